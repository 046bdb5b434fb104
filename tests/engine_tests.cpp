#include "tests/test_framework.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "geo/runway_polygon.hpp"
#include "io/config_loader.hpp"
#include "io/output_writer.hpp"
#include "io/ping_reader.hpp"
#include "pipeline/runway_event_engine.hpp"

// =========================
// End-to-end: RunwayEventEngine + IO
// =========================

namespace {

namespace fs = std::filesystem;

using runway::Ping;
using runway::RunwayEvent;

const runway::GeoPoint kIn{1.3642, 43.6287};
const runway::GeoPoint kOut{1.30, 43.60};

// 把 "oOiIo" 这种简写展开成一条航班：i/I = 区内，o/O = 区外
void AppendFlight(std::vector<Ping>& out, runway::io::PingIdAllocator& ids,
                  const std::string& flight, const std::string& pattern,
                  std::int64_t t0 = 1700000000, std::int64_t dt = 5) {
  for (std::size_t k = 0; k < pattern.size(); ++k) {
    Ping p;
    p.id = ids.Next();
    p.flight_id = flight;
    p.timestamp = t0 + static_cast<std::int64_t>(k) * dt;
    const bool inside = (pattern[k] == 'i' || pattern[k] == 'I');
    p.point = inside ? kIn : kOut;
    p.altitude = inside ? 800.0 : 3000.0;
    p.ground_speed = 140.0;
    out.push_back(std::move(p));
  }
}

runway::RunContext RunEngine(std::vector<Ping> pings, unsigned workers = 1,
                             runway::FirstPingPolicy policy = runway::FirstPingPolicy::AsEntry) {
  runway::RunContext ctx;
  ctx.config.worker_threads = workers;
  ctx.config.first_ping_policy = policy;
  ctx.config.verbose = false;
  ctx.pings = std::move(pings);
  runway::RunwayEventEngine engine;
  engine.Run(ctx);
  return ctx;
}

// 按 id 取派生结果，便于跨运行比较
struct Derived {
  bool in_region;
  int transition;
  RunwayEvent event;
  bool operator==(const Derived& o) const {
    return in_region == o.in_region && transition == o.transition && event == o.event;
  }
};

std::map<std::int64_t, Derived> DerivedById(const runway::RunContext& ctx) {
  std::map<std::int64_t, Derived> m;
  for (const auto& p : ctx.pings) {
    m[p.id] = Derived{p.in_region, static_cast<int>(p.transition), p.event};
  }
  return m;
}

std::string EventsOf(const runway::RunContext& ctx, const std::string& flight) {
  std::ostringstream oss;
  const auto& line = ctx.timeline.TimelineFor(flight);
  for (std::size_t k = 0; k < line.size(); ++k) {
    if (k) oss << ",";
    const char* s = runway::ToString(ctx.pings[line[k]].event);
    oss << (*s ? s : "-");
  }
  return oss.str();
}

std::string TransitionsOf(const runway::RunContext& ctx, const std::string& flight) {
  std::ostringstream oss;
  const auto& line = ctx.timeline.TimelineFor(flight);
  for (std::size_t k = 0; k < line.size(); ++k) {
    if (k) oss << ",";
    oss << static_cast<int>(ctx.pings[line[k]].transition);
  }
  return oss.str();
}

fs::path MakeTempDir(const std::string& tag) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() / ("runway_events_" + tag + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

// =========================
// Scenarios
// =========================

bool Test_Engine_EnterThenExit() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "A", "ooiio");
  const auto ctx = RunEngine(std::move(pings));

  RUNWAY_EXPECT_EQ(TransitionsOf(ctx, "A"), std::string("0,0,1,0,-1"));
  RUNWAY_EXPECT_EQ(EventsOf(ctx, "A"), std::string("-,-,-,-,touch-n-go"));
  return true;
}

bool Test_Engine_Alternating() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "B", "ioio");
  const auto ctx = RunEngine(std::move(pings));

  RUNWAY_EXPECT_EQ(TransitionsOf(ctx, "B"), std::string("1,-1,1,-1"));
  RUNWAY_EXPECT_EQ(EventsOf(ctx, "B"), std::string("-,touch-n-go,-,touch-n-go"));
  return true;
}

bool Test_Engine_SinglePingInside() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "C", "i");
  const auto ctx = RunEngine(std::move(pings));

  RUNWAY_EXPECT_EQ(TransitionsOf(ctx, "C"), std::string("1"));
  RUNWAY_EXPECT_EQ(EventsOf(ctx, "C"), std::string("landing"));
  return true;
}

bool Test_Engine_NeverInRegion() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "D", "oooooo");
  const auto ctx = RunEngine(std::move(pings));

  RUNWAY_EXPECT_EQ(TransitionsOf(ctx, "D"), std::string("0,0,0,0,0,0"));
  RUNWAY_EXPECT_EQ(EventsOf(ctx, "D"), std::string("-,-,-,-,-,-"));
  RUNWAY_EXPECT_TRUE(ctx.flight_summaries[0].landing_ping_ids.empty());
  return true;
}

bool Test_Engine_TakeoffWithAsUnknownPolicy() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "E", "iiooo");
  const auto ctx = RunEngine(std::move(pings), 1, runway::FirstPingPolicy::AsUnknown);

  // transition 照常按前驱 0 写出
  RUNWAY_EXPECT_EQ(TransitionsOf(ctx, "E"), std::string("1,0,-1,0,0"));
  RUNWAY_EXPECT_EQ(EventsOf(ctx, "E"), std::string("-,-,takeoff,-,-"));
  return true;
}

bool Test_Engine_AltitudeCeilingMasksRegion() {
  // 飞越跑道但始终在 5000 以上：不算进入
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "HIGH", "oiiio");
  for (auto& p : pings) p.altitude = 12000.0;
  const auto ctx = RunEngine(std::move(pings));
  RUNWAY_EXPECT_EQ(TransitionsOf(ctx, "HIGH"), std::string("0,0,0,0,0"));
  return true;
}

bool Test_Engine_Idempotent() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "A", "ooiioioo");
  AppendFlight(pings, ids, "B", "iooi");
  AppendFlight(pings, ids, "C", "i");

  runway::RunContext ctx;
  ctx.config.worker_threads = 2;
  ctx.pings = std::move(pings);
  runway::RunwayEventEngine engine;
  engine.Run(ctx);
  const auto first = DerivedById(ctx);
  engine.Run(ctx); // 在已派生的数据上再跑一遍
  const auto second = DerivedById(ctx);

  RUNWAY_EXPECT_TRUE(first == second);
  return true;
}

bool Test_Engine_FlightOrderIndependent() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  AppendFlight(pings, ids, "A", "ooiioioo");
  AppendFlight(pings, ids, "B", "iooi", 1700000002, 7);
  AppendFlight(pings, ids, "C", "oiiiio", 1700000001, 3);
  AppendFlight(pings, ids, "D", "oo");

  const auto baseline = DerivedById(RunEngine(pings, 1));

  std::mt19937 rng(12345);
  for (int round = 0; round < 5; ++round) {
    auto shuffled = pings;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    const auto got = DerivedById(RunEngine(std::move(shuffled), 1 + round % 4));
    RUNWAY_EXPECT_TRUE(got == baseline);
  }
  return true;
}

bool Test_Engine_ManyFlightsParallelMatchesSerial() {
  runway::io::PingIdAllocator ids;
  std::vector<Ping> pings;
  const char* patterns[] = {"ooiio", "ioio", "i", "oooo", "oiioiio", "iio"};
  for (int f = 0; f < 200; ++f) {
    AppendFlight(pings, ids, "F" + std::to_string(f), patterns[f % 6], 1700000000 + f);
  }
  const auto serial = DerivedById(RunEngine(pings, 1));
  const auto parallel = DerivedById(RunEngine(pings, 8));
  RUNWAY_EXPECT_TRUE(serial == parallel);
  return true;
}

bool Test_Engine_EmptyDataset() {
  runway::RunContext ctx;
  runway::RunwayEventEngine engine;
  RUNWAY_EXPECT_THROW(engine.Run(ctx), runway::EmptyDatasetError);

  // 显式允许空集时正常结束
  ctx.config.require_pings = false;
  engine.Run(ctx);
  RUNWAY_EXPECT_TRUE(ctx.flight_summaries.empty());
  return true;
}

bool Test_Engine_InvalidPolygonIsFatal() {
  runway::io::PingIdAllocator ids;
  runway::RunContext ctx;
  AppendFlight(ctx.pings, ids, "A", "oio");
  ctx.config.polygon.ring = {{0.0, 0.0}, {1.0, 1.0}, {1.0, 0.0}, {0.0, 1.0}};
  runway::RunwayEventEngine engine;
  RUNWAY_EXPECT_THROW(engine.Run(ctx), runway::InvalidGeometryError);
  return true;
}

bool Test_Engine_MakePredicateValidatesConfigUpFront() {
  // 读完配置即可校验，不依赖报点
  const auto bowtie = runway::io::ConfigLoader::ParseText(
      R"({"runway_polygon": [[0, 0], [1, 1], [1, 0], [0, 1]]})");
  RUNWAY_EXPECT_THROW(runway::RunwayEventEngine::MakePredicate(bowtie), runway::InvalidGeometryError);

  // 空多边形回落到内置 LFBO 区
  const runway::GeoPredicate pred = runway::RunwayEventEngine::MakePredicate(runway::EngineConfig{});
  RUNWAY_EXPECT_EQ(pred.ring().size(), runway::DefaultRunwayPolygon().ring.size());
  RUNWAY_EXPECT_NEAR(pred.altitude_ceiling(), 5000.0, 1e-12);
  RUNWAY_EXPECT_TRUE(pred.Contains(kIn, 800.0));

  const auto square = runway::io::ConfigLoader::ParseText(
      R"({"runway_polygon": [[0, 0], [1, 0], [1, 1], [0, 1]], "altitude_ceiling": 300})");
  const runway::GeoPredicate custom = runway::RunwayEventEngine::MakePredicate(square);
  RUNWAY_EXPECT_TRUE(custom.Contains(runway::GeoPoint{0.5, 0.5}, 299.0));
  RUNWAY_EXPECT_TRUE(!custom.Contains(runway::GeoPoint{0.5, 0.5}, 300.0));
  return true;
}

// =========================
// IO
// =========================

bool Test_PingIdAllocator_Monotonic() {
  runway::io::PingIdAllocator ids;
  RUNWAY_EXPECT_EQ(ids.Next(), static_cast<std::int64_t>(1));
  RUNWAY_EXPECT_EQ(ids.Next(), static_cast<std::int64_t>(2));
  RUNWAY_EXPECT_EQ(ids.peek(), static_cast<std::int64_t>(3));

  // 每次入库一个新的分配器，互不影响
  runway::io::PingIdAllocator other(100);
  RUNWAY_EXPECT_EQ(other.Next(), static_cast<std::int64_t>(100));
  RUNWAY_EXPECT_EQ(ids.Next(), static_cast<std::int64_t>(3));
  return true;
}

bool Test_ParseTimestamp_Formats() {
  using runway::io::ParseTimestamp;
  RUNWAY_EXPECT_EQ(ParseTimestamp("1700000000"), static_cast<std::int64_t>(1700000000));
  RUNWAY_EXPECT_EQ(ParseTimestamp("1970-01-01 00:00:00"), static_cast<std::int64_t>(0));
  RUNWAY_EXPECT_EQ(ParseTimestamp("2023-11-14 22:13:20"), static_cast<std::int64_t>(1700000000));
  RUNWAY_EXPECT_EQ(ParseTimestamp("2023-11-14T22:13:20Z"), static_cast<std::int64_t>(1700000000));
  RUNWAY_EXPECT_EQ(ParseTimestamp("2024-02-29 12:00:00"), static_cast<std::int64_t>(1709208000));
  RUNWAY_EXPECT_THROW(ParseTimestamp("yesterday"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ParseTimestamp("2023-11-14 22:13:20 extra"), runway::ConfigError);

  // 不存在的日期不能滚到下个月，否则会和真实日期撞车
  RUNWAY_EXPECT_EQ(ParseTimestamp("2023-03-02 00:00:00"), static_cast<std::int64_t>(1677715200));
  RUNWAY_EXPECT_THROW(ParseTimestamp("2023-02-30 00:00:00"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ParseTimestamp("2023-02-29 00:00:00"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ParseTimestamp("2023-04-31T08:00:00Z"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ParseTimestamp("1900-02-29 00:00:00"), runway::ConfigError);
  RUNWAY_EXPECT_EQ(ParseTimestamp("2000-02-29 00:00:00"), static_cast<std::int64_t>(951782400));
  return true;
}

bool Test_PingReader_ParsesRecords() {
  const std::string text = R"([
    {"flight_id": "30e7a9b1", "timestamp": 1700000000, "longitude": 1.3642, "latitude": 43.6287,
     "altitude": 800, "ground_speed": 140, "vertical_speed": -600, "heading": 143, "squawk": "7000"},
    {"flight_id": 820785193, "timestamp": "2023-11-14 22:13:25", "longitude": null, "latitude": 43.6,
     "altitude": null, "squawk": 1200},
    {"flight_id": "30e7a9b1", "timestamp": 1700000010}
  ])";

  runway::io::PingIdAllocator ids;
  const auto pings = runway::io::PingReader::ParseText(text, ids);
  RUNWAY_EXPECT_EQ(pings.size(), static_cast<std::size_t>(3));

  RUNWAY_EXPECT_EQ(pings[0].id, static_cast<std::int64_t>(1));
  RUNWAY_EXPECT_EQ(pings[0].flight_id, std::string("30e7a9b1"));
  RUNWAY_EXPECT_TRUE(pings[0].point.has_value());
  RUNWAY_EXPECT_NEAR(pings[0].point->lon_deg, 1.3642, 1e-12);
  RUNWAY_EXPECT_NEAR(pings[0].altitude.value(), 800.0, 1e-12);
  RUNWAY_EXPECT_NEAR(pings[0].vertical_speed, -600.0, 1e-12);
  RUNWAY_EXPECT_EQ(pings[0].squawk, std::string("7000"));

  RUNWAY_EXPECT_EQ(pings[1].id, static_cast<std::int64_t>(2));
  RUNWAY_EXPECT_EQ(pings[1].flight_id, std::string("820785193"));
  RUNWAY_EXPECT_EQ(pings[1].timestamp, static_cast<std::int64_t>(1700000005));
  RUNWAY_EXPECT_TRUE(!pings[1].point.has_value());   // 只有纬度
  RUNWAY_EXPECT_TRUE(!pings[1].altitude.has_value());
  RUNWAY_EXPECT_EQ(pings[1].squawk, std::string("1200"));

  RUNWAY_EXPECT_EQ(pings[2].id, static_cast<std::int64_t>(3));
  RUNWAY_EXPECT_TRUE(!pings[2].point.has_value());
  RUNWAY_EXPECT_EQ(ids.peek(), static_cast<std::int64_t>(4));
  return true;
}

bool Test_PingReader_RejectsBadInput() {
  runway::io::PingIdAllocator ids;
  using runway::io::PingReader;
  RUNWAY_EXPECT_THROW(PingReader::ParseText("not json", ids), runway::ConfigError);
  RUNWAY_EXPECT_THROW(PingReader::ParseText("42", ids), runway::ConfigError);
  RUNWAY_EXPECT_THROW(PingReader::ParseText(R"([{"timestamp": 1}])", ids), runway::ConfigError);
  RUNWAY_EXPECT_THROW(PingReader::ParseText(R"([{"flight_id": "A"}])", ids), runway::ConfigError);
  RUNWAY_EXPECT_THROW(PingReader::ParseText(R"([{"flight_id": "A", "timestamp": 1, "altitude": "high"}])", ids),
                      runway::ConfigError);

  // 超出 int64 的无符号整数不能回绕成负数
  RUNWAY_EXPECT_THROW(PingReader::ParseText(R"([{"flight_id": "A", "timestamp": 18446744073709551000}])", ids),
                      runway::ConfigError);
  RUNWAY_EXPECT_THROW(PingReader::ParseText(R"([{"flight_id": "A", "timestamp": 9223372036854775808}])", ids),
                      runway::ConfigError);
  RUNWAY_EXPECT_THROW(PingReader::ParseText(R"([{"flight_id": "A", "timestamp": "2023-02-30 00:00:00"}])", ids),
                      runway::ConfigError);
  const auto max_ts = PingReader::ParseText(R"([{"flight_id": "A", "timestamp": 9223372036854775807}])", ids);
  RUNWAY_EXPECT_EQ(max_ts[0].timestamp, std::numeric_limits<std::int64_t>::max());

  // 对象包一层 pings 也可以
  const auto pings = PingReader::ParseText(R"({"pings": [{"flight_id": "A", "timestamp": 1}]})", ids);
  RUNWAY_EXPECT_EQ(pings.size(), static_cast<std::size_t>(1));
  return true;
}

bool Test_ConfigLoader_ParsesAllKeys() {
  const std::string text = R"({
    "runway_polygon": [[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]],
    "altitude_ceiling": 3000,
    "worker_threads": 4,
    "first_ping_policy": "as_unknown",
    "require_pings": false
  })";
  const auto cfg = runway::io::ConfigLoader::ParseText(text);
  RUNWAY_EXPECT_EQ(cfg.polygon.ring.size(), static_cast<std::size_t>(5));
  RUNWAY_EXPECT_NEAR(cfg.altitude_ceiling, 3000.0, 1e-12);
  RUNWAY_EXPECT_EQ(cfg.worker_threads, 4u);
  RUNWAY_EXPECT_TRUE(cfg.first_ping_policy == runway::FirstPingPolicy::AsUnknown);
  RUNWAY_EXPECT_TRUE(!cfg.require_pings);

  // 空对象：全部默认
  const auto def = runway::io::ConfigLoader::ParseText("{}");
  RUNWAY_EXPECT_TRUE(def.polygon.ring.empty());
  RUNWAY_EXPECT_NEAR(def.altitude_ceiling, 5000.0, 1e-12);
  RUNWAY_EXPECT_TRUE(def.first_ping_policy == runway::FirstPingPolicy::AsEntry);
  RUNWAY_EXPECT_TRUE(def.require_pings);
  return true;
}

bool Test_ConfigLoader_RunwayZone() {
  const auto cfg = runway::io::ConfigLoader::ParseText(
      R"({"runway_zone": {"center": [1.3642, 43.6287], "azimuth_deg": 143,
                          "long_axis_m": 4000, "short_axis_m": 200}})");
  RUNWAY_EXPECT_EQ(cfg.polygon.ring.size(), static_cast<std::size_t>(4));
  return true;
}

bool Test_ConfigLoader_RejectsBadConfig() {
  using runway::io::ConfigLoader;
  RUNWAY_EXPECT_THROW(ConfigLoader::ParseText("[]"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ConfigLoader::ParseText(R"({"first_ping_policy": "sometimes"})"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ConfigLoader::ParseText(R"({"worker_threads": -1})"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ConfigLoader::ParseText(R"({"altitude_ceiling": "5000"})"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ConfigLoader::ParseText(R"({"runway_polygon": [[0, 0], [1]]})"), runway::ConfigError);
  RUNWAY_EXPECT_THROW(ConfigLoader::ParseText(R"({"runway_polygon": [], "runway_zone": {}})"),
                      runway::ConfigError);
  RUNWAY_EXPECT_THROW(ConfigLoader::LoadFile("/nonexistent/engine_config.json"), runway::ConfigError);
  return true;
}

bool Test_EndToEnd_FilesRoundTrip() {
  const fs::path dir = MakeTempDir("e2e");
  const fs::path input = dir / "pings.json";
  const fs::path outdir = dir / "out";

  {
    // F1: 区外 -> 区内 -> 区外 -> 区内（最后停在区内）
    nlohmann::json arr = nlohmann::json::array();
    const std::vector<std::pair<bool, std::int64_t>> f1 = {
        {false, 100}, {true, 110}, {false, 120}, {true, 130}};
    for (const auto& s : f1) {
      arr.push_back({{"flight_id", "F1"}, {"timestamp", s.second},
                     {"longitude", s.first ? kIn.lon_deg : kOut.lon_deg},
                     {"latitude", s.first ? kIn.lat_deg : kOut.lat_deg},
                     {"altitude", 900}, {"squawk", "7000"}});
    }
    // F2: 缺高度，只计数不报错
    arr.push_back({{"flight_id", "F2"}, {"timestamp", 100},
                   {"longitude", kIn.lon_deg}, {"latitude", kIn.lat_deg}, {"altitude", nullptr}});
    std::ofstream ofs(input);
    ofs << arr.dump();
  }

  runway::RunContext ctx;
  ctx.config.worker_threads = 2;
  runway::io::PingIdAllocator ids;
  ctx.pings = runway::io::PingReader::LoadFile(input.string(), ids);
  runway::RunwayEventEngine engine;
  engine.Run(ctx);
  runway::io::OutputWriter::WriteAll(ctx, outdir.string());

  RUNWAY_EXPECT_TRUE(fs::exists(outdir / "pings_enriched.csv"));
  RUNWAY_EXPECT_TRUE(fs::exists(outdir / "summary.json"));

  // CSV：表头 + 5 行，顺序与输入一致
  std::ifstream csv(outdir / "pings_enriched.csv");
  std::vector<std::string> lines;
  for (std::string line; std::getline(csv, line);) lines.push_back(line);
  RUNWAY_EXPECT_EQ(lines.size(), static_cast<std::size_t>(6));
  RUNWAY_EXPECT_TRUE(lines[0].rfind("id,flight_id,timestamp", 0) == 0);
  RUNWAY_EXPECT_TRUE(lines[3].find(",0,-1,touch-n-go") != std::string::npos);
  RUNWAY_EXPECT_TRUE(lines[4].find(",1,1,landing") != std::string::npos);

  std::ifstream sj(outdir / "summary.json");
  const nlohmann::json summary = nlohmann::json::parse(sj);
  RUNWAY_EXPECT_EQ(summary.at("flight_count").get<int>(), 2);
  RUNWAY_EXPECT_EQ(summary.at("ping_count").get<int>(), 5);
  RUNWAY_EXPECT_EQ(summary.at("events").at("touch-n-go").get<int>(), 1);
  RUNWAY_EXPECT_EQ(summary.at("events").at("landing").get<int>(), 1);
  RUNWAY_EXPECT_EQ(summary.at("events").at("takeoff").get<int>(), 0);
  RUNWAY_EXPECT_EQ(summary.at("diagnostics").at("missing_altitude").get<int>(), 1);
  RUNWAY_EXPECT_EQ(summary.at("flights").at(0).at("flight_id").get<std::string>(), std::string("F1"));
  RUNWAY_EXPECT_EQ(summary.at("flights").at(0).at("landing").at(0).get<int>(), 4);

  std::error_code ec;
  fs::remove_all(dir, ec);
  return true;
}

bool Test_OutputWriter_CsvKeepsFullPrecision() {
  const fs::path dir = MakeTempDir("csv_precision");
  const fs::path csv_path = dir / "pings_enriched.csv";

  Ping p;
  p.id = 1;
  p.flight_id = "A";
  p.timestamp = 1700000000;
  p.point = runway::GeoPoint{1.3642123456789012, 43.628712345678901};
  p.altitude = 812.3456789012345;

  runway::RunContext ctx;
  ctx.pings = {p};
  runway::io::OutputWriter::WriteEnrichedCsv(ctx, csv_path.string());

  std::ifstream csv(csv_path);
  std::string header, row;
  std::getline(csv, header);
  std::getline(csv, row);

  std::vector<std::string> cols;
  std::stringstream ss(row);
  for (std::string col; std::getline(ss, col, ',');) cols.push_back(col);
  RUNWAY_EXPECT_TRUE(cols.size() >= 6);

  // 写出再读回必须与原值逐位相等
  RUNWAY_EXPECT_TRUE(std::stod(cols[3]) == p.point->lon_deg);
  RUNWAY_EXPECT_TRUE(std::stod(cols[4]) == p.point->lat_deg);
  RUNWAY_EXPECT_TRUE(std::stod(cols[5]) == *p.altitude);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  using runway::test::TestCase;

  std::vector<TestCase> cases = {
      {"Engine: enter then exit", Test_Engine_EnterThenExit},
      {"Engine: alternating in/out", Test_Engine_Alternating},
      {"Engine: single ping inside -> landing", Test_Engine_SinglePingInside},
      {"Engine: never in region -> no events", Test_Engine_NeverInRegion},
      {"Engine: as_unknown policy -> takeoff", Test_Engine_TakeoffWithAsUnknownPolicy},
      {"Engine: altitude ceiling masks region", Test_Engine_AltitudeCeilingMasksRegion},
      {"Engine: idempotent", Test_Engine_Idempotent},
      {"Engine: flight order independent", Test_Engine_FlightOrderIndependent},
      {"Engine: parallel matches serial", Test_Engine_ManyFlightsParallelMatchesSerial},
      {"Engine: empty dataset", Test_Engine_EmptyDataset},
      {"Engine: invalid polygon is fatal", Test_Engine_InvalidPolygonIsFatal},
      {"Engine: MakePredicate validates config before pings", Test_Engine_MakePredicateValidatesConfigUpFront},
      {"IO: PingIdAllocator monotonic", Test_PingIdAllocator_Monotonic},
      {"IO: ParseTimestamp formats", Test_ParseTimestamp_Formats},
      {"IO: PingReader parses records", Test_PingReader_ParsesRecords},
      {"IO: PingReader rejects bad input", Test_PingReader_RejectsBadInput},
      {"IO: ConfigLoader parses all keys", Test_ConfigLoader_ParsesAllKeys},
      {"IO: ConfigLoader runway_zone", Test_ConfigLoader_RunwayZone},
      {"IO: ConfigLoader rejects bad config", Test_ConfigLoader_RejectsBadConfig},
      {"IO: enriched CSV keeps full coordinate precision", Test_OutputWriter_CsvKeepsFullPrecision},
      {"IO: end-to-end files round trip", Test_EndToEnd_FilesRoundTrip},
  };

  return runway::test::RunAll(cases, argc, argv);
}
