#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "io/config_loader.hpp"

namespace fs = std::filesystem;

namespace runway::io {

static void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

// 含逗号 / 引号 / 换行的字段加引号，内部引号双写
static std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void OutputWriter::WriteAll(const RunContext& ctx, const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteEnrichedCsv(ctx, (fs::path(output_dir) / "pings_enriched.csv").string());
  WriteSummaryJson(ctx, (fs::path(output_dir) / "summary.json").string());
}

void OutputWriter::WriteEnrichedCsv(const RunContext& ctx, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);

  ofs << "id,flight_id,timestamp,longitude,latitude,altitude,ground_speed,vertical_speed,"
         "heading,squawk,in_region,transition,event\n";
  for (const auto& p : ctx.pings) {
    ofs << p.id << "," << CsvField(p.flight_id) << "," << p.timestamp << ",";
    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    if (p.point) {
      ofs << p.point->lon_deg << "," << p.point->lat_deg << ",";
    } else {
      ofs << ",,";
    }
    if (p.altitude) ofs << *p.altitude;
    ofs << "," << p.ground_speed << "," << p.vertical_speed << "," << p.heading << ","
        << CsvField(p.squawk) << ","
        << (p.in_region ? 1 : 0) << ","
        << static_cast<int>(p.transition) << ","
        << runway::ToString(p.event) << "\n";
  }
}

void OutputWriter::WriteSummaryJson(const RunContext& ctx, const std::string& output_path) {
  using json = nlohmann::json;

  std::size_t n_takeoff = 0, n_landing = 0, n_tng = 0;
  json flights = json::array();
  for (const auto& f : ctx.flight_summaries) {
    n_takeoff += f.takeoff_ping_ids.size();
    n_landing += f.landing_ping_ids.size();
    n_tng += f.touch_n_go_ping_ids.size();

    flights.push_back({
        {"flight_id", f.flight_id},
        {"ping_count", f.ping_count},
        {"takeoff", f.takeoff_ping_ids},
        {"landing", f.landing_ping_ids},
        {"touch-n-go", f.touch_n_go_ping_ids},
    });
  }

  const Diagnostics& d = ctx.diagnostics;
  json root = {
      {"flight_count", ctx.flight_summaries.size()},
      {"ping_count", ctx.pings.size()},
      {"altitude_ceiling", ctx.config.altitude_ceiling},
      {"first_ping_policy", ToString(ctx.config.first_ping_policy)},
      {"events", {{"takeoff", n_takeoff}, {"landing", n_landing}, {"touch-n-go", n_tng}}},
      {"diagnostics", {
          {"missing_altitude", d.missing_altitude},
          {"missing_point", d.missing_point},
          {"non_finite_point", d.non_finite_point},
          {"timestamp_ties", d.timestamp_ties},
      }},
      {"flights", flights},
  };

  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << root.dump(2) << "\n";
}

} // namespace runway::io
