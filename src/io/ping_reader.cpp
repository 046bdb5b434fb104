#include "io/ping_reader.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

#include "common/errors.hpp"
#include "io/json_util.hpp"

namespace runway::io {

namespace {

using json = nlohmann::json;

// 公历日期 -> 距 1970-01-01 的天数（proleptic Gregorian）
static std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static unsigned DaysInMonth(std::int64_t y, unsigned m) {
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
  return (m == 2 && leap) ? 29u : kDays[m - 1];
}

static std::string FlightIdOf(const json& rec, const std::string& hint) {
  auto it = rec.find("flight_id");
  if (it == rec.end() || it->is_null()) {
    throw ConfigError(hint + ": missing flight_id");
  }
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number_integer()) return it->dump();
  throw ConfigError(hint + ": flight_id must be a string or integer");
}

static std::int64_t TimestampOf(const json& rec, const std::string& hint) {
  auto it = rec.find("timestamp");
  if (it == rec.end() || it->is_null()) {
    throw ConfigError(hint + ": missing timestamp");
  }
  if (it->is_number_unsigned() &&
      it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw ConfigError(hint + ": timestamp out of range: " + it->dump());
  }
  if (it->is_number_integer()) return it->get<std::int64_t>();
  if (it->is_string()) {
    try {
      return ParseTimestamp(it->get<std::string>());
    } catch (const ConfigError& e) {
      throw ConfigError(hint + ": " + e.what());
    }
  }
  throw ConfigError(hint + ": timestamp must be integer seconds or a UTC time string");
}

static std::string SquawkOf(const json& rec, const std::string& hint) {
  auto it = rec.find("squawk");
  if (it == rec.end() || it->is_null()) return {};
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number_integer()) {
    // 数值形式的应答码补足 4 位
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld", static_cast<long long>(it->get<std::int64_t>()));
    return buf;
  }
  throw ConfigError(hint + ": squawk must be a string, integer or null");
}

static Ping ParseRecord(const json& rec, const std::string& hint) {
  if (!rec.is_object()) {
    throw ConfigError(hint + ": record must be an object");
  }

  Ping p;
  p.flight_id = FlightIdOf(rec, hint);
  p.timestamp = TimestampOf(rec, hint);

  const auto lon = OptionalNumber(rec, "longitude", hint);
  const auto lat = OptionalNumber(rec, "latitude", hint);
  if (lon && lat) p.point = GeoPoint{*lon, *lat};

  p.altitude = OptionalNumber(rec, "altitude", hint);
  p.ground_speed = OptionalNumber(rec, "ground_speed", hint).value_or(0.0);
  p.vertical_speed = OptionalNumber(rec, "vertical_speed", hint).value_or(0.0);
  p.heading = OptionalNumber(rec, "heading", hint).value_or(0.0);
  p.squawk = SquawkOf(rec, hint);
  return p;
}

} // namespace

std::int64_t ParseTimestamp(const std::string& text) {
  // 纯整数：unix 秒
  {
    std::size_t i = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) i = 1;
    bool all_digits = i < text.size();
    for (std::size_t k = i; k < text.size(); ++k) {
      if (!std::isdigit(static_cast<unsigned char>(text[k]))) { all_digits = false; break; }
    }
    if (all_digits) {
      try {
        return std::stoll(text);
      } catch (const std::out_of_range&) {
        throw ConfigError("timestamp out of range: '" + text + "'");
      }
    }
  }

  // "YYYY-MM-DD HH:MM:SS" / "YYYY-MM-DDTHH:MM:SS[Z]"，按 UTC 解释
  std::string s = text;
  if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.pop_back();
  if (s.size() > 10 && (s[10] == 'T' || s[10] == 't')) s[10] = ' ';

  std::tm tm{};
  std::istringstream iss(s);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
    throw ConfigError("unrecognized timestamp: '" + text + "'");
  }

  // get_time 只查字段范围，2 月 30 日这类要自己挡
  const std::int64_t year = tm.tm_year + 1900;
  const unsigned month = static_cast<unsigned>(tm.tm_mon + 1);
  const unsigned day = static_cast<unsigned>(tm.tm_mday);
  if (day > DaysInMonth(year, month)) {
    throw ConfigError("no such calendar day: '" + text + "'");
  }

  const std::int64_t days = DaysFromCivil(year, month, day);
  return days * 86400 + tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
}

std::vector<Ping> PingReader::LoadFile(const std::string& path, PingIdAllocator& ids) {
  return ParseText(ReadAllText(path), ids, path);
}

std::vector<Ping> PingReader::ParseText(const std::string& text, PingIdAllocator& ids,
                                        const std::string& hint) {
  const json root = ParseJson(text, hint);

  const json* records = &root;
  if (root.is_object()) {
    auto it = root.find("pings");
    if (it == root.end() || !it->is_array()) {
      throw ConfigError(hint + ": expected an array or an object with a 'pings' array");
    }
    records = &*it;
  } else if (!root.is_array()) {
    throw ConfigError(hint + ": expected an array or an object with a 'pings' array");
  }

  std::vector<Ping> pings;
  pings.reserve(records->size());
  for (std::size_t i = 0; i < records->size(); ++i) {
    Ping p = ParseRecord((*records)[i], hint + "[" + std::to_string(i) + "]");
    p.id = ids.Next();
    pings.push_back(std::move(p));
  }
  return pings;
}

} // namespace runway::io
