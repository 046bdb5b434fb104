#include "io/config_loader.hpp"

#include <cmath>

#include "common/errors.hpp"
#include "geo/runway_polygon.hpp"
#include "io/json_util.hpp"

namespace runway::io {

namespace {

using json = nlohmann::json;

static GeoPoint ParseLonLat(const json& pair, const std::string& hint) {
  if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number() || !pair[1].is_number()) {
    throw ConfigError(hint + ": expected [lon, lat] pair");
  }
  return GeoPoint{pair[0].get<double>(), pair[1].get<double>()};
}

static RunwayPolygon ParsePolygon(const json& ring, const std::string& hint) {
  if (!ring.is_array()) {
    throw ConfigError(hint + ": runway_polygon must be an array of [lon, lat]");
  }
  RunwayPolygon poly;
  for (std::size_t i = 0; i < ring.size(); ++i) {
    poly.ring.push_back(ParseLonLat(ring[i], hint + ".runway_polygon[" + std::to_string(i) + "]"));
  }
  return poly;
}

static RunwayPolygon ParseZone(const json& zone, const std::string& hint) {
  if (!zone.is_object()) {
    throw ConfigError(hint + ": runway_zone must be an object");
  }
  RunwayZoneParams params;
  if (zone.contains("center")) params.center = ParseLonLat(zone["center"], hint + ".runway_zone.center");
  const std::string zhint = hint + ".runway_zone";
  if (auto v = OptionalNumber(zone, "azimuth_deg", zhint)) params.azimuth_deg = *v;
  if (auto v = OptionalNumber(zone, "long_axis_m", zhint)) params.long_axis_m = *v;
  if (auto v = OptionalNumber(zone, "short_axis_m", zhint)) params.short_axis_m = *v;
  if (!(params.long_axis_m > 0.0) || !(params.short_axis_m > 0.0)) {
    throw ConfigError(zhint + ": axes must be positive");
  }
  return MakeRunwayZone(params);
}

} // namespace

FirstPingPolicy ParseFirstPingPolicy(const std::string& s) {
  if (s == "as_entry") return FirstPingPolicy::AsEntry;
  if (s == "as_unknown") return FirstPingPolicy::AsUnknown;
  throw ConfigError("unknown first_ping_policy: '" + s + "' (expected as_entry / as_unknown)");
}

const char* ToString(FirstPingPolicy policy) {
  return policy == FirstPingPolicy::AsUnknown ? "as_unknown" : "as_entry";
}

EngineConfig ConfigLoader::LoadFile(const std::string& path) {
  return ParseText(ReadAllText(path), path);
}

EngineConfig ConfigLoader::ParseText(const std::string& text, const std::string& hint) {
  const json root = ParseJson(text, hint);
  if (!root.is_object()) {
    throw ConfigError(hint + ": top level must be an object");
  }

  EngineConfig cfg;

  if (root.contains("runway_polygon") && root.contains("runway_zone")) {
    throw ConfigError(hint + ": runway_polygon and runway_zone are mutually exclusive");
  }
  if (root.contains("runway_polygon")) {
    cfg.polygon = ParsePolygon(root["runway_polygon"], hint);
  } else if (root.contains("runway_zone")) {
    cfg.polygon = ParseZone(root["runway_zone"], hint);
  }

  if (auto v = OptionalNumber(root, "altitude_ceiling", hint)) {
    if (!std::isfinite(*v)) throw ConfigError(hint + ": altitude_ceiling must be finite");
    cfg.altitude_ceiling = *v;
  }

  if (root.contains("worker_threads")) {
    const json& w = root["worker_threads"];
    if (!w.is_number_integer() || w.get<long long>() < 0) {
      throw ConfigError(hint + ": worker_threads must be a non-negative integer");
    }
    cfg.worker_threads = static_cast<unsigned>(w.get<long long>());
  }

  if (root.contains("first_ping_policy")) {
    const json& p = root["first_ping_policy"];
    if (!p.is_string()) throw ConfigError(hint + ": first_ping_policy must be a string");
    cfg.first_ping_policy = ParseFirstPingPolicy(p.get<std::string>());
  }

  if (root.contains("require_pings")) {
    const json& r = root["require_pings"];
    if (!r.is_boolean()) throw ConfigError(hint + ": require_pings must be a boolean");
    cfg.require_pings = r.get<bool>();
  }

  return cfg;
}

} // namespace runway::io
