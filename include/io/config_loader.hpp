#pragma once
#include <string>
#include "common/types.hpp"

namespace runway::io {

// 读取引擎配置（engine_config.json），所有键都可省略：
//
//   {
//     "runway_polygon": [[lon, lat], ...],       // 与 runway_zone 二选一
//     "runway_zone": { "center": [lon, lat], "azimuth_deg": 143,
//                      "long_axis_m": 10000, "short_axis_m": 350 },
//     "altitude_ceiling": 5000,
//     "worker_threads": 0,
//     "first_ping_policy": "as_entry" | "as_unknown",
//     "require_pings": true
//   }
//
// 文件读不到 / JSON 不合法 / 字段类型不对 -> ConfigError。
// 多边形本身的几何合法性在 RunwayEventEngine 构造 GeoPredicate 时检查。
class ConfigLoader {
public:
  static EngineConfig LoadFile(const std::string& path);
  static EngineConfig ParseText(const std::string& text, const std::string& hint = "config");
};

FirstPingPolicy ParseFirstPingPolicy(const std::string& s);
const char* ToString(FirstPingPolicy policy);

} // namespace runway::io
