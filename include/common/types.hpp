#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace runway {

// ========================
// 1) 基础几何类型
// ========================

// 经纬度（度）。约定 lon 在前，与 WKT / GeoJSON 的 [lon, lat] 顺序一致
struct GeoPoint {
  double lon_deg{0.0};
  double lat_deg{0.0};
};

// 跑道邻近区：有序闭环（首尾不必重复）
struct RunwayPolygon {
  std::vector<GeoPoint> ring;
};

// ========================
// 2) 报点数据（输入 + 派生列）
// ========================

enum class RunwayEvent : std::uint8_t {
  None = 0,
  Takeoff,
  Landing,
  TouchAndGo
};

// "takeoff" / "landing" / "touch-n-go" / ""（None）
const char* ToString(RunwayEvent ev);

struct Ping {
  // 入库时按顺序分配（PingIdAllocator），从 1 开始，不复用
  std::int64_t id{0};
  std::string flight_id;
  std::int64_t timestamp{0}; // unix 秒

  // 任意遥测都可能缺失（输入里是 null）
  std::optional<GeoPoint> point;
  std::optional<double> altitude;
  double ground_speed{0.0};
  double vertical_speed{0.0};
  double heading{0.0};
  std::string squawk;

  // === 派生列（RunwayEventEngine 写回） ===
  bool in_region{false};
  std::int8_t transition{0}; // -1 / 0 / +1
  RunwayEvent event{RunwayEvent::None};
};

// ========================
// 3) 引擎配置
// ========================

// 航班第一个报点的“虚拟前驱”如何参与事件分类
//   AsEntry:   前驱按 0 处理，首点若在区内即视为一次进入（默认）
//   AsUnknown: 首点的 transition 照常写出，但分类时不计入非零子序列
enum class FirstPingPolicy {
  AsEntry,
  AsUnknown
};

struct EngineConfig {
  RunwayPolygon polygon;             // 为空时使用内置 LFBO 跑道区
  double altitude_ceiling{5000.0};   // 严格小于才算在区内
  unsigned worker_threads{0};        // 0 = hardware_concurrency
  FirstPingPolicy first_ping_policy{FirstPingPolicy::AsEntry};
  bool require_pings{true};
  bool verbose{true};                // false 时不打印每个 Stage 的耗时
};

// ========================
// 4) 计数型诊断（不算错误，只统计）
// ========================

struct Diagnostics {
  std::size_t missing_altitude{0};
  std::size_t missing_point{0};
  std::size_t non_finite_point{0};
  std::size_t timestamp_ties{0};
};

// 按航班的事件汇总，供输出使用
struct FlightEventSummary {
  std::string flight_id;
  std::size_t ping_count{0};
  std::vector<std::int64_t> takeoff_ping_ids;
  std::vector<std::int64_t> landing_ping_ids;
  std::vector<std::int64_t> touch_n_go_ping_ids;
};

} // namespace runway
