#pragma once
#include <optional>
#include <vector>
#include "common/types.hpp"
#include "geo/geo_predicate.hpp"
#include "timeline/ping_timeline.hpp"

namespace runway {

// ========================
// 一次完整运行的上下文（各 Stage 之间传递的“接口载体”）
// ========================

struct RunContext {
  // === 输入 ===
  EngineConfig config;
  std::vector<Ping> pings; // 派生列原地写回

  // === 中间结果 ===
  // 由 RunwayEventEngine 在跑 Stage 前根据 config 构造；缺失时 RegionAnnotateStage 直接失败
  std::optional<GeoPredicate> predicate;
  PingTimeline timeline;

  // === 输出 ===
  Diagnostics diagnostics;
  std::vector<FlightEventSummary> flight_summaries; // 与 timeline.FlightIds() 同序
};

} // namespace runway
