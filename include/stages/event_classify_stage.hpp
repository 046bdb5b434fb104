#pragma once
#include <cstdint>
#include <vector>
#include "stages/stage_base.hpp"

namespace runway {

// 单航班的跑道事件分类。
//
// 只看非零跳变组成的子序列；对其中每个元素取 当前值 / 子序列中的前一个 / 后一个，
// 规则按顺序匹配，先中先得：
//   1) 当前 -1 且 前一个 +1         -> touch-n-go
//   2) 当前 +1 且 没有后一个         -> landing（航班最后一次进入区域）
//   3) 当前 -1 且 没有前一个         -> takeoff
//   其余非零跳变不打标签（中间态）。
//
// AsUnknown 策略下，首点的跳变不进子序列（它没有真实前驱）。
class EventClassifier {
public:
  static std::vector<RunwayEvent> Classify(const std::vector<std::int8_t>& transitions,
                                           FirstPingPolicy policy = FirstPingPolicy::AsEntry);
};

// ======================
// 环节：跑道事件标注（第三遍派生）
//
// 输入：  ctx.timeline、ctx.pings[i].transition、ctx.config.first_ping_policy
// 输出：  ctx.pings[i].event
//         ctx.flight_summaries（与 ctx.timeline.FlightIds() 同序）
// ======================
class EventClassifyStage final : public IStage {
public:
  const char* Name() const override { return "EventClassify"; }
  void Run(RunContext& ctx) override;
};

} // namespace runway
