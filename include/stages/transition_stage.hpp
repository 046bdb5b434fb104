#pragma once
#include <cstdint>
#include <vector>
#include "stages/stage_base.hpp"

namespace runway {

// 单航班的跳变计算：对按时间排好的 in_region 做一阶差分。
// 顺序折叠，只带一个“上一个区内状态”累加器，初值 0（首点没有前驱按不在区内算）。
class TransitionDetector {
public:
  static std::vector<std::int8_t> Detect(const std::vector<bool>& in_region);

  // 直接在 pings 上沿 timeline 写 transition
  static void Apply(const std::vector<std::size_t>& timeline, std::vector<Ping>& pings);
};

// ======================
// 环节：跑道区进出跳变（第二遍派生）
//
// 输入：  ctx.timeline、ctx.pings[i].in_region
// 输出：  ctx.pings[i].transition ∈ {-1, 0, +1}
//
// 按航班并行；航班之间没有共享的可写状态。
// ======================
class TransitionStage final : public IStage {
public:
  const char* Name() const override { return "Transition"; }
  void Run(RunContext& ctx) override;
};

} // namespace runway
