#pragma once
#include "stages/stage_base.hpp"

namespace runway {

// ======================
// 环节：按航班分组 + 时间排序
//
// 输入：  ctx.pings[i].flight_id / timestamp / id
// 输出：  ctx.timeline
//         ctx.diagnostics.timestamp_ties
// ======================
class TimelineBuildStage final : public IStage {
public:
  const char* Name() const override { return "TimelineBuild"; }
  void Run(RunContext& ctx) override;
};

} // namespace runway
