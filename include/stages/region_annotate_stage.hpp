#pragma once
#include "stages/stage_base.hpp"

namespace runway {

// ======================
// 环节：跑道区内判定（第一遍派生）
//
// 输入：
//   ctx.predicate（必须已构造，否则抛 std::logic_error，整轮失败）
//   ctx.pings[i].point / altitude
//
// 输出：
//   ctx.pings[i].in_region
//   ctx.diagnostics.missing_altitude / missing_point / non_finite_point
//
// 备注：
//   - 按报点切块并行，每个 worker 只写自己那一段
//   - 缺失/异常遥测只计数，结果一律是 false
// ======================
class RegionAnnotateStage final : public IStage {
public:
  const char* Name() const override { return "RegionAnnotate"; }
  void Run(RunContext& ctx) override;
};

} // namespace runway
