#pragma once
#include <memory>
#include <vector>
#include "common/context.hpp"
#include "stages/stage_base.hpp"

namespace runway {

// RunwayEventEngine 负责把各 Stage 按依赖顺序串起来：
//   区内判定 -> 时间线 -> 跳变 -> 事件
// 每一遍都消费上一遍的输出，顺序不能换。
class RunwayEventEngine {
public:
  RunwayEventEngine();

  // 构造 ctx.predicate（多边形为空时用内置 LFBO 区），校验结构性前提后跑完所有 Stage。
  // 结构性错误（多边形非法 / 需要报点却为空）直接抛出，整轮失败。
  void Run(RunContext& ctx);

  // 按配置构造区域判定（多边形为空时用内置 LFBO 区），非法多边形抛 InvalidGeometryError。
  // Run 内部也用它；入口在读报点之前先调一次做启动校验。
  static GeoPredicate MakePredicate(const EngineConfig& config);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace runway
