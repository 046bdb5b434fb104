#pragma once
#include "common/context.hpp"

namespace runway {

// 每个“派生步骤”实现一个 Stage，输入输出都通过 RunContext 传递。
// 顺序由 RunwayEventEngine 固定：区内判定 -> 时间线 -> 跳变 -> 事件。
// Run 必须可重复调用：每次都覆盖自己负责的输出。
class IStage {
public:
  virtual ~IStage() = default;
  virtual const char* Name() const = 0;
  virtual void Run(RunContext& ctx) = 0;
};

} // namespace runway
