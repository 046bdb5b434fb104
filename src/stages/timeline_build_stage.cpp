#include "stages/timeline_build_stage.hpp"

namespace runway {

void TimelineBuildStage::Run(RunContext& ctx) {
  ctx.timeline = PingTimeline::Build(ctx.pings);
  ctx.diagnostics.timestamp_ties = ctx.timeline.TimestampTies();
}

} // namespace runway
