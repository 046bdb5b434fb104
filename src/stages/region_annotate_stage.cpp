#include "stages/region_annotate_stage.hpp"

#include <cmath>
#include <stdexcept>

#include "pipeline/flight_parallel.hpp"

namespace runway {

void RegionAnnotateStage::Run(RunContext& ctx) {
  if (!ctx.predicate) {
    throw std::logic_error("RegionAnnotateStage: geometry predicate not configured");
  }
  const GeoPredicate& pred = *ctx.predicate;

  const unsigned workers = ResolveWorkerCount(ctx.config.worker_threads, ctx.pings.size());
  std::vector<Diagnostics> local(workers);

  ParallelFor(ctx.pings.size(), workers, [&](std::size_t begin, std::size_t end, unsigned w) {
    Diagnostics& diag = local[w];
    for (std::size_t i = begin; i < end; ++i) {
      Ping& p = ctx.pings[i];
      if (!p.altitude) diag.missing_altitude++;
      if (!p.point) {
        diag.missing_point++;
      } else if (!std::isfinite(p.point->lon_deg) || !std::isfinite(p.point->lat_deg)) {
        diag.non_finite_point++;
      }
      p.in_region = pred.Contains(p.point, p.altitude);
    }
  });

  // 本 Stage 负责的计数先清零再汇总，保证重复 Run 结果一致
  ctx.diagnostics.missing_altitude = 0;
  ctx.diagnostics.missing_point = 0;
  ctx.diagnostics.non_finite_point = 0;
  for (const auto& d : local) {
    ctx.diagnostics.missing_altitude += d.missing_altitude;
    ctx.diagnostics.missing_point += d.missing_point;
    ctx.diagnostics.non_finite_point += d.non_finite_point;
  }
}

} // namespace runway
