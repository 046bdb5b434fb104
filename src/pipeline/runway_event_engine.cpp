#include "pipeline/runway_event_engine.hpp"

#include <chrono>
#include <iostream>

#include "common/errors.hpp"
#include "geo/runway_polygon.hpp"

// 具体 Stage
#include "stages/region_annotate_stage.hpp"
#include "stages/timeline_build_stage.hpp"
#include "stages/transition_stage.hpp"
#include "stages/event_classify_stage.hpp"

namespace runway {

RunwayEventEngine::RunwayEventEngine() {
  stages_.emplace_back(std::make_unique<RegionAnnotateStage>());
  stages_.emplace_back(std::make_unique<TimelineBuildStage>());
  stages_.emplace_back(std::make_unique<TransitionStage>());
  stages_.emplace_back(std::make_unique<EventClassifyStage>());
}

void RunwayEventEngine::Run(RunContext& ctx) {
  if (ctx.pings.empty() && ctx.config.require_pings) {
    throw EmptyDatasetError("no pings to classify");
  }

  ctx.predicate.emplace(MakePredicate(ctx.config));

  ctx.diagnostics = {};

  for (auto& stage : stages_) {
    const auto t0 = std::chrono::steady_clock::now();
    stage->Run(ctx);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    if (ctx.config.verbose) {
      std::cout << "[stage] " << stage->Name() << " done in " << ms << " ms\n";
    }
  }

  const Diagnostics& d = ctx.diagnostics;
  if (d.missing_altitude || d.missing_point || d.non_finite_point) {
    std::cerr << "WARNING: defaulted to not-in-region: missing_altitude=" << d.missing_altitude
              << " missing_point=" << d.missing_point
              << " non_finite_point=" << d.non_finite_point << "\n";
  }
  if (d.timestamp_ties) {
    std::cerr << "WARNING: " << d.timestamp_ties
              << " equal-timestamp ping pair(s), ordered by ping id\n";
  }
}

GeoPredicate RunwayEventEngine::MakePredicate(const EngineConfig& config) {
  const RunwayPolygon polygon =
      config.polygon.ring.empty() ? DefaultRunwayPolygon() : config.polygon;
  return GeoPredicate(polygon, config.altitude_ceiling);
}

} // namespace runway
