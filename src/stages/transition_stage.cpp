#include "stages/transition_stage.hpp"

#include "pipeline/flight_parallel.hpp"

namespace runway {

std::vector<std::int8_t> TransitionDetector::Detect(const std::vector<bool>& in_region) {
  std::vector<std::int8_t> out;
  out.reserve(in_region.size());
  int prev = 0;
  for (bool cur_in : in_region) {
    const int cur = cur_in ? 1 : 0;
    out.push_back(static_cast<std::int8_t>(cur - prev));
    prev = cur;
  }
  return out;
}

void TransitionDetector::Apply(const std::vector<std::size_t>& timeline, std::vector<Ping>& pings) {
  std::vector<bool> in_region;
  in_region.reserve(timeline.size());
  for (std::size_t idx : timeline) in_region.push_back(pings[idx].in_region);

  const auto transitions = Detect(in_region);
  for (std::size_t k = 0; k < timeline.size(); ++k) {
    pings[timeline[k]].transition = transitions[k];
  }
}

void TransitionStage::Run(RunContext& ctx) {
  const std::size_t n = ctx.timeline.FlightCount();
  ParallelFor(n, ctx.config.worker_threads, [&](std::size_t begin, std::size_t end, unsigned) {
    for (std::size_t f = begin; f < end; ++f) {
      TransitionDetector::Apply(ctx.timeline.TimelineAt(f), ctx.pings);
    }
  });
}

} // namespace runway
