#include "stages/event_classify_stage.hpp"

#include <optional>

#include "pipeline/flight_parallel.hpp"

namespace runway {

std::vector<RunwayEvent> EventClassifier::Classify(const std::vector<std::int8_t>& transitions,
                                                   FirstPingPolicy policy) {
  std::vector<RunwayEvent> events(transitions.size(), RunwayEvent::None);

  // 非零子序列（存位置）
  std::vector<std::size_t> nz;
  for (std::size_t k = 0; k < transitions.size(); ++k) {
    if (transitions[k] == 0) continue;
    if (k == 0 && policy == FirstPingPolicy::AsUnknown) continue;
    nz.push_back(k);
  }

  for (std::size_t j = 0; j < nz.size(); ++j) {
    const int cur = transitions[nz[j]];
    std::optional<int> prev;
    std::optional<int> next;
    if (j > 0) prev = transitions[nz[j - 1]];
    if (j + 1 < nz.size()) next = transitions[nz[j + 1]];

    RunwayEvent ev = RunwayEvent::None;
    if (cur == -1 && prev && *prev == 1) {
      ev = RunwayEvent::TouchAndGo;
    } else if (cur == 1 && !next) {
      ev = RunwayEvent::Landing;
    } else if (cur == -1 && !prev) {
      ev = RunwayEvent::Takeoff;
    }
    events[nz[j]] = ev;
  }
  return events;
}

void EventClassifyStage::Run(RunContext& ctx) {
  const std::size_t n = ctx.timeline.FlightCount();
  ctx.flight_summaries.assign(n, FlightEventSummary{});

  ParallelFor(n, ctx.config.worker_threads, [&](std::size_t begin, std::size_t end, unsigned) {
    for (std::size_t f = begin; f < end; ++f) {
      const auto& line = ctx.timeline.TimelineAt(f);

      std::vector<std::int8_t> transitions;
      transitions.reserve(line.size());
      for (std::size_t idx : line) transitions.push_back(ctx.pings[idx].transition);

      const auto events = EventClassifier::Classify(transitions, ctx.config.first_ping_policy);

      FlightEventSummary& summary = ctx.flight_summaries[f];
      summary.flight_id = ctx.timeline.FlightIds()[f];
      summary.ping_count = line.size();
      for (std::size_t k = 0; k < line.size(); ++k) {
        Ping& p = ctx.pings[line[k]];
        p.event = events[k];
        switch (p.event) {
          case RunwayEvent::Takeoff:    summary.takeoff_ping_ids.push_back(p.id); break;
          case RunwayEvent::Landing:    summary.landing_ping_ids.push_back(p.id); break;
          case RunwayEvent::TouchAndGo: summary.touch_n_go_ping_ids.push_back(p.id); break;
          case RunwayEvent::None:       break;
        }
      }
    }
  });
}

} // namespace runway
