#include "timeline/ping_timeline.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace runway {

PingTimeline PingTimeline::Build(const std::vector<Ping>& pings) {
  PingTimeline tl;

  // 1) 分组：std::map 保证航班号有序，输出与输入中的航班顺序无关
  std::map<std::string, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < pings.size(); ++i) {
    groups[pings[i].flight_id].push_back(i);
  }

  tl.flight_of_.assign(pings.size(), 0);
  tl.position_of_.assign(pings.size(), 0);
  tl.flight_ids_.reserve(groups.size());
  tl.timelines_.reserve(groups.size());

  // 2) 组内排序
  for (auto& kv : groups) {
    auto& idx = kv.second;
    std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
      const Ping& pa = pings[a];
      const Ping& pb = pings[b];
      if (pa.timestamp != pb.timestamp) return pa.timestamp < pb.timestamp;
      if (pa.id != pb.id) return pa.id < pb.id;
      return a < b;
    });

    const std::size_t slot = tl.timelines_.size();
    for (std::size_t pos = 0; pos < idx.size(); ++pos) {
      tl.flight_of_[idx[pos]] = slot;
      tl.position_of_[idx[pos]] = pos;
      if (pos > 0 && pings[idx[pos]].timestamp == pings[idx[pos - 1]].timestamp) {
        tl.timestamp_ties_++;
      }
    }

    tl.slot_of_flight_[kv.first] = slot;
    tl.flight_ids_.push_back(kv.first);
    tl.timelines_.push_back(std::move(idx));
  }

  return tl;
}

const std::vector<std::size_t>& PingTimeline::TimelineAt(std::size_t flight_slot) const {
  return timelines_.at(flight_slot);
}

const std::vector<std::size_t>& PingTimeline::TimelineFor(const std::string& flight_id) const {
  auto it = slot_of_flight_.find(flight_id);
  if (it == slot_of_flight_.end()) {
    throw std::out_of_range("unknown flight_id: " + flight_id);
  }
  return timelines_[it->second];
}

std::optional<std::size_t> PingTimeline::Previous(std::size_t ping_index) const {
  if (ping_index >= flight_of_.size()) return std::nullopt;
  const std::size_t pos = position_of_[ping_index];
  if (pos == 0) return std::nullopt;
  return timelines_[flight_of_[ping_index]][pos - 1];
}

std::optional<std::size_t> PingTimeline::Next(std::size_t ping_index) const {
  if (ping_index >= flight_of_.size()) return std::nullopt;
  const auto& line = timelines_[flight_of_[ping_index]];
  const std::size_t pos = position_of_[ping_index];
  if (pos + 1 >= line.size()) return std::nullopt;
  return line[pos + 1];
}

} // namespace runway
