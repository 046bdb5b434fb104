#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace runway {

// ======================
// 按航班分组、按时间排序的报点时间线
//
// 只保存下标（指向构建时传入的 pings 数组），不拷贝 Ping。
// 排序键：timestamp 升序 -> id 升序 -> 输入位置升序，保证稳定且全序。
// ======================
class PingTimeline {
public:
  PingTimeline() = default;

  static PingTimeline Build(const std::vector<Ping>& pings);

  // 升序排列的航班号
  const std::vector<std::string>& FlightIds() const { return flight_ids_; }
  std::size_t FlightCount() const { return flight_ids_.size(); }

  // 第 k 个航班（与 FlightIds() 同序）
  const std::vector<std::size_t>& TimelineAt(std::size_t flight_slot) const;

  // 未知航班抛 std::out_of_range
  const std::vector<std::size_t>& TimelineFor(const std::string& flight_id) const;

  std::optional<std::size_t> Previous(std::size_t ping_index) const;
  std::optional<std::size_t> Next(std::size_t ping_index) const;

  // 同一航班内相邻且时间戳相同的对数
  std::size_t TimestampTies() const { return timestamp_ties_; }

  std::size_t PingCount() const { return flight_of_.size(); }

private:
  std::vector<std::string> flight_ids_;
  std::map<std::string, std::size_t> slot_of_flight_;
  std::vector<std::vector<std::size_t>> timelines_;

  // 按 ping 下标反查：所属航班 slot、在时间线中的位置
  std::vector<std::size_t> flight_of_;
  std::vector<std::size_t> position_of_;

  std::size_t timestamp_ties_{0};
};

} // namespace runway
