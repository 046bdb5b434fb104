#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace runway::io {

// 报点 id 分配器：一次入库对应一个实例，单调递增，不复用。
class PingIdAllocator {
public:
  explicit PingIdAllocator(std::int64_t first_id = 1) : next_(first_id) {}

  std::int64_t Next() { return next_++; }
  std::int64_t peek() const { return next_; }

private:
  std::int64_t next_;
};

// 读取报点 JSON：顶层是数组，或是带 "pings" 数组的对象。每条记录：
//
//   { "flight_id": "30e7a9b1" | 820785193,
//     "timestamp": 1700000000 | "2023-11-14 22:13:20" | "2023-11-14T22:13:20Z",
//     "longitude": 1.36, "latitude": 43.62, "altitude": 1200,
//     "ground_speed": 140, "vertical_speed": -700, "heading": 143, "squawk": "7000" }
//
// flight_id / timestamp 必填，其余遥测可缺省或为 null。
// id 按记录在文件中的顺序由 ids 分配。
class PingReader {
public:
  static std::vector<Ping> LoadFile(const std::string& path, PingIdAllocator& ids);
  static std::vector<Ping> ParseText(const std::string& text, PingIdAllocator& ids,
                                     const std::string& hint = "pings");
};

// unix 秒；不是整数也不是 UTC 时间串 -> ConfigError
std::int64_t ParseTimestamp(const std::string& text);

} // namespace runway::io
