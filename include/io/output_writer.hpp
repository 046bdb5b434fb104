#pragma once
#include <string>
#include "common/context.hpp"

namespace runway::io {

// OutputWriter 负责把 ctx 中的“最终产物”写到输出目录：
// 1) pings_enriched.csv：按入库顺序输出每个报点 + in_region,transition,event
// 2) summary.json：航班数 / 报点数 / 各类事件计数 / 每航班事件 / 诊断计数
class OutputWriter {
public:
  static void WriteAll(const RunContext& ctx, const std::string& output_dir);

  // 分开暴露接口，方便只写某一种输出进行调试
  static void WriteEnrichedCsv(const RunContext& ctx, const std::string& output_path);
  static void WriteSummaryJson(const RunContext& ctx, const std::string& output_path);
};

} // namespace runway::io
