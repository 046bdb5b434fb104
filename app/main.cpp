#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "io/config_loader.hpp"
#include "io/output_writer.hpp"
#include "io/ping_reader.hpp"
#include "pipeline/runway_event_engine.hpp"

static void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--config FILE] [--quiet] <pings.json> <output_dir>\n";
}

int main(int argc, char** argv) {
  // 默认使用 demo/input（pings.json + engine_config.json）和 demo/output
  //   ./runway_events
  //   ./runway_events --config demo/input/engine_config.json demo/input/pings.json demo/output
  std::string config_path;
  bool quiet = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        PrintUsage(argv[0]);
        return 2;
      }
      config_path = argv[++i];
    } else if (arg == "--quiet") {
      quiet = true;
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() > 2) {
    PrintUsage(argv[0]);
    return 2;
  }

  const std::string input_path = positional.size() >= 1 ? positional[0] : "demo/input/pings.json";
  const std::string output_dir = positional.size() >= 2 ? positional[1] : "demo/output";
  if (config_path.empty() && positional.empty() &&
      std::filesystem::exists("demo/input/engine_config.json")) {
    config_path = "demo/input/engine_config.json";
  }

  try {
    // 1) 配置（可选），多边形非法在这里就失败
    runway::RunContext ctx;
    if (!config_path.empty()) {
      ctx.config = runway::io::ConfigLoader::LoadFile(config_path);
    }
    ctx.config.verbose = !quiet;
    ctx.predicate.emplace(runway::RunwayEventEngine::MakePredicate(ctx.config));

    // 2) 报点
    runway::io::PingIdAllocator ids;
    ctx.pings = runway::io::PingReader::LoadFile(input_path, ids);
    if (!quiet) {
      std::cout << "Loaded " << ctx.pings.size() << " pings from " << input_path << "\n";
    }

    // 3) 三遍派生
    runway::RunwayEventEngine engine;
    engine.Run(ctx);

    // 4) 输出
    runway::io::OutputWriter::WriteAll(ctx, output_dir);

    std::cout << "Done. " << ctx.flight_summaries.size()
              << " flights classified, output written to: " << output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
