#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "dst/config/FusionConfig.hpp"
#include "dst/core/Logger.hpp"
#include "dst/data/FrameOfDiscernment.hpp"
#include "dst/data/JsonEvidenceSource.hpp"
#include "dst/fusion/Measures.hpp"
#include "dst/pipeline/FusionPipeline.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::string strategy;
  std::string logLevel;
  std::size_t capacity = 0;
  bool quiet = false;
  bool showHelp = false;
};

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  options.configPath = "config/default.json";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config" && i + 1 < argc) {
      options.configPath = argv[++i];
    } else if (arg == "--strategy" && i + 1 < argc) {
      options.strategy = argv[++i];
    } else if (arg == "--capacity" && i + 1 < argc) {
      options.capacity = static_cast<std::size_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (arg == "--log-level" && i + 1 < argc) {
      options.logLevel = argv[++i];
    } else if (arg == "--quiet") {
      options.quiet = true;
    }
  }
  return options;
}

void reportError(const std::string& message) {
  if (auto logger = dst::Logger::Get()) {
    logger->error("{}", message);
  } else {
    fmt::print(stderr, "{}\n", message);
  }
}

} // namespace

int main(int argc, char** argv) {
  dst::Logger::Initialize();
  const CliOptions_t cliOptions = parseArgs(argc, argv);
  if (cliOptions.showHelp) {
    fmt::print("Usage: dst_cli [--config <path>] [--strategy <topn|summarize>] [--capacity <2|4|8|16|32>]\n"
               "               [--log-level <trace|debug|info|warn|error|off>] [--quiet]\n");
    return 0;
  }

  nlohmann::json config;
  try {
    config = dst::loadJson(cliOptions.configPath);
  } catch (const std::exception& e) {
    reportError(e.what());
    return 1;
  }
  dst::Logger::Configure(dst::parseLoggingConfig(config.value("logging", nlohmann::json::object())));
  if (!cliOptions.logLevel.empty()) {
    dst::Logger::SetLevel(dst::Logger::ParseLevel(cliOptions.logLevel));
  }
  if (cliOptions.quiet) {
    dst::Logger::SetEnabled(false);
  }
  if (auto logger = dst::Logger::Get()) {
    logger->info("dst_cli using config: {}", cliOptions.configPath);
  }

  dst::FrameOfDiscernment frame;
  if (!dst::parseFrame(config.value("frame", nlohmann::json::array()), frame)) {
    reportError("Failed to read the frame of discernment from config.");
    return 1;
  }

  dst::FusionOptions_t options = dst::parseFusionOptions(config.value("fusion", nlohmann::json::object()));
  if (!cliOptions.strategy.empty()) {
    options.strategy = dst::parseStrategy(cliOptions.strategy, options.strategy);
  }
  if (cliOptions.capacity > 0) {
    options.capacity = dst::supportedCapacity(cliOptions.capacity);
  }

  dst::JsonEvidenceSource source(config.value("sources", nlohmann::json::array()), frame);
  dst::FusionPipeline pipeline(options);
  const dst::FusionReport_t report = pipeline.run(source);
  if (source.skipped() > 0) {
    fmt::print("Skipped {} invalid sources\n", source.skipped());
  }
  if (report.status != dst::FusionStatus_e::kOk) {
    reportError(std::string("Fusion failed: ") + dst::toString(report.status));
    return 2;
  }

  fmt::print("Fused {} sources ({}, capacity {}):\n",
             report.sourceCount,
             dst::toString(pipeline.options().strategy),
             pipeline.options().capacity);
  for (const auto& element : report.focalElements) {
    fmt::print("  m({}) = {:.4f}\n", frame.format(element.hypothesis), element.mass);
  }

  const nlohmann::json queries = config.value("queries", nlohmann::json::array());
  for (const auto& queryNode : queries) {
    if (!queryNode.is_string()) {
      continue;
    }
    dst::Hypothesis query;
    if (!frame.parse(queryNode.get<std::string>(), query)) {
      continue;
    }
    fmt::print("  bel({0}) = {1:.4f}  pl({0}) = {2:.4f}\n",
               frame.format(query),
               dst::bel(report.focalElements, query),
               dst::pl(report.focalElements, query));
  }

  if (auto logger = dst::Logger::Get()) {
    logger->info("dst_cli done");
  }
  return 0;
}
