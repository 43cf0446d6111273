#include "dst/core/Logger.hpp"

#include <filesystem>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dst {

namespace {

constexpr const char* kRootName = "dst";
constexpr const char* kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> gLogger;
LoggingConfig_t gConfig{};
spdlog::level::level_enum gLevel = spdlog::level::info;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> gClassLoggers;

void ensureParent(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
}

void dropClassLoggers() {
  for (const auto& entry : gClassLoggers) {
    spdlog::drop(entry.first);
  }
  gClassLoggers.clear();
}

void BuildLogger() {
  spdlog::drop(kRootName);
  gLogger.reset();
  if (!gConfig.enabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (gConfig.file.enabled) {
    ensureParent(gConfig.file.path);
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          gConfig.file.path, gConfig.file.maxSizeBytes, gConfig.file.maxFiles));
    } catch (const spdlog::spdlog_ex&) {
      // Keep logging to stdout when the file cannot be opened.
    }
  }

  gLogger = std::make_shared<spdlog::logger>(kRootName, sinks.begin(), sinks.end());
  gLogger->set_pattern(kPattern);
  gLogger->set_level(gLevel);
  spdlog::register_logger(gLogger);
}

std::shared_ptr<spdlog::logger> BuildClassLogger(const std::string& name) {
  const std::filesystem::path path = std::filesystem::path(gConfig.classLogs.path) / (name + ".log");
  ensureParent(path);
  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), gConfig.classLogs.maxSizeBytes, gConfig.classLogs.maxFiles);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern(kPattern);
    logger->set_level(gLevel);
    spdlog::register_logger(logger);
    return logger;
  } catch (const spdlog::spdlog_ex&) {
    return nullptr;
  }
}

} // namespace

void Logger::Initialize() {
  if (!gLogger && gConfig.enabled) {
    BuildLogger();
  }
}

void Logger::Configure(const LoggingConfig_t& config) {
  gConfig = config;
  gLevel = ParseLevel(config.level);
  dropClassLoggers();
  BuildLogger();
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  if (!gConfig.enabled) {
    return nullptr;
  }
  if (!gLogger) {
    Initialize();
  }
  return gLogger;
}

std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  if (!gConfig.enabled || !gConfig.classLogs.enabled) {
    return Get();
  }
  auto it = gClassLoggers.find(name);
  if (it != gClassLoggers.end()) {
    return it->second;
  }
  auto logger = BuildClassLogger(name);
  if (logger) {
    gClassLoggers[name] = logger;
    return logger;
  }
  return Get();
}

void Logger::SetEnabled(bool enabled) {
  gConfig.enabled = enabled;
  dropClassLoggers();
  BuildLogger();
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  gLevel = level;
  if (gLogger) {
    gLogger->set_level(level);
  }
  for (const auto& entry : gClassLoggers) {
    entry.second->set_level(level);
  }
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  if (value == "trace") {
    return spdlog::level::trace;
  }
  if (value == "debug") {
    return spdlog::level::debug;
  }
  if (value == "warn") {
    return spdlog::level::warn;
  }
  if (value == "error") {
    return spdlog::level::err;
  }
  if (value == "critical") {
    return spdlog::level::critical;
  }
  if (value == "off") {
    return spdlog::level::off;
  }
  return spdlog::level::info;
}

} // namespace dst
