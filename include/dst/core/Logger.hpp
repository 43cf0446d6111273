#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace dst {

// Rotating file sink settings. For class sinks `path` names a directory that
// receives one <component>.log per class logger.
struct LogSinkConfig_t {
  bool enabled = false;
  std::string path;
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

struct LoggingConfig_t {
  bool enabled = true;
  std::string level = "info";
  LogSinkConfig_t file{false, "logs/dst.log"};
  LogSinkConfig_t classLogs{false, "logs/classes"};
};

class Logger {
 public:
  static void Initialize();
  static void Configure(const LoggingConfig_t& config);
  static std::shared_ptr<spdlog::logger> Get();
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetEnabled(bool enabled);
  static void SetLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum ParseLevel(const std::string& value);
};

} // namespace dst
