#include "dst/config/FusionConfig.hpp"

#include <fstream>
#include <stdexcept>

namespace dst {

namespace {

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

bool getBool(const nlohmann::json& node, const std::string& key, bool fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

std::size_t getSize(const nlohmann::json& node, const std::string& key, std::size_t fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_number_integer() || it->get<long long>() <= 0) {
    return fallback;
  }
  return it->get<std::size_t>();
}

LogSinkConfig_t parseSink(const nlohmann::json& node, const LogSinkConfig_t& fallback, const std::string& pathKey) {
  LogSinkConfig_t sink = fallback;
  if (!node.is_object()) {
    return sink;
  }
  sink.enabled = getBool(node, "enabled", sink.enabled);
  sink.path = getString(node, pathKey, sink.path);
  sink.maxSizeBytes = getSize(node, "maxSizeBytes", sink.maxSizeBytes);
  sink.maxFiles = getSize(node, "maxFiles", sink.maxFiles);
  return sink;
}

} // namespace

const char* toString(ApproximationStrategy_e strategy) {
  switch (strategy) {
    case ApproximationStrategy_e::kTopN:
      return "topn";
    case ApproximationStrategy_e::kSummarize:
      return "summarize";
  }
  return "unknown";
}

ApproximationStrategy_e parseStrategy(const std::string& value, ApproximationStrategy_e fallback) {
  if (value == "topn" || value == "top-n") {
    return ApproximationStrategy_e::kTopN;
  }
  if (value == "summarize") {
    return ApproximationStrategy_e::kSummarize;
  }
  if (auto logger = Logger::Get()) {
    logger->warn("FusionConfig: unknown strategy '{}', using {}", value, toString(fallback));
  }
  return fallback;
}

std::size_t supportedCapacity(std::size_t requested) {
  for (std::size_t capacity : kSupportedCapacities) {
    if (capacity >= requested) {
      return capacity;
    }
  }
  return kSupportedCapacities.back();
}

FusionOptions_t parseFusionOptions(const nlohmann::json& node) {
  FusionOptions_t options;
  if (!node.is_object()) {
    return options;
  }

  auto strategyIt = node.find("strategy");
  if (strategyIt != node.end() && strategyIt->is_string()) {
    options.strategy = parseStrategy(strategyIt->get<std::string>(), options.strategy);
  }

  const std::size_t requested = getSize(node, "capacity", options.capacity);
  options.capacity = supportedCapacity(requested);
  if (options.capacity != requested) {
    if (auto logger = Logger::Get()) {
      logger->warn("FusionConfig: capacity {} is not supported, using {}", requested, options.capacity);
    }
  }
  return options;
}

LoggingConfig_t parseLoggingConfig(const nlohmann::json& node) {
  LoggingConfig_t config;
  if (!node.is_object()) {
    return config;
  }
  config.enabled = getBool(node, "enabled", config.enabled);
  config.level = getString(node, "level", config.level);
  config.file = parseSink(node.value("file", nlohmann::json::object()), config.file, "path");
  config.classLogs = parseSink(node.value("classLogs", nlohmann::json::object()), config.classLogs, "directory");
  return config;
}

bool parseFrame(const nlohmann::json& node, FrameOfDiscernment& out) {
  if (!node.is_array() || node.empty()) {
    if (auto logger = Logger::Get()) {
      logger->error("FusionConfig: 'frame' must be a non-empty array of labels");
    }
    return false;
  }
  FrameOfDiscernment frame;
  for (const auto& labelNode : node) {
    if (!labelNode.is_string() || !frame.addLabel(labelNode.get<std::string>())) {
      return false;
    }
  }
  out = frame;
  return true;
}

nlohmann::json loadJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + path);
  }
  nlohmann::json config;
  try {
    file >> config;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
  }
  if (!config.is_object()) {
    throw std::runtime_error("Config file " + path + " must hold a JSON object");
  }
  return config;
}

} // namespace dst
