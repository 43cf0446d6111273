#pragma once

#include <array>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "dst/core/Logger.hpp"
#include "dst/data/FrameOfDiscernment.hpp"

namespace dst {

// Approximation applied to every input and after every combination step.
enum class ApproximationStrategy_e {
  kTopN,
  kSummarize
};

// Capacities the fusion pipeline is instantiated for.
constexpr std::array<std::size_t, 5> kSupportedCapacities = {2, 4, 8, 16, 32};

struct FusionOptions_t {
  ApproximationStrategy_e strategy = ApproximationStrategy_e::kTopN;
  std::size_t capacity = 8;
};

const char* toString(ApproximationStrategy_e strategy);
ApproximationStrategy_e parseStrategy(const std::string& value, ApproximationStrategy_e fallback);

// Smallest supported capacity >= requested, clamped to the largest.
std::size_t supportedCapacity(std::size_t requested);

FusionOptions_t parseFusionOptions(const nlohmann::json& node);
LoggingConfig_t parseLoggingConfig(const nlohmann::json& node);
bool parseFrame(const nlohmann::json& node, FrameOfDiscernment& out);

// Throws std::runtime_error when the file cannot be opened or parsed, or
// when its top level is not an object.
nlohmann::json loadJson(const std::string& path);

} // namespace dst
