#include "dst/data/JsonEvidenceSource.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "dst/core/Logger.hpp"

namespace dst {

namespace {

constexpr Mass kSumTolerance = 1e-3f;

} // namespace

JsonEvidenceSource::JsonEvidenceSource(nlohmann::json sourcesInput, FrameOfDiscernment frameInput)
    : sources(std::move(sourcesInput)), frame(std::move(frameInput)) {
  if (!sources.is_array()) {
    if (auto logger = Logger::GetClass("JsonEvidenceSource")) {
      logger->error("JsonEvidenceSource: 'sources' is not an array, no evidence will be read");
    }
    sources = nlohmann::json::array();
  }
  if (auto logger = Logger::GetClass("JsonEvidenceSource")) {
    logger->info("JsonEvidenceSource: {} sources over {} labels", sources.size(), frame.size());
  }
}

bool JsonEvidenceSource::next(Evidence_t& out) {
  while (index < sources.size()) {
    const nlohmann::json& node = sources[index];
    ++index;
    Evidence_t evidence;
    if (!parseEntry(node, evidence)) {
      ++skippedCount;
      continue;
    }
    out = std::move(evidence);
    return true;
  }
  return false;
}

bool JsonEvidenceSource::parseEntry(const nlohmann::json& node, Evidence_t& out) const {
  auto logger = Logger::GetClass("JsonEvidenceSource");
  if (!node.is_object()) {
    if (logger) {
      logger->error("JsonEvidenceSource: source {} is not an object", index - 1);
    }
    return false;
  }
  auto nameIt = node.find("name");
  if (nameIt == node.end()) {
    out.name = "source" + std::to_string(index - 1);
  } else if (nameIt->is_string()) {
    out.name = nameIt->get<std::string>();
  } else {
    if (logger) {
      logger->error("JsonEvidenceSource: source {} has a non-string name", index - 1);
    }
    return false;
  }

  auto massesIt = node.find("masses");
  if (massesIt == node.end() || !massesIt->is_object() || massesIt->empty()) {
    if (logger) {
      logger->error("JsonEvidenceSource: '{}' has no masses", out.name);
    }
    return false;
  }

  for (auto it = massesIt->begin(); it != massesIt->end(); ++it) {
    if (!it.value().is_number()) {
      if (logger) {
        logger->error("JsonEvidenceSource: '{}' mass for '{}' is not a number", out.name, it.key());
      }
      return false;
    }
    const Mass mass = it.value().get<Mass>();
    if (!std::isfinite(mass) || mass < 0.0f || mass > 1.0f) {
      if (logger) {
        logger->error("JsonEvidenceSource: '{}' mass {} for '{}' is outside [0, 1]", out.name, mass, it.key());
      }
      return false;
    }
    Hypothesis hypothesis;
    if (!frame.parse(it.key(), hypothesis)) {
      return false;
    }

    // "A|B" and "B|A" name the same hypothesis.
    bool merged = false;
    for (auto& element : out.masses) {
      if (element.hypothesis == hypothesis) {
        element.mass += mass;
        merged = true;
        break;
      }
    }
    if (!merged) {
      out.masses.push_back(FocalElement_t<Hypothesis>{hypothesis, mass});
    }
  }

  const Mass sum = totalMass(out.masses);
  if (std::abs(sum - 1.0f) > kSumTolerance && logger) {
    logger->warn("JsonEvidenceSource: '{}' masses sum to {:.4f}", out.name, sum);
  }
  return true;
}

} // namespace dst
