#include "dst/data/FrameOfDiscernment.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "dst/core/Logger.hpp"

namespace dst {

namespace {

constexpr char kSeparator = '|';
constexpr const char* kWholeFrame = "*";

std::string trim(const std::string& value) {
  const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
  const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return first < last ? std::string(first, last) : std::string();
}

} // namespace

bool FrameOfDiscernment::addLabel(const std::string& label) {
  const std::string name = trim(label);
  if (name.empty() || name == kWholeFrame || name.find(kSeparator) != std::string::npos) {
    if (auto logger = Logger::GetClass("FrameOfDiscernment")) {
      logger->error("FrameOfDiscernment: invalid label '{}'", label);
    }
    return false;
  }
  if (indexOf(name) >= 0) {
    if (auto logger = Logger::GetClass("FrameOfDiscernment")) {
      logger->error("FrameOfDiscernment: duplicate label '{}'", name);
    }
    return false;
  }
  if (labels.size() >= kMaxFrameSize) {
    if (auto logger = Logger::GetClass("FrameOfDiscernment")) {
      logger->error("FrameOfDiscernment: frame is limited to {} labels", kMaxFrameSize);
    }
    return false;
  }
  labels.push_back(name);
  return true;
}

Hypothesis FrameOfDiscernment::whole() const {
  Hypothesis all;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    all.set(i);
  }
  return all;
}

bool FrameOfDiscernment::parse(const std::string& expression, Hypothesis& out) const {
  const std::string trimmed = trim(expression);
  if (trimmed == kWholeFrame) {
    out = whole();
    return true;
  }

  Hypothesis result;
  std::size_t start = 0;
  while (start <= trimmed.size()) {
    const std::size_t end = std::min(trimmed.find(kSeparator, start), trimmed.size());
    const std::string label = trim(trimmed.substr(start, end - start));
    const int index = indexOf(label);
    if (index < 0) {
      if (auto logger = Logger::GetClass("FrameOfDiscernment")) {
        logger->error("FrameOfDiscernment: unknown label '{}' in '{}'", label, expression);
      }
      return false;
    }
    result.set(static_cast<std::size_t>(index));
    start = end + 1;
  }
  out = result;
  return true;
}

std::string FrameOfDiscernment::format(const Hypothesis& hypothesis) const {
  std::string text;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (!hypothesis.test(i)) {
      continue;
    }
    if (!text.empty()) {
      text += kSeparator;
    }
    text += labels[i];
  }
  return text.empty() ? "{}" : text;
}

int FrameOfDiscernment::indexOf(const std::string& label) const {
  const auto it = std::find(labels.begin(), labels.end(), label);
  if (it == labels.end()) {
    return -1;
  }
  return static_cast<int>(std::distance(labels.begin(), it));
}

} // namespace dst
