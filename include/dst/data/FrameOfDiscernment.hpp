#pragma once

#include <bitset>
#include <cstddef>
#include <string>
#include <vector>

namespace dst {

constexpr std::size_t kMaxFrameSize = 64;

// Hypothesis type used by the application layers.
using Hypothesis = std::bitset<kMaxFrameSize>;

// Named elementary hypotheses. Label i maps to bit i.
class FrameOfDiscernment {
public:
  FrameOfDiscernment() = default;

  // Adds a label; fails on empty, duplicate or reserved labels and when the
  // frame is full.
  bool addLabel(const std::string& label);

  std::size_t size() const { return labels.size(); }
  const std::vector<std::string>& labelNames() const { return labels; }

  // Every elementary hypothesis of the frame.
  Hypothesis whole() const;

  // Parses "A|B|C" (whitespace ignored) or "*" for the whole frame.
  bool parse(const std::string& expression, Hypothesis& out) const;

  // Inverse of parse; the empty set formats as "{}".
  std::string format(const Hypothesis& hypothesis) const;

private:
  int indexOf(const std::string& label) const;

  std::vector<std::string> labels;
};

} // namespace dst
