#pragma once

#include <string>
#include <vector>

#include "dst/core/Types.hpp"
#include "dst/data/FrameOfDiscernment.hpp"

namespace dst {

// One body of evidence: a raw mass assignment over the frame.
struct Evidence_t {
  std::string name;
  std::vector<FocalElement_t<Hypothesis>> masses;
};

// Streaming evidence interface.
class IEvidenceSource {
public:
  virtual ~IEvidenceSource() = default;
  virtual bool next(Evidence_t& out) = 0;
};

} // namespace dst
