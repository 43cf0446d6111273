#pragma once

#include <stdexcept>

namespace dst {

// Outcome of a combination or fusion call.
enum class FusionStatus_e {
  kOk,
  kFullContradiction,
  kEmptyInput
};

const char* toString(FusionStatus_e status);

// Raised when a bounded container runs out of slots; a sizing error, not a data error.
class CapacityExceeded : public std::length_error {
public:
  using std::length_error::length_error;
};

} // namespace dst
