#include "dst/core/Status.hpp"

namespace dst {

const char* toString(FusionStatus_e status) {
  switch (status) {
    case FusionStatus_e::kOk:
      return "ok";
    case FusionStatus_e::kFullContradiction:
      return "full contradiction";
    case FusionStatus_e::kEmptyInput:
      return "empty input";
  }
  return "unknown";
}

} // namespace dst
