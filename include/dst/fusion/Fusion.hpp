#pragma once

#include <cstddef>

#include "dst/core/Logger.hpp"
#include "dst/core/Status.hpp"
#include "dst/core/Types.hpp"
#include "dst/fusion/Approximation.hpp"
#include "dst/fusion/Dempster.hpp"

namespace dst {

// Fuses a sequence of raw mass assignments: each is bounded with `Approx`,
// then the bounded assignments are left-folded through Dempster's rule, which
// re-approximates after every step. `out` is written only on success.
template <typename Approx = TopN, typename S, std::size_t N, typename Sources>
FusionStatus_e fuse(const Sources& sources, BoundedAssignment<S, N>& out) {
  BoundedAssignment<S, N> accumulated{};
  std::size_t folded = 0;
  for (const auto& source : sources) {
    const BoundedAssignment<S, N> bounded = Approx::template approx<N>(source);
    if (folded == 0) {
      accumulated = bounded;
    } else {
      BoundedAssignment<S, N> combined{};
      const FusionStatus_e status = Dempster::combine<Approx>(accumulated, bounded, combined);
      if (status != FusionStatus_e::kOk) {
        if (auto logger = Logger::GetClass("Fusion")) {
          logger->warn("Fusion: stopped at source {}: {}", folded, toString(status));
        }
        return status;
      }
      accumulated = combined;
    }
    ++folded;
  }

  if (folded == 0) {
    if (auto logger = Logger::GetClass("Fusion")) {
      logger->warn("Fusion: no sources to fuse");
    }
    return FusionStatus_e::kEmptyInput;
  }
  if (auto logger = Logger::GetClass("Fusion")) {
    logger->debug("Fusion: folded {} sources into {} focal elements", folded, focalCount(accumulated));
  }
  out = accumulated;
  return FusionStatus_e::kOk;
}

} // namespace dst
