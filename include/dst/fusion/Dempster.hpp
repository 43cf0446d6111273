#pragma once

#include <cstddef>

#include "dst/container/SummationTable.hpp"
#include "dst/core/Logger.hpp"
#include "dst/core/Set.hpp"
#include "dst/core/Status.hpp"
#include "dst/core/Types.hpp"
#include "dst/fusion/Approximation.hpp"

namespace dst {

// Conflict mass at or above 1 - kContradictionTolerance leaves the
// normalization factor undefined.
constexpr Mass kContradictionTolerance = 1e-6f;

// Dempster's rule of combination over bounded assignments.
struct Dempster {
  template <typename S, std::size_t N>
  using Table = SummationTable<S, Mass, N * N>;

  // Accumulates every non-conflicting pairwise intersection of `a` and `b`
  // into `table` and returns the conflict mass K. Pairs whose product is zero
  // are not focal and are skipped.
  template <typename S, std::size_t N>
  static Mass accumulate(const BoundedAssignment<S, N>& a,
                         const BoundedAssignment<S, N>& b,
                         Table<S, N>& table) {
    Mass conflict = 0.0f;
    for (const auto& lhs : a) {
      for (const auto& rhs : b) {
        const Mass product = lhs.mass * rhs.mass;
        if (product == 0.0f) {
          continue;
        }
        const S intersection = cap(lhs.hypothesis, rhs.hypothesis);
        if (isEmpty(intersection)) {
          conflict += product;
        } else {
          table.insert(intersection, product);
        }
      }
    }
    return conflict;
  }

  // Combines `a` and `b`, renormalizes by 1/(1-K) and re-bounds the result to
  // N slots with `Approx`. On full contradiction `out` is left untouched.
  template <typename Approx = TopN, typename S, std::size_t N>
  static FusionStatus_e combine(const BoundedAssignment<S, N>& a,
                                const BoundedAssignment<S, N>& b,
                                BoundedAssignment<S, N>& out) {
    Table<S, N> table;
    const Mass conflict = accumulate(a, b, table);
    const Mass normalization = 1.0f - conflict;
    // An empty table means every non-zero product conflicted, whatever K rounds to.
    if (table.empty() || normalization <= kContradictionTolerance) {
      if (auto logger = Logger::GetClass("Dempster")) {
        logger->warn("Dempster: full contradiction, conflict {:.6f}", conflict);
      }
      return FusionStatus_e::kFullContradiction;
    }
    table.scale(1.0f / normalization);

    if (auto logger = Logger::GetClass("Dempster")) {
      logger->debug("Dempster: conflict {:.6f}, {} intersections before approximation", conflict, table.size());
    }

    typename Approx::template Builder<S, N> builder;
    for (const auto& entry : table) {
      builder.add(FocalElement_t<S>{entry.key, entry.value});
    }
    out = builder.finish();
    return FusionStatus_e::kOk;
  }
};

} // namespace dst
