#pragma once

#include "dst/core/Set.hpp"
#include "dst/core/Types.hpp"

namespace dst {

// Belief: total mass of the focal elements contained in `query`.
template <typename Range, typename S>
Mass bel(const Range& assignment, const S& query) {
  Mass sum = 0.0f;
  for (const auto& element : assignment) {
    if (isSubset(element.hypothesis, query)) {
      sum += element.mass;
    }
  }
  return sum;
}

// Plausibility: 1 - bel(complement(query)).
template <typename Range, typename S>
Mass pl(const Range& assignment, const S& query) {
  return 1.0f - bel(assignment, complement(query));
}

} // namespace dst
