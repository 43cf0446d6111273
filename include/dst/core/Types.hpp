#pragma once

#include <array>
#include <cstddef>

#include "dst/core/Set.hpp"

namespace dst {

using Mass = float;

// A hypothesis together with the mass committed to it.
template <typename S>
struct FocalElement_t {
  S hypothesis = SetTraits<S>::empty();
  Mass mass = 0.0f;
};

// At most N focal elements; unused slots hold (EMPTY, 0).
template <typename S, std::size_t N>
using BoundedAssignment = std::array<FocalElement_t<S>, N>;

template <typename Range>
Mass totalMass(const Range& assignment) {
  Mass sum = 0.0f;
  for (const auto& element : assignment) {
    sum += element.mass;
  }
  return sum;
}

// Number of slots that carry a non-empty hypothesis.
template <typename Range>
std::size_t focalCount(const Range& assignment) {
  std::size_t count = 0;
  for (const auto& element : assignment) {
    if (!isEmpty(element.hypothesis)) {
      ++count;
    }
  }
  return count;
}

} // namespace dst
