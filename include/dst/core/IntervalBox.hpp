#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "dst/core/Hash.hpp"
#include "dst/core/Set.hpp"

namespace dst {

// Axis-aligned box of closed integral intervals. A box with no extent in any
// dimension is the empty set; all empty boxes share one representation.
template <std::size_t D, typename T>
class IntervalBox {
  static_assert(D > 0, "IntervalBox requires at least one dimension");
  static_assert(std::is_integral<T>::value, "IntervalBox requires integral bounds");

public:
  using Bound = std::pair<T, T>;
  using Bounds = std::array<std::optional<Bound>, D>;

  IntervalBox() = default;

  explicit IntervalBox(const Bounds& boundsInput) : bounds(boundsInput) {
    for (const auto& dim : bounds) {
      if (dim && dim->first > dim->second) {
        throw std::invalid_argument("IntervalBox: lower bound exceeds upper bound");
      }
    }
    normalize();
  }

  bool empty() const { return !bounds[0].has_value(); }
  const Bounds& dimensions() const { return bounds; }

  bool operator==(const IntervalBox& rhs) const { return bounds == rhs.bounds; }
  bool operator!=(const IntervalBox& rhs) const { return !(*this == rhs); }

  bool contains(const IntervalBox& inner) const {
    if (inner.empty()) {
      return true;
    }
    if (empty()) {
      return false;
    }
    for (std::size_t i = 0; i < D; ++i) {
      if (inner.bounds[i]->first < bounds[i]->first || inner.bounds[i]->second > bounds[i]->second) {
        return false;
      }
    }
    return true;
  }

  static IntervalBox intersect(const IntervalBox& lhs, const IntervalBox& rhs) {
    IntervalBox result;
    if (lhs.empty() || rhs.empty()) {
      return result;
    }
    for (std::size_t i = 0; i < D; ++i) {
      const Bound& l = *lhs.bounds[i];
      const Bound& r = *rhs.bounds[i];
      if (l.second < r.first || r.second < l.first) {
        return IntervalBox();
      }
      result.bounds[i] = Bound(std::max(l.first, r.first), std::min(l.second, r.second));
    }
    return result;
  }

  // Per-dimension hull; a superset of the union when the boxes are disjoint.
  static IntervalBox hull(const IntervalBox& lhs, const IntervalBox& rhs) {
    if (lhs.empty()) {
      return rhs;
    }
    if (rhs.empty()) {
      return lhs;
    }
    IntervalBox result;
    for (std::size_t i = 0; i < D; ++i) {
      const Bound& l = *lhs.bounds[i];
      const Bound& r = *rhs.bounds[i];
      result.bounds[i] = Bound(std::min(l.first, r.first), std::max(l.second, r.second));
    }
    return result;
  }

  std::uint64_t hash() const {
    std::uint64_t state = fnv1a(nullptr, 0);
    if (empty()) {
      return state;
    }
    for (const auto& dim : bounds) {
      state = fnv1a(&dim->first, sizeof(T), state);
      state = fnv1a(&dim->second, sizeof(T), state);
    }
    return state;
  }

private:
  void normalize() {
    for (const auto& dim : bounds) {
      if (!dim) {
        bounds.fill(std::nullopt);
        return;
      }
    }
  }

  Bounds bounds{};
};

// Interval boxes cannot represent their complement, so plausibility queries
// over them do not compile.
template <std::size_t D, typename T>
struct SetTraits<IntervalBox<D, T>> {
  using Set = IntervalBox<D, T>;

  static Set empty() { return Set(); }
  static bool isSubset(const Set& lhs, const Set& rhs) { return rhs.contains(lhs); }
  static Set cap(const Set& lhs, const Set& rhs) { return Set::intersect(lhs, rhs); }
  static Set cup(const Set& lhs, const Set& rhs) { return Set::hull(lhs, rhs); }
  static std::uint64_t hash(const Set& value) { return value.hash(); }
};

} // namespace dst
