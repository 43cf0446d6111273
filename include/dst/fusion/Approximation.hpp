#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

#include "dst/container/TopKSelector.hpp"
#include "dst/core/Set.hpp"
#include "dst/core/Types.hpp"

namespace dst {

namespace detail {

template <typename Range>
using RangeHypothesis = std::decay_t<decltype((*std::begin(std::declval<const Range&>())).hypothesis)>;

template <typename S>
Mass massOf(const FocalElement_t<S>& element) {
  return element.mass;
}

} // namespace detail

// Keeps the N most massive focal elements and rescales them to sum to one.
// Low-mass claims are dropped outright.
struct TopN {
  template <typename S, std::size_t N>
  class Builder {
    static_assert(N > 0, "TopN needs at least one slot");

  public:
    // Empty hypotheses carry no evidence and are not retained.
    void add(const FocalElement_t<S>& element) {
      if (isEmpty(element.hypothesis)) {
        return;
      }
      selector.insertByKey(&detail::massOf<S>, element);
    }

    BoundedAssignment<S, N> finish() const {
      BoundedAssignment<S, N> out{};
      std::size_t slot = 0;
      for (const auto& element : selector) {
        out[slot++] = element;
      }
      const Mass denom = totalMass(out);
      if (denom > 0.0f) {
        for (auto& element : out) {
          element.mass /= denom;
        }
      }
      return out;
    }

  private:
    TopKSelector<FocalElement_t<S>, N> selector;
  };

  template <std::size_t N, typename Range>
  static BoundedAssignment<detail::RangeHypothesis<Range>, N> approx(const Range& input) {
    Builder<detail::RangeHypothesis<Range>, N> builder;
    for (const auto& element : input) {
      builder.add(element);
    }
    return builder.finish();
  }
};

// Keeps the N-1 most massive focal elements and folds everything else into a
// residual element in slot N-1: the union of the displaced hypotheses carrying
// the sum of their masses. Total mass is preserved.
struct Summarize {
  template <typename S, std::size_t N>
  class Builder {
    static_assert(N > 0, "Summarize needs at least one slot");

  public:
    void add(const FocalElement_t<S>& element) {
      if (isEmpty(element.hypothesis)) {
        return;
      }
      auto displaced = selector.displaceByKey(&detail::massOf<S>, element);
      if (displaced) {
        residual.hypothesis = cup(residual.hypothesis, displaced->hypothesis);
        residual.mass += displaced->mass;
      }
    }

    BoundedAssignment<S, N> finish() const {
      BoundedAssignment<S, N> out{};
      std::size_t slot = 0;
      bool merged = false;
      for (const auto& element : selector) {
        out[slot] = element;
        if (!merged && !isEmpty(residual.hypothesis) && element.hypothesis == residual.hypothesis) {
          out[slot].mass += residual.mass;
          merged = true;
        }
        ++slot;
      }
      if (!merged) {
        out[N - 1] = residual;
      }
      return out;
    }

  private:
    TopKSelector<FocalElement_t<S>, N - 1> selector;
    FocalElement_t<S> residual;
  };

  template <std::size_t N, typename Range>
  static BoundedAssignment<detail::RangeHypothesis<Range>, N> approx(const Range& input) {
    Builder<detail::RangeHypothesis<Range>, N> builder;
    for (const auto& element : input) {
      builder.add(element);
    }
    return builder.finish();
  }
};

} // namespace dst
