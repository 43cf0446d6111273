#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "dst/core/Hash.hpp"

namespace dst {

// Capability contract for a hypothesis space. A type models it by specializing
// SetTraits with:
//   static S empty();
//   static bool isSubset(const S& lhs, const S& rhs);
//   static S cap(const S& lhs, const S& rhs);
//   static S cup(const S& lhs, const S& rhs);
//   static S complement(const S& value);   (optional, required by pl())
//   static std::uint64_t hash(const S& value);
// Equality is structural via operator==.
template <typename S, typename Enable = void>
struct SetTraits;

// Integer masks, one bit per elementary hypothesis.
template <typename S>
struct SetTraits<S, std::enable_if_t<std::is_integral<S>::value && std::is_unsigned<S>::value &&
                                       !std::is_same<S, bool>::value>> {
  static constexpr S empty() { return S{0}; }
  static constexpr bool isSubset(S lhs, S rhs) { return (lhs & rhs) == lhs; }
  static constexpr S cap(S lhs, S rhs) { return static_cast<S>(lhs & rhs); }
  static constexpr S cup(S lhs, S rhs) { return static_cast<S>(lhs | rhs); }
  static constexpr S complement(S value) { return static_cast<S>(~value); }
  static std::uint64_t hash(S value) { return fnv1a(&value, sizeof(value)); }
};

// Fixed-width bitset; the default hypothesis model.
template <std::size_t W>
struct SetTraits<std::bitset<W>> {
  using Set = std::bitset<W>;

  static Set empty() { return Set{}; }
  static bool isSubset(const Set& lhs, const Set& rhs) { return (lhs & ~rhs).none(); }
  static Set cap(const Set& lhs, const Set& rhs) { return lhs & rhs; }
  static Set cup(const Set& lhs, const Set& rhs) { return lhs | rhs; }
  static Set complement(const Set& value) { return ~value; }
  // FNV-1a over the bits packed into 64-bit words, lowest word first.
  static std::uint64_t hash(const Set& value) {
    std::uint64_t state = fnv1a(nullptr, 0);
    for (std::size_t base = 0; base < W; base += 64) {
      std::uint64_t word = 0;
      for (std::size_t bit = 0; bit < 64 && base + bit < W; ++bit) {
        if (value.test(base + bit)) {
          word |= std::uint64_t{1} << bit;
        }
      }
      state = fnv1a(&word, sizeof(word), state);
    }
    return state;
  }
};

template <typename S>
S emptySet() {
  return SetTraits<S>::empty();
}

template <typename S>
bool isEmpty(const S& value) {
  return value == SetTraits<S>::empty();
}

template <typename S>
bool isSubset(const S& lhs, const S& rhs) {
  return SetTraits<S>::isSubset(lhs, rhs);
}

template <typename S>
S cap(const S& lhs, const S& rhs) {
  return SetTraits<S>::cap(lhs, rhs);
}

template <typename S>
S cup(const S& lhs, const S& rhs) {
  return SetTraits<S>::cup(lhs, rhs);
}

template <typename S>
S complement(const S& value) {
  return SetTraits<S>::complement(value);
}

template <typename S>
std::uint64_t hashSet(const S& value) {
  return SetTraits<S>::hash(value);
}

// Hash functor for containers keyed by hypotheses.
template <typename S>
struct SetHash {
  std::uint64_t operator()(const S& value) const { return SetTraits<S>::hash(value); }
};

} // namespace dst
