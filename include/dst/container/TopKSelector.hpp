#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace dst {

// Keeps the K largest items seen so far in fixed storage. Once full, an
// incoming item replaces the current minimum only when its key is strictly
// larger; among equal minima the lowest slot is evicted.
template <typename T, std::size_t K>
class TopKSelector {
public:
  using const_iterator = typename std::array<T, (K > 0 ? K : 1)>::const_iterator;

  // Returns the evicted occupant, or nullopt when nothing was evicted
  // (including when the incoming item was rejected).
  template <typename KeyFn>
  std::optional<T> insertByKey(KeyFn key, T value) {
    bool rejected = false;
    std::optional<T> evicted = place(key, std::move(value), rejected);
    if (rejected) {
      return std::nullopt;
    }
    return evicted;
  }

  // Like insertByKey, but a rejected incoming item is handed back as well,
  // so callers can account for every element that did not survive.
  template <typename KeyFn>
  std::optional<T> displaceByKey(KeyFn key, T value) {
    bool rejected = false;
    return place(key, std::move(value), rejected);
  }

  std::size_t size() const { return count; }
  bool full() const { return count == K; }
  static constexpr std::size_t capacity() { return K; }

  const_iterator begin() const { return slots.begin(); }
  const_iterator end() const { return slots.begin() + static_cast<std::ptrdiff_t>(count); }

private:
  template <typename KeyFn>
  std::optional<T> place(KeyFn& key, T value, bool& rejected) {
    if (count < K) {
      slots[count++] = std::move(value);
      return std::nullopt;
    }
    if (K == 0) {
      rejected = true;
      return std::optional<T>(std::move(value));
    }

    std::size_t minIndex = 0;
    for (std::size_t i = 1; i < count; ++i) {
      if (key(slots[i]) < key(slots[minIndex])) {
        minIndex = i;
      }
    }
    if (!(key(value) > key(slots[minIndex]))) {
      rejected = true;
      return std::optional<T>(std::move(value));
    }
    std::optional<T> evicted(std::move(slots[minIndex]));
    slots[minIndex] = std::move(value);
    return evicted;
  }

  // One spare slot keeps the array well-formed when K is zero.
  std::array<T, (K > 0 ? K : 1)> slots{};
  std::size_t count = 0;
};

} // namespace dst
