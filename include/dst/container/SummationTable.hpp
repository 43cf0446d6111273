#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

#include "dst/core/Set.hpp"
#include "dst/core/Status.hpp"

namespace dst {

// Fixed-capacity map whose insert adds to the value already stored under an
// equal key. Open addressing: probing starts at hash(key) % Capacity and walks
// forward one slot at a time. Entries are never removed.
template <typename K, typename V, std::size_t Capacity, typename Hash = SetHash<K>>
class SummationTable {
  static_assert(Capacity > 0, "SummationTable needs at least one slot");

public:
  struct Entry_t {
    K key{};
    V value{};
  };

  class const_iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Entry_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const Entry_t*;
    using reference = const Entry_t&;

    const_iterator(const SummationTable* tableInput, std::size_t indexInput)
        : table(tableInput), index(indexInput) {
      skipFree();
    }

    reference operator*() const { return table->entries[index]; }
    pointer operator->() const { return &table->entries[index]; }

    const_iterator& operator++() {
      ++index;
      skipFree();
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator previous = *this;
      ++(*this);
      return previous;
    }

    bool operator==(const const_iterator& rhs) const { return index == rhs.index; }
    bool operator!=(const const_iterator& rhs) const { return index != rhs.index; }

  private:
    void skipFree() {
      while (index < Capacity && !table->occupied[index]) {
        ++index;
      }
    }

    const SummationTable* table;
    std::size_t index;
  };

  // Adds `value` to the entry for `key`, creating it if absent.
  void insert(const K& key, const V& value) {
    const std::size_t index = probe(key);
    if (index == Capacity) {
      throw CapacityExceeded("SummationTable: all " + std::to_string(Capacity) + " slots are taken");
    }
    if (occupied[index]) {
      entries[index].value += value;
      return;
    }
    occupied[index] = true;
    entries[index].key = key;
    entries[index].value = value;
    ++count;
  }

  const V* get(const K& key) const {
    const std::size_t index = probe(key);
    if (index == Capacity || !occupied[index]) {
      return nullptr;
    }
    return &entries[index].value;
  }

  void scale(const V& factor) {
    for (std::size_t i = 0; i < Capacity; ++i) {
      if (occupied[i]) {
        entries[i].value *= factor;
      }
    }
  }

  std::size_t size() const { return count; }
  bool empty() const { return count == 0; }
  static constexpr std::size_t capacity() { return Capacity; }

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, Capacity); }

private:
  // Slot holding `key`, else the first free slot on its probe path, else Capacity.
  std::size_t probe(const K& key) const {
    const std::size_t start = static_cast<std::size_t>(Hash{}(key) % Capacity);
    for (std::size_t step = 0; step < Capacity; ++step) {
      const std::size_t index = (start + step) % Capacity;
      if (!occupied[index] || entries[index].key == key) {
        return index;
      }
    }
    return Capacity;
  }

  std::array<Entry_t, Capacity> entries{};
  std::array<bool, Capacity> occupied{};
  std::size_t count = 0;
};

} // namespace dst
