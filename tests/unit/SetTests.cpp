#include <bitset>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

#include <gtest/gtest.h>

#include "dst/core/Set.hpp"

namespace {

using Wide = std::bitset<70>;

Wide makeWide(std::initializer_list<std::size_t> bits) {
  Wide value;
  for (std::size_t bit : bits) {
    value.set(bit);
  }
  return value;
}

} // namespace

TEST(SetTests, MaskOperationsFollowBitwiseAlgebra) {
  const std::uint32_t a = 0b0110;
  const std::uint32_t b = 0b0011;

  EXPECT_EQ(dst::cap(a, b), 0b0010u);
  EXPECT_EQ(dst::cup(a, b), 0b0111u);
  EXPECT_TRUE(dst::isSubset<std::uint32_t>(0b0010u, a));
  EXPECT_FALSE(dst::isSubset(a, b));
  EXPECT_EQ(dst::complement(dst::complement(a)), a);
  EXPECT_TRUE(dst::isEmpty(dst::cap<std::uint32_t>(0b100u, 0b011u)));
}

TEST(SetTests, EmptySetIsSubsetOfEverythingAndAbsorbsIntersection) {
  const std::uint64_t empty = dst::emptySet<std::uint64_t>();
  const std::uint64_t values[] = {0u, 1u, 0b1010u, ~0ULL};
  for (std::uint64_t value : values) {
    EXPECT_TRUE(dst::isSubset(empty, value));
    EXPECT_EQ(dst::cap(value, empty), empty);
  }

  const Wide wideEmpty = dst::emptySet<Wide>();
  const Wide x = makeWide({0, 63, 69});
  EXPECT_TRUE(dst::isSubset(wideEmpty, x));
  EXPECT_EQ(dst::cap(x, wideEmpty), wideEmpty);
}

TEST(SetTests, BitsetCapIsCommutativeAndAssociative) {
  const Wide a = makeWide({1, 2, 3, 64});
  const Wide b = makeWide({2, 3, 65});
  const Wide c = makeWide({3, 64, 65});

  EXPECT_EQ(dst::cap(a, b), dst::cap(b, a));
  EXPECT_EQ(dst::cap(dst::cap(a, b), c), dst::cap(a, dst::cap(b, c)));
  EXPECT_EQ(dst::cap(dst::cap(a, b), c), makeWide({3}));
}

TEST(SetTests, BitsetComplementStaysWithinWidth) {
  const Wide x = makeWide({0, 68});
  const Wide notX = dst::complement(x);
  EXPECT_EQ(notX.count(), 68u);
  EXPECT_EQ(dst::complement(notX), x);
  EXPECT_TRUE(dst::isEmpty(dst::cap(x, notX)));
  EXPECT_EQ(dst::cup(x, notX), dst::complement(dst::emptySet<Wide>()));
}

TEST(SetTests, EqualSetsHashEqually) {
  EXPECT_EQ(dst::hashSet(makeWide({4, 66})), dst::hashSet(makeWide({66, 4})));
  EXPECT_EQ(dst::hashSet<std::uint32_t>(5u), dst::hashSet<std::uint32_t>(5u));
  EXPECT_NE(dst::hashSet<std::uint32_t>(5u), dst::hashSet<std::uint32_t>(6u));
}

TEST(SetTests, BitsetHashIsFnv1aOverPackedWords) {
  const std::uint64_t low = 0b1011;
  EXPECT_EQ(dst::hashSet(std::bitset<8>(low)), dst::fnv1a(&low, sizeof(low)));

  const std::uint64_t words[2] = {std::uint64_t{1} << 4, std::uint64_t{1} << 2};
  const std::uint64_t chained = dst::fnv1a(&words[1], sizeof(words[1]), dst::fnv1a(&words[0], sizeof(words[0])));
  EXPECT_EQ(dst::hashSet(makeWide({4, 66})), chained);
}
