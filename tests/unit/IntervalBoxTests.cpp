#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "dst/core/IntervalBox.hpp"
#include "dst/fusion/Dempster.hpp"
#include "dst/fusion/Measures.hpp"

namespace {

using Box = dst::IntervalBox<1, int>;
using Box2 = dst::IntervalBox<2, int>;

Box box(int lower, int upper) {
  return Box(Box::Bounds{Box::Bound(lower, upper)});
}

// The four overlap arrangements of [0, 10] against a second interval.
const std::array<std::pair<std::pair<int, int>, std::pair<int, int>>, 4> kOverlaps = {{
    {{0, 10}, {1, 11}},
    {{0, 10}, {-1, 11}},
    {{0, 10}, {1, 9}},
    {{0, 10}, {-1, 9}},
}};

} // namespace

TEST(IntervalBoxTests, SubsetFollowsContainment) {
  const std::array<bool, 4> expected = {false, true, false, false};
  for (std::size_t i = 0; i < kOverlaps.size(); ++i) {
    const Box a = box(kOverlaps[i].first.first, kOverlaps[i].first.second);
    const Box b = box(kOverlaps[i].second.first, kOverlaps[i].second.second);
    EXPECT_EQ(dst::isSubset(a, b), expected[i]) << "case " << i;
  }
}

TEST(IntervalBoxTests, EmptyBoxIsSubsetOfEverything) {
  const Box b = box(0, 10);
  EXPECT_TRUE(dst::isSubset(dst::emptySet<Box>(), b));
  EXPECT_TRUE(dst::isSubset(dst::emptySet<Box>(), dst::emptySet<Box>()));
  EXPECT_FALSE(dst::isSubset(b, dst::emptySet<Box>()));
}

TEST(IntervalBoxTests, CapTakesOverlapAndCupTakesHull) {
  const std::array<std::pair<int, int>, 4> caps = {{{1, 10}, {0, 10}, {1, 9}, {0, 9}}};
  const std::array<std::pair<int, int>, 4> cups = {{{0, 11}, {-1, 11}, {0, 10}, {-1, 10}}};
  for (std::size_t i = 0; i < kOverlaps.size(); ++i) {
    const Box a = box(kOverlaps[i].first.first, kOverlaps[i].first.second);
    const Box b = box(kOverlaps[i].second.first, kOverlaps[i].second.second);
    EXPECT_EQ(dst::cap(a, b), box(caps[i].first, caps[i].second)) << "case " << i;
    EXPECT_EQ(dst::cup(a, b), box(cups[i].first, cups[i].second)) << "case " << i;
  }
}

TEST(IntervalBoxTests, DisjointBoxesIntersectToEmpty) {
  EXPECT_TRUE(dst::isEmpty(dst::cap(box(0, 10), box(11, 20))));
  EXPECT_TRUE(dst::isEmpty(dst::cap(dst::emptySet<Box>(), box(0, 10))));
  EXPECT_EQ(dst::cup(dst::emptySet<Box>(), box(0, 10)), box(0, 10));
  EXPECT_EQ(dst::cup(box(0, 10), box(11, 20)), box(0, 20));
}

TEST(IntervalBoxTests, BoxWithMissingDimensionIsTheEmptySet) {
  const Box2 partial(Box2::Bounds{Box2::Bound(0, 5), std::nullopt});
  EXPECT_TRUE(partial.empty());
  EXPECT_FALSE(partial.dimensions()[0].has_value());
  EXPECT_EQ(partial, dst::emptySet<Box2>());
  EXPECT_EQ(dst::hashSet(partial), dst::hashSet(dst::emptySet<Box2>()));

  const Box2 a(Box2::Bounds{Box2::Bound(0, 5), Box2::Bound(0, 5)});
  const Box2 b(Box2::Bounds{Box2::Bound(3, 8), Box2::Bound(6, 9)});
  EXPECT_TRUE(dst::isEmpty(dst::cap(a, b)));

  const Box2 overlap = dst::cap(a, Box2(Box2::Bounds{Box2::Bound(3, 8), Box2::Bound(2, 9)}));
  ASSERT_TRUE(overlap.dimensions()[1].has_value());
  EXPECT_EQ(*overlap.dimensions()[0], Box2::Bound(3, 5));
  EXPECT_EQ(*overlap.dimensions()[1], Box2::Bound(2, 5));
}

TEST(IntervalBoxTests, RejectsInvertedBounds) {
  EXPECT_THROW(box(5, 1), std::invalid_argument);
}

TEST(IntervalBoxTests, DempsterCombinesIntervalEvidence) {
  // Two range sensors reporting where a target lies on a line.
  const dst::BoundedAssignment<Box, 2> first = {{{box(0, 10), 0.8f}, {box(0, 100), 0.2f}}};
  const dst::BoundedAssignment<Box, 2> second = {{{box(5, 20), 0.6f}, {box(50, 60), 0.4f}}};

  dst::BoundedAssignment<Box, 2> fused{};
  ASSERT_EQ(dst::Dempster::combine(first, second, fused), dst::FusionStatus_e::kOk);

  // [0,10]x[50,60] conflicts (K = 0.32). Of the three intersections Top-N
  // keeps [5,10] and [5,20] and drops [50,60].
  EXPECT_NEAR(dst::bel(fused, box(5, 10)), 0.8f, 1e-4f);
  EXPECT_NEAR(dst::bel(fused, box(5, 20)), 1.0f, 1e-4f);
  EXPECT_NEAR(dst::bel(fused, box(50, 60)), 0.0f, 1e-6f);
  EXPECT_NEAR(dst::totalMass(fused), 1.0f, 1e-5f);
}
