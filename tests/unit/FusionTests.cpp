#include <bitset>
#include <initializer_list>
#include <vector>

#include <gtest/gtest.h>

#include "dst/fusion/Fusion.hpp"
#include "dst/fusion/Measures.hpp"

namespace {

using Set = std::bitset<8>;
using Focal = dst::FocalElement_t<Set>;
using Raw = std::vector<Focal>;

const Set kRed("100");
const Set kYellow("010");
const Set kGreen("001");
const Set kAll("111");

constexpr float kTol = 1e-4f;

} // namespace

TEST(FusionTests, EmptyInputIsReported) {
  const std::vector<Raw> sources;
  dst::BoundedAssignment<Set, 4> out = {{{kAll, 1.0f}}};
  EXPECT_EQ(dst::fuse(sources, out), dst::FusionStatus_e::kEmptyInput);
  EXPECT_EQ(out[0].hypothesis, kAll);
}

TEST(FusionTests, SingleSourceIsOnlyApproximated) {
  const std::vector<Raw> sources = {
      {{kRed, 0.5f}, {kYellow, 0.3f}, {kGreen, 0.15f}, {kAll, 0.05f}},
  };
  dst::BoundedAssignment<Set, 2> out{};
  ASSERT_EQ(dst::fuse(sources, out), dst::FusionStatus_e::kOk);
  EXPECT_NEAR(dst::bel(out, kRed), 0.5f / 0.8f, kTol);
  EXPECT_NEAR(dst::bel(out, kYellow), 0.3f / 0.8f, kTol);
}

TEST(FusionTests, FoldsSourcesLeftToRight) {
  const std::vector<Raw> sources = {
      {{kRed, 0.6f}, {kRed | kYellow, 0.3f}, {kAll, 0.1f}},
      {{kYellow, 0.5f}, {kRed | kYellow, 0.2f}, {kGreen, 0.3f}},
      {{kRed | kYellow, 0.9f}, {kAll, 0.1f}},
  };

  dst::BoundedAssignment<Set, 4> fused{};
  ASSERT_EQ(dst::fuse(sources, fused), dst::FusionStatus_e::kOk);

  // The first fold yields R 0.12, Y 0.20, RY 0.08, G 0.03 over 0.43. The third
  // source removes G (conflict 0.027/0.43) and keeps the rest in proportion.
  const float remaining = 0.40f + 0.003f;
  EXPECT_NEAR(dst::bel(fused, kRed), 0.12f / remaining, kTol);
  EXPECT_NEAR(dst::bel(fused, kYellow), 0.20f / remaining, kTol);
  EXPECT_NEAR(dst::bel(fused, kGreen), 0.003f / remaining, kTol);
  EXPECT_NEAR(dst::totalMass(fused), 1.0f, 1e-5f);
}

TEST(FusionTests, OrderChangesOnlyRounding) {
  const std::vector<Raw> forward = {
      {{kRed, 0.6f}, {kRed | kYellow, 0.3f}, {kAll, 0.1f}},
      {{kYellow, 0.5f}, {kRed | kYellow, 0.2f}, {kGreen, 0.3f}},
  };
  const std::vector<Raw> backward(forward.rbegin(), forward.rend());

  dst::BoundedAssignment<Set, 8> lhs{};
  dst::BoundedAssignment<Set, 8> rhs{};
  ASSERT_EQ(dst::fuse<dst::Summarize>(forward, lhs), dst::FusionStatus_e::kOk);
  ASSERT_EQ(dst::fuse<dst::Summarize>(backward, rhs), dst::FusionStatus_e::kOk);
  for (const Set& query : {kRed, kYellow, kGreen, kRed | kYellow}) {
    EXPECT_NEAR(dst::bel(lhs, query), dst::bel(rhs, query), 1e-5f);
    EXPECT_NEAR(dst::pl(lhs, query), dst::pl(rhs, query), 1e-5f);
  }
}

TEST(FusionTests, ContradictionStopsTheFold) {
  const std::vector<Raw> sources = {
      {{kRed, 1.0f}},
      {{kGreen, 1.0f}},
      {{kAll, 1.0f}},
  };
  dst::BoundedAssignment<Set, 2> out{};
  EXPECT_EQ(dst::fuse(sources, out), dst::FusionStatus_e::kFullContradiction);
  EXPECT_TRUE(dst::isEmpty(out[0].hypothesis));
}
