#include <gtest/gtest.h>
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <string>
#include "demonet/core/error.hpp"
#include "demonet/core/scale.hpp"
#include "test_utils.hpp"

using namespace demonet::core;
using namespace demonet::core::test;

namespace {

// Input iterator whose dereference throws, used to leave a ScaleRatio
// valueless by exception.
struct FailingRatioSource {
  using iterator_category = std::input_iterator_tag;
  using value_type = std::pair<const NodeId, Ratio>;
  using difference_type = std::ptrdiff_t;
  using pointer = const value_type*;
  using reference = value_type;

  int pos {0};

  value_type operator*() const { throw std::runtime_error("ratio source failed"); }
  FailingRatioSource& operator++() { ++pos; return *this; }
  FailingRatioSource operator++(int) { auto old = *this; ++pos; return old; }
  bool operator==(const FailingRatioSource& other) const { return pos == other.pos; }
};

ScaleRatio valueless_ratio() {
  ScaleRatio ratio {0.5};
  try {
    ratio.emplace<SparseRatio>(FailingRatioSource{0}, FailingRatioSource{1});
  } catch (const std::runtime_error&) {
  }
  return ratio;
}

} // namespace

//=============================================================================
// scale_and_round
//=============================================================================

TEST(ScaleAndRound, HalfTruncates) {
  // 0.5 is not > 0.5, so the truncating branch is taken
  EXPECT_EQ(scale_and_round(10.0, 0.5), 5.0);
  EXPECT_EQ(scale_and_round(7.0, 0.5), 3.0);
}

TEST(ScaleAndRound, AboveHalfRoundsToNearest) {
  EXPECT_EQ(scale_and_round(10.0, 0.51), 5.0);  // floor(5.1 + 0.5)
  EXPECT_EQ(scale_and_round(3.0, 0.6), 2.0);    // floor(1.8 + 0.5)
  EXPECT_EQ(scale_and_round(7.0, 2.0), 14.0);
}

TEST(ScaleAndRound, TiesGoUp) {
  // 3 * 1.5 == 4.5 exactly
  EXPECT_EQ(scale_and_round(3.0, 1.5), 5.0);
}

TEST(ScaleAndRound, SmallRatiosTruncate) {
  EXPECT_EQ(scale_and_round(10.0, 0.33), 3.0);
  EXPECT_EQ(scale_and_round(9.0, 0.25), 2.0);
  EXPECT_EQ(scale_and_round(3.0, 0.0), 0.0);
  EXPECT_EQ(scale_and_round(1.0, 0.49), 0.0);
}

//=============================================================================
// scale_node_susceptibles
//=============================================================================

TEST(ScaleNodes, ScalarRewritesEveryNode) {
  auto net = make_network({10, 20, 30});
  scale_node_susceptibles(net.nodes(), ScaleRatio{0.5});

  auto save = net.nodes().save_play_suscept_view();
  EXPECT_EQ(save[1], 5.0);
  EXPECT_EQ(save[2], 10.0);
  EXPECT_EQ(save[3], 15.0);
  EXPECT_EQ(save[0], 0.0);
  expect_lockstep(net);
}

TEST(ScaleNodes, IdentityScalarLeavesArraysUntouched) {
  auto net = make_network({10, 7, 3});
  // Make play differ from save so that any rewrite would be visible
  net.nodes().play_suscept_view()[2] = 99.0;
  auto before_play = copy_values(net.nodes().play_suscept_view());
  auto before_save = copy_values(net.nodes().save_play_suscept_view());

  scale_node_susceptibles(net.nodes(), ScaleRatio{1.0});

  EXPECT_EQ(copy_values(net.nodes().play_suscept_view()), before_play);
  EXPECT_EQ(copy_values(net.nodes().save_play_suscept_view()), before_save);
}

TEST(ScaleNodes, AbsentRatioIsNoOp) {
  auto net = make_network({10, 20, 30});
  auto before = copy_values(net.nodes().save_play_suscept_view());
  scale_node_susceptibles(net.nodes(), std::nullopt);
  EXPECT_EQ(copy_values(net.nodes().save_play_suscept_view()), before);
}

TEST(ScaleNodes, EmptyCollectionIsNoOp) {
  Nodes nodes;
  // A dense ratio of the wrong length is not an error on an empty collection
  EXPECT_NO_THROW(scale_node_susceptibles(nodes, ScaleRatio{DenseRatio{0.5, 0.5}}));
  EXPECT_EQ(nodes.size(), 0);
}

TEST(ScaleNodes, SparseRewritesOnlyListedNodes) {
  auto net = make_network({10, 20, 30});
  scale_node_susceptibles(net.nodes(), ScaleRatio{SparseRatio{{2, 0.5}}});

  auto save = net.nodes().save_play_suscept_view();
  EXPECT_EQ(save[1], 10.0);
  EXPECT_EQ(save[2], 10.0);
  EXPECT_EQ(save[3], 30.0);
  expect_lockstep(net);
}

TEST(ScaleNodes, SparseKeyOutsideNodesThrowsBeforeWriting) {
  auto net = make_network({10, 20, 30});
  auto before = copy_values(net.nodes().save_play_suscept_view());
  EXPECT_THROW(scale_node_susceptibles(net.nodes(), ScaleRatio{SparseRatio{{1, 0.5}, {4, 0.5}}}),
               InvalidArgument);
  EXPECT_EQ(copy_values(net.nodes().save_play_suscept_view()), before);
}

TEST(ScaleNodes, DenseUsesPositionForId) {
  auto net = make_network({10, 20, 30});
  scale_node_susceptibles(net.nodes(), ScaleRatio{DenseRatio{0.5, 2.0, 0.1}});

  auto save = net.nodes().save_play_suscept_view();
  EXPECT_EQ(save[1], 5.0);
  EXPECT_EQ(save[2], 40.0);
  EXPECT_EQ(save[3], 3.0);
  expect_lockstep(net);
}

TEST(ScaleNodes, DenseLengthMismatchThrowsAndLeavesArraysUnmodified) {
  auto net = make_network({10, 20, 30});
  auto before_play = copy_values(net.nodes().play_suscept_view());
  auto before_save = copy_values(net.nodes().save_play_suscept_view());

  try {
    scale_node_susceptibles(net.nodes(), ScaleRatio{DenseRatio{0.5, 0.5}});
    FAIL() << "Expected InvalidArgument";
  } catch (const InvalidArgument& e) {
    std::string msg = e.what();
    EXPECT_NE(msg.find("2"), std::string::npos) << msg;
    EXPECT_NE(msg.find("3"), std::string::npos) << msg;
  }

  EXPECT_EQ(copy_values(net.nodes().play_suscept_view()), before_play);
  EXPECT_EQ(copy_values(net.nodes().save_play_suscept_view()), before_save);
}

TEST(ScaleNodes, RatioOverridesPlayRatio) {
  auto net = make_network({10, 20});
  scale_node_susceptibles(net.nodes(), ScaleRatio{0.5}, std::nullopt, ScaleRatio{2.0});
  EXPECT_EQ(net.nodes().save_play_suscept_view()[1], 5.0);
  EXPECT_EQ(net.nodes().save_play_suscept_view()[2], 10.0);
}

TEST(ScaleNodes, PlayRatioAloneIsApplied) {
  auto net = make_network({10, 20});
  scale_node_susceptibles(net.nodes(), std::nullopt, std::nullopt, ScaleRatio{2.0});
  EXPECT_EQ(net.nodes().save_play_suscept_view()[1], 20.0);
  EXPECT_EQ(net.nodes().play_suscept_view()[2], 40.0);
}

TEST(ScaleNodes, WorkRatioAloneDoesNotTouchPlayArrays) {
  auto net = make_network({10, 20});
  scale_node_susceptibles(net.nodes(), std::nullopt, ScaleRatio{0.5}, std::nullopt);
  EXPECT_EQ(net.nodes().save_play_suscept_view()[1], 10.0);
  EXPECT_EQ(net.nodes().save_play_suscept_view()[2], 20.0);
}

//=============================================================================
// scale_link_susceptibles
//=============================================================================

TEST(ScaleLinks, ScalarRewritesEveryLink) {
  auto net = make_network({1, 1, 1}, {1, 2, 3}, {2, 3, 1}, {10, 11, 12});
  scale_link_susceptibles(net.links(), ScaleRatio{0.5});

  auto w = net.links().weight_view();
  EXPECT_EQ(w[1], 5.0);
  EXPECT_EQ(w[2], 5.0);
  EXPECT_EQ(w[3], 6.0);
  expect_lockstep(net);
}

TEST(ScaleLinks, IdentityScalarIsNoOp) {
  auto net = make_network({1, 1}, {1, 2}, {2, 1}, {10, 11});
  net.links().suscept_view()[1] = 3.0;
  scale_link_susceptibles(net.links(), ScaleRatio{1.0});
  EXPECT_EQ(net.links().suscept_view()[1], 3.0);
  EXPECT_EQ(net.links().weight_view()[1], 10.0);
}

TEST(ScaleLinks, SparseIsKeyedByOriginNode) {
  // Link 1 originates at node 5, link 2 at node 2
  std::vector<Count> nodes(6, 1.0);
  auto net = make_network(nodes, {5, 2}, {1, 3}, {7, 9});
  scale_link_susceptibles(net.links(), ScaleRatio{SparseRatio{{5, 0.0}}});

  EXPECT_EQ(net.links().weight_view()[1], 0.0);
  EXPECT_EQ(net.links().suscept_view()[1], 0.0);
  EXPECT_EQ(net.links().weight_view()[2], 9.0);
  EXPECT_EQ(net.links().suscept_view()[2], 9.0);
}

TEST(ScaleLinks, SparseKeyForLinkIdIsNotUsed) {
  // The key 1 names node 1, which no link originates from
  auto net = make_network({1, 1, 1}, {2, 3}, {1, 1}, {8, 8});
  scale_link_susceptibles(net.links(), ScaleRatio{SparseRatio{{1, 0.5}}});
  EXPECT_EQ(net.links().weight_view()[1], 8.0);
  EXPECT_EQ(net.links().weight_view()[2], 8.0);
}

TEST(ScaleLinks, DenseIsIndexedByOriginNode) {
  auto net = make_network({1, 1, 1}, {1, 2, 3, 3}, {2, 3, 1, 2}, {10, 10, 10, 11});
  scale_link_susceptibles(net.links(), ScaleRatio{DenseRatio{1.0, 0.5, 0.2}});

  auto w = net.links().weight_view();
  EXPECT_EQ(w[1], 10.0);
  EXPECT_EQ(w[2], 5.0);
  EXPECT_EQ(w[3], 2.0);
  EXPECT_EQ(w[4], 2.0);
  expect_lockstep(net);
}

TEST(ScaleLinks, DenseLengthMismatchThrowsBeforeWriting) {
  auto net = make_network({1, 1, 1}, {1, 2}, {2, 3}, {10, 10});
  auto before = copy_values(net.links().weight_view());
  EXPECT_THROW(scale_link_susceptibles(net.links(), ScaleRatio{DenseRatio{0.5, 0.5}}),
               InvalidArgument);
  EXPECT_EQ(copy_values(net.links().weight_view()), before);
}

TEST(ScaleLinks, AbsentRatioOrNoLinksIsNoOp) {
  auto net = make_network({10, 20});
  EXPECT_NO_THROW(scale_link_susceptibles(net.links(), ScaleRatio{DenseRatio{}}));
  auto with_links = make_network({1, 1}, {1}, {2}, {6});
  scale_link_susceptibles(with_links.links(), std::nullopt);
  EXPECT_EQ(with_links.links().weight_view()[1], 6.0);
}

//=============================================================================
// Unsupported ratios
//=============================================================================

TEST(ScaleNodes, ValuelessRatioThrowsUnsupportedScaleType) {
  std::optional<ScaleRatio> ratio {valueless_ratio()};
  ASSERT_TRUE(ratio->valueless_by_exception());

  auto net = make_network({10, 20, 30});
  auto before = copy_values(net.nodes().save_play_suscept_view());
  EXPECT_THROW(scale_node_susceptibles(net.nodes(), ratio), UnsupportedScaleType);
  EXPECT_THROW(scale_node_susceptibles(net.nodes(), std::nullopt, std::nullopt, ratio),
               UnsupportedScaleType);
  EXPECT_EQ(copy_values(net.nodes().save_play_suscept_view()), before);
  EXPECT_EQ(copy_values(net.nodes().play_suscept_view()), before);
}

TEST(ScaleLinks, ValuelessRatioThrowsUnsupportedScaleType) {
  std::optional<ScaleRatio> ratio {valueless_ratio()};
  ASSERT_TRUE(ratio->valueless_by_exception());

  auto net = make_network({1, 1, 1}, {1, 2}, {2, 3}, {10, 12});
  auto before = copy_values(net.links().weight_view());
  EXPECT_THROW(scale_link_susceptibles(net.links(), ratio), UnsupportedScaleType);
  EXPECT_EQ(copy_values(net.links().weight_view()), before);
  EXPECT_EQ(copy_values(net.links().suscept_view()), before);
}
