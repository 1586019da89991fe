/*
  Networks: demographic sub-networks of one overall population.
*/
#include "demonet/core/networks.hpp"
#include "demonet/core/error.hpp"
#include "demonet/core/scale.hpp"

#include <string>
#include <utility>

namespace demonet::core {

namespace {

// First id in 1..target.size() whose subnet sum differs from target, or 0.
template <typename ViewOf>
std::int32_t first_unconserved(ConservedView<const Count> target,
                               std::span<const Network> subnets, ViewOf view_of,
                               Count& sum_out) noexcept {
  for (std::int32_t i = 1; i <= target.size(); ++i) {
    Count sum = 0.0;
    for (auto const& sub : subnets) sum += view_of(sub)[i];
    if (sum != target[i]) {
      sum_out = sum;
      return i;
    }
  }
  return 0;
}

ConservedView<const Count> node_baseline(const Network& n) noexcept {
  return n.nodes().save_play_suscept_view();
}

ConservedView<const Count> link_weight(const Network& n) noexcept {
  return n.links().weight_view();
}

} // namespace

Networks Networks::build(Network overall, std::vector<Network> subnets) {
  if (subnets.size() < 2) {
    throw InvalidArgument("Networks need at least two demographic sub-networks (got " +
                          std::to_string(subnets.size()) + ")");
  }
  for (std::size_t j = 0; j < subnets.size(); ++j) {
    if (!subnets[j].same_shape(overall)) {
      throw InvalidArgument("sub-network " + std::to_string(j) +
                            " does not have the same nodes and links as the overall network");
    }
  }
  Networks out;
  out.overall_ = std::move(overall);
  out.subnets_ = std::move(subnets);
  return out;
}

void Networks::scale_susceptibles(std::span<const std::optional<ScaleRatio>> ratios) {
  if (ratios.size() != subnets_.size()) {
    throw InvalidArgument("Number of ratios (" + std::to_string(ratios.size()) +
                          ") does not match the number of sub-networks (" +
                          std::to_string(subnets_.size()) + ")");
  }
  for (std::size_t j = 0; j < subnets_.size(); ++j) {
    scale_node_susceptibles(subnets_[j].nodes(), ratios[j]);
    scale_link_susceptibles(subnets_[j].links(), ratios[j]);
  }
}

RemainderSummary Networks::distribute_remainders(std::span<RandomGenerator> rngs,
                                                 const DistributeOptions& opts,
                                                 Profiler& profiler) {
  return core::distribute_remainders(overall_, std::span<Network>(subnets_), rngs, opts, profiler);
}

bool Networks::is_conserved() const noexcept {
  Count sum = 0.0;
  return first_unconserved(node_baseline(overall_), subnets(), node_baseline, sum) == 0 &&
         first_unconserved(link_weight(overall_), subnets(), link_weight, sum) == 0;
}

void Networks::assert_conserved() const {
  Count sum = 0.0;
  if (auto i = first_unconserved(node_baseline(overall_), subnets(), node_baseline, sum)) {
    throw InvalidArgument("save_play_suscept of node " + std::to_string(i) + " sums to " +
                          std::to_string(sum) + " across sub-networks but is " +
                          std::to_string(node_baseline(overall_)[i]) + " overall");
  }
  if (auto i = first_unconserved(link_weight(overall_), subnets(), link_weight, sum)) {
    throw InvalidArgument("weight of link " + std::to_string(i) + " sums to " +
                          std::to_string(sum) + " across sub-networks but is " +
                          std::to_string(link_weight(overall_)[i]) + " overall");
  }
}

void Networks::assert_sane() const {
  overall_.assert_sane();
  for (auto const& sub : subnets_) sub.assert_sane();
}

} // namespace demonet::core
