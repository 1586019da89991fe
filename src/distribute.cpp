/*
  Remainder Redistributor.

  Independent rounding of each partition leaves a small integer discrepancy
  per id between the parent and the sum of its partitions. The repair runs in
  four timed phases:
    initialise      : scratch arrays <- parent baseline (parallel)
    calc_differences: scratch[i] -= partition[j][i] for every j (parallel)
    distribute_nodes: per-node stochastic +/-1 repair (sequential)
    distribute_links: per-link stochastic +/-1 repair (sequential)
  The repair phases share one generator and therefore one writer.
*/
#include "demonet/core/distribute.hpp"
#include "demonet/core/error.hpp"
#include "demonet/core/parallel.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace demonet::core {

namespace {

void validate(const Network& parent, std::span<Network* const> partitions,
              std::span<RandomGenerator> rngs) {
  if (partitions.empty()) {
    throw InvalidArgument("distribute_remainders: at least one partition is required");
  }
  if (rngs.empty()) {
    throw InvalidArgument("distribute_remainders: at least one random generator is required");
  }
  for (std::size_t j = 0; j < partitions.size(); ++j) {
    const Network* sub = partitions[j];
    if (sub == nullptr) {
      throw InvalidArgument("distribute_remainders: partition " + std::to_string(j) + " is null");
    }
    if (!sub->same_shape(parent)) {
      throw InvalidArgument("distribute_remainders: partition " + std::to_string(j) + " has " +
                            std::to_string(sub->num_nodes()) + " nodes and " +
                            std::to_string(sub->num_links()) + " links, parent has " +
                            std::to_string(parent.num_nodes()) + " nodes and " +
                            std::to_string(parent.num_links()) + " links");
    }
  }
}

// Repair every id whose diff is non-zero; returns the absolute units moved.
// base[j] is the authoritative field of partition j, mirror[j] its working copy.
Count repair(ConservedView<const Count> target, const std::vector<Count>& diff,
             const std::vector<ConservedView<Count>>& base,
             const std::vector<ConservedView<Count>>& mirror,
             RandomGenerator& rng, std::int32_t& repaired) {
  const auto nsubnets = base.size();
  std::vector<Count> values(nsubnets, 0.0);
  Count moved = 0.0;
  for (std::int32_t i = 1; i <= target.size(); ++i) {
    const Count d = diff[static_cast<std::size_t>(i)];
    if (d == 0.0) continue;
    for (std::size_t j = 0; j < nsubnets; ++j) values[j] = base[j][i];
    redistribute(target[i], values, rng);
    for (std::size_t j = 0; j < nsubnets; ++j) {
      base[j][i] = values[j];
      mirror[j][i] = values[j];
    }
    moved += std::fabs(d);
    ++repaired;
  }
  return moved;
}

} // namespace

void redistribute(Count target, std::span<Count> values, RandomGenerator& rng) {
  Count remaining = target;
  for (Count v : values) remaining -= v;
  if (remaining == 0.0) return;
  if (values.empty()) {
    throw InvalidArgument("redistribute: no partitions to absorb a remainder of " +
                          std::to_string(remaining));
  }
  const auto n = static_cast<std::int32_t>(values.size());
  while (remaining > 0.0) {
    values[static_cast<std::size_t>(rng.uniform_int(n))] += 1.0;
    remaining -= 1.0;
  }
  while (remaining < 0.0) {
    values[static_cast<std::size_t>(rng.uniform_int(n))] -= 1.0;
    remaining += 1.0;
  }
}

RemainderSummary distribute_remainders(const Network& parent,
                                       std::span<Network* const> partitions,
                                       std::span<RandomGenerator> rngs,
                                       const DistributeOptions& opts,
                                       Profiler& profiler) {
  validate(parent, partitions, rngs);

  const std::int32_t nnodes = parent.num_nodes();
  const std::int32_t nlinks = parent.num_links();
  const int nthreads = resolve_num_threads(opts.num_threads);
  const auto nsubnets = partitions.size();

  // Resolve every partition's views once, before any parallel region.
  std::vector<ConservedView<Count>> sub_save, sub_play, sub_weight, sub_suscept;
  sub_save.reserve(nsubnets);
  sub_play.reserve(nsubnets);
  sub_weight.reserve(nsubnets);
  sub_suscept.reserve(nsubnets);
  for (Network* sub : partitions) {
    sub_save.push_back(sub->nodes().save_play_suscept_view());
    sub_play.push_back(sub->nodes().play_suscept_view());
    sub_weight.push_back(sub->links().weight_view());
    sub_suscept.push_back(sub->links().suscept_view());
  }

  const auto parent_save = parent.nodes().save_play_suscept_view();
  const auto parent_weight = parent.links().weight_view();

  auto phase = profiler.start("initialise");
  std::vector<Count> node_diff(static_cast<std::size_t>(nnodes) + 1, 0.0);
  std::vector<Count> link_diff(static_cast<std::size_t>(nlinks) + 1, 0.0);
  parallel_for_static(nnodes, nthreads, opts.parallel_threshold, [&](std::int32_t i) {
    node_diff[static_cast<std::size_t>(i)] = parent_save[i];
  });
  parallel_for_static(nlinks, nthreads, opts.parallel_threshold, [&](std::int32_t i) {
    link_diff[static_cast<std::size_t>(i)] = parent_weight[i];
  });
  phase.stop();

  phase = profiler.start("calc_differences");
  parallel_for_static(nnodes, nthreads, opts.parallel_threshold, [&](std::int32_t i) {
    Count d = node_diff[static_cast<std::size_t>(i)];
    for (std::size_t j = 0; j < nsubnets; ++j) d -= sub_save[j][i];
    node_diff[static_cast<std::size_t>(i)] = d;
  });
  parallel_for_static(nlinks, nthreads, opts.parallel_threshold, [&](std::int32_t i) {
    Count d = link_diff[static_cast<std::size_t>(i)];
    for (std::size_t j = 0; j < nsubnets; ++j) d -= sub_weight[j][i];
    link_diff[static_cast<std::size_t>(i)] = d;
  });
  phase.stop();

  RandomGenerator& rng = rngs[0];
  RemainderSummary summary;

  phase = profiler.start("distribute_nodes");
  summary.node_correction = repair(parent_save, node_diff, sub_save, sub_play, rng,
                                   summary.nodes_repaired);
  phase.stop();

  phase = profiler.start("distribute_links");
  summary.link_correction = repair(parent_weight, link_diff, sub_weight, sub_suscept, rng,
                                   summary.links_repaired);
  phase.stop();

  return summary;
}

RemainderSummary distribute_remainders(const Network& parent,
                                       std::span<Network> partitions,
                                       std::span<RandomGenerator> rngs,
                                       const DistributeOptions& opts,
                                       Profiler& profiler) {
  std::vector<Network*> ptrs;
  ptrs.reserve(partitions.size());
  for (auto& sub : partitions) ptrs.push_back(&sub);
  return distribute_remainders(parent, std::span<Network* const>(ptrs), rngs, opts, profiler);
}

} // namespace demonet::core
