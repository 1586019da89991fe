/* Remainder Redistributor: restore exact partition sums after rounding. */
#pragma once

#include <cstdint>
#include <span>

#include "demonet/core/network.hpp"
#include "demonet/core/options.hpp"
#include "demonet/core/profiler.hpp"
#include "demonet/core/random.hpp"
#include "demonet/core/types.hpp"

namespace demonet::core {

// Diagnostic report of one distribute_remainders call.
struct RemainderSummary {
  Count node_correction {0.0};   // total absolute units moved across all nodes
  Count link_correction {0.0};   // total absolute units moved across all links
  std::int32_t nodes_repaired {0};
  std::int32_t links_repaired {0};

  [[nodiscard]] Count total_correction() const noexcept { return node_correction + link_correction; }
};

// Adjust values by +/-1 units until they sum to target. Each unit goes to a
// partition drawn uniformly and independently from [0, values.size()), so one
// partition may absorb several units. Values are not clamped at zero.
// Throws InvalidArgument if values is empty and target is non-zero.
void redistribute(Count target, std::span<Count> values, RandomGenerator& rng);

// Repair every partition so that, for each node id i and link id i,
//   sum_j partitions[j].save_play_suscept[i] == parent.save_play_suscept[i]
//   sum_j partitions[j].weight[i]            == parent.weight[i]
// Node repairs write play_suscept and save_play_suscept; link repairs write
// weight and suscept.
//
// Phases "initialise" and "calc_differences" run on opts.num_threads OpenMP
// workers with a static schedule. "distribute_nodes" and "distribute_links"
// run on the calling thread and draw only from rngs[0], so a fixed seed gives
// the same result for any thread count.
//
// Throws InvalidArgument (before any write) when partitions or rngs is empty,
// a partition is null, or a partition's shape differs from the parent's.
[[nodiscard]] RemainderSummary distribute_remainders(const Network& parent,
                                                     std::span<Network* const> partitions,
                                                     std::span<RandomGenerator> rngs,
                                                     const DistributeOptions& opts = {},
                                                     Profiler& profiler = null_profiler());

[[nodiscard]] RemainderSummary distribute_remainders(const Network& parent,
                                                     std::span<Network> partitions,
                                                     std::span<RandomGenerator> rngs,
                                                     const DistributeOptions& opts = {},
                                                     Profiler& profiler = null_profiler());

} // namespace demonet::core
