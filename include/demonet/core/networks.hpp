/* Networks: an overall Network plus one sub-network per demographic. */
#pragma once

#include <optional>
#include <span>
#include <vector>

#include "demonet/core/distribute.hpp"
#include "demonet/core/network.hpp"
#include "demonet/core/options.hpp"
#include "demonet/core/profiler.hpp"
#include "demonet/core/random.hpp"
#include "demonet/core/types.hpp"

namespace demonet::core {

// Networks ties the overall population to its demographic sub-networks. The
// sub-networks share the overall network's shape; after distribute_remainders
// their node baselines and link weights sum exactly to the overall network's.
class Networks {
public:
  // Requires at least two sub-networks, each the same shape as overall.
  [[nodiscard]] static Networks build(Network overall, std::vector<Network> subnets);

  [[nodiscard]] const Network& overall() const noexcept { return overall_; }
  [[nodiscard]] std::span<Network> subnets() noexcept { return subnets_; }
  [[nodiscard]] std::span<const Network> subnets() const noexcept { return subnets_; }
  [[nodiscard]] std::size_t size() const noexcept { return subnets_.size(); }

  // Scale subnet j's node and link susceptibles by ratios[j]. ratios must have
  // one (possibly empty) entry per subnet.
  void scale_susceptibles(std::span<const std::optional<ScaleRatio>> ratios);

  [[nodiscard]] RemainderSummary distribute_remainders(std::span<RandomGenerator> rngs,
                                                       const DistributeOptions& opts = {},
                                                       Profiler& profiler = null_profiler());

  // True when every node baseline and link weight sums exactly to overall.
  [[nodiscard]] bool is_conserved() const noexcept;
  // Throws InvalidArgument naming the first id whose subnets do not sum to overall.
  void assert_conserved() const;
  // Network::assert_sane on overall and every subnet.
  void assert_sane() const;

private:
  Network overall_ {};
  std::vector<Network> subnets_ {};
};

} // namespace demonet::core
