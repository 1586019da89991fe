/* Scale Engine: rescale susceptible counts by a ratio with biased rounding. */
#pragma once

#include <cmath>
#include <optional>

#include "demonet/core/network.hpp"
#include "demonet/core/types.hpp"

namespace demonet::core {

// Round value*scale to an integer count. Shrinking ratios (scale <= 0.5)
// truncate toward -inf; larger ratios round to nearest with ties toward +inf.
[[nodiscard]] inline double scale_and_round(double value, double scale) noexcept;

// Scale the play susceptibles of every node. A present ratio overrides both
// work_ratio and play_ratio; only the play channel is consumed here. Writes
// play_suscept and save_play_suscept with the same value.
//
// No-op when the effective ratio is absent, nodes is empty, or the ratio is
// the scalar 1.0. Throws InvalidArgument before mutating anything if a dense
// ratio's length differs from the node count or a sparse key is not a node id,
// and UnsupportedScaleType for an unusable ratio.
void scale_node_susceptibles(Nodes& nodes,
                             const std::optional<ScaleRatio>& ratio,
                             const std::optional<ScaleRatio>& work_ratio = std::nullopt,
                             const std::optional<ScaleRatio>& play_ratio = std::nullopt);

// Scale the weight/suscept of every link. Sparse and dense ratios are keyed by
// the link's origin node (ifrom); for those forms only links whose resolved
// ratio differs from 1.0 are rewritten. A dense ratio must have one entry per
// node of the network the links were built for.
void scale_link_susceptibles(Links& links, const std::optional<ScaleRatio>& ratio);

inline double scale_and_round(double value, double scale) noexcept {
  if (scale > 0.5) {
    return std::floor(value * scale + 0.5);
  }
  return std::floor(value * scale);
}

} // namespace demonet::core
