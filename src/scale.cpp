/*
  Scale Engine: node and link susceptible rescaling.

  Ratios arrive as a ScaleRatio variant resolved once at the call boundary:
    - scalar: every id rewritten (skipped entirely for exactly 1.0)
    - sparse: only the listed ids rewritten
    - dense:  one ratio per node id
  Validation happens before the first write so a failed call leaves every
  array untouched.
*/
#include "demonet/core/scale.hpp"
#include "demonet/core/error.hpp"

#include <string>
#include <variant>

namespace demonet::core {

namespace {

void write_node(ConservedView<Count> live, ConservedView<Count> save,
                std::int32_t i, double ratio) noexcept {
  double v = scale_and_round(save[i], ratio);
  save[i] = v;
  live[i] = v;
}

void write_link(ConservedView<Count> weight, ConservedView<Count> suscept,
                std::int32_t i, double ratio) noexcept {
  double v = scale_and_round(weight[i], ratio);
  weight[i] = v;
  suscept[i] = v;
}

std::string length_mismatch(const char* what, std::size_t got, std::int32_t expected) {
  return std::string("Number of ratios (") + std::to_string(got) +
         ") does not match the number of " + what + " (" + std::to_string(expected) + ")";
}

} // namespace

void scale_node_susceptibles(Nodes& nodes,
                             const std::optional<ScaleRatio>& ratio,
                             [[maybe_unused]] const std::optional<ScaleRatio>& work_ratio,
                             const std::optional<ScaleRatio>& play_ratio) {
  const std::optional<ScaleRatio>& play = ratio.has_value() ? ratio : play_ratio;
  if (!play.has_value()) return;
  const std::int32_t n = nodes.size();
  if (n == 0) return;

  auto live = nodes.play_suscept_view();
  auto save = nodes.save_play_suscept_view();

  if (const auto* scalar = std::get_if<Ratio>(&*play)) {
    if (*scalar == 1.0) return;
    for (std::int32_t i = 1; i <= n; ++i) write_node(live, save, i, *scalar);
    return;
  }
  if (const auto* sparse = std::get_if<SparseRatio>(&*play)) {
    for (auto const& kv : *sparse) {
      if (kv.first < 1 || kv.first > n) {
        throw InvalidArgument("Ratio given for node " + std::to_string(kv.first) +
                              " but node ids run from 1 to " + std::to_string(n));
      }
    }
    for (auto const& [id, r] : *sparse) write_node(live, save, id, r);
    return;
  }
  if (const auto* dense = std::get_if<DenseRatio>(&*play)) {
    if (dense->size() != static_cast<std::size_t>(n)) {
      throw InvalidArgument(length_mismatch("nodes", dense->size(), n));
    }
    for (std::int32_t i = 1; i <= n; ++i) {
      write_node(live, save, i, (*dense)[static_cast<std::size_t>(i - 1)]);
    }
    return;
  }
  throw UnsupportedScaleType("Cannot scale node susceptibles by a ratio that is not a "
                             "number, a mapping or a sequence");
}

void scale_link_susceptibles(Links& links, const std::optional<ScaleRatio>& ratio) {
  if (!ratio.has_value()) return;
  const std::int32_t m = links.size();
  if (m == 0) return;

  auto weight = links.weight_view();
  auto suscept = links.suscept_view();
  auto ifrom = links.ifrom_view();

  if (const auto* scalar = std::get_if<Ratio>(&*ratio)) {
    if (*scalar == 1.0) return;
    for (std::int32_t i = 1; i <= m; ++i) write_link(weight, suscept, i, *scalar);
    return;
  }
  if (const auto* sparse = std::get_if<SparseRatio>(&*ratio)) {
    for (std::int32_t i = 1; i <= m; ++i) {
      auto it = sparse->find(ifrom[i]);
      if (it == sparse->end() || it->second == 1.0) continue;
      write_link(weight, suscept, i, it->second);
    }
    return;
  }
  if (const auto* dense = std::get_if<DenseRatio>(&*ratio)) {
    if (dense->size() != static_cast<std::size_t>(links.num_nodes())) {
      throw InvalidArgument(length_mismatch("nodes", dense->size(), links.num_nodes()));
    }
    for (std::int32_t i = 1; i <= m; ++i) {
      double r = (*dense)[static_cast<std::size_t>(ifrom[i] - 1)];
      if (r == 1.0) continue;
      write_link(weight, suscept, i, r);
    }
    return;
  }
  throw UnsupportedScaleType("Cannot scale link susceptibles by a ratio that is not a "
                             "number, a mapping or a sequence");
}

} // namespace demonet::core
