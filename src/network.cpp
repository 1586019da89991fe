/*
  Nodes / Links / Network: construction, field lookup and sanity checks.

  Construction from arrays validates inputs and lays every per-entity field out
  with a leading sentinel slot, so that id i lives at index i.
*/
#include "demonet/core/network.hpp"
#include "demonet/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace demonet::core {

namespace {

const char* field_name(NodeField f) noexcept {
  return f == NodeField::PlaySuscept ? "play_suscept" : "save_play_suscept";
}

const char* field_name(LinkField f) noexcept {
  return f == LinkField::Weight ? "weight" : "suscept";
}

bool is_count(double x) noexcept {
  return std::isfinite(x) && x >= 0.0 && std::floor(x) == x;
}

// Values are the real entries only; id i is values[i - 1].
void check_values(std::span<const Count> values, const char* name) {
  for (std::size_t k = 0; k < values.size(); ++k) {
    if (!is_count(values[k])) {
      throw InvalidArgument(std::string(name) + "[" + std::to_string(k + 1) + "] = " +
                            std::to_string(values[k]) + " is not a non-negative integer count");
    }
  }
}

void check_counts(ConservedView<const Count> v, const char* name) {
  if (v.span().empty()) return;
  if (v[0] != 0.0) {
    throw InvalidArgument(std::string(name) + "[0] sentinel must be 0");
  }
  check_values(v.values(), name);
}

void check_lockstep(ConservedView<const Count> save, ConservedView<const Count> live,
                    const char* save_name, const char* live_name) {
  for (std::int32_t i = 1; i <= save.size(); ++i) {
    if (save[i] != live[i]) {
      throw InvalidArgument(std::string(live_name) + "[" + std::to_string(i) +
                            "] differs from " + save_name);
    }
  }
}

} // namespace

Nodes Nodes::from_arrays(std::span<const Count> play_suscept) {
  check_values(play_suscept, field_name(NodeField::PlaySuscept));
  Nodes n;
  n.play_suscept_.assign(play_suscept.size() + 1, 0.0);
  std::copy(play_suscept.begin(), play_suscept.end(), n.play_suscept_.begin() + 1);
  n.save_play_suscept_ = n.play_suscept_;
  return n;
}

ConservedView<Count> Nodes::view(NodeField field) {
  switch (field) {
    case NodeField::PlaySuscept: return play_suscept_view();
    case NodeField::SavePlaySuscept: return save_play_suscept_view();
  }
  throw InvalidArgument("Nodes::view: unknown field");
}

ConservedView<const Count> Nodes::view(NodeField field) const {
  switch (field) {
    case NodeField::PlaySuscept: return play_suscept_view();
    case NodeField::SavePlaySuscept: return save_play_suscept_view();
  }
  throw InvalidArgument("Nodes::view: unknown field");
}

Links Links::from_arrays(std::int32_t num_nodes,
                         std::span<const NodeId> ifrom,
                         std::span<const NodeId> ito,
                         std::span<const Count> weight) {
  if (num_nodes < 0) {
    throw InvalidArgument("num_nodes must be >= 0");
  }
  if (ifrom.size() != ito.size() || ifrom.size() != weight.size()) {
    throw InvalidArgument("ifrom, ito and weight must have the same length (got " +
                          std::to_string(ifrom.size()) + ", " + std::to_string(ito.size()) +
                          ", " + std::to_string(weight.size()) + ")");
  }
  const std::size_t m = ifrom.size();
  for (std::size_t i = 0; i < m; ++i) {
    if (ifrom[i] < 1 || ito[i] < 1 || ifrom[i] > num_nodes || ito[i] > num_nodes) {
      throw InvalidArgument("link " + std::to_string(i + 1) + " references a node outside [1, " +
                            std::to_string(num_nodes) + "]");
    }
  }
  check_values(weight, field_name(LinkField::Weight));
  Links l;
  l.num_nodes_ = num_nodes;
  l.ifrom_.assign(m + 1, 0);
  l.ito_.assign(m + 1, 0);
  l.weight_.assign(m + 1, 0.0);
  std::copy(ifrom.begin(), ifrom.end(), l.ifrom_.begin() + 1);
  std::copy(ito.begin(), ito.end(), l.ito_.begin() + 1);
  std::copy(weight.begin(), weight.end(), l.weight_.begin() + 1);
  l.suscept_ = l.weight_;
  return l;
}

ConservedView<Count> Links::view(LinkField field) {
  switch (field) {
    case LinkField::Weight: return weight_view();
    case LinkField::Suscept: return suscept_view();
  }
  throw InvalidArgument("Links::view: unknown field");
}

ConservedView<const Count> Links::view(LinkField field) const {
  switch (field) {
    case LinkField::Weight: return weight_view();
    case LinkField::Suscept: return suscept_view();
  }
  throw InvalidArgument("Links::view: unknown field");
}

Network::Network(Nodes nodes, Links links)
  : nodes_(std::move(nodes)), links_(std::move(links)) {
  if (!links_.empty() && links_.num_nodes() != nodes_.size()) {
    throw InvalidArgument("links were built for " + std::to_string(links_.num_nodes()) +
                          " nodes but the network has " + std::to_string(nodes_.size()));
  }
}

Network Network::from_arrays(std::span<const Count> play_suscept,
                             std::span<const NodeId> ifrom,
                             std::span<const NodeId> ito,
                             std::span<const Count> weight) {
  auto nodes = Nodes::from_arrays(play_suscept);
  auto links = Links::from_arrays(nodes.size(), ifrom, ito, weight);
  return Network(std::move(nodes), std::move(links));
}

void Network::assert_sane() const {
  for (auto f : {NodeField::SavePlaySuscept, NodeField::PlaySuscept}) {
    check_counts(nodes_.view(f), field_name(f));
  }
  for (auto f : {LinkField::Weight, LinkField::Suscept}) {
    check_counts(links_.view(f), field_name(f));
  }
  check_lockstep(nodes_.save_play_suscept_view(), nodes_.play_suscept_view(),
                 field_name(NodeField::SavePlaySuscept), field_name(NodeField::PlaySuscept));
  check_lockstep(links_.weight_view(), links_.suscept_view(),
                 field_name(LinkField::Weight), field_name(LinkField::Suscept));
}

} // namespace demonet::core
