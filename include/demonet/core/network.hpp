/* Nodes, Links and Network: owners of the per-entity Conserved Arrays. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "demonet/core/conserved_array.hpp"
#include "demonet/core/types.hpp"

namespace demonet::core {

// Nodes holds the per-node susceptible counts. save_play_suscept is the
// baseline used for conservation; play_suscept is the working copy. Every
// write made by this library updates both.
class Nodes {
public:
  Nodes() = default;
  // play_suscept holds the N real values (ids 1..N); the sentinel slot is added.
  [[nodiscard]] static Nodes from_arrays(std::span<const Count> play_suscept);

  [[nodiscard]] std::int32_t size() const noexcept {
    return static_cast<std::int32_t>(play_suscept_.size() - 1);
  }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  [[nodiscard]] ConservedView<Count> view(NodeField field);
  [[nodiscard]] ConservedView<const Count> view(NodeField field) const;

  [[nodiscard]] ConservedView<Count> play_suscept_view() noexcept {
    return ConservedView<Count>(play_suscept_);
  }
  [[nodiscard]] ConservedView<const Count> play_suscept_view() const noexcept {
    return ConservedView<const Count>(play_suscept_);
  }
  [[nodiscard]] ConservedView<Count> save_play_suscept_view() noexcept {
    return ConservedView<Count>(save_play_suscept_);
  }
  [[nodiscard]] ConservedView<const Count> save_play_suscept_view() const noexcept {
    return ConservedView<const Count>(save_play_suscept_);
  }

  // Copy the baseline back over the working values.
  void reset() noexcept { play_suscept_ = save_play_suscept_; }

private:
  ConservedArray play_suscept_ { 0.0 };
  ConservedArray save_play_suscept_ { 0.0 };
};

// Links holds the directed links between nodes. ifrom/ito are 1-based node
// ids; weight is the baseline used for conservation and suscept its working copy.
class Links {
public:
  Links() = default;
  [[nodiscard]] static Links from_arrays(std::int32_t num_nodes,
                                         std::span<const NodeId> ifrom,
                                         std::span<const NodeId> ito,
                                         std::span<const Count> weight);

  [[nodiscard]] std::int32_t size() const noexcept {
    return static_cast<std::int32_t>(weight_.size() - 1);
  }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }
  // Number of nodes the ids were validated against.
  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }

  [[nodiscard]] ConservedView<Count> view(LinkField field);
  [[nodiscard]] ConservedView<const Count> view(LinkField field) const;

  [[nodiscard]] ConservedView<Count> weight_view() noexcept { return ConservedView<Count>(weight_); }
  [[nodiscard]] ConservedView<const Count> weight_view() const noexcept {
    return ConservedView<const Count>(weight_);
  }
  [[nodiscard]] ConservedView<Count> suscept_view() noexcept { return ConservedView<Count>(suscept_); }
  [[nodiscard]] ConservedView<const Count> suscept_view() const noexcept {
    return ConservedView<const Count>(suscept_);
  }
  [[nodiscard]] ConservedView<const NodeId> ifrom_view() const noexcept {
    return ConservedView<const NodeId>(ifrom_);
  }
  [[nodiscard]] ConservedView<const NodeId> ito_view() const noexcept {
    return ConservedView<const NodeId>(ito_);
  }

  void reset() noexcept { suscept_ = weight_; }

private:
  std::int32_t num_nodes_ {0};
  std::vector<NodeId> ifrom_ { 0 };
  std::vector<NodeId> ito_ { 0 };
  ConservedArray weight_ { 0.0 };
  ConservedArray suscept_ { 0.0 };
};

// Network is one population: its nodes and the links between them. A
// demographic sub-network is a Network with the same shape as its parent.
class Network {
public:
  Network() = default;
  // Throws InvalidArgument if links were built for a different node count.
  Network(Nodes nodes, Links links);

  [[nodiscard]] static Network from_arrays(std::span<const Count> play_suscept,
                                           std::span<const NodeId> ifrom,
                                           std::span<const NodeId> ito,
                                           std::span<const Count> weight);

  [[nodiscard]] Nodes& nodes() noexcept { return nodes_; }
  [[nodiscard]] const Nodes& nodes() const noexcept { return nodes_; }
  [[nodiscard]] Links& links() noexcept { return links_; }
  [[nodiscard]] const Links& links() const noexcept { return links_; }

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return nodes_.size(); }
  [[nodiscard]] std::int32_t num_links() const noexcept { return links_.size(); }

  [[nodiscard]] bool same_shape(const Network& other) const noexcept {
    return num_nodes() == other.num_nodes() && num_links() == other.num_links();
  }

  // Check the Conserved Array invariants: sentinels are zero, populated values
  // are finite, non-negative and integer valued, and working copies equal their
  // baselines. Throws InvalidArgument naming the first offending field/index.
  void assert_sane() const;

  void reset() noexcept {
    nodes_.reset();
    links_.reset();
  }

private:
  Nodes nodes_ {};
  Links links_ {};
};

} // namespace demonet::core
