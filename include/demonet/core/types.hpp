/* Core type aliases and ratio specification.
 *
 * For Python developers:
 * - NodeId/LinkId: int32 (matches np.int32), 1-based; index 0 is a sentinel
 * - Count: double (matches np.float64) but always integer valued
 * - std::variant<A,B,C>: tagged union (like Union[A, B, C] resolved once)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <map>
#include <variant>
#include <vector>

namespace demonet::core {

// Node and link identifiers are signed 32-bit integers. Real entities are
// numbered from 1; slot 0 of every per-entity array is unused.
using NodeId = std::int32_t;
using LinkId = std::int32_t;
using Count  = double;  // Susceptible count (integer valued, stored as float64)
using Ratio  = double;  // Scale factor

// Ratio applied only to the listed ids (others keep ratio 1.0).
// For links the key is the origin node id, not the link id.
using SparseRatio = std::map<NodeId, Ratio>;

// One ratio per node: element p holds the ratio for id p+1.
// For links the element is looked up by origin node id.
using DenseRatio = std::vector<Ratio>;

// Scalar | SparseByIndex | DenseByIndex.
using ScaleRatio = std::variant<Ratio, SparseRatio, DenseRatio>;

// Named per-node fields (Conserved Arrays owned by Nodes).
enum class NodeField {
  PlaySuscept = 1,      // working value
  SavePlaySuscept = 2   // baseline value, authoritative for conservation
};

// Named per-link fields (Conserved Arrays owned by Links).
enum class LinkField {
  Weight = 1,   // authoritative for conservation
  Suscept = 2
};

} // namespace demonet::core
