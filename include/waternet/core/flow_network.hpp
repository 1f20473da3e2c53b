/* Immutable capacitated digraph with CSR, reverse CSR and residual adjacency. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "waternet/core/types.hpp"

namespace waternet::core {

// Boundary description of a node: identifier and role.
struct NodeSpec {
  std::string name;
  NodeRole role { NodeRole::Intermediate };
};

// Boundary description of a pipe: endpoints by node name and capacity.
struct EdgeSpec {
  std::string from;
  std::string to;
  Cap capacity { 0.0 };
};

// Notes on identifiers:
// - NodeId is the position of the node in the construction input.
// - EdgeId is the insertion index of the edge. Unlike a compacted multigraph,
//   edges are never reordered: insertion order is the tie-break order used by
//   every algorithm, so EdgeId order == traversal order.
// - Copies are cheap to reason about: a FlowNetwork never changes after
//   construction, so concurrent runs may share one instance.
class FlowNetwork {
public:
  // Build from named nodes and edges. Exactly one node must be SOURCE and one
  // SINK. Throws InvalidNetwork on any violation.
  [[nodiscard]] static FlowNetwork build(std::span<const NodeSpec> nodes,
                                         std::span<const EdgeSpec> edges);

  // Build from index arrays. Nodes are named by their decimal index.
  [[nodiscard]] static FlowNetwork from_arrays(
      std::int32_t num_nodes,
      std::span<const std::int32_t> src,
      std::span<const std::int32_t> dst,
      std::span<const Cap> capacity,
      NodeId source,
      NodeId sink);

  // Same topology, ids and names with a new capacity vector (length
  // num_edges()). Used by scenario application; validates capacities.
  [[nodiscard]] FlowNetwork with_capacities(std::vector<Cap> capacity) const;

  ~FlowNetwork() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(capacity_.size()); }
  [[nodiscard]] NodeId source() const noexcept { return source_; }
  [[nodiscard]] NodeId sink() const noexcept { return sink_; }

  [[nodiscard]] NodeRole role(NodeId v) const { return roles_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] const std::string& node_name(NodeId v) const { return names_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] std::optional<NodeId> find_node(std::string_view name) const;
  [[nodiscard]] std::optional<EdgeId> find_edge(NodeId from, NodeId to) const;
  [[nodiscard]] std::optional<EdgeId> find_edge(std::string_view from, std::string_view to) const;
  // "A->B" style label used in logs, traces and reports.
  [[nodiscard]] std::string edge_label(EdgeId e) const;

  [[nodiscard]] std::span<const Cap> capacity_view() const noexcept { return capacity_; }
  [[nodiscard]] std::span<const NodeId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeId> edge_dst_view() const noexcept { return dst_; }
  // CSR adjacency (outgoing edges, insertion order within each row)
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }
  // Reverse CSR (incoming edges)
  [[nodiscard]] std::span<const std::int32_t> in_row_offsets_view() const noexcept { return in_row_offsets_; }
  [[nodiscard]] std::span<const NodeId> in_col_indices_view() const noexcept { return in_col_indices_; }
  [[nodiscard]] std::span<const EdgeId> in_adj_edge_index_view() const noexcept { return in_adj_edge_index_; }
  // Residual adjacency: for node u, arcs in [arc_offsets[u], arc_offsets[u+1])
  // are the forward arcs of its out-edges and the reverse arcs of its
  // in-edges, ordered by underlying EdgeId.
  [[nodiscard]] std::span<const std::int32_t> arc_offsets_view() const noexcept { return arc_offsets_; }
  [[nodiscard]] std::span<const ArcId> arcs_view() const noexcept { return arcs_; }

  // Tail/head of a residual arc.
  [[nodiscard]] NodeId arc_tail(ArcId a) const noexcept {
    auto e = static_cast<std::size_t>(arc_edge(a));
    return is_forward_arc(a) ? src_[e] : dst_[e];
  }
  [[nodiscard]] NodeId arc_head(ArcId a) const noexcept {
    auto e = static_cast<std::size_t>(arc_edge(a));
    return is_forward_arc(a) ? dst_[e] : src_[e];
  }

private:
  FlowNetwork() = default;
  void build_adjacency();

  std::int32_t num_nodes_ {0};
  NodeId source_ {-1};
  NodeId sink_ {-1};
  std::vector<std::string> names_ {};
  std::vector<NodeRole> roles_ {};
  std::unordered_map<std::string, NodeId> name_index_ {};

  std::vector<Cap> capacity_ {};
  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};

  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {};
  std::vector<std::int32_t> in_row_offsets_ {};
  std::vector<NodeId> in_col_indices_ {};
  std::vector<EdgeId> in_adj_edge_index_ {};
  std::vector<std::int32_t> arc_offsets_ {};
  std::vector<ArcId> arcs_ {};
};

} // namespace waternet::core
