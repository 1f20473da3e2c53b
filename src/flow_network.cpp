/*
  FlowNetwork — immutable capacitated digraph with deterministic layout.

  Construction validates inputs (roles, capacities, self-loops, parallel
  edges) and builds CSR adjacency, reverse CSR and the residual-arc adjacency
  used by the algorithms. Edges keep their insertion order throughout, so the
  EdgeId is also the tie-break key for traversal.
*/
#include "waternet/core/flow_network.hpp"
#include "waternet/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

#include "absl/strings/str_cat.h"

namespace waternet::core {

namespace {

void validate_capacity(Cap c, std::size_t i) {
  if (!std::isfinite(c)) {
    throw InvalidNetwork(absl::StrCat("edge ", i, ": capacity must be finite"));
  }
  if (c < 0.0) {
    throw InvalidNetwork(absl::StrCat("edge ", i, ": capacity must be >= 0, got ", c));
  }
}

// Fills a CSR triple from per-edge keys; rows are node ids, entries stay in
// EdgeId order because edges are scanned in order.
void fill_csr(std::int32_t num_nodes,
              const std::vector<NodeId>& key,
              const std::vector<NodeId>& other,
              std::vector<std::int32_t>& offsets,
              std::vector<NodeId>& cols,
              std::vector<EdgeId>& eids) {
  const std::size_t m = key.size();
  offsets.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    offsets[static_cast<std::size_t>(key[i]) + 1]++;
  }
  for (std::size_t i = 1; i < offsets.size(); ++i) {
    offsets[i] += offsets[i - 1];
  }
  cols.resize(m);
  eids.resize(m);
  std::vector<std::int32_t> cursor = offsets;
  for (std::size_t e = 0; e < m; ++e) {
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(key[e])]++);
    cols[pos] = other[e];
    eids[pos] = static_cast<EdgeId>(e);
  }
}

} // namespace

FlowNetwork FlowNetwork::build(std::span<const NodeSpec> nodes,
                               std::span<const EdgeSpec> edges) {
  FlowNetwork g;
  g.num_nodes_ = static_cast<std::int32_t>(nodes.size());
  g.names_.reserve(nodes.size());
  g.roles_.reserve(nodes.size());
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const auto& n = nodes[i];
    if (n.name.empty()) {
      throw InvalidNetwork(absl::StrCat("node ", i, ": identifier must not be empty"));
    }
    auto [it, inserted] = g.name_index_.emplace(n.name, static_cast<NodeId>(i));
    if (!inserted) {
      throw InvalidNetwork(absl::StrCat("duplicate node identifier '", n.name, "'"));
    }
    if (n.role == NodeRole::Source) {
      if (g.source_ >= 0) throw InvalidNetwork("network has more than one source");
      g.source_ = static_cast<NodeId>(i);
    } else if (n.role == NodeRole::Sink) {
      if (g.sink_ >= 0) throw InvalidNetwork("network has more than one sink");
      g.sink_ = static_cast<NodeId>(i);
    }
    g.names_.push_back(n.name);
    g.roles_.push_back(n.role);
  }
  if (g.source_ < 0) throw InvalidNetwork("network has no source");
  if (g.sink_ < 0) throw InvalidNetwork("network has no sink");

  const std::size_t m = edges.size();
  g.src_.reserve(m);
  g.dst_.reserve(m);
  g.capacity_.reserve(m);
  for (std::size_t i = 0; i < m; ++i) {
    const auto& e = edges[i];
    auto u = g.name_index_.find(e.from);
    auto v = g.name_index_.find(e.to);
    if (u == g.name_index_.end()) {
      throw InvalidNetwork(absl::StrCat("edge ", i, ": unknown node '", e.from, "'"));
    }
    if (v == g.name_index_.end()) {
      throw InvalidNetwork(absl::StrCat("edge ", i, ": unknown node '", e.to, "'"));
    }
    g.src_.push_back(u->second);
    g.dst_.push_back(v->second);
    g.capacity_.push_back(e.capacity);
  }
  g.build_adjacency();
  return g;
}

FlowNetwork FlowNetwork::from_arrays(
    std::int32_t num_nodes,
    std::span<const std::int32_t> src,
    std::span<const std::int32_t> dst,
    std::span<const Cap> capacity,
    NodeId source,
    NodeId sink) {

  if (num_nodes < 0) {
    throw InvalidNetwork("num_nodes must be >= 0");
  }
  if (src.size() != dst.size() || src.size() != capacity.size()) {
    throw InvalidNetwork("src, dst, and capacity must have the same length");
  }
  if (source < 0 || source >= num_nodes) throw InvalidNetwork("source not present in network");
  if (sink < 0 || sink >= num_nodes) throw InvalidNetwork("sink not present in network");
  if (source == sink) throw InvalidNetwork("source and sink must differ");

  FlowNetwork g;
  g.num_nodes_ = num_nodes;
  g.source_ = source;
  g.sink_ = sink;
  g.names_.reserve(static_cast<std::size_t>(num_nodes));
  g.roles_.assign(static_cast<std::size_t>(num_nodes), NodeRole::Intermediate);
  g.roles_[static_cast<std::size_t>(source)] = NodeRole::Source;
  g.roles_[static_cast<std::size_t>(sink)] = NodeRole::Sink;
  for (std::int32_t i = 0; i < num_nodes; ++i) {
    g.names_.push_back(std::to_string(i));
    g.name_index_.emplace(g.names_.back(), i);
  }
  for (std::size_t i = 0; i < src.size(); ++i) {
    if (src[i] < 0 || dst[i] < 0 || src[i] >= num_nodes || dst[i] >= num_nodes) {
      throw InvalidNetwork(absl::StrCat("edge ", i, ": node index out of range of num_nodes"));
    }
  }
  g.src_.assign(src.begin(), src.end());
  g.dst_.assign(dst.begin(), dst.end());
  g.capacity_.assign(capacity.begin(), capacity.end());
  g.build_adjacency();
  return g;
}

FlowNetwork FlowNetwork::with_capacities(std::vector<Cap> capacity) const {
  if (capacity.size() != capacity_.size()) {
    throw InvalidNetwork("capacity vector length must equal num_edges");
  }
  for (std::size_t i = 0; i < capacity.size(); ++i) {
    validate_capacity(capacity[i], i);
  }
  FlowNetwork g = *this;
  g.capacity_ = std::move(capacity);
  return g;
}

// Shared tail of both builders: validates edges, then lays out adjacency.
void FlowNetwork::build_adjacency() {
  if (source_ == sink_) throw InvalidNetwork("source and sink must differ");
  const std::size_t m = src_.size();
  std::unordered_set<std::int64_t> seen;
  seen.reserve(m);
  for (std::size_t i = 0; i < m; ++i) {
    validate_capacity(capacity_[i], i);
    if (src_[i] == dst_[i]) {
      throw InvalidNetwork(absl::StrCat("edge ", i, ": self-loop on node '",
                                        names_[static_cast<std::size_t>(src_[i])], "'"));
    }
    auto key = (static_cast<std::int64_t>(src_[i]) << 32) | static_cast<std::uint32_t>(dst_[i]);
    if (!seen.insert(key).second) {
      throw InvalidNetwork(absl::StrCat("edge ", i, ": duplicate edge ",
                                        names_[static_cast<std::size_t>(src_[i])], "->",
                                        names_[static_cast<std::size_t>(dst_[i])]));
    }
  }

  fill_csr(num_nodes_, src_, dst_, row_offsets_, col_indices_, adj_edge_index_);
  fill_csr(num_nodes_, dst_, src_, in_row_offsets_, in_col_indices_, in_adj_edge_index_);

  // Residual arcs: each edge contributes its forward arc to the tail's row and
  // its reverse arc to the head's row. Scanning edges in order keeps each row
  // sorted by EdgeId.
  arc_offsets_.assign(static_cast<std::size_t>(num_nodes_) + 1, 0);
  for (std::size_t e = 0; e < m; ++e) {
    arc_offsets_[static_cast<std::size_t>(src_[e]) + 1]++;
    arc_offsets_[static_cast<std::size_t>(dst_[e]) + 1]++;
  }
  for (std::size_t i = 1; i < arc_offsets_.size(); ++i) {
    arc_offsets_[i] += arc_offsets_[i - 1];
  }
  arcs_.resize(2 * m);
  std::vector<std::int32_t> cursor = arc_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto eid = static_cast<EdgeId>(e);
    arcs_[static_cast<std::size_t>(cursor[static_cast<std::size_t>(src_[e])]++)] = forward_arc(eid);
    arcs_[static_cast<std::size_t>(cursor[static_cast<std::size_t>(dst_[e])]++)] = reverse_arc(eid);
  }
}

std::optional<NodeId> FlowNetwork::find_node(std::string_view name) const {
  auto it = name_index_.find(std::string(name));
  if (it == name_index_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeId> FlowNetwork::find_edge(NodeId from, NodeId to) const {
  if (from < 0 || from >= num_nodes_ || to < 0 || to >= num_nodes_) return std::nullopt;
  auto s = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(from)]);
  auto e = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(from) + 1]);
  for (std::size_t j = s; j < e; ++j) {
    if (col_indices_[j] == to) return adj_edge_index_[j];
  }
  return std::nullopt;
}

std::optional<EdgeId> FlowNetwork::find_edge(std::string_view from, std::string_view to) const {
  auto u = find_node(from);
  auto v = find_node(to);
  if (!u || !v) return std::nullopt;
  return find_edge(*u, *v);
}

std::string FlowNetwork::edge_label(EdgeId e) const {
  auto i = static_cast<std::size_t>(e);
  return absl::StrCat(names_.at(static_cast<std::size_t>(src_.at(i))), "->",
                      names_.at(static_cast<std::size_t>(dst_.at(i))));
}

} // namespace waternet::core
