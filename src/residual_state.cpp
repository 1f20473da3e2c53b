/*
  ResidualState — per-edge flow arena with residual-arc accessors.

  Flow is stored once per edge; both residual arcs are derived from it, so a
  push along an arc and along its opposite can never drift apart.
*/
#include "waternet/core/residual_state.hpp"
#include "waternet/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <queue>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace waternet::core {

ResidualState::ResidualState(const FlowNetwork& g, double tolerance)
  : g_(&g), tol_(tolerance), edge_flow_(static_cast<std::size_t>(g.num_edges()), 0.0) {
  if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
    throw std::invalid_argument("tolerance must be finite and >= 0");
  }
}

ResidualState::ResidualState(const FlowNetwork& g, std::span<const Flow> edge_flows, double tolerance)
  : ResidualState(g, tolerance) {
  assign(edge_flows);
}

void ResidualState::reset() noexcept {
  std::fill(edge_flow_.begin(), edge_flow_.end(), 0.0);
}

void ResidualState::assign(std::span<const Flow> edge_flows) {
  if (edge_flows.size() != edge_flow_.size()) {
    throw std::invalid_argument("edge_flows length must equal num_edges");
  }
  std::copy(edge_flows.begin(), edge_flows.end(), edge_flow_.begin());
}

void ResidualState::push(ArcId a, Flow amount) {
  DCHECK(a >= 0 && arc_edge(a) < g_->num_edges()) << "arc " << a;
  auto e = static_cast<std::size_t>(arc_edge(a));
  const Cap cap = g_->capacity_view()[e];
  const double slack = tol_ * std::max(1.0, cap);
  Flow f = is_forward_arc(a) ? edge_flow_[e] + amount : edge_flow_[e] - amount;
  if (!std::isfinite(amount) || f < -slack || f > cap + slack) {
    LOG(ERROR) << "numeric instability on edge " << g_->edge_label(arc_edge(a))
               << ": flow would become " << f << " (capacity " << cap
               << ", push " << amount << ")";
    throw NumericInstability(absl::StrCat("flow on edge ", g_->edge_label(arc_edge(a)),
                                          " left [0, capacity] beyond tolerance: ", f));
  }
  edge_flow_[e] = std::clamp(f, 0.0, cap);
}

Flow ResidualState::net_outflow(NodeId v) const noexcept {
  auto row = g_->row_offsets_view();
  auto aei = g_->adj_edge_index_view();
  auto in_row = g_->in_row_offsets_view();
  auto in_aei = g_->in_adj_edge_index_view();
  auto u = static_cast<std::size_t>(v);
  Flow out = 0.0;
  for (auto j = static_cast<std::size_t>(row[u]); j < static_cast<std::size_t>(row[u + 1]); ++j) {
    out += edge_flow_[static_cast<std::size_t>(aei[j])];
  }
  for (auto j = static_cast<std::size_t>(in_row[u]); j < static_cast<std::size_t>(in_row[u + 1]); ++j) {
    out -= edge_flow_[static_cast<std::size_t>(in_aei[j])];
  }
  return out;
}

MinCut ResidualState::compute_min_cut(NodeId src) const {
  MinCut out;
  const auto N = g_->num_nodes();
  if (src < 0 || src >= N) {
    throw std::out_of_range("compute_min_cut: src out of range");
  }
  auto offsets = g_->arc_offsets_view();
  auto arcs = g_->arcs_view();
  out.reachable.assign(static_cast<std::size_t>(N), 0u);
  std::queue<NodeId> q;
  out.reachable[static_cast<std::size_t>(src)] = 1u;
  q.push(src);
  while (!q.empty()) {
    auto u = static_cast<std::size_t>(q.front());
    q.pop();
    for (auto j = static_cast<std::size_t>(offsets[u]); j < static_cast<std::size_t>(offsets[u + 1]); ++j) {
      ArcId a = arcs[j];
      auto v = static_cast<std::size_t>(g_->arc_head(a));
      if (!out.reachable[v] && admissible(a)) {
        out.reachable[v] = 1u;
        q.push(static_cast<NodeId>(v));
      }
    }
  }
  for (NodeId v = 0; v < N; ++v) {
    (out.reachable[static_cast<std::size_t>(v)] ? out.source_side : out.sink_side).push_back(v);
  }
  auto src_v = g_->edge_src_view();
  auto dst_v = g_->edge_dst_view();
  auto cap = g_->capacity_view();
  for (EdgeId e = 0; e < g_->num_edges(); ++e) {
    auto i = static_cast<std::size_t>(e);
    if (out.reachable[static_cast<std::size_t>(src_v[i])] &&
        !out.reachable[static_cast<std::size_t>(dst_v[i])] && cap[i] > 0.0) {
      out.edges.push_back(e);
      out.capacity += cap[i];
    }
  }
  return out;
}

} // namespace waternet::core
