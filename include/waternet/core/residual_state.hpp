/*
  ResidualState — per-run arena of edge flows over an immutable FlowNetwork.
  Indexed by EdgeId/ArcId; never shared between runs.
*/
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "waternet/core/flow_network.hpp"
#include "waternet/core/min_cut.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

// Residual view of arc a:
//   forward arc 2e: capacity[e] - flow[e]
//   reverse arc 2e+1: flow[e]
class ResidualState {
public:
  ResidualState(const FlowNetwork& g, double tolerance);
  ResidualState(const FlowNetwork& g, std::span<const Flow> edge_flows, double tolerance);
  ~ResidualState() noexcept = default;

  // Zero all flows.
  void reset() noexcept;
  // Replace all flows (length == g.num_edges()).
  void assign(std::span<const Flow> edge_flows);

  [[nodiscard]] const FlowNetwork& graph() const noexcept { return *g_; }
  [[nodiscard]] double tolerance() const noexcept { return tol_; }
  [[nodiscard]] std::span<const Cap> capacity_view() const noexcept { return g_->capacity_view(); }
  [[nodiscard]] std::span<const Flow> edge_flow_view() const noexcept { return edge_flow_; }

  [[nodiscard]] Cap residual(ArcId a) const noexcept {
    auto e = static_cast<std::size_t>(arc_edge(a));
    return is_forward_arc(a) ? g_->capacity_view()[e] - edge_flow_[e] : edge_flow_[e];
  }
  // Residual strictly above tolerance.
  [[nodiscard]] bool admissible(ArcId a) const noexcept { return residual(a) > tol_; }

  // Moves `amount` along arc a. Values that overshoot [0, capacity] by no
  // more than tolerance are clamped; larger violations (or a non-finite
  // amount) throw NumericInstability.
  void push(ArcId a, Flow amount);

  // Net flow out of node v (outflow - inflow).
  [[nodiscard]] Flow net_outflow(NodeId v) const noexcept;

  // Reachability from src over admissible arcs, then the S->T edges with
  // positive capacity.
  [[nodiscard]] MinCut compute_min_cut(NodeId src) const;

private:
  const FlowNetwork* g_ {nullptr};
  double tol_ {0.0};
  std::vector<Flow> edge_flow_;
};

} // namespace waternet::core
