/*
  RunContext — per-run scaffolding shared by the max-flow variants (internal).

  Owns the residual arena, budget and trace channel of one run, and turns the
  terminated state into a FlowResult after re-checking the flow invariants.
*/
#pragma once

#include "waternet/core/budget.hpp"
#include "waternet/core/flow_network.hpp"
#include "waternet/core/max_flow.hpp"
#include "waternet/core/options.hpp"
#include "waternet/core/residual_state.hpp"
#include "waternet/core/trace.hpp"

namespace waternet::core {

class RunContext {
public:
  RunContext(const FlowNetwork& g, NodeId src, NodeId dst,
             AlgorithmKind kind, const RunOptions& opts);

  RunContext(const RunContext&) = delete;
  RunContext& operator=(const RunContext&) = delete;

  [[nodiscard]] const FlowNetwork& graph() const noexcept { return *g_; }
  [[nodiscard]] NodeId src() const noexcept { return src_; }
  [[nodiscard]] NodeId dst() const noexcept { return dst_; }
  [[nodiscard]] double tolerance() const noexcept { return state_.tolerance(); }
  [[nodiscard]] ResidualState& state() noexcept { return state_; }
  [[nodiscard]] RunBudget& budget() noexcept { return budget_; }
  [[nodiscard]] TraceChannel& trace() noexcept { return channel_; }

  // Validates the current edge flows, computes the value and packages the
  // result. Throws NumericInstability if the invariants do not hold.
  [[nodiscard]] FlowResult finish(TerminationReason reason);

private:
  const FlowNetwork* g_ {nullptr};
  NodeId src_ {-1};
  NodeId dst_ {-1};
  AlgorithmKind kind_;
  bool keep_trace_ {false};
  ResidualState state_;
  RunBudget budget_;
  TraceRecorder recorder_;
  TraceChannel channel_;
};

// Throws std::out_of_range / std::invalid_argument for unusable terminals.
void check_terminals(const FlowNetwork& g, NodeId src, NodeId dst);

} // namespace waternet::core
