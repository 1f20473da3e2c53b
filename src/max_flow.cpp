/*
  Max-flow plumbing shared by the three variants: terminal checks, the
  per-run context and the variant factory.
*/
#include "waternet/core/max_flow.hpp"
#include "waternet/core/flow_analysis.hpp"
#include "run_context.hpp"

#include <stdexcept>

#include "absl/log/log.h"

namespace waternet::core {

void check_terminals(const FlowNetwork& g, NodeId src, NodeId dst) {
  const auto N = g.num_nodes();
  if (src < 0 || src >= N) throw std::out_of_range("src out of range");
  if (dst < 0 || dst >= N) throw std::out_of_range("dst out of range");
  if (src == dst) throw std::invalid_argument("src and dst must differ");
}

RunContext::RunContext(const FlowNetwork& g, NodeId src, NodeId dst,
                       AlgorithmKind kind, const RunOptions& opts)
  : g_(&g), src_(src), dst_(dst), kind_(kind), keep_trace_(opts.trace),
    state_(g, opts.tolerance), budget_(opts),
    channel_(opts.trace ? &recorder_ : nullptr, opts.trace_sink) {
  check_terminals(g, src, dst);
}

FlowResult RunContext::finish(TerminationReason reason) {
  auto flows = state_.edge_flow_view();
  validate_flow(*g_, flows, src_, dst_, state_.tolerance());

  FlowResult r;
  r.edge_flows.assign(flows.begin(), flows.end());
  r.total_flow = state_.net_outflow(src_);
  r.algorithm = kind_;
  r.source = src_;
  r.sink = dst_;
  r.iterations = budget_.iterations();
  r.termination = reason;
  r.tolerance = state_.tolerance();
  if (keep_trace_) r.trace = recorder_.take();

  VLOG(1) << to_string(kind_) << ": max flow " << r.total_flow << " after "
          << r.iterations << " iterations (" << to_string(reason) << ")";
  if (reason != TerminationReason::Converged) {
    LOG(WARNING) << to_string(kind_) << " stopped early (" << to_string(reason)
                 << ") after " << r.iterations << " iterations; flow "
                 << r.total_flow << " is valid but not proven maximal";
  }
  return r;
}

MaxFlowAlgorithmPtr make_algorithm(AlgorithmKind kind) {
  switch (kind) {
    case AlgorithmKind::AugmentingPath: return make_augmenting_path();
    case AlgorithmKind::BlockingFlow: return make_blocking_flow();
    case AlgorithmKind::PreflowPush: return make_preflow_push();
  }
  throw std::invalid_argument("unknown algorithm kind");
}

} // namespace waternet::core
