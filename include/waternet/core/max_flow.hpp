/* Max-flow capability interface, result type and variant factories. */
#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "waternet/core/flow_network.hpp"
#include "waternet/core/options.hpp"
#include "waternet/core/trace.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

struct FlowResult {
  Flow total_flow {0.0};          // net flow leaving the source
  std::vector<Flow> edge_flows;   // length == num_edges; 0 <= flow <= capacity
  AlgorithmKind algorithm {AlgorithmKind::AugmentingPath};
  NodeId source {-1};
  NodeId sink {-1};
  std::int64_t iterations {0};    // augmentations / phases / discharges
  TerminationReason termination {TerminationReason::Converged};
  double tolerance {0.0};         // tolerance the run used
  std::vector<AlgorithmEvent> trace;  // filled only when RunOptions::trace

  [[nodiscard]] bool is_maximal() const noexcept {
    return termination == TerminationReason::Converged;
  }
};

// One operation: compute a flow from src to dst on g. Implementations keep
// all mutable state local to run(), so one instance may serve concurrent
// runs. Throws std::out_of_range / std::invalid_argument for bad terminals
// and NumericInstability if the run's arithmetic breaks the flow invariants.
class MaxFlowAlgorithm {
public:
  virtual ~MaxFlowAlgorithm() noexcept = default;

  [[nodiscard]] virtual AlgorithmKind kind() const noexcept = 0;

  [[nodiscard]] virtual FlowResult run(const FlowNetwork& g, NodeId src, NodeId dst,
                                       const RunOptions& opts) const = 0;
};

using MaxFlowAlgorithmPtr = std::shared_ptr<const MaxFlowAlgorithm>;

[[nodiscard]] MaxFlowAlgorithmPtr make_augmenting_path();
[[nodiscard]] MaxFlowAlgorithmPtr make_blocking_flow();
[[nodiscard]] MaxFlowAlgorithmPtr make_preflow_push();
[[nodiscard]] MaxFlowAlgorithmPtr make_algorithm(AlgorithmKind kind);

} // namespace waternet::core
