/* Minimum cut extracted from a terminated run's residual state. */
#pragma once

#include <cstdint>
#include <vector>

#include "waternet/core/constants.hpp"
#include "waternet/core/flow_network.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

struct FlowResult;

// Partition (S, T) with S = nodes reachable from the source over arcs with
// residual capacity above tolerance. `edges` are the S->T edges with positive
// network capacity, in EdgeId order; `capacity` is their sum.
struct MinCut {
  std::vector<NodeId> source_side;
  std::vector<NodeId> sink_side;
  std::vector<EdgeId> edges;
  Cap capacity {0.0};
  std::vector<std::uint8_t> reachable;  // length == num_nodes; 0/1 flags
  bool separating {true};               // sink is on the sink side
};

// Rebuilds the residual graph from result.edge_flows and extracts the cut.
// For a Converged result, cut capacity equals result.total_flow. A stopped
// run may still leave an augmenting path; then the sink is reachable,
// `separating` is false and `edges` is not a source/sink cut.
[[nodiscard]] MinCut extract_min_cut(const FlowNetwork& g, const FlowResult& result);

} // namespace waternet::core
