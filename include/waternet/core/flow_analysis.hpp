/* Flow inspection: path decomposition, node balances and invariant checks. */
#pragma once

#include <span>
#include <vector>

#include "waternet/core/constants.hpp"
#include "waternet/core/flow_network.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

// One source->sink path carrying `amount`. nodes.size() == edges.size() + 1.
struct FlowPath {
  std::vector<NodeId> nodes;
  std::vector<EdgeId> edges;
  Flow amount {0.0};
};

struct FlowDecomposition {
  std::vector<FlowPath> paths;  // in discovery order
  Flow delivered {0.0};         // sum of path amounts
  Flow stranded {0.0};          // flow from the source that ends short of the sink
  Flow cycles {0.0};            // flow removed as circulation
};

// Splits edge flows into src->dst paths. Walks out-edges in EdgeId order
// (deterministic), cancels flow cycles, and reports flow that dead-ends at
// a non-sink node (preflow excess) as stranded.
[[nodiscard]] FlowDecomposition decompose_flow(const FlowNetwork& g,
                                               std::span<const Flow> edge_flows,
                                               NodeId src, NodeId dst,
                                               double tolerance = kDefaultTolerance);

// Per-edge flow carried by the decomposition's paths. The result is a valid
// flow of value `delivered`.
[[nodiscard]] std::vector<Flow> path_edge_flows(const FlowNetwork& g,
                                                const FlowDecomposition& d);

struct NodeBalance {
  NodeId node {-1};
  Flow inflow {0.0};
  Flow outflow {0.0};
  [[nodiscard]] Flow net() const noexcept { return outflow - inflow; }
};

// Inflow/outflow for every node, in NodeId order.
[[nodiscard]] std::vector<NodeBalance> node_balances(const FlowNetwork& g,
                                                     std::span<const Flow> edge_flows);

// Net flow out of src.
[[nodiscard]] Flow flow_value(const FlowNetwork& g, std::span<const Flow> edge_flows, NodeId src);

// Checks capacity respect, conservation at every node but src/dst, and
// agreement between source outflow and sink inflow. Comparisons are scaled
// by the magnitudes involved. Throws NumericInstability on violation.
void validate_flow(const FlowNetwork& g, std::span<const Flow> edge_flows,
                   NodeId src, NodeId dst, double tolerance = kDefaultTolerance);

} // namespace waternet::core
