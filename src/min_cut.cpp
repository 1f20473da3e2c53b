/*
  extract_min_cut — residual reachability cut for a finished FlowResult.
*/
#include "waternet/core/min_cut.hpp"
#include "waternet/core/max_flow.hpp"
#include "waternet/core/residual_state.hpp"

#include <stdexcept>

#include "absl/log/log.h"

namespace waternet::core {

MinCut extract_min_cut(const FlowNetwork& g, const FlowResult& result) {
  if (result.edge_flows.size() != static_cast<std::size_t>(g.num_edges())) {
    throw std::invalid_argument("extract_min_cut: result does not belong to this network");
  }
  ResidualState rs(g, result.edge_flows, result.tolerance);
  const NodeId sink = result.sink >= 0 ? result.sink : g.sink();
  MinCut cut = rs.compute_min_cut(result.source >= 0 ? result.source : g.source());
  cut.separating = cut.reachable.at(static_cast<std::size_t>(sink)) == 0u;
  if (!cut.separating) {
    LOG(WARNING) << "min cut requested on a non-maximal flow: sink " << g.node_name(sink)
                 << " is still reachable from the source";
  }
  VLOG(1) << "min cut: " << cut.edges.size() << " edges, capacity " << cut.capacity
          << ", |S|=" << cut.source_side.size() << " (flow " << result.total_flow << ")";
  return cut;
}

} // namespace waternet::core
