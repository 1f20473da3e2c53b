/*
  AugmentingPath — Edmonds-Karp shortest augmenting paths.

  Each iteration runs a BFS from the source over arcs with residual capacity
  above tolerance, expanding every node's arcs in EdgeId order, and augments
  the bottleneck amount along the fewest-edge path found. The BFS is
  read-only, so the budget is charged only once a path exists.
*/
#include "waternet/core/max_flow.hpp"
#include "run_context.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <vector>

#include "absl/log/log.h"

namespace waternet::core {

namespace {

class AugmentingPath final : public MaxFlowAlgorithm {
public:
  AlgorithmKind kind() const noexcept override { return AlgorithmKind::AugmentingPath; }

  FlowResult run(const FlowNetwork& g, NodeId src, NodeId dst,
                 const RunOptions& opts) const override {
    RunContext ctx(g, src, dst, kind(), opts);
    auto& rs = ctx.state();
    auto offsets = g.arc_offsets_view();
    auto arcs = g.arcs_view();
    const auto N = static_cast<std::size_t>(g.num_nodes());
    // parent_arc[v] is the arc used to reach v; -1 when unvisited.
    std::vector<ArcId> parent_arc(N, -1);
    std::vector<ArcId> path;
    Flow total = 0.0;

    auto bfs = [&]() -> bool {
      std::fill(parent_arc.begin(), parent_arc.end(), -1);
      std::queue<NodeId> q;
      q.push(src);
      while (!q.empty()) {
        auto u = static_cast<std::size_t>(q.front());
        q.pop();
        for (auto j = static_cast<std::size_t>(offsets[u]); j < static_cast<std::size_t>(offsets[u + 1]); ++j) {
          ArcId a = arcs[j];
          NodeId v = g.arc_head(a);
          if (v == src || parent_arc[static_cast<std::size_t>(v)] >= 0) continue;
          if (!rs.admissible(a)) continue;
          parent_arc[static_cast<std::size_t>(v)] = a;
          if (v == dst) return true;
          q.push(v);
        }
      }
      return false;
    };

    TerminationReason reason = TerminationReason::Converged;
    while (bfs()) {
      if (auto stop = ctx.budget().tick()) {
        reason = *stop;
        break;
      }
      // Walk back from dst collecting arcs and the bottleneck residual.
      path.clear();
      Flow bottleneck = std::numeric_limits<Flow>::infinity();
      for (NodeId v = dst; v != src; ) {
        ArcId a = parent_arc[static_cast<std::size_t>(v)];
        path.push_back(a);
        bottleneck = std::min(bottleneck, rs.residual(a));
        v = g.arc_tail(a);
      }
      std::reverse(path.begin(), path.end());
      for (ArcId a : path) rs.push(a, bottleneck);
      total += bottleneck;
      if (ctx.trace().enabled()) {
        AlgorithmEvent ev;
        ev.kind = EventKind::PathFound;
        ev.iteration = ctx.budget().iterations();
        ev.arcs = path;
        ev.amount = bottleneck;
        ev.total_flow = total;
        ctx.trace().emit(std::move(ev));
      }
      VLOG(2) << "edmonds-karp: augmented " << bottleneck << " along " << path.size()
              << " arcs, total " << total;
    }
    return ctx.finish(reason);
  }
};

} // namespace

MaxFlowAlgorithmPtr make_augmenting_path() {
  return std::make_shared<AugmentingPath>();
}

} // namespace waternet::core
