/*
  BlockingFlow — Dinic phases over a BFS level graph.

  A phase builds levels with a BFS from the source over admissible arcs. If
  the sink is reached, an iterative DFS restricted to level L -> L+1 arcs
  finds augmenting paths one at a time; each node keeps a current-arc pointer
  that only advances past arcs proven saturated or leading to a dead end, so
  a phase never re-scans work. Arcs are scanned in EdgeId order. Path depth
  is bounded by memory, not by the call stack.
*/
#include "waternet/core/max_flow.hpp"
#include "run_context.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"

namespace waternet::core {

namespace {

// Level graph and DFS pointers for one run.
struct LevelWorkspace {
  const FlowNetwork* g {nullptr};
  ResidualState* rs {nullptr};
  std::vector<std::int32_t> level;  // BFS level; -1 when unreached
  std::vector<std::int32_t> it;     // current-arc position into arcs_view()
  std::vector<ArcId> stack;         // arcs of the path being built

  bool bfs(NodeId s, NodeId t) {
    auto offsets = g->arc_offsets_view();
    auto arcs = g->arcs_view();
    std::fill(level.begin(), level.end(), -1);
    std::queue<NodeId> q;
    level[static_cast<std::size_t>(s)] = 0;
    q.push(s);
    while (!q.empty()) {
      auto u = static_cast<std::size_t>(q.front());
      q.pop();
      for (auto j = static_cast<std::size_t>(offsets[u]); j < static_cast<std::size_t>(offsets[u + 1]); ++j) {
        ArcId a = arcs[j];
        auto v = static_cast<std::size_t>(g->arc_head(a));
        if (level[v] < 0 && rs->admissible(a)) {
          level[v] = level[u] + 1;
          q.push(static_cast<NodeId>(v));
        }
      }
    }
    return level[static_cast<std::size_t>(t)] >= 0;
  }

  // Finds one s->t path in the level graph and saturates its bottleneck.
  // Advance follows the current arc of the node on top of `stack`; retreat
  // drops a dead-end node and moves its parent's pointer past the arc. On
  // success `stack` holds the path arcs. Returns 0 when the phase is blocked.
  Flow augment(NodeId s, NodeId t) {
    auto arcs = g->arcs_view();
    auto offsets = g->arc_offsets_view();
    stack.clear();
    NodeId u = s;
    while (u != t) {
      auto ui = static_cast<std::size_t>(u);
      const auto end = offsets[ui + 1];
      auto& i = it[ui];
      while (i < end) {
        ArcId a = arcs[static_cast<std::size_t>(i)];
        if (rs->admissible(a) && level[static_cast<std::size_t>(g->arc_head(a))] == level[ui] + 1) break;
        ++i;
      }
      if (i < end) {
        ArcId a = arcs[static_cast<std::size_t>(i)];
        stack.push_back(a);
        u = g->arc_head(a);
        continue;
      }
      if (stack.empty()) return 0.0;
      ArcId back = stack.back();
      stack.pop_back();
      u = g->arc_tail(back);
      ++it[static_cast<std::size_t>(u)];
    }
    Flow d = std::numeric_limits<Flow>::infinity();
    for (ArcId a : stack) d = std::min(d, rs->residual(a));
    DCHECK(d > 0.0);
    for (ArcId a : stack) rs->push(a, d);
    return d;
  }
};

class BlockingFlow final : public MaxFlowAlgorithm {
public:
  AlgorithmKind kind() const noexcept override { return AlgorithmKind::BlockingFlow; }

  FlowResult run(const FlowNetwork& g, NodeId src, NodeId dst,
                 const RunOptions& opts) const override {
    RunContext ctx(g, src, dst, kind(), opts);
    const auto N = static_cast<std::size_t>(g.num_nodes());
    LevelWorkspace ws;
    ws.g = &g;
    ws.rs = &ctx.state();
    ws.level.assign(N, -1);
    ws.it.assign(N, 0);
    Flow total = 0.0;

    TerminationReason reason = TerminationReason::Converged;
    while (ws.bfs(src, dst)) {
      if (auto stop = ctx.budget().tick()) {
        reason = *stop;
        break;
      }
      const auto phase = ctx.budget().iterations();
      if (ctx.trace().enabled()) {
        AlgorithmEvent ev;
        ev.kind = EventKind::PhaseStart;
        ev.iteration = phase;
        ev.level = ws.level[static_cast<std::size_t>(dst)];
        ctx.trace().emit(std::move(ev));
      }
      auto offsets = g.arc_offsets_view();
      std::copy(offsets.begin(), offsets.end() - 1, ws.it.begin());
      Flow phase_flow = 0.0;
      while (true) {
        Flow pushed = ws.augment(src, dst);
        if (pushed <= 0.0) break;
        phase_flow += pushed;
        total += pushed;
        if (ctx.trace().enabled()) {
          AlgorithmEvent ev;
          ev.kind = EventKind::PathFound;
          ev.iteration = phase;
          ev.arcs = ws.stack;
          ev.amount = pushed;
          ev.total_flow = total;
          ctx.trace().emit(std::move(ev));
        }
      }
      VLOG(2) << "dinic: phase " << phase << " (sink level "
              << ws.level[static_cast<std::size_t>(dst)] << ") pushed " << phase_flow;
    }
    return ctx.finish(reason);
  }
};

} // namespace

MaxFlowAlgorithmPtr make_blocking_flow() {
  return std::make_shared<BlockingFlow>();
}

} // namespace waternet::core
