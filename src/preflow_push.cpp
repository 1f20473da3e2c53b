/*
  PreflowPush — push-relabel with FIFO active-node selection.

  Phase 1 computes a maximum preflow: the source starts at height n with all
  its out-edges saturated; an active node (excess > tolerance, height < n) is
  discharged by pushing along admissible arcs (head exactly one level lower)
  using a current-arc pointer, and relabelled to 1 + the lowest residual
  neighbour when the pointer runs off its arc list. Nodes that climb to
  height >= n can no longer reach the sink and stop being active.

  Phase 2 turns the preflow into a flow: the preflow is decomposed into
  source->sink paths and the flow is rebuilt from them, which returns every
  unit of stranded excess to the source. The same conversion runs when the
  budget stops phase 1 early, so a stopped run still reports a valid flow.
  The returned excess is traced as pushes along reverse arcs.
*/
#include "waternet/core/max_flow.hpp"
#include "waternet/core/error.hpp"
#include "waternet/core/flow_analysis.hpp"
#include "run_context.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <span>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace waternet::core {

namespace {

class PreflowPush final : public MaxFlowAlgorithm {
public:
  AlgorithmKind kind() const noexcept override { return AlgorithmKind::PreflowPush; }

  FlowResult run(const FlowNetwork& g, NodeId src, NodeId dst,
                 const RunOptions& opts) const override {
    RunContext ctx(g, src, dst, kind(), opts);
    Discharger d(ctx);
    TerminationReason reason = d.run();
    VLOG(2) << "push-relabel: " << d.pushes() << " pushes, " << d.relabels()
            << " relabels, preflow into sink " << d.excess_at(dst);

    auto& rs = ctx.state();
    auto dec = decompose_flow(g, rs.edge_flow_view(), src, dst, ctx.tolerance());
    if (dec.stranded > 0.0) {
      VLOG(2) << "push-relabel: returned " << dec.stranded << " stranded excess to the source";
    }
    auto flows = path_edge_flows(g, dec);
    if (ctx.trace().enabled()) emit_returns(ctx, rs.edge_flow_view(), flows);
    rs.assign(flows);
    return ctx.finish(reason);
  }

private:
  // Records the phase-2 rewrite as pushes, so that replaying every Push
  // event reproduces the final edge flows. Excess leaves an edge along its
  // reverse arc; rounding in the rebuilt flow may need a forward nudge.
  static void emit_returns(RunContext& ctx, std::span<const Flow> preflow,
                           const std::vector<Flow>& flows) {
    const auto& g = ctx.graph();
    auto src = g.edge_src_view();
    auto dst = g.edge_dst_view();
    for (EdgeId e = 0; e < g.num_edges(); ++e) {
      auto i = static_cast<std::size_t>(e);
      const Flow delta = preflow[i] - flows[i];
      if (delta == 0.0) continue;
      AlgorithmEvent ev;
      ev.kind = EventKind::Push;
      ev.iteration = ctx.budget().iterations();
      if (delta > 0.0) {
        ev.node = dst[i];
        ev.target = src[i];
        ev.arcs = {reverse_arc(e)};
        ev.amount = delta;
      } else {
        ev.node = src[i];
        ev.target = dst[i];
        ev.arcs = {forward_arc(e)};
        ev.amount = -delta;
      }
      ctx.trace().emit(std::move(ev));
    }
  }

  class Discharger {
  public:
    explicit Discharger(RunContext& ctx)
      : ctx_(ctx), g_(ctx.graph()), rs_(ctx.state()),
        n_(g_.num_nodes()),
        height_(static_cast<std::size_t>(n_), 0),
        excess_(static_cast<std::size_t>(n_), 0.0),
        current_(g_.arc_offsets_view().begin(), g_.arc_offsets_view().end() - 1),
        queued_(static_cast<std::size_t>(n_), 0) {}

    [[nodiscard]] std::int64_t pushes() const noexcept { return pushes_; }
    [[nodiscard]] std::int64_t relabels() const noexcept { return relabels_; }
    [[nodiscard]] Flow excess_at(NodeId v) const { return excess_.at(static_cast<std::size_t>(v)); }

    TerminationReason run() {
      const NodeId s = ctx_.src();
      height_[static_cast<std::size_t>(s)] = n_;
      auto offsets = g_.arc_offsets_view();
      auto arcs = g_.arcs_view();
      auto si = static_cast<std::size_t>(s);
      for (auto j = static_cast<std::size_t>(offsets[si]); j < static_cast<std::size_t>(offsets[si + 1]); ++j) {
        ArcId a = arcs[j];
        if (rs_.admissible(a)) push(a, rs_.residual(a));
      }
      while (!active_.empty()) {
        NodeId u = active_.front();
        active_.pop_front();
        queued_[static_cast<std::size_t>(u)] = 0;
        if (!is_active(u)) continue;
        if (auto stop = ctx_.budget().tick()) return *stop;
        discharge(u);
      }
      return TerminationReason::Converged;
    }

  private:
    bool is_active(NodeId v) const {
      auto i = static_cast<std::size_t>(v);
      return v != ctx_.src() && v != ctx_.dst() &&
             excess_[i] > ctx_.tolerance() && height_[i] < n_;
    }

    void push(ArcId a, Flow amount) {
      NodeId u = g_.arc_tail(a);
      NodeId v = g_.arc_head(a);
      rs_.push(a, amount);
      auto ui = static_cast<std::size_t>(u);
      excess_[ui] -= amount;
      excess_[static_cast<std::size_t>(v)] += amount;
      ++pushes_;
      if (u != ctx_.src() && excess_[ui] < -ctx_.tolerance() * std::max(1.0, amount)) {
        LOG(ERROR) << "negative excess " << excess_[ui] << " at " << g_.node_name(u);
        throw NumericInstability(absl::StrCat("excess at node ", g_.node_name(u),
                                              " became negative: ", excess_[ui]));
      }
      if (ctx_.trace().enabled()) {
        AlgorithmEvent ev;
        ev.kind = EventKind::Push;
        ev.iteration = ctx_.budget().iterations();
        ev.node = u;
        ev.target = v;
        ev.arcs = {a};
        ev.amount = amount;
        ctx_.trace().emit(std::move(ev));
      }
      auto vi = static_cast<std::size_t>(v);
      if (!queued_[vi] && is_active(v)) {
        queued_[vi] = 1;
        active_.push_back(v);
      }
    }

    void relabel(NodeId u) {
      auto offsets = g_.arc_offsets_view();
      auto arcs = g_.arcs_view();
      auto ui = static_cast<std::size_t>(u);
      std::int32_t lowest = std::numeric_limits<std::int32_t>::max();
      for (auto j = static_cast<std::size_t>(offsets[ui]); j < static_cast<std::size_t>(offsets[ui + 1]); ++j) {
        ArcId a = arcs[j];
        if (rs_.admissible(a)) {
          lowest = std::min(lowest, height_[static_cast<std::size_t>(g_.arc_head(a))]);
        }
      }
      // Excess below tolerance on every inbound arc leaves nothing to push
      // back on; park the node so phase 2 returns what it holds.
      height_[ui] = (lowest == std::numeric_limits<std::int32_t>::max()) ? 2 * n_ : lowest + 1;
      current_[ui] = offsets[ui];
      ++relabels_;
      if (ctx_.trace().enabled()) {
        AlgorithmEvent ev;
        ev.kind = EventKind::Relabel;
        ev.iteration = ctx_.budget().iterations();
        ev.node = u;
        ev.level = height_[ui];
        ctx_.trace().emit(std::move(ev));
      }
    }

    void discharge(NodeId u) {
      auto offsets = g_.arc_offsets_view();
      auto arcs = g_.arcs_view();
      auto ui = static_cast<std::size_t>(u);
      while (excess_[ui] > ctx_.tolerance()) {
        if (current_[ui] == offsets[ui + 1]) {
          relabel(u);
          if (height_[ui] >= n_) break;
          continue;
        }
        ArcId a = arcs[static_cast<std::size_t>(current_[ui])];
        NodeId v = g_.arc_head(a);
        if (rs_.admissible(a) && height_[ui] == height_[static_cast<std::size_t>(v)] + 1) {
          push(a, std::min(excess_[ui], rs_.residual(a)));
          if (!rs_.admissible(a)) ++current_[ui];
        } else {
          ++current_[ui];
        }
      }
    }

    RunContext& ctx_;
    const FlowNetwork& g_;
    ResidualState& rs_;
    std::int32_t n_;
    std::vector<std::int32_t> height_;
    std::vector<Flow> excess_;
    std::vector<std::int32_t> current_;  // current-arc position per node
    std::vector<std::uint8_t> queued_;
    std::deque<NodeId> active_;
    std::int64_t pushes_ {0};
    std::int64_t relabels_ {0};
  };
};

} // namespace

MaxFlowAlgorithmPtr make_preflow_push() {
  return std::make_shared<PreflowPush>();
}

} // namespace waternet::core
