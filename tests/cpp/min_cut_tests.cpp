#include <gtest/gtest.h>
#include <vector>
#include "waternet/core/engine.hpp"
#include "waternet/core/min_cut.hpp"
#include "waternet/core/residual_state.hpp"
#include "test_utils.hpp"

using namespace waternet::core;
using namespace waternet::core::test;

TEST(MinCut, DiamondPartition) {
  auto g = make_diamond();
  auto r = run(g, AlgorithmKind::BlockingFlow);
  auto cut = extract_min_cut(g, r);
  EXPECT_TRUE(cut.separating);
  EXPECT_EQ(cut.source_side, (std::vector<NodeId>{g.source()}));
  EXPECT_EQ(cut.sink_side.size(), 3u);
  EXPECT_EQ(cut.edges, (std::vector<EdgeId>{0, 1}));
  EXPECT_DOUBLE_EQ(cut.capacity, 20.0);
  ASSERT_EQ(cut.reachable.size(), 4u);
  EXPECT_EQ(cut.reachable[static_cast<std::size_t>(g.source())], 1u);
  EXPECT_EQ(cut.reachable[static_cast<std::size_t>(g.sink())], 0u);
}

TEST(MinCut, BottleneckInTheMiddle) {
  auto g = make_line({5, 2, 7});
  auto r = run(g, AlgorithmKind::AugmentingPath);
  auto cut = extract_min_cut(g, r);
  EXPECT_EQ(cut.source_side, (std::vector<NodeId>{0, 1}));
  EXPECT_EQ(cut.sink_side, (std::vector<NodeId>{2, 3}));
  EXPECT_EQ(cut.edges, (std::vector<EdgeId>{1}));
  EXPECT_DOUBLE_EQ(cut.capacity, 2.0);
}

TEST(MinCut, DisconnectedNetworkHasZeroCut) {
  // No S->T route even at full capacity: flow 0 and the reachable side
  // absorbs everything the source can reach, so nothing crosses.
  auto g = make_network(
    {node("S", NodeRole::Source), node("A"), node("B"), node("T", NodeRole::Sink)},
    {conduit("S", "A", 5), conduit("B", "T", 5)});
  for (auto kind : kAllAlgorithms) {
    auto r = run(g, kind);
    auto cut = extract_min_cut(g, r);
    EXPECT_TRUE(cut.separating);
    EXPECT_TRUE(cut.edges.empty());
    EXPECT_DOUBLE_EQ(cut.capacity, 0.0);
    EXPECT_EQ(cut.source_side.size(), 2u);
  }
}

TEST(MinCut, FailedPipesAreNotCutEdges) {
  auto base = make_diamond();
  auto g = ScenarioBuilder(base).fail("S", "A").apply();
  auto r = run(g, AlgorithmKind::PreflowPush);
  EXPECT_DOUBLE_EQ(r.total_flow, 10.0);
  auto cut = extract_min_cut(g, r);
  // S->A has zero capacity; the bottleneck is S->B alone.
  EXPECT_EQ(cut.edges, (std::vector<EdgeId>{*g.find_edge("S", "B")}));
  EXPECT_DOUBLE_EQ(cut.capacity, 10.0);
}

TEST(MinCut, StoppedRunIsNotSeparating) {
  auto g = make_diamond();
  RunOptions opts;
  opts.max_iterations = 1;
  auto r = run(g, AlgorithmKind::AugmentingPath, opts);
  ASSERT_EQ(r.termination, TerminationReason::BudgetExceeded);
  auto cut = extract_min_cut(g, r);
  EXPECT_FALSE(cut.separating);
  EXPECT_EQ(cut.reachable[static_cast<std::size_t>(g.sink())], 1u);
}

TEST(MinCut, ResultFromAnotherNetworkThrows) {
  auto g = make_diamond();
  auto other = make_line({1, 1});
  auto r = run(other, AlgorithmKind::AugmentingPath);
  EXPECT_THROW((void)extract_min_cut(g, r), std::invalid_argument);
}

TEST(ResidualState, ResidualArcsMirrorEdgeFlow) {
  auto g = make_line({4});
  ResidualState rs(g, 1e-9);
  EXPECT_DOUBLE_EQ(rs.residual(forward_arc(0)), 4.0);
  EXPECT_DOUBLE_EQ(rs.residual(reverse_arc(0)), 0.0);
  EXPECT_FALSE(rs.admissible(reverse_arc(0)));
  rs.push(forward_arc(0), 3.0);
  EXPECT_DOUBLE_EQ(rs.residual(forward_arc(0)), 1.0);
  EXPECT_DOUBLE_EQ(rs.residual(reverse_arc(0)), 3.0);
  rs.push(reverse_arc(0), 1.0);
  EXPECT_DOUBLE_EQ(rs.edge_flow_view()[0], 2.0);
  EXPECT_DOUBLE_EQ(rs.net_outflow(0), 2.0);
  EXPECT_DOUBLE_EQ(rs.net_outflow(1), -2.0);
  rs.reset();
  EXPECT_DOUBLE_EQ(rs.edge_flow_view()[0], 0.0);
}

TEST(ResidualState, CutFromArbitraryAssignment) {
  auto g = make_diamond();
  // Both S out-pipes saturated: the source is cut off on its own.
  std::vector<Flow> flows {10, 10, 10, 10, 0};
  ResidualState rs(g, flows, 1e-9);
  auto cut = rs.compute_min_cut(g.source());
  EXPECT_EQ(cut.source_side, (std::vector<NodeId>{g.source()}));
  std::vector<Flow> partial {5, 5, 5, 5, 0};
  rs.assign(partial);
  auto cut2 = rs.compute_min_cut(g.source());
  EXPECT_EQ(cut2.source_side.size(), 4u);
  EXPECT_TRUE(cut2.edges.empty());
  EXPECT_THROW((void)rs.compute_min_cut(9), std::out_of_range);
}
