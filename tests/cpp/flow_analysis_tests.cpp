#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "waternet/core/engine.hpp"
#include "waternet/core/error.hpp"
#include "waternet/core/flow_analysis.hpp"
#include "test_utils.hpp"

using namespace waternet::core;
using namespace waternet::core::test;

TEST(DecomposeFlow, DiamondSplitsIntoTwoPaths) {
  auto g = make_diamond();
  auto r = run(g, AlgorithmKind::AugmentingPath);
  auto d = decompose_flow(g, r.edge_flows, g.source(), g.sink());
  ASSERT_EQ(d.paths.size(), 2u);
  auto S = g.source(), T = g.sink();
  auto A = *g.find_node("A"), B = *g.find_node("B");
  EXPECT_EQ(d.paths[0].nodes, (std::vector<NodeId>{S, A, T}));
  EXPECT_EQ(d.paths[0].edges, (std::vector<EdgeId>{0, 2}));
  EXPECT_DOUBLE_EQ(d.paths[0].amount, 10.0);
  EXPECT_EQ(d.paths[1].nodes, (std::vector<NodeId>{S, B, T}));
  EXPECT_DOUBLE_EQ(d.delivered, 20.0);
  EXPECT_DOUBLE_EQ(d.stranded, 0.0);
  EXPECT_DOUBLE_EQ(d.cycles, 0.0);
}

TEST(DecomposeFlow, PathsRebuildTheFlow) {
  auto g = make_layered(5, 5);
  for (auto kind : kAllAlgorithms) {
    auto r = run(g, kind);
    auto d = decompose_flow(g, r.edge_flows, g.source(), g.sink());
    EXPECT_NEAR(d.delivered, r.total_flow, 1e-9);
    EXPECT_NEAR(d.stranded, 0.0, 1e-9);
    auto rebuilt = path_edge_flows(g, d);
    Flow sum = 0.0;
    for (const auto& p : d.paths) {
      EXPECT_EQ(p.nodes.size(), p.edges.size() + 1);
      EXPECT_EQ(p.nodes.front(), g.source());
      EXPECT_EQ(p.nodes.back(), g.sink());
      EXPECT_GT(p.amount, 0.0);
      sum += p.amount;
    }
    EXPECT_NEAR(sum, r.total_flow, 1e-9);
    EXPECT_NO_THROW(validate_flow(g, rebuilt, g.source(), g.sink()));
    EXPECT_NEAR(flow_value(g, rebuilt, g.source()), r.total_flow, 1e-9);
  }
}

TEST(DecomposeFlow, CancelsCirculation) {
  auto g = make_network(
    {node("S", NodeRole::Source), node("A"), node("B"), node("T", NodeRole::Sink)},
    {conduit("S", "A", 5), conduit("A", "B", 3), conduit("B", "A", 3), conduit("A", "T", 5)});
  std::vector<Flow> flows {5, 2, 2, 5};
  auto d = decompose_flow(g, flows, g.source(), g.sink());
  ASSERT_EQ(d.paths.size(), 1u);
  EXPECT_DOUBLE_EQ(d.paths[0].amount, 5.0);
  EXPECT_DOUBLE_EQ(d.cycles, 2.0);
  EXPECT_DOUBLE_EQ(d.stranded, 0.0);
  auto rebuilt = path_edge_flows(g, d);
  EXPECT_EQ(rebuilt, (std::vector<Flow>{5, 0, 0, 5}));
}

TEST(DecomposeFlow, ReportsStrandedExcess) {
  auto g = make_line({5, 5});
  std::vector<Flow> preflow {3, 1};
  auto d = decompose_flow(g, preflow, 0, 2);
  ASSERT_EQ(d.paths.size(), 1u);
  EXPECT_DOUBLE_EQ(d.delivered, 1.0);
  EXPECT_DOUBLE_EQ(d.stranded, 2.0);
  EXPECT_EQ(path_edge_flows(g, d), (std::vector<Flow>{1, 1}));
}

TEST(DecomposeFlow, ArgumentChecks) {
  auto g = make_line({1});
  std::vector<Flow> wrong {1, 1};
  std::vector<Flow> right {1};
  EXPECT_THROW((void)decompose_flow(g, wrong, 0, 1), std::invalid_argument);
  EXPECT_THROW((void)decompose_flow(g, right, 0, 2), std::out_of_range);
  EXPECT_TRUE(decompose_flow(g, right, 1, 1).paths.empty());
}

TEST(NodeBalances, InflowOutflow) {
  auto g = make_diamond();
  auto r = run(g, AlgorithmKind::BlockingFlow);
  auto bal = node_balances(g, r.edge_flows);
  ASSERT_EQ(bal.size(), 4u);
  EXPECT_DOUBLE_EQ(bal[static_cast<std::size_t>(g.source())].outflow, 20.0);
  EXPECT_DOUBLE_EQ(bal[static_cast<std::size_t>(g.source())].inflow, 0.0);
  EXPECT_DOUBLE_EQ(bal[static_cast<std::size_t>(g.sink())].net(), -20.0);
  auto A = static_cast<std::size_t>(*g.find_node("A"));
  EXPECT_EQ(bal[A].node, static_cast<NodeId>(A));
  EXPECT_DOUBLE_EQ(bal[A].net(), 0.0);
  EXPECT_DOUBLE_EQ(flow_value(g, r.edge_flows, g.source()), 20.0);
}

TEST(ValidateFlow, AcceptsAlgorithmOutput) {
  auto g = make_grid(4, 4, 0.7);
  for (auto kind : kAllAlgorithms) {
    auto r = run(g, kind);
    EXPECT_NO_THROW(validate_flow(g, r.edge_flows, g.source(), g.sink(), r.tolerance));
  }
}

TEST(ValidateFlow, RejectsCapacityViolation) {
  auto g = make_line({5, 5});
  std::vector<Flow> over {6, 6};
  EXPECT_THROW(validate_flow(g, over, 0, 2), NumericInstability);
  std::vector<Flow> negative {-1, -1};
  EXPECT_THROW(validate_flow(g, negative, 0, 2), NumericInstability);
}

TEST(ValidateFlow, RejectsConservationViolation) {
  auto g = make_line({5, 5});
  std::vector<Flow> leaky {3, 1};
  EXPECT_THROW(validate_flow(g, leaky, 0, 2), NumericInstability);
}

TEST(ValidateFlow, ToleratesRounding) {
  auto g = make_line({0.1 + 0.2, 0.3});
  std::vector<Flow> flows {0.1 + 0.2, 0.3};
  EXPECT_NO_THROW(validate_flow(g, flows, 0, 2, 0.0));
}

TEST(ValidateFlow, ArgumentChecks) {
  auto g = make_line({1});
  std::vector<Flow> wrong {1, 1};
  EXPECT_THROW(validate_flow(g, wrong, 0, 1), std::invalid_argument);
  std::vector<Flow> right {1};
  EXPECT_THROW(validate_flow(g, right, 0, 3), std::out_of_range);
}
