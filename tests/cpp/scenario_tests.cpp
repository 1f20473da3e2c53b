#include <gtest/gtest.h>
#include <vector>
#include "waternet/core/error.hpp"
#include "waternet/core/scenario.hpp"
#include "test_utils.hpp"

using namespace waternet::core;
using namespace waternet::core::test;

TEST(Scenario, EmptyScenarioIsIdentity) {
  auto base = make_diamond();
  auto g = apply_scenario(base, Scenario{});
  ASSERT_EQ(g.num_edges(), base.num_edges());
  for (EdgeId e = 0; e < g.num_edges(); ++e) {
    auto i = static_cast<std::size_t>(e);
    EXPECT_EQ(g.capacity_view()[i], base.capacity_view()[i]);
    EXPECT_EQ(g.edge_src_view()[i], base.edge_src_view()[i]);
    EXPECT_EQ(g.edge_dst_view()[i], base.edge_dst_view()[i]);
  }
  EXPECT_EQ(g.source(), base.source());
  EXPECT_EQ(g.sink(), base.sink());
  EXPECT_EQ(g.node_name(2), base.node_name(2));
}

TEST(Scenario, UniformLeakage) {
  auto base = make_diamond();
  Scenario s;
  s.default_leakage = 0.25;
  auto g = apply_scenario(base, s);
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "A"), 7.5);
  EXPECT_DOUBLE_EQ(capacity_of(g, "A", "B"), 3.75);
  // Base is untouched
  EXPECT_DOUBLE_EQ(capacity_of(base, "S", "A"), 10.0);
}

TEST(Scenario, OverridesAndFailures) {
  auto base = make_diamond();
  Scenario s;
  s.default_leakage = 0.1;
  s.edge_leakage[*base.find_edge("A", "B")] = 0.0;
  s.edge_leakage[*base.find_edge("S", "B")] = 0.5;
  s.failed_edges.insert(*base.find_edge("A", "T"));
  // A failure wins over a leakage override on the same pipe.
  s.edge_leakage[*base.find_edge("A", "T")] = 0.2;
  auto g = apply_scenario(base, s);
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "A"), 9.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "B"), 5.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "A", "B"), 5.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "A", "T"), 0.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "B", "T"), 9.0);
}

TEST(Scenario, RejectsBadFractions) {
  auto base = make_diamond();
  for (double f : {-0.1, 1.0, 1.5}) {
    Scenario s;
    s.default_leakage = f;
    EXPECT_THROW((void)apply_scenario(base, s), InvalidScenario) << f;
    Scenario t;
    t.edge_leakage[0] = f;
    EXPECT_THROW((void)apply_scenario(base, t), InvalidScenario) << f;
  }
}

TEST(Scenario, RejectsUnknownEdges) {
  auto base = make_diamond();
  Scenario s;
  s.failed_edges.insert(5);
  EXPECT_THROW((void)apply_scenario(base, s), InvalidScenario);
  Scenario t;
  t.edge_leakage[-1] = 0.1;
  EXPECT_THROW((void)apply_scenario(base, t), InvalidScenario);
}

TEST(ScenarioBuilder, ByName) {
  auto base = make_diamond();
  ScenarioBuilder b(base);
  b.leakage_percent(20).leak("S", "A", 0.5).fail("B,T");
  const auto& s = b.scenario();
  EXPECT_DOUBLE_EQ(s.default_leakage, 0.2);
  EXPECT_EQ(s.edge_leakage.size(), 1u);
  EXPECT_EQ(s.failed_edges.count(*base.find_edge("B", "T")), 1u);
  auto g = b.apply();
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "A"), 5.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "B"), 8.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "B", "T"), 0.0);
}

TEST(ScenarioBuilder, ErrorsSurfaceImmediately) {
  auto base = make_diamond();
  ScenarioBuilder b(base);
  EXPECT_THROW(b.leakage(1.0), InvalidScenario);
  EXPECT_THROW(b.leakage_percent(100), InvalidScenario);
  EXPECT_THROW(b.leak("B", "A", 0.1), InvalidScenario);
  EXPECT_THROW(b.fail("S", "T"), InvalidScenario);
  EXPECT_THROW(b.fail("S;A"), InvalidScenario);
  EXPECT_THROW(b.fail(EdgeId {42}), InvalidScenario);
  EXPECT_TRUE(b.scenario().failed_edges.empty());
}

TEST(ParseEdgeRef, Forms) {
  auto g = make_diamond();
  EXPECT_EQ(parse_edge_ref(g, "A,T"), *g.find_edge("A", "T"));
  EXPECT_EQ(parse_edge_ref(g, " A , B "), *g.find_edge("A", "B"));
  EXPECT_THROW((void)parse_edge_ref(g, "A"), InvalidScenario);
  EXPECT_THROW((void)parse_edge_ref(g, "A,B,T"), InvalidScenario);
  EXPECT_THROW((void)parse_edge_ref(g, "T,A"), InvalidScenario);
  EXPECT_THROW((void)parse_edge_ref(g, "X,Y"), InvalidScenario);
}

TEST(ScenarioBuilder, FailAllTakesSemicolonSeparatedPipes) {
  auto base = make_diamond();
  ScenarioBuilder b(base);
  b.fail_all(" A,T ; B,T;");
  const auto& failed = b.scenario().failed_edges;
  EXPECT_EQ(failed.size(), 2u);
  EXPECT_EQ(failed.count(*base.find_edge("A", "T")), 1u);
  EXPECT_EQ(failed.count(*base.find_edge("B", "T")), 1u);
  auto g = b.apply();
  EXPECT_DOUBLE_EQ(capacity_of(g, "A", "T"), 0.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "B", "T"), 0.0);
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "A"), 10.0);
}

TEST(ScenarioBuilder, FailAllSingleAndEmpty) {
  auto base = make_diamond();
  ScenarioBuilder b(base);
  b.fail_all("");
  EXPECT_TRUE(b.scenario().failed_edges.empty());
  b.fail_all("A,B");
  EXPECT_EQ(b.scenario().failed_edges.count(*base.find_edge("A", "B")), 1u);
}

TEST(ScenarioBuilder, FailAllIsAllOrNothing) {
  auto base = make_diamond();
  ScenarioBuilder b(base);
  // A comma-only list is not two pipes.
  EXPECT_THROW(b.fail_all("A,T,B,T"), InvalidScenario);
  EXPECT_THROW(b.fail_all("A,T;T,A"), InvalidScenario);
  EXPECT_THROW(b.fail_all("A;T"), InvalidScenario);
  EXPECT_TRUE(b.scenario().failed_edges.empty());
}
