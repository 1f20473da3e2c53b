#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "waternet/core/engine.hpp"
#include "waternet/core/error.hpp"
#include "waternet/core/network_io.hpp"
#include "test_utils.hpp"

using namespace waternet::core;
using namespace waternet::core::test;

namespace {

constexpr const char* kDiamondCsv =
    "u,v,capacity_mld\n"
    "S,A,10\n"
    "S,B,10\n"
    "A,T,10\n"
    "B,T,10\n"
    "A,B,5\n";

} // namespace

TEST(NetworkCsv, LoadsDiamond) {
  auto g = load_network_csv(kDiamondCsv);
  EXPECT_EQ(g.num_nodes(), 4);
  EXPECT_EQ(g.num_edges(), 5);
  EXPECT_EQ(g.node_name(g.source()), "S");
  EXPECT_EQ(g.node_name(g.sink()), "T");
  EXPECT_EQ(g.find_edge("A", "B").value_or(-1), 4);
  EXPECT_DOUBLE_EQ(run(g, AlgorithmKind::BlockingFlow).total_flow, 20.0);
}

TEST(NetworkCsv, ExtraColumnsWhitespaceAndBlankLines) {
  std::string text =
      "pipe_id, v , u ,capacity_mld,notes\n"
      "\n"
      "p1, R1 , S , 12.5 ,main\n"
      "p2,T,R1,4,\r\n"
      "\n";
  auto g = load_network_csv(text);
  EXPECT_EQ(g.num_edges(), 2);
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "R1"), 12.5);
  EXPECT_DOUBLE_EQ(capacity_of(g, "R1", "T"), 4.0);
}

TEST(NetworkCsv, TabDelimiterDetected) {
  auto g = load_network_csv("u\tv\tcapacity_mld\nS\tT\t3\n");
  EXPECT_DOUBLE_EQ(capacity_of(g, "S", "T"), 3.0);
}

TEST(NetworkCsv, CustomColumnsAndTerminals) {
  CsvOptions opts;
  opts.from_column = "from";
  opts.to_column = "to";
  opts.capacity_column = "cap";
  opts.source_name = "Reservoir";
  opts.sink_name = "City";
  opts.delimiter = ';';
  auto g = load_network_csv("from;to;cap\nReservoir;Pump;8\nPump;City;6\n", opts);
  EXPECT_EQ(g.node_name(g.source()), "Reservoir");
  EXPECT_EQ(g.node_name(g.sink()), "City");
  EXPECT_DOUBLE_EQ(run(g, AlgorithmKind::AugmentingPath).total_flow, 6.0);
}

TEST(NetworkCsv, DuplicatePipes) {
  const std::string text = "u,v,capacity_mld\nS,T,3\nS,T,4\n";
  EXPECT_THROW((void)load_network_csv(text), InvalidNetwork);
  CsvOptions merge;
  merge.merge_parallel = true;
  auto g = load_network_csv(text, merge);
  EXPECT_EQ(g.num_edges(), 1);
  EXPECT_DOUBLE_EQ(g.capacity_view()[0], 7.0);
}

TEST(NetworkCsv, MalformedInput) {
  EXPECT_THROW((void)load_network_csv(""), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v\nS,T\n"), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v,capacity_mld\nS,T\n"), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v,capacity_mld\nS,T,lots\n"), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v,capacity_mld\nS,T,-2\n"), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v,capacity_mld\nS,,2\n"), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v,capacity_mld\nS,A,2\n"), InvalidNetwork);
  EXPECT_THROW((void)load_network_csv("u,v,capacity_mld\nA,A,2\nS,T,1\n"), InvalidNetwork);
}

TEST(NetworkCsv, ErrorsCarryLineNumbers) {
  try {
    (void)load_network_csv("u,v,capacity_mld\nS,A,1\nA,T,x\n");
    FAIL() << "expected InvalidNetwork";
  } catch (const InvalidNetwork& e) {
    EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos) << e.what();
  }
}

TEST(NetworkCsv, MissingFile) {
  EXPECT_THROW((void)load_network_csv_file("/nonexistent/waternet/edges.csv"), std::runtime_error);
}
