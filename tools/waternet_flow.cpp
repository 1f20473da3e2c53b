/*
  waternet_flow — command-line driver for the flow engine.

  Loads a pipe list, optionally applies leakage and pipe failures, runs one
  max-flow variant and prints the flow value, the bottleneck (min cut) and,
  on request, the flow paths and the execution trace.

    waternet_flow --edges=data/edges.csv --algorithm=dinic \
        --leakage_percent=10 --fail='R2,T;A,B' --paths
*/
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include "waternet/core/engine.hpp"
#include "waternet/core/error.hpp"
#include "waternet/core/flow_analysis.hpp"
#include "waternet/core/network_io.hpp"
#include "waternet/core/scenario.hpp"

ABSL_FLAG(std::string, edges, "", "CSV pipe list with columns u, v, capacity_mld.");
ABSL_FLAG(std::string, algorithm, "edmonds-karp", "edmonds-karp, dinic or push-relabel.");
ABSL_FLAG(double, leakage_percent, 0.0, "Uniform leakage applied to every pipe, in [0, 100).");
ABSL_FLAG(std::string, fail, "", "Failed pipes as u,v; separate several with ';' (e.g. \"R2,T;A,B\").");
ABSL_FLAG(std::string, source, "S", "Name of the source node.");
ABSL_FLAG(std::string, sink, "T", "Name of the sink node.");
ABSL_FLAG(bool, merge_parallel, false, "Sum capacities of repeated pipes instead of rejecting them.");
ABSL_FLAG(int64_t, max_iterations, waternet::core::kDefaultMaxIterations,
          "Iteration budget; 0 disables it.");
ABSL_FLAG(double, tolerance, waternet::core::kDefaultTolerance, "Numeric tolerance.");
ABSL_FLAG(int64_t, time_limit_ms, 0, "Wall-clock limit per run; 0 disables it.");
ABSL_FLAG(bool, trace, false, "Print the algorithm's event log.");
ABSL_FLAG(bool, paths, false, "Print the source-to-sink flow paths.");
ABSL_FLAG(bool, compare, false, "Run all three algorithms and compare their values.");

namespace waternet::core {
namespace {

void print_result(const FlowResult& r) {
  std::cout << absl::StrFormat("Max flow = %.2f MLD (%s, %d iterations, %s)\n",
                               r.total_flow, to_string(r.algorithm), r.iterations,
                               to_string(r.termination));
}

int run_main() {
  const std::string path = absl::GetFlag(FLAGS_edges);
  if (path.empty()) {
    LOG(ERROR) << "Please specify the pipe list via --edges=...";
    return 2;
  }
  CsvOptions csv;
  csv.source_name = absl::GetFlag(FLAGS_source);
  csv.sink_name = absl::GetFlag(FLAGS_sink);
  csv.merge_parallel = absl::GetFlag(FLAGS_merge_parallel);
  FlowNetwork base = load_network_csv_file(path, csv);

  ScenarioBuilder scenario(base);
  scenario.leakage_percent(absl::GetFlag(FLAGS_leakage_percent));
  scenario.fail_all(absl::GetFlag(FLAGS_fail));
  FlowNetwork g = scenario.apply();

  RunOptions opts;
  opts.max_iterations = absl::GetFlag(FLAGS_max_iterations);
  opts.tolerance = absl::GetFlag(FLAGS_tolerance);
  opts.trace = absl::GetFlag(FLAGS_trace);
  if (const auto ms = absl::GetFlag(FLAGS_time_limit_ms); ms > 0) {
    opts.time_limit = std::chrono::milliseconds(ms);
  }

  if (absl::GetFlag(FLAGS_compare)) {
    for (const auto& r : compare_algorithms(g, opts)) print_result(r);
    return 0;
  }

  const FlowResult result = run(g, parse_algorithm(absl::GetFlag(FLAGS_algorithm)), opts);
  print_result(result);

  if (opts.trace) {
    std::cout << "\nTrace (" << result.trace.size() << " events)\n";
    for (const auto& ev : result.trace) std::cout << "  " << describe(g, ev) << "\n";
  }

  if (absl::GetFlag(FLAGS_paths)) {
    auto dec = decompose_flow(g, result.edge_flows, g.source(), g.sink(), result.tolerance);
    std::cout << "\nFlow paths (" << g.node_name(g.source()) << " -> "
              << g.node_name(g.sink()) << ")\n";
    if (dec.paths.empty()) std::cout << "  none\n";
    for (const auto& p : dec.paths) {
      std::vector<std::string> names;
      names.reserve(p.nodes.size());
      for (auto v : p.nodes) names.push_back(g.node_name(v));
      std::cout << absl::StrFormat("  %-40s %10.2f\n", absl::StrJoin(names, " -> "), p.amount);
    }
  }

  const MinCut cut = extract_min_cut(g, result);
  std::cout << "\nMin-cut report\n";
  if (!cut.separating) std::cout << "  run stopped early; the sink is still reachable\n";
  if (cut.edges.empty()) std::cout << "  no bottlenecks detected\n";
  for (auto e : cut.edges) {
    std::cout << absl::StrFormat("  %-20s %10.2f\n", g.edge_label(e),
                                 g.capacity_view()[static_cast<std::size_t>(e)]);
  }
  std::cout << absl::StrFormat("  total capacity %.2f\n", cut.capacity);
  return 0;
}

} // namespace
} // namespace waternet::core

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage("Max flow / min cut on a water distribution network.");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  try {
    return waternet::core::run_main();
  } catch (const waternet::core::InvalidNetwork& e) {
    LOG(ERROR) << "invalid network: " << e.what();
  } catch (const waternet::core::InvalidScenario& e) {
    LOG(ERROR) << "invalid scenario: " << e.what();
  } catch (const waternet::core::NumericInstability& e) {
    LOG(ERROR) << "numeric instability: " << e.what();
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
  }
  return 1;
}
