/*
  Engine façade — the entry points the dashboard layer is allowed to call.

  Together with extract_min_cut (min_cut.hpp) and apply_scenario
  (scenario.hpp) these are the only calls the dashboard layer makes. All take
  immutable inputs and return fresh values; concurrent calls on a shared
  FlowNetwork are safe.
*/
#pragma once

#include <array>
#include <span>
#include <string_view>
#include <vector>

#include "waternet/core/flow_network.hpp"
#include "waternet/core/max_flow.hpp"
#include "waternet/core/min_cut.hpp"
#include "waternet/core/options.hpp"
#include "waternet/core/scenario.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

// Max flow from the network's source to its sink.
[[nodiscard]] FlowResult run(const FlowNetwork& g, AlgorithmKind algorithm,
                             const RunOptions& opts = {});

inline constexpr std::array<AlgorithmKind, 3> kAllAlgorithms {
  AlgorithmKind::AugmentingPath, AlgorithmKind::BlockingFlow, AlgorithmKind::PreflowPush
};

// Runs the three variants concurrently on g; results in kAllAlgorithms order.
// opts.trace_sink is not forwarded (sinks are not shared across threads).
[[nodiscard]] std::vector<FlowResult> compare_algorithms(const FlowNetwork& g,
                                                         const RunOptions& opts = {});

// For each fraction, applies a uniform leakage scenario to `base` and runs
// `algorithm`, concurrently in batches of std::thread::hardware_concurrency()
// runs; results keep input order. Throws InvalidScenario
// before starting any run if a fraction is outside [0, 1).
[[nodiscard]] std::vector<FlowResult> sweep_leakage(const FlowNetwork& base,
                                                    std::span<const double> fractions,
                                                    AlgorithmKind algorithm,
                                                    const RunOptions& opts = {});

// Parses "edmonds-karp"/"dinic"/"push-relabel" (also "augmenting-path",
// "blocking-flow", "preflow-push"). Throws std::invalid_argument.
[[nodiscard]] AlgorithmKind parse_algorithm(std::string_view name);

} // namespace waternet::core
