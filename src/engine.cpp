/*
  Engine façade — single runs and concurrent comparisons/sweeps.

  Each concurrent task owns its algorithm run (and therefore its residual
  arena); the only shared object is the immutable input network.
*/
#include "waternet/core/engine.hpp"
#include "waternet/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>
#include <thread>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace waternet::core {

FlowResult run(const FlowNetwork& g, AlgorithmKind algorithm, const RunOptions& opts) {
  return make_algorithm(algorithm)->run(g, g.source(), g.sink(), opts);
}

std::vector<FlowResult> compare_algorithms(const FlowNetwork& g, const RunOptions& opts) {
  RunOptions task_opts = opts;
  task_opts.trace_sink = nullptr;
  std::vector<std::future<FlowResult>> pending;
  pending.reserve(kAllAlgorithms.size());
  for (auto kind : kAllAlgorithms) {
    pending.push_back(std::async(std::launch::async, [&g, kind, task_opts]() {
      return run(g, kind, task_opts);
    }));
  }
  std::vector<FlowResult> out;
  out.reserve(pending.size());
  // A failed task rethrows from get(); unwinding then joins the others.
  for (auto& f : pending) out.push_back(f.get());
  VLOG(1) << "compare: edmonds-karp " << out[0].total_flow << ", dinic "
          << out[1].total_flow << ", push-relabel " << out[2].total_flow;
  return out;
}

std::vector<FlowResult> sweep_leakage(const FlowNetwork& base,
                                      std::span<const double> fractions,
                                      AlgorithmKind algorithm,
                                      const RunOptions& opts) {
  for (double f : fractions) {
    if (!std::isfinite(f) || f < 0.0 || f >= 1.0) {
      throw InvalidScenario(absl::StrCat("sweep leakage must be in [0, 1), got ", f));
    }
  }
  RunOptions task_opts = opts;
  task_opts.trace_sink = nullptr;
  // At most one batch of derived networks and runs is alive at a time.
  const std::size_t width = std::max(1u, std::thread::hardware_concurrency());
  std::vector<FlowResult> out;
  out.reserve(fractions.size());
  for (std::size_t begin = 0; begin < fractions.size(); begin += width) {
    const std::size_t end = std::min(fractions.size(), begin + width);
    std::vector<std::future<FlowResult>> pending;
    pending.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
      pending.push_back(std::async(std::launch::async, [&base, f = fractions[i], algorithm, task_opts]() {
        Scenario s;
        s.default_leakage = f;
        const FlowNetwork g = apply_scenario(base, s);
        return run(g, algorithm, task_opts);
      }));
    }
    for (auto& p : pending) out.push_back(p.get());
  }
  VLOG(1) << "sweep: " << fractions.size() << " runs in batches of " << width;
  return out;
}

AlgorithmKind parse_algorithm(std::string_view name) {
  std::string n = absl::AsciiStrToLower(name);
  if (n == "edmonds-karp" || n == "augmenting-path" || n == "ek") return AlgorithmKind::AugmentingPath;
  if (n == "dinic" || n == "blocking-flow") return AlgorithmKind::BlockingFlow;
  if (n == "push-relabel" || n == "preflow-push" || n == "pr") return AlgorithmKind::PreflowPush;
  throw std::invalid_argument(absl::StrCat("unknown algorithm '", name, "'"));
}

} // namespace waternet::core
