/* Run configuration shared by every max-flow variant. */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

#include "waternet/core/constants.hpp"

namespace waternet::core {

class TraceSink;

struct RunOptions {
  // Iteration budget: augmentations (AugmentingPath), phases (BlockingFlow)
  // or active-node discharges (PreflowPush). 0 disables the budget.
  std::int64_t max_iterations {kDefaultMaxIterations};
  // Residual capacities and excesses at or below this count as zero.
  double tolerance {kDefaultTolerance};
  // Collect AlgorithmEvents into FlowResult::trace.
  bool trace {false};
  // Wall-clock limit measured from the start of the run.
  std::optional<std::chrono::milliseconds> time_limit {};
  // Cooperative cancellation: polled at the top of each iteration. Not owned.
  const std::atomic<bool>* cancel {nullptr};
  // Additional event sink. Not owned; must outlive the run.
  TraceSink* trace_sink {nullptr};
};

} // namespace waternet::core
