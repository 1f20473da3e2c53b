/* Execution budget — iteration, deadline and cancellation checks. */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "waternet/core/options.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

// Created at the start of a run. Algorithms call tick() at the top of every
// iteration, before touching residual state, so a stop always leaves the
// state exactly as the previous iteration completed it.
class RunBudget {
public:
  explicit RunBudget(const RunOptions& opts);

  // Counts one iteration. Returns the stop reason if the run must end
  // instead of performing it.
  [[nodiscard]] std::optional<TerminationReason> tick();

  // Iterations actually performed.
  [[nodiscard]] std::int64_t iterations() const noexcept { return iterations_; }

private:
  std::int64_t max_iterations_ {0};
  const std::atomic<bool>* cancel_ {nullptr};
  std::optional<std::chrono::steady_clock::time_point> deadline_ {};
  std::int64_t iterations_ {0};
};

} // namespace waternet::core
