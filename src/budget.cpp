#include "waternet/core/budget.hpp"

namespace waternet::core {

RunBudget::RunBudget(const RunOptions& opts)
  : max_iterations_(opts.max_iterations), cancel_(opts.cancel) {
  if (opts.time_limit.has_value()) {
    deadline_ = std::chrono::steady_clock::now() + *opts.time_limit;
  }
}

std::optional<TerminationReason> RunBudget::tick() {
  if (cancel_ != nullptr && cancel_->load(std::memory_order_relaxed)) {
    return TerminationReason::Cancelled;
  }
  if (max_iterations_ > 0 && iterations_ >= max_iterations_) {
    return TerminationReason::BudgetExceeded;
  }
  if (deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_) {
    return TerminationReason::BudgetExceeded;
  }
  ++iterations_;
  return std::nullopt;
}

} // namespace waternet::core
