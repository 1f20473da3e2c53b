#include "waternet/core/types.hpp"

namespace waternet::core {

std::string_view to_string(NodeRole role) noexcept {
  switch (role) {
    case NodeRole::Source: return "source";
    case NodeRole::Sink: return "sink";
    case NodeRole::Intermediate: break;
  }
  return "intermediate";
}

std::string_view to_string(AlgorithmKind kind) noexcept {
  switch (kind) {
    case AlgorithmKind::AugmentingPath: return "edmonds-karp";
    case AlgorithmKind::BlockingFlow: return "dinic";
    case AlgorithmKind::PreflowPush: return "push-relabel";
  }
  return "unknown";
}

std::string_view to_string(TerminationReason reason) noexcept {
  switch (reason) {
    case TerminationReason::Converged: return "converged";
    case TerminationReason::BudgetExceeded: return "budget_exceeded";
    case TerminationReason::Cancelled: return "cancelled";
  }
  return "unknown";
}

} // namespace waternet::core
