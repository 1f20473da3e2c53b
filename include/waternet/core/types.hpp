/* Core type aliases and enums shared by the flow engine.
 *
 * - NodeId/EdgeId: int32 indices assigned at FlowNetwork construction
 * - Cap/Flow: double (capacities may be derated by leakage, so not integral)
 * - ArcId: residual arc index; arc 2*e is edge e forward, 2*e+1 its reverse
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace waternet::core {

using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using ArcId  = std::int32_t;
using Cap    = double;  // Edge capacity (e.g. million litres per day)
using Flow   = double;  // Flow amount (same unit as capacity)

enum class NodeRole : std::uint8_t {
  Intermediate = 0,
  Source = 1,
  Sink = 2
};

// Max-flow algorithm variants.
enum class AlgorithmKind : std::uint8_t {
  AugmentingPath = 1,  // Edmonds-Karp: BFS shortest augmenting paths
  BlockingFlow = 2,    // Dinic: level graph + blocking flow per phase
  PreflowPush = 3      // Goldberg-Tarjan push-relabel, FIFO active nodes
};

// Why a run stopped. Anything other than Converged means the flow is valid
// but not proven maximal.
enum class TerminationReason : std::uint8_t {
  Converged = 0,
  BudgetExceeded = 1,  // iteration budget or time limit reached
  Cancelled = 2        // caller raised the cancellation flag
};

[[nodiscard]] constexpr ArcId forward_arc(EdgeId e) noexcept { return 2 * e; }
[[nodiscard]] constexpr ArcId reverse_arc(EdgeId e) noexcept { return 2 * e + 1; }
[[nodiscard]] constexpr EdgeId arc_edge(ArcId a) noexcept { return a >> 1; }
[[nodiscard]] constexpr bool is_forward_arc(ArcId a) noexcept { return (a & 1) == 0; }
[[nodiscard]] constexpr ArcId opposite_arc(ArcId a) noexcept { return a ^ 1; }

[[nodiscard]] std::string_view to_string(NodeRole role) noexcept;
[[nodiscard]] std::string_view to_string(AlgorithmKind kind) noexcept;
[[nodiscard]] std::string_view to_string(TerminationReason reason) noexcept;

} // namespace waternet::core
