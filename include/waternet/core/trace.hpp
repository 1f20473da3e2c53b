/* Execution trace — observational side channel for algorithm runs. */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "waternet/core/types.hpp"

namespace waternet::core {

class FlowNetwork;

enum class EventKind : std::uint8_t {
  PhaseStart = 1,  // BlockingFlow: a new level graph reached the sink
  PathFound = 2,   // an augmenting path was found and flow pushed along it
  Push = 3,        // PreflowPush: excess moved along one residual arc
  Relabel = 4      // PreflowPush: a node's height increased
};

// One algorithmic step. Fields not meaningful for a kind keep their defaults.
struct AlgorithmEvent {
  std::int64_t sequence {0};    // 0-based position in the run's event stream
  EventKind kind {EventKind::PathFound};
  std::int64_t iteration {0};   // iteration counter of the run when emitted
  NodeId node {-1};             // Push: tail; Relabel: relabelled node
  NodeId target {-1};           // Push: head
  std::vector<ArcId> arcs {};   // PathFound: source->sink arcs; Push: the arc
  Flow amount {0.0};            // PathFound/Push: amount moved
  Flow total_flow {0.0};        // PathFound: flow value after augmenting
  std::int32_t level {-1};      // PhaseStart: sink level; Relabel: new height
};

// Injectable sink with a single operation. Implementations must not throw
// into the algorithm in a way that alters its results.
class TraceSink {
public:
  virtual ~TraceSink() noexcept = default;
  virtual void record(const AlgorithmEvent& ev) = 0;
};

// Discards every event; a run with it is indistinguishable from one without.
class NullTraceSink final : public TraceSink {
public:
  void record(const AlgorithmEvent&) override {}
};

// Collects events in arrival order.
class TraceRecorder final : public TraceSink {
public:
  void record(const AlgorithmEvent& ev) override { events_.push_back(ev); }
  [[nodiscard]] std::span<const AlgorithmEvent> events() const noexcept { return events_; }
  [[nodiscard]] std::vector<AlgorithmEvent> take() noexcept { return std::move(events_); }
  void clear() noexcept { events_.clear(); }

private:
  std::vector<AlgorithmEvent> events_;
};

// Per-run dispatcher used by the algorithms: stamps sequence numbers and
// forwards to up to two sinks (the run's own recorder and an injected one).
// Does nothing when both are null.
class TraceChannel {
public:
  TraceChannel(TraceSink* primary, TraceSink* secondary) noexcept
      : primary_(primary), secondary_(secondary) {}

  [[nodiscard]] bool enabled() const noexcept { return primary_ != nullptr || secondary_ != nullptr; }
  void emit(AlgorithmEvent ev);

private:
  TraceSink* primary_ {nullptr};
  TraceSink* secondary_ {nullptr};
  std::int64_t next_ {0};
};

[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;

// Renders one event as a log line, e.g. "#3 path S->A->T amount=5 total=15".
[[nodiscard]] std::string describe(const FlowNetwork& g, const AlgorithmEvent& ev);

} // namespace waternet::core
