/*
  Trace helpers — sequence stamping and human-readable event rendering.
*/
#include "waternet/core/trace.hpp"
#include "waternet/core/flow_network.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace waternet::core {

void TraceChannel::emit(AlgorithmEvent ev) {
  if (!enabled()) return;
  ev.sequence = next_++;
  if (primary_ != nullptr) primary_->record(ev);
  if (secondary_ != nullptr) secondary_->record(ev);
}

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::PhaseStart: return "phase";
    case EventKind::PathFound: return "path";
    case EventKind::Push: return "push";
    case EventKind::Relabel: return "relabel";
  }
  return "unknown";
}

std::string describe(const FlowNetwork& g, const AlgorithmEvent& ev) {
  std::string out = absl::StrCat("#", ev.sequence, " ", to_string(ev.kind));
  switch (ev.kind) {
    case EventKind::PhaseStart:
      absl::StrAppend(&out, " iteration=", ev.iteration, " sink_level=", ev.level);
      break;
    case EventKind::PathFound: {
      std::string path;
      for (std::size_t i = 0; i < ev.arcs.size(); ++i) {
        if (i == 0) path = g.node_name(g.arc_tail(ev.arcs[i]));
        absl::StrAppend(&path, "->", g.node_name(g.arc_head(ev.arcs[i])));
      }
      absl::StrAppend(&out, " ", path, absl::StrFormat(" amount=%g total=%g", ev.amount, ev.total_flow));
      break;
    }
    case EventKind::Push:
      absl::StrAppend(&out, " ", g.node_name(ev.node), "->", g.node_name(ev.target),
                      absl::StrFormat(" amount=%g", ev.amount));
      break;
    case EventKind::Relabel:
      absl::StrAppend(&out, " ", g.node_name(ev.node), " height=", ev.level);
      break;
  }
  return out;
}

} // namespace waternet::core
