/* Scenario perturbations — leakage derating and pipe failure. */
#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

#include "waternet/core/flow_network.hpp"
#include "waternet/core/types.hpp"

namespace waternet::core {

// Perturbation of a base network. Effective capacity of edge e:
//   0                                   if e is in failed_edges
//   capacity * (1 - edge_leakage[e])    if e has an override
//   capacity * (1 - default_leakage)    otherwise
// Leakage fractions must lie in [0, 1).
struct Scenario {
  double default_leakage {0.0};
  std::map<EdgeId, double> edge_leakage;
  std::set<EdgeId> failed_edges;
};

// Pure: returns a new network with identical topology, ids, names and edge
// order and recomputed capacities; `base` is untouched. Failed edges stay in
// the topology with capacity 0. Throws InvalidScenario.
[[nodiscard]] FlowNetwork apply_scenario(const FlowNetwork& base, const Scenario& scenario);

// Resolves "u,v" (whitespace tolerated) to the edge u->v of g.
// Throws InvalidScenario when malformed or when no such pipe exists.
[[nodiscard]] EdgeId parse_edge_ref(const FlowNetwork& g, std::string_view ref);

// Assembles a Scenario against a base network using node names. The builder
// keeps a reference to `base`; it must outlive the builder.
class ScenarioBuilder {
public:
  explicit ScenarioBuilder(const FlowNetwork& base) : base_(&base) {}

  ScenarioBuilder& leakage(double fraction);
  ScenarioBuilder& leakage_percent(double percent);
  ScenarioBuilder& leak(std::string_view from, std::string_view to, double fraction);
  ScenarioBuilder& leak(EdgeId e, double fraction);
  ScenarioBuilder& fail(std::string_view from, std::string_view to);
  ScenarioBuilder& fail(std::string_view ref);
  ScenarioBuilder& fail(EdgeId e);
  // Fails every pipe of a ';'-separated list such as "R2,T; A,B". Empty
  // entries are skipped. All refs are resolved before any is recorded.
  ScenarioBuilder& fail_all(std::string_view refs);

  [[nodiscard]] const Scenario& scenario() const noexcept { return scenario_; }
  // Shorthand for apply_scenario(base, scenario()).
  [[nodiscard]] FlowNetwork apply() const;

private:
  EdgeId resolve(std::string_view from, std::string_view to) const;

  const FlowNetwork* base_ {nullptr};
  Scenario scenario_ {};
};

} // namespace waternet::core
