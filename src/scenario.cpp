/*
  Scenario application — derive a perturbed FlowNetwork from a base one.
*/
#include "waternet/core/scenario.hpp"
#include "waternet/core/error.hpp"

#include <cmath>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace waternet::core {

namespace {

void check_fraction(double f, std::string_view what) {
  if (!std::isfinite(f) || f < 0.0 || f >= 1.0) {
    throw InvalidScenario(absl::StrCat(what, " leakage must be in [0, 1), got ", f));
  }
}

void check_edge(const FlowNetwork& g, EdgeId e) {
  if (e < 0 || e >= g.num_edges()) {
    throw InvalidScenario(absl::StrCat("scenario references nonexistent edge id ", e));
  }
}

} // namespace

FlowNetwork apply_scenario(const FlowNetwork& base, const Scenario& scenario) {
  check_fraction(scenario.default_leakage, "default");
  for (const auto& [e, f] : scenario.edge_leakage) {
    check_edge(base, e);
    check_fraction(f, absl::StrCat("edge ", base.edge_label(e)));
  }
  for (auto e : scenario.failed_edges) check_edge(base, e);

  auto cap = base.capacity_view();
  std::vector<Cap> derived(cap.begin(), cap.end());
  for (std::size_t i = 0; i < derived.size(); ++i) {
    auto it = scenario.edge_leakage.find(static_cast<EdgeId>(i));
    double f = (it != scenario.edge_leakage.end()) ? it->second : scenario.default_leakage;
    if (f != 0.0) derived[i] = cap[i] * (1.0 - f);
  }
  for (auto e : scenario.failed_edges) derived[static_cast<std::size_t>(e)] = 0.0;

  VLOG(1) << "scenario: default leakage " << scenario.default_leakage << ", "
          << scenario.edge_leakage.size() << " overrides, "
          << scenario.failed_edges.size() << " failed edges";
  return base.with_capacities(std::move(derived));
}

EdgeId parse_edge_ref(const FlowNetwork& g, std::string_view ref) {
  std::vector<std::string_view> parts = absl::StrSplit(ref, ',');
  if (parts.size() != 2) {
    throw InvalidScenario(absl::StrCat("pipe reference must look like 'u,v', got '", ref, "'"));
  }
  auto from = absl::StripAsciiWhitespace(parts[0]);
  auto to = absl::StripAsciiWhitespace(parts[1]);
  auto e = g.find_edge(from, to);
  if (!e) {
    throw InvalidScenario(absl::StrCat("no pipe ", from, "->", to, " in network"));
  }
  return *e;
}

ScenarioBuilder& ScenarioBuilder::leakage(double fraction) {
  check_fraction(fraction, "default");
  scenario_.default_leakage = fraction;
  return *this;
}

ScenarioBuilder& ScenarioBuilder::leakage_percent(double percent) {
  return leakage(percent / 100.0);
}

ScenarioBuilder& ScenarioBuilder::leak(std::string_view from, std::string_view to, double fraction) {
  return leak(resolve(from, to), fraction);
}

ScenarioBuilder& ScenarioBuilder::leak(EdgeId e, double fraction) {
  check_edge(*base_, e);
  check_fraction(fraction, absl::StrCat("edge ", base_->edge_label(e)));
  scenario_.edge_leakage[e] = fraction;
  return *this;
}

ScenarioBuilder& ScenarioBuilder::fail(std::string_view from, std::string_view to) {
  return fail(resolve(from, to));
}

ScenarioBuilder& ScenarioBuilder::fail(std::string_view ref) {
  return fail(parse_edge_ref(*base_, ref));
}

ScenarioBuilder& ScenarioBuilder::fail(EdgeId e) {
  check_edge(*base_, e);
  scenario_.failed_edges.insert(e);
  return *this;
}

ScenarioBuilder& ScenarioBuilder::fail_all(std::string_view refs) {
  std::vector<EdgeId> failed;
  for (absl::string_view ref : absl::StrSplit(refs, ';')) {
    ref = absl::StripAsciiWhitespace(ref);
    if (ref.empty()) continue;
    failed.push_back(parse_edge_ref(*base_, ref));
  }
  scenario_.failed_edges.insert(failed.begin(), failed.end());
  return *this;
}

FlowNetwork ScenarioBuilder::apply() const {
  return apply_scenario(*base_, scenario_);
}

EdgeId ScenarioBuilder::resolve(std::string_view from, std::string_view to) const {
  auto e = base_->find_edge(from, to);
  if (!e) {
    throw InvalidScenario(absl::StrCat("no pipe ", from, "->", to, " in network"));
  }
  return *e;
}

} // namespace waternet::core
