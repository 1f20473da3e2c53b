#pragma once

#include <stdexcept>
#include <string>

namespace waternet::core {

// Network description rejected at construction (missing or duplicate
// source/sink, negative or non-finite capacity, self-loop, parallel edge).
struct InvalidNetwork : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Scenario rejected at application (leakage outside [0,1), unknown edge).
struct InvalidScenario : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// A run produced flow, residual or excess values outside tolerance in a
// direction the flow invariants forbid. Only the offending run is aborted.
struct NumericInstability : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace waternet::core
