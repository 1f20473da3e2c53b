/* Numeric defaults for flow computations. */
#pragma once

#include <cstdint>

namespace waternet::core {

// Residual capacity or excess at or below this is treated as zero.
inline constexpr double kDefaultTolerance = 1e-9;

// Safety net for runs that do not set their own budget.
inline constexpr std::int64_t kDefaultMaxIterations = 10'000'000;

} // namespace waternet::core
