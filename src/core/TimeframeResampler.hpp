#pragma once

#include <vector>

#include "domain/Types.hpp"

namespace core {

// Aggregates strictly increasing 1-minute bars into UTC-aligned windows of `target`.
// Empty windows produce no bar. Throws std::invalid_argument on unordered or duplicated
// input and fxb::ConfigurationError for an unsupported target.
std::vector<domain::Bar> resample(const std::vector<domain::Bar>& minuteBars, const domain::Timeframe& target);

}  // namespace core
