#pragma once

#include <cmath>

namespace settleup::model {

// Role sums must match the expense total within this many currency units.
inline constexpr double kAmountTolerance = 0.01;

// Percentages further than this from 100 are rescaled before committing.
inline constexpr double kPercentTolerance = 0.1;

// Pairwise nets below this are not worth a transfer.
inline constexpr double kSettleThreshold = 0.01;

inline double Round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

inline bool NearlyEqual(double a, double b, double tolerance = kAmountTolerance) {
  // Small slack so that 99.99 vs 100.00 compares inside a 0.01 tolerance
  // despite binary rounding.
  return std::fabs(a - b) <= tolerance + 1e-9;
}

} // namespace settleup::model
