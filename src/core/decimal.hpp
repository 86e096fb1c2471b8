#pragma once

#include <cmath>

namespace lotledger::core {

constexpr int kMaxDecimals = 8;

/// Round half away from zero to a fixed number of decimal places.
inline double round_to(double value, int decimals) {
    if (decimals < 0) decimals = 0;
    if (decimals > kMaxDecimals) decimals = kMaxDecimals;
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

/// Collapse residuals below half a unit of the last kept place to zero,
/// and never return a negative amount.
inline double clamp_non_negative(double value, int decimals) {
    double eps = 0.5 * std::pow(10.0, -decimals);
    if (value < eps) return 0.0;
    return value;
}

}  // namespace lotledger::core
