#pragma once

/// @file constants.hpp
/// @brief Mathematical constants for impulse_math

#include <cmath>
#include <limits>

namespace impulse_math {

/// Mathematical constants
namespace consts {

/// Pi (π)
inline constexpr float PI = 3.14159265358979323846f;

/// Tau (2π)
inline constexpr float TAU = 6.28318530717958647692f;

/// Half Pi (π/2)
inline constexpr float FRAC_PI_2 = 1.57079632679489661923f;

/// Small epsilon for floating point comparisons
inline constexpr float EPSILON = 1e-6f;

/// Larger epsilon for less precise comparisons
inline constexpr float EPSILON_LOOSE = 1e-4f;

/// Infinity
inline constexpr float INFINITY_F = std::numeric_limits<float>::infinity();

/// Maximum float value
inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();

} // namespace consts

} // namespace impulse_math
