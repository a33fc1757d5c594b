#pragma once

/// @file vec.hpp
/// @brief Vector utility functions for impulse_math
///
/// Thin wrappers over GLM plus the 2D helpers the physics code
/// needs (perp-dot products, angle rotation).

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace impulse_math {

// =============================================================================
// Core Vector Operations (GLM wrappers)
// =============================================================================

/// Normalize a vector
template<typename T>
[[nodiscard]] inline T normalize(const T& v) noexcept {
    return glm::normalize(v);
}

/// Dot product of two vectors
template<typename T>
[[nodiscard]] inline auto dot(const T& a, const T& b) noexcept {
    return glm::dot(a, b);
}

/// Cross product of two Vec3 vectors
[[nodiscard]] inline Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
    return glm::cross(a, b);
}

/// Length of a vector
template<typename T>
[[nodiscard]] inline float length(const T& v) noexcept {
    return glm::length(v);
}

/// Squared length of a vector
template<typename T>
[[nodiscard]] inline float length_squared(const T& v) noexcept {
    return glm::length2(v);
}

// =============================================================================
// Vec2 Utilities
// =============================================================================

/// 2D cross product (z component of the 3D cross product)
[[nodiscard]] inline float cross(const Vec2& a, const Vec2& b) noexcept {
    return a.x * b.y - a.y * b.x;
}

/// Cross of a scalar (z axis) with a vector: w x r
[[nodiscard]] inline Vec2 cross(float w, const Vec2& r) noexcept {
    return Vec2(-w * r.y, w * r.x);
}

/// Get perpendicular vector (rotated 90 degrees counter-clockwise)
[[nodiscard]] inline Vec2 perpendicular(const Vec2& v) noexcept {
    return Vec2(-v.y, v.x);
}

/// Normalize, returning zero for near-zero input
[[nodiscard]] inline Vec2 normalize_or_zero(const Vec2& v) noexcept {
    float len_sq = glm::length2(v);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec2::ZERO;
    }
    return v / std::sqrt(len_sq);
}

/// Rotate a vector by an angle in radians
[[nodiscard]] inline Vec2 rotate(float angle, const Vec2& v) noexcept {
    float c = std::cos(angle);
    float s = std::sin(angle);
    return Vec2(c * v.x - s * v.y, s * v.x + c * v.y);
}

[[nodiscard]] inline bool is_finite(const Vec2& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

[[nodiscard]] inline Vec2 min(const Vec2& a, const Vec2& b) noexcept {
    return glm::min(a, b);
}

[[nodiscard]] inline Vec2 max(const Vec2& a, const Vec2& b) noexcept {
    return glm::max(a, b);
}

[[nodiscard]] inline Vec2 abs(const Vec2& v) noexcept {
    return glm::abs(v);
}

// =============================================================================
// Vec3 Utilities
// =============================================================================

/// Normalize, returning zero for near-zero input
[[nodiscard]] inline Vec3 normalize_or_zero(const Vec3& v) noexcept {
    float len_sq = glm::length2(v);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }
    return v / std::sqrt(len_sq);
}

[[nodiscard]] inline Vec3 min(const Vec3& a, const Vec3& b) noexcept {
    return glm::min(a, b);
}

[[nodiscard]] inline Vec3 max(const Vec3& a, const Vec3& b) noexcept {
    return glm::max(a, b);
}

[[nodiscard]] inline Vec3 abs(const Vec3& v) noexcept {
    return glm::abs(v);
}

[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Largest component
[[nodiscard]] inline float max_component(const Vec3& v) noexcept {
    return std::max({v.x, v.y, v.z});
}

/// Unit vector perpendicular to a unit normal
[[nodiscard]] inline Vec3 any_perpendicular(const Vec3& n) noexcept {
    if (std::abs(n.x) > 0.9f) {
        return glm::normalize(glm::cross(n, vec3::Y));
    }
    return glm::normalize(glm::cross(n, vec3::X));
}

// =============================================================================
// Scalar Utilities
// =============================================================================

[[nodiscard]] inline bool is_finite(float v) noexcept {
    return std::isfinite(v);
}

/// Wrap an angle into (-PI, PI]
[[nodiscard]] inline float wrap_angle(float angle) noexcept {
    float wrapped = std::remainder(angle, consts::TAU);
    if (wrapped <= -consts::PI) {
        wrapped += consts::TAU;
    }
    return wrapped;
}

/// Approximate equality within an absolute tolerance
template<typename T>
[[nodiscard]] inline bool approx_equal(const T& a, const T& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return glm::all(glm::lessThanEqual(glm::abs(a - b), T(epsilon)));
}

} // namespace impulse_math
