#pragma once

/// @file quat.hpp
/// @brief Quaternion utility functions for impulse_math

#include "types.hpp"
#include "vec.hpp"
#include <cmath>

namespace impulse_math {

// =============================================================================
// Quaternion Construction
// =============================================================================

/// Create quaternion from axis and angle (radians)
[[nodiscard]] inline Quat quat_from_axis_angle(const Vec3& axis, float angle) noexcept {
    return glm::angleAxis(angle, glm::normalize(axis));
}

// =============================================================================
// Quaternion Operations
// =============================================================================

/// Normalize quaternion, returning identity if length is too small
[[nodiscard]] inline Quat normalize_or_identity(const Quat& q) noexcept {
    float len_sq = glm::length2(q);
    if (len_sq < consts::EPSILON * consts::EPSILON || !std::isfinite(len_sq)) {
        return quat::IDENTITY;
    }
    return q * (1.0f / std::sqrt(len_sq));
}

/// Get quaternion conjugate (inverse for unit quaternions)
[[nodiscard]] inline Quat conjugate(const Quat& q) noexcept {
    return glm::conjugate(q);
}

/// Rotate a vector by a quaternion
[[nodiscard]] inline Vec3 rotate(const Quat& q, const Vec3& v) noexcept {
    return q * v;
}

/// Rotate a vector by the inverse of a unit quaternion
[[nodiscard]] inline Vec3 inverse_rotate(const Quat& q, const Vec3& v) noexcept {
    return glm::conjugate(q) * v;
}

/// Rotation matrix of a unit quaternion
[[nodiscard]] inline Mat3 quat_to_mat3(const Quat& q) noexcept {
    return glm::mat3_cast(q);
}

[[nodiscard]] inline bool is_finite(const Quat& q) noexcept {
    return std::isfinite(q.x) && std::isfinite(q.y) && std::isfinite(q.z) && std::isfinite(q.w);
}

/// Advance an orientation by angular velocity over dt (first order), renormalized
/// @param q Current orientation
/// @param w Angular velocity (world space, rad/s)
/// @param dt Time step
[[nodiscard]] inline Quat integrate_rotation(const Quat& q, const Vec3& w, float dt) noexcept {
    Quat spin(0.0f, w.x * dt * 0.5f, w.y * dt * 0.5f, w.z * dt * 0.5f);
    Quat dq = spin * q;
    return normalize_or_identity(Quat(q.w + dq.w, q.x + dq.x, q.y + dq.y, q.z + dq.z));
}

/// Approximate equality (treats q and -q as equal)
[[nodiscard]] inline bool approx_equal(const Quat& a, const Quat& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return std::abs(glm::dot(a, b)) > 1.0f - epsilon;
}

} // namespace impulse_math
