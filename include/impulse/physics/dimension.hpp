#pragma once

/// @file dimension.hpp
/// @brief Dimension traits for impulse_physics
///
/// Dim2 and Dim3 bundle the vector, rotation, angular-velocity and inertia
/// types of a world dimension together with the handful of operations whose
/// form differs between 2D and 3D. Every pipeline stage is a template over
/// one of these traits.

#include "fwd.hpp"

#include <impulse/math/math.hpp>

#include <algorithm>
#include <cmath>

namespace impulse_physics {

// =============================================================================
// Dim2
// =============================================================================

/// Planar world: angle rotations, scalar angular velocity and inertia
struct Dim2 {
    static constexpr int k_dimension = 2;

    using Vector = impulse_math::Vec2;
    using Rotation = float;             ///< Angle in radians
    using AngularVelocity = float;      ///< rad/s about +Z
    using InverseInertia = float;       ///< Scalar about +Z
    using Bounds = impulse_math::AABB2;

    [[nodiscard]] static Vector zero_vector() noexcept { return Vector(0.0f); }
    [[nodiscard]] static Rotation identity_rotation() noexcept { return 0.0f; }
    [[nodiscard]] static AngularVelocity zero_angular() noexcept { return 0.0f; }
    [[nodiscard]] static InverseInertia zero_inertia() noexcept { return 0.0f; }

    /// Drop the Z component of a 3D vector
    [[nodiscard]] static Vector from_vec3(const impulse_math::Vec3& v) noexcept {
        return Vector(v.x, v.y);
    }

    [[nodiscard]] static Vector rotate(Rotation angle, const Vector& v) noexcept {
        return impulse_math::rotate(angle, v);
    }

    [[nodiscard]] static Vector inverse_rotate(Rotation angle, const Vector& v) noexcept {
        return impulse_math::rotate(-angle, v);
    }

    /// Torque of an impulse j applied at lever arm r
    [[nodiscard]] static AngularVelocity cross(const Vector& r, const Vector& j) noexcept {
        return impulse_math::cross(r, j);
    }

    /// Linear velocity of a point at lever arm r: w x r
    [[nodiscard]] static Vector angular_cross(AngularVelocity w, const Vector& r) noexcept {
        return impulse_math::cross(w, r);
    }

    /// Apply the world-space inverse inertia to an angular quantity
    [[nodiscard]] static AngularVelocity apply_inverse_inertia(InverseInertia local_inv,
                                                              Rotation /*rotation*/,
                                                              AngularVelocity torque) noexcept {
        return local_inv * torque;
    }

    [[nodiscard]] static float angular_dot(AngularVelocity a, AngularVelocity b) noexcept {
        return a * b;
    }

    /// theta += w * dt, wrapped into (-PI, PI]
    [[nodiscard]] static Rotation integrate_rotation(Rotation angle, AngularVelocity w, float dt) noexcept {
        return impulse_math::wrap_angle(angle + w * dt);
    }

    [[nodiscard]] static AngularVelocity clamp_angular(AngularVelocity w, float max_speed) noexcept {
        return std::clamp(w, -max_speed, max_speed);
    }

    [[nodiscard]] static bool is_finite(const Vector& v) noexcept { return impulse_math::is_finite(v); }
    [[nodiscard]] static bool is_finite_rotation(Rotation r) noexcept { return std::isfinite(r); }
    [[nodiscard]] static bool is_finite_angular(AngularVelocity w) noexcept { return std::isfinite(w); }
    [[nodiscard]] static bool is_finite_inertia(InverseInertia i) noexcept { return std::isfinite(i) && i >= 0.0f; }
};

// =============================================================================
// Dim3
// =============================================================================

/// Spatial world: quaternion rotations, vector angular velocity, tensor inertia
struct Dim3 {
    static constexpr int k_dimension = 3;

    using Vector = impulse_math::Vec3;
    using Rotation = impulse_math::Quat;
    using AngularVelocity = impulse_math::Vec3;
    using InverseInertia = impulse_math::Mat3;  ///< Local (body) frame
    using Bounds = impulse_math::AABB;

    [[nodiscard]] static Vector zero_vector() noexcept { return Vector(0.0f); }
    [[nodiscard]] static Rotation identity_rotation() noexcept { return impulse_math::quat::IDENTITY; }
    [[nodiscard]] static AngularVelocity zero_angular() noexcept { return Vector(0.0f); }
    [[nodiscard]] static InverseInertia zero_inertia() noexcept { return impulse_math::Mat3(0.0f); }

    [[nodiscard]] static Vector from_vec3(const impulse_math::Vec3& v) noexcept { return v; }

    [[nodiscard]] static Vector rotate(const Rotation& q, const Vector& v) noexcept {
        return impulse_math::rotate(q, v);
    }

    [[nodiscard]] static Vector inverse_rotate(const Rotation& q, const Vector& v) noexcept {
        return impulse_math::inverse_rotate(q, v);
    }

    [[nodiscard]] static AngularVelocity cross(const Vector& r, const Vector& j) noexcept {
        return impulse_math::cross(r, j);
    }

    [[nodiscard]] static Vector angular_cross(const AngularVelocity& w, const Vector& r) noexcept {
        return impulse_math::cross(w, r);
    }

    /// R * I^-1 * R^T * torque
    [[nodiscard]] static AngularVelocity apply_inverse_inertia(const InverseInertia& local_inv,
                                                              const Rotation& rotation,
                                                              const AngularVelocity& torque) noexcept {
        Vector local = impulse_math::inverse_rotate(rotation, torque);
        return impulse_math::rotate(rotation, local_inv * local);
    }

    [[nodiscard]] static float angular_dot(const AngularVelocity& a, const AngularVelocity& b) noexcept {
        return impulse_math::dot(a, b);
    }

    /// q += 0.5 * (w, 0) * q * dt, renormalized
    [[nodiscard]] static Rotation integrate_rotation(const Rotation& q, const AngularVelocity& w, float dt) noexcept {
        return impulse_math::integrate_rotation(q, w, dt);
    }

    [[nodiscard]] static AngularVelocity clamp_angular(const AngularVelocity& w, float max_speed) noexcept {
        float len_sq = impulse_math::length_squared(w);
        if (len_sq > max_speed * max_speed) {
            return w * (max_speed / std::sqrt(len_sq));
        }
        return w;
    }

    [[nodiscard]] static bool is_finite(const Vector& v) noexcept { return impulse_math::is_finite(v); }
    [[nodiscard]] static bool is_finite_rotation(const Rotation& q) noexcept { return impulse_math::is_finite(q); }
    [[nodiscard]] static bool is_finite_angular(const AngularVelocity& w) noexcept { return impulse_math::is_finite(w); }

    [[nodiscard]] static bool is_finite_inertia(const InverseInertia& m) noexcept {
        for (int c = 0; c < 3; ++c) {
            if (!impulse_math::is_finite(m[c])) return false;
            if (m[c][c] < 0.0f) return false;
        }
        return true;
    }
};

/// Clamp a linear velocity to a maximum speed
template<typename V>
[[nodiscard]] inline V clamp_speed(const V& v, float max_speed) noexcept {
    float len_sq = impulse_math::length_squared(v);
    if (len_sq > max_speed * max_speed) {
        return v * (max_speed / std::sqrt(len_sq));
    }
    return v;
}

} // namespace impulse_physics
