#pragma once

/// @file integrator.hpp
/// @brief Semi-implicit Euler integration of bodies

#include "fwd.hpp"
#include "body.hpp"
#include "shape.hpp"
#include "solver.hpp"

#include <impulse/math/math.hpp>

#include <cmath>

namespace impulse_physics {

// =============================================================================
// IntegratorConfig
// =============================================================================

struct IntegratorConfig {
    impulse_math::Vec3 gravity{0.0f, -9.81f, 0.0f};    ///< 2D worlds use x and y
    float max_linear_speed = 500.0f;
    float max_angular_speed = 100.0f;                   ///< rad/s
};

/// Outcome of a full integration step
template<typename D>
struct IntegrationResult {
    Pose<D> pose;
    Body<D> body;
    bool reverted = false;      ///< Non-finite result replaced by the previous pose
};

// =============================================================================
// Integrator
// =============================================================================

/// Velocity first, then position. Static bodies are never touched and
/// kinematic bodies move by their velocity but ignore forces. A dt that is
/// not a positive finite number makes every operation a no-op.
template<typename D>
class Integrator {
public:
    explicit Integrator(const IntegratorConfig& config = {}) : m_config(config) {}

    /// Apply gravity, forces, damping and speed clamps to a dynamic body
    void integrate_velocity(Body<D>& body, const Forces<D>& forces, float dt,
                            const typename D::Rotation& rotation = D::identity_rotation()) const;

    /// Add resolver velocity deltas and positional correction
    void apply_delta(Pose<D>& pose, Body<D>& body, const BodyDelta<D>& delta) const;

    /// Advance position and orientation by the current velocity
    void integrate_position(Pose<D>& pose, const Body<D>& body, float dt) const;

    /// Full step: integrate_velocity then integrate_position
    [[nodiscard]] IntegrationResult<D> integrate(const Pose<D>& pose, const Body<D>& body,
                                                 const Forces<D>& forces, float dt) const;

    /// Restore `previous` and zero the velocity if pose or velocity went
    /// non-finite. Returns true when it did.
    bool revert_if_non_finite(Pose<D>& pose, Body<D>& body, const Pose<D>& previous) const;

    [[nodiscard]] const IntegratorConfig& config() const noexcept { return m_config; }

    [[nodiscard]] static bool is_valid_timestep(float dt) noexcept {
        return std::isfinite(dt) && dt > 0.0f;
    }

private:
    IntegratorConfig m_config;
};

using Integrator2D = Integrator<Dim2>;
using Integrator3D = Integrator<Dim3>;

} // namespace impulse_physics
