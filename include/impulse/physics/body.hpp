#pragma once

/// @file body.hpp
/// @brief Rigid body data for impulse_physics

#include "fwd.hpp"
#include "types.hpp"
#include "dimension.hpp"
#include "shape.hpp"

#include <impulse/core/error.hpp>

#include <cmath>

namespace impulse_physics {

// =============================================================================
// Mass Properties
// =============================================================================

/// Mass and local inverse inertia of a body
template<typename D>
struct MassProperties {
    float mass = 1.0f;
    float inv_mass = 1.0f;
    typename D::InverseInertia inv_inertia = D::zero_inertia();  ///< Local frame
};

/// Derive mass properties from a shape, a density and a uniform scale.
/// Planes have no finite mass and are rejected.
[[nodiscard]] impulse_core::Result<MassProperties<Dim2>> compute_mass_properties(
    const Shape2& shape, float density, float scale = 1.0f);

[[nodiscard]] impulse_core::Result<MassProperties<Dim3>> compute_mass_properties(
    const Shape3& shape, float density, float scale = 1.0f);

// =============================================================================
// Forces
// =============================================================================

/// External force and torque accumulated by the host for one tick
template<typename D>
struct Forces {
    typename D::Vector force = D::zero_vector();
    typename D::AngularVelocity torque = D::zero_angular();
};

// =============================================================================
// Body
// =============================================================================

/// Per-entity motion and material state
template<typename D>
struct Body {
    BodyKind kind = BodyKind::Dynamic;

    float mass = 1.0f;
    float inv_mass = 1.0f;                                      ///< 0 for static/kinematic
    typename D::InverseInertia inv_inertia = D::zero_inertia(); ///< Local frame

    typename D::Vector linear_velocity = D::zero_vector();
    typename D::AngularVelocity angular_velocity = D::zero_angular();

    float restitution = 0.0f;       ///< [0, 1]
    float friction = 0.5f;          ///< Coulomb coefficient

    CollisionLayer layer = layers::Default;
    CollisionLayer mask = layers::All;
    CollisionStrategy strategy = CollisionStrategy::FullResolution;

    float gravity_scale = 1.0f;
    float linear_damping = 0.0f;
    float angular_damping = 0.0f;

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static Body make_static() {
        Body body;
        body.kind = BodyKind::Static;
        body.mass = 0.0f;
        body.inv_mass = 0.0f;
        return body;
    }

    [[nodiscard]] static Body make_kinematic(const typename D::Vector& velocity = D::zero_vector(),
                                             const typename D::AngularVelocity& angular = D::zero_angular()) {
        Body body;
        body.kind = BodyKind::Kinematic;
        body.mass = 0.0f;
        body.inv_mass = 0.0f;
        body.linear_velocity = velocity;
        body.angular_velocity = angular;
        return body;
    }

    [[nodiscard]] static Body make_dynamic(const MassProperties<D>& props) {
        Body body;
        body.kind = BodyKind::Dynamic;
        body.mass = props.mass;
        body.inv_mass = props.inv_mass;
        body.inv_inertia = props.inv_inertia;
        return body;
    }

    /// Dynamic body with mass properties derived from a shape
    [[nodiscard]] static impulse_core::Result<Body> dynamic_from_shape(const ShapeOf<D>& shape,
                                                                     float density,
                                                                     float scale = 1.0f) {
        auto props = compute_mass_properties(shape, density, scale);
        if (!props) {
            return impulse_core::Err<Body>(props.error());
        }
        return impulse_core::Ok(make_dynamic(*props));
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_static() const noexcept { return kind == BodyKind::Static; }
    [[nodiscard]] bool is_kinematic() const noexcept { return kind == BodyKind::Kinematic; }
    [[nodiscard]] bool is_dynamic() const noexcept { return kind == BodyKind::Dynamic; }
    [[nodiscard]] bool is_trigger() const noexcept { return strategy == CollisionStrategy::CollisionOnly; }

    /// Inverse mass seen by the solver (0 unless dynamic)
    [[nodiscard]] float effective_inv_mass() const noexcept {
        return is_dynamic() ? inv_mass : 0.0f;
    }

    /// Local inverse inertia seen by the solver (0 unless dynamic)
    [[nodiscard]] typename D::InverseInertia effective_inv_inertia() const noexcept {
        return is_dynamic() ? inv_inertia : D::zero_inertia();
    }

    [[nodiscard]] CollisionFilter filter() const noexcept {
        return CollisionFilter{kind, layer, mask};
    }

    /// Relative mismatch allowed between mass and 1 / inv_mass
    static constexpr float k_inv_mass_tolerance = 1.0e-4f;

    /// Check velocity and mass data
    [[nodiscard]] impulse_core::Result<void> validate(EntityId id) const {
        using impulse_core::BodyError;
        if (!D::is_finite(linear_velocity) || !D::is_finite_angular(angular_velocity)) {
            return impulse_core::Err(BodyError::non_finite_velocity(id.value));
        }
        if (is_dynamic()) {
            if (!std::isfinite(mass) || mass <= 0.0f ||
                !std::isfinite(inv_mass) || inv_mass <= 0.0f ||
                std::abs(mass * inv_mass - 1.0f) > k_inv_mass_tolerance ||
                !D::is_finite_inertia(inv_inertia)) {
                return impulse_core::Err(BodyError::invalid_mass(id.value));
            }
        }
        if (!std::isfinite(restitution) || restitution < 0.0f ||
            !std::isfinite(friction) || friction < 0.0f ||
            !std::isfinite(gravity_scale) ||
            !std::isfinite(linear_damping) || linear_damping < 0.0f ||
            !std::isfinite(angular_damping) || angular_damping < 0.0f) {
            return impulse_core::Err(BodyError::invalid_mass(id.value));
        }
        return impulse_core::Ok();
    }
};

using Body2 = Body<Dim2>;
using Body3 = Body<Dim3>;
using Forces2 = Forces<Dim2>;
using Forces3 = Forces<Dim3>;

} // namespace impulse_physics
