#pragma once

/// @file solver.hpp
/// @brief Sequential impulse contact resolution
///
/// The resolver never mutates bodies. It reads a snapshot of the bodies
/// involved and returns velocity and position deltas parallel to that
/// snapshot, which the integrator applies.

#include "fwd.hpp"
#include "types.hpp"
#include "body.hpp"
#include "contact.hpp"
#include "shape.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace impulse_physics {

// =============================================================================
// SolverConfig
// =============================================================================

/// Upper bound accepted for velocity_iterations
constexpr std::uint32_t k_max_velocity_iterations = 1000;

struct SolverConfig {
    std::uint32_t velocity_iterations = 8;
    float position_correction_percent = 0.2f;   ///< Fraction of penetration removed per step
    float slop = 0.01f;                         ///< Penetration allowed without correction
    float restitution_threshold = 1.0f;         ///< Approach speed below which nothing bounces
    CombineRule restitution_combine = CombineRule::Minimum;
    CombineRule friction_combine = CombineRule::Average;
};

// =============================================================================
// Solver Input / Output
// =============================================================================

/// Body state as seen by the resolver
template<typename D>
struct SolverBody {
    EntityId id;
    Pose<D> pose;
    Body<D> body;
};

/// Change to apply to one body after resolution
template<typename D>
struct BodyDelta {
    typename D::Vector linear = D::zero_vector();
    typename D::AngularVelocity angular = D::zero_angular();
    typename D::Vector position = D::zero_vector();     ///< Positional correction

    [[nodiscard]] bool is_zero() const noexcept {
        return linear == D::zero_vector() && angular == D::zero_angular() && position == D::zero_vector();
    }
};

template<typename D>
struct ResolveResult {
    std::vector<BodyDelta<D>> deltas;   ///< Parallel to the input bodies
    std::size_t solved_points = 0;
    std::size_t skipped_points = 0;     ///< Singular or non-finite effective mass
    std::size_t skipped_manifolds = 0;  ///< Unknown ids
};

// =============================================================================
// ContactResolver
// =============================================================================

template<typename D>
class ContactResolver {
public:
    explicit ContactResolver(const SolverConfig& config = {}) : m_config(config) {}

    /// Resolve all manifolds against the given bodies.
    /// Manifolds are visited in canonical pair order, points in manifold order.
    [[nodiscard]] ResolveResult<D> resolve(std::span<const ContactManifold<D>> manifolds,
                                           std::span<const SolverBody<D>> bodies) const;

    [[nodiscard]] const SolverConfig& config() const noexcept { return m_config; }
    void set_config(const SolverConfig& config) { m_config = config; }

private:
    SolverConfig m_config;
};

using ContactResolver2D = ContactResolver<Dim2>;
using ContactResolver3D = ContactResolver<Dim3>;

} // namespace impulse_physics
