#pragma once

/// @file contact.hpp
/// @brief Contact manifolds produced by the narrow phase

#include "fwd.hpp"
#include "types.hpp"
#include "dimension.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

namespace impulse_physics {

/// Hard upper bound on points per manifold
constexpr std::size_t k_max_manifold_points = 4;

// =============================================================================
// Contact Point
// =============================================================================

/// Single contact point
template<typename D>
struct ContactPoint {
    typename D::Vector position = D::zero_vector();    ///< World space, midway between the surfaces
    float depth = 0.0f;                                 ///< Penetration depth, >= 0
};

// =============================================================================
// Contact Manifold
// =============================================================================

/// Contact between two entities for one tick
template<typename D>
struct ContactManifold {
    using Vector = typename D::Vector;
    static constexpr int k_tangent_count = D::k_dimension - 1;

    CandidatePair pair;                         ///< a is body A, b is body B
    Vector normal = D::zero_vector();           ///< Unit, from A to B
    std::array<Vector, k_tangent_count> tangents{};
    std::vector<ContactPoint<D>> points;

    [[nodiscard]] std::size_t size() const noexcept { return points.size(); }
    [[nodiscard]] bool empty() const noexcept { return points.empty(); }

    /// Get deepest penetration
    [[nodiscard]] float max_depth() const noexcept {
        float max_d = 0.0f;
        for (const auto& p : points) {
            max_d = std::max(max_d, p.depth);
        }
        return max_d;
    }

    /// Reverse roles of A and B
    void flip() noexcept {
        normal = -normal;
        for (auto& t : tangents) {
            t = -t;
        }
    }
};

using ContactManifold2D = ContactManifold<Dim2>;
using ContactManifold3D = ContactManifold<Dim3>;

// =============================================================================
// Tangent Basis
// =============================================================================

[[nodiscard]] inline std::array<impulse_math::Vec2, 1> build_tangent_basis(const impulse_math::Vec2& normal) noexcept {
    return {impulse_math::perpendicular(normal)};
}

[[nodiscard]] inline std::array<impulse_math::Vec3, 2> build_tangent_basis(const impulse_math::Vec3& normal) noexcept {
    impulse_math::Vec3 tangent1 = impulse_math::any_perpendicular(normal);
    impulse_math::Vec3 tangent2 = impulse_math::cross(normal, tangent1);
    return {tangent1, tangent2};
}

/// Clamp depths, keep the deepest points (stable for equal depths) up to
/// max_points, and fill in the tangent basis.
template<typename D>
void finalize_manifold(ContactManifold<D>& manifold, std::size_t max_points) {
    for (auto& p : manifold.points) {
        p.depth = std::max(p.depth, 0.0f);
    }

    std::stable_sort(manifold.points.begin(), manifold.points.end(),
        [](const ContactPoint<D>& a, const ContactPoint<D>& b) {
            return a.depth > b.depth;
        });

    std::size_t cap = std::clamp<std::size_t>(max_points, 1, k_max_manifold_points);
    if (manifold.points.size() > cap) {
        manifold.points.resize(cap);
    }

    manifold.tangents = build_tangent_basis(manifold.normal);
}

} // namespace impulse_physics
