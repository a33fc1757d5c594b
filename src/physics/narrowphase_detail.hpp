#pragma once

/// @file narrowphase_detail.hpp
/// @brief Helpers shared by the 2D and 3D narrow phase routines

#include <impulse/physics/contact.hpp>
#include <impulse/physics/narrowphase.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <span>

namespace impulse_physics::detail {

/// Below this a direction is treated as zero
constexpr float k_normal_epsilon = 1.0e-6f;

/// Segments closer than this to parallel produce two contact points
constexpr float k_parallel_tolerance = 1.0e-4f;

// =============================================================================
// Segment Queries
// =============================================================================

template<typename V>
[[nodiscard]] V closest_point_on_segment(const V& p, const V& a, const V& b) {
    V ab = b - a;
    float len_sq = impulse_math::dot(ab, ab);
    if (len_sq < k_normal_epsilon * k_normal_epsilon) {
        return a;
    }
    float t = std::clamp(impulse_math::dot(p - a, ab) / len_sq, 0.0f, 1.0f);
    return a + ab * t;
}

/// Closest points between segments p1-q1 and p2-q2
template<typename V>
void closest_points_segments(const V& p1, const V& q1, const V& p2, const V& q2,
                             V& c1, V& c2) {
    V d1 = q1 - p1;
    V d2 = q2 - p2;
    V r = p1 - p2;
    float a = impulse_math::dot(d1, d1);
    float e = impulse_math::dot(d2, d2);
    float f = impulse_math::dot(d2, r);
    constexpr float eps = k_normal_epsilon * k_normal_epsilon;

    float s = 0.0f;
    float t = 0.0f;

    if (a <= eps && e <= eps) {
        c1 = p1;
        c2 = p2;
        return;
    }

    if (a <= eps) {
        t = std::clamp(f / e, 0.0f, 1.0f);
    } else {
        float c = impulse_math::dot(d1, r);
        if (e <= eps) {
            s = std::clamp(-c / a, 0.0f, 1.0f);
        } else {
            float b = impulse_math::dot(d1, d2);
            float denom = a * e - b * b;
            if (denom > eps) {
                s = std::clamp((b * f - c * e) / denom, 0.0f, 1.0f);
            }
            t = (b * s + f) / e;
            if (t < 0.0f) {
                t = 0.0f;
                s = std::clamp(-c / a, 0.0f, 1.0f);
            } else if (t > 1.0f) {
                t = 1.0f;
                s = std::clamp((b - c) / a, 0.0f, 1.0f);
            }
        }
    }

    c1 = p1 + d1 * s;
    c2 = p2 + d2 * t;
}

// =============================================================================
// Rounded Contacts
// =============================================================================

/// Contact between two rounded points (sphere/circle cores)
template<typename D>
[[nodiscard]] std::optional<ContactManifold<D>> round_contact(
    const typename D::Vector& center_a, float radius_a,
    const typename D::Vector& center_b, float radius_b,
    const typename D::Vector& fallback_normal,
    const NarrowPhaseConfig& config) {

    using Vector = typename D::Vector;
    Vector delta = center_b - center_a;
    float dist = impulse_math::length(delta);
    float separation = dist - radius_a - radius_b;
    if (separation > config.contact_epsilon) {
        return std::nullopt;
    }

    Vector normal = dist > k_normal_epsilon ? delta / dist : fallback_normal;

    ContactManifold<D> manifold;
    manifold.normal = normal;
    Vector surface_a = center_a + normal * radius_a;
    Vector surface_b = center_b - normal * radius_b;
    manifold.points.push_back({(surface_a + surface_b) * 0.5f, -separation});
    return manifold;
}

/// Contact between two capsule cores. Parallel overlapping segments give two
/// points at the ends of the overlap.
template<typename D>
[[nodiscard]] std::optional<ContactManifold<D>> capsule_capsule_contact(
    const typename D::Vector& a0, const typename D::Vector& a1, float radius_a,
    const typename D::Vector& b0, const typename D::Vector& b1, float radius_b,
    const typename D::Vector& fallback_normal,
    const NarrowPhaseConfig& config) {

    using Vector = typename D::Vector;
    Vector ca;
    Vector cb;
    closest_points_segments(a0, a1, b0, b1, ca, cb);

    auto manifold = round_contact<D>(ca, radius_a, cb, radius_b, fallback_normal, config);
    if (!manifold) {
        return std::nullopt;
    }

    Vector da = a1 - a0;
    Vector db = b1 - b0;
    float la = impulse_math::length(da);
    float lb = impulse_math::length(db);
    if (la < k_normal_epsilon || lb < k_normal_epsilon) {
        return manifold;
    }

    float alignment = std::abs(impulse_math::dot(da, db)) / (la * lb);
    if (alignment < 1.0f - k_parallel_tolerance) {
        return manifold;
    }

    Vector axis = da / la;
    float t0 = impulse_math::dot(b0 - a0, axis);
    float t1 = impulse_math::dot(b1 - a0, axis);
    float lo = std::max(0.0f, std::min(t0, t1));
    float hi = std::min(la, std::max(t0, t1));
    if (hi - lo < k_parallel_tolerance) {
        return manifold;
    }

    const Vector normal = manifold->normal;
    manifold->points.clear();
    for (float t : {lo, hi}) {
        Vector pa = a0 + axis * t;
        Vector pb = closest_point_on_segment(pa, b0, b1);
        float depth = radius_a + radius_b - impulse_math::dot(normal, pb - pa);
        Vector surface_a = pa + normal * radius_a;
        Vector surface_b = pb - normal * radius_b;
        manifold->points.push_back({(surface_a + surface_b) * 0.5f, depth});
    }
    return manifold;
}

// =============================================================================
// Plane Contacts
// =============================================================================

/// Rounded vertices of shape A against the solid half-space
/// { x : dot(normal, x) <= offset } as B. One point per penetrating vertex.
template<typename D>
[[nodiscard]] std::optional<ContactManifold<D>> plane_contact(
    std::span<const typename D::Vector> vertices, float radius,
    const typename D::Vector& plane_normal, float plane_offset,
    const NarrowPhaseConfig& config) {

    using Vector = typename D::Vector;
    ContactManifold<D> manifold;
    manifold.normal = -plane_normal;

    for (const Vector& v : vertices) {
        float height = impulse_math::dot(plane_normal, v) - plane_offset;
        float depth = radius - height;
        if (depth < -config.contact_epsilon) {
            continue;
        }
        Vector on_shape = v - plane_normal * radius;
        Vector on_plane = v - plane_normal * height;
        manifold.points.push_back({(on_shape + on_plane) * 0.5f, depth});
    }

    if (manifold.points.empty()) {
        return std::nullopt;
    }
    return manifold;
}

// =============================================================================
// Dispatch Helpers
// =============================================================================

/// Run a routine with the operands swapped and flip the result
template<typename M, typename W, std::optional<M> (*F)(const W&, const W&, const NarrowPhaseConfig&)>
std::optional<M> mirrored(const W& a, const W& b, const NarrowPhaseConfig& config) {
    auto manifold = F(b, a, config);
    if (manifold) {
        manifold->flip();
    }
    return manifold;
}

template<typename M, typename W>
std::optional<M> no_contact(const W&, const W&, const NarrowPhaseConfig&) {
    return std::nullopt;
}

/// Reject manifolds carrying non-finite data
template<typename D>
[[nodiscard]] bool is_finite_manifold(const ContactManifold<D>& manifold) {
    if (!D::is_finite(manifold.normal)) return false;
    if (impulse_math::length_squared(manifold.normal) < k_normal_epsilon) return false;
    for (const auto& p : manifold.points) {
        if (!D::is_finite(p.position) || !std::isfinite(p.depth)) return false;
    }
    return true;
}

} // namespace impulse_physics::detail
