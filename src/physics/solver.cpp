/// @file solver.cpp
/// @brief Sequential impulse contact resolution

#include <impulse/physics/solver.hpp>
#include <impulse/core/log.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace impulse_physics {

namespace {

/// Effective masses below this are treated as singular
constexpr float k_min_effective_mass = 1.0e-9f;

template<typename D>
struct PointConstraint {
    using Vector = typename D::Vector;
    static constexpr int k_tangents = D::k_dimension - 1;

    Vector r_a = D::zero_vector();
    Vector r_b = D::zero_vector();
    float normal_mass = 0.0f;
    std::array<float, k_tangents> tangent_mass{};
    float velocity_bias = 0.0f;
    float normal_impulse = 0.0f;
    std::array<float, k_tangents> tangent_impulse{};
};

template<typename D>
struct ManifoldConstraint {
    using Vector = typename D::Vector;

    std::size_t index_a = 0;
    std::size_t index_b = 0;
    Vector normal = D::zero_vector();
    std::array<Vector, D::k_dimension - 1> tangents{};
    float inv_mass_a = 0.0f;
    float inv_mass_b = 0.0f;
    typename D::InverseInertia inv_inertia_a = D::zero_inertia();
    typename D::InverseInertia inv_inertia_b = D::zero_inertia();
    typename D::Rotation rotation_a = D::identity_rotation();
    typename D::Rotation rotation_b = D::identity_rotation();
    float friction = 0.0f;
    float max_depth = 0.0f;
    std::vector<PointConstraint<D>> points;
};

/// Working velocity of one body: initial velocity plus accumulated delta
template<typename D>
struct VelocityState {
    typename D::Vector v = D::zero_vector();
    typename D::AngularVelocity w = D::zero_angular();
};

template<typename D>
float effective_mass(const ManifoldConstraint<D>& c, const typename D::Vector& r_a,
                     const typename D::Vector& r_b, const typename D::Vector& dir) {
    auto ra_x = D::cross(r_a, dir);
    auto rb_x = D::cross(r_b, dir);
    return c.inv_mass_a + c.inv_mass_b
        + D::angular_dot(ra_x, D::apply_inverse_inertia(c.inv_inertia_a, c.rotation_a, ra_x))
        + D::angular_dot(rb_x, D::apply_inverse_inertia(c.inv_inertia_b, c.rotation_b, rb_x));
}

template<typename D>
void apply_impulse(const ManifoldConstraint<D>& c, const PointConstraint<D>& cp,
                   const typename D::Vector& impulse,
                   VelocityState<D>& vel_a, VelocityState<D>& vel_b) {
    vel_a.v = vel_a.v - impulse * c.inv_mass_a;
    vel_a.w = vel_a.w - D::apply_inverse_inertia(c.inv_inertia_a, c.rotation_a, D::cross(cp.r_a, impulse));
    vel_b.v = vel_b.v + impulse * c.inv_mass_b;
    vel_b.w = vel_b.w + D::apply_inverse_inertia(c.inv_inertia_b, c.rotation_b, D::cross(cp.r_b, impulse));
}

template<typename D>
typename D::Vector relative_velocity(const PointConstraint<D>& cp,
                                     const VelocityState<D>& vel_a, const VelocityState<D>& vel_b) {
    auto v_a = vel_a.v + D::angular_cross(vel_a.w, cp.r_a);
    auto v_b = vel_b.v + D::angular_cross(vel_b.w, cp.r_b);
    return v_b - v_a;
}

} // anonymous namespace

template<typename D>
ResolveResult<D> ContactResolver<D>::resolve(std::span<const ContactManifold<D>> manifolds,
                                             std::span<const SolverBody<D>> bodies) const {
    ResolveResult<D> result;
    result.deltas.resize(bodies.size());

    std::unordered_map<EntityId, std::size_t> index_of;
    index_of.reserve(bodies.size());
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        index_of.emplace(bodies[i].id, i);
    }

    std::vector<VelocityState<D>> velocities(bodies.size());
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        velocities[i].v = bodies[i].body.linear_velocity;
        velocities[i].w = bodies[i].body.angular_velocity;
    }

    // Canonical pair order, stable for equal pairs
    std::vector<std::size_t> order(manifolds.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&manifolds](std::size_t x, std::size_t y) {
        return manifolds[x].pair < manifolds[y].pair;
    });

    // =========================================================================
    // Initialize constraints
    // =========================================================================

    std::vector<ManifoldConstraint<D>> constraints;
    constraints.reserve(manifolds.size());

    for (std::size_t m : order) {
        const ContactManifold<D>& manifold = manifolds[m];
        auto it_a = index_of.find(manifold.pair.a);
        auto it_b = index_of.find(manifold.pair.b);
        if (it_a == index_of.end() || it_b == index_of.end()) {
            impulse_core::physics_logger()->debug("Resolver: manifold {} references an unknown body, skipped",
                                                  to_string(manifold.pair));
            ++result.skipped_manifolds;
            continue;
        }

        const SolverBody<D>& a = bodies[it_a->second];
        const SolverBody<D>& b = bodies[it_b->second];

        ManifoldConstraint<D> c;
        c.index_a = it_a->second;
        c.index_b = it_b->second;
        c.normal = manifold.normal;
        c.tangents = manifold.tangents;
        c.inv_mass_a = a.body.effective_inv_mass();
        c.inv_mass_b = b.body.effective_inv_mass();
        c.inv_inertia_a = a.body.effective_inv_inertia();
        c.inv_inertia_b = b.body.effective_inv_inertia();
        c.rotation_a = a.pose.rotation;
        c.rotation_b = b.pose.rotation;
        c.friction = combine(m_config.friction_combine, a.body.friction, b.body.friction);
        c.max_depth = manifold.max_depth();
        float restitution = combine(m_config.restitution_combine, a.body.restitution, b.body.restitution);

        for (const auto& point : manifold.points) {
            PointConstraint<D> cp;
            cp.r_a = point.position - a.pose.position;
            cp.r_b = point.position - b.pose.position;

            float k_normal = effective_mass(c, cp.r_a, cp.r_b, c.normal);
            if (!std::isfinite(k_normal) || k_normal < k_min_effective_mass) {
                ++result.skipped_points;
                continue;
            }
            cp.normal_mass = 1.0f / k_normal;

            for (std::size_t t = 0; t < c.tangents.size(); ++t) {
                float k_tangent = effective_mass(c, cp.r_a, cp.r_b, c.tangents[t]);
                cp.tangent_mass[t] = std::isfinite(k_tangent) && k_tangent >= k_min_effective_mass
                    ? 1.0f / k_tangent : 0.0f;
            }

            // Restitution bias
            float v_rel = impulse_math::dot(c.normal,
                relative_velocity(cp, velocities[c.index_a], velocities[c.index_b]));
            if (v_rel < -m_config.restitution_threshold) {
                cp.velocity_bias = -restitution * v_rel;
            }

            c.points.push_back(cp);
        }

        result.solved_points += c.points.size();
        constraints.push_back(std::move(c));
    }

    // =========================================================================
    // Velocity passes
    // =========================================================================

    for (std::uint32_t iter = 0; iter < m_config.velocity_iterations; ++iter) {
        for (auto& c : constraints) {
            auto& vel_a = velocities[c.index_a];
            auto& vel_b = velocities[c.index_b];

            for (auto& cp : c.points) {
                // Friction
                float max_friction = c.friction * cp.normal_impulse;
                for (std::size_t t = 0; t < c.tangents.size(); ++t) {
                    auto dv = relative_velocity(cp, vel_a, vel_b);
                    float vt = impulse_math::dot(dv, c.tangents[t]);
                    float dt = cp.tangent_mass[t] * (-vt);
                    float old_t = cp.tangent_impulse[t];
                    cp.tangent_impulse[t] = std::clamp(old_t + dt, -max_friction, max_friction);
                    dt = cp.tangent_impulse[t] - old_t;

                    apply_impulse(c, cp, c.tangents[t] * dt, vel_a, vel_b);
                }

                // Normal constraint
                auto dv = relative_velocity(cp, vel_a, vel_b);
                float vn = impulse_math::dot(dv, c.normal);
                float dn = cp.normal_mass * (-vn + cp.velocity_bias);
                float old_n = cp.normal_impulse;
                cp.normal_impulse = std::max(old_n + dn, 0.0f);
                dn = cp.normal_impulse - old_n;

                apply_impulse(c, cp, c.normal * dn, vel_a, vel_b);
            }
        }
    }

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        if (!bodies[i].body.is_dynamic()) continue;
        result.deltas[i].linear = velocities[i].v - bodies[i].body.linear_velocity;
        result.deltas[i].angular = velocities[i].w - bodies[i].body.angular_velocity;
    }

    // =========================================================================
    // Positional correction
    // =========================================================================

    for (const auto& c : constraints) {
        float inv_mass_sum = c.inv_mass_a + c.inv_mass_b;
        if (inv_mass_sum <= 0.0f) continue;

        float correction = std::max(c.max_depth - m_config.slop, 0.0f) / inv_mass_sum
            * m_config.position_correction_percent;
        if (correction <= 0.0f) continue;

        if (c.inv_mass_a > 0.0f) {
            result.deltas[c.index_a].position -= c.normal * (correction * c.inv_mass_a);
        }
        if (c.inv_mass_b > 0.0f) {
            result.deltas[c.index_b].position += c.normal * (correction * c.inv_mass_b);
        }
    }

    return result;
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

template class ContactResolver<Dim2>;
template class ContactResolver<Dim3>;

} // namespace impulse_physics
