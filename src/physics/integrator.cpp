/// @file integrator.cpp
/// @brief Semi-implicit Euler integration of bodies

#include <impulse/physics/integrator.hpp>
#include <impulse/core/log.hpp>

#include <cmath>

namespace impulse_physics {

template<typename D>
void Integrator<D>::integrate_velocity(Body<D>& body, const Forces<D>& forces, float dt,
                                       const typename D::Rotation& rotation) const {
    if (!body.is_dynamic() || !is_valid_timestep(dt)) {
        return;
    }

    // Linear: gravity plus applied force
    auto gravity = D::from_vec3(m_config.gravity) * body.gravity_scale;
    auto accel = gravity + forces.force * body.inv_mass;
    auto new_vel = body.linear_velocity + accel * dt;
    new_vel = new_vel * (1.0f / (1.0f + dt * body.linear_damping));
    body.linear_velocity = clamp_speed(new_vel, m_config.max_linear_speed);

    // Angular: world inverse inertia times torque
    auto ang_accel = D::apply_inverse_inertia(body.inv_inertia, rotation, forces.torque);
    auto new_ang_vel = body.angular_velocity + ang_accel * dt;
    new_ang_vel = new_ang_vel * (1.0f / (1.0f + dt * body.angular_damping));
    body.angular_velocity = D::clamp_angular(new_ang_vel, m_config.max_angular_speed);
}

template<typename D>
void Integrator<D>::apply_delta(Pose<D>& pose, Body<D>& body, const BodyDelta<D>& delta) const {
    if (!body.is_dynamic()) {
        return;
    }
    body.linear_velocity += delta.linear;
    body.angular_velocity += delta.angular;
    pose.position += delta.position;
}

template<typename D>
void Integrator<D>::integrate_position(Pose<D>& pose, const Body<D>& body, float dt) const {
    if (body.is_static() || !is_valid_timestep(dt)) {
        return;
    }
    pose.position = pose.position + body.linear_velocity * dt;
    pose.rotation = D::integrate_rotation(pose.rotation, body.angular_velocity, dt);
}

template<typename D>
bool Integrator<D>::revert_if_non_finite(Pose<D>& pose, Body<D>& body, const Pose<D>& previous) const {
    if (pose.is_finite() && D::is_finite(body.linear_velocity) && D::is_finite_angular(body.angular_velocity)) {
        return false;
    }
    pose = previous;
    body.linear_velocity = D::zero_vector();
    body.angular_velocity = D::zero_angular();
    return true;
}

template<typename D>
IntegrationResult<D> Integrator<D>::integrate(const Pose<D>& pose, const Body<D>& body,
                                              const Forces<D>& forces, float dt) const {
    IntegrationResult<D> result{pose, body, false};
    if (body.is_static() || !is_valid_timestep(dt)) {
        return result;
    }

    integrate_velocity(result.body, forces, dt, pose.rotation);
    integrate_position(result.pose, result.body, dt);

    if (revert_if_non_finite(result.pose, result.body, pose)) {
        impulse_core::physics_logger()->warn("Integrator: non-finite state after step (dt={}), pose reverted", dt);
        result.reverted = true;
    }
    return result;
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

template class Integrator<Dim2>;
template class Integrator<Dim3>;

} // namespace impulse_physics
