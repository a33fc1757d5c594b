// impulse_physics integrator tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/integrator.hpp>

#include <limits>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

Body3 unit_box() {
    return Body3::dynamic_from_shape(Shape3{Box{Vec3(0.5f)}}, 1.0f).unwrap();
}

} // anonymous namespace

// =============================================================================
// Timestep
// =============================================================================

TEST_CASE("Integrator rejects invalid timesteps", "[physics][integrator]") {
    REQUIRE(Integrator3D::is_valid_timestep(1.0f / 60.0f));
    REQUIRE_FALSE(Integrator3D::is_valid_timestep(0.0f));
    REQUIRE_FALSE(Integrator3D::is_valid_timestep(-0.01f));
    REQUIRE_FALSE(Integrator3D::is_valid_timestep(std::numeric_limits<float>::quiet_NaN()));
    REQUIRE_FALSE(Integrator3D::is_valid_timestep(consts::INFINITY_F));

    Integrator3D integrator;
    Pose3 pose;
    pose.position = Vec3(1.0f, 2.0f, 3.0f);
    Body3 body = unit_box();
    body.linear_velocity = Vec3(1.0f, 0.0f, 0.0f);

    for (float dt : {0.0f, -1.0f, std::numeric_limits<float>::quiet_NaN()}) {
        auto result = integrator.integrate(pose, body, Forces3{}, dt);
        REQUIRE(result.pose == pose);
        REQUIRE(result.body.linear_velocity == body.linear_velocity);
        REQUIRE_FALSE(result.reverted);
    }
}

// =============================================================================
// Body Kinds
// =============================================================================

TEST_CASE("Integrator never moves static bodies", "[physics][integrator]") {
    Integrator3D integrator;
    Pose3 pose;
    pose.position = Vec3(0.0f, -1.0f, 0.0f);
    Body3 ground = Body3::make_static();
    ground.linear_velocity = Vec3(5.0f, 0.0f, 0.0f);

    Forces3 forces;
    forces.force = Vec3(100.0f, 0.0f, 0.0f);

    auto result = integrator.integrate(pose, ground, forces, 0.1f);
    REQUIRE(result.pose == pose);
    REQUIRE(result.body.linear_velocity == ground.linear_velocity);

    BodyDelta<Dim3> delta;
    delta.linear = Vec3(1.0f);
    delta.position = Vec3(1.0f);
    Pose3 moved = pose;
    integrator.apply_delta(moved, ground, delta);
    REQUIRE(moved == pose);
}

TEST_CASE("Integrator moves kinematic bodies by velocity only", "[physics][integrator]") {
    Integrator3D integrator;
    Body3 platform = Body3::make_kinematic(Vec3(2.0f, 0.0f, 0.0f));

    Forces3 forces;
    forces.force = Vec3(0.0f, 1000.0f, 0.0f);

    auto result = integrator.integrate(Pose3{}, platform, forces, 0.5f);
    REQUIRE(result.body.linear_velocity == Vec3(2.0f, 0.0f, 0.0f));
    REQUIRE_THAT(result.pose.position.x, WithinAbs(1.0f, 1e-6f));
    REQUIRE(result.pose.position.y == 0.0f);
}

// =============================================================================
// Dynamics
// =============================================================================

TEST_CASE("Integrator applies gravity semi-implicitly", "[physics][integrator]") {
    Integrator3D integrator;
    Body3 body = unit_box();

    auto result = integrator.integrate(Pose3{}, body, Forces3{}, 0.1f);
    REQUIRE_THAT(result.body.linear_velocity.y, WithinAbs(-0.981f, 1e-5f));
    // Position uses the updated velocity
    REQUIRE_THAT(result.pose.position.y, WithinAbs(-0.0981f, 1e-6f));

    SECTION("gravity scale") {
        body.gravity_scale = 0.0f;
        auto floating = integrator.integrate(Pose3{}, body, Forces3{}, 0.1f);
        REQUIRE(floating.body.linear_velocity == Vec3(0.0f));
    }

    SECTION("2D uses the x and y of gravity") {
        Integrator2D integrator2d;
        Body2 body2d = Body2::dynamic_from_shape(Shape2{Circle{0.5f}}, 1.0f).unwrap();
        auto step = integrator2d.integrate(Pose2{}, body2d, Forces2{}, 0.1f);
        REQUIRE_THAT(step.body.linear_velocity.y, WithinAbs(-0.981f, 1e-5f));
        REQUIRE(step.body.linear_velocity.x == 0.0f);
    }
}

TEST_CASE("Integrator applies force and torque through mass", "[physics][integrator]") {
    IntegratorConfig config;
    config.gravity = Vec3(0.0f);
    Integrator3D integrator(config);

    Body3 body = unit_box();
    body.mass = 2.0f;
    body.inv_mass = 0.5f;

    Forces3 forces;
    forces.force = Vec3(4.0f, 0.0f, 0.0f);
    forces.torque = Vec3(0.0f, 1.0f, 0.0f);

    integrator.integrate_velocity(body, forces, 1.0f);
    REQUIRE_THAT(body.linear_velocity.x, WithinAbs(2.0f, 1e-6f));
    // Unit box inverse inertia is 6 on every axis
    REQUIRE_THAT(body.angular_velocity.y, WithinAbs(6.0f, 1e-4f));
}

TEST_CASE("Integrator damping and speed clamps", "[physics][integrator]") {
    IntegratorConfig config;
    config.gravity = Vec3(0.0f);
    config.max_linear_speed = 10.0f;
    config.max_angular_speed = 2.0f;
    Integrator3D integrator(config);

    Body3 body = unit_box();

    SECTION("damping") {
        body.linear_velocity = Vec3(4.0f, 0.0f, 0.0f);
        body.linear_damping = 1.0f;
        integrator.integrate_velocity(body, Forces3{}, 1.0f);
        REQUIRE_THAT(body.linear_velocity.x, WithinAbs(2.0f, 1e-6f));
    }

    SECTION("linear clamp keeps direction") {
        body.linear_velocity = Vec3(30.0f, 40.0f, 0.0f);
        integrator.integrate_velocity(body, Forces3{}, 0.01f);
        REQUIRE_THAT(length(body.linear_velocity), WithinAbs(10.0f, 1e-4f));
        REQUIRE_THAT(body.linear_velocity.x, WithinAbs(6.0f, 1e-4f));
    }

    SECTION("angular clamp") {
        body.angular_velocity = Vec3(0.0f, 0.0f, 50.0f);
        integrator.integrate_velocity(body, Forces3{}, 0.01f);
        REQUIRE_THAT(body.angular_velocity.z, WithinAbs(2.0f, 1e-4f));
    }
}

TEST_CASE("Integrator rotates bodies", "[physics][integrator]") {
    IntegratorConfig config;
    config.gravity = Vec3(0.0f);

    SECTION("2D angle wraps into (-pi, pi]") {
        Integrator2D integrator(config);
        Body2 body = Body2::make_kinematic(Vec2(0.0f), 2.0f);
        Pose2 pose;
        pose.rotation = 3.0f;
        integrator.integrate_position(pose, body, 0.5f);
        REQUIRE_THAT(pose.rotation, WithinAbs(4.0f - consts::TAU, 1e-5f));
    }

    SECTION("3D orientation stays normalized") {
        Integrator3D integrator(config);
        Body3 body = Body3::make_kinematic(Vec3(0.0f), Vec3(0.0f, consts::PI, 0.0f));
        Pose3 pose;
        for (int i = 0; i < 60; ++i) {
            integrator.integrate_position(pose, body, 1.0f / 60.0f);
        }
        REQUIRE_THAT(length(pose.rotation), WithinAbs(1.0f, 1e-5f));
        // Half a turn about Y maps +X to -X
        Vec3 x = rotate(pose.rotation, vec3::X);
        REQUIRE_THAT(x.x, WithinAbs(-1.0f, 1e-2f));
    }
}

// =============================================================================
// Deltas and Recovery
// =============================================================================

TEST_CASE("Integrator applies resolver deltas to dynamic bodies", "[physics][integrator]") {
    Integrator3D integrator;
    Body3 body = unit_box();
    Pose3 pose;

    BodyDelta<Dim3> delta;
    delta.linear = Vec3(0.0f, 3.0f, 0.0f);
    delta.angular = Vec3(1.0f, 0.0f, 0.0f);
    delta.position = Vec3(0.0f, 0.01f, 0.0f);

    integrator.apply_delta(pose, body, delta);
    REQUIRE(body.linear_velocity == Vec3(0.0f, 3.0f, 0.0f));
    REQUIRE(body.angular_velocity == Vec3(1.0f, 0.0f, 0.0f));
    REQUIRE(pose.position == Vec3(0.0f, 0.01f, 0.0f));

    SECTION("kinematic bodies ignore deltas") {
        Body3 platform = Body3::make_kinematic(Vec3(1.0f, 0.0f, 0.0f));
        Pose3 platform_pose;
        integrator.apply_delta(platform_pose, platform, delta);
        REQUIRE(platform.linear_velocity == Vec3(1.0f, 0.0f, 0.0f));
        REQUIRE(platform_pose.position == Vec3(0.0f));
    }
}

TEST_CASE("Integrator reverts non-finite results", "[physics][integrator]") {
    Integrator3D integrator;
    Pose3 previous;
    previous.position = Vec3(1.0f, 1.0f, 1.0f);

    Pose3 pose = previous;
    Body3 body = unit_box();
    body.linear_velocity = Vec3(2.0f, 0.0f, 0.0f);
    REQUIRE_FALSE(integrator.revert_if_non_finite(pose, body, previous));
    REQUIRE(body.linear_velocity == Vec3(2.0f, 0.0f, 0.0f));

    pose.position.x = std::numeric_limits<float>::quiet_NaN();
    REQUIRE(integrator.revert_if_non_finite(pose, body, previous));
    REQUIRE(pose == previous);
    REQUIRE(body.linear_velocity == Vec3(0.0f));
    REQUIRE(body.angular_velocity == Vec3(0.0f));

    SECTION("full step reports the revert") {
        Body3 runaway = unit_box();
        Forces3 forces;
        forces.force = Vec3(consts::INFINITY_F, 0.0f, 0.0f);
        auto result = integrator.integrate(previous, runaway, forces, 0.1f);
        REQUIRE(result.reverted);
        REQUIRE(result.pose == previous);
    }
}
