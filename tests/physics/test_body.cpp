// impulse_physics body and mass property tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/body.hpp>

#include <limits>

using namespace impulse_physics;
using namespace impulse_math;
using impulse_core::BodyError;
using impulse_core::ErrorCode;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Mass Property Tests
// =============================================================================

TEST_CASE("Mass properties 2D", "[physics][body][mass]") {
    SECTION("circle") {
        auto props = compute_mass_properties(Shape2{Circle{1.0f}}, 2.0f);
        REQUIRE(props.is_ok());
        REQUIRE_THAT(props->mass, WithinRel(2.0f * consts::PI, 1e-5f));
        REQUIRE_THAT(props->inv_mass, WithinRel(1.0f / (2.0f * consts::PI), 1e-5f));
        REQUIRE_THAT(props->inv_inertia, WithinRel(1.0f / consts::PI, 1e-5f));
    }

    SECTION("box matches the equivalent polygon") {
        auto box = compute_mass_properties(Shape2{Box2{Vec2(1.0f, 0.5f)}}, 1.0f);
        auto polygon = compute_mass_properties(Shape2{ConvexPolygon{
            {Vec2(-1.0f, -0.5f), Vec2(1.0f, -0.5f), Vec2(1.0f, 0.5f), Vec2(-1.0f, 0.5f)}}}, 1.0f);
        REQUIRE(box.is_ok());
        REQUIRE(polygon.is_ok());
        REQUIRE_THAT(box->mass, WithinRel(2.0f, 1e-5f));
        REQUIRE_THAT(polygon->mass, WithinRel(box->mass, 1e-5f));
        REQUIRE_THAT(polygon->inv_inertia, WithinRel(box->inv_inertia, 1e-4f));
    }

    SECTION("scale multiplies the area") {
        auto unit = compute_mass_properties(Shape2{Circle{1.0f}}, 1.0f, 1.0f);
        auto doubled = compute_mass_properties(Shape2{Circle{1.0f}}, 1.0f, 2.0f);
        REQUIRE_THAT(doubled->mass, WithinRel(4.0f * unit->mass, 1e-5f));
    }

    SECTION("planes have no mass") {
        auto props = compute_mass_properties(Shape2{Plane2{}}, 1.0f);
        REQUIRE(props.is_err());
        REQUIRE(props.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("density must be positive") {
        REQUIRE(compute_mass_properties(Shape2{Circle{1.0f}}, 0.0f).is_err());
        REQUIRE(compute_mass_properties(Shape2{Circle{1.0f}}, -1.0f).is_err());
        REQUIRE(compute_mass_properties(Shape2{Circle{1.0f}}, 1.0f, 0.0f).is_err());
    }
}

TEST_CASE("Mass properties 3D", "[physics][body][mass]") {
    SECTION("unit box") {
        auto props = compute_mass_properties(Shape3{Box{Vec3(0.5f)}}, 1.0f);
        REQUIRE(props.is_ok());
        REQUIRE_THAT(props->mass, WithinRel(1.0f, 1e-5f));
        // I = m (h^2 + h^2) / 3 = 1/6 on every axis
        REQUIRE_THAT(props->inv_inertia[0][0], WithinRel(6.0f, 1e-4f));
        REQUIRE_THAT(props->inv_inertia[1][1], WithinRel(6.0f, 1e-4f));
        REQUIRE(props->inv_inertia[0][1] == 0.0f);
    }

    SECTION("sphere") {
        auto props = compute_mass_properties(Shape3{Sphere{1.0f}}, 3.0f);
        REQUIRE(props.is_ok());
        REQUIRE_THAT(props->mass, WithinRel(4.0f * consts::PI, 1e-5f));
    }

    SECTION("capsule is heavier than its cylinder") {
        auto props = compute_mass_properties(Shape3{Capsule{1.0f, 0.5f}}, 1.0f);
        REQUIRE(props.is_ok());
        REQUIRE(props->mass > consts::PI * 0.25f * 2.0f);
        // Axial inertia is the smallest
        REQUIRE(props->inv_inertia[1][1] > props->inv_inertia[0][0]);
    }

    SECTION("planes have no mass") {
        REQUIRE(compute_mass_properties(Shape3{Plane{}}, 1.0f).is_err());
    }
}

// =============================================================================
// Body Tests
// =============================================================================

TEST_CASE("Body factories", "[physics][body]") {
    SECTION("static") {
        auto body = Body3::make_static();
        REQUIRE(body.is_static());
        REQUIRE(body.effective_inv_mass() == 0.0f);
        REQUIRE_FALSE(body.filter().can_move());
    }

    SECTION("kinematic keeps its velocity but has no inverse mass") {
        auto body = Body2::make_kinematic(Vec2(1.0f, 0.0f), 0.5f);
        REQUIRE(body.is_kinematic());
        REQUIRE(body.linear_velocity == Vec2(1.0f, 0.0f));
        REQUIRE(body.angular_velocity == 0.5f);
        REQUIRE(body.effective_inv_mass() == 0.0f);
        REQUIRE(body.effective_inv_inertia() == 0.0f);
        REQUIRE(body.filter().can_move());
    }

    SECTION("dynamic from shape") {
        auto body = Body3::dynamic_from_shape(Shape3{Box{Vec3(0.5f)}}, 2.0f);
        REQUIRE(body.is_ok());
        REQUIRE(body->is_dynamic());
        REQUIRE_THAT(body->mass, WithinRel(2.0f, 1e-5f));
        REQUIRE_THAT(body->effective_inv_mass(), WithinRel(0.5f, 1e-5f));
    }

    SECTION("dynamic from a plane fails") {
        REQUIRE(Body2::dynamic_from_shape(Shape2{Plane2{}}, 1.0f).is_err());
    }

    SECTION("defaults") {
        Body2 body;
        REQUIRE(body.restitution == 0.0f);
        REQUIRE(body.friction == 0.5f);
        REQUIRE(body.layer == layers::Default);
        REQUIRE(body.mask == layers::All);
        REQUIRE_FALSE(body.is_trigger());
    }
}

TEST_CASE("Body validation", "[physics][body]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    auto body = Body3::dynamic_from_shape(Shape3{Sphere{0.5f}}, 1.0f).unwrap();
    REQUIRE(body.validate(EntityId{1}).is_ok());

    SECTION("non-finite velocity") {
        body.linear_velocity.x = nan;
        auto result = body.validate(EntityId{9});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<BodyError>()->kind == BodyError::Kind::NonFiniteVelocity);
        REQUIRE(result.error().as<BodyError>()->entity == 9);
    }

    SECTION("non-finite angular velocity") {
        body.angular_velocity.z = consts::INFINITY_F;
        REQUIRE(body.validate(EntityId{1}).is_err());
    }

    SECTION("dynamic body with zero mass") {
        body.mass = 0.0f;
        auto result = body.validate(EntityId{1});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<BodyError>()->kind == BodyError::Kind::InvalidMass);
    }

    SECTION("static body ignores mass") {
        auto ground = Body3::make_static();
        REQUIRE(ground.validate(EntityId{1}).is_ok());
    }

    SECTION("negative friction") {
        body.friction = -0.1f;
        REQUIRE(body.validate(EntityId{1}).is_err());
    }

    SECTION("inverse mass must match mass") {
        body.inv_mass = 2.0f * body.inv_mass;
        auto result = body.validate(EntityId{1});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<BodyError>()->kind == BodyError::Kind::InvalidMass);
    }

    SECTION("negative inverse inertia") {
        body.inv_inertia[1][1] = -1.0f;
        auto result = body.validate(EntityId{1});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<BodyError>()->kind == BodyError::Kind::InvalidMass);
    }

    SECTION("2D negative inverse inertia") {
        auto disc = Body2::dynamic_from_shape(Shape2{Circle{0.5f}}, 1.0f).unwrap();
        REQUIRE(disc.validate(EntityId{1}).is_ok());
        disc.inv_inertia = -1.0f;
        REQUIRE(disc.validate(EntityId{1}).is_err());
    }
}
