// impulse_physics shape tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/shape.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace impulse_physics;
using namespace impulse_math;
using impulse_core::ErrorCode;
using impulse_core::ShapeError;
using Catch::Matchers::WithinAbs;

// =============================================================================
// ShapeFactory Tests
// =============================================================================

TEST_CASE("ShapeFactory round shapes", "[physics][shape]") {
    SECTION("valid circle and sphere") {
        auto circle = ShapeFactory::circle(0.5f);
        REQUIRE(circle.is_ok());
        REQUIRE(std::get<Circle>(**circle).radius == 0.5f);

        auto sphere = ShapeFactory::sphere(2.0f);
        REQUIRE(sphere.is_ok());
        REQUIRE(std::string(shape_name(**sphere)) == "Sphere");
    }

    SECTION("zero or negative radius") {
        auto zero = ShapeFactory::circle(0.0f);
        REQUIRE(zero.is_err());
        REQUIRE(zero.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(zero.error().is<ShapeError>());

        REQUIRE(ShapeFactory::sphere(-1.0f).is_err());
        REQUIRE(ShapeFactory::capsule(0.5f, 0.0f).is_err());
        REQUIRE(ShapeFactory::capsule2(0.0f, 0.25f).is_err());
    }

    SECTION("non-finite radius") {
        auto nan = ShapeFactory::sphere(std::numeric_limits<float>::quiet_NaN());
        REQUIRE(nan.is_err());
        REQUIRE(nan.error().code() == ErrorCode::NumericalError);
    }
}

TEST_CASE("ShapeFactory boxes", "[physics][shape]") {
    REQUIRE(ShapeFactory::box2(1.0f, 2.0f).is_ok());
    REQUIRE(ShapeFactory::box(Vec3(0.5f)).is_ok());

    REQUIRE(ShapeFactory::box2(1.0f, 0.0f).is_err());
    REQUIRE(ShapeFactory::box(0.5f, -0.5f, 0.5f).is_err());
    REQUIRE(ShapeFactory::box(Vec3(consts::INFINITY_F)).is_err());
}

TEST_CASE("ShapeFactory convex polygon", "[physics][shape]") {
    std::vector<Vec2> ccw = {Vec2(0.0f, 0.0f), Vec2(1.0f, 0.0f), Vec2(1.0f, 1.0f), Vec2(0.0f, 1.0f)};

    SECTION("counter-clockwise input is kept") {
        auto shape = ShapeFactory::convex_polygon(ccw);
        REQUIRE(shape.is_ok());
        REQUIRE(std::get<ConvexPolygon>(**shape).vertices == ccw);
    }

    SECTION("clockwise input is reversed") {
        std::vector<Vec2> cw(ccw.rbegin(), ccw.rend());
        auto shape = ShapeFactory::convex_polygon(cw);
        REQUIRE(shape.is_ok());
        REQUIRE(validate_shape(**shape).is_ok());
    }

    SECTION("too few vertices") {
        auto shape = ShapeFactory::convex_polygon({Vec2(0.0f), Vec2(1.0f, 0.0f)});
        REQUIRE(shape.is_err());
        REQUIRE(shape.error().as<ShapeError>()->kind == ShapeError::Kind::TooFewVertices);
    }

    SECTION("reflex vertex is rejected") {
        std::vector<Vec2> dart = {
            Vec2(0.0f, 0.0f), Vec2(2.0f, 0.0f), Vec2(1.0f, 0.5f), Vec2(2.0f, 2.0f), Vec2(0.0f, 2.0f)};
        auto shape = ShapeFactory::convex_polygon(dart);
        REQUIRE(shape.is_err());
        REQUIRE(shape.error().code() == ErrorCode::ValidationError);
    }

    SECTION("collinear vertices are rejected") {
        auto shape = ShapeFactory::convex_polygon({Vec2(0.0f), Vec2(1.0f, 0.0f), Vec2(2.0f, 0.0f)});
        REQUIRE(shape.is_err());
    }
}

TEST_CASE("ShapeFactory convex polyhedron", "[physics][shape]") {
    SECTION("tetrahedron") {
        auto shape = ShapeFactory::convex_polyhedron(
            {Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f)});
        REQUIRE(shape.is_ok());
    }

    SECTION("coplanar points") {
        auto shape = ShapeFactory::convex_polyhedron(
            {Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f), Vec3(1.0f, 1.0f, 0.0f)});
        REQUIRE(shape.is_err());
        REQUIRE(shape.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("too few vertices") {
        auto shape = ShapeFactory::convex_polyhedron({Vec3(0.0f), Vec3(1.0f), Vec3(2.0f, 0.0f, 0.0f)});
        REQUIRE(shape.is_err());
    }
}

TEST_CASE("ShapeFactory planes", "[physics][shape]") {
    SECTION("normal is normalized together with the offset") {
        auto shape = ShapeFactory::plane(Vec3(0.0f, 2.0f, 0.0f), 4.0f);
        REQUIRE(shape.is_ok());
        const auto& plane = std::get<Plane>(**shape);
        REQUIRE(approx_equal(plane.normal, vec3::Y));
        REQUIRE_THAT(plane.offset, WithinAbs(2.0f, 1e-6f));
        REQUIRE(is_plane(**shape));
    }

    SECTION("zero normal") {
        auto shape = ShapeFactory::plane2(Vec2(0.0f), 0.0f);
        REQUIRE(shape.is_err());
        REQUIRE(shape.error().code() == ErrorCode::NumericalError);
    }

    SECTION("non-finite offset") {
        REQUIRE(ShapeFactory::plane(vec3::Y, consts::INFINITY_F).is_err());
    }

    SECTION("validation rejects a hand-built unnormalized plane") {
        Shape3 plane = Plane{Vec3(0.0f, 3.0f, 0.0f), 0.0f};
        REQUIRE(validate_shape(plane).is_err());
    }
}

// =============================================================================
// Bounds Tests
// =============================================================================

TEST_CASE("compute_bounds 2D", "[physics][shape][bounds]") {
    SECTION("circle with scale") {
        Pose2 pose;
        pose.position = Vec2(1.0f, 2.0f);
        pose.scale = 2.0f;
        AABB2 bounds = compute_bounds(Shape2{Circle{0.5f}}, pose);
        REQUIRE(approx_equal(bounds.min, Vec2(0.0f, 1.0f)));
        REQUIRE(approx_equal(bounds.max, Vec2(2.0f, 3.0f)));
    }

    SECTION("rotated box grows its bounds") {
        Pose2 pose;
        pose.rotation = 0.5f * consts::FRAC_PI_2;
        AABB2 bounds = compute_bounds(Shape2{Box2{Vec2(1.0f)}}, pose);
        REQUIRE_THAT(bounds.max.x, WithinAbs(std::sqrt(2.0f), 1e-5f));
        REQUIRE_THAT(bounds.min.y, WithinAbs(-std::sqrt(2.0f), 1e-5f));
    }

    SECTION("capsule along Y") {
        AABB2 bounds = compute_bounds(Shape2{Capsule2{1.0f, 0.25f}}, Pose2{});
        REQUIRE(approx_equal(bounds.min, Vec2(-0.25f, -1.25f)));
        REQUIRE(approx_equal(bounds.max, Vec2(0.25f, 1.25f)));
    }

    SECTION("ground plane is clipped at its surface") {
        AABB2 bounds = compute_bounds(Shape2{Plane2{Vec2(0.0f, 1.0f), 0.0f}}, Pose2{});
        REQUIRE(bounds.max.y == 0.0f);
        REQUIRE(bounds.min.y == -k_plane_extent);
        REQUIRE(bounds.max.x == k_plane_extent);
        REQUIRE(is_finite(bounds));
    }
}

TEST_CASE("compute_bounds 3D", "[physics][shape][bounds]") {
    SECTION("box is conservative under rotation") {
        Pose3 pose;
        pose.rotation = quat_from_axis_angle(vec3::Y, 0.7f);
        Shape3 shape = Box{Vec3(1.0f, 0.5f, 2.0f)};
        AABB bounds = compute_bounds(shape, pose);

        const auto& box = std::get<Box>(shape);
        for (int i = 0; i < 8; ++i) {
            Vec3 corner((i & 1) ? box.half_extents.x : -box.half_extents.x,
                        (i & 2) ? box.half_extents.y : -box.half_extents.y,
                        (i & 4) ? box.half_extents.z : -box.half_extents.z);
            REQUIRE(bounds.expanded(1e-4f).contains_point(pose.transform_point(corner)));
        }
    }

    SECTION("polyhedron bounds follow the transformed vertices") {
        Pose3 pose;
        pose.position = Vec3(5.0f, 0.0f, 0.0f);
        Shape3 shape = ConvexPolyhedron{
            {Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f)}};
        AABB bounds = compute_bounds(shape, pose);
        REQUIRE(approx_equal(bounds.min, Vec3(5.0f, 0.0f, 0.0f)));
        REQUIRE(approx_equal(bounds.max, Vec3(6.0f, 1.0f, 1.0f)));
    }

    SECTION("plane facing down") {
        AABB bounds = compute_bounds(Shape3{Plane{Vec3(0.0f, -1.0f, 0.0f), 3.0f}}, Pose3{});
        REQUIRE(bounds.min.y == -3.0f);
        REQUIRE(bounds.max.y == k_plane_extent);
    }
}
