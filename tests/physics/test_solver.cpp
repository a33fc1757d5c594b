// impulse_physics contact resolver tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/solver.hpp>
#include <impulse/physics/narrowphase.hpp>

#include <vector>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

SolverBody<Dim3> sphere_body(std::uint64_t id, const Vec3& position, const Vec3& velocity,
                             float restitution = 0.0f) {
    SolverBody<Dim3> sb;
    sb.id = EntityId{id};
    sb.pose.position = position;
    sb.body = Body3::dynamic_from_shape(Shape3{Sphere{0.5f}}, 1.0f).unwrap();
    sb.body.linear_velocity = velocity;
    sb.body.restitution = restitution;
    return sb;
}

SolverBody<Dim3> ground_body(std::uint64_t id, float restitution = 0.0f) {
    SolverBody<Dim3> sb;
    sb.id = EntityId{id};
    sb.body = Body3::make_static();
    sb.body.restitution = restitution;
    return sb;
}

/// Single-point manifold, A above a ground plane (normal from A into the plane)
ContactManifold3D ground_contact(std::uint64_t a, std::uint64_t b, const Vec3& point, float depth) {
    ContactManifold3D manifold;
    manifold.pair = CandidatePair{EntityId{a}, EntityId{b}};
    manifold.normal = -vec3::Y;
    manifold.points.push_back({point, depth});
    finalize_manifold(manifold, k_max_manifold_points);
    return manifold;
}

} // anonymous namespace

// =============================================================================
// Normal Response
// =============================================================================

TEST_CASE("Resolver bounces an elastic sphere off static ground", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {
        sphere_body(1, Vec3(0.0f, 0.45f, 0.0f), Vec3(0.0f, -5.0f, 0.0f), 1.0f),
        ground_body(2, 1.0f),
    };
    std::vector<ContactManifold3D> manifolds = {ground_contact(1, 2, Vec3(0.0f, -0.025f, 0.0f), 0.05f)};

    ContactResolver3D resolver;
    auto result = resolver.resolve(manifolds, bodies);

    REQUIRE(result.deltas.size() == 2);
    REQUIRE(result.solved_points == 1);
    REQUIRE(result.skipped_manifolds == 0);

    const auto& delta = result.deltas[0];
    REQUIRE_THAT(delta.linear.y, WithinAbs(10.0f, 1e-4f));
    REQUIRE_THAT(delta.linear.x, WithinAbs(0.0f, 1e-5f));
    REQUIRE(delta.position.y > 0.0f);
    REQUIRE_THAT(delta.position.y, WithinAbs((0.05f - 0.01f) * 0.2f, 1e-5f));

    // The contact point is directly below the center: no spin
    REQUIRE_THAT(length(delta.angular), WithinAbs(0.0f, 1e-5f));

    REQUIRE(result.deltas[1].is_zero());
}

TEST_CASE("Resolver ignores slow approach for restitution", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {
        sphere_body(1, Vec3(0.0f, 0.5f, 0.0f), Vec3(0.0f, -0.5f, 0.0f), 1.0f),
        ground_body(2, 1.0f),
    };
    std::vector<ContactManifold3D> manifolds = {ground_contact(1, 2, Vec3(0.0f), 0.0f)};

    ContactResolver3D resolver;
    auto result = resolver.resolve(manifolds, bodies);

    // Below the threshold the sphere just stops
    REQUIRE_THAT(result.deltas[0].linear.y, WithinAbs(0.5f, 1e-5f));
}

TEST_CASE("Resolver leaves a resting contact untouched", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {
        sphere_body(1, Vec3(0.0f, 0.5f, 0.0f), Vec3(0.0f)),
        ground_body(2),
    };
    std::vector<ContactManifold3D> manifolds = {ground_contact(1, 2, Vec3(0.0f), 0.0f)};

    ContactResolver3D resolver;
    auto result = resolver.resolve(manifolds, bodies);
    REQUIRE(result.deltas[0].is_zero());
    REQUIRE(result.deltas[1].is_zero());
}

TEST_CASE("Resolver conserves momentum between dynamic bodies", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {
        sphere_body(1, Vec3(0.0f), Vec3(2.0f, 0.0f, 0.0f)),
        sphere_body(2, Vec3(0.9f, 0.0f, 0.0f), Vec3(-2.0f, 0.0f, 0.0f)),
    };

    auto manifold = NarrowPhase::test(Shape3{Sphere{0.5f}}, bodies[0].pose,
                                      Shape3{Sphere{0.5f}}, bodies[1].pose);
    REQUIRE(manifold.has_value());
    manifold->pair = CandidatePair{EntityId{1}, EntityId{2}};
    std::vector<ContactManifold3D> manifolds = {*manifold};

    ContactResolver3D resolver;
    auto result = resolver.resolve(manifolds, bodies);

    // Perfectly inelastic head-on collision of equal masses: both stop
    REQUIRE_THAT(result.deltas[0].linear.x, WithinAbs(-2.0f, 1e-4f));
    REQUIRE_THAT(result.deltas[1].linear.x, WithinAbs(2.0f, 1e-4f));

    // Equal masses share the positional correction
    REQUIRE(result.deltas[0].position.x < 0.0f);
    REQUIRE_THAT(result.deltas[0].position.x, WithinAbs(-result.deltas[1].position.x, 1e-6f));
}

// =============================================================================
// Friction
// =============================================================================

TEST_CASE("Resolver friction slows sliding and spins a circle", "[physics][solver][friction]") {
    SolverBody<Dim2> circle;
    circle.id = EntityId{1};
    circle.pose.position = Vec2(0.0f, 0.5f);
    circle.body = Body2::dynamic_from_shape(Shape2{Circle{0.5f}}, 1.0f).unwrap();
    circle.body.linear_velocity = Vec2(3.0f, -2.0f);

    SolverBody<Dim2> ground;
    ground.id = EntityId{2};
    ground.body = Body2::make_static();

    ContactManifold2D manifold;
    manifold.pair = CandidatePair{EntityId{1}, EntityId{2}};
    manifold.normal = Vec2(0.0f, -1.0f);
    manifold.points.push_back({Vec2(0.0f, 0.0f), 0.0f});
    finalize_manifold(manifold, k_max_manifold_points);

    std::vector<SolverBody<Dim2>> bodies = {circle, ground};
    std::vector<ContactManifold2D> manifolds = {manifold};

    ContactResolver2D resolver;
    auto result = resolver.resolve(manifolds, bodies);
    const auto& delta = result.deltas[0];

    float final_vx = circle.body.linear_velocity.x + delta.linear.x;
    REQUIRE_THAT(delta.linear.y, WithinAbs(2.0f, 1e-4f));
    REQUIRE(final_vx < 3.0f);
    REQUIRE(final_vx > 0.0f);
    // Sliding right along the ground rolls clockwise
    REQUIRE(delta.angular < 0.0f);

    SECTION("frictionless materials keep the tangential velocity") {
        bodies[0].body.friction = 0.0f;
        bodies[1].body.friction = 0.0f;
        auto slick = resolver.resolve(manifolds, bodies);
        REQUIRE_THAT(slick.deltas[0].linear.x, WithinAbs(0.0f, 1e-6f));
        REQUIRE(slick.deltas[0].angular == 0.0f);
    }
}

// =============================================================================
// Robustness
// =============================================================================

TEST_CASE("Resolver skips manifolds with unknown bodies", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {
        sphere_body(1, Vec3(0.0f, 0.45f, 0.0f), Vec3(0.0f, -5.0f, 0.0f)),
    };
    std::vector<ContactManifold3D> manifolds = {ground_contact(1, 99, Vec3(0.0f), 0.05f)};

    ContactResolver3D resolver;
    auto result = resolver.resolve(manifolds, bodies);
    REQUIRE(result.skipped_manifolds == 1);
    REQUIRE(result.solved_points == 0);
    REQUIRE(result.deltas[0].is_zero());
}

TEST_CASE("Resolver skips points between two immovable bodies", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {ground_body(1), ground_body(2)};
    bodies[0].body = Body3::make_kinematic(Vec3(0.0f, -1.0f, 0.0f));
    std::vector<ContactManifold3D> manifolds = {ground_contact(1, 2, Vec3(0.0f), 0.2f)};

    ContactResolver3D resolver;
    auto result = resolver.resolve(manifolds, bodies);
    REQUIRE(result.skipped_points == 1);
    REQUIRE(result.deltas[0].is_zero());
    REQUIRE(result.deltas[1].is_zero());
}

TEST_CASE("Resolver result does not depend on manifold order", "[physics][solver]") {
    std::vector<SolverBody<Dim3>> bodies = {
        sphere_body(1, Vec3(0.0f, 0.45f, 0.0f), Vec3(0.5f, -3.0f, 0.0f)),
        ground_body(2),
        sphere_body(3, Vec3(0.9f, 0.45f, 0.0f), Vec3(-1.0f, -3.0f, 0.0f)),
    };

    auto between = NarrowPhase::test(Shape3{Sphere{0.5f}}, bodies[0].pose,
                                     Shape3{Sphere{0.5f}}, bodies[2].pose);
    REQUIRE(between.has_value());
    between->pair = CandidatePair{EntityId{1}, EntityId{3}};

    std::vector<ContactManifold3D> forward = {
        ground_contact(1, 2, Vec3(0.0f, -0.025f, 0.0f), 0.05f),
        *between,
        ground_contact(2, 3, Vec3(0.9f, -0.025f, 0.0f), 0.05f),
    };
    // Ground is A in the (2, 3) pair, so the normal points up into the sphere
    forward[2].flip();
    std::vector<ContactManifold3D> backward(forward.rbegin(), forward.rend());

    ContactResolver3D resolver;
    auto first = resolver.resolve(forward, bodies);
    auto second = resolver.resolve(backward, bodies);

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        REQUIRE(first.deltas[i].linear == second.deltas[i].linear);
        REQUIRE(first.deltas[i].angular == second.deltas[i].angular);
        REQUIRE(first.deltas[i].position == second.deltas[i].position);
    }
}
