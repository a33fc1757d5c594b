#pragma once

/// @file shape.hpp
/// @brief Collision shapes and poses for impulse_physics
///
/// Shapes are a closed set of convex primitives held in a std::variant per
/// dimension. They are immutable once built and shared between entities
/// through std::shared_ptr<const Shape>. ShapeFactory validates parameters
/// and is the only way the pipeline expects shapes to be created.

#include "fwd.hpp"
#include "dimension.hpp"

#include <impulse/core/error.hpp>
#include <impulse/math/math.hpp>

#include <memory>
#include <variant>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Pose
// =============================================================================

/// Position, orientation and uniform scale of an entity
template<typename D>
struct Pose {
    typename D::Vector position = D::zero_vector();
    typename D::Rotation rotation = D::identity_rotation();
    float scale = 1.0f;

    /// Transform a local point to world space
    [[nodiscard]] typename D::Vector transform_point(const typename D::Vector& local) const noexcept {
        return position + D::rotate(rotation, local * scale);
    }

    /// Transform a local direction to world space (no scale)
    [[nodiscard]] typename D::Vector transform_direction(const typename D::Vector& local) const noexcept {
        return D::rotate(rotation, local);
    }

    /// Transform a world point to local space
    [[nodiscard]] typename D::Vector inverse_transform_point(const typename D::Vector& world) const noexcept {
        return D::inverse_rotate(rotation, world - position) / scale;
    }

    [[nodiscard]] bool is_finite() const noexcept {
        return D::is_finite(position) && D::is_finite_rotation(rotation) && std::isfinite(scale);
    }

    bool operator==(const Pose& other) const noexcept {
        return position == other.position && rotation == other.rotation && scale == other.scale;
    }
};

using Pose2 = Pose<Dim2>;
using Pose3 = Pose<Dim3>;

// =============================================================================
// 2D Primitives
// =============================================================================

struct Circle {
    float radius = 0.5f;
};

/// Box oriented by the pose; an axis-aligned box has zero rotation
struct Box2 {
    impulse_math::Vec2 half_extents{0.5f, 0.5f};
};

/// Convex polygon, vertices counter-clockwise in local space
struct ConvexPolygon {
    std::vector<impulse_math::Vec2> vertices;
};

/// Segment along local Y from -half_height to +half_height, inflated by radius
struct Capsule2 {
    float half_height = 0.5f;
    float radius = 0.25f;
};

/// Solid half-space { x : dot(normal, x) <= offset }
struct Plane2 {
    impulse_math::Vec2 normal{0.0f, 1.0f};
    float offset = 0.0f;
};

using Shape2 = std::variant<Circle, Box2, ConvexPolygon, Capsule2, Plane2>;

// =============================================================================
// 3D Primitives
// =============================================================================

struct Sphere {
    float radius = 0.5f;
};

struct Box {
    impulse_math::Vec3 half_extents{0.5f, 0.5f, 0.5f};
};

/// Convex hull of a vertex cloud in local space
struct ConvexPolyhedron {
    std::vector<impulse_math::Vec3> vertices;
};

/// Segment along local Y from -half_height to +half_height, inflated by radius
struct Capsule {
    float half_height = 0.5f;
    float radius = 0.25f;
};

/// Solid half-space { x : dot(normal, x) <= offset }
struct Plane {
    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};
    float offset = 0.0f;
};

using Shape3 = std::variant<Sphere, Box, ConvexPolyhedron, Capsule, Plane>;

// =============================================================================
// Dimension Mapping
// =============================================================================

template<typename D> struct ShapeFor;
template<> struct ShapeFor<Dim2> { using type = Shape2; };
template<> struct ShapeFor<Dim3> { using type = Shape3; };

template<typename D>
using ShapeOf = typename ShapeFor<D>::type;

/// Reference-counted immutable shape
template<typename D>
using SharedShape = std::shared_ptr<const ShapeOf<D>>;

using SharedShape2 = SharedShape<Dim2>;
using SharedShape3 = SharedShape<Dim3>;

/// Half-extent used for the bounds of infinite planes
constexpr float k_plane_extent = 1.0e6f;

/// Minimum polygon area / polyhedron extent accepted by validation
constexpr float k_min_shape_measure = 1.0e-6f;

// =============================================================================
// Shape Queries
// =============================================================================

/// Primitive name, for logs and errors
[[nodiscard]] const char* shape_name(const Shape2& shape);
[[nodiscard]] const char* shape_name(const Shape3& shape);

/// Check shape parameters
[[nodiscard]] impulse_core::Result<void> validate_shape(const Shape2& shape);
[[nodiscard]] impulse_core::Result<void> validate_shape(const Shape3& shape);

/// World bounds of a shape at a pose; always contains the transformed shape
[[nodiscard]] impulse_math::AABB2 compute_bounds(const Shape2& shape, const Pose2& pose);
[[nodiscard]] impulse_math::AABB compute_bounds(const Shape3& shape, const Pose3& pose);

[[nodiscard]] bool is_plane(const Shape2& shape) noexcept;
[[nodiscard]] bool is_plane(const Shape3& shape) noexcept;

// =============================================================================
// Shape Factory
// =============================================================================

/// Validating constructors for shared shapes
class ShapeFactory {
public:
    // 2D
    [[nodiscard]] static impulse_core::Result<SharedShape2> circle(float radius);
    [[nodiscard]] static impulse_core::Result<SharedShape2> box2(const impulse_math::Vec2& half_extents);
    [[nodiscard]] static impulse_core::Result<SharedShape2> box2(float hx, float hy);

    /// Accepts either winding; the stored polygon is counter-clockwise
    [[nodiscard]] static impulse_core::Result<SharedShape2> convex_polygon(
        std::vector<impulse_math::Vec2> vertices);

    [[nodiscard]] static impulse_core::Result<SharedShape2> capsule2(float half_height, float radius);
    [[nodiscard]] static impulse_core::Result<SharedShape2> plane2(const impulse_math::Vec2& normal, float offset);

    // 3D
    [[nodiscard]] static impulse_core::Result<SharedShape3> sphere(float radius);
    [[nodiscard]] static impulse_core::Result<SharedShape3> box(const impulse_math::Vec3& half_extents);
    [[nodiscard]] static impulse_core::Result<SharedShape3> box(float hx, float hy, float hz);
    [[nodiscard]] static impulse_core::Result<SharedShape3> convex_polyhedron(
        std::vector<impulse_math::Vec3> vertices);
    [[nodiscard]] static impulse_core::Result<SharedShape3> capsule(float half_height, float radius);
    [[nodiscard]] static impulse_core::Result<SharedShape3> plane(const impulse_math::Vec3& normal, float offset);
};

} // namespace impulse_physics
