/// @file shape.cpp
/// @brief Collision shape validation, bounds and factories for impulse_physics

#include <impulse/physics/shape.hpp>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace impulse_physics {

using impulse_core::Err;
using impulse_core::Ok;
using impulse_core::Result;
using impulse_core::ShapeError;
using impulse_math::AABB;
using impulse_math::AABB2;
using impulse_math::Vec2;
using impulse_math::Vec3;

namespace {

// =============================================================================
// Validation Helpers
// =============================================================================

Result<void> check_radius(const char* name, float radius) {
    if (!std::isfinite(radius)) {
        return Err(ShapeError::non_finite(name));
    }
    if (radius <= 0.0f) {
        return Err(ShapeError::invalid_dimension(name, "radius must be positive"));
    }
    return Ok();
}

Result<void> check_half_height(const char* name, float half_height) {
    if (!std::isfinite(half_height)) {
        return Err(ShapeError::non_finite(name));
    }
    if (half_height <= 0.0f) {
        return Err(ShapeError::invalid_dimension(name, "half height must be positive"));
    }
    return Ok();
}

template<typename V>
Result<void> check_extents(const char* name, const V& half_extents) {
    if (!impulse_math::is_finite(half_extents)) {
        return Err(ShapeError::non_finite(name));
    }
    for (int i = 0; i < V::length(); ++i) {
        if (half_extents[i] <= 0.0f) {
            return Err(ShapeError::invalid_dimension(name, "half extents must be positive"));
        }
    }
    return Ok();
}

template<typename V>
Result<void> check_normal(const char* name, const V& normal, float offset) {
    if (!impulse_math::is_finite(normal) || !std::isfinite(offset)) {
        return Err(ShapeError::non_finite(name));
    }
    if (std::abs(impulse_math::length(normal) - 1.0f) > 1.0e-3f) {
        return Err(ShapeError::degenerate_normal(name));
    }
    return Ok();
}

/// Twice the signed area of a polygon (positive for counter-clockwise)
float signed_area_2x(const std::vector<Vec2>& vertices) {
    float area = 0.0f;
    std::size_t n = vertices.size();
    for (std::size_t i = 0; i < n; ++i) {
        area += impulse_math::cross(vertices[i], vertices[(i + 1) % n]);
    }
    return area;
}

Result<void> check_polygon(const ConvexPolygon& polygon) {
    const auto& v = polygon.vertices;
    if (v.size() < 3) {
        return Err(ShapeError::too_few_vertices("ConvexPolygon", v.size(), 3));
    }
    for (const auto& p : v) {
        if (!impulse_math::is_finite(p)) {
            return Err(ShapeError::non_finite("ConvexPolygon"));
        }
    }
    if (signed_area_2x(v) <= k_min_shape_measure) {
        return Err(ShapeError::not_convex("ConvexPolygon"));
    }

    // Every turn must be a strict left turn
    std::size_t n = v.size();
    for (std::size_t i = 0; i < n; ++i) {
        Vec2 e0 = v[(i + 1) % n] - v[i];
        Vec2 e1 = v[(i + 2) % n] - v[(i + 1) % n];
        if (impulse_math::cross(e0, e1) <= 0.0f) {
            return Err(ShapeError::not_convex("ConvexPolygon"));
        }
    }
    return Ok();
}

Result<void> check_polyhedron(const ConvexPolyhedron& polyhedron) {
    const auto& v = polyhedron.vertices;
    if (v.size() < 4) {
        return Err(ShapeError::too_few_vertices("ConvexPolyhedron", v.size(), 4));
    }
    for (const auto& p : v) {
        if (!impulse_math::is_finite(p)) {
            return Err(ShapeError::non_finite("ConvexPolyhedron"));
        }
    }

    // Find a non-degenerate tetrahedron: farthest point, farthest from line,
    // farthest from plane
    const Vec3& a = v[0];
    std::size_t ib = 0;
    float best = 0.0f;
    for (std::size_t i = 1; i < v.size(); ++i) {
        float d = impulse_math::length_squared(v[i] - a);
        if (d > best) { best = d; ib = i; }
    }
    if (best <= k_min_shape_measure) {
        return Err(ShapeError::invalid_dimension("ConvexPolyhedron", "vertices are coincident"));
    }

    Vec3 ab = v[ib] - a;
    std::size_t ic = 0;
    best = 0.0f;
    for (std::size_t i = 1; i < v.size(); ++i) {
        float d = impulse_math::length_squared(impulse_math::cross(ab, v[i] - a));
        if (d > best) { best = d; ic = i; }
    }
    if (best <= k_min_shape_measure) {
        return Err(ShapeError::invalid_dimension("ConvexPolyhedron", "vertices are collinear"));
    }

    Vec3 normal = impulse_math::cross(ab, v[ic] - a);
    best = 0.0f;
    for (std::size_t i = 1; i < v.size(); ++i) {
        best = std::max(best, std::abs(impulse_math::dot(normal, v[i] - a)));
    }
    if (best <= k_min_shape_measure) {
        return Err(ShapeError::invalid_dimension("ConvexPolyhedron", "vertices are coplanar"));
    }
    return Ok();
}

// =============================================================================
// Bounds Helpers
// =============================================================================

/// Large box clipped along an axis-aligned plane normal
template<typename Bounds, typename V>
Bounds plane_bounds(const V& world_normal, float world_offset) {
    Bounds bounds(V(-k_plane_extent), V(k_plane_extent));
    for (int axis = 0; axis < V::length(); ++axis) {
        if (world_normal[axis] > 1.0f - 1.0e-6f) {
            bounds.max[axis] = world_offset;
            bounds.min[axis] = std::min(bounds.min[axis], bounds.max[axis]);
        } else if (world_normal[axis] < -1.0f + 1.0e-6f) {
            bounds.min[axis] = -world_offset;
            bounds.max[axis] = std::max(bounds.max[axis], bounds.min[axis]);
        }
    }
    return bounds;
}

} // anonymous namespace

// =============================================================================
// Names
// =============================================================================

const char* shape_name(const Shape2& shape) {
    return std::visit([](const auto& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Circle>) return "Circle";
        else if constexpr (std::is_same_v<T, Box2>) return "Box2";
        else if constexpr (std::is_same_v<T, ConvexPolygon>) return "ConvexPolygon";
        else if constexpr (std::is_same_v<T, Capsule2>) return "Capsule2";
        else return "Plane2";
    }, shape);
}

const char* shape_name(const Shape3& shape) {
    return std::visit([](const auto& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Sphere>) return "Sphere";
        else if constexpr (std::is_same_v<T, Box>) return "Box";
        else if constexpr (std::is_same_v<T, ConvexPolyhedron>) return "ConvexPolyhedron";
        else if constexpr (std::is_same_v<T, Capsule>) return "Capsule";
        else return "Plane";
    }, shape);
}

bool is_plane(const Shape2& shape) noexcept {
    return std::holds_alternative<Plane2>(shape);
}

bool is_plane(const Shape3& shape) noexcept {
    return std::holds_alternative<Plane>(shape);
}

// =============================================================================
// Validation
// =============================================================================

Result<void> validate_shape(const Shape2& shape) {
    return std::visit([](const auto& s) -> Result<void> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Circle>) {
            return check_radius("Circle", s.radius);
        } else if constexpr (std::is_same_v<T, Box2>) {
            return check_extents("Box2", s.half_extents);
        } else if constexpr (std::is_same_v<T, ConvexPolygon>) {
            return check_polygon(s);
        } else if constexpr (std::is_same_v<T, Capsule2>) {
            auto r = check_radius("Capsule2", s.radius);
            if (!r) return r;
            return check_half_height("Capsule2", s.half_height);
        } else {
            return check_normal("Plane2", s.normal, s.offset);
        }
    }, shape);
}

Result<void> validate_shape(const Shape3& shape) {
    return std::visit([](const auto& s) -> Result<void> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Sphere>) {
            return check_radius("Sphere", s.radius);
        } else if constexpr (std::is_same_v<T, Box>) {
            return check_extents("Box", s.half_extents);
        } else if constexpr (std::is_same_v<T, ConvexPolyhedron>) {
            return check_polyhedron(s);
        } else if constexpr (std::is_same_v<T, Capsule>) {
            auto r = check_radius("Capsule", s.radius);
            if (!r) return r;
            return check_half_height("Capsule", s.half_height);
        } else {
            return check_normal("Plane", s.normal, s.offset);
        }
    }, shape);
}

// =============================================================================
// Bounds
// =============================================================================

AABB2 compute_bounds(const Shape2& shape, const Pose2& pose) {
    return std::visit([&pose](const auto& s) -> AABB2 {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Circle>) {
            return AABB2::from_center_half_extents(pose.position, Vec2(s.radius * pose.scale));
        } else if constexpr (std::is_same_v<T, Box2>) {
            float c = std::abs(std::cos(pose.rotation));
            float sn = std::abs(std::sin(pose.rotation));
            Vec2 h = s.half_extents * pose.scale;
            Vec2 extent(c * h.x + sn * h.y, sn * h.x + c * h.y);
            return AABB2::from_center_half_extents(pose.position, extent);
        } else if constexpr (std::is_same_v<T, ConvexPolygon>) {
            AABB2 bounds;
            for (const auto& v : s.vertices) {
                bounds.expand_to_include(pose.transform_point(v));
            }
            return bounds;
        } else if constexpr (std::is_same_v<T, Capsule2>) {
            Vec2 tip = pose.transform_direction(Vec2(0.0f, s.half_height * pose.scale));
            AABB2 bounds;
            bounds.expand_to_include(pose.position + tip);
            bounds.expand_to_include(pose.position - tip);
            return bounds.expanded(s.radius * pose.scale);
        } else {
            Vec2 normal = pose.transform_direction(s.normal);
            Vec2 point = pose.transform_point(s.normal * s.offset);
            return plane_bounds<AABB2>(normal, impulse_math::dot(normal, point));
        }
    }, shape);
}

AABB compute_bounds(const Shape3& shape, const Pose3& pose) {
    return std::visit([&pose](const auto& s) -> AABB {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Sphere>) {
            return AABB::from_center_half_extents(pose.position, Vec3(s.radius * pose.scale));
        } else if constexpr (std::is_same_v<T, Box>) {
            impulse_math::Mat3 rot = impulse_math::quat_to_mat3(pose.rotation);
            Vec3 h = s.half_extents * pose.scale;
            Vec3 extent(0.0f);
            for (int col = 0; col < 3; ++col) {
                extent += impulse_math::abs(rot[col]) * h[col];
            }
            return AABB::from_center_half_extents(pose.position, extent);
        } else if constexpr (std::is_same_v<T, ConvexPolyhedron>) {
            AABB bounds;
            for (const auto& v : s.vertices) {
                bounds.expand_to_include(pose.transform_point(v));
            }
            return bounds;
        } else if constexpr (std::is_same_v<T, Capsule>) {
            Vec3 tip = pose.transform_direction(Vec3(0.0f, s.half_height * pose.scale, 0.0f));
            AABB bounds;
            bounds.expand_to_include(pose.position + tip);
            bounds.expand_to_include(pose.position - tip);
            return bounds.expanded(s.radius * pose.scale);
        } else {
            Vec3 normal = pose.transform_direction(s.normal);
            Vec3 point = pose.transform_point(s.normal * s.offset);
            return plane_bounds<AABB>(normal, impulse_math::dot(normal, point));
        }
    }, shape);
}

// =============================================================================
// ShapeFactory
// =============================================================================

namespace {

template<typename D, typename T>
Result<SharedShape<D>> make_validated(T primitive) {
    ShapeOf<D> shape(std::move(primitive));
    auto valid = validate_shape(shape);
    if (!valid) {
        return Err<SharedShape<D>>(valid.error());
    }
    return Ok<SharedShape<D>>(std::make_shared<const ShapeOf<D>>(std::move(shape)));
}

template<typename V>
bool normalize_plane(V& normal, float& offset) {
    if (!impulse_math::is_finite(normal) || !std::isfinite(offset)) {
        return false;
    }
    float len = impulse_math::length(normal);
    if (len < impulse_math::consts::EPSILON) {
        return false;
    }
    normal /= len;
    offset /= len;
    return true;
}

} // anonymous namespace

Result<SharedShape2> ShapeFactory::circle(float radius) {
    return make_validated<Dim2>(Circle{radius});
}

Result<SharedShape2> ShapeFactory::box2(const Vec2& half_extents) {
    return make_validated<Dim2>(Box2{half_extents});
}

Result<SharedShape2> ShapeFactory::box2(float hx, float hy) {
    return box2(Vec2(hx, hy));
}

Result<SharedShape2> ShapeFactory::convex_polygon(std::vector<Vec2> vertices) {
    if (vertices.size() >= 3 && signed_area_2x(vertices) < 0.0f) {
        std::reverse(vertices.begin(), vertices.end());
    }
    return make_validated<Dim2>(ConvexPolygon{std::move(vertices)});
}

Result<SharedShape2> ShapeFactory::capsule2(float half_height, float radius) {
    return make_validated<Dim2>(Capsule2{half_height, radius});
}

Result<SharedShape2> ShapeFactory::plane2(const Vec2& normal, float offset) {
    Vec2 n = normal;
    float d = offset;
    if (!normalize_plane(n, d)) {
        if (!impulse_math::is_finite(normal) || !std::isfinite(offset)) {
            return Err<SharedShape2>(ShapeError::non_finite("Plane2"));
        }
        return Err<SharedShape2>(ShapeError::degenerate_normal("Plane2"));
    }
    return make_validated<Dim2>(Plane2{n, d});
}

Result<SharedShape3> ShapeFactory::sphere(float radius) {
    return make_validated<Dim3>(Sphere{radius});
}

Result<SharedShape3> ShapeFactory::box(const Vec3& half_extents) {
    return make_validated<Dim3>(Box{half_extents});
}

Result<SharedShape3> ShapeFactory::box(float hx, float hy, float hz) {
    return box(Vec3(hx, hy, hz));
}

Result<SharedShape3> ShapeFactory::convex_polyhedron(std::vector<Vec3> vertices) {
    return make_validated<Dim3>(ConvexPolyhedron{std::move(vertices)});
}

Result<SharedShape3> ShapeFactory::capsule(float half_height, float radius) {
    return make_validated<Dim3>(Capsule{half_height, radius});
}

Result<SharedShape3> ShapeFactory::plane(const Vec3& normal, float offset) {
    Vec3 n = normal;
    float d = offset;
    if (!normalize_plane(n, d)) {
        if (!impulse_math::is_finite(normal) || !std::isfinite(offset)) {
            return Err<SharedShape3>(ShapeError::non_finite("Plane"));
        }
        return Err<SharedShape3>(ShapeError::degenerate_normal("Plane"));
    }
    return make_validated<Dim3>(Plane{n, d});
}

} // namespace impulse_physics
