/// @file body.cpp
/// @brief Mass property computation for impulse_physics

#include <impulse/physics/body.hpp>

#include <cmath>
#include <type_traits>

namespace impulse_physics {

using impulse_core::Err;
using impulse_core::Ok;
using impulse_core::Result;
using impulse_core::ShapeError;
using impulse_math::Vec2;
using impulse_math::Vec3;
namespace consts = impulse_math::consts;

namespace {

Result<void> check_density(const char* name, float density, float scale) {
    if (!std::isfinite(density) || !std::isfinite(scale)) {
        return Err(ShapeError::non_finite(name));
    }
    if (density <= 0.0f) {
        return Err(ShapeError::invalid_dimension(name, "density must be positive"));
    }
    if (scale <= 0.0f) {
        return Err(ShapeError::invalid_dimension(name, "scale must be positive"));
    }
    return Ok();
}

float safe_inverse(float value) {
    return value > consts::EPSILON ? 1.0f / value : 0.0f;
}

/// Area and second moment about the local origin of a polygon (triangle fan)
void polygon_mass(const std::vector<Vec2>& vertices, float scale, float& area, float& inertia) {
    area = 0.0f;
    inertia = 0.0f;
    std::size_t n = vertices.size();
    for (std::size_t i = 0; i < n; ++i) {
        Vec2 e1 = vertices[i] * scale;
        Vec2 e2 = vertices[(i + 1) % n] * scale;
        float d = impulse_math::cross(e1, e2);
        area += 0.5f * d;

        float intx2 = e1.x * e1.x + e2.x * e1.x + e2.x * e2.x;
        float inty2 = e1.y * e1.y + e2.y * e1.y + e2.y * e2.y;
        inertia += (0.25f / 3.0f * d) * (intx2 + inty2);
    }
}

MassProperties<Dim3> from_diagonal(float mass, const Vec3& inertia) {
    MassProperties<Dim3> props;
    props.mass = mass;
    props.inv_mass = safe_inverse(mass);
    props.inv_inertia = impulse_math::Mat3(0.0f);
    props.inv_inertia[0][0] = safe_inverse(inertia.x);
    props.inv_inertia[1][1] = safe_inverse(inertia.y);
    props.inv_inertia[2][2] = safe_inverse(inertia.z);
    return props;
}

} // anonymous namespace

// =============================================================================
// 2D Mass Properties
// =============================================================================

Result<MassProperties<Dim2>> compute_mass_properties(const Shape2& shape, float density, float scale) {
    const char* name = shape_name(shape);
    auto valid = validate_shape(shape);
    if (!valid) {
        return Err<MassProperties<Dim2>>(valid.error());
    }
    auto dens = check_density(name, density, scale);
    if (!dens) {
        return Err<MassProperties<Dim2>>(dens.error());
    }
    if (is_plane(shape)) {
        return Err<MassProperties<Dim2>>(ShapeError::invalid_dimension(name, "planes have no finite mass"));
    }

    float mass = 0.0f;
    float inertia = 0.0f;

    if (const auto* circle = std::get_if<Circle>(&shape)) {
        float r = circle->radius * scale;
        mass = density * consts::PI * r * r;
        inertia = 0.5f * mass * r * r;
    } else if (const auto* box = std::get_if<Box2>(&shape)) {
        Vec2 h = box->half_extents * scale;
        mass = density * 4.0f * h.x * h.y;
        inertia = mass * (h.x * h.x + h.y * h.y) / 3.0f;
    } else if (const auto* polygon = std::get_if<ConvexPolygon>(&shape)) {
        float area = 0.0f;
        polygon_mass(polygon->vertices, scale, area, inertia);
        mass = density * area;
        inertia *= density;
    } else if (const auto* capsule = std::get_if<Capsule2>(&shape)) {
        float r = capsule->radius * scale;
        float h = capsule->half_height * scale;
        float rr = r * r;
        float box_mass = density * (2.0f * r) * (2.0f * h);
        float circle_mass = density * consts::PI * rr;
        float lc = 4.0f * r / (3.0f * consts::PI);
        mass = box_mass + circle_mass;
        inertia = circle_mass * (0.5f * rr + h * h + 2.0f * h * lc) +
                  box_mass * (4.0f * rr + 4.0f * h * h) / 12.0f;
    }

    MassProperties<Dim2> props;
    props.mass = mass;
    props.inv_mass = safe_inverse(mass);
    props.inv_inertia = safe_inverse(inertia);
    return Ok(props);
}

// =============================================================================
// 3D Mass Properties
// =============================================================================

Result<MassProperties<Dim3>> compute_mass_properties(const Shape3& shape, float density, float scale) {
    const char* name = shape_name(shape);
    auto valid = validate_shape(shape);
    if (!valid) {
        return Err<MassProperties<Dim3>>(valid.error());
    }
    auto dens = check_density(name, density, scale);
    if (!dens) {
        return Err<MassProperties<Dim3>>(dens.error());
    }
    if (is_plane(shape)) {
        return Err<MassProperties<Dim3>>(ShapeError::invalid_dimension(name, "planes have no finite mass"));
    }

    if (const auto* sphere = std::get_if<Sphere>(&shape)) {
        float r = sphere->radius * scale;
        float mass = density * (4.0f / 3.0f) * consts::PI * r * r * r;
        float i = (2.0f / 5.0f) * mass * r * r;
        return Ok(from_diagonal(mass, Vec3(i)));
    }

    if (const auto* box = std::get_if<Box>(&shape)) {
        Vec3 h = box->half_extents * scale;
        float mass = density * 8.0f * h.x * h.y * h.z;
        Vec3 h2 = h * h;
        return Ok(from_diagonal(mass, Vec3(
            mass * (h2.y + h2.z) / 3.0f,
            mass * (h2.x + h2.z) / 3.0f,
            mass * (h2.x + h2.y) / 3.0f)));
    }

    if (const auto* capsule = std::get_if<Capsule>(&shape)) {
        float r = capsule->radius * scale;
        float h = capsule->half_height * scale;
        float volume = consts::PI * r * r * (2.0f * h) + (4.0f / 3.0f) * consts::PI * r * r * r;
        float mass = density * volume;
        float r2 = r * r;
        float h2 = h * h;
        float i_axial = 0.5f * mass * r2;
        float i_transverse = mass * (r2 / 4.0f + h2 / 3.0f);
        return Ok(from_diagonal(mass, Vec3(i_transverse, i_axial, i_transverse)));
    }

    // Convex polyhedron: approximated by its bounding box
    const auto& polyhedron = std::get<ConvexPolyhedron>(shape);
    impulse_math::AABB local = impulse_math::AABB::from_points(polyhedron.vertices);
    Vec3 size = local.size() * scale;
    float mass = density * size.x * size.y * size.z;
    return Ok(from_diagonal(mass, Vec3(
        mass * (size.y * size.y + size.z * size.z) / 12.0f,
        mass * (size.x * size.x + size.z * size.z) / 12.0f,
        mass * (size.x * size.x + size.y * size.y) / 12.0f)));
}

} // namespace impulse_physics
