/// @file narrowphase2d.cpp
/// @brief 2D contact generation

#include "narrowphase_detail.hpp"

#include <impulse/core/log.hpp>

#include <array>
#include <limits>
#include <type_traits>
#include <variant>
#include <vector>

namespace impulse_physics {

namespace {

using impulse_math::Vec2;
using Manifold = ContactManifold2D;

/// Prefer face axes, and A's faces over B's, unless the other is clearly better
constexpr float k_axis_bias = 1.0e-3f;

// =============================================================================
// World Primitives
// =============================================================================

struct WorldCircle {
    Vec2 center{0.0f};
    float radius = 0.0f;
};

/// Convex polygon with its outward edge normals, optionally inflated by radius.
/// A capsule is the two-vertex case.
struct RoundedPolygon {
    std::vector<Vec2> vertices;
    std::vector<Vec2> normals;
    float radius = 0.0f;
};

struct WorldCapsule {
    Vec2 p0{0.0f};
    Vec2 p1{0.0f};
    float radius = 0.0f;
};

struct WorldPlane {
    Vec2 normal{0.0f, 1.0f};
    float offset = 0.0f;
};

using WorldShape = std::variant<WorldCircle, RoundedPolygon, WorldCapsule, WorldPlane>;

void compute_normals(RoundedPolygon& polygon) {
    const std::size_t count = polygon.vertices.size();
    polygon.normals.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        Vec2 edge = polygon.vertices[(i + 1) % count] - polygon.vertices[i];
        polygon.normals[i] = impulse_math::normalize_or_zero(Vec2(edge.y, -edge.x));
    }
}

RoundedPolygon to_rounded(const WorldCapsule& capsule) {
    RoundedPolygon polygon;
    polygon.vertices = {capsule.p0, capsule.p1};
    Vec2 dir = impulse_math::normalize_or_zero(capsule.p1 - capsule.p0);
    if (impulse_math::length_squared(dir) < 0.5f) {
        dir = impulse_math::vec2::Y;
    }
    polygon.normals = {Vec2(dir.y, -dir.x), Vec2(-dir.y, dir.x)};
    polygon.radius = capsule.radius;
    return polygon;
}

WorldShape to_world(const Shape2& shape, const Pose2& pose) {
    return std::visit([&pose](const auto& s) -> WorldShape {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, Circle>) {
            return WorldCircle{pose.position, s.radius * pose.scale};
        } else if constexpr (std::is_same_v<T, Box2>) {
            const Vec2 h = s.half_extents;
            RoundedPolygon polygon;
            polygon.vertices = {
                pose.transform_point(Vec2(-h.x, -h.y)),
                pose.transform_point(Vec2(h.x, -h.y)),
                pose.transform_point(Vec2(h.x, h.y)),
                pose.transform_point(Vec2(-h.x, h.y)),
            };
            compute_normals(polygon);
            return polygon;
        } else if constexpr (std::is_same_v<T, ConvexPolygon>) {
            RoundedPolygon polygon;
            polygon.vertices.reserve(s.vertices.size());
            for (const auto& v : s.vertices) {
                polygon.vertices.push_back(pose.transform_point(v));
            }
            compute_normals(polygon);
            return polygon;
        } else if constexpr (std::is_same_v<T, Capsule2>) {
            return WorldCapsule{
                pose.transform_point(Vec2(0.0f, -s.half_height)),
                pose.transform_point(Vec2(0.0f, s.half_height)),
                s.radius * pose.scale};
        } else {
            Vec2 n = pose.transform_direction(s.normal);
            return WorldPlane{n, s.offset * pose.scale + impulse_math::dot(n, pose.position)};
        }
    }, shape);
}

Vec2 capsule_fallback_normal(const WorldCapsule& capsule) {
    Vec2 dir = impulse_math::normalize_or_zero(capsule.p1 - capsule.p0);
    if (impulse_math::length_squared(dir) < 0.5f) {
        return impulse_math::vec2::Y;
    }
    return Vec2(dir.y, -dir.x);
}

// =============================================================================
// Separating Axis Test
// =============================================================================

struct AxisQuery {
    float separation = -std::numeric_limits<float>::max();
    int index = -1;
};

/// Greatest separation of b along a's face normals
AxisQuery max_face_separation(const RoundedPolygon& a, const RoundedPolygon& b) {
    AxisQuery best;
    for (std::size_t i = 0; i < a.normals.size(); ++i) {
        const Vec2& n = a.normals[i];
        float min_b = std::numeric_limits<float>::max();
        for (const auto& v : b.vertices) {
            min_b = std::min(min_b, impulse_math::dot(n, v - a.vertices[i]));
        }
        float separation = min_b - a.radius - b.radius;
        if (separation > best.separation) {
            best.separation = separation;
            best.index = static_cast<int>(i);
        }
    }
    return best;
}

struct VertexAxisQuery {
    float separation = -std::numeric_limits<float>::max();
    Vec2 axis{0.0f};
    bool found = false;
};

/// Vertex-to-vertex axes, needed once either shape is rounded
VertexAxisQuery max_vertex_separation(const RoundedPolygon& a, const RoundedPolygon& b) {
    VertexAxisQuery best;
    for (const auto& va : a.vertices) {
        for (const auto& vb : b.vertices) {
            Vec2 delta = vb - va;
            float len = impulse_math::length(delta);
            if (len < detail::k_normal_epsilon) continue;
            Vec2 axis = delta / len;

            float max_a = -std::numeric_limits<float>::max();
            for (const auto& v : a.vertices) max_a = std::max(max_a, impulse_math::dot(axis, v));
            float min_b = std::numeric_limits<float>::max();
            for (const auto& v : b.vertices) min_b = std::min(min_b, impulse_math::dot(axis, v));

            float separation = min_b - max_a - a.radius - b.radius;
            if (separation > best.separation) {
                best.separation = separation;
                best.axis = axis;
                best.found = true;
            }
        }
    }
    return best;
}

/// Sutherland-Hodgman against one line; keeps dot(normal, p) <= offset
int clip_segment_to_line(std::array<Vec2, 2>& out, const std::array<Vec2, 2>& in,
                         const Vec2& normal, float offset) {
    int count = 0;
    float d0 = impulse_math::dot(normal, in[0]) - offset;
    float d1 = impulse_math::dot(normal, in[1]) - offset;

    if (d0 <= 0.0f) out[count++] = in[0];
    if (d1 <= 0.0f) out[count++] = in[1];

    if (d0 * d1 < 0.0f && count < 2) {
        float t = d0 / (d0 - d1);
        out[count++] = in[0] + (in[1] - in[0]) * t;
    }
    return count;
}

/// Manifold from a reference face of `ref` and the incident edge of `inc`.
/// When `ref_is_b` the manifold normal is reversed so it still points A to B.
std::optional<Manifold> face_contact(const RoundedPolygon& ref, int face,
                                     const RoundedPolygon& inc, bool ref_is_b,
                                     const NarrowPhaseConfig& config) {
    const std::size_t ref_count = ref.vertices.size();
    const std::size_t inc_count = inc.vertices.size();

    const Vec2 n = ref.normals[face];
    const Vec2 v1 = ref.vertices[face];
    const Vec2 v2 = ref.vertices[(face + 1) % ref_count];

    // Incident edge: normal most anti-parallel to the reference normal
    std::size_t incident = 0;
    float min_dot = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < inc_count; ++i) {
        float d = impulse_math::dot(n, inc.normals[i]);
        if (d < min_dot) {
            min_dot = d;
            incident = i;
        }
    }

    std::array<Vec2, 2> edge = {inc.vertices[incident], inc.vertices[(incident + 1) % inc_count]};
    Vec2 tangent = impulse_math::normalize_or_zero(v2 - v1);

    std::array<Vec2, 2> clip1{};
    std::array<Vec2, 2> clip2{};
    int count = clip_segment_to_line(clip1, edge, -tangent, -impulse_math::dot(tangent, v1));
    if (count == 2) {
        count = clip_segment_to_line(clip2, clip1, tangent, impulse_math::dot(tangent, v2));
    } else {
        count = 0;
    }

    Manifold manifold;
    manifold.normal = ref_is_b ? -n : n;

    auto add_point = [&](const Vec2& p) {
        float s = impulse_math::dot(n, p - v1);
        float depth = ref.radius + inc.radius - s;
        if (depth < -config.contact_epsilon) return;
        Vec2 on_ref = p - n * s + n * ref.radius;
        Vec2 on_inc = p - n * inc.radius;
        manifold.points.push_back({(on_ref + on_inc) * 0.5f, depth});
    };

    for (int i = 0; i < count; ++i) {
        add_point(clip2[i]);
    }

    if (manifold.points.empty()) {
        // Incident edge lies outside the side planes: use its deepest vertex
        const Vec2* deepest = &edge[0];
        if (impulse_math::dot(n, edge[1]) < impulse_math::dot(n, edge[0])) {
            deepest = &edge[1];
        }
        add_point(*deepest);
    }

    if (manifold.points.empty()) {
        return std::nullopt;
    }
    return manifold;
}

std::optional<Manifold> sat_contact(const RoundedPolygon& a, const RoundedPolygon& b,
                                    const NarrowPhaseConfig& config) {
    AxisQuery face_a = max_face_separation(a, b);
    if (face_a.separation > config.contact_epsilon) return std::nullopt;

    AxisQuery face_b = max_face_separation(b, a);
    if (face_b.separation > config.contact_epsilon) return std::nullopt;

    float best_face = std::max(face_a.separation, face_b.separation);

    if (a.radius > 0.0f || b.radius > 0.0f) {
        VertexAxisQuery vertex = max_vertex_separation(a, b);
        if (vertex.found && vertex.separation > config.contact_epsilon) {
            return std::nullopt;
        }
        if (vertex.found && vertex.separation > best_face + k_axis_bias) {
            const Vec2& axis = vertex.axis;
            Vec2 support_a = a.vertices.front();
            for (const auto& v : a.vertices) {
                if (impulse_math::dot(axis, v) > impulse_math::dot(axis, support_a)) support_a = v;
            }
            Vec2 support_b = b.vertices.front();
            for (const auto& v : b.vertices) {
                if (impulse_math::dot(axis, v) < impulse_math::dot(axis, support_b)) support_b = v;
            }

            Manifold manifold;
            manifold.normal = axis;
            Vec2 surface_a = support_a + axis * a.radius;
            Vec2 surface_b = support_b - axis * b.radius;
            manifold.points.push_back({(surface_a + surface_b) * 0.5f, -vertex.separation});
            return manifold;
        }
    }

    if (face_b.separation > face_a.separation + k_axis_bias) {
        return face_contact(b, face_b.index, a, true, config);
    }
    return face_contact(a, face_a.index, b, false, config);
}

// =============================================================================
// Pairwise Routines
// =============================================================================

std::optional<Manifold> circle_circle(const WorldShape& a, const WorldShape& b,
                                      const NarrowPhaseConfig& config) {
    const auto& ca = std::get<WorldCircle>(a);
    const auto& cb = std::get<WorldCircle>(b);
    return detail::round_contact<Dim2>(ca.center, ca.radius, cb.center, cb.radius,
                                       impulse_math::vec2::Y, config);
}

std::optional<Manifold> polygon_circle(const WorldShape& a, const WorldShape& b,
                                       const NarrowPhaseConfig& config) {
    const auto& polygon = std::get<RoundedPolygon>(a);
    const auto& circle = std::get<WorldCircle>(b);
    const Vec2 c = circle.center;
    const float r = circle.radius;

    AxisQuery face;
    for (std::size_t i = 0; i < polygon.normals.size(); ++i) {
        float s = impulse_math::dot(polygon.normals[i], c - polygon.vertices[i]);
        if (s > face.separation) {
            face.separation = s;
            face.index = static_cast<int>(i);
        }
    }

    if (face.separation > r + config.contact_epsilon) {
        return std::nullopt;
    }

    Manifold manifold;
    const Vec2 face_normal = polygon.normals[face.index];

    if (face.separation <= 0.0f) {
        // Center inside the polygon
        manifold.normal = face_normal;
        Vec2 surface_a = c - face_normal * face.separation;
        Vec2 surface_b = c - face_normal * r;
        manifold.points.push_back({(surface_a + surface_b) * 0.5f, r - face.separation});
        return manifold;
    }

    const std::size_t count = polygon.vertices.size();
    Vec2 closest = polygon.vertices[0];
    float closest_dist_sq = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < count; ++i) {
        Vec2 q = detail::closest_point_on_segment(c, polygon.vertices[i], polygon.vertices[(i + 1) % count]);
        float dist_sq = impulse_math::length_squared(c - q);
        if (dist_sq < closest_dist_sq) {
            closest_dist_sq = dist_sq;
            closest = q;
        }
    }

    float dist = std::sqrt(closest_dist_sq);
    if (dist - r > config.contact_epsilon) {
        return std::nullopt;
    }

    Vec2 normal = dist > detail::k_normal_epsilon ? (c - closest) / dist : face_normal;
    manifold.normal = normal;
    Vec2 surface_b = c - normal * r;
    manifold.points.push_back({(closest + surface_b) * 0.5f, r - dist});
    return manifold;
}

std::optional<Manifold> capsule_circle(const WorldShape& a, const WorldShape& b,
                                       const NarrowPhaseConfig& config) {
    const auto& capsule = std::get<WorldCapsule>(a);
    const auto& circle = std::get<WorldCircle>(b);
    Vec2 core = detail::closest_point_on_segment(circle.center, capsule.p0, capsule.p1);
    return detail::round_contact<Dim2>(core, capsule.radius, circle.center, circle.radius,
                                       capsule_fallback_normal(capsule), config);
}

std::optional<Manifold> capsule_capsule(const WorldShape& a, const WorldShape& b,
                                        const NarrowPhaseConfig& config) {
    const auto& ca = std::get<WorldCapsule>(a);
    const auto& cb = std::get<WorldCapsule>(b);
    return detail::capsule_capsule_contact<Dim2>(ca.p0, ca.p1, ca.radius, cb.p0, cb.p1, cb.radius,
                                                 capsule_fallback_normal(ca), config);
}

std::optional<Manifold> polygon_polygon(const WorldShape& a, const WorldShape& b,
                                        const NarrowPhaseConfig& config) {
    return sat_contact(std::get<RoundedPolygon>(a), std::get<RoundedPolygon>(b), config);
}

std::optional<Manifold> polygon_capsule(const WorldShape& a, const WorldShape& b,
                                        const NarrowPhaseConfig& config) {
    return sat_contact(std::get<RoundedPolygon>(a), to_rounded(std::get<WorldCapsule>(b)), config);
}

std::optional<Manifold> circle_plane(const WorldShape& a, const WorldShape& b,
                                     const NarrowPhaseConfig& config) {
    const auto& circle = std::get<WorldCircle>(a);
    const auto& plane = std::get<WorldPlane>(b);
    const std::array<Vec2, 1> center = {circle.center};
    return detail::plane_contact<Dim2>(center, circle.radius, plane.normal, plane.offset, config);
}

std::optional<Manifold> polygon_plane(const WorldShape& a, const WorldShape& b,
                                      const NarrowPhaseConfig& config) {
    const auto& polygon = std::get<RoundedPolygon>(a);
    const auto& plane = std::get<WorldPlane>(b);
    return detail::plane_contact<Dim2>(polygon.vertices, 0.0f, plane.normal, plane.offset, config);
}

std::optional<Manifold> capsule_plane(const WorldShape& a, const WorldShape& b,
                                      const NarrowPhaseConfig& config) {
    const auto& capsule = std::get<WorldCapsule>(a);
    const auto& plane = std::get<WorldPlane>(b);
    const std::array<Vec2, 2> ends = {capsule.p0, capsule.p1};
    return detail::plane_contact<Dim2>(ends, capsule.radius, plane.normal, plane.offset, config);
}

// =============================================================================
// Dispatch Matrix
// =============================================================================

using Routine = std::optional<Manifold> (*)(const WorldShape&, const WorldShape&, const NarrowPhaseConfig&);

template<Routine F>
constexpr Routine flipped = &detail::mirrored<Manifold, WorldShape, F>;

constexpr std::size_t k_kinds = std::variant_size_v<WorldShape>;

/// Indexed by [A kind][B kind]: circle, polygon, capsule, plane
constexpr std::array<std::array<Routine, k_kinds>, k_kinds> k_dispatch = {{
    {&circle_circle, flipped<&polygon_circle>, flipped<&capsule_circle>, &circle_plane},
    {&polygon_circle, &polygon_polygon, &polygon_capsule, &polygon_plane},
    {&capsule_circle, flipped<&polygon_capsule>, &capsule_capsule, &capsule_plane},
    {flipped<&circle_plane>, flipped<&polygon_plane>, flipped<&capsule_plane>,
     &detail::no_contact<Manifold, WorldShape>},
}};

} // anonymous namespace

// =============================================================================
// NarrowPhase
// =============================================================================

std::optional<ContactManifold2D> NarrowPhase::test(const Shape2& shape_a, const Pose2& pose_a,
                                                   const Shape2& shape_b, const Pose2& pose_b,
                                                   const NarrowPhaseConfig& config) {
    WorldShape a = to_world(shape_a, pose_a);
    WorldShape b = to_world(shape_b, pose_b);

    auto manifold = k_dispatch[a.index()][b.index()](a, b, config);
    if (!manifold) {
        return std::nullopt;
    }

    if (manifold->points.empty() || !detail::is_finite_manifold(*manifold)) {
        impulse_core::physics_logger()->debug("Narrow phase: dropped degenerate {} vs {} contact",
                                              shape_name(shape_a), shape_name(shape_b));
        return std::nullopt;
    }

    finalize_manifold(*manifold, config.max_manifold_points);
    return manifold;
}

} // namespace impulse_physics
