/// @file narrowphase3d.cpp
/// @brief 3D contact generation

#include "narrowphase_detail.hpp"

#include <impulse/physics/gjk.hpp>
#include <impulse/core/log.hpp>

#include <array>
#include <cmath>
#include <limits>
#include <type_traits>
#include <variant>
#include <vector>

namespace impulse_physics {

namespace {

using impulse_math::Vec3;
using Manifold = ContactManifold3D;
using Point = ContactPoint<Dim3>;

/// Prefer face axes over edge axes, and A's faces over B's
constexpr float k_axis_bias = 1.0e-3f;

/// Support vertices within this distance of the extreme form a feature
constexpr float k_feature_tolerance = 1.0e-2f;

// =============================================================================
// World Primitives
// =============================================================================

struct WorldSphere {
    Vec3 center{0.0f};
    float radius = 0.0f;
};

struct WorldBox {
    Vec3 center{0.0f};
    std::array<Vec3, 3> axes{};     ///< World directions of local X, Y, Z
    Vec3 half{0.0f};                ///< Scaled half extents
};

struct WorldHull {
    std::vector<Vec3> vertices;
};

struct WorldCapsule {
    Vec3 p0{0.0f};
    Vec3 p1{0.0f};
    float radius = 0.0f;
};

struct WorldPlane {
    Vec3 normal{0.0f, 1.0f, 0.0f};
    float offset = 0.0f;
};

using WorldShape = std::variant<WorldSphere, WorldBox, WorldHull, WorldCapsule, WorldPlane>;

WorldShape to_world(const Shape3& shape, const Pose3& pose) {
    return std::visit([&pose](const auto& s) -> WorldShape {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, Sphere>) {
            return WorldSphere{pose.position, s.radius * pose.scale};
        } else if constexpr (std::is_same_v<T, Box>) {
            WorldBox box;
            box.center = pose.position;
            box.axes = {
                pose.transform_direction(impulse_math::vec3::X),
                pose.transform_direction(impulse_math::vec3::Y),
                pose.transform_direction(impulse_math::vec3::Z),
            };
            box.half = s.half_extents * pose.scale;
            return box;
        } else if constexpr (std::is_same_v<T, ConvexPolyhedron>) {
            WorldHull hull;
            hull.vertices.reserve(s.vertices.size());
            for (const auto& v : s.vertices) {
                hull.vertices.push_back(pose.transform_point(v));
            }
            return hull;
        } else if constexpr (std::is_same_v<T, Capsule>) {
            return WorldCapsule{
                pose.transform_point(Vec3(0.0f, -s.half_height, 0.0f)),
                pose.transform_point(Vec3(0.0f, s.half_height, 0.0f)),
                s.radius * pose.scale};
        } else {
            Vec3 n = pose.transform_direction(s.normal);
            return WorldPlane{n, s.offset * pose.scale + impulse_math::dot(n, pose.position)};
        }
    }, shape);
}

std::array<Vec3, 8> box_corners(const WorldBox& box) {
    std::array<Vec3, 8> corners{};
    for (int i = 0; i < 8; ++i) {
        Vec3 p = box.center;
        p += box.axes[0] * ((i & 1) ? box.half.x : -box.half.x);
        p += box.axes[1] * ((i & 2) ? box.half.y : -box.half.y);
        p += box.axes[2] * ((i & 4) ? box.half.z : -box.half.z);
        corners[i] = p;
    }
    return corners;
}

/// Face of a box with the given outward normal, as a closed loop
std::vector<Vec3> box_face(const WorldBox& box, int axis, float sign) {
    Vec3 center = box.center + box.axes[axis] * (box.half[axis] * sign);
    Vec3 u = box.axes[(axis + 1) % 3] * box.half[(axis + 1) % 3];
    Vec3 v = box.axes[(axis + 2) % 3] * box.half[(axis + 2) % 3];
    return {center + u + v, center - u + v, center - u - v, center + u - v};
}

Vec3 capsule_fallback_normal(const WorldCapsule& capsule) {
    Vec3 dir = impulse_math::normalize_or_zero(capsule.p1 - capsule.p0);
    if (impulse_math::length_squared(dir) < 0.5f) {
        return impulse_math::vec3::Y;
    }
    return impulse_math::any_perpendicular(dir);
}

// =============================================================================
// Support Mapping
// =============================================================================

Vec3 support(const WorldShape& shape, const Vec3& dir) {
    return std::visit([&dir](const auto& s) -> Vec3 {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, WorldSphere>) {
            return s.center + impulse_math::normalize_or_zero(dir) * s.radius;
        } else if constexpr (std::is_same_v<T, WorldBox>) {
            Vec3 p = s.center;
            for (int k = 0; k < 3; ++k) {
                p += s.axes[k] * (impulse_math::dot(dir, s.axes[k]) >= 0.0f ? s.half[k] : -s.half[k]);
            }
            return p;
        } else if constexpr (std::is_same_v<T, WorldHull>) {
            Vec3 best = s.vertices.front();
            float best_dot = impulse_math::dot(best, dir);
            for (const auto& v : s.vertices) {
                float d = impulse_math::dot(v, dir);
                if (d > best_dot) {
                    best_dot = d;
                    best = v;
                }
            }
            return best;
        } else if constexpr (std::is_same_v<T, WorldCapsule>) {
            Vec3 end = impulse_math::dot(dir, s.p1 - s.p0) >= 0.0f ? s.p1 : s.p0;
            return end + impulse_math::normalize_or_zero(dir) * s.radius;
        } else {
            return s.normal * s.offset;
        }
    }, shape);
}

void add_unique(std::vector<Vec3>& points, const Vec3& p) {
    for (const auto& q : points) {
        if (impulse_math::length_squared(p - q) < detail::k_normal_epsilon) return;
    }
    points.push_back(p);
}

/// Surface points of a shape lying (nearly) furthest along dir
std::vector<Vec3> support_feature(const WorldShape& shape, const Vec3& dir) {
    std::vector<Vec3> feature;

    auto gather = [&](std::span<const Vec3> vertices, float radius) {
        float max_dot = -std::numeric_limits<float>::max();
        for (const auto& v : vertices) {
            max_dot = std::max(max_dot, impulse_math::dot(v, dir));
        }
        for (const auto& v : vertices) {
            if (impulse_math::dot(v, dir) >= max_dot - k_feature_tolerance) {
                add_unique(feature, v + dir * radius);
            }
        }
    };

    if (const auto* sphere = std::get_if<WorldSphere>(&shape)) {
        feature.push_back(sphere->center + dir * sphere->radius);
    } else if (const auto* box = std::get_if<WorldBox>(&shape)) {
        auto corners = box_corners(*box);
        gather(corners, 0.0f);
    } else if (const auto* hull = std::get_if<WorldHull>(&shape)) {
        gather(hull->vertices, 0.0f);
    } else if (const auto* capsule = std::get_if<WorldCapsule>(&shape)) {
        const std::array<Vec3, 2> ends = {capsule->p0, capsule->p1};
        gather(ends, capsule->radius);
    }
    return feature;
}

/// Order coplanar points by angle about their centroid
void order_polygon(std::vector<Vec3>& points, const Vec3& normal) {
    if (points.size() < 3) return;

    Vec3 centroid(0.0f);
    for (const auto& p : points) centroid += p;
    centroid /= static_cast<float>(points.size());

    Vec3 t1 = impulse_math::any_perpendicular(normal);
    Vec3 t2 = impulse_math::cross(normal, t1);

    std::stable_sort(points.begin(), points.end(), [&](const Vec3& a, const Vec3& b) {
        Vec3 da = a - centroid;
        Vec3 db = b - centroid;
        return std::atan2(impulse_math::dot(da, t2), impulse_math::dot(da, t1)) <
               std::atan2(impulse_math::dot(db, t2), impulse_math::dot(db, t1));
    });
}

// =============================================================================
// Clipping
// =============================================================================

/// Keep the part of a polygon (or segment, or point) with dot(n, p) <= d
std::vector<Vec3> clip_against_plane(const std::vector<Vec3>& in, const Vec3& n, float d) {
    std::vector<Vec3> out;
    if (in.empty()) return out;

    if (in.size() == 1) {
        if (impulse_math::dot(n, in[0]) <= d) out.push_back(in[0]);
        return out;
    }

    if (in.size() == 2) {
        float d0 = impulse_math::dot(n, in[0]) - d;
        float d1 = impulse_math::dot(n, in[1]) - d;
        if (d0 <= 0.0f) out.push_back(in[0]);
        if (d0 * d1 < 0.0f) out.push_back(in[0] + (in[1] - in[0]) * (d0 / (d0 - d1)));
        if (d1 <= 0.0f) out.push_back(in[1]);
        return out;
    }

    out.reserve(in.size() + 2);
    for (std::size_t i = 0; i < in.size(); ++i) {
        const Vec3& cur = in[i];
        const Vec3& next = in[(i + 1) % in.size()];
        float dc = impulse_math::dot(n, cur) - d;
        float dn = impulse_math::dot(n, next) - d;

        if (dc <= 0.0f) out.push_back(cur);
        if (dc * dn < 0.0f) out.push_back(cur + (next - cur) * (dc / (dc - dn)));
    }
    return out;
}

/// Clip the incident feature to the side planes of the reference face and
/// keep the points below it. ref_normal points out of the reference shape.
std::vector<Point> reference_clip(const std::vector<Vec3>& reference, const Vec3& ref_normal,
                                  const std::vector<Vec3>& incident, const NarrowPhaseConfig& config) {
    Vec3 centroid(0.0f);
    for (const auto& p : reference) centroid += p;
    centroid /= static_cast<float>(reference.size());

    std::vector<Vec3> clipped = incident;
    for (std::size_t k = 0; k < reference.size() && !clipped.empty(); ++k) {
        const Vec3& a = reference[k];
        const Vec3& b = reference[(k + 1) % reference.size()];
        Vec3 side = impulse_math::normalize_or_zero(impulse_math::cross(b - a, ref_normal));
        if (impulse_math::length_squared(side) < 0.5f) continue;
        if (impulse_math::dot(side, centroid - a) > 0.0f) {
            side = -side;
        }
        clipped = clip_against_plane(clipped, side, impulse_math::dot(side, a));
    }

    const float ref_offset = impulse_math::dot(ref_normal, reference.front());
    std::vector<Point> points;
    for (const auto& p : clipped) {
        float depth = ref_offset - impulse_math::dot(ref_normal, p);
        if (depth >= -config.contact_epsilon) {
            points.push_back({p + ref_normal * (depth * 0.5f), depth});
        }
    }

    if (points.empty() && !incident.empty()) {
        const Vec3* deepest = &incident.front();
        for (const auto& p : incident) {
            if (impulse_math::dot(ref_normal, p) < impulse_math::dot(ref_normal, *deepest)) {
                deepest = &p;
            }
        }
        float depth = ref_offset - impulse_math::dot(ref_normal, *deepest);
        points.push_back({*deepest + ref_normal * (depth * 0.5f), depth});
    }
    return points;
}

/// Two points for parallel overlapping segments, none otherwise
std::vector<Point> segment_clip(const std::vector<Vec3>& seg_a, const std::vector<Vec3>& seg_b,
                                const Vec3& normal) {
    std::vector<Point> points;
    Vec3 da = seg_a[1] - seg_a[0];
    Vec3 db = seg_b[1] - seg_b[0];
    float la = impulse_math::length(da);
    float lb = impulse_math::length(db);
    if (la < detail::k_normal_epsilon || lb < detail::k_normal_epsilon) return points;
    if (std::abs(impulse_math::dot(da, db)) / (la * lb) < 1.0f - detail::k_parallel_tolerance) return points;

    Vec3 axis = da / la;
    float t0 = impulse_math::dot(seg_b[0] - seg_a[0], axis);
    float t1 = impulse_math::dot(seg_b[1] - seg_a[0], axis);
    float lo = std::max(0.0f, std::min(t0, t1));
    float hi = std::min(la, std::max(t0, t1));
    if (hi - lo < detail::k_parallel_tolerance) return points;

    for (float t : {lo, hi}) {
        Vec3 pa = seg_a[0] + axis * t;
        Vec3 pb = detail::closest_point_on_segment(pa, seg_b[0], seg_b[1]);
        points.push_back({(pa + pb) * 0.5f, impulse_math::dot(normal, pa - pb)});
    }
    return points;
}

// =============================================================================
// Pairwise Routines
// =============================================================================

std::optional<Manifold> sphere_sphere(const WorldShape& a, const WorldShape& b,
                                      const NarrowPhaseConfig& config) {
    const auto& sa = std::get<WorldSphere>(a);
    const auto& sb = std::get<WorldSphere>(b);
    return detail::round_contact<Dim3>(sa.center, sa.radius, sb.center, sb.radius,
                                       impulse_math::vec3::Y, config);
}

std::optional<Manifold> sphere_box(const WorldShape& a, const WorldShape& b,
                                   const NarrowPhaseConfig& config) {
    const auto& sphere = std::get<WorldSphere>(a);
    const auto& box = std::get<WorldBox>(b);

    Vec3 delta = sphere.center - box.center;
    Vec3 local(impulse_math::dot(delta, box.axes[0]),
               impulse_math::dot(delta, box.axes[1]),
               impulse_math::dot(delta, box.axes[2]));
    Vec3 clamped = impulse_math::max(-box.half, impulse_math::min(local, box.half));

    Manifold manifold;
    Vec3 closest = box.center + box.axes[0] * clamped.x + box.axes[1] * clamped.y + box.axes[2] * clamped.z;
    Vec3 offset = sphere.center - closest;
    float dist = impulse_math::length(offset);

    if (dist > detail::k_normal_epsilon) {
        if (dist - sphere.radius > config.contact_epsilon) {
            return std::nullopt;
        }
        Vec3 box_to_sphere = offset / dist;
        manifold.normal = -box_to_sphere;
        Vec3 on_sphere = sphere.center - box_to_sphere * sphere.radius;
        manifold.points.push_back({(closest + on_sphere) * 0.5f, sphere.radius - dist});
        return manifold;
    }

    // Center inside the box: push out through the nearest face
    int axis = 0;
    float face_dist = std::numeric_limits<float>::max();
    for (int k = 0; k < 3; ++k) {
        float d = box.half[k] - std::abs(local[k]);
        if (d < face_dist) {
            face_dist = d;
            axis = k;
        }
    }
    float sign = local[axis] >= 0.0f ? 1.0f : -1.0f;
    Vec3 box_to_sphere = box.axes[axis] * sign;

    manifold.normal = -box_to_sphere;
    Vec3 on_box = sphere.center + box_to_sphere * face_dist;
    Vec3 on_sphere = sphere.center - box_to_sphere * sphere.radius;
    manifold.points.push_back({(on_box + on_sphere) * 0.5f, sphere.radius + face_dist});
    return manifold;
}

std::optional<Manifold> sphere_capsule(const WorldShape& a, const WorldShape& b,
                                       const NarrowPhaseConfig& config) {
    const auto& sphere = std::get<WorldSphere>(a);
    const auto& capsule = std::get<WorldCapsule>(b);
    Vec3 core = detail::closest_point_on_segment(sphere.center, capsule.p0, capsule.p1);
    return detail::round_contact<Dim3>(sphere.center, sphere.radius, core, capsule.radius,
                                       -capsule_fallback_normal(capsule), config);
}

std::optional<Manifold> capsule_capsule(const WorldShape& a, const WorldShape& b,
                                        const NarrowPhaseConfig& config) {
    const auto& ca = std::get<WorldCapsule>(a);
    const auto& cb = std::get<WorldCapsule>(b);
    return detail::capsule_capsule_contact<Dim3>(ca.p0, ca.p1, ca.radius, cb.p0, cb.p1, cb.radius,
                                                 capsule_fallback_normal(ca), config);
}

std::optional<Manifold> box_box(const WorldShape& a, const WorldShape& b,
                                const NarrowPhaseConfig& config) {
    const auto& box_a = std::get<WorldBox>(a);
    const auto& box_b = std::get<WorldBox>(b);
    const Vec3 t = box_b.center - box_a.center;

    auto project = [](const WorldBox& box, const Vec3& axis) {
        return box.half.x * std::abs(impulse_math::dot(box.axes[0], axis)) +
               box.half.y * std::abs(impulse_math::dot(box.axes[1], axis)) +
               box.half.z * std::abs(impulse_math::dot(box.axes[2], axis));
    };

    struct AxisQuery {
        float separation = -std::numeric_limits<float>::max();
        Vec3 axis{0.0f};
        int i = -1;
        int j = -1;
    };

    AxisQuery face_a;
    AxisQuery face_b;
    AxisQuery edge;

    auto test_axis = [&](Vec3 axis, AxisQuery& best, int i, int j) {
        float len = impulse_math::length(axis);
        if (len < detail::k_normal_epsilon) {
            return true;    // Parallel edges: covered by the face axes
        }
        axis /= len;
        float separation = std::abs(impulse_math::dot(t, axis)) - project(box_a, axis) - project(box_b, axis);
        if (separation > config.contact_epsilon) {
            return false;
        }
        if (separation > best.separation) {
            best.separation = separation;
            best.axis = axis;
            best.i = i;
            best.j = j;
        }
        return true;
    };

    for (int i = 0; i < 3; ++i) {
        if (!test_axis(box_a.axes[i], face_a, i, -1)) return std::nullopt;
    }
    for (int j = 0; j < 3; ++j) {
        if (!test_axis(box_b.axes[j], face_b, -1, j)) return std::nullopt;
    }
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            if (!test_axis(impulse_math::cross(box_a.axes[i], box_b.axes[j]), edge, i, j)) return std::nullopt;
        }
    }

    const AxisQuery* best = &face_a;
    if (face_b.separation > best->separation + k_axis_bias) best = &face_b;
    if (edge.i >= 0 && edge.separation > best->separation + k_axis_bias) best = &edge;

    Vec3 normal = best->axis;
    if (impulse_math::dot(normal, t) < 0.0f) {
        normal = -normal;
    }

    Manifold manifold;
    manifold.normal = normal;

    // Incident face: the face of `inc` most anti-parallel to ref_normal
    auto incident_face = [](const WorldBox& inc, const Vec3& ref_normal) {
        int axis = 0;
        float max_abs = -1.0f;
        for (int k = 0; k < 3; ++k) {
            float d = std::abs(impulse_math::dot(inc.axes[k], ref_normal));
            if (d > max_abs) {
                max_abs = d;
                axis = k;
            }
        }
        float sign = impulse_math::dot(inc.axes[axis], ref_normal) > 0.0f ? -1.0f : 1.0f;
        return box_face(inc, axis, sign);
    };

    if (best == &face_a) {
        float sign = impulse_math::dot(box_a.axes[best->i], normal) >= 0.0f ? 1.0f : -1.0f;
        manifold.points = reference_clip(box_face(box_a, best->i, sign), normal,
                                         incident_face(box_b, normal), config);
    } else if (best == &face_b) {
        Vec3 ref_normal = -normal;
        float sign = impulse_math::dot(box_b.axes[best->j], ref_normal) >= 0.0f ? 1.0f : -1.0f;
        manifold.points = reference_clip(box_face(box_b, best->j, sign), ref_normal,
                                         incident_face(box_a, ref_normal), config);
    } else {
        // Edge-edge: closest points of the two supporting edges
        auto supporting_edge = [](const WorldBox& box, int axis, const Vec3& dir, Vec3& e0, Vec3& e1) {
            Vec3 mid = box.center;
            for (int k = 0; k < 3; ++k) {
                if (k == axis) continue;
                mid += box.axes[k] * (impulse_math::dot(box.axes[k], dir) >= 0.0f ? box.half[k] : -box.half[k]);
            }
            e0 = mid - box.axes[axis] * box.half[axis];
            e1 = mid + box.axes[axis] * box.half[axis];
        };

        Vec3 a0, a1, b0, b1;
        supporting_edge(box_a, best->i, normal, a0, a1);
        supporting_edge(box_b, best->j, -normal, b0, b1);

        Vec3 pa;
        Vec3 pb;
        detail::closest_points_segments(a0, a1, b0, b1, pa, pb);
        manifold.points.push_back({(pa + pb) * 0.5f, -best->separation});
    }

    if (manifold.points.empty()) {
        return std::nullopt;
    }
    return manifold;
}

/// GJK + EPA for any pair of convex non-plane shapes, then a multi-point
/// manifold from the support features along the contact normal
std::optional<Manifold> convex_convex(const WorldShape& a, const WorldShape& b,
                                      const NarrowPhaseConfig& config) {
    // Inflate both shapes so touching within the epsilon still intersects
    const float margin = 0.5f * config.contact_epsilon;
    auto support_a = [&a, margin](const Vec3& dir) {
        return support(a, dir) + impulse_math::normalize_or_zero(dir) * margin;
    };
    auto support_b = [&b, margin](const Vec3& dir) {
        return support(b, dir) + impulse_math::normalize_or_zero(dir) * margin;
    };

    GjkResult gjk = GjkEpa::gjk(support_a, support_b);
    if (!gjk.intersecting) {
        return std::nullopt;
    }

    auto penetration = GjkEpa::epa(support_a, support_b, gjk.simplex);
    if (!penetration) {
        impulse_core::physics_logger()->debug("Narrow phase: EPA found no penetration after {} GJK iterations",
                                              gjk.iterations);
        return std::nullopt;
    }

    Vec3 normal = impulse_math::normalize_or_zero(penetration->normal);
    if (impulse_math::length_squared(normal) < 0.5f) {
        return std::nullopt;
    }
    float depth = penetration->depth - 2.0f * margin;

    Manifold manifold;
    manifold.normal = normal;

    std::vector<Vec3> feature_a = support_feature(a, normal);
    std::vector<Vec3> feature_b = support_feature(b, -normal);

    if (feature_a.size() >= 3) {
        order_polygon(feature_a, normal);
        order_polygon(feature_b, normal);
        manifold.points = reference_clip(feature_a, normal, feature_b, config);
    } else if (feature_b.size() >= 3) {
        order_polygon(feature_b, normal);
        manifold.points = reference_clip(feature_b, -normal, feature_a, config);
    } else if (feature_a.size() == 2 && feature_b.size() == 2) {
        manifold.points = segment_clip(feature_a, feature_b, normal);
    }

    if (manifold.points.empty()) {
        Vec3 midpoint = (penetration->point_a + penetration->point_b) * 0.5f;
        manifold.points.push_back({midpoint, depth});
    }
    return manifold;
}

std::optional<Manifold> sphere_plane(const WorldShape& a, const WorldShape& b,
                                     const NarrowPhaseConfig& config) {
    const auto& sphere = std::get<WorldSphere>(a);
    const auto& plane = std::get<WorldPlane>(b);
    const std::array<Vec3, 1> center = {sphere.center};
    return detail::plane_contact<Dim3>(center, sphere.radius, plane.normal, plane.offset, config);
}

std::optional<Manifold> box_plane(const WorldShape& a, const WorldShape& b,
                                  const NarrowPhaseConfig& config) {
    const auto& box = std::get<WorldBox>(a);
    const auto& plane = std::get<WorldPlane>(b);
    const auto corners = box_corners(box);
    return detail::plane_contact<Dim3>(corners, 0.0f, plane.normal, plane.offset, config);
}

std::optional<Manifold> hull_plane(const WorldShape& a, const WorldShape& b,
                                   const NarrowPhaseConfig& config) {
    const auto& hull = std::get<WorldHull>(a);
    const auto& plane = std::get<WorldPlane>(b);
    return detail::plane_contact<Dim3>(hull.vertices, 0.0f, plane.normal, plane.offset, config);
}

std::optional<Manifold> capsule_plane(const WorldShape& a, const WorldShape& b,
                                      const NarrowPhaseConfig& config) {
    const auto& capsule = std::get<WorldCapsule>(a);
    const auto& plane = std::get<WorldPlane>(b);
    const std::array<Vec3, 2> ends = {capsule.p0, capsule.p1};
    return detail::plane_contact<Dim3>(ends, capsule.radius, plane.normal, plane.offset, config);
}

// =============================================================================
// Dispatch Matrix
// =============================================================================

using Routine = std::optional<Manifold> (*)(const WorldShape&, const WorldShape&, const NarrowPhaseConfig&);

template<Routine F>
constexpr Routine flipped = &detail::mirrored<Manifold, WorldShape, F>;

constexpr Routine k_none = &detail::no_contact<Manifold, WorldShape>;

constexpr std::size_t k_kinds = std::variant_size_v<WorldShape>;

/// Indexed by [A kind][B kind]: sphere, box, hull, capsule, plane
constexpr std::array<std::array<Routine, k_kinds>, k_kinds> k_dispatch = {{
    {&sphere_sphere, &sphere_box, &convex_convex, &sphere_capsule, &sphere_plane},
    {flipped<&sphere_box>, &box_box, &convex_convex, &convex_convex, &box_plane},
    {&convex_convex, &convex_convex, &convex_convex, &convex_convex, &hull_plane},
    {flipped<&sphere_capsule>, &convex_convex, &convex_convex, &capsule_capsule, &capsule_plane},
    {flipped<&sphere_plane>, flipped<&box_plane>, flipped<&hull_plane>, flipped<&capsule_plane>, k_none},
}};

} // anonymous namespace

// =============================================================================
// NarrowPhase
// =============================================================================

std::optional<ContactManifold3D> NarrowPhase::test(const Shape3& shape_a, const Pose3& pose_a,
                                                   const Shape3& shape_b, const Pose3& pose_b,
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
