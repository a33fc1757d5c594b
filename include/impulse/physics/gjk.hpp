#pragma once

/// @file gjk.hpp
/// @brief GJK intersection and EPA penetration for convex shapes in 3D
///
/// Shapes are described only by support functions: callables mapping a
/// world direction to the farthest world point of the shape along it.
/// The Minkowski difference is A - B, so the EPA normal points from A to B.

#include <impulse/math/math.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// GJK/EPA tolerance
constexpr float k_gjk_epsilon = 1e-6f;

/// EPA convergence tolerance
constexpr float k_epa_tolerance = 1e-4f;

constexpr int k_max_gjk_iterations = 64;
constexpr int k_max_epa_iterations = 64;
constexpr std::size_t k_max_epa_faces = 256;

// =============================================================================
// Simplex
// =============================================================================

/// Support point with Minkowski difference tracking
struct SupportPoint {
    impulse_math::Vec3 point{0.0f};      ///< Point in Minkowski difference
    impulse_math::Vec3 support_a{0.0f};  ///< Support point on shape A
    impulse_math::Vec3 support_b{0.0f};  ///< Support point on shape B
};

/// GJK Simplex (0-4 vertices, newest first)
class Simplex {
public:
    Simplex() = default;

    void push_front(const SupportPoint& point) {
        m_points[3] = m_points[2];
        m_points[2] = m_points[1];
        m_points[1] = m_points[0];
        m_points[0] = point;
        m_size = std::min(m_size + 1, 4);
    }

    void push_back(const SupportPoint& point) {
        if (m_size < 4) {
            m_points[m_size++] = point;
        }
    }

    [[nodiscard]] const SupportPoint& operator[](int i) const { return m_points[i]; }
    [[nodiscard]] SupportPoint& operator[](int i) { return m_points[i]; }

    [[nodiscard]] int size() const { return m_size; }

    void set_point(const SupportPoint& a) {
        m_points[0] = a;
        m_size = 1;
    }

    void set_line(const SupportPoint& a, const SupportPoint& b) {
        m_points[0] = a;
        m_points[1] = b;
        m_size = 2;
    }

    void set_triangle(const SupportPoint& a, const SupportPoint& b, const SupportPoint& c) {
        m_points[0] = a;
        m_points[1] = b;
        m_points[2] = c;
        m_size = 3;
    }

private:
    std::array<SupportPoint, 4> m_points{};
    int m_size = 0;
};

/// Result of GJK intersection test
struct GjkResult {
    bool intersecting = false;
    Simplex simplex;
    int iterations = 0;
};

/// Penetration found by EPA
struct Penetration {
    impulse_math::Vec3 normal{0.0f, 1.0f, 0.0f};    ///< A -> B
    float depth = 0.0f;
    impulse_math::Vec3 point_a{0.0f};               ///< Deepest point of A inside B
    impulse_math::Vec3 point_b{0.0f};               ///< Deepest point of B inside A
};

// =============================================================================
// GjkEpa
// =============================================================================

/// GJK and EPA over support callables `Vec3 support(const Vec3& dir)`
class GjkEpa {
public:
    template<typename SupportA, typename SupportB>
    [[nodiscard]] static GjkResult gjk(const SupportA& shape_a, const SupportB& shape_b) {
        using impulse_math::Vec3;

        GjkResult result;
        Vec3 direction(1.0f, 0.0f, 0.0f);

        SupportPoint support = get_support(shape_a, shape_b, direction);
        result.simplex.push_front(support);
        direction = -support.point;

        for (int i = 0; i < k_max_gjk_iterations; ++i) {
            result.iterations = i + 1;

            float dir_len = impulse_math::length(direction);
            if (dir_len < k_gjk_epsilon) {
                // Origin lies on the simplex
                result.intersecting = true;
                return result;
            }
            direction = direction / dir_len;

            support = get_support(shape_a, shape_b, direction);
            if (impulse_math::dot(support.point, direction) < 0.0f) {
                result.intersecting = false;
                return result;
            }

            result.simplex.push_front(support);
            if (do_simplex(result.simplex, direction)) {
                result.intersecting = true;
                return result;
            }
        }

        result.intersecting = false;
        return result;
    }

    /// Expand the GJK simplex into the penetration of A and B
    template<typename SupportA, typename SupportB>
    [[nodiscard]] static std::optional<Penetration> epa(const SupportA& shape_a,
                                                       const SupportB& shape_b,
                                                       Simplex simplex) {
        using impulse_math::Vec3;

        if (!complete_simplex(shape_a, shape_b, simplex)) {
            return std::nullopt;
        }

        std::vector<SupportPoint> vertices;
        vertices.reserve(32);
        for (int i = 0; i < 4; ++i) {
            vertices.push_back(simplex[i]);
        }

        std::vector<Face> faces;
        faces.reserve(64);
        faces.push_back(make_face(vertices, 0, 1, 2));
        faces.push_back(make_face(vertices, 0, 3, 1));
        faces.push_back(make_face(vertices, 0, 2, 3));
        faces.push_back(make_face(vertices, 1, 3, 2));

        std::size_t closest = 0;
        for (int iter = 0; iter < k_max_epa_iterations; ++iter) {
            closest = closest_face(faces);
            const Face& face = faces[closest];

            SupportPoint support = get_support(shape_a, shape_b, face.normal);
            float support_dist = impulse_math::dot(support.point, face.normal);
            if (support_dist - face.distance < k_epa_tolerance) {
                return build_penetration(vertices, face);
            }

            int new_vertex = static_cast<int>(vertices.size());
            vertices.push_back(support);

            // Remove faces visible from the new point, keeping the horizon
            std::vector<std::pair<int, int>> horizon;
            std::vector<Face> remaining;
            remaining.reserve(faces.size());

            for (const auto& f : faces) {
                Vec3 to_point = support.point - vertices[f.indices[0]].point;
                if (impulse_math::dot(f.normal, to_point) > k_gjk_epsilon) {
                    add_edge(horizon, f.indices[0], f.indices[1]);
                    add_edge(horizon, f.indices[1], f.indices[2]);
                    add_edge(horizon, f.indices[2], f.indices[0]);
                } else {
                    remaining.push_back(f);
                }
            }

            if (horizon.empty()) {
                // No face sees the support point; the closest face is final
                return build_penetration(vertices, face);
            }

            faces = std::move(remaining);
            for (const auto& [i, j] : horizon) {
                faces.push_back(make_face(vertices, i, j, new_vertex));
            }

            if (faces.size() > k_max_epa_faces) {
                break;
            }
        }

        // Out of iterations: report the best face found
        return build_penetration(vertices, faces[closest_face(faces)]);
    }

private:
    struct Face {
        std::array<int, 3> indices{};
        impulse_math::Vec3 normal{0.0f};
        float distance = std::numeric_limits<float>::max();
    };

    template<typename SupportA, typename SupportB>
    [[nodiscard]] static SupportPoint get_support(const SupportA& shape_a,
                                                  const SupportB& shape_b,
                                                  const impulse_math::Vec3& direction) {
        SupportPoint sp;
        sp.support_a = shape_a(direction);
        sp.support_b = shape_b(-direction);
        sp.point = sp.support_a - sp.support_b;
        return sp;
    }

    // =========================================================================
    // GJK Helpers
    // =========================================================================

    /// Returns true if the simplex encloses the origin
    [[nodiscard]] static bool do_simplex(Simplex& simplex, impulse_math::Vec3& direction) {
        switch (simplex.size()) {
            case 2: return do_simplex_line(simplex, direction);
            case 3: return do_simplex_triangle(simplex, direction);
            case 4: return do_simplex_tetrahedron(simplex, direction);
            default: return false;
        }
    }

    [[nodiscard]] static bool do_simplex_line(Simplex& simplex, impulse_math::Vec3& direction) {
        using impulse_math::Vec3;
        Vec3 a = simplex[0].point;
        Vec3 b = simplex[1].point;
        Vec3 ab = b - a;
        Vec3 ao = -a;

        if (impulse_math::dot(ab, ao) > 0.0f) {
            direction = impulse_math::cross(impulse_math::cross(ab, ao), ab);
        } else {
            simplex.set_point(simplex[0]);
            direction = ao;
        }
        return false;
    }

    [[nodiscard]] static bool do_simplex_triangle(Simplex& simplex, impulse_math::Vec3& direction) {
        using impulse_math::Vec3;
        SupportPoint sa = simplex[0];
        SupportPoint sb = simplex[1];
        SupportPoint sc = simplex[2];

        Vec3 ab = sb.point - sa.point;
        Vec3 ac = sc.point - sa.point;
        Vec3 ao = -sa.point;
        Vec3 abc = impulse_math::cross(ab, ac);

        if (impulse_math::dot(impulse_math::cross(abc, ac), ao) > 0.0f) {
            if (impulse_math::dot(ac, ao) > 0.0f) {
                simplex.set_line(sa, sc);
                direction = impulse_math::cross(impulse_math::cross(ac, ao), ac);
                return false;
            }
            simplex.set_line(sa, sb);
            return do_simplex_line(simplex, direction);
        }

        if (impulse_math::dot(impulse_math::cross(ab, abc), ao) > 0.0f) {
            simplex.set_line(sa, sb);
            return do_simplex_line(simplex, direction);
        }

        if (impulse_math::dot(abc, ao) > 0.0f) {
            direction = abc;
        } else {
            simplex.set_triangle(sa, sc, sb);
            direction = -abc;
        }
        return false;
    }

    [[nodiscard]] static bool do_simplex_tetrahedron(Simplex& simplex, impulse_math::Vec3& direction) {
        using impulse_math::Vec3;
        SupportPoint sa = simplex[0];
        SupportPoint sb = simplex[1];
        SupportPoint sc = simplex[2];
        SupportPoint sd = simplex[3];

        Vec3 ab = sb.point - sa.point;
        Vec3 ac = sc.point - sa.point;
        Vec3 ad = sd.point - sa.point;
        Vec3 ao = -sa.point;

        Vec3 abc = impulse_math::cross(ab, ac);
        Vec3 acd = impulse_math::cross(ac, ad);
        Vec3 adb = impulse_math::cross(ad, ab);

        if (impulse_math::dot(abc, ao) > 0.0f) {
            simplex.set_triangle(sa, sb, sc);
            return do_simplex_triangle(simplex, direction);
        }
        if (impulse_math::dot(acd, ao) > 0.0f) {
            simplex.set_triangle(sa, sc, sd);
            return do_simplex_triangle(simplex, direction);
        }
        if (impulse_math::dot(adb, ao) > 0.0f) {
            simplex.set_triangle(sa, sd, sb);
            return do_simplex_triangle(simplex, direction);
        }
        return true;
    }

    // =========================================================================
    // EPA Helpers
    // =========================================================================

    /// Grow a 1-3 point simplex into a tetrahedron around the origin
    template<typename SupportA, typename SupportB>
    [[nodiscard]] static bool complete_simplex(const SupportA& shape_a, const SupportB& shape_b,
                                               Simplex& simplex) {
        using impulse_math::Vec3;
        static const Vec3 k_axes[6] = {
            Vec3(1, 0, 0), Vec3(-1, 0, 0), Vec3(0, 1, 0),
            Vec3(0, -1, 0), Vec3(0, 0, 1), Vec3(0, 0, -1)
        };
        constexpr float k_min_extent = 1e-5f;

        if (simplex.size() == 1) {
            for (const auto& axis : k_axes) {
                SupportPoint p = get_support(shape_a, shape_b, axis);
                if (impulse_math::length(p.point - simplex[0].point) > k_min_extent) {
                    simplex.push_back(p);
                    break;
                }
            }
        }

        if (simplex.size() == 2) {
            Vec3 line = impulse_math::normalize_or_zero(simplex[1].point - simplex[0].point);
            Vec3 perp = impulse_math::any_perpendicular(line);
            impulse_math::Quat step = impulse_math::quat_from_axis_angle(line, impulse_math::consts::PI / 3.0f);
            for (int i = 0; i < 6; ++i) {
                SupportPoint p = get_support(shape_a, shape_b, perp);
                Vec3 offset = p.point - simplex[0].point;
                if (impulse_math::length(impulse_math::cross(offset, line)) > k_min_extent) {
                    simplex.push_back(p);
                    break;
                }
                perp = impulse_math::rotate(step, perp);
            }
        }

        if (simplex.size() == 3) {
            Vec3 n = impulse_math::cross(simplex[1].point - simplex[0].point,
                                         simplex[2].point - simplex[0].point);
            float n_len = impulse_math::length(n);
            if (n_len < k_min_extent * k_min_extent) {
                return false;
            }
            n /= n_len;
            SupportPoint p = get_support(shape_a, shape_b, n);
            if (std::abs(impulse_math::dot(p.point - simplex[0].point, n)) < k_min_extent) {
                p = get_support(shape_a, shape_b, -n);
            }
            if (std::abs(impulse_math::dot(p.point - simplex[0].point, n)) < k_min_extent) {
                return false;
            }
            simplex.push_back(p);
        }

        return simplex.size() == 4;
    }

    /// Face with outward normal (origin on the inner side)
    [[nodiscard]] static Face make_face(const std::vector<SupportPoint>& vertices, int i, int j, int k) {
        using impulse_math::Vec3;
        Face face;
        face.indices = {i, j, k};

        const Vec3& a = vertices[i].point;
        Vec3 n = impulse_math::cross(vertices[j].point - a, vertices[k].point - a);
        float len = impulse_math::length(n);
        if (len < k_gjk_epsilon) {
            return face;    // Degenerate: never closest, never visible
        }

        face.normal = n / len;
        face.distance = impulse_math::dot(face.normal, a);
        if (face.distance < 0.0f) {
            std::swap(face.indices[0], face.indices[1]);
            face.normal = -face.normal;
            face.distance = -face.distance;
        }
        return face;
    }

    [[nodiscard]] static std::size_t closest_face(const std::vector<Face>& faces) {
        std::size_t best = 0;
        for (std::size_t i = 1; i < faces.size(); ++i) {
            if (faces[i].distance < faces[best].distance) {
                best = i;
            }
        }
        return best;
    }

    /// Add edge to horizon, removing it if the reverse edge is present
    static void add_edge(std::vector<std::pair<int, int>>& horizon, int a, int b) {
        for (auto it = horizon.begin(); it != horizon.end(); ++it) {
            if (it->first == b && it->second == a) {
                horizon.erase(it);
                return;
            }
        }
        horizon.emplace_back(a, b);
    }

    [[nodiscard]] static Penetration build_penetration(const std::vector<SupportPoint>& vertices,
                                                       const Face& face) {
        Penetration pen;
        pen.normal = face.normal;
        pen.depth = std::max(face.distance, 0.0f);

        const SupportPoint& v0 = vertices[face.indices[0]];
        const SupportPoint& v1 = vertices[face.indices[1]];
        const SupportPoint& v2 = vertices[face.indices[2]];

        auto [u, v, w] = barycentric(face.normal * face.distance, v0.point, v1.point, v2.point);
        pen.point_a = v0.support_a * u + v1.support_a * v + v2.support_a * w;
        pen.point_b = v0.support_b * u + v1.support_b * v + v2.support_b * w;
        return pen;
    }

    [[nodiscard]] static std::tuple<float, float, float> barycentric(
        const impulse_math::Vec3& p,
        const impulse_math::Vec3& a,
        const impulse_math::Vec3& b,
        const impulse_math::Vec3& c) {

        impulse_math::Vec3 v0 = b - a;
        impulse_math::Vec3 v1 = c - a;
        impulse_math::Vec3 v2 = p - a;

        float d00 = impulse_math::dot(v0, v0);
        float d01 = impulse_math::dot(v0, v1);
        float d11 = impulse_math::dot(v1, v1);
        float d20 = impulse_math::dot(v2, v0);
        float d21 = impulse_math::dot(v2, v1);

        float denom = d00 * d11 - d01 * d01;
        if (std::abs(denom) < k_gjk_epsilon) {
            return {1.0f / 3.0f, 1.0f / 3.0f, 1.0f / 3.0f};
        }

        float v = (d11 * d20 - d01 * d21) / denom;
        float w = (d00 * d21 - d01 * d20) / denom;
        return {1.0f - v - w, v, w};
    }
};

} // namespace impulse_physics
