#pragma once

/// @file bounds.hpp
/// @brief Axis-aligned bounding boxes for impulse_math
///
/// AABB (3D) and AABB2 (2D) share the same interface so that
/// spatial structures can be written once over either.

#include "types.hpp"
#include "vec.hpp"
#include <array>
#include <cmath>
#include <algorithm>
#include <span>

namespace impulse_math {

// =============================================================================
// AABB (Axis-Aligned Bounding Box)
// =============================================================================

/// Axis-Aligned Bounding Box
struct AABB {
    using vector_type = Vec3;
    static constexpr int k_axes = 3;

    Vec3 min = Vec3(consts::MAX_FLOAT);   ///< Minimum corner
    Vec3 max = Vec3(-consts::MAX_FLOAT);  ///< Maximum corner

    // =========================================================================
    // Constructors
    // =========================================================================

    AABB() noexcept = default;

    /// Create from min and max corners
    AABB(const Vec3& min_point, const Vec3& max_point) noexcept
        : min(min_point), max(max_point) {}

    /// Create from center and half extents
    static AABB from_center_half_extents(const Vec3& center, const Vec3& half_extents) noexcept {
        return AABB(center - half_extents, center + half_extents);
    }

    /// Create from a list of points
    static AABB from_points(std::span<const Vec3> points) noexcept {
        AABB result;
        for (const auto& p : points) {
            result.expand_to_include(p);
        }
        return result;
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] Vec3 center() const noexcept {
        return (min + max) * 0.5f;
    }

    [[nodiscard]] Vec3 half_extents() const noexcept {
        return (max - min) * 0.5f;
    }

    [[nodiscard]] Vec3 size() const noexcept {
        return max - min;
    }

    [[nodiscard]] float surface_area() const noexcept {
        Vec3 s = size();
        return 2.0f * (s.x * s.y + s.y * s.z + s.z * s.x);
    }

    /// Check if AABB is valid (min <= max for all components)
    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    // =========================================================================
    // Expansion
    // =========================================================================

    void expand_to_include(const Vec3& point) noexcept {
        min = impulse_math::min(min, point);
        max = impulse_math::max(max, point);
    }

    void expand_to_include(const AABB& other) noexcept {
        min = impulse_math::min(min, other.min);
        max = impulse_math::max(max, other.max);
    }

    [[nodiscard]] AABB union_with(const AABB& other) const noexcept {
        AABB result = *this;
        result.expand_to_include(other);
        return result;
    }

    /// Expand uniformly in all directions
    [[nodiscard]] AABB expanded(float amount) const noexcept {
        return AABB(min - Vec3(amount), max + Vec3(amount));
    }

    // =========================================================================
    // Containment Tests
    // =========================================================================

    [[nodiscard]] bool contains_point(const Vec3& point) const noexcept {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    [[nodiscard]] bool contains_aabb(const AABB& other) const noexcept {
        return other.min.x >= min.x && other.max.x <= max.x &&
               other.min.y >= min.y && other.max.y <= max.y &&
               other.min.z >= min.z && other.max.z <= max.z;
    }

    /// Overlap test; touching boxes intersect
    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    /// Get all 8 corner points
    [[nodiscard]] std::array<Vec3, 8> corners() const noexcept {
        return {{
            Vec3(min.x, min.y, min.z),
            Vec3(max.x, min.y, min.z),
            Vec3(min.x, max.y, min.z),
            Vec3(max.x, max.y, min.z),
            Vec3(min.x, min.y, max.z),
            Vec3(max.x, min.y, max.z),
            Vec3(min.x, max.y, max.z),
            Vec3(max.x, max.y, max.z)
        }};
    }

    bool operator==(const AABB& other) const noexcept {
        return min == other.min && max == other.max;
    }
};

// =============================================================================
// AABB2 (2D Axis-Aligned Bounding Box)
// =============================================================================

/// 2D Axis-Aligned Bounding Box
struct AABB2 {
    using vector_type = Vec2;
    static constexpr int k_axes = 2;

    Vec2 min = Vec2(consts::MAX_FLOAT);
    Vec2 max = Vec2(-consts::MAX_FLOAT);

    AABB2() noexcept = default;

    AABB2(const Vec2& min_point, const Vec2& max_point) noexcept
        : min(min_point), max(max_point) {}

    static AABB2 from_center_half_extents(const Vec2& center, const Vec2& half_extents) noexcept {
        return AABB2(center - half_extents, center + half_extents);
    }

    static AABB2 from_points(std::span<const Vec2> points) noexcept {
        AABB2 result;
        for (const auto& p : points) {
            result.expand_to_include(p);
        }
        return result;
    }

    [[nodiscard]] Vec2 center() const noexcept { return (min + max) * 0.5f; }
    [[nodiscard]] Vec2 half_extents() const noexcept { return (max - min) * 0.5f; }
    [[nodiscard]] Vec2 size() const noexcept { return max - min; }

    /// Perimeter (the 2D analogue of surface area)
    [[nodiscard]] float perimeter() const noexcept {
        Vec2 s = size();
        return 2.0f * (s.x + s.y);
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y;
    }

    void expand_to_include(const Vec2& point) noexcept {
        min = impulse_math::min(min, point);
        max = impulse_math::max(max, point);
    }

    void expand_to_include(const AABB2& other) noexcept {
        min = impulse_math::min(min, other.min);
        max = impulse_math::max(max, other.max);
    }

    [[nodiscard]] AABB2 union_with(const AABB2& other) const noexcept {
        AABB2 result = *this;
        result.expand_to_include(other);
        return result;
    }

    [[nodiscard]] AABB2 expanded(float amount) const noexcept {
        return AABB2(min - Vec2(amount), max + Vec2(amount));
    }

    [[nodiscard]] bool contains_point(const Vec2& point) const noexcept {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y;
    }

    [[nodiscard]] bool contains_aabb(const AABB2& other) const noexcept {
        return other.min.x >= min.x && other.max.x <= max.x &&
               other.min.y >= min.y && other.max.y <= max.y;
    }

    [[nodiscard]] bool intersects(const AABB2& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y;
    }

    bool operator==(const AABB2& other) const noexcept {
        return min == other.min && max == other.max;
    }
};

// =============================================================================
// Free Functions
// =============================================================================

[[nodiscard]] inline bool intersects(const AABB& a, const AABB& b) noexcept {
    return a.intersects(b);
}

[[nodiscard]] inline bool intersects(const AABB2& a, const AABB2& b) noexcept {
    return a.intersects(b);
}

[[nodiscard]] inline AABB combine(const AABB& a, const AABB& b) noexcept {
    return a.union_with(b);
}

[[nodiscard]] inline AABB2 combine(const AABB2& a, const AABB2& b) noexcept {
    return a.union_with(b);
}

/// Tree cost metric: surface area in 3D
[[nodiscard]] inline float cost_metric(const AABB& a) noexcept {
    return a.surface_area();
}

/// Tree cost metric: perimeter in 2D
[[nodiscard]] inline float cost_metric(const AABB2& a) noexcept {
    return a.perimeter();
}

/// Check all components are finite
[[nodiscard]] inline bool is_finite(const AABB& a) noexcept {
    return is_finite(a.min) && is_finite(a.max);
}

[[nodiscard]] inline bool is_finite(const AABB2& a) noexcept {
    return is_finite(a.min) && is_finite(a.max);
}

} // namespace impulse_math
