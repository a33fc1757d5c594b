#pragma once

/// @file types.hpp
/// @brief Core type definitions for impulse_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"
#include "constants.hpp"

namespace impulse_math {

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec2 {
    inline constexpr Vec2 ZERO  = Vec2(0.0f, 0.0f);
    inline constexpr Vec2 ONE   = Vec2(1.0f, 1.0f);
    inline constexpr Vec2 X     = Vec2(1.0f, 0.0f);
    inline constexpr Vec2 Y     = Vec2(0.0f, 1.0f);
    inline constexpr Vec2 NEG_Y = Vec2(0.0f, -1.0f);
}

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
    inline constexpr Vec3 NEG_Y = Vec3(0.0f, -1.0f, 0.0f);

    inline constexpr Vec3 UP   = Y;
    inline constexpr Vec3 DOWN = NEG_Y;
}

// =============================================================================
// Matrix Constants
// =============================================================================

namespace mat3 {
    inline const Mat3 IDENTITY = Mat3(1.0f);
    inline const Mat3 ZERO     = Mat3(0.0f);
}

// =============================================================================
// Quaternion Constants
// =============================================================================

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

} // namespace impulse_math
