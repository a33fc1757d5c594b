#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for impulse_math types

#include <glm/fwd.hpp>

namespace impulse_math {

// =============================================================================
// Vector Types (GLM aliases)
// =============================================================================
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;

using IVec2 = glm::ivec2;
using IVec3 = glm::ivec3;

// =============================================================================
// Matrix Types (GLM aliases)
// =============================================================================
using Mat2 = glm::mat2;
using Mat3 = glm::mat3;

// =============================================================================
// Quaternion Types (GLM aliases)
// =============================================================================
using Quat = glm::quat;

// =============================================================================
// Forward Declarations (impulse_math types)
// =============================================================================
struct AABB;
struct AABB2;

} // namespace impulse_math
