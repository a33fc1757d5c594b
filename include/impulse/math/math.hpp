#pragma once

/// @file math.hpp
/// @brief Main include for impulse_math
///
/// GLM-based vector, quaternion and bounding-box helpers used by
/// the physics core.

#include "fwd.hpp"
#include "constants.hpp"
#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"
#include "bounds.hpp"
