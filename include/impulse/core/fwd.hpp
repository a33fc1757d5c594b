#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for impulse_core module

#include <cstdint>

namespace impulse_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ShapeError;
struct BodyError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace impulse_core
