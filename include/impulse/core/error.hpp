#pragma once

/// @file error.hpp
/// @brief Error handling types for impulse_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace impulse_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    NumericalError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::NumericalError: return "NumericalError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Shape construction and validation errors
struct ShapeError {
    enum class Kind : std::uint8_t {
        InvalidDimension,   // Radius, extent or height <= 0
        NonFinite,          // NaN or infinite parameter
        TooFewVertices,     // Polytope below minimum vertex count
        NotConvex,          // Polygon winding is not strictly convex
        DegenerateNormal,   // Plane normal of zero length
    };

    Kind kind;
    std::string message;
    std::string shape;      // Primitive name

    [[nodiscard]] static ShapeError invalid_dimension(const std::string& shape_name, const std::string& what) {
        return ShapeError{Kind::InvalidDimension, shape_name + ": " + what, shape_name};
    }

    [[nodiscard]] static ShapeError non_finite(const std::string& shape_name) {
        return ShapeError{Kind::NonFinite, shape_name + ": parameters must be finite", shape_name};
    }

    [[nodiscard]] static ShapeError too_few_vertices(const std::string& shape_name, std::size_t got, std::size_t need) {
        return ShapeError{Kind::TooFewVertices,
            shape_name + ": needs at least " + std::to_string(need) + " vertices, got " + std::to_string(got),
            shape_name};
    }

    [[nodiscard]] static ShapeError not_convex(const std::string& shape_name) {
        return ShapeError{Kind::NotConvex, shape_name + ": vertices do not form a convex counter-clockwise loop",
            shape_name};
    }

    [[nodiscard]] static ShapeError degenerate_normal(const std::string& shape_name) {
        return ShapeError{Kind::DegenerateNormal, shape_name + ": normal has zero length", shape_name};
    }
};

/// Per-entity snapshot errors (reported as rejected entities)
struct BodyError {
    enum class Kind : std::uint8_t {
        NonFinitePose,      // Position, rotation or scale not finite
        NonFiniteVelocity,  // Linear or angular velocity not finite
        InvalidMass,        // Negative/non-finite mass or inverse inertia
        InvalidScale,       // Pose scale <= 0
        MissingShape,       // Null shape pointer
        DuplicateId,        // Entity id appears twice in one tick
    };

    Kind kind;
    std::string message;
    std::uint64_t entity = 0;

    [[nodiscard]] static BodyError non_finite_pose(std::uint64_t id) {
        return BodyError{Kind::NonFinitePose, "Entity " + std::to_string(id) + ": pose is not finite", id};
    }

    [[nodiscard]] static BodyError non_finite_velocity(std::uint64_t id) {
        return BodyError{Kind::NonFiniteVelocity, "Entity " + std::to_string(id) + ": velocity is not finite", id};
    }

    [[nodiscard]] static BodyError invalid_mass(std::uint64_t id) {
        return BodyError{Kind::InvalidMass, "Entity " + std::to_string(id) + ": invalid mass data", id};
    }

    [[nodiscard]] static BodyError invalid_scale(std::uint64_t id) {
        return BodyError{Kind::InvalidScale, "Entity " + std::to_string(id) + ": scale must be positive", id};
    }

    [[nodiscard]] static BodyError missing_shape(std::uint64_t id) {
        return BodyError{Kind::MissingShape, "Entity " + std::to_string(id) + ": no shape", id};
    }

    [[nodiscard]] static BodyError duplicate_id(std::uint64_t id) {
        return BodyError{Kind::DuplicateId, "Entity " + std::to_string(id) + ": duplicate id in snapshot", id};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Config file could not be opened
        ParseError,     // Malformed JSON or wrong value type
        InvalidValue,   // Value out of range
    };

    Kind kind;
    std::string message;
    std::string key;    // Offending key, if any

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key_name, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key_name + "': " + reason, key_name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ShapeError,
        BodyError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ShapeError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(BodyError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ShapeError::Kind kind) {
        switch (kind) {
            case ShapeError::Kind::InvalidDimension: return ErrorCode::InvalidArgument;
            case ShapeError::Kind::NonFinite: return ErrorCode::NumericalError;
            case ShapeError::Kind::TooFewVertices: return ErrorCode::InvalidArgument;
            case ShapeError::Kind::NotConvex: return ErrorCode::ValidationError;
            case ShapeError::Kind::DegenerateNormal: return ErrorCode::NumericalError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(BodyError::Kind kind) {
        switch (kind) {
            case BodyError::Kind::NonFinitePose: return ErrorCode::NumericalError;
            case BodyError::Kind::NonFiniteVelocity: return ErrorCode::NumericalError;
            case BodyError::Kind::InvalidMass: return ErrorCode::InvalidArgument;
            case BodyError::Kind::InvalidScale: return ErrorCode::InvalidArgument;
            case BodyError::Kind::MissingShape: return ErrorCode::NotFound;
            case BodyError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::IOError;
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind prefix and context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count for one error code
std::uint64_t error_count(ErrorCode code);

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace impulse_core
