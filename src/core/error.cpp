/// @file error.cpp
/// @brief Error formatting and statistics for impulse_core
///
/// The Result/Error types are header-only. This file provides the
/// out-of-line formatting helpers and the debug error counters.

#include <impulse/core/error.hpp>

#include <array>
#include <atomic>
#include <sstream>

namespace impulse_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* shape_kind_name(ShapeError::Kind kind) {
    switch (kind) {
        case ShapeError::Kind::InvalidDimension: return "InvalidDimension";
        case ShapeError::Kind::NonFinite: return "NonFinite";
        case ShapeError::Kind::TooFewVertices: return "TooFewVertices";
        case ShapeError::Kind::NotConvex: return "NotConvex";
        case ShapeError::Kind::DegenerateNormal: return "DegenerateNormal";
    }
    return "Unknown";
}

const char* body_kind_name(BodyError::Kind kind) {
    switch (kind) {
        case BodyError::Kind::NonFinitePose: return "NonFinitePose";
        case BodyError::Kind::NonFiniteVelocity: return "NonFiniteVelocity";
        case BodyError::Kind::InvalidMass: return "InvalidMass";
        case BodyError::Kind::InvalidScale: return "InvalidScale";
        case BodyError::Kind::MissingShape: return "MissingShape";
        case BodyError::Kind::DuplicateId: return "DuplicateId";
    }
    return "Unknown";
}

const char* config_kind_name(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::FileNotFound: return "FileNotFound";
        case ConfigError::Kind::ParseError: return "ParseError";
        case ConfigError::Kind::InvalidValue: return "InvalidValue";
    }
    return "Unknown";
}

std::string format_shape_error(const ShapeError& err) {
    std::ostringstream oss;
    oss << "[ShapeError:" << shape_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

std::string format_body_error(const BodyError& err) {
    std::ostringstream oss;
    oss << "[BodyError:" << body_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError:" << config_kind_name(err.kind) << "] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ShapeError>) {
            oss << detail::format_shape_error(err);
        } else if constexpr (std::is_same_v<T, BodyError>) {
            oss << detail::format_body_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_code_slots = static_cast<std::size_t>(ErrorCode::NumericalError) + 1;

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::array<std::atomic<std::uint64_t>, k_code_slots> by_code{};
};

ErrorStats& stats() {
    static ErrorStats s_stats;
    return s_stats;
}

} // anonymous namespace

void record_error(const Error& error) {
    auto& s = stats();
    s.total_errors.fetch_add(1, std::memory_order_relaxed);
    auto slot = static_cast<std::size_t>(error.code());
    if (slot < k_code_slots) {
        s.by_code[slot].fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return stats().total_errors.load(std::memory_order_relaxed);
}

std::uint64_t error_count(ErrorCode code) {
    auto slot = static_cast<std::size_t>(code);
    if (slot >= k_code_slots) return 0;
    return stats().by_code[slot].load(std::memory_order_relaxed);
}

void reset_error_stats() {
    auto& s = stats();
    s.total_errors.store(0, std::memory_order_relaxed);
    for (auto& counter : s.by_code) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << total_error_count() << "\n";
    for (std::size_t i = 0; i < k_code_slots; ++i) {
        auto count = stats().by_code[i].load(std::memory_order_relaxed);
        if (count > 0) {
            oss << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": " << count << "\n";
        }
    }
    return oss.str();
}

} // namespace debug

} // namespace impulse_core
