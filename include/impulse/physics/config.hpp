#pragma once

/// @file config.hpp
/// @brief Pipeline configuration and its JSON form

#include "fwd.hpp"
#include "types.hpp"
#include "solver.hpp"
#include "narrowphase.hpp"
#include "integrator.hpp"

#include <impulse/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace impulse_physics {

// =============================================================================
// BroadPhaseConfig
// =============================================================================

struct BroadPhaseConfig {
    BroadPhaseKind kind = BroadPhaseKind::Bvh;
    float cell_size = 2.0f;     ///< Uniform grid only
    float margin = 0.0f;        ///< Added to every entity's bounds on top of contact_epsilon
};

// =============================================================================
// PhysicsConfig
// =============================================================================

struct PhysicsConfig {
    SolverConfig solver;
    NarrowPhaseConfig narrowphase;
    IntegratorConfig integrator;
    BroadPhaseConfig broadphase;

    /// Default configuration
    [[nodiscard]] static PhysicsConfig defaults();

    /// More solver iterations
    [[nodiscard]] static PhysicsConfig high_fidelity();

    /// Fewer iterations, sweep-and-prune broad phase
    [[nodiscard]] static PhysicsConfig performance();

    /// Read a (possibly partial) document; missing keys keep their defaults
    [[nodiscard]] static impulse_core::Result<PhysicsConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Range-check every value
    [[nodiscard]] impulse_core::Result<void> validate() const;
};

/// Load and validate a JSON configuration file
[[nodiscard]] impulse_core::Result<PhysicsConfig> load_physics_config(const std::filesystem::path& path);

// =============================================================================
// String Conversion
// =============================================================================

/// "min", "max", "average", "multiply"
[[nodiscard]] std::optional<CombineRule> parse_combine_rule(std::string_view name);

/// "bvh", "sweep_and_prune", "grid", "brute_force"
[[nodiscard]] std::optional<BroadPhaseKind> parse_broadphase_kind(std::string_view name);

} // namespace impulse_physics
