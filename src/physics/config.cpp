/// @file config.cpp
/// @brief Pipeline configuration presets and JSON serialization

#include <impulse/physics/config.hpp>
#include <impulse/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <string>

namespace impulse_physics {

using impulse_core::ConfigError;
using impulse_core::Err;
using impulse_core::Ok;
using impulse_core::Result;

// =============================================================================
// Presets
// =============================================================================

PhysicsConfig PhysicsConfig::defaults() {
    return PhysicsConfig{};
}

PhysicsConfig PhysicsConfig::high_fidelity() {
    PhysicsConfig config;
    config.solver.velocity_iterations = 16;
    return config;
}

PhysicsConfig PhysicsConfig::performance() {
    PhysicsConfig config;
    config.solver.velocity_iterations = 4;
    config.broadphase.kind = BroadPhaseKind::SweepAndPrune;
    return config;
}

// =============================================================================
// String Conversion
// =============================================================================

std::optional<CombineRule> parse_combine_rule(std::string_view name) {
    if (name == "min") return CombineRule::Minimum;
    if (name == "max") return CombineRule::Maximum;
    if (name == "average") return CombineRule::Average;
    if (name == "multiply") return CombineRule::Multiply;
    return std::nullopt;
}

std::optional<BroadPhaseKind> parse_broadphase_kind(std::string_view name) {
    if (name == "bvh") return BroadPhaseKind::Bvh;
    if (name == "sweep_and_prune") return BroadPhaseKind::SweepAndPrune;
    if (name == "grid") return BroadPhaseKind::UniformGrid;
    if (name == "brute_force") return BroadPhaseKind::BruteForce;
    return std::nullopt;
}

// =============================================================================
// JSON
// =============================================================================

namespace {

template<typename T>
void read(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

/// Integer counts are read signed so negative input is rejected instead of wrapping
template<typename T>
Result<void> read_count(const nlohmann::json& j, const char* key, std::int64_t min, std::int64_t max, T& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        return Err(ConfigError::parse_error(std::string(key) + " must be an integer"));
    }
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(max)) {
        return Err(ConfigError::invalid_value(key, "must be in [" + std::to_string(min) + ", " +
                                                   std::to_string(max) + "]"));
    }
    auto count = value.get<std::int64_t>();
    if (count < min || count > max) {
        return Err(ConfigError::invalid_value(key, "must be in [" + std::to_string(min) + ", " +
                                                   std::to_string(max) + "]"));
    }
    out = static_cast<T>(count);
    return Ok();
}

Result<void> read_combine(const nlohmann::json& j, const char* key, CombineRule& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    auto name = j.at(key).get<std::string>();
    auto rule = parse_combine_rule(name);
    if (!rule) {
        return Err(ConfigError::invalid_value(key, "unknown combine rule '" + name + "'"));
    }
    out = *rule;
    return Ok();
}

} // anonymous namespace

Result<PhysicsConfig> PhysicsConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<PhysicsConfig>(ConfigError::parse_error("root must be an object"));
    }

    PhysicsConfig config;

    try {
        if (j.contains("solver")) {
            const auto& s = j.at("solver");
            if (auto r = read_count(s, "velocity_iterations", 1, k_max_velocity_iterations,
                                    config.solver.velocity_iterations); !r) {
                return Err<PhysicsConfig>(r.error());
            }
            read(s, "position_correction_percent", config.solver.position_correction_percent);
            read(s, "slop", config.solver.slop);
            read(s, "restitution_threshold", config.solver.restitution_threshold);

            if (auto r = read_combine(s, "restitution_combine", config.solver.restitution_combine); !r) {
                return Err<PhysicsConfig>(r.error());
            }
            if (auto r = read_combine(s, "friction_combine", config.solver.friction_combine); !r) {
                return Err<PhysicsConfig>(r.error());
            }
        }

        if (j.contains("narrowphase")) {
            const auto& n = j.at("narrowphase");
            read(n, "contact_epsilon", config.narrowphase.contact_epsilon);
            if (auto r = read_count(n, "max_manifold_points", 1, k_max_manifold_points,
                                    config.narrowphase.max_manifold_points); !r) {
                return Err<PhysicsConfig>(r.error());
            }
        }

        if (j.contains("integrator")) {
            const auto& i = j.at("integrator");
            if (i.contains("gravity")) {
                const auto& g = i.at("gravity");
                if (!g.is_array() || g.size() < 2 || g.size() > 3) {
                    return Err<PhysicsConfig>(ConfigError::invalid_value("gravity", "expected [x, y] or [x, y, z]"));
                }
                config.integrator.gravity = impulse_math::Vec3(
                    g.at(0).get<float>(), g.at(1).get<float>(), g.size() == 3 ? g.at(2).get<float>() : 0.0f);
            }
            read(i, "max_linear_speed", config.integrator.max_linear_speed);
            read(i, "max_angular_speed", config.integrator.max_angular_speed);
        }

        if (j.contains("broadphase")) {
            const auto& b = j.at("broadphase");
            if (b.contains("kind")) {
                auto name = b.at("kind").get<std::string>();
                auto kind = parse_broadphase_kind(name);
                if (!kind) {
                    return Err<PhysicsConfig>(ConfigError::invalid_value("kind", "unknown broad phase '" + name + "'"));
                }
                config.broadphase.kind = *kind;
            }
            read(b, "cell_size", config.broadphase.cell_size);
            read(b, "margin", config.broadphase.margin);
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<PhysicsConfig>(ConfigError::parse_error(e.what()));
    }

    if (auto valid = config.validate(); !valid) {
        return Err<PhysicsConfig>(valid.error());
    }
    return Ok(config);
}

nlohmann::json PhysicsConfig::to_json() const {
    nlohmann::json j;

    j["solver"] = {
        {"velocity_iterations", solver.velocity_iterations},
        {"position_correction_percent", solver.position_correction_percent},
        {"slop", solver.slop},
        {"restitution_threshold", solver.restitution_threshold},
        {"restitution_combine", to_string(solver.restitution_combine)},
        {"friction_combine", to_string(solver.friction_combine)},
    };

    j["narrowphase"] = {
        {"contact_epsilon", narrowphase.contact_epsilon},
        {"max_manifold_points", narrowphase.max_manifold_points},
    };

    j["integrator"] = {
        {"gravity", {integrator.gravity.x, integrator.gravity.y, integrator.gravity.z}},
        {"max_linear_speed", integrator.max_linear_speed},
        {"max_angular_speed", integrator.max_angular_speed},
    };

    j["broadphase"] = {
        {"kind", to_string(broadphase.kind)},
        {"cell_size", broadphase.cell_size},
        {"margin", broadphase.margin},
    };

    return j;
}

Result<void> PhysicsConfig::validate() const {
    auto non_negative = [](float v) { return std::isfinite(v) && v >= 0.0f; };

    if (solver.velocity_iterations < 1 || solver.velocity_iterations > k_max_velocity_iterations) {
        return Err(ConfigError::invalid_value("velocity_iterations", "must be in [1, 1000]"));
    }
    float percent = solver.position_correction_percent;
    if (!std::isfinite(percent) || percent < 0.0f || percent > 1.0f) {
        return Err(ConfigError::invalid_value("position_correction_percent", "must be in [0, 1]"));
    }
    if (!non_negative(solver.slop)) {
        return Err(ConfigError::invalid_value("slop", "must be >= 0"));
    }
    if (!non_negative(solver.restitution_threshold)) {
        return Err(ConfigError::invalid_value("restitution_threshold", "must be >= 0"));
    }
    if (!non_negative(narrowphase.contact_epsilon)) {
        return Err(ConfigError::invalid_value("contact_epsilon", "must be >= 0"));
    }
    if (narrowphase.max_manifold_points < 1 || narrowphase.max_manifold_points > k_max_manifold_points) {
        return Err(ConfigError::invalid_value("max_manifold_points", "must be in [1, 4]"));
    }
    if (!impulse_math::is_finite(integrator.gravity)) {
        return Err(ConfigError::invalid_value("gravity", "must be finite"));
    }
    if (!std::isfinite(integrator.max_linear_speed) || integrator.max_linear_speed <= 0.0f) {
        return Err(ConfigError::invalid_value("max_linear_speed", "must be > 0"));
    }
    if (!std::isfinite(integrator.max_angular_speed) || integrator.max_angular_speed <= 0.0f) {
        return Err(ConfigError::invalid_value("max_angular_speed", "must be > 0"));
    }
    if (!std::isfinite(broadphase.cell_size) || broadphase.cell_size <= 0.0f) {
        return Err(ConfigError::invalid_value("cell_size", "must be > 0"));
    }
    if (!non_negative(broadphase.margin)) {
        return Err(ConfigError::invalid_value("margin", "must be >= 0"));
    }
    return Ok();
}

// =============================================================================
// File Loading
// =============================================================================

Result<PhysicsConfig> load_physics_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        impulse_core::physics_logger()->error("Failed to open physics config '{}'", path.string());
        return Err<PhysicsConfig>(ConfigError::file_not_found(path.string()));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        impulse_core::physics_logger()->error("Failed to parse physics config '{}': {}", path.string(), e.what());
        return Err<PhysicsConfig>(ConfigError::parse_error(e.what()));
    }

    auto config = PhysicsConfig::from_json(j);
    if (!config) {
        impulse_core::physics_logger()->error("Invalid physics config '{}': {}", path.string(),
                                              config.error().message());
        return config;
    }

    impulse_core::physics_logger()->info("Loaded physics config '{}' ({} velocity iterations, {} broad phase)",
                                         path.string(), config->solver.velocity_iterations,
                                         to_string(config->broadphase.kind));
    return config;
}

} // namespace impulse_physics
