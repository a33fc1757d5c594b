/// @file main.cpp
/// @brief Spheres and boxes on a floor with a trigger volume
///
/// A dynamic sphere rolls through a static trigger box. The trigger reports
/// Began/Ended events but never pushes the sphere. Stage timings of the last
/// tick are printed at the end.

#include <impulse/physics/physics.hpp>
#include <impulse/core/log.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <unordered_map>
#include <vector>

using namespace impulse_physics;

namespace {

constexpr float k_dt = 1.0f / 60.0f;
constexpr int k_ticks = 300;

constexpr std::uint64_t k_floor = 1;
constexpr std::uint64_t k_trigger = 2;
constexpr std::uint64_t k_ball = 10;
constexpr std::uint64_t k_crate = 11;

} // namespace

int main() {
    impulse_core::init_logging();
    impulse_core::set_logger_level("physics", spdlog::level::debug);
    IMPULSE_LOG_INFO("=== impulse basic3d ===");

    PhysicsPipeline3D pipeline(PhysicsConfig::high_fidelity());
    ContactState contacts;

    auto floor_shape = ShapeFactory::plane({0.0f, 1.0f, 0.0f}, 0.0f);
    auto trigger_shape = ShapeFactory::box(1.0f, 1.0f, 1.0f);
    auto ball_shape = ShapeFactory::sphere(0.5f);
    auto crate_shape = ShapeFactory::box(0.5f, 0.5f, 0.5f);
    if (!floor_shape || !trigger_shape || !ball_shape || !crate_shape) {
        IMPULSE_LOG_ERROR("Failed to create shapes");
        return EXIT_FAILURE;
    }

    auto ball_body = Body3::dynamic_from_shape(**ball_shape, 1.0f);
    auto crate_body = Body3::dynamic_from_shape(**crate_shape, 0.5f);
    if (!ball_body || !crate_body) {
        IMPULSE_LOG_ERROR("Failed to derive mass properties");
        return EXIT_FAILURE;
    }

    std::vector<EntitySnapshot3D> entities;
    entities.push_back({EntityId{k_floor}, *floor_shape, Pose3{}, Body3::make_static(), {}});

    Body3 trigger = Body3::make_static();
    trigger.strategy = CollisionStrategy::CollisionOnly;
    trigger.layer = layers::Trigger;
    entities.push_back({EntityId{k_trigger}, *trigger_shape, Pose3{}, trigger, {}});
    entities.back().pose.position = {4.0f, 1.0f, 0.0f};

    ball_body->linear_velocity = {3.0f, 0.0f, 0.0f};
    ball_body->friction = 0.2f;
    entities.push_back({EntityId{k_ball}, *ball_shape, Pose3{}, *ball_body, {}});
    entities.back().pose.position = {0.0f, 0.5f, 0.0f};

    crate_body->restitution = 0.1f;
    entities.push_back({EntityId{k_crate}, *crate_shape, Pose3{}, *crate_body, {}});
    entities.back().pose.position = {-2.0f, 3.0f, 0.0f};
    entities.back().pose.rotation = impulse_math::quat_from_axis_angle({0.0f, 0.0f, 1.0f}, 0.3f);

    std::unordered_map<EntityId, std::size_t> slot_of;
    for (std::size_t i = 0; i < entities.size(); ++i) {
        slot_of.emplace(entities[i].id, i);
    }

    StepStats last_stats;
    for (int tick = 0; tick < k_ticks; ++tick) {
        auto out = pipeline.step(entities, k_dt, contacts);

        for (const auto& update : out.updates) {
            auto& entity = entities[slot_of.at(update.id)];
            entity.pose = update.pose;
            entity.body = update.body;
        }

        for (const auto& event : out.events) {
            if (event.phase == ContactPhase::Persisted) {
                continue;
            }
            if (event.pair.contains(EntityId{k_trigger})) {
                IMPULSE_LOG_INFO("tick {:3}: trigger {} {}", tick, to_string(event.phase), to_string(event.pair));
            } else {
                IMPULSE_LOG_INFO("tick {:3}: {} {}", tick, to_string(event.phase), to_string(event.pair));
            }
        }
        last_stats = out.stats;
    }

    for (const auto& entity : entities) {
        const auto& p = entity.pose.position;
        IMPULSE_LOG_INFO("entity {} at ({:.3f}, {:.3f}, {:.3f})", entity.id.value, p.x, p.y, p.z);
    }

    IMPULSE_LOG_INFO("last tick: {:.3f} ms (broad {:.3f}, narrow {:.3f}, solver {:.3f}, integrate {:.3f}), "
                 "{} pairs, {} contacts",
                 last_stats.step_time_ms, last_stats.broadphase_time_ms, last_stats.narrowphase_time_ms,
                 last_stats.solver_time_ms, last_stats.integration_time_ms,
                 last_stats.broadphase_pairs, last_stats.narrowphase_pairs);

    impulse_core::shutdown_logging();
    return EXIT_SUCCESS;
}
