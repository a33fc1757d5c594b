/// @file main.cpp
/// @brief Circles and a box falling onto a ground plane
///
/// The example plays the role of a host:
/// - keeps its own entity list and the contact state between ticks
/// - calls PhysicsPipeline2D::step at a fixed rate
/// - writes the returned poses back and logs contact events
///
/// Usage: basic2d [config.json]

#include <impulse/physics/physics.hpp>
#include <impulse/core/log.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <unordered_map>
#include <vector>

using namespace impulse_physics;

namespace {

constexpr float k_dt = 1.0f / 60.0f;
constexpr int k_ticks = 240;

PhysicsConfig load_config(int argc, char* argv[]) {
    if (argc < 2) {
        return PhysicsConfig::defaults();
    }
    auto config = load_physics_config(argv[1]);
    if (!config) {
        IMPULSE_LOG_WARN("Using default config: {}", impulse_core::build_error_chain(config.error()));
        return PhysicsConfig::defaults();
    }
    return *config;
}

bool add_dynamic(std::vector<EntitySnapshot2D>& entities, std::uint64_t id,
                 impulse_core::Result<SharedShape2> shape, impulse_math::Vec2 position,
                 float restitution) {
    if (!shape) {
        IMPULSE_LOG_ERROR("Shape for entity {}: {}", id, shape.error().message());
        return false;
    }
    auto body = Body2::dynamic_from_shape(**shape, 1.0f);
    if (!body) {
        IMPULSE_LOG_ERROR("Body for entity {}: {}", id, body.error().message());
        return false;
    }
    body->restitution = restitution;

    EntitySnapshot2D entity{EntityId{id}, *shape, Pose2{}, *body, {}};
    entity.pose.position = position;
    entities.push_back(std::move(entity));
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    impulse_core::init_logging();
    IMPULSE_LOG_INFO("=== impulse basic2d ===");

    PhysicsPipeline2D pipeline(load_config(argc, argv));
    ContactState contacts;

    std::vector<EntitySnapshot2D> entities;

    auto ground = ShapeFactory::plane2({0.0f, 1.0f}, 0.0f);
    if (!ground) {
        IMPULSE_LOG_ERROR("Ground: {}", ground.error().message());
        return EXIT_FAILURE;
    }
    entities.push_back({EntityId{1}, *ground, Pose2{}, Body2::make_static(), {}});

    bool ok = add_dynamic(entities, 2, ShapeFactory::circle(0.5f), {0.0f, 2.0f}, 0.6f)
           && add_dynamic(entities, 3, ShapeFactory::circle(0.25f), {0.3f, 4.0f}, 0.2f)
           && add_dynamic(entities, 4, ShapeFactory::box2(0.4f, 0.3f), {-1.5f, 3.0f}, 0.0f);
    if (!ok) {
        return EXIT_FAILURE;
    }

    std::unordered_map<EntityId, std::size_t> slot_of;
    for (std::size_t i = 0; i < entities.size(); ++i) {
        slot_of.emplace(entities[i].id, i);
    }

    for (int tick = 0; tick < k_ticks; ++tick) {
        auto out = pipeline.step(entities, k_dt, contacts);

        for (const auto& update : out.updates) {
            auto& entity = entities[slot_of.at(update.id)];
            entity.pose = update.pose;
            entity.body = update.body;
        }

        for (const auto& event : out.events) {
            if (event.phase != ContactPhase::Persisted) {
                IMPULSE_LOG_INFO("tick {:3}: {} {}", tick, to_string(event.phase), to_string(event.pair));
            }
        }
    }

    for (const auto& entity : entities) {
        IMPULSE_LOG_INFO("entity {} at ({:.3f}, {:.3f}) angle {:.3f}", entity.id.value,
                     entity.pose.position.x, entity.pose.position.y, entity.pose.rotation);
    }

    impulse_core::shutdown_logging();
    return EXIT_SUCCESS;
}
