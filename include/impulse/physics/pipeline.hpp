#pragma once

/// @file pipeline.hpp
/// @brief One physics tick over a host-provided snapshot of entities
///
/// The host (an ECS) hands in a span of entity snapshots, the tick length
/// and the contact state it kept from the previous tick. The pipeline runs
/// validation, forces, broad phase, narrow phase, resolution, integration and
/// event emission in that order and hands back updated poses and bodies. It
/// keeps no per-entity state between ticks.

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"
#include "body.hpp"
#include "contact.hpp"
#include "spatial_index.hpp"
#include "broadphase.hpp"
#include "narrowphase.hpp"
#include "solver.hpp"
#include "integrator.hpp"
#include "events.hpp"
#include "config.hpp"

#include <impulse/core/error.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Pipeline Input / Output
// =============================================================================

/// Everything the pipeline needs to know about one entity for one tick
template<typename D>
struct EntitySnapshot {
    EntityId id;
    SharedShape<D> shape;
    Pose<D> pose;
    Body<D> body;
    Forces<D> forces;
};

/// New pose and body state for an accepted entity
template<typename D>
struct EntityUpdate {
    EntityId id;
    Pose<D> pose;
    Body<D> body;
};

/// Entity excluded from the tick, with the reason
struct RejectedEntity {
    EntityId id;
    impulse_core::Error error;
};

/// Counters and stage timings of one tick
struct StepStats {
    std::uint32_t accepted_entities = 0;
    std::uint32_t rejected_entities = 0;
    std::uint32_t dynamic_bodies = 0;
    std::uint32_t kinematic_bodies = 0;
    std::uint32_t static_bodies = 0;

    std::uint32_t broadphase_pairs = 0;
    std::uint32_t narrowphase_pairs = 0;    ///< Pairs actually in contact
    std::uint32_t contact_points = 0;
    std::uint32_t trigger_contacts = 0;     ///< Reported but not resolved
    std::uint32_t reverted_bodies = 0;      ///< Non-finite results rolled back

    /// Performance
    float step_time_ms = 0.0f;
    float broadphase_time_ms = 0.0f;
    float narrowphase_time_ms = 0.0f;
    float solver_time_ms = 0.0f;
    float integration_time_ms = 0.0f;
};

template<typename D>
struct StepOutput {
    std::vector<EntityUpdate<D>> updates;       ///< Accepted entities, input order
    std::vector<ContactEvent> events;
    std::vector<RejectedEntity> rejected;
    std::vector<ContactManifold<D>> manifolds;  ///< Canonical pair order
    StepStats stats;
};

// =============================================================================
// PhysicsPipeline
// =============================================================================

template<typename D>
class PhysicsPipeline {
public:
    /// An invalid configuration is replaced by the defaults
    explicit PhysicsPipeline(const PhysicsConfig& config = PhysicsConfig::defaults());

    /// Run one tick. `state` is read as the previous contact set and
    /// replaced by this tick's.
    [[nodiscard]] StepOutput<D> step(std::span<const EntitySnapshot<D>> entities, float dt,
                                     ContactState& state);

    [[nodiscard]] const PhysicsConfig& config() const noexcept { return m_config; }

    /// Validate and apply a new configuration
    [[nodiscard]] impulse_core::Result<void> set_config(const PhysicsConfig& config);

    /// Spatial index as left by the last step
    [[nodiscard]] const ISpatialIndex<D>& index() const noexcept { return *m_index; }

    /// Broad phase counters of the last step
    [[nodiscard]] const BroadPhase::Stats& broadphase_stats() const noexcept { return m_broadphase.stats(); }

private:
    void apply_config(const PhysicsConfig& config);

    PhysicsConfig m_config;
    std::unique_ptr<ISpatialIndex<D>> m_index;
    BroadPhase m_broadphase;
    ContactResolver<D> m_resolver;
    Integrator<D> m_integrator;
};

using PhysicsPipeline2D = PhysicsPipeline<Dim2>;
using PhysicsPipeline3D = PhysicsPipeline<Dim3>;

using EntitySnapshot2D = EntitySnapshot<Dim2>;
using EntitySnapshot3D = EntitySnapshot<Dim3>;

} // namespace impulse_physics
