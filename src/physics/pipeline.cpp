/// @file pipeline.cpp
/// @brief One physics tick over a host-provided snapshot of entities

#include <impulse/physics/pipeline.hpp>
#include <impulse/core/log.hpp>

#include <cassert>
#include <chrono>
#include <string>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace impulse_physics {

using impulse_core::BodyError;
using impulse_core::Error;

namespace {

using Clock = std::chrono::high_resolution_clock;

float elapsed_ms(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<float, std::milli>(end - start).count();
}

/// First problem found with a snapshot, if any
template<typename D>
std::optional<Error> check_snapshot(const EntitySnapshot<D>& entity) {
    if (!entity.shape) {
        return Error(BodyError::missing_shape(entity.id.value));
    }
    if (auto shape_ok = validate_shape(*entity.shape); !shape_ok) {
        return shape_ok.error();
    }
    if (!entity.pose.is_finite()) {
        return Error(BodyError::non_finite_pose(entity.id.value));
    }
    if (entity.pose.scale <= 0.0f) {
        return Error(BodyError::invalid_scale(entity.id.value));
    }
    if (auto body_ok = entity.body.validate(entity.id); !body_ok) {
        return body_ok.error();
    }
    if (!D::is_finite(entity.forces.force) || !D::is_finite_angular(entity.forces.torque)) {
        return Error(BodyError::non_finite_velocity(entity.id.value)).with_context("field", "forces");
    }
    return std::nullopt;
}

} // anonymous namespace

template<typename D>
PhysicsPipeline<D>::PhysicsPipeline(const PhysicsConfig& config) {
    if (auto valid = config.validate(); !valid) {
        impulse_core::physics_logger()->warn("Invalid physics config ({}), using defaults",
                                             valid.error().message());
        apply_config(PhysicsConfig::defaults());
    } else {
        apply_config(config);
    }
}

template<typename D>
impulse_core::Result<void> PhysicsPipeline<D>::set_config(const PhysicsConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid;
    }
    apply_config(config);
    return impulse_core::Ok();
}

template<typename D>
void PhysicsPipeline<D>::apply_config(const PhysicsConfig& config) {
    m_config = config;
    m_index = make_spatial_index<D>(config.broadphase.kind, config.broadphase.cell_size);
    m_resolver = ContactResolver<D>(config.solver);
    m_integrator = Integrator<D>(config.integrator);
}

template<typename D>
StepOutput<D> PhysicsPipeline<D>::step(std::span<const EntitySnapshot<D>> entities, float dt,
                                       ContactState& state) {
    auto step_start = Clock::now();
    StepOutput<D> output;
    StepStats& stats = output.stats;
    const bool advance = Integrator<D>::is_valid_timestep(dt);

    // =========================================================================
    // Validate
    // =========================================================================

    std::vector<std::size_t> accepted;
    accepted.reserve(entities.size());
    std::unordered_set<EntityId> seen;
    seen.reserve(entities.size());

    for (std::size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        std::optional<Error> problem;
        if (seen.contains(entity.id)) {
            problem = Error(BodyError::duplicate_id(entity.id.value));
        } else {
            problem = check_snapshot(entity);
        }

        if (problem) {
            impulse_core::physics_logger()->warn("Rejected entity {}: {}", entity.id.value,
                                                 impulse_core::build_error_chain(*problem));
            impulse_core::debug::record_error(*problem);
            output.rejected.push_back(RejectedEntity{entity.id, std::move(*problem)});
            continue;
        }

        seen.insert(entity.id);
        accepted.push_back(i);
    }

    stats.accepted_entities = static_cast<std::uint32_t>(accepted.size());
    stats.rejected_entities = static_cast<std::uint32_t>(output.rejected.size());

    // =========================================================================
    // Forces
    // =========================================================================

    std::vector<SolverBody<D>> bodies;
    bodies.reserve(accepted.size());
    std::unordered_map<EntityId, std::size_t> slot_of;
    slot_of.reserve(accepted.size());
    CollisionFilterTable filters;
    filters.reserve(accepted.size());

    for (std::size_t i : accepted) {
        const auto& entity = entities[i];
        SolverBody<D> body{entity.id, entity.pose, entity.body};
        if (advance) {
            m_integrator.integrate_velocity(body.body, entity.forces, dt, entity.pose.rotation);
        }

        switch (entity.body.kind) {
            case BodyKind::Dynamic: ++stats.dynamic_bodies; break;
            case BodyKind::Kinematic: ++stats.kinematic_bodies; break;
            case BodyKind::Static: ++stats.static_bodies; break;
        }

        slot_of.emplace(entity.id, bodies.size());
        filters.emplace(entity.id, entity.body.filter());
        bodies.push_back(std::move(body));
    }

    // =========================================================================
    // Broad Phase
    // =========================================================================

    auto bp_start = Clock::now();

    // Shapes within contact_epsilon of each other are in contact, so the
    // bounds always grow by at least that much
    const float bounds_margin = m_config.broadphase.margin + m_config.narrowphase.contact_epsilon;

    std::vector<IndexEntry<D>> index_entries;
    index_entries.reserve(accepted.size());
    for (std::size_t i : accepted) {
        const auto& entity = entities[i];
        auto bounds = compute_bounds(*entity.shape, entity.pose);
        if (bounds_margin > 0.0f) {
            bounds = bounds.expanded(bounds_margin);
        }
        index_entries.push_back(IndexEntry<D>{entity.id, bounds});
    }
    m_index->rebuild(index_entries);

    std::vector<CandidatePair> candidates = m_broadphase.compute_pairs(*m_index, filters);
    stats.broadphase_pairs = static_cast<std::uint32_t>(candidates.size());

    auto bp_end = Clock::now();

    // =========================================================================
    // Narrow Phase
    // =========================================================================

    std::vector<CandidatePair> active;
    std::vector<ContactManifold<D>> resolvable;

    for (const auto& pair : candidates) {
        auto slot_a = slot_of.find(pair.a);
        auto slot_b = slot_of.find(pair.b);
        // The index only holds accepted entities
        assert(slot_a != slot_of.end() && slot_b != slot_of.end() &&
               "candidate pair references an entity absent from the snapshot");
        if (slot_a == slot_of.end() || slot_b == slot_of.end()) {
            continue;
        }
        const auto& a = entities[accepted[slot_a->second]];
        const auto& b = entities[accepted[slot_b->second]];

        auto manifold = NarrowPhase::test_pair<D>(pair, *a.shape, a.pose, *b.shape, b.pose,
                                                  m_config.narrowphase);
        if (!manifold) {
            continue;
        }

        active.push_back(pair);
        stats.contact_points += static_cast<std::uint32_t>(manifold->size());

        if (a.body.is_trigger() || b.body.is_trigger()) {
            ++stats.trigger_contacts;
        } else {
            resolvable.push_back(*manifold);
        }
        output.manifolds.push_back(std::move(*manifold));
    }
    stats.narrowphase_pairs = static_cast<std::uint32_t>(active.size());

    auto np_end = Clock::now();

    // =========================================================================
    // Resolve
    // =========================================================================

    ResolveResult<D> resolved;
    if (advance) {
        resolved = m_resolver.resolve(resolvable, bodies);
    }

    auto solver_end = Clock::now();

    // =========================================================================
    // Integrate
    // =========================================================================

    output.updates.reserve(bodies.size());
    for (std::size_t slot = 0; slot < bodies.size(); ++slot) {
        SolverBody<D>& body = bodies[slot];
        if (advance) {
            if (slot < resolved.deltas.size()) {
                m_integrator.apply_delta(body.pose, body.body, resolved.deltas[slot]);
            }
            m_integrator.integrate_position(body.pose, body.body, dt);

            const auto& previous = entities[accepted[slot]].pose;
            if (m_integrator.revert_if_non_finite(body.pose, body.body, previous)) {
                impulse_core::physics_logger()->warn("Entity {}: non-finite state after integration, pose reverted",
                                                     body.id.value);
                ++stats.reverted_bodies;
            }
        }
        output.updates.push_back(EntityUpdate<D>{body.id, body.pose, body.body});
    }

    auto int_end = Clock::now();

    // =========================================================================
    // Events
    // =========================================================================

    EmitResult emitted = ContactEventEmitter::emit(state, active);
    output.events = std::move(emitted.events);
    state = std::move(emitted.next_state);

    auto step_end = Clock::now();

    stats.broadphase_time_ms = elapsed_ms(bp_start, bp_end);
    stats.narrowphase_time_ms = elapsed_ms(bp_end, np_end);
    stats.solver_time_ms = elapsed_ms(np_end, solver_end);
    stats.integration_time_ms = elapsed_ms(solver_end, int_end);
    stats.step_time_ms = elapsed_ms(step_start, step_end);

    if (impulse_core::physics_logger()->should_log(spdlog::level::trace)) {
        impulse_core::log_structured(spdlog::level::trace, "physics", "step", {
            {"dt", fmt::format("{}", dt)},
            {"entities", std::to_string(stats.accepted_entities)},
            {"rejected", std::to_string(stats.rejected_entities)},
            {"pairs", std::to_string(stats.broadphase_pairs)},
            {"contacts", std::to_string(stats.narrowphase_pairs)},
            {"events", std::to_string(output.events.size())},
            {"ms", fmt::format("{:.3f}", stats.step_time_ms)},
        });
    }

    return output;
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

template class PhysicsPipeline<Dim2>;
template class PhysicsPipeline<Dim3>;

} // namespace impulse_physics
