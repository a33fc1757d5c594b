/// @file physics.hpp
/// @brief Main include header for impulse_physics
///
/// impulse_physics is a stateless 2D/3D collision and rigid-body core:
/// - Spatial indexing (BVH, sweep and prune, uniform grid, brute force)
/// - Broad phase filtering with layers and masks
/// - Narrow phase contact manifolds for circles, boxes, polygons, capsules and planes
/// - Sequential impulse contact resolution with positional correction
/// - Semi-implicit Euler integration
/// - Began / Persisted / Ended contact events
///
/// ## Quick Start
///
/// ```cpp
/// #include <impulse/physics/physics.hpp>
///
/// using namespace impulse_physics;
///
/// PhysicsPipeline3D pipeline(PhysicsConfig::defaults());
/// ContactState contacts;
///
/// std::vector<EntitySnapshot3D> entities;
/// entities.push_back({EntityId{1}, ShapeFactory::plane({0, 1, 0}, 0).value(),
///                     Pose3{}, Body3::make_static(), {}});
///
/// auto ball = ShapeFactory::sphere(0.5f).value();
/// EntitySnapshot3D falling{EntityId{2}, ball, Pose3{}, Body3::dynamic_from_shape(*ball, 1.0f).value(), {}};
/// falling.pose.position = {0, 3, 0};
/// entities.push_back(falling);
///
/// auto out = pipeline.step(entities, 1.0f / 60.0f, contacts);
/// for (const auto& update : out.updates) {
///     // write update.pose / update.body back to the host
/// }
/// for (const auto& event : out.events) {
///     // event.pair, event.phase
/// }
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "dimension.hpp"
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
#include "pipeline.hpp"

namespace impulse_physics {

/// Prelude - commonly used types
namespace prelude {
    using impulse_physics::PhysicsPipeline2D;
    using impulse_physics::PhysicsPipeline3D;
    using impulse_physics::PhysicsConfig;
    using impulse_physics::StepStats;

    using impulse_physics::EntityId;
    using impulse_physics::EntitySnapshot2D;
    using impulse_physics::EntitySnapshot3D;
    using impulse_physics::BodyKind;
    using impulse_physics::Body2;
    using impulse_physics::Body3;
    using impulse_physics::Pose2;
    using impulse_physics::Pose3;

    using impulse_physics::ShapeFactory;
    using impulse_physics::Shape2;
    using impulse_physics::Shape3;

    using impulse_physics::ContactState;
    using impulse_physics::ContactEvent;
    using impulse_physics::ContactPhase;
    using impulse_physics::CandidatePair;

    using impulse_physics::CollisionLayer;
    using impulse_physics::CollisionStrategy;
} // namespace prelude

} // namespace impulse_physics
