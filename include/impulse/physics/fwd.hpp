#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for impulse_physics

#include <cstdint>

namespace impulse_physics {

// Identifiers and enums
struct EntityId;
struct CandidatePair;
struct CollisionFilter;
enum class BodyKind : std::uint8_t;
enum class CollisionStrategy : std::uint8_t;
enum class CombineRule : std::uint8_t;
enum class ContactPhase : std::uint8_t;
struct ContactEvent;
class ContactState;
enum class BroadPhaseKind : std::uint8_t;

// Dimension traits
struct Dim2;
struct Dim3;

// Shapes and bodies
struct Circle;
struct Box2;
struct ConvexPolygon;
struct Capsule2;
struct Plane2;
struct Sphere;
struct Box;
struct ConvexPolyhedron;
struct Capsule;
struct Plane;

template<typename D> struct Pose;
template<typename D> struct Body;
template<typename D> struct Forces;
template<typename D> struct MassProperties;

// Pipeline stages
template<typename D> class ISpatialIndex;
template<typename D> class BvhIndex;
template<typename D> class SweepAndPruneIndex;
template<typename D> class UniformGridIndex;
template<typename D> class BruteForceIndex;
class BroadPhase;
template<typename D> struct ContactManifold;
template<typename D> class ContactResolver;
template<typename D> class Integrator;
class ContactEventEmitter;
class ContactTracker;
template<typename D> class PhysicsPipeline;

// Configuration
struct SolverConfig;
struct NarrowPhaseConfig;
struct IntegratorConfig;
struct BroadPhaseConfig;
struct PhysicsConfig;

} // namespace impulse_physics
