#pragma once

/// @file types.hpp
/// @brief Core types for impulse_physics

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

namespace impulse_physics {

// =============================================================================
// Identifiers
// =============================================================================

/// Opaque entity identifier supplied by the host
struct EntityId {
    std::uint64_t value = 0;

    bool operator==(const EntityId& other) const noexcept { return value == other.value; }
    bool operator!=(const EntityId& other) const noexcept { return value != other.value; }
    bool operator<(const EntityId& other) const noexcept { return value < other.value; }
};

// =============================================================================
// Body Kinds
// =============================================================================

/// Rigidbody motion type
enum class BodyKind : std::uint8_t {
    Static,         ///< Never moves, infinite mass
    Kinematic,      ///< Moved by its velocity, infinite mass
    Dynamic,        ///< Simulated by forces and contacts
};

/// Get body kind name
[[nodiscard]] const char* to_string(BodyKind kind);

/// How contacts involving a body are handled
enum class CollisionStrategy : std::uint8_t {
    FullResolution, ///< Detect, report and resolve
    CollisionOnly,  ///< Detect and report only (trigger volume)
};

[[nodiscard]] const char* to_string(CollisionStrategy strategy);

// =============================================================================
// Material Combine Rules
// =============================================================================

/// How two material coefficients combine into one contact coefficient
enum class CombineRule : std::uint8_t {
    Minimum,
    Maximum,
    Average,
    Multiply,
};

[[nodiscard]] const char* to_string(CombineRule rule);

/// Combine two coefficients
[[nodiscard]] float combine(CombineRule rule, float a, float b) noexcept;

// =============================================================================
// Broad Phase Kinds
// =============================================================================

/// Spatial index implementation used by the broad phase
enum class BroadPhaseKind : std::uint8_t {
    Bvh,            ///< Dynamic AABB tree (default)
    SweepAndPrune,  ///< Sort and sweep on the axis of greatest variance
    UniformGrid,    ///< Hash grid
    BruteForce,     ///< All pairs
};

[[nodiscard]] const char* to_string(BroadPhaseKind kind);

// =============================================================================
// Collision Layers
// =============================================================================

/// Collision layer (up to 32 layers)
using CollisionLayer = std::uint32_t;

/// Predefined collision layers
namespace layers {
    constexpr CollisionLayer None       = 0;
    constexpr CollisionLayer Default    = 1 << 0;
    constexpr CollisionLayer Static     = 1 << 1;
    constexpr CollisionLayer Dynamic    = 1 << 2;
    constexpr CollisionLayer Kinematic  = 1 << 3;
    constexpr CollisionLayer Trigger    = 1 << 4;
    constexpr CollisionLayer Player     = 1 << 5;
    constexpr CollisionLayer Projectile = 1 << 6;
    constexpr CollisionLayer Debris     = 1 << 7;
    constexpr CollisionLayer All        = ~0u;
} // namespace layers

/// Per-entity data the broad phase filters on
struct CollisionFilter {
    BodyKind kind = BodyKind::Dynamic;
    CollisionLayer layer = layers::Default;     ///< This entity's layers
    CollisionLayer mask = layers::All;          ///< Layers this entity collides with

    /// Check the layer/mask test in both directions
    [[nodiscard]] static bool can_collide(const CollisionFilter& a, const CollisionFilter& b) noexcept {
        return (a.layer & b.mask) != 0 && (b.layer & a.mask) != 0;
    }

    /// Static bodies never move; kinematic and dynamic bodies do
    [[nodiscard]] bool can_move() const noexcept { return kind != BodyKind::Static; }
};

// =============================================================================
// Candidate Pair
// =============================================================================

/// Unordered entity pair stored canonically (a < b)
struct CandidatePair {
    EntityId a;
    EntityId b;

    /// Build a canonical pair from two ids in any order
    [[nodiscard]] static CandidatePair make(EntityId x, EntityId y) noexcept {
        return x < y ? CandidatePair{x, y} : CandidatePair{y, x};
    }

    [[nodiscard]] bool contains(EntityId id) const noexcept { return a == id || b == id; }

    bool operator==(const CandidatePair& other) const noexcept {
        return a == other.a && b == other.b;
    }
    bool operator!=(const CandidatePair& other) const noexcept { return !(*this == other); }
    bool operator<(const CandidatePair& other) const noexcept {
        if (a.value != other.a.value) return a.value < other.a.value;
        return b.value < other.b.value;
    }
};

[[nodiscard]] std::string to_string(const CandidatePair& pair);

// =============================================================================
// Contact Events
// =============================================================================

/// Lifecycle phase of a touching pair
enum class ContactPhase : std::uint8_t {
    Began,          ///< Touching this tick, not last tick
    Persisted,      ///< Touching this tick and last tick
    Ended,          ///< Touching last tick, not this tick
};

[[nodiscard]] const char* to_string(ContactPhase phase);

/// Contact lifecycle notification
struct ContactEvent {
    CandidatePair pair;
    ContactPhase phase = ContactPhase::Began;

    bool operator==(const ContactEvent& other) const noexcept {
        return pair == other.pair && phase == other.phase;
    }
};

} // namespace impulse_physics

template<>
struct std::hash<impulse_physics::EntityId> {
    std::size_t operator()(const impulse_physics::EntityId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template<>
struct std::hash<impulse_physics::CandidatePair> {
    std::size_t operator()(const impulse_physics::CandidatePair& pair) const noexcept {
        std::size_t h1 = std::hash<std::uint64_t>{}(pair.a.value);
        std::size_t h2 = std::hash<std::uint64_t>{}(pair.b.value);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

namespace impulse_physics {

/// Filter data keyed by entity, consulted by the broad phase
using CollisionFilterTable = std::unordered_map<EntityId, CollisionFilter>;

} // namespace impulse_physics
