/// @file types.cpp
/// @brief Core type implementations for impulse_physics

#include <impulse/physics/types.hpp>

#include <algorithm>

namespace impulse_physics {

// =============================================================================
// String Conversions
// =============================================================================

const char* to_string(BodyKind kind) {
    switch (kind) {
        case BodyKind::Static: return "Static";
        case BodyKind::Kinematic: return "Kinematic";
        case BodyKind::Dynamic: return "Dynamic";
    }
    return "Unknown";
}

const char* to_string(CollisionStrategy strategy) {
    switch (strategy) {
        case CollisionStrategy::FullResolution: return "FullResolution";
        case CollisionStrategy::CollisionOnly: return "CollisionOnly";
    }
    return "Unknown";
}

const char* to_string(CombineRule rule) {
    switch (rule) {
        case CombineRule::Minimum: return "min";
        case CombineRule::Maximum: return "max";
        case CombineRule::Average: return "average";
        case CombineRule::Multiply: return "multiply";
    }
    return "unknown";
}

const char* to_string(BroadPhaseKind kind) {
    switch (kind) {
        case BroadPhaseKind::Bvh: return "bvh";
        case BroadPhaseKind::SweepAndPrune: return "sweep_and_prune";
        case BroadPhaseKind::UniformGrid: return "grid";
        case BroadPhaseKind::BruteForce: return "brute_force";
    }
    return "unknown";
}

const char* to_string(ContactPhase phase) {
    switch (phase) {
        case ContactPhase::Began: return "Began";
        case ContactPhase::Persisted: return "Persisted";
        case ContactPhase::Ended: return "Ended";
    }
    return "Unknown";
}

std::string to_string(const CandidatePair& pair) {
    return "(" + std::to_string(pair.a.value) + ", " + std::to_string(pair.b.value) + ")";
}

// =============================================================================
// Combine Rules
// =============================================================================

float combine(CombineRule rule, float a, float b) noexcept {
    switch (rule) {
        case CombineRule::Minimum: return std::min(a, b);
        case CombineRule::Maximum: return std::max(a, b);
        case CombineRule::Average: return (a + b) * 0.5f;
        case CombineRule::Multiply: return a * b;
    }
    return std::min(a, b);
}

} // namespace impulse_physics
