#pragma once

/// @file narrowphase.hpp
/// @brief Exact contact generation between shape pairs
///
/// Both shapes are moved to world space and a dispatch matrix indexed by the
/// two primitive kinds picks the pairwise routine. The returned normal always
/// points from A to B. Separation up to contact_epsilon counts as contact.

#include "fwd.hpp"
#include "contact.hpp"
#include "shape.hpp"

#include <cstddef>
#include <optional>

namespace impulse_physics {

// =============================================================================
// NarrowPhaseConfig
// =============================================================================

struct NarrowPhaseConfig {
    float contact_epsilon = 1.0e-4f;                        ///< Touching tolerance
    std::size_t max_manifold_points = k_max_manifold_points;  ///< 1..4
};

// =============================================================================
// NarrowPhase
// =============================================================================

class NarrowPhase {
public:
    /// Contact between two 2D shapes, or nullopt when disjoint.
    /// The manifold pair is left for the caller to fill.
    [[nodiscard]] static std::optional<ContactManifold2D> test(
        const Shape2& shape_a, const Pose2& pose_a,
        const Shape2& shape_b, const Pose2& pose_b,
        const NarrowPhaseConfig& config = {});

    /// Contact between two 3D shapes, or nullopt when disjoint
    [[nodiscard]] static std::optional<ContactManifold3D> test(
        const Shape3& shape_a, const Pose3& pose_a,
        const Shape3& shape_b, const Pose3& pose_b,
        const NarrowPhaseConfig& config = {});

    /// Test a candidate pair and tag the manifold with it
    template<typename D>
    [[nodiscard]] static std::optional<ContactManifold<D>> test_pair(
        const CandidatePair& pair,
        const ShapeOf<D>& shape_a, const Pose<D>& pose_a,
        const ShapeOf<D>& shape_b, const Pose<D>& pose_b,
        const NarrowPhaseConfig& config = {}) {
        auto manifold = test(shape_a, pose_a, shape_b, pose_b, config);
        if (manifold) {
            manifold->pair = pair;
        }
        return manifold;
    }
};

} // namespace impulse_physics
