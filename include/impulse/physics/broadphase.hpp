#pragma once

/// @file broadphase.hpp
/// @brief Broad phase pair filtering

#include "fwd.hpp"
#include "types.hpp"
#include "spatial_index.hpp"

#include <span>
#include <vector>

namespace impulse_physics {

// =============================================================================
// BroadPhase
// =============================================================================

/// Turns raw bounds overlaps into the candidate pairs worth an exact test
class BroadPhase {
public:
    /// Counters from the last filtering pass
    struct Stats {
        std::size_t raw_pairs = 0;          ///< Pairs reported by the index
        std::size_t static_pairs = 0;       ///< Dropped: neither body moves
        std::size_t masked_pairs = 0;       ///< Dropped: layer/mask test failed
        std::size_t unknown_pairs = 0;      ///< Dropped: id missing from the table
        std::size_t accepted_pairs = 0;
    };

    /// Query the index and filter the result
    template<typename D>
    [[nodiscard]] std::vector<CandidatePair> compute_pairs(const ISpatialIndex<D>& index,
                                                           const CollisionFilterTable& filters) {
        std::vector<CandidatePair> raw = index.query_overlaps();
        return filter_pairs(raw, filters);
    }

    /// Drop static-static pairs, layer/mask failures and unknown ids.
    /// Output is canonical, sorted and duplicate-free.
    [[nodiscard]] std::vector<CandidatePair> filter_pairs(std::span<const CandidatePair> pairs,
                                                          const CollisionFilterTable& filters);

    [[nodiscard]] const Stats& stats() const noexcept { return m_stats; }

private:
    Stats m_stats;
};

} // namespace impulse_physics
