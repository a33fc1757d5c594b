/// @file broadphase.cpp
/// @brief Broad phase pair filtering

#include <impulse/physics/broadphase.hpp>

#include <impulse/core/log.hpp>

namespace impulse_physics {

std::vector<CandidatePair> BroadPhase::filter_pairs(std::span<const CandidatePair> pairs,
                                                    const CollisionFilterTable& filters) {
    m_stats = Stats{};
    m_stats.raw_pairs = pairs.size();

    std::vector<CandidatePair> result;
    result.reserve(pairs.size());

    for (const auto& raw : pairs) {
        if (raw.a == raw.b) continue;
        CandidatePair pair = CandidatePair::make(raw.a, raw.b);

        auto it_a = filters.find(pair.a);
        auto it_b = filters.find(pair.b);
        if (it_a == filters.end() || it_b == filters.end()) {
            ++m_stats.unknown_pairs;
            impulse_core::physics_logger()->debug("Broad phase: pair {} references an unknown entity",
                                                  to_string(pair));
            continue;
        }

        const CollisionFilter& fa = it_a->second;
        const CollisionFilter& fb = it_b->second;

        if (!fa.can_move() && !fb.can_move()) {
            ++m_stats.static_pairs;
            continue;
        }
        if (!CollisionFilter::can_collide(fa, fb)) {
            ++m_stats.masked_pairs;
            continue;
        }

        result.push_back(pair);
    }

    finalize_pairs(result);
    m_stats.accepted_pairs = result.size();
    return result;
}

} // namespace impulse_physics
