/// @file events.cpp
/// @brief Contact lifecycle events

#include <impulse/physics/events.hpp>
#include <impulse/physics/spatial_index.hpp>

#include <algorithm>

namespace impulse_physics {

// =============================================================================
// ContactState
// =============================================================================

ContactState::ContactState(std::vector<CandidatePair> pairs)
    : m_pairs(std::move(pairs)) {
    for (auto& pair : m_pairs) {
        pair = CandidatePair::make(pair.a, pair.b);
    }
    finalize_pairs(m_pairs);
}

bool ContactState::contains(const CandidatePair& pair) const {
    CandidatePair key = CandidatePair::make(pair.a, pair.b);
    return std::binary_search(m_pairs.begin(), m_pairs.end(), key);
}

// =============================================================================
// ContactEventEmitter
// =============================================================================

EmitResult ContactEventEmitter::emit(const ContactState& previous,
                                     std::span<const CandidatePair> active) {
    EmitResult result;
    result.next_state = ContactState(std::vector<CandidatePair>(active.begin(), active.end()));

    const auto current = result.next_state.pairs();
    result.events.reserve(current.size() + previous.size());

    for (const auto& pair : current) {
        ContactPhase phase = previous.contains(pair) ? ContactPhase::Persisted : ContactPhase::Began;
        result.events.push_back(ContactEvent{pair, phase});
    }

    for (const auto& pair : previous.pairs()) {
        if (!result.next_state.contains(pair)) {
            result.events.push_back(ContactEvent{pair, ContactPhase::Ended});
        }
    }

    return result;
}

// =============================================================================
// ContactTracker
// =============================================================================

std::vector<ContactEvent> ContactTracker::update(std::span<const CandidatePair> active) {
    EmitResult result = ContactEventEmitter::emit(m_state, active);
    m_state = std::move(result.next_state);
    return std::move(result.events);
}

} // namespace impulse_physics
