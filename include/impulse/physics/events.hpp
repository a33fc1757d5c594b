#pragma once

/// @file events.hpp
/// @brief Contact lifecycle events from the active pair set of each tick
///
/// The previous tick's pair set is owned by the host and passed in
/// explicitly. Each call returns the events and the state to keep for the
/// next tick.

#include "fwd.hpp"
#include "types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace impulse_physics {

// =============================================================================
// ContactState
// =============================================================================

/// Set of pairs in contact, kept canonical and sorted
class ContactState {
public:
    ContactState() = default;

    /// Canonicalizes, sorts and removes duplicates
    explicit ContactState(std::vector<CandidatePair> pairs);

    [[nodiscard]] bool contains(const CandidatePair& pair) const;

    [[nodiscard]] std::span<const CandidatePair> pairs() const noexcept { return m_pairs; }
    [[nodiscard]] std::size_t size() const noexcept { return m_pairs.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_pairs.empty(); }
    void clear() noexcept { m_pairs.clear(); }

    bool operator==(const ContactState& other) const { return m_pairs == other.m_pairs; }

private:
    std::vector<CandidatePair> m_pairs;
};

// =============================================================================
// ContactEventEmitter
// =============================================================================

struct EmitResult {
    std::vector<ContactEvent> events;
    ContactState next_state;
};

/// Diffs the active pairs of this tick against the previous state.
/// Began and Persisted events come first in canonical pair order, followed
/// by Ended events in canonical pair order.
class ContactEventEmitter {
public:
    [[nodiscard]] static EmitResult emit(const ContactState& previous,
                                         std::span<const CandidatePair> active);
};

// =============================================================================
// ContactTracker
// =============================================================================

/// Owns a ContactState and replaces it on every update
class ContactTracker {
public:
    std::vector<ContactEvent> update(std::span<const CandidatePair> active);

    [[nodiscard]] const ContactState& state() const noexcept { return m_state; }
    void reset() noexcept { m_state.clear(); }

private:
    ContactState m_state;
};

} // namespace impulse_physics
