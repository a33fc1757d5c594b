// impulse_physics contact event tests

#include <catch2/catch_test_macros.hpp>
#include <impulse/physics/events.hpp>

#include <vector>

using namespace impulse_physics;

namespace {

CandidatePair pair_of(std::uint64_t a, std::uint64_t b) {
    return CandidatePair::make(EntityId{a}, EntityId{b});
}

} // anonymous namespace

// =============================================================================
// ContactState
// =============================================================================

TEST_CASE("ContactState canonicalizes its pairs", "[physics][events]") {
    ContactState state({
        CandidatePair{EntityId{5}, EntityId{2}},
        pair_of(1, 3),
        pair_of(2, 5),
        pair_of(1, 3),
    });

    REQUIRE(state.size() == 2);
    REQUIRE(state.pairs()[0] == pair_of(1, 3));
    REQUIRE(state.pairs()[1] == pair_of(2, 5));

    REQUIRE(state.contains(pair_of(5, 2)));
    REQUIRE(state.contains(CandidatePair{EntityId{5}, EntityId{2}}));
    REQUIRE_FALSE(state.contains(pair_of(1, 2)));

    REQUIRE(state == ContactState({pair_of(2, 5), pair_of(1, 3)}));

    state.clear();
    REQUIRE(state.empty());
}

// =============================================================================
// ContactEventEmitter
// =============================================================================

TEST_CASE("Contact lifecycle across ticks", "[physics][events]") {
    const std::vector<CandidatePair> touching = {pair_of(1, 2)};
    const std::vector<CandidatePair> apart;

    ContactState state;

    auto tick1 = ContactEventEmitter::emit(state, touching);
    REQUIRE(tick1.events == std::vector<ContactEvent>{{pair_of(1, 2), ContactPhase::Began}});
    state = tick1.next_state;

    for (int i = 0; i < 2; ++i) {
        auto tick = ContactEventEmitter::emit(state, touching);
        REQUIRE(tick.events == std::vector<ContactEvent>{{pair_of(1, 2), ContactPhase::Persisted}});
        state = tick.next_state;
    }

    auto tick4 = ContactEventEmitter::emit(state, apart);
    REQUIRE(tick4.events == std::vector<ContactEvent>{{pair_of(1, 2), ContactPhase::Ended}});
    REQUIRE(tick4.next_state.empty());

    auto tick5 = ContactEventEmitter::emit(tick4.next_state, apart);
    REQUIRE(tick5.events.empty());
}

TEST_CASE("Contact events are ordered", "[physics][events]") {
    ContactState previous({pair_of(1, 2), pair_of(3, 4), pair_of(7, 8)});
    const std::vector<CandidatePair> active = {pair_of(7, 8), pair_of(5, 6), pair_of(0, 9), pair_of(1, 2)};

    auto result = ContactEventEmitter::emit(previous, active);

    const std::vector<ContactEvent> expected = {
        {pair_of(0, 9), ContactPhase::Began},
        {pair_of(1, 2), ContactPhase::Persisted},
        {pair_of(5, 6), ContactPhase::Began},
        {pair_of(7, 8), ContactPhase::Persisted},
        {pair_of(3, 4), ContactPhase::Ended},
    };
    REQUIRE(result.events == expected);
    REQUIRE(result.next_state == ContactState(active));
}

TEST_CASE("Contact emitter tolerates duplicate and reversed active pairs", "[physics][events]") {
    const std::vector<CandidatePair> active = {
        CandidatePair{EntityId{4}, EntityId{3}},
        pair_of(3, 4),
    };

    auto result = ContactEventEmitter::emit(ContactState{}, active);
    REQUIRE(result.events == std::vector<ContactEvent>{{pair_of(3, 4), ContactPhase::Began}});
    REQUIRE(result.next_state.size() == 1);
}

TEST_CASE("Contact emitter is deterministic", "[physics][events]") {
    ContactState previous({pair_of(2, 3), pair_of(1, 4)});
    const std::vector<CandidatePair> active = {pair_of(1, 4), pair_of(2, 9)};

    auto first = ContactEventEmitter::emit(previous, active);
    auto second = ContactEventEmitter::emit(previous, active);
    REQUIRE(first.events == second.events);
    REQUIRE(first.next_state == second.next_state);
}

// =============================================================================
// ContactTracker
// =============================================================================

TEST_CASE("ContactTracker keeps state between updates", "[physics][events]") {
    ContactTracker tracker;

    auto began = tracker.update(std::vector<CandidatePair>{pair_of(1, 2), pair_of(2, 3)});
    REQUIRE(began.size() == 2);
    REQUIRE(began[0].phase == ContactPhase::Began);
    REQUIRE(tracker.state().size() == 2);

    auto mixed = tracker.update(std::vector<CandidatePair>{pair_of(2, 3)});
    const std::vector<ContactEvent> expected = {
        {pair_of(2, 3), ContactPhase::Persisted},
        {pair_of(1, 2), ContactPhase::Ended},
    };
    REQUIRE(mixed == expected);

    tracker.reset();
    REQUIRE(tracker.state().empty());
    auto again = tracker.update(std::vector<CandidatePair>{pair_of(2, 3)});
    REQUIRE(again == std::vector<ContactEvent>{{pair_of(2, 3), ContactPhase::Began}});
}
