// impulse_physics broad phase tests

#include <catch2/catch_test_macros.hpp>
#include <impulse/physics/broadphase.hpp>
#include <impulse/physics/bvh.hpp>

#include <vector>

using namespace impulse_physics;
using namespace impulse_math;

namespace {

CollisionFilter make_filter(BodyKind kind, CollisionLayer layer = layers::Default,
                            CollisionLayer mask = layers::All) {
    return CollisionFilter{kind, layer, mask};
}

} // anonymous namespace

// =============================================================================
// Filtering Tests
// =============================================================================

TEST_CASE("Broad phase drops pairs that cannot interact", "[physics][broadphase]") {
    BroadPhase broadphase;

    CollisionFilterTable filters;
    filters[EntityId{1}] = make_filter(BodyKind::Static);
    filters[EntityId{2}] = make_filter(BodyKind::Static);
    filters[EntityId{3}] = make_filter(BodyKind::Dynamic);
    filters[EntityId{4}] = make_filter(BodyKind::Kinematic);

    SECTION("static-static pairs are dropped") {
        std::vector<CandidatePair> raw = {{EntityId{1}, EntityId{2}}, {EntityId{1}, EntityId{3}}};
        auto pairs = broadphase.filter_pairs(raw, filters);
        REQUIRE(pairs == std::vector<CandidatePair>{{EntityId{1}, EntityId{3}}});
        REQUIRE(broadphase.stats().static_pairs == 1);
        REQUIRE(broadphase.stats().accepted_pairs == 1);
    }

    SECTION("kinematic against static is kept") {
        std::vector<CandidatePair> raw = {{EntityId{1}, EntityId{4}}};
        REQUIRE(broadphase.filter_pairs(raw, filters).size() == 1);
    }

    SECTION("unknown ids are dropped") {
        std::vector<CandidatePair> raw = {{EntityId{3}, EntityId{42}}};
        REQUIRE(broadphase.filter_pairs(raw, filters).empty());
        REQUIRE(broadphase.stats().unknown_pairs == 1);
    }

    SECTION("self pairs are dropped") {
        std::vector<CandidatePair> raw = {{EntityId{3}, EntityId{3}}};
        REQUIRE(broadphase.filter_pairs(raw, filters).empty());
    }
}

TEST_CASE("Broad phase layer and mask test", "[physics][broadphase]") {
    BroadPhase broadphase;

    CollisionFilterTable filters;
    filters[EntityId{1}] = make_filter(BodyKind::Dynamic, layers::Player, layers::All & ~layers::Debris);
    filters[EntityId{2}] = make_filter(BodyKind::Dynamic, layers::Debris);
    filters[EntityId{3}] = make_filter(BodyKind::Dynamic, layers::Projectile, layers::Default);
    filters[EntityId{4}] = make_filter(BodyKind::Dynamic);

    SECTION("one side masking out is enough to drop") {
        std::vector<CandidatePair> raw = {{EntityId{1}, EntityId{2}}};
        REQUIRE(broadphase.filter_pairs(raw, filters).empty());
        REQUIRE(broadphase.stats().masked_pairs == 1);
    }

    SECTION("mask must accept the other layer in both directions") {
        std::vector<CandidatePair> raw = {{EntityId{1}, EntityId{3}}, {EntityId{3}, EntityId{4}}};
        auto pairs = broadphase.filter_pairs(raw, filters);
        REQUIRE(pairs == std::vector<CandidatePair>{{EntityId{3}, EntityId{4}}});
    }

    SECTION("can_collide is symmetric") {
        for (std::uint64_t a = 1; a <= 4; ++a) {
            for (std::uint64_t b = 1; b <= 4; ++b) {
                REQUIRE(CollisionFilter::can_collide(filters[EntityId{a}], filters[EntityId{b}]) ==
                        CollisionFilter::can_collide(filters[EntityId{b}], filters[EntityId{a}]));
            }
        }
    }
}

TEST_CASE("Broad phase output is canonical", "[physics][broadphase]") {
    BroadPhase broadphase;

    CollisionFilterTable filters;
    for (std::uint64_t id = 1; id <= 4; ++id) {
        filters[EntityId{id}] = make_filter(BodyKind::Dynamic);
    }

    std::vector<CandidatePair> raw = {
        {EntityId{4}, EntityId{2}},
        {EntityId{1}, EntityId{3}},
        {EntityId{2}, EntityId{4}},
        {EntityId{2}, EntityId{1}},
    };
    auto pairs = broadphase.filter_pairs(raw, filters);

    std::vector<CandidatePair> expected = {
        {EntityId{1}, EntityId{2}},
        {EntityId{1}, EntityId{3}},
        {EntityId{2}, EntityId{4}},
    };
    REQUIRE(pairs == expected);
}

TEST_CASE("Broad phase keeps every overlapping movable pair", "[physics][broadphase]") {
    // Row of touching boxes, the middle one static
    std::vector<IndexEntry<Dim2>> entries;
    CollisionFilterTable filters;
    for (std::uint64_t i = 0; i < 5; ++i) {
        float x = static_cast<float>(i);
        entries.push_back({EntityId{i + 1}, AABB2(Vec2(x, 0.0f), Vec2(x + 1.0f, 1.0f))});
        filters[EntityId{i + 1}] = make_filter(i == 2 ? BodyKind::Static : BodyKind::Dynamic);
    }

    BvhIndex<Dim2> index;
    index.rebuild(entries);

    BroadPhase broadphase;
    auto pairs = broadphase.compute_pairs(index, filters);

    // Neighbours touch; nothing else overlaps
    std::vector<CandidatePair> expected = {
        {EntityId{1}, EntityId{2}},
        {EntityId{2}, EntityId{3}},
        {EntityId{3}, EntityId{4}},
        {EntityId{4}, EntityId{5}},
    };
    REQUIRE(pairs == expected);
    REQUIRE(broadphase.stats().raw_pairs == 4);
}
