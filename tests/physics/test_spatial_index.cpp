// impulse_physics spatial index tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <impulse/physics/spatial_index.hpp>
#include <impulse/physics/bvh.hpp>

#include <memory>
#include <random>
#include <vector>

using namespace impulse_physics;
using namespace impulse_math;

namespace {

std::vector<IndexEntry<Dim2>> random_entries_2d(std::size_t count, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> pos(-20.0f, 20.0f);
    std::uniform_real_distribution<float> ext(0.1f, 3.0f);

    std::vector<IndexEntry<Dim2>> entries;
    for (std::size_t i = 0; i < count; ++i) {
        Vec2 c(pos(rng), pos(rng));
        Vec2 h(ext(rng), ext(rng));
        entries.push_back({EntityId{i + 1}, AABB2::from_center_half_extents(c, h)});
    }
    return entries;
}

std::vector<IndexEntry<Dim3>> random_entries_3d(std::size_t count, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> pos(-15.0f, 15.0f);
    std::uniform_real_distribution<float> ext(0.1f, 2.5f);

    std::vector<IndexEntry<Dim3>> entries;
    for (std::size_t i = 0; i < count; ++i) {
        Vec3 c(pos(rng), pos(rng), pos(rng));
        Vec3 h(ext(rng), ext(rng), ext(rng));
        // Sparse ids, inserted out of order
        entries.push_back({EntityId{(count - i) * 7}, AABB::from_center_half_extents(c, h)});
    }
    return entries;
}

} // anonymous namespace

// =============================================================================
// Agreement Tests
// =============================================================================

TEST_CASE("All spatial indices agree with brute force (2D)", "[physics][spatial_index]") {
    auto kind = GENERATE(BroadPhaseKind::Bvh, BroadPhaseKind::SweepAndPrune, BroadPhaseKind::UniformGrid);
    auto entries = random_entries_2d(200, 1234);

    BruteForceIndex<Dim2> reference;
    reference.rebuild(entries);
    auto expected = reference.query_overlaps();
    REQUIRE_FALSE(expected.empty());

    auto index = make_spatial_index<Dim2>(kind, 2.0f);
    REQUIRE(index->kind() == kind);
    index->rebuild(entries);
    REQUIRE(index->size() == entries.size());
    REQUIRE(index->query_overlaps() == expected);

    AABB2 region(Vec2(-5.0f), Vec2(5.0f));
    REQUIRE(index->query_bounds(region) == reference.query_bounds(region));
}

TEST_CASE("All spatial indices agree with brute force (3D)", "[physics][spatial_index]") {
    auto kind = GENERATE(BroadPhaseKind::Bvh, BroadPhaseKind::SweepAndPrune, BroadPhaseKind::UniformGrid);
    auto entries = random_entries_3d(150, 99);

    BruteForceIndex<Dim3> reference;
    reference.rebuild(entries);
    auto expected = reference.query_overlaps();

    auto index = make_spatial_index<Dim3>(kind, 3.0f);
    index->rebuild(entries);
    REQUIRE(index->query_overlaps() == expected);

    for (const auto& pair : expected) {
        REQUIRE(pair.a < pair.b);
    }
}

// =============================================================================
// Edge Cases
// =============================================================================

TEST_CASE("Spatial index edge cases", "[physics][spatial_index]") {
    auto kind = GENERATE(BroadPhaseKind::Bvh, BroadPhaseKind::SweepAndPrune,
                         BroadPhaseKind::UniformGrid, BroadPhaseKind::BruteForce);
    auto index = make_spatial_index<Dim2>(kind, 1.0f);

    SECTION("empty") {
        index->rebuild({});
        REQUIRE(index->size() == 0);
        REQUIRE(index->query_overlaps().empty());
        REQUIRE(index->query_bounds(AABB2(Vec2(-1.0f), Vec2(1.0f))).empty());
    }

    SECTION("single entity") {
        std::vector<IndexEntry<Dim2>> entries = {{EntityId{1}, AABB2(Vec2(0.0f), Vec2(1.0f))}};
        index->rebuild(entries);
        REQUIRE(index->query_overlaps().empty());
        REQUIRE(index->query_bounds(AABB2(Vec2(0.5f), Vec2(2.0f))) == std::vector<EntityId>{EntityId{1}});
    }

    SECTION("touching bounds overlap") {
        std::vector<IndexEntry<Dim2>> entries = {
            {EntityId{5}, AABB2(Vec2(0.0f), Vec2(1.0f))},
            {EntityId{2}, AABB2(Vec2(1.0f, 0.0f), Vec2(2.0f, 1.0f))},
        };
        index->rebuild(entries);
        auto pairs = index->query_overlaps();
        REQUIRE(pairs.size() == 1);
        REQUIRE(pairs[0] == CandidatePair{EntityId{2}, EntityId{5}});
    }

    SECTION("degenerate point bounds") {
        std::vector<IndexEntry<Dim2>> entries = {
            {EntityId{1}, AABB2(Vec2(3.0f), Vec2(3.0f))},
            {EntityId{2}, AABB2(Vec2(3.0f), Vec2(3.0f))},
            {EntityId{3}, AABB2(Vec2(4.0f), Vec2(4.0f))},
        };
        index->rebuild(entries);
        auto pairs = index->query_overlaps();
        REQUIRE(pairs == std::vector<CandidatePair>{{EntityId{1}, EntityId{2}}});
    }

    SECTION("rebuild replaces previous contents") {
        std::vector<IndexEntry<Dim2>> first = {
            {EntityId{1}, AABB2(Vec2(0.0f), Vec2(1.0f))},
            {EntityId{2}, AABB2(Vec2(0.5f), Vec2(1.5f))},
        };
        index->rebuild(first);
        REQUIRE(index->query_overlaps().size() == 1);

        std::vector<IndexEntry<Dim2>> second = {
            {EntityId{1}, AABB2(Vec2(0.0f), Vec2(1.0f))},
            {EntityId{2}, AABB2(Vec2(10.0f), Vec2(11.0f))},
        };
        index->rebuild(second);
        REQUIRE(index->query_overlaps().empty());

        index->clear();
        REQUIRE(index->size() == 0);
    }
}

TEST_CASE("Uniform grid keeps huge entities out of the cells", "[physics][spatial_index][grid]") {
    UniformGridIndex<Dim2> grid(1.0f);
    std::vector<IndexEntry<Dim2>> entries = {
        {EntityId{1}, AABB2(Vec2(-k_plane_extent), Vec2(k_plane_extent, 0.0f))},
        {EntityId{2}, AABB2(Vec2(0.0f, -0.5f), Vec2(1.0f, 0.5f))},
        {EntityId{3}, AABB2(Vec2(50.0f, 50.0f), Vec2(51.0f, 51.0f))},
    };
    grid.rebuild(entries);

    REQUIRE(grid.oversize_count() == 1);
    REQUIRE(grid.query_overlaps() == std::vector<CandidatePair>{{EntityId{1}, EntityId{2}}});
    REQUIRE(grid.query_bounds(AABB2(Vec2(50.5f), Vec2(50.6f))) == std::vector<EntityId>{EntityId{3}});
}

TEST_CASE("Sweep and prune picks the axis of greatest spread", "[physics][spatial_index][sap]") {
    SweepAndPruneIndex<Dim3> sap;
    std::vector<IndexEntry<Dim3>> entries;
    for (std::uint64_t i = 0; i < 10; ++i) {
        Vec3 c(0.0f, 0.0f, static_cast<float>(i) * 3.0f);
        entries.push_back({EntityId{i + 1}, AABB::from_center_half_extents(c, Vec3(0.5f))});
    }
    sap.rebuild(entries);
    REQUIRE(sap.sweep_axis() == 2);
    REQUIRE(sap.query_overlaps().empty());
}

TEST_CASE("BVH stays balanced and valid", "[physics][spatial_index][bvh]") {
    BvhIndex<Dim3> bvh;
    auto entries = random_entries_3d(256, 7);
    bvh.rebuild(entries);

    REQUIRE(bvh.validate());
    REQUIRE(bvh.size() == 256);
    REQUIRE(bvh.height() < 32);
}
