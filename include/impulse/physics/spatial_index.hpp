#pragma once

/// @file spatial_index.hpp
/// @brief Spatial indices for broad phase pair generation
///
/// Every index is rebuilt from scratch each tick from the entities' world
/// bounds and reports overlapping pairs in canonical order (lower id first),
/// sorted and without duplicates. Touching bounds overlap.

#include "fwd.hpp"
#include "types.hpp"
#include "dimension.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Index Entry
// =============================================================================

/// One entity's bounding volume for this tick
template<typename D>
struct IndexEntry {
    EntityId id;
    typename D::Bounds bounds;
};

// =============================================================================
// ISpatialIndex
// =============================================================================

/// Interface shared by all broad phase structures
template<typename D>
class ISpatialIndex {
public:
    using Bounds = typename D::Bounds;

    virtual ~ISpatialIndex() = default;

    /// Replace the contents with the given entries
    virtual void rebuild(std::span<const IndexEntry<D>> entries) = 0;

    /// All pairs whose bounds overlap, canonical and sorted
    [[nodiscard]] virtual std::vector<CandidatePair> query_overlaps() const = 0;

    /// Ids of entries overlapping a region, sorted
    [[nodiscard]] virtual std::vector<EntityId> query_bounds(const Bounds& bounds) const = 0;

    [[nodiscard]] virtual std::size_t size() const = 0;
    virtual void clear() = 0;

    [[nodiscard]] virtual BroadPhaseKind kind() const noexcept = 0;
};

/// Sort pairs and drop duplicates
void finalize_pairs(std::vector<CandidatePair>& pairs);

// =============================================================================
// BruteForceIndex
// =============================================================================

/// O(n^2) reference implementation
template<typename D>
class BruteForceIndex final : public ISpatialIndex<D> {
public:
    using Bounds = typename D::Bounds;

    void rebuild(std::span<const IndexEntry<D>> entries) override;
    [[nodiscard]] std::vector<CandidatePair> query_overlaps() const override;
    [[nodiscard]] std::vector<EntityId> query_bounds(const Bounds& bounds) const override;
    [[nodiscard]] std::size_t size() const override { return m_entries.size(); }
    void clear() override { m_entries.clear(); }
    [[nodiscard]] BroadPhaseKind kind() const noexcept override { return BroadPhaseKind::BruteForce; }

private:
    std::vector<IndexEntry<D>> m_entries;
};

// =============================================================================
// SweepAndPruneIndex
// =============================================================================

/// Sort on the axis of greatest centroid variance, then sweep
template<typename D>
class SweepAndPruneIndex final : public ISpatialIndex<D> {
public:
    using Bounds = typename D::Bounds;

    void rebuild(std::span<const IndexEntry<D>> entries) override;
    [[nodiscard]] std::vector<CandidatePair> query_overlaps() const override;
    [[nodiscard]] std::vector<EntityId> query_bounds(const Bounds& bounds) const override;
    [[nodiscard]] std::size_t size() const override { return m_entries.size(); }
    void clear() override;
    [[nodiscard]] BroadPhaseKind kind() const noexcept override { return BroadPhaseKind::SweepAndPrune; }

    /// Axis chosen by the last rebuild
    [[nodiscard]] int sweep_axis() const noexcept { return m_axis; }

private:
    std::vector<IndexEntry<D>> m_entries;   ///< Sorted by min on m_axis
    int m_axis = 0;
};

// =============================================================================
// UniformGridIndex
// =============================================================================

/// Hash grid keyed by integer cell coordinates. Entities covering more than
/// k_max_cells_per_entity cells live in an oversize list tested against all.
template<typename D>
class UniformGridIndex final : public ISpatialIndex<D> {
public:
    using Bounds = typename D::Bounds;

    static constexpr std::size_t k_max_cells_per_entity = 64;

    explicit UniformGridIndex(float cell_size = 2.0f);

    void rebuild(std::span<const IndexEntry<D>> entries) override;
    [[nodiscard]] std::vector<CandidatePair> query_overlaps() const override;
    [[nodiscard]] std::vector<EntityId> query_bounds(const Bounds& bounds) const override;
    [[nodiscard]] std::size_t size() const override { return m_entries.size(); }
    void clear() override;
    [[nodiscard]] BroadPhaseKind kind() const noexcept override { return BroadPhaseKind::UniformGrid; }

    [[nodiscard]] float cell_size() const noexcept { return m_cell_size; }
    [[nodiscard]] std::size_t cell_count() const noexcept { return m_cells.size(); }
    [[nodiscard]] std::size_t oversize_count() const noexcept { return m_oversize.size(); }

private:
    /// Visit every cell key covered by bounds; false if it covers too many
    template<typename F>
    bool for_each_cell(const Bounds& bounds, F&& visit) const;

    float m_cell_size;
    std::vector<IndexEntry<D>> m_entries;
    std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> m_cells;  ///< Entry indices
    std::vector<std::uint32_t> m_oversize;
};

// =============================================================================
// Factory
// =============================================================================

/// Create the index matching a broad phase kind
template<typename D>
[[nodiscard]] std::unique_ptr<ISpatialIndex<D>> make_spatial_index(BroadPhaseKind kind, float cell_size);

} // namespace impulse_physics
