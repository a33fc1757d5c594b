/// @file spatial_index.cpp
/// @brief Brute force, sweep-and-prune and uniform grid spatial indices

#include <impulse/physics/spatial_index.hpp>
#include <impulse/physics/bvh.hpp>

#include <algorithm>
#include <cmath>

namespace impulse_physics {

void finalize_pairs(std::vector<CandidatePair>& pairs) {
    std::sort(pairs.begin(), pairs.end());
    pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
}

// =============================================================================
// BruteForceIndex
// =============================================================================

template<typename D>
void BruteForceIndex<D>::rebuild(std::span<const IndexEntry<D>> entries) {
    m_entries.assign(entries.begin(), entries.end());
}

template<typename D>
std::vector<CandidatePair> BruteForceIndex<D>::query_overlaps() const {
    std::vector<CandidatePair> pairs;
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        for (std::size_t j = i + 1; j < m_entries.size(); ++j) {
            if (m_entries[i].id == m_entries[j].id) continue;
            if (impulse_math::intersects(m_entries[i].bounds, m_entries[j].bounds)) {
                pairs.push_back(CandidatePair::make(m_entries[i].id, m_entries[j].id));
            }
        }
    }
    finalize_pairs(pairs);
    return pairs;
}

template<typename D>
std::vector<EntityId> BruteForceIndex<D>::query_bounds(const Bounds& bounds) const {
    std::vector<EntityId> results;
    for (const auto& entry : m_entries) {
        if (impulse_math::intersects(entry.bounds, bounds)) {
            results.push_back(entry.id);
        }
    }
    std::sort(results.begin(), results.end());
    return results;
}

// =============================================================================
// SweepAndPruneIndex
// =============================================================================

template<typename D>
void SweepAndPruneIndex<D>::rebuild(std::span<const IndexEntry<D>> entries) {
    m_entries.assign(entries.begin(), entries.end());
    m_axis = 0;
    if (m_entries.size() < 2) return;

    // Axis of greatest centroid variance
    using Vector = typename D::Vector;
    Vector sum(0.0f);
    Vector sum_sq(0.0f);
    for (const auto& entry : m_entries) {
        Vector c = entry.bounds.center();
        sum += c;
        sum_sq += c * c;
    }
    float inv_n = 1.0f / static_cast<float>(m_entries.size());
    Vector variance = sum_sq * inv_n - (sum * inv_n) * (sum * inv_n);

    for (int axis = 1; axis < D::k_dimension; ++axis) {
        if (variance[axis] > variance[m_axis]) {
            m_axis = axis;
        }
    }

    int axis = m_axis;
    std::sort(m_entries.begin(), m_entries.end(), [axis](const IndexEntry<D>& a, const IndexEntry<D>& b) {
        if (a.bounds.min[axis] != b.bounds.min[axis]) return a.bounds.min[axis] < b.bounds.min[axis];
        return a.id < b.id;
    });
}

template<typename D>
std::vector<CandidatePair> SweepAndPruneIndex<D>::query_overlaps() const {
    std::vector<CandidatePair> pairs;
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        const auto& a = m_entries[i];
        for (std::size_t j = i + 1; j < m_entries.size(); ++j) {
            const auto& b = m_entries[j];
            if (b.bounds.min[m_axis] > a.bounds.max[m_axis]) break;
            if (a.id != b.id && impulse_math::intersects(a.bounds, b.bounds)) {
                pairs.push_back(CandidatePair::make(a.id, b.id));
            }
        }
    }
    finalize_pairs(pairs);
    return pairs;
}

template<typename D>
std::vector<EntityId> SweepAndPruneIndex<D>::query_bounds(const Bounds& bounds) const {
    std::vector<EntityId> results;
    for (const auto& entry : m_entries) {
        if (entry.bounds.min[m_axis] > bounds.max[m_axis]) break;
        if (impulse_math::intersects(entry.bounds, bounds)) {
            results.push_back(entry.id);
        }
    }
    std::sort(results.begin(), results.end());
    return results;
}

template<typename D>
void SweepAndPruneIndex<D>::clear() {
    m_entries.clear();
    m_axis = 0;
}

// =============================================================================
// UniformGridIndex
// =============================================================================

namespace {

std::uint64_t hash_cell(std::int64_t cx, std::int64_t cy, std::int64_t cz) {
    auto h = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cx));
    h ^= static_cast<std::uint64_t>(static_cast<std::uint32_t>(cy)) * 0x9E3779B97F4A7C15ULL;
    h ^= static_cast<std::uint64_t>(static_cast<std::uint32_t>(cz)) * 0x517CC1B727220A95ULL;
    return h;
}

} // anonymous namespace

template<typename D>
UniformGridIndex<D>::UniformGridIndex(float cell_size)
    : m_cell_size(cell_size > 0.0f && std::isfinite(cell_size) ? cell_size : 2.0f) {}

template<typename D>
template<typename F>
bool UniformGridIndex<D>::for_each_cell(const Bounds& bounds, F&& visit) const {
    std::int64_t lo[3] = {0, 0, 0};
    std::int64_t hi[3] = {0, 0, 0};
    double cells = 1.0;

    for (int axis = 0; axis < D::k_dimension; ++axis) {
        double min_cell = std::floor(static_cast<double>(bounds.min[axis]) / m_cell_size);
        double max_cell = std::floor(static_cast<double>(bounds.max[axis]) / m_cell_size);
        cells *= (max_cell - min_cell + 1.0);
        if (!std::isfinite(cells) || cells > static_cast<double>(k_max_cells_per_entity)) {
            return false;
        }
        lo[axis] = static_cast<std::int64_t>(min_cell);
        hi[axis] = static_cast<std::int64_t>(max_cell);
    }

    for (std::int64_t x = lo[0]; x <= hi[0]; ++x) {
        for (std::int64_t y = lo[1]; y <= hi[1]; ++y) {
            for (std::int64_t z = lo[2]; z <= hi[2]; ++z) {
                visit(hash_cell(x, y, z));
            }
        }
    }
    return true;
}

template<typename D>
void UniformGridIndex<D>::rebuild(std::span<const IndexEntry<D>> entries) {
    clear();
    m_entries.assign(entries.begin(), entries.end());

    for (std::uint32_t i = 0; i < m_entries.size(); ++i) {
        bool fits = for_each_cell(m_entries[i].bounds, [this, i](std::uint64_t key) {
            auto& cell = m_cells[key];
            // Duplicate keys from hash collisions within one entity
            if (cell.empty() || cell.back() != i) {
                cell.push_back(i);
            }
        });
        if (!fits) {
            m_oversize.push_back(i);
        }
    }
}

template<typename D>
std::vector<CandidatePair> UniformGridIndex<D>::query_overlaps() const {
    std::vector<CandidatePair> pairs;

    auto test = [this, &pairs](std::uint32_t i, std::uint32_t j) {
        const auto& a = m_entries[i];
        const auto& b = m_entries[j];
        if (a.id != b.id && impulse_math::intersects(a.bounds, b.bounds)) {
            pairs.push_back(CandidatePair::make(a.id, b.id));
        }
    };

    for (const auto& [key, members] : m_cells) {
        for (std::size_t i = 0; i < members.size(); ++i) {
            for (std::size_t j = i + 1; j < members.size(); ++j) {
                test(members[i], members[j]);
            }
        }
    }

    for (std::uint32_t big : m_oversize) {
        for (std::uint32_t j = 0; j < m_entries.size(); ++j) {
            if (j != big) {
                test(big, j);
            }
        }
    }

    finalize_pairs(pairs);
    return pairs;
}

template<typename D>
std::vector<EntityId> UniformGridIndex<D>::query_bounds(const Bounds& bounds) const {
    std::vector<EntityId> results;
    std::vector<bool> visited(m_entries.size(), false);

    auto consider = [&](std::uint32_t i) {
        if (visited[i]) return;
        visited[i] = true;
        if (impulse_math::intersects(m_entries[i].bounds, bounds)) {
            results.push_back(m_entries[i].id);
        }
    };

    bool fits = for_each_cell(bounds, [&](std::uint64_t key) {
        auto it = m_cells.find(key);
        if (it == m_cells.end()) return;
        for (std::uint32_t i : it->second) {
            consider(i);
        }
    });

    if (fits) {
        for (std::uint32_t big : m_oversize) {
            consider(big);
        }
    } else {
        for (std::uint32_t i = 0; i < m_entries.size(); ++i) {
            consider(i);
        }
    }

    std::sort(results.begin(), results.end());
    return results;
}

template<typename D>
void UniformGridIndex<D>::clear() {
    m_entries.clear();
    m_cells.clear();
    m_oversize.clear();
}

// =============================================================================
// Factory
// =============================================================================

template<typename D>
std::unique_ptr<ISpatialIndex<D>> make_spatial_index(BroadPhaseKind kind, float cell_size) {
    switch (kind) {
        case BroadPhaseKind::Bvh: return std::make_unique<BvhIndex<D>>();
        case BroadPhaseKind::SweepAndPrune: return std::make_unique<SweepAndPruneIndex<D>>();
        case BroadPhaseKind::UniformGrid: return std::make_unique<UniformGridIndex<D>>(cell_size);
        case BroadPhaseKind::BruteForce: return std::make_unique<BruteForceIndex<D>>();
    }
    return std::make_unique<BvhIndex<D>>();
}

// =============================================================================
// Explicit Instantiations
// =============================================================================

template class BruteForceIndex<Dim2>;
template class BruteForceIndex<Dim3>;
template class SweepAndPruneIndex<Dim2>;
template class SweepAndPruneIndex<Dim3>;
template class UniformGridIndex<Dim2>;
template class UniformGridIndex<Dim3>;

template std::unique_ptr<ISpatialIndex<Dim2>> make_spatial_index<Dim2>(BroadPhaseKind, float);
template std::unique_ptr<ISpatialIndex<Dim3>> make_spatial_index<Dim3>(BroadPhaseKind, float);

} // namespace impulse_physics
