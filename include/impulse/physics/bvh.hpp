#pragma once

/// @file bvh.hpp
/// @brief Dynamic AABB tree spatial index
///
/// Leaves are inserted one at a time with a surface-area heuristic sibling
/// search and the tree is kept balanced with AVL-style rotations. In 2D the
/// perimeter stands in for surface area.

#include "spatial_index.hpp"

#include <algorithm>
#include <stack>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// Null node index
constexpr int k_null_node = -1;

// =============================================================================
// BVH Node
// =============================================================================

/// Dynamic BVH node
template<typename D>
struct BvhNode {
    typename D::Bounds bounds;      ///< Bounding box
    int parent = k_null_node;       ///< Parent node
    int left = k_null_node;         ///< Left child (or next free node)
    int right = k_null_node;        ///< Right child
    int height = 0;                 ///< Tree height at this node
    bool is_leaf = false;           ///< True if leaf node
    EntityId id;                    ///< Entity (leaf only)
};

// =============================================================================
// BvhIndex
// =============================================================================

/// Dynamic AABB tree, the default broad phase structure
template<typename D>
class BvhIndex final : public ISpatialIndex<D> {
public:
    using Bounds = typename D::Bounds;

    BvhIndex() {
        m_nodes.reserve(256);
    }

    // =========================================================================
    // ISpatialIndex
    // =========================================================================

    void rebuild(std::span<const IndexEntry<D>> entries) override {
        clear();
        m_nodes.reserve(entries.size() * 2);
        m_leaves.reserve(entries.size());
        for (const auto& entry : entries) {
            insert(entry.id, entry.bounds);
        }
    }

    [[nodiscard]] std::vector<CandidatePair> query_overlaps() const override {
        std::vector<CandidatePair> pairs;
        if (m_root == k_null_node) return pairs;

        for (int leaf : m_leaves) {
            const BvhNode<D>& node = m_nodes[leaf];
            query_subtree(node.bounds, node.id, pairs);
        }

        finalize_pairs(pairs);
        return pairs;
    }

    [[nodiscard]] std::vector<EntityId> query_bounds(const Bounds& bounds) const override {
        std::vector<EntityId> results;
        if (m_root == k_null_node) return results;

        std::stack<int> stack;
        stack.push(m_root);

        while (!stack.empty()) {
            int node_idx = stack.top();
            stack.pop();

            const BvhNode<D>& node = m_nodes[node_idx];
            if (!impulse_math::intersects(node.bounds, bounds)) {
                continue;
            }

            if (node.is_leaf) {
                results.push_back(node.id);
            } else {
                stack.push(node.left);
                stack.push(node.right);
            }
        }

        std::sort(results.begin(), results.end());
        return results;
    }

    [[nodiscard]] std::size_t size() const override { return m_leaves.size(); }

    void clear() override {
        m_nodes.clear();
        m_leaves.clear();
        m_root = k_null_node;
        m_free_list = k_null_node;
    }

    [[nodiscard]] BroadPhaseKind kind() const noexcept override { return BroadPhaseKind::Bvh; }

    // =========================================================================
    // Proxy Management
    // =========================================================================

    /// Insert a leaf
    /// @return Node index
    int insert(EntityId id, const Bounds& bounds) {
        int node_idx = allocate_node();
        BvhNode<D>& node = m_nodes[node_idx];
        node.bounds = bounds;
        node.is_leaf = true;
        node.id = id;
        node.height = 0;

        insert_leaf(node_idx);
        m_leaves.push_back(node_idx);
        return node_idx;
    }

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const { return m_nodes.size(); }

    [[nodiscard]] int height() const {
        if (m_root == k_null_node) return 0;
        return m_nodes[m_root].height;
    }

    /// Validate tree structure (parents, heights, enclosing bounds)
    [[nodiscard]] bool validate() const {
        if (m_root == k_null_node) return true;
        return validate_node(m_root, k_null_node);
    }

private:
    // =========================================================================
    // Node Allocation
    // =========================================================================

    int allocate_node() {
        if (m_free_list != k_null_node) {
            int node_idx = m_free_list;
            m_free_list = m_nodes[node_idx].left;
            m_nodes[node_idx] = BvhNode<D>{};
            return node_idx;
        }

        int node_idx = static_cast<int>(m_nodes.size());
        m_nodes.push_back(BvhNode<D>{});
        return node_idx;
    }

    // =========================================================================
    // Tree Operations
    // =========================================================================

    void insert_leaf(int leaf_idx) {
        if (m_root == k_null_node) {
            m_root = leaf_idx;
            m_nodes[leaf_idx].parent = k_null_node;
            return;
        }

        Bounds leaf_bounds = m_nodes[leaf_idx].bounds;
        int sibling = find_best_sibling(leaf_bounds);

        int old_parent = m_nodes[sibling].parent;
        int new_parent = allocate_node();

        m_nodes[new_parent].parent = old_parent;
        m_nodes[new_parent].bounds = impulse_math::combine(leaf_bounds, m_nodes[sibling].bounds);
        m_nodes[new_parent].height = m_nodes[sibling].height + 1;
        m_nodes[new_parent].is_leaf = false;

        if (old_parent != k_null_node) {
            if (m_nodes[old_parent].left == sibling) {
                m_nodes[old_parent].left = new_parent;
            } else {
                m_nodes[old_parent].right = new_parent;
            }
        } else {
            m_root = new_parent;
        }

        m_nodes[new_parent].left = sibling;
        m_nodes[new_parent].right = leaf_idx;
        m_nodes[sibling].parent = new_parent;
        m_nodes[leaf_idx].parent = new_parent;

        rebalance(m_nodes[leaf_idx].parent);
    }

    /// Branch-and-bound search for the sibling with the least added cost
    int find_best_sibling(const Bounds& bounds) const {
        int best = m_root;
        float best_cost = impulse_math::cost_metric(impulse_math::combine(bounds, m_nodes[m_root].bounds));

        std::stack<std::pair<int, float>> stack;
        stack.emplace(m_root, 0.0f);

        while (!stack.empty()) {
            auto [node_idx, inherited_cost] = stack.top();
            stack.pop();

            const BvhNode<D>& node = m_nodes[node_idx];
            float direct_cost = impulse_math::cost_metric(impulse_math::combine(bounds, node.bounds));

            float cost = direct_cost + inherited_cost;
            if (cost < best_cost) {
                best_cost = cost;
                best = node_idx;
            }

            if (!node.is_leaf) {
                float child_inherited = inherited_cost + direct_cost - impulse_math::cost_metric(node.bounds);

                // Lower bound on child costs
                float child_lower_bound = impulse_math::cost_metric(bounds) + child_inherited;
                if (child_lower_bound < best_cost) {
                    stack.emplace(node.left, child_inherited);
                    stack.emplace(node.right, child_inherited);
                }
            }
        }

        return best;
    }

    void rebalance(int node_idx) {
        while (node_idx != k_null_node) {
            node_idx = balance(node_idx);

            BvhNode<D>& node = m_nodes[node_idx];
            node.height = 1 + std::max(m_nodes[node.left].height, m_nodes[node.right].height);
            node.bounds = impulse_math::combine(m_nodes[node.left].bounds, m_nodes[node.right].bounds);

            node_idx = node.parent;
        }
    }

    /// Rotate the taller grandchild up when |height(right) - height(left)| > 1
    int balance(int a) {
        BvhNode<D>& node = m_nodes[a];
        if (node.is_leaf || node.height < 2) {
            return a;
        }

        int b = node.left;
        int c = node.right;
        int balance_factor = m_nodes[c].height - m_nodes[b].height;

        if (balance_factor > 1) {
            return rotate_up(a, c, b, /*promote_right=*/true);
        }
        if (balance_factor < -1) {
            return rotate_up(a, b, c, /*promote_right=*/false);
        }
        return a;
    }

    /// Promote child `up` of node `a` over `a`; `other` is a's remaining child
    int rotate_up(int a, int up, int other, bool promote_right) {
        int f = m_nodes[up].left;
        int g = m_nodes[up].right;

        m_nodes[up].left = a;
        m_nodes[up].parent = m_nodes[a].parent;
        m_nodes[a].parent = up;

        int up_parent = m_nodes[up].parent;
        if (up_parent != k_null_node) {
            if (m_nodes[up_parent].left == a) {
                m_nodes[up_parent].left = up;
            } else {
                m_nodes[up_parent].right = up;
            }
        } else {
            m_root = up;
        }

        // Keep the taller grandchild under `up`, hand the other to `a`
        int keep = m_nodes[f].height > m_nodes[g].height ? f : g;
        int give = keep == f ? g : f;

        m_nodes[up].right = keep;
        if (promote_right) {
            m_nodes[a].right = give;
        } else {
            m_nodes[a].left = give;
        }
        m_nodes[give].parent = a;

        m_nodes[a].bounds = impulse_math::combine(m_nodes[other].bounds, m_nodes[give].bounds);
        m_nodes[up].bounds = impulse_math::combine(m_nodes[a].bounds, m_nodes[keep].bounds);

        m_nodes[a].height = 1 + std::max(m_nodes[other].height, m_nodes[give].height);
        m_nodes[up].height = 1 + std::max(m_nodes[a].height, m_nodes[keep].height);

        return up;
    }

    // =========================================================================
    // Query Helpers
    // =========================================================================

    void query_subtree(const Bounds& query, EntityId self, std::vector<CandidatePair>& pairs) const {
        std::stack<int> stack;
        stack.push(m_root);

        while (!stack.empty()) {
            int idx = stack.top();
            stack.pop();

            const BvhNode<D>& node = m_nodes[idx];
            if (!impulse_math::intersects(node.bounds, query)) {
                continue;
            }

            if (node.is_leaf) {
                // Each pair is reported from its lower id only
                if (self < node.id) {
                    pairs.push_back(CandidatePair{self, node.id});
                }
            } else {
                stack.push(node.left);
                stack.push(node.right);
            }
        }
    }

    [[nodiscard]] bool validate_node(int node_idx, int expected_parent) const {
        const BvhNode<D>& node = m_nodes[node_idx];

        if (node.parent != expected_parent) return false;

        if (node.is_leaf) {
            return node.left == k_null_node && node.right == k_null_node && node.height == 0;
        }

        if (!validate_node(node.left, node_idx)) return false;
        if (!validate_node(node.right, node_idx)) return false;

        const BvhNode<D>& l = m_nodes[node.left];
        const BvhNode<D>& r = m_nodes[node.right];
        if (node.height != 1 + std::max(l.height, r.height)) return false;
        return node.bounds.contains_aabb(l.bounds) && node.bounds.contains_aabb(r.bounds);
    }

    std::vector<BvhNode<D>> m_nodes;
    std::vector<int> m_leaves;
    int m_root = k_null_node;
    int m_free_list = k_null_node;
};

} // namespace impulse_physics
