/// @file query_pipeline.hpp
/// @brief Bounding volume hierarchy for scene queries

#pragma once

#include "fwd.hpp"
#include "collider.hpp"
#include "shape.hpp"

#include <tether/math/aabb.hpp>
#include <tether/math/ray.hpp>

#include <cstdint>
#include <functional>
#include <vector>

namespace tether_physics {

/// Null node index
constexpr int k_null_node = -1;

/// Static BVH node
struct QueryBvhNode {
    tether_math::AABB aabb;          ///< Bounding box
    int left = k_null_node;          ///< Left child
    int right = k_null_node;         ///< Right child
    int leaf = k_null_node;          ///< Leaf index (leaf nodes only)

    [[nodiscard]] bool is_leaf() const { return leaf != k_null_node; }
};

/// Ray query acceleration structure. It is rebuilt from scratch by
/// `update` and never refers to colliders removed since the last update.
class QueryPipeline {
public:
    /// Leaves with at most this many colliders are not split
    static constexpr std::size_t MAX_LEAF_SIZE = 1;

    /// Called for each confirmed hit. Return false to stop the traversal.
    using RayCallback = std::function<bool(RawColliderHandle, const RayHit&)>;

    QueryPipeline() = default;

    /// Rebuild the tree from current collider poses
    void update(const RigidBodySet& bodies, const ColliderSet& colliders);

    /// Visit every collider hit by `ray` within `max_toi` whose collision
    /// groups pass `groups`
    void intersections_with_ray(const ColliderSet& colliders,
                                const tether_math::Ray& ray,
                                float max_toi,
                                InteractionGroups groups,
                                const RayCallback& callback) const;

    [[nodiscard]] std::size_t proxy_count() const noexcept { return m_leaves.size(); }
    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }

private:
    struct Leaf {
        RawColliderHandle collider;
        tether_math::Isometry pose;
        tether_math::AABB aabb;
    };

    int build(std::vector<int>& order, std::size_t begin, std::size_t end);

    std::vector<Leaf> m_leaves;
    std::vector<QueryBvhNode> m_nodes;
    int m_root = k_null_node;
};

} // namespace tether_physics
