/// @file query_pipeline.cpp
/// @brief Query BVH implementation

#include <tether/physics/query_pipeline.hpp>
#include <tether/physics/rigid_body.hpp>

#include <algorithm>
#include <numeric>
#include <stack>

namespace tether_physics {

void QueryPipeline::update(const RigidBodySet& bodies, const ColliderSet& colliders) {
    m_leaves.clear();
    m_nodes.clear();
    m_root = k_null_node;

    colliders.for_each([&](RawColliderHandle handle, const Collider& collider) {
        const RigidBody* body = bodies.get(collider.parent());
        if (!body) {
            return;
        }
        tether_math::Isometry pose = collider.world_position(body->position());
        m_leaves.push_back(Leaf{handle, pose, collider.shape().compute_aabb(pose)});
    });

    if (m_leaves.empty()) {
        return;
    }

    std::vector<int> order(m_leaves.size());
    std::iota(order.begin(), order.end(), 0);
    m_nodes.reserve(m_leaves.size() * 2);
    m_root = build(order, 0, order.size());
}

int QueryPipeline::build(std::vector<int>& order, std::size_t begin, std::size_t end) {
    tether_math::AABB bounds;
    tether_math::AABB centroid_bounds;
    for (std::size_t i = begin; i < end; ++i) {
        const auto& aabb = m_leaves[order[i]].aabb;
        bounds = bounds.merged(aabb);
        centroid_bounds.expand_to_include(aabb.center());
    }

    int node_idx = static_cast<int>(m_nodes.size());
    m_nodes.push_back(QueryBvhNode{});
    m_nodes[node_idx].aabb = bounds;

    if (end - begin <= MAX_LEAF_SIZE) {
        m_nodes[node_idx].leaf = order[begin];
        return node_idx;
    }

    // Median split along the widest centroid axis
    tether_math::Vec3 extent = centroid_bounds.max - centroid_bounds.min;
    int axis = 0;
    if (extent.y > extent.x) axis = 1;
    if (extent.z > extent[axis]) axis = 2;

    std::size_t mid = begin + (end - begin) / 2;
    std::nth_element(order.begin() + static_cast<std::ptrdiff_t>(begin),
                     order.begin() + static_cast<std::ptrdiff_t>(mid),
                     order.begin() + static_cast<std::ptrdiff_t>(end),
                     [&](int a, int b) {
                         return m_leaves[a].aabb.center()[axis] < m_leaves[b].aabb.center()[axis];
                     });

    int left = build(order, begin, mid);
    int right = build(order, mid, end);
    m_nodes[node_idx].left = left;
    m_nodes[node_idx].right = right;
    return node_idx;
}

void QueryPipeline::intersections_with_ray(const ColliderSet& colliders,
                                           const tether_math::Ray& ray,
                                           float max_toi,
                                           InteractionGroups groups,
                                           const RayCallback& callback) const {
    if (m_root == k_null_node) return;

    std::stack<int> stack;
    stack.push(m_root);

    while (!stack.empty()) {
        int node_idx = stack.top();
        stack.pop();

        const QueryBvhNode& node = m_nodes[node_idx];
        if (!node.aabb.cast_ray(ray, max_toi)) {
            continue;
        }

        if (!node.is_leaf()) {
            stack.push(node.right);
            stack.push(node.left);
            continue;
        }

        const Leaf& leaf = m_leaves[node.leaf];
        const Collider* collider = colliders.get(leaf.collider);
        if (!collider || !groups.test(collider->collision_groups())) {
            continue;
        }

        auto hit = collider->shape().cast_ray(leaf.pose, ray, max_toi);
        if (hit && !callback(leaf.collider, *hit)) {
            return;
        }
    }
}

} // namespace tether_physics
