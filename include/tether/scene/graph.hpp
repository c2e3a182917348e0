#pragma once

/// @file graph.hpp
/// @brief Minimal scene graph consumed by the physics layer
///
/// The physics layer only reads the graph through SceneGraphView: node
/// validity, node data (name, children, mesh surfaces) and global
/// transforms. Graph is the in-memory implementation used by the demo and
/// the tests.

#include "fwd.hpp"
#include <tether/core/handle.hpp>
#include <tether/math/types.hpp>
#include <tether/math/isometry.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether_scene {

// =============================================================================
// Geometry
// =============================================================================

/// Indexed triangle list of one surface
struct SurfaceData {
    std::vector<tether_math::Vec3> positions;
    std::vector<std::array<std::uint32_t, 3>> triangles;
};

/// Mesh attached to a node
struct Mesh {
    std::vector<SurfaceData> surfaces;

    [[nodiscard]] std::size_t triangle_count() const {
        std::size_t count = 0;
        for (const auto& surface : surfaces) {
            count += surface.triangles.size();
        }
        return count;
    }
};

// =============================================================================
// Node
// =============================================================================

/// Translation, rotation and scale relative to the parent node
struct LocalTransform {
    tether_math::Vec3 position{0.0f};
    tether_math::Quat rotation = tether_math::quat::IDENTITY;
    tether_math::Vec3 scale{1.0f};

    /// T * R * S
    [[nodiscard]] tether_math::Mat4 matrix() const;

    /// Rotation and translation only
    [[nodiscard]] tether_math::Isometry isometry() const {
        return tether_math::Isometry{position, rotation};
    }
};

struct Node {
    std::string name;
    LocalTransform local_transform;
    std::optional<Mesh> mesh;
    NodeHandle parent;
    std::vector<NodeHandle> children;

    Node() = default;
    explicit Node(std::string node_name) : name(std::move(node_name)) {}

    [[nodiscard]] bool is_mesh() const noexcept { return mesh.has_value(); }
};

// =============================================================================
// SceneGraphView
// =============================================================================

/// Read-only view of a scene graph
class SceneGraphView {
public:
    virtual ~SceneGraphView() = default;

    [[nodiscard]] virtual bool is_valid_handle(NodeHandle handle) const = 0;

    /// Node data, nullptr for invalid handles
    [[nodiscard]] virtual const Node* node(NodeHandle handle) const = 0;

    /// Full global transform including scale
    [[nodiscard]] virtual tether_math::Mat4 global_transform(NodeHandle handle) const = 0;

    /// Global transform built from rotations and translations only
    [[nodiscard]] virtual tether_math::Mat4 isometric_global_transform(NodeHandle handle) const = 0;

    [[nodiscard]] virtual std::pair<tether_math::Quat, tether_math::Vec3>
    isometric_global_rotation_position(NodeHandle handle) const = 0;
};

// =============================================================================
// Graph
// =============================================================================

/// Node hierarchy stored in a pool. Every node except the root has a parent.
class Graph : public SceneGraphView {
public:
    /// Mapping produced when a subtree is copied
    using NodeRemap = std::unordered_map<NodeHandle, NodeHandle>;

    Graph();

    [[nodiscard]] NodeHandle root() const noexcept { return m_root; }

    /// Insert a node as a child of the root
    NodeHandle add_node(Node node);

    /// Re-parent `child` under `parent`. Returns false for invalid handles
    /// or when `parent` lies inside the subtree of `child`.
    bool link_nodes(NodeHandle child, NodeHandle parent);

    /// Remove a node and its whole subtree. The root cannot be removed.
    bool remove_node(NodeHandle handle);

    [[nodiscard]] Node* node_mut(NodeHandle handle) { return m_pool.get_mut(handle); }

    /// First node named `name` in the subtree of `from`, depth first
    [[nodiscard]] std::optional<NodeHandle> find_by_name(NodeHandle from, const std::string& name) const;

    /// Copy the subtree of `root` into `dest` under the destination root.
    /// Returns the copy of `root` and the old to new handle mapping.
    std::pair<NodeHandle, NodeRemap> copy_subtree(NodeHandle root, Graph& dest) const;

    /// Number of nodes including the root
    [[nodiscard]] std::size_t len() const noexcept { return m_pool.len(); }

    // SceneGraphView
    [[nodiscard]] bool is_valid_handle(NodeHandle handle) const override { return m_pool.contains(handle); }
    [[nodiscard]] const Node* node(NodeHandle handle) const override { return m_pool.get(handle); }
    [[nodiscard]] tether_math::Mat4 global_transform(NodeHandle handle) const override;
    [[nodiscard]] tether_math::Mat4 isometric_global_transform(NodeHandle handle) const override;
    [[nodiscard]] std::pair<tether_math::Quat, tether_math::Vec3>
    isometric_global_rotation_position(NodeHandle handle) const override;

private:
    [[nodiscard]] tether_math::Isometry isometric_global(NodeHandle handle) const;
    [[nodiscard]] bool is_ancestor(NodeHandle ancestor, NodeHandle handle) const;
    void detach(NodeHandle handle);

    tether_core::Pool<Node> m_pool;
    NodeHandle m_root;
};

} // namespace tether_scene
