/// @file graph.cpp
/// @brief Graph implementation

#include <tether/scene/graph.hpp>

#include <algorithm>

namespace tether_scene {

using tether_math::Isometry;
using tether_math::Mat4;
using tether_math::Quat;
using tether_math::Vec3;

// =============================================================================
// LocalTransform
// =============================================================================

Mat4 LocalTransform::matrix() const {
    Mat4 m = glm::translate(Mat4(1.0f), position);
    m = m * glm::mat4_cast(rotation);
    return glm::scale(m, scale);
}

// =============================================================================
// Graph
// =============================================================================

Graph::Graph() {
    m_root = m_pool.insert(Node("__ROOT__"));
}

NodeHandle Graph::add_node(Node node) {
    node.parent = NodeHandle{};
    node.children.clear();
    NodeHandle handle = m_pool.insert(std::move(node));
    link_nodes(handle, m_root);
    return handle;
}

bool Graph::link_nodes(NodeHandle child, NodeHandle parent) {
    if (!is_valid_handle(child) || !is_valid_handle(parent) || child == m_root) {
        return false;
    }
    if (is_ancestor(child, parent)) {
        return false;
    }

    detach(child);
    m_pool.get_mut(child)->parent = parent;
    m_pool.get_mut(parent)->children.push_back(child);
    return true;
}

bool Graph::remove_node(NodeHandle handle) {
    if (!is_valid_handle(handle) || handle == m_root) {
        return false;
    }

    detach(handle);

    std::vector<NodeHandle> stack{handle};
    while (!stack.empty()) {
        NodeHandle current = stack.back();
        stack.pop_back();
        if (auto removed = m_pool.remove(current)) {
            stack.insert(stack.end(), removed->children.begin(), removed->children.end());
        }
    }
    return true;
}

std::optional<NodeHandle> Graph::find_by_name(NodeHandle from, const std::string& name) const {
    std::vector<NodeHandle> stack{from};
    while (!stack.empty()) {
        NodeHandle current = stack.back();
        stack.pop_back();

        const Node* n = node(current);
        if (!n) {
            continue;
        }
        if (n->name == name) {
            return current;
        }
        // Reverse so that the first child is visited first
        stack.insert(stack.end(), n->children.rbegin(), n->children.rend());
    }
    return std::nullopt;
}

std::pair<NodeHandle, Graph::NodeRemap> Graph::copy_subtree(NodeHandle root, Graph& dest) const {
    NodeRemap old_to_new;
    if (!is_valid_handle(root)) {
        return {NodeHandle{}, std::move(old_to_new)};
    }

    // (source node, destination parent)
    std::vector<std::pair<NodeHandle, NodeHandle>> stack{{root, dest.root()}};
    NodeHandle new_root;
    while (!stack.empty()) {
        auto [source, dest_parent] = stack.back();
        stack.pop_back();

        // Copied by value, `dest` may be this graph
        const Node original = *node(source);
        Node copy(original.name);
        copy.local_transform = original.local_transform;
        copy.mesh = original.mesh;

        NodeHandle copied = dest.add_node(std::move(copy));
        dest.link_nodes(copied, dest_parent);
        old_to_new.emplace(source, copied);
        if (source == root) {
            new_root = copied;
        }

        for (auto it = original.children.rbegin(); it != original.children.rend(); ++it) {
            stack.emplace_back(*it, copied);
        }
    }
    return {new_root, std::move(old_to_new)};
}

Mat4 Graph::global_transform(NodeHandle handle) const {
    Mat4 result(1.0f);
    const Node* n = node(handle);
    while (n) {
        result = n->local_transform.matrix() * result;
        n = node(n->parent);
    }
    return result;
}

Mat4 Graph::isometric_global_transform(NodeHandle handle) const {
    return isometric_global(handle).to_mat4();
}

std::pair<Quat, Vec3> Graph::isometric_global_rotation_position(NodeHandle handle) const {
    Isometry iso = isometric_global(handle);
    return {iso.rotation, iso.translation};
}

Isometry Graph::isometric_global(NodeHandle handle) const {
    Isometry result = Isometry::identity();
    const Node* n = node(handle);
    while (n) {
        result = n->local_transform.isometry() * result;
        n = node(n->parent);
    }
    return result;
}

bool Graph::is_ancestor(NodeHandle ancestor, NodeHandle handle) const {
    const Node* n = node(handle);
    NodeHandle current = handle;
    while (n) {
        if (current == ancestor) {
            return true;
        }
        current = n->parent;
        n = node(current);
    }
    return false;
}

void Graph::detach(NodeHandle handle) {
    Node* n = m_pool.get_mut(handle);
    if (!n) {
        return;
    }
    if (Node* parent = m_pool.get_mut(n->parent)) {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), handle), siblings.end());
    }
    n->parent = NodeHandle{};
}

} // namespace tether_scene
