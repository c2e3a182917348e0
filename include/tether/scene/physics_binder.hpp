#pragma once

/// @file physics_binder.hpp
/// @brief Association between scene nodes and rigid bodies
///
/// A bound node follows its body. The physics layer uses the binding to
/// find the node that supplies triangle mesh geometry for a body, and to
/// move bindings over to new bodies when a resource is instantiated.

#include "fwd.hpp"
#include <tether/core/bidir_map.hpp>
#include <tether/core/visitor.hpp>
#include <tether/physics/handles.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace tether_scene {

class PhysicsBinder {
public:
    using ForwardMap = std::unordered_map<NodeHandle, tether_physics::RigidBodyHandle>;

    PhysicsBinder() = default;

    /// Bind `node` to `body`. Any previous binding of either side is dropped.
    /// Returns the body `node` was bound to before.
    std::optional<tether_physics::RigidBodyHandle> bind(NodeHandle node, tether_physics::RigidBodyHandle body) {
        return m_map.insert(node, body);
    }

    std::optional<tether_physics::RigidBodyHandle> unbind_by_node(NodeHandle node) {
        return m_map.remove_by_key(node);
    }

    std::optional<NodeHandle> unbind_by_body(tether_physics::RigidBodyHandle body) {
        return m_map.remove_by_value(body);
    }

    [[nodiscard]] std::optional<NodeHandle> node_of(tether_physics::RigidBodyHandle body) const {
        return m_map.key_of(body);
    }

    [[nodiscard]] std::optional<tether_physics::RigidBodyHandle> body_of(NodeHandle node) const {
        return m_map.value_of(node);
    }

    [[nodiscard]] const ForwardMap& forward_map() const noexcept { return m_map.forward_map(); }

    [[nodiscard]] std::size_t len() const noexcept { return m_map.len(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_map.is_empty(); }

    void clear() { m_map.clear(); }

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor) {
        return tether_core::visit(visitor, name, m_map);
    }

private:
    tether_core::BiDirHashMap<NodeHandle, tether_physics::RigidBodyHandle> m_map;
};

} // namespace tether_scene
