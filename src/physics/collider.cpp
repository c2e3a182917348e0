/// @file collider.cpp
/// @brief Collider set implementation

#include <tether/physics/collider.hpp>
#include <tether/physics/rigid_body.hpp>

namespace tether_physics {

RawColliderHandle ColliderSet::insert(Collider collider, RawBodyHandle parent, RigidBodySet& bodies) {
    RigidBody* body = bodies.get_mut(parent);
    if (!body) {
        return RawColliderHandle::invalid();
    }

    collider.m_parent = parent;
    RawColliderHandle handle = m_colliders.insert(std::move(collider));
    body->attach_collider(handle);
    return handle;
}

std::optional<Collider> ColliderSet::remove(RawColliderHandle handle, RigidBodySet& bodies, bool wake_up) {
    auto collider = m_colliders.remove(handle);
    if (!collider) {
        return std::nullopt;
    }

    if (RigidBody* body = bodies.get_mut(collider->parent())) {
        body->detach_collider(handle);
        if (wake_up) {
            body->wake_up();
        }
    }
    return collider;
}

} // namespace tether_physics
