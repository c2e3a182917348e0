/// @file rigid_body.cpp
/// @brief Rigid body and body set implementation

#include <tether/physics/rigid_body.hpp>
#include <tether/physics/collider.hpp>
#include <tether/physics/joint.hpp>

#include <algorithm>

namespace tether_physics {

const char* body_status_name(BodyStatus status) {
    switch (status) {
        case BodyStatus::Dynamic: return "Dynamic";
        case BodyStatus::Static: return "Static";
        case BodyStatus::Kinematic: return "Kinematic";
        default: return "Unknown";
    }
}

// =============================================================================
// RigidBody
// =============================================================================

void RigidBody::set_position(const tether_math::Isometry& position, bool wake_up) {
    m_position = position;
    if (wake_up) {
        this->wake_up();
    }
}

void RigidBody::set_linvel(const tether_math::Vec3& linvel, bool wake_up) {
    m_linvel = linvel;
    if (wake_up) {
        this->wake_up();
    }
}

void RigidBody::set_angvel(const tether_math::Vec3& angvel, bool wake_up) {
    m_angvel = angvel;
    if (wake_up) {
        this->wake_up();
    }
}

void RigidBody::sleep() {
    m_sleeping = true;
    m_linvel = tether_math::Vec3(0.0f);
    m_angvel = tether_math::Vec3(0.0f);
}

void RigidBody::wake_up() {
    m_sleeping = false;
    m_sleep_timer = 0.0f;
}

void RigidBody::detach_collider(RawColliderHandle handle) {
    m_colliders.erase(std::remove(m_colliders.begin(), m_colliders.end(), handle), m_colliders.end());
}

// =============================================================================
// RigidBodyBuilder
// =============================================================================

RigidBody RigidBodyBuilder::build() const {
    RigidBody body(m_status);
    body.set_position(m_position, false);
    body.set_linvel(m_linvel, false);
    body.set_angvel(m_angvel, false);
    body.set_mass(m_mass);
    body.restrict_rotations(m_rotation_locked[0], m_rotation_locked[1], m_rotation_locked[2]);
    body.lock_translations(m_translation_locked);
    if (m_sleeping) {
        body.sleep();
    }
    return body;
}

// =============================================================================
// RigidBodySet
// =============================================================================

std::optional<RigidBody> RigidBodySet::remove(RawBodyHandle handle, ColliderSet& colliders, JointSet& joints,
                                              std::vector<RawJointHandle>* removed_joints) {
    if (!m_bodies.contains(handle)) {
        return std::nullopt;
    }

    for (RawJointHandle joint : joints.attached_to(handle)) {
        if (joints.remove(joint, *this, true) && removed_joints) {
            removed_joints->push_back(joint);
        }
    }

    auto body = m_bodies.remove(handle);
    for (RawColliderHandle collider : body->colliders()) {
        colliders.remove_detached(collider);
    }
    return body;
}

} // namespace tether_physics
