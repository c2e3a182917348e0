/// @file joint.cpp
/// @brief Joint set implementation

#include <tether/physics/joint.hpp>
#include <tether/physics/rigid_body.hpp>

namespace tether_physics {

RawJointHandle JointSet::insert(RigidBodySet& bodies, RawBodyHandle body1, RawBodyHandle body2,
                                JointParams params) {
    if (!bodies.contains(body1) || !bodies.contains(body2)) {
        return RawJointHandle::invalid();
    }
    return m_joints.insert(Joint(body1, body2, std::move(params)));
}

std::optional<Joint> JointSet::remove(RawJointHandle handle, RigidBodySet& bodies, bool wake_up) {
    auto joint = m_joints.remove(handle);
    if (!joint) {
        return std::nullopt;
    }

    if (wake_up) {
        for (RawBodyHandle body_handle : {joint->body1(), joint->body2()}) {
            if (RigidBody* body = bodies.get_mut(body_handle)) {
                body->wake_up();
            }
        }
    }
    return joint;
}

std::vector<RawJointHandle> JointSet::attached_to(RawBodyHandle body) const {
    std::vector<RawJointHandle> result;
    m_joints.for_each([&](RawJointHandle handle, const Joint& joint) {
        if (joint.is_attached_to(body)) {
            result.push_back(handle);
        }
    });
    return result;
}

} // namespace tether_physics
