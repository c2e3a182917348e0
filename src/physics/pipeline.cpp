/// @file pipeline.cpp
/// @brief Minimal simulation pipeline implementation

#include <tether/physics/pipeline.hpp>
#include <tether/physics/rigid_body.hpp>
#include <tether/physics/collider.hpp>
#include <tether/physics/joint.hpp>

namespace tether_physics {

void PhysicsPipeline::step(const tether_math::Vec3& gravity,
                           const IntegrationParameters& params,
                           RigidBodySet& bodies,
                           ColliderSet& /*colliders*/,
                           JointSet& /*joints*/) {
    const float dt = params.dt;

    bodies.for_each_mut([&](RawBodyHandle, RigidBody& body) {
        if (body.is_static() || body.is_sleeping()) {
            return;
        }

        if (body.is_dynamic()) {
            integrate_velocities(body, gravity, dt);
        }
        integrate_positions(body, dt);

        if (body.is_dynamic()) {
            update_sleep_state(body, dt);
        }
    });

    ++m_step_count;
}

void PhysicsPipeline::integrate_velocities(RigidBody& body, const tether_math::Vec3& gravity, float dt) {
    tether_math::Vec3 linvel = body.linvel();
    if (body.mass() > 0.0f) {
        linvel += gravity * dt;
    }
    body.set_linvel(linvel, false);
}

void PhysicsPipeline::integrate_positions(RigidBody& body, float dt) {
    tether_math::Vec3 linvel = body.linvel();
    tether_math::Vec3 angvel = body.angvel();

    if (body.is_translation_locked()) {
        linvel = tether_math::Vec3(0.0f);
    }
    const auto& locked = body.is_rotation_locked();
    for (int axis = 0; axis < 3; ++axis) {
        if (locked[axis]) {
            angvel[axis] = 0.0f;
        }
    }
    body.set_linvel(linvel, false);
    body.set_angvel(angvel, false);

    tether_math::Isometry pose = body.position();
    pose.translation += linvel * dt;

    // q' = q + 0.5 * (0, w) * q * dt
    const tether_math::Quat& q = pose.rotation;
    tether_math::Quat spin(0.0f, angvel.x * dt * 0.5f, angvel.y * dt * 0.5f, angvel.z * dt * 0.5f);
    tether_math::Quat dq = spin * q;
    pose.rotation = glm::normalize(tether_math::Quat(q.w + dq.w, q.x + dq.x, q.y + dq.y, q.z + dq.z));

    body.set_position(pose, false);
}

void PhysicsPipeline::update_sleep_state(RigidBody& body, float dt) {
    bool slow = glm::length2(body.linvel()) < SLEEP_LINEAR_THRESHOLD * SLEEP_LINEAR_THRESHOLD &&
                glm::length2(body.angvel()) < SLEEP_ANGULAR_THRESHOLD * SLEEP_ANGULAR_THRESHOLD;
    if (!slow) {
        body.set_sleep_timer(0.0f);
        return;
    }

    body.set_sleep_timer(body.sleep_timer() + dt);
    if (body.sleep_timer() >= TIME_TO_SLEEP) {
        body.sleep();
    }
}

} // namespace tether_physics
