/// @file pipeline.hpp
/// @brief Minimal simulation pipeline

#pragma once

#include "fwd.hpp"
#include "integration_parameters.hpp"

#include <tether/math/types.hpp>

namespace tether_physics {

/// Advances bodies with semi-implicit Euler integration.
///
/// Dynamic bodies receive gravity, kinematic bodies move with their
/// current velocity and static bodies never move. Lock flags zero the
/// matching velocity components before integration. Contacts and joint
/// constraints are not solved.
class PhysicsPipeline {
public:
    /// Velocity below which a body starts counting towards sleep
    static constexpr float SLEEP_LINEAR_THRESHOLD = 0.01f;
    static constexpr float SLEEP_ANGULAR_THRESHOLD = 0.01f;

    /// Seconds a body must stay below the thresholds before it sleeps
    static constexpr float TIME_TO_SLEEP = 2.0f;

    PhysicsPipeline() = default;

    void step(const tether_math::Vec3& gravity,
              const IntegrationParameters& params,
              RigidBodySet& bodies,
              ColliderSet& colliders,
              JointSet& joints);

    /// Number of steps taken so far
    [[nodiscard]] std::uint64_t step_count() const noexcept { return m_step_count; }

private:
    static void integrate_velocities(RigidBody& body, const tether_math::Vec3& gravity, float dt);
    static void integrate_positions(RigidBody& body, float dt);
    static void update_sleep_state(RigidBody& body, float dt);

    std::uint64_t m_step_count = 0;
};

} // namespace tether_physics
