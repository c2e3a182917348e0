/// @file rigid_body.hpp
/// @brief Rigid bodies and the set that owns them

#pragma once

#include "fwd.hpp"

#include <tether/core/handle.hpp>
#include <tether/math/isometry.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace tether_physics {

// =============================================================================
// Body Status
// =============================================================================

/// How the solver treats a body
enum class BodyStatus : std::uint8_t {
    Dynamic,    ///< Moved by gravity and velocity
    Static,     ///< Never moves
    Kinematic,  ///< Moved by velocity only
};

[[nodiscard]] const char* body_status_name(BodyStatus status);

// =============================================================================
// RigidBody
// =============================================================================

class RigidBody {
public:
    RigidBody() = default;
    explicit RigidBody(BodyStatus status) : m_status(status) {}

    // -------------------------------------------------------------------------
    // Pose / Velocity
    // -------------------------------------------------------------------------

    [[nodiscard]] const tether_math::Isometry& position() const noexcept { return m_position; }
    void set_position(const tether_math::Isometry& position, bool wake_up);

    [[nodiscard]] const tether_math::Vec3& linvel() const noexcept { return m_linvel; }
    void set_linvel(const tether_math::Vec3& linvel, bool wake_up);

    [[nodiscard]] const tether_math::Vec3& angvel() const noexcept { return m_angvel; }
    void set_angvel(const tether_math::Vec3& angvel, bool wake_up);

    // -------------------------------------------------------------------------
    // Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] BodyStatus body_status() const noexcept { return m_status; }
    void set_body_status(BodyStatus status) { m_status = status; }

    [[nodiscard]] bool is_dynamic() const noexcept { return m_status == BodyStatus::Dynamic; }
    [[nodiscard]] bool is_static() const noexcept { return m_status == BodyStatus::Static; }
    [[nodiscard]] bool is_kinematic() const noexcept { return m_status == BodyStatus::Kinematic; }

    [[nodiscard]] float mass() const noexcept { return m_mass; }
    void set_mass(float mass) { m_mass = mass; }

    /// Per-axis rotation locks (x, y, z)
    [[nodiscard]] const std::array<bool, 3>& is_rotation_locked() const noexcept { return m_rotation_locked; }
    void restrict_rotations(bool x, bool y, bool z) { m_rotation_locked = {x, y, z}; }

    [[nodiscard]] bool is_translation_locked() const noexcept { return m_translation_locked; }
    void lock_translations(bool locked = true) { m_translation_locked = locked; }

    // -------------------------------------------------------------------------
    // Sleeping
    // -------------------------------------------------------------------------

    [[nodiscard]] bool is_sleeping() const noexcept { return m_sleeping; }
    void sleep();
    void wake_up();

    /// Time spent below the sleep threshold
    [[nodiscard]] float sleep_timer() const noexcept { return m_sleep_timer; }
    void set_sleep_timer(float seconds) { m_sleep_timer = seconds; }

    // -------------------------------------------------------------------------
    // Attached Colliders
    // -------------------------------------------------------------------------

    /// Colliders attached to this body, in attachment order
    [[nodiscard]] const std::vector<RawColliderHandle>& colliders() const noexcept { return m_colliders; }

private:
    friend class ColliderSet;

    void attach_collider(RawColliderHandle handle) { m_colliders.push_back(handle); }
    void detach_collider(RawColliderHandle handle);

    tether_math::Isometry m_position;
    tether_math::Vec3 m_linvel{0.0f};
    tether_math::Vec3 m_angvel{0.0f};
    BodyStatus m_status = BodyStatus::Dynamic;
    float m_mass = 1.0f;
    std::array<bool, 3> m_rotation_locked{false, false, false};
    bool m_translation_locked = false;
    bool m_sleeping = false;
    float m_sleep_timer = 0.0f;
    std::vector<RawColliderHandle> m_colliders;
};

// =============================================================================
// RigidBodyBuilder
// =============================================================================

/// Fluent builder for rigid bodies
class RigidBodyBuilder {
public:
    explicit RigidBodyBuilder(BodyStatus status) : m_status(status) {}

    [[nodiscard]] static RigidBodyBuilder new_dynamic() { return RigidBodyBuilder(BodyStatus::Dynamic); }
    [[nodiscard]] static RigidBodyBuilder new_static() { return RigidBodyBuilder(BodyStatus::Static); }
    [[nodiscard]] static RigidBodyBuilder new_kinematic() { return RigidBodyBuilder(BodyStatus::Kinematic); }

    RigidBodyBuilder& position(const tether_math::Isometry& p) { m_position = p; return *this; }
    RigidBodyBuilder& translation(const tether_math::Vec3& t) { m_position.translation = t; return *this; }
    RigidBodyBuilder& rotation(const tether_math::Quat& r) { m_position.rotation = r; return *this; }

    RigidBodyBuilder& linvel(const tether_math::Vec3& v) { m_linvel = v; return *this; }
    RigidBodyBuilder& angvel(const tether_math::Vec3& v) { m_angvel = v; return *this; }

    /// Body mass. Colliders do not contribute to it.
    RigidBodyBuilder& additional_mass(float m) { m_mass = m; return *this; }

    RigidBodyBuilder& restrict_rotations(bool x, bool y, bool z) { m_rotation_locked = {x, y, z}; return *this; }
    RigidBodyBuilder& lock_rotations() { return restrict_rotations(true, true, true); }
    RigidBodyBuilder& lock_translations() { m_translation_locked = true; return *this; }

    RigidBodyBuilder& sleeping(bool asleep = true) { m_sleeping = asleep; return *this; }

    [[nodiscard]] RigidBody build() const;

private:
    BodyStatus m_status;
    tether_math::Isometry m_position;
    tether_math::Vec3 m_linvel{0.0f};
    tether_math::Vec3 m_angvel{0.0f};
    float m_mass = 1.0f;
    std::array<bool, 3> m_rotation_locked{false, false, false};
    bool m_translation_locked = false;
    bool m_sleeping = false;
};

// =============================================================================
// RigidBodySet
// =============================================================================

/// Owns bodies behind generational handles
class RigidBodySet {
public:
    RigidBodySet() = default;

    [[nodiscard]] RawBodyHandle insert(RigidBody body) { return m_bodies.insert(std::move(body)); }

    /// Remove a body together with its colliders and every joint attached to it.
    /// Handles of the removed joints are appended to `removed_joints` when given.
    std::optional<RigidBody> remove(RawBodyHandle handle, ColliderSet& colliders, JointSet& joints,
                                    std::vector<RawJointHandle>* removed_joints = nullptr);

    [[nodiscard]] const RigidBody* get(RawBodyHandle handle) const { return m_bodies.get(handle); }
    [[nodiscard]] RigidBody* get_mut(RawBodyHandle handle) { return m_bodies.get_mut(handle); }
    [[nodiscard]] bool contains(RawBodyHandle handle) const { return m_bodies.contains(handle); }

    [[nodiscard]] std::size_t len() const noexcept { return m_bodies.len(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_bodies.is_empty(); }

    /// Iterate live bodies in slot order
    template<typename F>
    void for_each(F&& func) const { m_bodies.for_each(std::forward<F>(func)); }

    template<typename F>
    void for_each_mut(F&& func) { m_bodies.for_each_mut(std::forward<F>(func)); }

    [[nodiscard]] std::vector<RawBodyHandle> handles() const { return m_bodies.handles(); }

private:
    tether_core::Pool<RigidBody> m_bodies;
};

} // namespace tether_physics
