/// @file collider.hpp
/// @brief Colliders, interaction groups and the collider set

#pragma once

#include "fwd.hpp"
#include "shape.hpp"

#include <tether/core/handle.hpp>
#include <tether/math/isometry.hpp>

#include <cstdint>
#include <limits>
#include <optional>

namespace tether_physics {

// =============================================================================
// InteractionGroups
// =============================================================================

/// Packed membership/filter masks. The high 16 bits are the groups this
/// collider belongs to, the low 16 bits the groups it interacts with.
struct InteractionGroups {
    std::uint32_t bits = std::numeric_limits<std::uint32_t>::max();

    constexpr InteractionGroups() noexcept = default;
    constexpr explicit InteractionGroups(std::uint32_t raw) noexcept : bits(raw) {}

    [[nodiscard]] static constexpr InteractionGroups all() noexcept { return InteractionGroups{}; }
    [[nodiscard]] static constexpr InteractionGroups none() noexcept { return InteractionGroups{0}; }

    [[nodiscard]] static constexpr InteractionGroups with(std::uint16_t memberships, std::uint16_t filter) noexcept {
        return InteractionGroups{(static_cast<std::uint32_t>(memberships) << 16) | filter};
    }

    [[nodiscard]] constexpr std::uint16_t memberships() const noexcept { return static_cast<std::uint16_t>(bits >> 16); }
    [[nodiscard]] constexpr std::uint16_t filter() const noexcept { return static_cast<std::uint16_t>(bits & 0xFFFFu); }

    /// Both sides must accept each other
    [[nodiscard]] constexpr bool test(InteractionGroups other) const noexcept {
        return (memberships() & other.filter()) != 0 && (other.memberships() & filter()) != 0;
    }

    constexpr bool operator==(const InteractionGroups&) const noexcept = default;
};

// =============================================================================
// Collider
// =============================================================================

class Collider {
public:
    explicit Collider(SharedShape shape) : m_shape(std::move(shape)) {}

    [[nodiscard]] const IShape& shape() const noexcept { return *m_shape; }
    [[nodiscard]] const SharedShape& shared_shape() const noexcept { return m_shape; }
    void set_shape(SharedShape shape) { m_shape = std::move(shape); }

    /// Owning body. Invalid until the collider is inserted into a set.
    [[nodiscard]] RawBodyHandle parent() const noexcept { return m_parent; }

    [[nodiscard]] const tether_math::Isometry& position_wrt_parent() const noexcept { return m_position_wrt_parent; }
    void set_position_wrt_parent(const tether_math::Isometry& position) { m_position_wrt_parent = position; }

    [[nodiscard]] float friction() const noexcept { return m_friction; }
    void set_friction(float friction) { m_friction = friction; }

    [[nodiscard]] float restitution() const noexcept { return m_restitution; }
    void set_restitution(float restitution) { m_restitution = restitution; }

    [[nodiscard]] std::optional<float> density() const noexcept { return m_density; }
    void set_density(std::optional<float> density) { m_density = density; }

    [[nodiscard]] bool is_sensor() const noexcept { return m_is_sensor; }
    void set_sensor(bool sensor) { m_is_sensor = sensor; }

    [[nodiscard]] InteractionGroups collision_groups() const noexcept { return m_collision_groups; }
    void set_collision_groups(InteractionGroups groups) { m_collision_groups = groups; }

    [[nodiscard]] InteractionGroups solver_groups() const noexcept { return m_solver_groups; }
    void set_solver_groups(InteractionGroups groups) { m_solver_groups = groups; }

    /// World pose given the pose of the parent body
    [[nodiscard]] tether_math::Isometry world_position(const tether_math::Isometry& body_position) const {
        return body_position * m_position_wrt_parent;
    }

private:
    friend class ColliderSet;

    SharedShape m_shape;
    RawBodyHandle m_parent;
    tether_math::Isometry m_position_wrt_parent;
    float m_friction = 0.5f;
    float m_restitution = 0.0f;
    std::optional<float> m_density;
    bool m_is_sensor = false;
    InteractionGroups m_collision_groups;
    InteractionGroups m_solver_groups;
};

// =============================================================================
// ColliderBuilder
// =============================================================================

class ColliderBuilder {
public:
    explicit ColliderBuilder(SharedShape shape) : m_collider(std::move(shape)) {}

    ColliderBuilder& friction(float f) { m_collider.set_friction(f); return *this; }
    ColliderBuilder& restitution(float r) { m_collider.set_restitution(r); return *this; }
    ColliderBuilder& density(float d) { m_collider.set_density(d); return *this; }
    ColliderBuilder& sensor(bool s) { m_collider.set_sensor(s); return *this; }
    ColliderBuilder& position_wrt_parent(const tether_math::Isometry& p) { m_collider.set_position_wrt_parent(p); return *this; }
    ColliderBuilder& translation(const tether_math::Vec3& t) {
        auto p = m_collider.position_wrt_parent();
        p.translation = t;
        m_collider.set_position_wrt_parent(p);
        return *this;
    }
    ColliderBuilder& collision_groups(InteractionGroups g) { m_collider.set_collision_groups(g); return *this; }
    ColliderBuilder& solver_groups(InteractionGroups g) { m_collider.set_solver_groups(g); return *this; }

    [[nodiscard]] Collider build() const { return m_collider; }

private:
    Collider m_collider;
};

// =============================================================================
// ColliderSet
// =============================================================================

class ColliderSet {
public:
    ColliderSet() = default;

    /// Attach a collider to `parent`. Returns an invalid handle when the
    /// parent does not exist.
    [[nodiscard]] RawColliderHandle insert(Collider collider, RawBodyHandle parent, RigidBodySet& bodies);

    /// Detach and remove a collider, optionally waking its parent body
    std::optional<Collider> remove(RawColliderHandle handle, RigidBodySet& bodies, bool wake_up);

    [[nodiscard]] const Collider* get(RawColliderHandle handle) const { return m_colliders.get(handle); }
    [[nodiscard]] Collider* get_mut(RawColliderHandle handle) { return m_colliders.get_mut(handle); }
    [[nodiscard]] bool contains(RawColliderHandle handle) const { return m_colliders.contains(handle); }

    [[nodiscard]] std::size_t len() const noexcept { return m_colliders.len(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_colliders.is_empty(); }

    template<typename F>
    void for_each(F&& func) const { m_colliders.for_each(std::forward<F>(func)); }

    [[nodiscard]] std::vector<RawColliderHandle> handles() const { return m_colliders.handles(); }

private:
    friend class RigidBodySet;

    /// Drop a collider whose parent is being removed
    std::optional<Collider> remove_detached(RawColliderHandle handle) { return m_colliders.remove(handle); }

    tether_core::Pool<Collider> m_colliders;
};

} // namespace tether_physics
