/// @file joint.hpp
/// @brief Joints between two rigid bodies

#pragma once

#include "fwd.hpp"

#include <tether/core/handle.hpp>
#include <tether/math/isometry.hpp>

#include <optional>
#include <variant>
#include <vector>

namespace tether_physics {

// =============================================================================
// Joint Parameters
// =============================================================================

/// Shared point, free rotation
struct BallJoint {
    tether_math::Vec3 local_anchor1{0.0f};
    tether_math::Vec3 local_anchor2{0.0f};
};

/// No relative motion
struct FixedJoint {
    tether_math::Isometry local_anchor1;
    tether_math::Isometry local_anchor2;
};

/// Translation along one axis
struct PrismaticJoint {
    PrismaticJoint() = default;
    PrismaticJoint(const tether_math::Vec3& anchor1, const tether_math::Vec3& axis1,
                   const tether_math::Vec3& anchor2, const tether_math::Vec3& axis2)
        : local_anchor1(anchor1)
        , local_axis1(tether_math::try_normalize(axis1))
        , local_anchor2(anchor2)
        , local_axis2(tether_math::try_normalize(axis2)) {}

    tether_math::Vec3 local_anchor1{0.0f};
    tether_math::Vec3 local_axis1{tether_math::vec3::X};
    tether_math::Vec3 local_anchor2{0.0f};
    tether_math::Vec3 local_axis2{tether_math::vec3::X};
};

/// Rotation around one axis
struct RevoluteJoint {
    RevoluteJoint() = default;
    RevoluteJoint(const tether_math::Vec3& anchor1, const tether_math::Vec3& axis1,
                  const tether_math::Vec3& anchor2, const tether_math::Vec3& axis2)
        : local_anchor1(anchor1)
        , local_axis1(tether_math::try_normalize(axis1))
        , local_anchor2(anchor2)
        , local_axis2(tether_math::try_normalize(axis2)) {}

    tether_math::Vec3 local_anchor1{0.0f};
    tether_math::Vec3 local_axis1{tether_math::vec3::X};
    tether_math::Vec3 local_anchor2{0.0f};
    tether_math::Vec3 local_axis2{tether_math::vec3::X};
};

using JointParams = std::variant<BallJoint, FixedJoint, PrismaticJoint, RevoluteJoint>;

// =============================================================================
// Joint
// =============================================================================

class Joint {
public:
    Joint(RawBodyHandle body1, RawBodyHandle body2, JointParams params)
        : m_body1(body1), m_body2(body2), m_params(std::move(params)) {}

    [[nodiscard]] RawBodyHandle body1() const noexcept { return m_body1; }
    [[nodiscard]] RawBodyHandle body2() const noexcept { return m_body2; }
    [[nodiscard]] const JointParams& params() const noexcept { return m_params; }
    void set_params(JointParams params) { m_params = std::move(params); }

    [[nodiscard]] bool is_attached_to(RawBodyHandle body) const noexcept {
        return m_body1 == body || m_body2 == body;
    }

private:
    RawBodyHandle m_body1;
    RawBodyHandle m_body2;
    JointParams m_params;
};

// =============================================================================
// JointSet
// =============================================================================

class JointSet {
public:
    JointSet() = default;

    /// Connect two bodies. Returns an invalid handle when either body is missing.
    [[nodiscard]] RawJointHandle insert(RigidBodySet& bodies, RawBodyHandle body1, RawBodyHandle body2,
                                        JointParams params);

    /// Remove a joint, optionally waking both bodies
    std::optional<Joint> remove(RawJointHandle handle, RigidBodySet& bodies, bool wake_up);

    /// Handles of every joint touching `body`, in slot order
    [[nodiscard]] std::vector<RawJointHandle> attached_to(RawBodyHandle body) const;

    [[nodiscard]] const Joint* get(RawJointHandle handle) const { return m_joints.get(handle); }
    [[nodiscard]] Joint* get_mut(RawJointHandle handle) { return m_joints.get_mut(handle); }
    [[nodiscard]] bool contains(RawJointHandle handle) const { return m_joints.contains(handle); }

    [[nodiscard]] std::size_t len() const noexcept { return m_joints.len(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_joints.is_empty(); }

    template<typename F>
    void for_each(F&& func) const { m_joints.for_each(std::forward<F>(func)); }

    [[nodiscard]] std::vector<RawJointHandle> handles() const { return m_joints.handles(); }

private:
    tether_core::Pool<Joint> m_joints;
};

} // namespace tether_physics
