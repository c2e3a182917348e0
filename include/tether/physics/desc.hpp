#pragma once

/// @file desc.hpp
/// @brief Serializable descriptors of a physics world
///
/// Descriptors are the only form in which a world is persisted. They refer
/// to each other by engine handle, never by solver handle, and every
/// variant carries a fixed numeric id. The id tables below are the single
/// source of truth for the stored layout: the variant alternative index IS
/// the id, and the static_asserts keep the two from drifting apart.
///
/// | Shape         | id | Joint     | id | Body status | id |
/// |---------------|----|-----------|----|-------------|----|
/// | Ball          | 0  | Ball      | 0  | Dynamic     | 0  |
/// | Cylinder      | 1  | Fixed     | 1  | Static      | 1  |
/// | RoundCylinder | 2  | Prismatic | 2  | Kinematic   | 2  |
/// | Cone          | 3  | Revolute  | 3  |             |    |
/// | Cuboid        | 4  |           |    |             |    |
/// | Capsule       | 5  |           |    |             |    |
/// | Segment       | 6  |           |    |             |    |
/// | Triangle      | 7  |           |    |             |    |
/// | Trimesh       | 8  |           |    |             |    |
/// | Heightfield   | 9  |           |    |             |    |

#include "fwd.hpp"
#include "handles.hpp"
#include "shape.hpp"
#include "rigid_body.hpp"
#include "collider.hpp"
#include "joint.hpp"
#include "integration_parameters.hpp"

#include <tether/core/bidir_map.hpp>
#include <tether/core/visitor.hpp>
#include <tether/math/types.hpp>
#include <tether/math/isometry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tether_physics {

using BodyHandleMap = tether_core::BiDirHashMap<RigidBodyHandle, RawBodyHandle>;
using ColliderHandleMap = tether_core::BiDirHashMap<ColliderHandle, RawColliderHandle>;
using JointHandleMap = tether_core::BiDirHashMap<JointHandle, RawJointHandle>;

/// Build variant alternative `index`, default constructed
template<typename Variant, std::size_t I = 0>
[[nodiscard]] std::optional<Variant> variant_from_index(std::size_t index) {
    if constexpr (I < std::variant_size_v<Variant>) {
        if (index == I) {
            return Variant{std::in_place_index<I>};
        }
        return variant_from_index<Variant, I + 1>(index);
    } else {
        return std::nullopt;
    }
}

/// True when every alternative's ID equals its position in the variant
template<typename Variant, std::size_t... I>
constexpr bool ids_match_indices(std::index_sequence<I...>) {
    return ((std::variant_alternative_t<I, Variant>::ID == I) && ...);
}

// =============================================================================
// Body Status
// =============================================================================

enum class BodyStatusDesc : std::uint32_t {
    Dynamic = 0,
    Static = 1,
    Kinematic = 2,
};

/// Fails with MalformedData for unknown ids
[[nodiscard]] tether_core::Result<BodyStatusDesc> body_status_desc_from_id(std::uint32_t id);

[[nodiscard]] BodyStatusDesc to_body_status_desc(BodyStatus status);
[[nodiscard]] BodyStatus to_body_status(BodyStatusDesc status);

// =============================================================================
// Shape Descriptors
// =============================================================================

struct BallDesc {
    static constexpr std::uint32_t ID = 0;
    float radius = 0.5f;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const BallDesc&) const = default;
};

struct CylinderDesc {
    static constexpr std::uint32_t ID = 1;
    float half_height = 0.5f;
    float radius = 0.5f;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const CylinderDesc&) const = default;
};

struct RoundCylinderDesc {
    static constexpr std::uint32_t ID = 2;
    float half_height = 0.5f;
    float radius = 0.5f;
    float border_radius = 0.1f;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const RoundCylinderDesc&) const = default;
};

struct ConeDesc {
    static constexpr std::uint32_t ID = 3;
    float half_height = 0.5f;
    float radius = 0.5f;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const ConeDesc&) const = default;
};

struct CuboidDesc {
    static constexpr std::uint32_t ID = 4;
    tether_math::Vec3 half_extents{0.5f};

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const CuboidDesc&) const = default;
};

struct CapsuleDesc {
    static constexpr std::uint32_t ID = 5;
    tether_math::Vec3 begin{0.0f};
    tether_math::Vec3 end{0.0f, 1.0f, 0.0f};
    float radius = 0.5f;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const CapsuleDesc&) const = default;
};

struct SegmentDesc {
    static constexpr std::uint32_t ID = 6;
    tether_math::Vec3 begin{0.0f};
    tether_math::Vec3 end{0.0f};

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const SegmentDesc&) const = default;
};

struct TriangleDesc {
    static constexpr std::uint32_t ID = 7;
    tether_math::Vec3 a{0.0f};
    tether_math::Vec3 b{0.0f};
    tether_math::Vec3 c{0.0f};

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const TriangleDesc&) const = default;
};

/// Marker only. The geometry is rebuilt from the mesh node bound to the
/// collider's parent body.
struct TrimeshDesc {
    static constexpr std::uint32_t ID = 8;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const TrimeshDesc&) const = default;
};

/// Marker only. Heights are not persisted.
struct HeightfieldDesc {
    static constexpr std::uint32_t ID = 9;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const HeightfieldDesc&) const = default;
};

struct ColliderShapeDesc {
    using Variant = std::variant<
        BallDesc,
        CylinderDesc,
        RoundCylinderDesc,
        ConeDesc,
        CuboidDesc,
        CapsuleDesc,
        SegmentDesc,
        TriangleDesc,
        TrimeshDesc,
        HeightfieldDesc
    >;

    Variant value;

    ColliderShapeDesc() = default;
    template<typename T>
        requires std::is_constructible_v<Variant, T>
    ColliderShapeDesc(T desc) : value(std::move(desc)) {}

    [[nodiscard]] std::uint32_t id() const noexcept { return static_cast<std::uint32_t>(value.index()); }

    /// Default-valued descriptor for `id`, MalformedData for unknown ids
    [[nodiscard]] static tether_core::Result<ColliderShapeDesc> from_id(std::uint32_t id);

    [[nodiscard]] static ColliderShapeDesc from_collider_shape(const IShape& shape);

    /// Live shape. Trimesh and heightfield produce fixed placeholders.
    [[nodiscard]] SharedShape into_collider_shape() const;

    [[nodiscard]] bool is_trimesh() const noexcept { return std::holds_alternative<TrimeshDesc>(value); }

    template<typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&value); }

    /// {Id, <name>{fields...}}
    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);

    bool operator==(const ColliderShapeDesc&) const = default;
};

static_assert(ids_match_indices<ColliderShapeDesc::Variant>(
    std::make_index_sequence<std::variant_size_v<ColliderShapeDesc::Variant>>{}));

// =============================================================================
// Collider / Body Descriptors
// =============================================================================

struct ColliderDesc {
    ColliderShapeDesc shape;
    RigidBodyHandle parent;
    float friction = 0.5f;
    float restitution = 0.0f;
    bool is_sensor = false;
    tether_math::Vec3 translation{0.0f};
    tether_math::Quat rotation = tether_math::quat::IDENTITY;
    std::uint32_t collision_groups = InteractionGroups::all().bits;
    std::uint32_t solver_groups = InteractionGroups::all().bits;
    std::optional<float> density;

    /// Snapshot `collider`. The parent is translated through `body_map`.
    [[nodiscard]] static ColliderDesc from_collider(const Collider& collider, const BodyHandleMap& body_map);

    /// Live collider without a parent; trimesh geometry is a placeholder
    [[nodiscard]] Collider convert_to_collider() const;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
};

struct RigidBodyDesc {
    tether_math::Vec3 position{0.0f};
    tether_math::Quat rotation = tether_math::quat::IDENTITY;
    tether_math::Vec3 lin_vel{0.0f};
    tether_math::Vec3 ang_vel{0.0f};
    bool sleeping = false;
    BodyStatusDesc status = BodyStatusDesc::Dynamic;
    std::vector<ColliderHandle> colliders;
    float mass = 1.0f;
    bool x_rotation_locked = false;
    bool y_rotation_locked = false;
    bool z_rotation_locked = false;
    bool translation_locked = false;

    /// Snapshot `body`. Attached colliders are translated through `collider_map`.
    [[nodiscard]] static RigidBodyDesc from_body(const RigidBody& body, const ColliderHandleMap& collider_map);

    [[nodiscard]] RigidBody convert_to_body() const;

    [[nodiscard]] tether_math::Isometry pose() const { return tether_math::Isometry{position, rotation}; }

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
};

// =============================================================================
// Joint Descriptors
// =============================================================================

struct BallJointDesc {
    static constexpr std::uint32_t ID = 0;
    tether_math::Vec3 local_anchor1{0.0f};
    tether_math::Vec3 local_anchor2{0.0f};

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const BallJointDesc&) const = default;
};

struct FixedJointDesc {
    static constexpr std::uint32_t ID = 1;
    tether_math::Vec3 local_anchor1_translation{0.0f};
    tether_math::Quat local_anchor1_rotation = tether_math::quat::IDENTITY;
    tether_math::Vec3 local_anchor2_translation{0.0f};
    tether_math::Quat local_anchor2_rotation = tether_math::quat::IDENTITY;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const FixedJointDesc&) const = default;
};

struct PrismaticJointDesc {
    static constexpr std::uint32_t ID = 2;
    tether_math::Vec3 local_anchor1{0.0f};
    tether_math::Vec3 local_axis1{tether_math::vec3::X};
    tether_math::Vec3 local_anchor2{0.0f};
    tether_math::Vec3 local_axis2{tether_math::vec3::X};

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const PrismaticJointDesc&) const = default;
};

struct RevoluteJointDesc {
    static constexpr std::uint32_t ID = 3;
    tether_math::Vec3 local_anchor1{0.0f};
    tether_math::Vec3 local_axis1{tether_math::vec3::X};
    tether_math::Vec3 local_anchor2{0.0f};
    tether_math::Vec3 local_axis2{tether_math::vec3::X};

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
    bool operator==(const RevoluteJointDesc&) const = default;
};

struct JointParamsDesc {
    using Variant = std::variant<
        BallJointDesc,
        FixedJointDesc,
        PrismaticJointDesc,
        RevoluteJointDesc
    >;

    Variant value;

    JointParamsDesc() = default;
    template<typename T>
        requires std::is_constructible_v<Variant, T>
    JointParamsDesc(T desc) : value(std::move(desc)) {}

    [[nodiscard]] std::uint32_t id() const noexcept { return static_cast<std::uint32_t>(value.index()); }

    [[nodiscard]] static tether_core::Result<JointParamsDesc> from_id(std::uint32_t id);
    [[nodiscard]] static JointParamsDesc from_params(const JointParams& params);
    [[nodiscard]] JointParams into_params() const;

    template<typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&value); }

    /// {Id, Data{fields...}}
    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);

    bool operator==(const JointParamsDesc&) const = default;
};

static_assert(ids_match_indices<JointParamsDesc::Variant>(
    std::make_index_sequence<std::variant_size_v<JointParamsDesc::Variant>>{}));

struct JointDesc {
    RigidBodyHandle body1;
    RigidBodyHandle body2;
    JointParamsDesc params;

    /// Snapshot `joint`. Both bodies are translated through `body_map`.
    [[nodiscard]] static JointDesc from_joint(const Joint& joint, const BodyHandleMap& body_map);

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
};

// =============================================================================
// Integration Parameters
// =============================================================================

struct IntegrationParametersDesc {
    float dt = 1.0f / 60.0f;
    float min_ccd_dt = 1.0f / 60.0f / 100.0f;
    float erp = 0.2f;
    float joint_erp = 0.2f;
    float warmstart_coeff = 1.0f;
    float warmstart_correction_slope = 10.0f;
    float velocity_solve_fraction = 1.0f;
    float velocity_based_erp = 0.0f;
    float allowed_linear_error = 0.005f;
    float max_linear_correction = 0.2f;
    float max_angular_correction = 0.2f;
    std::uint32_t max_velocity_iterations = 4;
    std::uint32_t max_position_iterations = 1;
    std::uint32_t min_island_size = 128;
    std::uint32_t max_ccd_substeps = 1;

    IntegrationParametersDesc() = default;
    explicit IntegrationParametersDesc(const IntegrationParameters& params);

    /// Fields that are not persisted keep their defaults
    [[nodiscard]] IntegrationParameters into_parameters() const;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
};

// =============================================================================
// PhysicsDesc
// =============================================================================

struct PhysicsDesc {
    /// Newest layout this build writes and understands
    static constexpr std::uint32_t SCHEMA_VERSION = 1;

    std::vector<ColliderDesc> colliders;
    std::vector<RigidBodyDesc> bodies;
    tether_math::Vec3 gravity{0.0f, -9.81f, 0.0f};
    IntegrationParametersDesc integration_parameters;
    std::vector<JointDesc> joints;

    BodyHandleMap body_handle_map;
    ColliderHandleMap collider_handle_map;
    JointHandleMap joint_handle_map;

    /// A missing or unreadable handle map is replaced with sequential
    /// fallbacks: engine handle bytes [i, 0] map to solver handle (i, 0).
    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
};

} // namespace tether_physics
