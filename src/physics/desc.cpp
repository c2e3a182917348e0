/// @file desc.cpp
/// @brief Descriptor conversion and serialization

#include <tether/physics/desc.hpp>
#include <tether/math/serialize.hpp>

namespace tether_physics {

using tether_core::Err;
using tether_core::Ok;
using tether_core::RegionScope;
using tether_core::Result;
using tether_core::VisitError;
using tether_core::Visitor;
using tether_math::Vec3;

// =============================================================================
// Body Status
// =============================================================================

Result<BodyStatusDesc> body_status_desc_from_id(std::uint32_t id) {
    switch (id) {
        case 0: return BodyStatusDesc::Dynamic;
        case 1: return BodyStatusDesc::Static;
        case 2: return BodyStatusDesc::Kinematic;
        default:
            return Err<BodyStatusDesc>(VisitError::malformed_data(
                "Invalid body status id " + std::to_string(id) + "!"));
    }
}

BodyStatusDesc to_body_status_desc(BodyStatus status) {
    switch (status) {
        case BodyStatus::Dynamic: return BodyStatusDesc::Dynamic;
        case BodyStatus::Static: return BodyStatusDesc::Static;
        case BodyStatus::Kinematic: return BodyStatusDesc::Kinematic;
    }
    return BodyStatusDesc::Dynamic;
}

BodyStatus to_body_status(BodyStatusDesc status) {
    switch (status) {
        case BodyStatusDesc::Dynamic: return BodyStatus::Dynamic;
        case BodyStatusDesc::Static: return BodyStatus::Static;
        case BodyStatusDesc::Kinematic: return BodyStatus::Kinematic;
    }
    return BodyStatus::Dynamic;
}

// =============================================================================
// Shape Descriptors
// =============================================================================

Result<void> BallDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Radius", radius));
    return Ok();
}

Result<void> CylinderDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Radius", radius));
    TETHER_TRY(tether_core::visit(visitor, "HalfHeight", half_height));
    return Ok();
}

Result<void> RoundCylinderDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Radius", radius));
    TETHER_TRY(tether_core::visit(visitor, "HalfHeight", half_height));
    TETHER_TRY(tether_core::visit(visitor, "BorderRadius", border_radius));
    return Ok();
}

Result<void> ConeDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Radius", radius));
    TETHER_TRY(tether_core::visit(visitor, "HalfHeight", half_height));
    return Ok();
}

Result<void> CuboidDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "HalfExtents", half_extents));
    return Ok();
}

Result<void> CapsuleDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Begin", begin));
    TETHER_TRY(tether_core::visit(visitor, "End", end));
    TETHER_TRY(tether_core::visit(visitor, "Radius", radius));
    return Ok();
}

Result<void> SegmentDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Begin", begin));
    TETHER_TRY(tether_core::visit(visitor, "End", end));
    return Ok();
}

Result<void> TriangleDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "A", a));
    TETHER_TRY(tether_core::visit(visitor, "B", b));
    TETHER_TRY(tether_core::visit(visitor, "C", c));
    return Ok();
}

Result<void> TrimeshDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();
    return Ok();
}

Result<void> HeightfieldDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();
    return Ok();
}

// =============================================================================
// ColliderShapeDesc
// =============================================================================

Result<ColliderShapeDesc> ColliderShapeDesc::from_id(std::uint32_t id) {
    auto value = variant_from_index<Variant>(id);
    if (!value) {
        return Err<ColliderShapeDesc>(VisitError::malformed_data(
            "Invalid collider shape desc id " + std::to_string(id) + "!"));
    }
    ColliderShapeDesc desc;
    desc.value = std::move(*value);
    return desc;
}

ColliderShapeDesc ColliderShapeDesc::from_collider_shape(const IShape& shape) {
    switch (shape.type()) {
        case ShapeType::Ball: {
            const auto* ball = shape.as<BallShape>();
            return BallDesc{.radius = ball->radius()};
        }
        case ShapeType::Cylinder: {
            const auto* cylinder = shape.as<CylinderShape>();
            return CylinderDesc{.half_height = cylinder->half_height(), .radius = cylinder->radius()};
        }
        case ShapeType::RoundCylinder: {
            const auto* round = shape.as<RoundCylinderShape>();
            return RoundCylinderDesc{
                .half_height = round->half_height(),
                .radius = round->radius(),
                .border_radius = round->border_radius(),
            };
        }
        case ShapeType::Cone: {
            const auto* cone = shape.as<ConeShape>();
            return ConeDesc{.half_height = cone->half_height(), .radius = cone->radius()};
        }
        case ShapeType::Cuboid:
            return CuboidDesc{.half_extents = shape.as<CuboidShape>()->half_extents()};
        case ShapeType::Capsule: {
            const auto* capsule = shape.as<CapsuleShape>();
            return CapsuleDesc{.begin = capsule->a(), .end = capsule->b(), .radius = capsule->radius()};
        }
        case ShapeType::Segment: {
            const auto* segment = shape.as<SegmentShape>();
            return SegmentDesc{.begin = segment->a(), .end = segment->b()};
        }
        case ShapeType::Triangle: {
            const auto* triangle = shape.as<TriangleShape>();
            return TriangleDesc{.a = triangle->a(), .b = triangle->b(), .c = triangle->c()};
        }
        case ShapeType::TriMesh:
            return TrimeshDesc{};
        case ShapeType::HeightField:
            return HeightfieldDesc{};
    }
    return BallDesc{};
}

SharedShape ColliderShapeDesc::into_collider_shape() const {
    struct Converter {
        SharedShape operator()(const BallDesc& d) const { return shapes::ball(d.radius); }
        SharedShape operator()(const CylinderDesc& d) const { return shapes::cylinder(d.half_height, d.radius); }
        SharedShape operator()(const RoundCylinderDesc& d) const {
            return shapes::round_cylinder(d.half_height, d.radius, d.border_radius);
        }
        SharedShape operator()(const ConeDesc& d) const { return shapes::cone(d.half_height, d.radius); }
        SharedShape operator()(const CuboidDesc& d) const { return shapes::cuboid(d.half_extents); }
        SharedShape operator()(const CapsuleDesc& d) const { return shapes::capsule(d.begin, d.end, d.radius); }
        SharedShape operator()(const SegmentDesc& d) const { return shapes::segment(d.begin, d.end); }
        SharedShape operator()(const TriangleDesc& d) const { return shapes::triangle(d.a, d.b, d.c); }

        // Real geometry is restored from the bound mesh node
        SharedShape operator()(const TrimeshDesc&) const {
            return shapes::trimesh({Vec3(0.0f, 0.0f, 1.0f), Vec3(1.0f, 0.0f, 1.0f), Vec3(1.0f, 0.0f, 0.0f)},
                                   {{0, 1, 2}});
        }

        SharedShape operator()(const HeightfieldDesc&) const {
            return shapes::heightfield(2, 2, {0.0f, 1.0f, 0.0f, 0.0f}, Vec3(1.0f));
        }
    };
    return std::visit(Converter{}, value);
}

Result<void> ColliderShapeDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    std::uint32_t type_id = visitor.is_reading() ? 0 : id();
    TETHER_TRY(visitor.visit_primitive("Id", type_id));
    if (visitor.is_reading()) {
        auto desc = from_id(type_id);
        if (desc.is_err()) {
            return desc.error();
        }
        value = std::move(desc.value().value);
    }

    return std::visit([&](auto& inner) { return inner.visit(name, visitor); }, value);
}

// =============================================================================
// ColliderDesc
// =============================================================================

ColliderDesc ColliderDesc::from_collider(const Collider& collider, const BodyHandleMap& body_map) {
    ColliderDesc desc;
    desc.shape = ColliderShapeDesc::from_collider_shape(collider.shape());
    desc.parent = body_map.key_of(collider.parent()).value_or(RigidBodyHandle{});
    desc.friction = collider.friction();
    desc.restitution = collider.restitution();
    desc.is_sensor = collider.is_sensor();
    desc.translation = collider.position_wrt_parent().translation;
    desc.rotation = collider.position_wrt_parent().rotation;
    desc.collision_groups = collider.collision_groups().bits;
    desc.solver_groups = collider.solver_groups().bits;
    desc.density = collider.density();
    return desc;
}

Collider ColliderDesc::convert_to_collider() const {
    ColliderBuilder builder(shape.into_collider_shape());
    builder.friction(friction)
        .restitution(restitution)
        .sensor(is_sensor)
        .position_wrt_parent(tether_math::Isometry{translation, rotation})
        .collision_groups(InteractionGroups{collision_groups})
        .solver_groups(InteractionGroups{solver_groups});
    if (density) {
        builder.density(*density);
    }
    return builder.build();
}

Result<void> ColliderDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Shape", shape));
    TETHER_TRY(tether_core::visit(visitor, "Parent", parent));
    TETHER_TRY(tether_core::visit(visitor, "Friction", friction));
    TETHER_TRY(tether_core::visit(visitor, "Restitution", restitution));
    TETHER_TRY(tether_core::visit(visitor, "IsSensor", is_sensor));
    TETHER_TRY(tether_core::visit(visitor, "Translation", translation));
    TETHER_TRY(tether_core::visit(visitor, "Rotation", rotation));
    TETHER_TRY(tether_core::visit(visitor, "CollisionGroups", collision_groups));
    TETHER_TRY(tether_core::visit(visitor, "SolverGroups", solver_groups));
    TETHER_TRY(tether_core::visit(visitor, "Density", density));
    return Ok();
}

// =============================================================================
// RigidBodyDesc
// =============================================================================

RigidBodyDesc RigidBodyDesc::from_body(const RigidBody& body, const ColliderHandleMap& collider_map) {
    RigidBodyDesc desc;
    desc.position = body.position().translation;
    desc.rotation = body.position().rotation;
    desc.lin_vel = body.linvel();
    desc.ang_vel = body.angvel();
    desc.sleeping = body.is_sleeping();
    desc.status = to_body_status_desc(body.body_status());
    desc.mass = body.mass();

    desc.colliders.reserve(body.colliders().size());
    for (RawColliderHandle raw : body.colliders()) {
        if (auto handle = collider_map.key_of(raw)) {
            desc.colliders.push_back(*handle);
        }
    }

    const auto& locks = body.is_rotation_locked();
    desc.x_rotation_locked = locks[0];
    desc.y_rotation_locked = locks[1];
    desc.z_rotation_locked = locks[2];
    desc.translation_locked = body.is_translation_locked();
    return desc;
}

RigidBody RigidBodyDesc::convert_to_body() const {
    RigidBodyBuilder builder(to_body_status(status));
    builder.position(pose())
        .linvel(lin_vel)
        .angvel(ang_vel)
        .additional_mass(mass)
        .restrict_rotations(x_rotation_locked, y_rotation_locked, z_rotation_locked)
        .sleeping(sleeping);
    if (translation_locked) {
        builder.lock_translations();
    }
    return builder.build();
}

Result<void> RigidBodyDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Position", position));
    TETHER_TRY(tether_core::visit(visitor, "Rotation", rotation));
    TETHER_TRY(tether_core::visit(visitor, "LinVel", lin_vel));
    TETHER_TRY(tether_core::visit(visitor, "AngVel", ang_vel));
    TETHER_TRY(tether_core::visit(visitor, "Sleeping", sleeping));

    auto status_id = static_cast<std::uint32_t>(status);
    TETHER_TRY(visitor.visit_primitive("Status", status_id));
    if (visitor.is_reading()) {
        auto parsed = body_status_desc_from_id(status_id);
        if (parsed.is_err()) {
            return parsed.error();
        }
        status = parsed.value();
    }

    TETHER_TRY(tether_core::visit(visitor, "Colliders", colliders));
    TETHER_TRY(tether_core::visit(visitor, "Mass", mass));
    TETHER_TRY(tether_core::visit(visitor, "XRotationLocked", x_rotation_locked));
    TETHER_TRY(tether_core::visit(visitor, "YRotationLocked", y_rotation_locked));
    TETHER_TRY(tether_core::visit(visitor, "ZRotationLocked", z_rotation_locked));
    TETHER_TRY(tether_core::visit(visitor, "TranslationLocked", translation_locked));
    return Ok();
}

// =============================================================================
// Joint Descriptors
// =============================================================================

Result<void> BallJointDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor1", local_anchor1));
    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor2", local_anchor2));
    return Ok();
}

Result<void> FixedJointDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor1Translation", local_anchor1_translation));
    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor1Rotation", local_anchor1_rotation));
    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor2Translation", local_anchor2_translation));
    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor2Rotation", local_anchor2_rotation));
    return Ok();
}

Result<void> PrismaticJointDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor1", local_anchor1));
    TETHER_TRY(tether_core::visit(visitor, "LocalAxis1", local_axis1));
    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor2", local_anchor2));
    TETHER_TRY(tether_core::visit(visitor, "LocalAxis2", local_axis2));
    return Ok();
}

Result<void> RevoluteJointDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor1", local_anchor1));
    TETHER_TRY(tether_core::visit(visitor, "LocalAxis1", local_axis1));
    TETHER_TRY(tether_core::visit(visitor, "LocalAnchor2", local_anchor2));
    TETHER_TRY(tether_core::visit(visitor, "LocalAxis2", local_axis2));
    return Ok();
}

Result<JointParamsDesc> JointParamsDesc::from_id(std::uint32_t id) {
    auto value = variant_from_index<Variant>(id);
    if (!value) {
        return Err<JointParamsDesc>(VisitError::malformed_data(
            "Invalid joint param desc id " + std::to_string(id) + "!"));
    }
    JointParamsDesc desc;
    desc.value = std::move(*value);
    return desc;
}

JointParamsDesc JointParamsDesc::from_params(const JointParams& params) {
    struct Converter {
        JointParamsDesc operator()(const BallJoint& j) const {
            return BallJointDesc{.local_anchor1 = j.local_anchor1, .local_anchor2 = j.local_anchor2};
        }
        JointParamsDesc operator()(const FixedJoint& j) const {
            return FixedJointDesc{
                .local_anchor1_translation = j.local_anchor1.translation,
                .local_anchor1_rotation = j.local_anchor1.rotation,
                .local_anchor2_translation = j.local_anchor2.translation,
                .local_anchor2_rotation = j.local_anchor2.rotation,
            };
        }
        JointParamsDesc operator()(const PrismaticJoint& j) const {
            return PrismaticJointDesc{
                .local_anchor1 = j.local_anchor1,
                .local_axis1 = j.local_axis1,
                .local_anchor2 = j.local_anchor2,
                .local_axis2 = j.local_axis2,
            };
        }
        JointParamsDesc operator()(const RevoluteJoint& j) const {
            return RevoluteJointDesc{
                .local_anchor1 = j.local_anchor1,
                .local_axis1 = j.local_axis1,
                .local_anchor2 = j.local_anchor2,
                .local_axis2 = j.local_axis2,
            };
        }
    };
    return std::visit(Converter{}, params);
}

JointParams JointParamsDesc::into_params() const {
    struct Converter {
        JointParams operator()(const BallJointDesc& d) const { return BallJoint{d.local_anchor1, d.local_anchor2}; }
        JointParams operator()(const FixedJointDesc& d) const {
            return FixedJoint{
                tether_math::Isometry{d.local_anchor1_translation, d.local_anchor1_rotation},
                tether_math::Isometry{d.local_anchor2_translation, d.local_anchor2_rotation},
            };
        }
        JointParams operator()(const PrismaticJointDesc& d) const {
            return PrismaticJoint(d.local_anchor1, d.local_axis1, d.local_anchor2, d.local_axis2);
        }
        JointParams operator()(const RevoluteJointDesc& d) const {
            return RevoluteJoint(d.local_anchor1, d.local_axis1, d.local_anchor2, d.local_axis2);
        }
    };
    return std::visit(Converter{}, value);
}

Result<void> JointParamsDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    std::uint32_t type_id = id();
    TETHER_TRY(visitor.visit_primitive("Id", type_id));
    if (visitor.is_reading()) {
        auto desc = from_id(type_id);
        if (desc.is_err()) {
            return desc.error();
        }
        value = std::move(desc.value().value);
    }

    return std::visit([&](auto& inner) { return inner.visit("Data", visitor); }, value);
}

JointDesc JointDesc::from_joint(const Joint& joint, const BodyHandleMap& body_map) {
    JointDesc desc;
    desc.body1 = body_map.key_of(joint.body1()).value_or(RigidBodyHandle{});
    desc.body2 = body_map.key_of(joint.body2()).value_or(RigidBodyHandle{});
    desc.params = JointParamsDesc::from_params(joint.params());
    return desc;
}

Result<void> JointDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Body1", body1));
    TETHER_TRY(tether_core::visit(visitor, "Body2", body2));
    TETHER_TRY(tether_core::visit(visitor, "Params", params));
    return Ok();
}

// =============================================================================
// IntegrationParametersDesc
// =============================================================================

IntegrationParametersDesc::IntegrationParametersDesc(const IntegrationParameters& params)
    : dt(params.dt)
    , min_ccd_dt(params.min_ccd_dt)
    , erp(params.erp)
    , joint_erp(params.joint_erp)
    , warmstart_coeff(params.warmstart_coeff)
    , warmstart_correction_slope(params.warmstart_correction_slope)
    , velocity_solve_fraction(params.velocity_solve_fraction)
    , velocity_based_erp(params.velocity_based_erp)
    , allowed_linear_error(params.allowed_linear_error)
    , max_linear_correction(params.max_linear_correction)
    , max_angular_correction(params.max_angular_correction)
    , max_velocity_iterations(params.max_velocity_iterations)
    , max_position_iterations(params.max_position_iterations)
    , min_island_size(params.min_island_size)
    , max_ccd_substeps(params.max_ccd_substeps)
{}

IntegrationParameters IntegrationParametersDesc::into_parameters() const {
    IntegrationParameters params;
    params.dt = dt;
    params.min_ccd_dt = min_ccd_dt;
    params.erp = erp;
    params.joint_erp = joint_erp;
    params.warmstart_coeff = warmstart_coeff;
    params.warmstart_correction_slope = warmstart_correction_slope;
    params.velocity_solve_fraction = velocity_solve_fraction;
    params.velocity_based_erp = velocity_based_erp;
    params.allowed_linear_error = allowed_linear_error;
    params.max_linear_correction = max_linear_correction;
    params.max_angular_correction = max_angular_correction;
    params.max_velocity_iterations = max_velocity_iterations;
    params.max_position_iterations = max_position_iterations;
    params.min_island_size = min_island_size;
    params.max_ccd_substeps = max_ccd_substeps;
    return params;
}

Result<void> IntegrationParametersDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "DeltaTime", dt));
    TETHER_TRY(tether_core::visit(visitor, "MinCcdDt", min_ccd_dt));
    TETHER_TRY(tether_core::visit(visitor, "Erp", erp));
    TETHER_TRY(tether_core::visit(visitor, "JointErp", joint_erp));
    TETHER_TRY(tether_core::visit(visitor, "WarmstartCoeff", warmstart_coeff));
    TETHER_TRY(tether_core::visit(visitor, "WarmstartCorrectionSlope", warmstart_correction_slope));
    TETHER_TRY(tether_core::visit(visitor, "VelocitySolveFraction", velocity_solve_fraction));
    TETHER_TRY(tether_core::visit(visitor, "VelocityBasedErp", velocity_based_erp));
    TETHER_TRY(tether_core::visit(visitor, "AllowedLinearError", allowed_linear_error));
    TETHER_TRY(tether_core::visit(visitor, "MaxLinearCorrection", max_linear_correction));
    TETHER_TRY(tether_core::visit(visitor, "MaxAngularCorrection", max_angular_correction));
    TETHER_TRY(tether_core::visit(visitor, "MaxVelocityIterations", max_velocity_iterations));
    TETHER_TRY(tether_core::visit(visitor, "MaxPositionIterations", max_position_iterations));
    TETHER_TRY(tether_core::visit(visitor, "MinIslandSize", min_island_size));
    TETHER_TRY(tether_core::visit(visitor, "MaxCcdSubsteps", max_ccd_substeps));

    if (visitor.is_reading() && min_island_size == 0) {
        min_island_size = 128;
    }
    return Ok();
}

// =============================================================================
// PhysicsDesc
// =============================================================================

namespace {

/// Handle map stored by a build that predates handle maps
template<typename EngineH, typename RawH>
tether_core::BiDirHashMap<EngineH, RawH> sequential_handle_map(std::size_t count) {
    tether_core::BiDirHashMap<EngineH, RawH> map;
    for (std::size_t i = 0; i < count; ++i) {
        map.insert(EngineH{tether_core::Uuid::from_u64_pair(i, 0)},
                   RawH::from_raw_parts(static_cast<std::uint32_t>(i), 0));
    }
    return map;
}

/// Reading falls back to the sequential map instead of failing
template<typename EngineH, typename RawH>
Result<void> visit_handle_map(Visitor& visitor, const std::string& name,
                              tether_core::BiDirHashMap<EngineH, RawH>& map, std::size_t count) {
    auto result = tether_core::visit(visitor, name, map);
    if (result.is_err() && visitor.is_reading()) {
        map = sequential_handle_map<EngineH, RawH>(count);
        return Ok();
    }
    return result;
}

} // namespace

Result<void> PhysicsDesc::visit(const std::string& name, Visitor& visitor) {
    RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    std::uint32_t version = SCHEMA_VERSION;
    if (visitor.is_reading()) {
        version = 0;
        if (visitor.has_field("SchemaVersion")) {
            TETHER_TRY(visitor.visit_primitive("SchemaVersion", version));
        }
        if (version > SCHEMA_VERSION) {
            return Err(VisitError::unsupported_version(version, SCHEMA_VERSION));
        }
    } else {
        TETHER_TRY(visitor.visit_primitive("SchemaVersion", version));
    }

    TETHER_TRY(tether_core::visit(visitor, "IntegrationParameters", integration_parameters));
    TETHER_TRY(tether_core::visit(visitor, "Gravity", gravity));
    TETHER_TRY(tether_core::visit(visitor, "Colliders", colliders));
    TETHER_TRY(tether_core::visit(visitor, "Bodies", bodies));
    TETHER_TRY(tether_core::visit(visitor, "Joints", joints));

    TETHER_TRY(visit_handle_map(visitor, "BodyHandleMap", body_handle_map, bodies.size()));
    TETHER_TRY(visit_handle_map(visitor, "ColliderHandleMap", collider_handle_map, colliders.size()));
    TETHER_TRY(visit_handle_map(visitor, "JointHandleMap", joint_handle_map, joints.size()));
    return Ok();
}

} // namespace tether_physics
