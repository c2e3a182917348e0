// tether_physics descriptor tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tether/physics/physics.hpp>

using namespace tether_physics;
using namespace tether_core;
using Catch::Matchers::WithinAbs;
using tether_math::Vec3;

namespace {

Physics make_world() {
    Physics physics;
    physics.set_gravity(Vec3(0.0f, -3.0f, 0.0f));

    RigidBodyHandle ground = physics.add_body(RigidBodyBuilder::new_static().build());
    REQUIRE(physics.add_collider(ColliderBuilder(shapes::cuboid(Vec3(5.0f, 0.1f, 5.0f))).friction(0.8f).build(),
                                 ground).has_value());

    RigidBodyHandle crate = physics.add_body(RigidBodyBuilder::new_dynamic()
        .translation(Vec3(0.0f, 2.0f, 0.0f))
        .linvel(Vec3(1.0f, 0.0f, 0.0f))
        .restrict_rotations(true, false, true)
        .build());
    REQUIRE(physics.add_collider(ColliderBuilder(shapes::capsule(Vec3(0.0f, -0.5f, 0.0f), Vec3(0.0f, 0.5f, 0.0f), 0.25f))
                                     .density(2.0f)
                                     .collision_groups(InteractionGroups::with(0x1, 0x3))
                                     .build(),
                                 crate).has_value());

    REQUIRE(physics.add_joint(ground, crate, RevoluteJoint(Vec3(0.0f), Vec3(0.0f, 0.0f, 1.0f),
                                                           Vec3(0.0f, -1.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f)))
                .has_value());
    return physics;
}

/// Writes a tree with only the given shape id under "Shape"
Visitor shape_with_id(std::uint32_t id) {
    Visitor visitor = Visitor::writer();
    {
        RegionScope region(visitor, "Shape");
        REQUIRE(region.ok());
        REQUIRE(visitor.visit_primitive("Id", id).is_ok());
    }
    visitor.rewind_for_reading();
    return visitor;
}

} // namespace

TEST_CASE("ColliderShapeDesc rejects unknown ids", "[physics][desc]") {
    Visitor visitor = shape_with_id(42);

    ColliderShapeDesc desc;
    auto result = desc.visit("Shape", visitor);
    REQUIRE(result.is_err());
    REQUIRE(result.error().message().find("Invalid collider shape desc id 42!") != std::string::npos);
    REQUIRE(result.error().as<VisitError>()->kind == VisitError::Kind::MalformedData);
}

TEST_CASE("ColliderShapeDesc id out of u32 range is not read as a ball", "[physics][desc]") {
    auto loaded = Visitor::from_json(
        R"({"fields":{},"regions":{"Shape":{"fields":{"Id":{"u32":4294967296}},"regions":{}}}})");
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().as<VisitError>()->kind == VisitError::Kind::MalformedData);

    auto in_range = Visitor::from_json(
        R"({"fields":{},"regions":{"Shape":{"fields":{"Id":{"u32":4294967295}},"regions":{}}}})");
    REQUIRE(in_range.is_ok());
    ColliderShapeDesc desc;
    REQUIRE(desc.visit("Shape", in_range.value()).is_err());
}

TEST_CASE("JointParamsDesc rejects unknown ids", "[physics][desc]") {
    Visitor visitor = Visitor::writer();
    {
        RegionScope region(visitor, "Params");
        REQUIRE(region.ok());
        std::uint32_t id = 9;
        REQUIRE(visitor.visit_primitive("Id", id).is_ok());
    }
    visitor.rewind_for_reading();

    JointParamsDesc desc;
    auto result = desc.visit("Params", visitor);
    REQUIRE(result.is_err());
    REQUIRE(result.error().message().find("Invalid joint param desc id 9!") != std::string::npos);
}

TEST_CASE("RigidBodyDesc rejects unknown status ids", "[physics][desc]") {
    Visitor visitor = Visitor::writer();
    RigidBodyDesc body;
    REQUIRE(body.visit("Body", visitor).is_ok());

    // Patch the stored status
    {
        RegionScope region(visitor, "Body");
        REQUIRE(region.ok());
        std::uint32_t status = 7;
        REQUIRE(visitor.visit_primitive("Status", status).is_ok());
    }
    visitor.rewind_for_reading();

    RigidBodyDesc loaded;
    auto result = loaded.visit("Body", visitor);
    REQUIRE(result.is_err());
    REQUIRE(result.error().message().find("Invalid body status id 7!") != std::string::npos);
}

TEST_CASE("Trimesh and heightfield descriptors restore placeholders", "[physics][desc]") {
    SECTION("Trimesh") {
        SharedShape shape = ColliderShapeDesc(TrimeshDesc{}).into_collider_shape();
        const auto* mesh = shape->as<TriMeshShape>();
        REQUIRE(mesh != nullptr);
        REQUIRE(mesh->triangle_count() == 1);

        auto triangle = mesh->triangle(0);
        REQUIRE(triangle[0] == Vec3(0.0f, 0.0f, 1.0f));
        REQUIRE(triangle[1] == Vec3(1.0f, 0.0f, 1.0f));
        REQUIRE(triangle[2] == Vec3(1.0f, 0.0f, 0.0f));
    }

    SECTION("Heightfield") {
        SharedShape shape = ColliderShapeDesc(HeightfieldDesc{}).into_collider_shape();
        const auto* field = shape->as<HeightFieldShape>();
        REQUIRE(field != nullptr);
        REQUIRE(field->nrows() == 2);
        REQUIRE(field->ncols() == 2);
        REQUIRE(field->heights() == std::vector<float>{0.0f, 1.0f, 0.0f, 0.0f});
        REQUIRE(field->scale() == Vec3(1.0f));
    }

    SECTION("Live geometry is not stored") {
        SharedShape mesh = shapes::trimesh({Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f)},
                                           {TriMeshShape::Triangle{0, 1, 2}});
        REQUIRE(ColliderShapeDesc::from_collider_shape(*mesh).is_trimesh());
    }
}

TEST_CASE("ColliderShapeDesc keeps primitive parameters", "[physics][desc]") {
    ColliderShapeDesc cone = ColliderShapeDesc::from_collider_shape(*shapes::cone(0.75f, 0.3f));
    REQUIRE(cone.id() == ConeDesc::ID);
    REQUIRE(cone.as<ConeDesc>()->half_height == 0.75f);
    REQUIRE(cone.as<ConeDesc>()->radius == 0.3f);

    SharedShape rebuilt = cone.into_collider_shape();
    REQUIRE(rebuilt->type() == ShapeType::Cone);
    REQUIRE(rebuilt->as<ConeShape>()->half_height() == 0.75f);
}

TEST_CASE("PhysicsDesc rejects newer schema versions", "[physics][desc]") {
    Visitor visitor = Visitor::writer();
    {
        RegionScope region(visitor, "Desc");
        REQUIRE(region.ok());
        std::uint32_t version = PhysicsDesc::SCHEMA_VERSION + 1;
        REQUIRE(visitor.visit_primitive("SchemaVersion", version).is_ok());
    }
    visitor.rewind_for_reading();

    PhysicsDesc desc;
    auto result = desc.visit("Desc", visitor);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::IncompatibleVersion);
    REQUIRE(result.error().as<VisitError>()->kind == VisitError::Kind::UnsupportedVersion);
}

TEST_CASE("PhysicsDesc without version or handle maps uses sequential maps", "[physics][desc]") {
    Visitor visitor = Visitor::writer();
    {
        RegionScope region(visitor, "Desc");
        REQUIRE(region.ok());

        IntegrationParametersDesc params;
        Vec3 gravity(0.0f, -1.0f, 0.0f);
        std::vector<ColliderDesc> colliders(1);
        std::vector<RigidBodyDesc> bodies(2);
        std::vector<JointDesc> joints;
        REQUIRE(params.visit("IntegrationParameters", visitor).is_ok());
        REQUIRE(tether_core::visit(visitor, "Gravity", gravity).is_ok());
        REQUIRE(tether_core::visit(visitor, "Colliders", colliders).is_ok());
        REQUIRE(tether_core::visit(visitor, "Bodies", bodies).is_ok());
        REQUIRE(tether_core::visit(visitor, "Joints", joints).is_ok());
    }
    visitor.rewind_for_reading();

    PhysicsDesc desc;
    REQUIRE(desc.visit("Desc", visitor).is_ok());
    REQUIRE(desc.gravity == Vec3(0.0f, -1.0f, 0.0f));
    REQUIRE(desc.bodies.size() == 2);
    REQUIRE(desc.body_handle_map.len() == 2);
    REQUIRE(desc.collider_handle_map.len() == 1);
    REQUIRE(desc.joint_handle_map.len() == 0);

    for (std::uint32_t i = 0; i < 2; ++i) {
        auto raw = desc.body_handle_map.value_of(RigidBodyHandle{Uuid::from_u64_pair(i, 0)});
        REQUIRE(raw.has_value());
        REQUIRE(*raw == RawBodyHandle::from_raw_parts(i, 0));
    }
}

TEST_CASE("IntegrationParametersDesc restores zero island size", "[physics][desc]") {
    IntegrationParametersDesc params;
    params.min_island_size = 0;

    Visitor visitor = Visitor::writer();
    REQUIRE(params.visit("Params", visitor).is_ok());
    visitor.rewind_for_reading();

    IntegrationParametersDesc loaded;
    REQUIRE(loaded.visit("Params", visitor).is_ok());
    REQUIRE(loaded.min_island_size == 128);
}

TEST_CASE("IntegrationParametersDesc mirrors live parameters", "[physics][desc]") {
    IntegrationParameters live;
    live.dt = 0.01f;
    live.max_velocity_iterations = 8;

    IntegrationParametersDesc desc(live);
    REQUIRE(desc.dt == 0.01f);
    REQUIRE(desc.max_velocity_iterations == 8);
    REQUIRE(desc.into_parameters() == live);
}

TEST_CASE("generate_desc captures the live world", "[physics][desc]") {
    Physics physics = make_world();
    PhysicsDesc desc = physics.generate_desc();

    REQUIRE(desc.gravity == Vec3(0.0f, -3.0f, 0.0f));
    REQUIRE(desc.bodies.size() == 2);
    REQUIRE(desc.colliders.size() == 2);
    REQUIRE(desc.joints.size() == 1);

    // Solver handles are dense in descriptor order
    for (std::size_t i = 0; i < desc.bodies.size(); ++i) {
        auto engine = desc.body_handle_map.key_of(RawBodyHandle::from_raw_parts(static_cast<std::uint32_t>(i), 0));
        REQUIRE(engine.has_value());
        REQUIRE(physics.contains_body(*engine));
    }

    const RigidBodyDesc* dynamic_body = nullptr;
    for (const auto& body : desc.bodies) {
        if (body.status == BodyStatusDesc::Dynamic) {
            dynamic_body = &body;
        }
    }
    REQUIRE(dynamic_body != nullptr);
    REQUIRE(dynamic_body->position == Vec3(0.0f, 2.0f, 0.0f));
    REQUIRE(dynamic_body->lin_vel == Vec3(1.0f, 0.0f, 0.0f));
    REQUIRE(dynamic_body->x_rotation_locked);
    REQUIRE_FALSE(dynamic_body->y_rotation_locked);
    REQUIRE(dynamic_body->colliders.size() == 1);

    REQUIRE(desc.joints[0].params.id() == RevoluteJointDesc::ID);
    REQUIRE(physics.contains_body(desc.joints[0].body1));
}

TEST_CASE("PhysicsDesc re-serializes byte-identically", "[physics][desc]") {
    Physics physics = make_world();
    PhysicsDesc desc = physics.generate_desc();

    Visitor first = Visitor::writer();
    REQUIRE(desc.visit("Desc", first).is_ok());
    std::vector<std::uint8_t> first_bytes = first.to_binary();

    auto reader = Visitor::from_binary(first_bytes);
    REQUIRE(reader.is_ok());
    PhysicsDesc loaded;
    REQUIRE(loaded.visit("Desc", reader.value()).is_ok());

    Visitor second = Visitor::writer();
    REQUIRE(loaded.visit("Desc", second).is_ok());
    REQUIRE(second.to_binary() == first_bytes);

    REQUIRE(loaded.colliders.size() == 2);
    bool found_capsule = false;
    for (const auto& collider : loaded.colliders) {
        if (const auto* capsule = collider.shape.as<CapsuleDesc>()) {
            found_capsule = true;
            REQUIRE_THAT(capsule->radius, WithinAbs(0.25f, 1e-6));
            REQUIRE(collider.density == std::optional<float>(2.0f));
            REQUIRE(collider.collision_groups == InteractionGroups::with(0x1, 0x3).bits);
        }
    }
    REQUIRE(found_capsule);
}
