// tether_physics debug draw tests

#include <catch2/catch_test_macros.hpp>
#include <tether/physics/physics.hpp>
#include <tether/scene/drawing_context.hpp>

using namespace tether_physics;
using tether_math::Vec3;
using tether_scene::SceneDrawingContext;

namespace {

std::size_t lines_for(const SharedShape& shape) {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_static().build());
    REQUIRE(physics.add_collider(ColliderBuilder(shape).build(), body).has_value());

    SceneDrawingContext context;
    physics.draw(context);
    return context.lines().size();
}

} // namespace

TEST_CASE("Empty world draws nothing", "[physics][draw]") {
    Physics physics;
    SceneDrawingContext context;
    physics.draw(context);
    REQUIRE(context.lines().empty());
}

TEST_CASE("Every body draws its frame", "[physics][draw]") {
    Physics physics;
    physics.add_body(RigidBodyBuilder::new_dynamic().build());
    physics.add_body(RigidBodyBuilder::new_dynamic().translation(Vec3(1.0f, 0.0f, 0.0f)).build());

    SceneDrawingContext context;
    physics.draw(context);
    REQUIRE(context.lines().size() == 6);
}

TEST_CASE("Collider shapes draw their outlines", "[physics][draw]") {
    // Three lines of each count come from the body frame
    REQUIRE(lines_for(shapes::cuboid(Vec3(0.5f))) == 3 + 12);
    REQUIRE(lines_for(shapes::ball(0.5f)) == 3 + 190);
    REQUIRE(lines_for(shapes::cone(0.5f, 0.5f)) == 3 + 20);
    REQUIRE(lines_for(shapes::cylinder(0.5f, 0.5f)) == 3 + 50);
    REQUIRE(lines_for(shapes::round_cylinder(0.5f, 0.5f, 0.1f)) == 3 + 30);
    REQUIRE(lines_for(shapes::capsule(Vec3(0.0f), Vec3(0.0f, 1.0f, 0.0f), 0.25f)) == 3 + 230);
    REQUIRE(lines_for(shapes::segment(Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f))) == 3 + 1);
    REQUIRE(lines_for(shapes::triangle(Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f))) == 3 + 3);
    REQUIRE(lines_for(shapes::heightfield(2, 2, {0.0f, 1.0f, 0.0f, 0.0f}, Vec3(1.0f))) == 3);
}

TEST_CASE("Trimesh colliders draw every triangle in world space", "[physics][draw]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_static().translation(Vec3(0.0f, 0.0f, 10.0f)).build());
    SharedShape mesh = shapes::trimesh(
        {Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f), Vec3(1.0f, 0.0f, 1.0f)},
        {TriMeshShape::Triangle{0, 1, 2}, TriMeshShape::Triangle{1, 3, 2}});
    REQUIRE(physics.add_collider(ColliderBuilder(mesh).translation(Vec3(0.0f, 2.0f, 0.0f)).build(), body).has_value());

    SceneDrawingContext context;
    physics.draw(context);
    REQUIRE(context.lines().size() == 3 + 6);

    const tether_scene::Line& first_edge = context.lines()[3];
    REQUIRE(tether_math::approx_eq(first_edge.begin, Vec3(0.0f, 2.0f, 10.0f)));
    REQUIRE(first_edge.color == tether_scene::Color::opaque(200, 200, 200));
}

TEST_CASE("Ball outline is centered on the collider", "[physics][draw]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_static().translation(Vec3(5.0f, 0.0f, 0.0f)).build());
    REQUIRE(physics.add_collider(ColliderBuilder(shapes::ball(1.0f)).translation(Vec3(0.0f, 3.0f, 0.0f)).build(), body)
                .has_value());

    SceneDrawingContext context;
    physics.draw(context);

    const Vec3 center(5.0f, 3.0f, 0.0f);
    for (std::size_t i = 3; i < context.lines().size(); ++i) {
        const auto& line = context.lines()[i];
        REQUIRE(glm::length(line.begin - center) <= 1.0f + 1e-4f);
        REQUIRE(glm::length(line.end - center) <= 1.0f + 1e-4f);
    }
}
