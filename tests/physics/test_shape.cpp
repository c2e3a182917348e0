// tether_physics shape tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tether/physics/physics.hpp>
#include <tether/scene/graph.hpp>

#include "log_capture.hpp"

#include <stdexcept>

using namespace tether_physics;
using Catch::Matchers::WithinAbs;
using tether_math::Isometry;
using tether_math::Ray;
using tether_math::Vec3;
using tether_scene::Graph;
using tether_scene::NodeHandle;

namespace {

tether_scene::Mesh make_quad(float half) {
    tether_scene::SurfaceData surface;
    surface.positions = {
        Vec3(-half, 0.0f, -half),
        Vec3(half, 0.0f, -half),
        Vec3(half, 0.0f, half),
        Vec3(-half, 0.0f, half),
    };
    surface.triangles.push_back({0, 2, 1});
    surface.triangles.push_back({0, 3, 2});

    tether_scene::Mesh mesh;
    mesh.surfaces.push_back(std::move(surface));
    return mesh;
}

float cast(const SharedShape& shape, const Ray& ray, float max_toi = 100.0f) {
    auto hit = shape->cast_ray(Isometry::identity(), ray, max_toi);
    REQUIRE(hit.has_value());
    return hit->toi;
}

} // namespace

// =============================================================================
// make_trimesh
// =============================================================================

TEST_CASE("make_trimesh on a subtree without meshes returns a placeholder", "[physics][shape]") {
    Graph graph;
    NodeHandle empty = graph.add_node(tether_scene::Node("Empty"));
    NodeHandle child = graph.add_node(tether_scene::Node("Child"));
    REQUIRE(graph.link_nodes(child, empty));

    tether_test::LogCapture capture;
    SharedShape shape = Physics::make_trimesh(empty, graph);

    const auto* mesh = shape->as<TriMeshShape>();
    REQUIRE(mesh != nullptr);
    REQUIRE(mesh->triangle_count() == 1);
    REQUIRE(mesh->vertices().size() == 1);
    REQUIRE(mesh->vertices()[0] == Vec3(0.0f));
    REQUIRE(capture.count("warning") == 1);
    REQUIRE(capture.count("warning", "Failed to create triangle mesh collider for Empty, it has no vertices!") == 1);
}

TEST_CASE("make_trimesh bakes geometry relative to the root", "[physics][shape]") {
    Graph graph;

    tether_scene::Node root_node("Root");
    root_node.local_transform.position = Vec3(5.0f, 0.0f, 0.0f);
    root_node.local_transform.rotation = glm::angleAxis(tether_math::consts::PI * 0.5f, tether_math::vec3::Y);
    NodeHandle root = graph.add_node(std::move(root_node));

    tether_scene::Node mesh_node("Mesh");
    mesh_node.local_transform.position = Vec3(1.0f, 0.0f, 0.0f);
    mesh_node.mesh = make_quad(2.0f);
    NodeHandle child = graph.add_node(std::move(mesh_node));
    REQUIRE(graph.link_nodes(child, root));

    SECTION("Rotation and translation of the root are removed") {
        const auto* mesh = Physics::make_trimesh(root, graph)->as<TriMeshShape>();
        REQUIRE(mesh != nullptr);
        REQUIRE(mesh->triangle_count() == 2);

        auto aabb = mesh->local_aabb();
        REQUIRE(tether_math::approx_eq(aabb.min, Vec3(-1.0f, 0.0f, -2.0f), 1e-4f));
        REQUIRE(tether_math::approx_eq(aabb.max, Vec3(3.0f, 0.0f, 2.0f), 1e-4f));
    }

    SECTION("Scale of the root is kept") {
        graph.node_mut(root)->local_transform.scale = Vec3(2.0f);

        auto aabb = Physics::make_trimesh(root, graph)->as<TriMeshShape>()->local_aabb();
        REQUIRE(tether_math::approx_eq(aabb.min, Vec3(-2.0f, 0.0f, -4.0f), 1e-4f));
        REQUIRE(tether_math::approx_eq(aabb.max, Vec3(6.0f, 0.0f, 4.0f), 1e-4f));
    }
}

TEST_CASE("make_trimesh merges every mesh of the subtree", "[physics][shape]") {
    Graph graph;

    tether_scene::Node root_node("Root");
    root_node.mesh = make_quad(1.0f);
    NodeHandle root = graph.add_node(std::move(root_node));

    tether_scene::Node child_node("Child");
    child_node.local_transform.position = Vec3(0.0f, 4.0f, 0.0f);
    child_node.mesh = make_quad(1.0f);
    child_node.mesh->surfaces.push_back(make_quad(0.5f).surfaces.front());
    NodeHandle child = graph.add_node(std::move(child_node));
    REQUIRE(graph.link_nodes(child, root));

    const auto* mesh = Physics::make_trimesh(root, graph)->as<TriMeshShape>();
    REQUIRE(mesh->triangle_count() == 6);
    REQUIRE_THAT(mesh->local_aabb().max.y, WithinAbs(4.0f, 1e-5));
}

TEST_CASE("make_trimesh skips triangles with bad indices", "[physics][shape]") {
    Graph graph;

    tether_scene::Node node("Broken");
    node.mesh = make_quad(1.0f);
    node.mesh->surfaces.front().triangles.push_back({0, 1, 9});
    NodeHandle handle = graph.add_node(std::move(node));

    const auto* mesh = Physics::make_trimesh(handle, graph)->as<TriMeshShape>();
    REQUIRE(mesh->triangle_count() == 2);
}

TEST_CASE("mesh_to_trimesh creates a static body at the node", "[physics][shape]") {
    Graph graph;
    tether_scene::Node node("Floor");
    node.local_transform.position = Vec3(0.0f, -2.0f, 0.0f);
    node.local_transform.scale = Vec3(4.0f);
    node.mesh = make_quad(1.0f);
    NodeHandle floor = graph.add_node(std::move(node));

    Physics physics;
    RigidBodyHandle body = physics.mesh_to_trimesh(floor, graph);

    const RigidBody* floor_body = physics.body(body);
    REQUIRE(floor_body != nullptr);
    REQUIRE(floor_body->is_static());
    REQUIRE(floor_body->position().translation == Vec3(0.0f, -2.0f, 0.0f));
    REQUIRE(floor_body->colliders().size() == 1);

    const Collider* collider = physics.colliders().get(floor_body->colliders().front());
    REQUIRE(collider->friction() == 0.0f);
    REQUIRE_THAT(collider->shape().local_aabb().max.x, WithinAbs(4.0f, 1e-5));

    // A ray from above lands on the floor plane
    std::vector<Intersection> hits;
    physics.cast_ray(RayCastOptions{Ray(Vec3(0.5f, 10.0f, 0.5f), Vec3(0.0f, -1.0f, 0.0f)), 100.0f,
                                    InteractionGroups::all(), true},
                     hits);
    REQUIRE(hits.size() == 1);
    REQUIRE_THAT(hits[0].toi, WithinAbs(12.0f, 1e-4));
}

// =============================================================================
// Shape queries
// =============================================================================

TEST_CASE("Shapes report ray hits in local space", "[physics][shape]") {
    const Ray down(Vec3(0.0f, 10.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f));
    const Ray across(Vec3(-10.0f, 0.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f));

    REQUIRE_THAT(cast(shapes::ball(2.0f), across), WithinAbs(8.0f, 1e-4));
    REQUIRE_THAT(cast(shapes::cuboid(Vec3(1.0f, 3.0f, 1.0f)), down), WithinAbs(7.0f, 1e-4));
    REQUIRE_THAT(cast(shapes::cylinder(1.5f, 0.5f), down), WithinAbs(8.5f, 1e-4));
    REQUIRE_THAT(cast(shapes::cylinder(1.5f, 0.5f), across), WithinAbs(9.5f, 1e-4));
    // Radius at the cone middle is half the base radius
    REQUIRE_THAT(cast(shapes::cone(1.0f, 1.0f), Ray(Vec3(0.5f, 10.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f))),
                 WithinAbs(10.0f, 1e-4));
    REQUIRE_THAT(cast(shapes::capsule(Vec3(0.0f, -1.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f), 0.5f), down),
                 WithinAbs(8.5f, 1e-4));
    REQUIRE_THAT(cast(shapes::capsule(Vec3(0.0f, -1.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f), 0.5f), across),
                 WithinAbs(9.5f, 1e-4));
    REQUIRE_THAT(cast(shapes::triangle(Vec3(-1.0f, 0.0f, -1.0f), Vec3(1.0f, 0.0f, -1.0f), Vec3(0.0f, 0.0f, 1.0f)), down),
                 WithinAbs(10.0f, 1e-4));
    REQUIRE_THAT(cast(shapes::heightfield(2, 2, {0.0f, 1.0f, 0.0f, 0.0f}, Vec3(1.0f)),
                      Ray(Vec3(0.25f, 10.0f, -0.25f), Vec3(0.0f, -1.0f, 0.0f))), WithinAbs(10.0f, 1e-4));
}

TEST_CASE("Shapes honour max_toi", "[physics][shape]") {
    const Ray across(Vec3(-10.0f, 0.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f));

    REQUIRE_FALSE(shapes::ball(2.0f)->cast_ray(Isometry::identity(), across, 5.0f).has_value());
    REQUIRE_FALSE(shapes::cuboid(Vec3(1.0f))->cast_ray(Isometry::identity(), across, 8.0f).has_value());
    REQUIRE(shapes::cuboid(Vec3(1.0f))->cast_ray(Isometry::identity(), across, 9.0f).has_value());
}

TEST_CASE("Ray starting inside a ball hits at zero", "[physics][shape]") {
    auto hit = shapes::ball(1.0f)->cast_ray(Isometry::identity(), Ray(Vec3(0.2f, 0.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f)),
                                            10.0f);
    REQUIRE(hit.has_value());
    REQUIRE(hit->toi == 0.0f);
}

TEST_CASE("Posed shapes transform rays and normals", "[physics][shape]") {
    Isometry pose(Vec3(0.0f, 0.0f, 5.0f), glm::angleAxis(tether_math::consts::PI * 0.5f, tether_math::vec3::Y));
    auto hit = shapes::cuboid(Vec3(1.0f, 1.0f, 2.0f))->cast_ray(pose, Ray(Vec3(-10.0f, 0.0f, 5.0f), Vec3(1.0f, 0.0f, 0.0f)),
                                                               100.0f);
    REQUIRE(hit.has_value());
    // The long axis now lies along world X
    REQUIRE_THAT(hit->toi, WithinAbs(8.0f, 1e-4));
    REQUIRE(tether_math::approx_eq(hit->normal, Vec3(-1.0f, 0.0f, 0.0f), 1e-4f));
}

TEST_CASE("TriMeshShape reports the triangle that was hit", "[physics][shape]") {
    SharedShape shape = shapes::trimesh(
        {Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f), Vec3(0.0f, 2.0f, 0.0f), Vec3(1.0f, 2.0f, 0.0f),
         Vec3(0.0f, 2.0f, 1.0f)},
        {TriMeshShape::Triangle{0, 1, 2}, TriMeshShape::Triangle{3, 4, 5}});

    auto hit = shape->cast_ray(Isometry::identity(), Ray(Vec3(0.2f, 10.0f, 0.2f), Vec3(0.0f, -1.0f, 0.0f)), 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE_THAT(hit->toi, WithinAbs(8.0f, 1e-4));
    REQUIRE(hit->feature == FeatureId::face(1));
}

TEST_CASE("Shape constructors validate their input", "[physics][shape]") {
    REQUIRE_THROWS_AS(shapes::trimesh({Vec3(0.0f)}, {TriMeshShape::Triangle{0, 0, 3}}), std::out_of_range);
    REQUIRE_THROWS_AS(shapes::heightfield(1, 2, {0.0f, 0.0f}, Vec3(1.0f)), std::invalid_argument);
    REQUIRE_THROWS_AS(shapes::heightfield(2, 2, {0.0f}, Vec3(1.0f)), std::invalid_argument);
}

TEST_CASE("Shape type names", "[physics][shape]") {
    REQUIRE(std::string(shape_type_name(ShapeType::Ball)) == "Ball");
    REQUIRE(std::string(shape_type_name(ShapeType::HeightField)) == "HeightField");
    REQUIRE(shapes::round_cylinder(1.0f, 0.5f, 0.1f)->type() == ShapeType::RoundCylinder);
}
