// tether_scene Graph tests

#include <catch2/catch_test_macros.hpp>
#include <tether/scene/graph.hpp>

using namespace tether_scene;
using tether_math::Vec3;
using tether_math::Vec4;
using tether_math::approx_eq;

namespace {

const tether_math::Quat QUARTER_TURN_Y = glm::angleAxis(tether_math::consts::PI * 0.5f, tether_math::vec3::Y);

Vec3 apply(const tether_math::Mat4& m, const Vec3& p) {
    return Vec3(m * Vec4(p, 1.0f));
}

} // namespace

TEST_CASE("Graph hierarchy", "[scene][graph]") {
    Graph graph;
    REQUIRE(graph.len() == 1);
    REQUIRE(graph.node(graph.root())->name == "__ROOT__");

    NodeHandle a = graph.add_node(Node("A"));
    NodeHandle b = graph.add_node(Node("B"));
    REQUIRE(graph.node(a)->parent == graph.root());

    SECTION("linking") {
        REQUIRE(graph.link_nodes(b, a));
        REQUIRE(graph.node(b)->parent == a);
        REQUIRE(graph.node(a)->children.size() == 1);
        REQUIRE(graph.node(graph.root())->children.size() == 1);
    }

    SECTION("cycles are rejected") {
        REQUIRE(graph.link_nodes(b, a));
        REQUIRE_FALSE(graph.link_nodes(a, b));
        REQUIRE_FALSE(graph.link_nodes(a, a));
        REQUIRE(graph.node(a)->parent == graph.root());
    }

    SECTION("removal takes the subtree") {
        REQUIRE(graph.link_nodes(b, a));
        REQUIRE(graph.remove_node(a));
        REQUIRE_FALSE(graph.is_valid_handle(a));
        REQUIRE_FALSE(graph.is_valid_handle(b));
        REQUIRE(graph.len() == 1);
        REQUIRE_FALSE(graph.remove_node(graph.root()));
        REQUIRE_FALSE(graph.remove_node(a));
    }

    SECTION("lookup by name") {
        REQUIRE(graph.link_nodes(b, a));
        REQUIRE(graph.find_by_name(graph.root(), "B") == b);
        REQUIRE_FALSE(graph.find_by_name(b, "A").has_value());
    }
}

TEST_CASE("Graph global transforms", "[scene][graph]") {
    Graph graph;

    Node parent_node("Parent");
    parent_node.local_transform.position = Vec3(10.0f, 0.0f, 0.0f);
    parent_node.local_transform.rotation = QUARTER_TURN_Y;
    parent_node.local_transform.scale = Vec3(2.0f);
    NodeHandle parent = graph.add_node(std::move(parent_node));

    Node child_node("Child");
    child_node.local_transform.position = Vec3(1.0f, 0.0f, 0.0f);
    NodeHandle child = graph.add_node(std::move(child_node));
    REQUIRE(graph.link_nodes(child, parent));

    SECTION("full transform keeps scale") {
        // (1, 0, 0) scaled to (2, 0, 0), rotated to (0, 0, -2), moved by +10 x
        REQUIRE(approx_eq(apply(graph.global_transform(child), Vec3(0.0f)), Vec3(10.0f, 0.0f, -2.0f)));
    }

    SECTION("isometric transform drops scale") {
        REQUIRE(approx_eq(apply(graph.isometric_global_transform(child), Vec3(0.0f)), Vec3(10.0f, 0.0f, -1.0f)));

        auto [rotation, position] = graph.isometric_global_rotation_position(child);
        REQUIRE(approx_eq(position, Vec3(10.0f, 0.0f, -1.0f)));
        REQUIRE(approx_eq(rotation * tether_math::vec3::X, Vec3(0.0f, 0.0f, -1.0f)));
    }
}

TEST_CASE("Graph subtree copy", "[scene][graph]") {
    Graph source;
    NodeHandle root = source.add_node(Node("Prefab"));
    Node mesh_node("Body");
    mesh_node.mesh = Mesh{};
    mesh_node.local_transform.position = Vec3(0.0f, 1.0f, 0.0f);
    NodeHandle body = source.add_node(std::move(mesh_node));
    REQUIRE(source.link_nodes(body, root));

    Graph dest;
    dest.add_node(Node("Existing"));

    auto [copy_root, old_to_new] = source.copy_subtree(root, dest);
    REQUIRE(old_to_new.size() == 2);
    REQUIRE(old_to_new.at(root) == copy_root);
    REQUIRE(dest.len() == 4);

    NodeHandle copied_body = old_to_new.at(body);
    REQUIRE(dest.node(copied_body)->name == "Body");
    REQUIRE(dest.node(copied_body)->is_mesh());
    REQUIRE(dest.node(copied_body)->parent == copy_root);
    REQUIRE(dest.node(copy_root)->parent == dest.root());

    SECTION("copy into the same graph") {
        auto [again, remap] = dest.copy_subtree(copy_root, dest);
        REQUIRE(remap.size() == 2);
        REQUIRE(again != copy_root);
        REQUIRE(dest.len() == 6);
    }

    SECTION("invalid root copies nothing") {
        auto [nothing, empty] = source.copy_subtree(NodeHandle{}, dest);
        REQUIRE_FALSE(nothing.is_valid());
        REQUIRE(empty.empty());
    }
}
