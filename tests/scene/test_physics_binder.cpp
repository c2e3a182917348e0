// tether_scene PhysicsBinder tests

#include <catch2/catch_test_macros.hpp>
#include <tether/scene/physics_binder.hpp>

using namespace tether_scene;
using tether_physics::RigidBodyHandle;

TEST_CASE("PhysicsBinder binds one node to one body", "[scene][binder]") {
    PhysicsBinder binder;
    NodeHandle node_a = NodeHandle::from_raw_parts(1, 0);
    NodeHandle node_b = NodeHandle::from_raw_parts(2, 0);
    RigidBodyHandle body_a = RigidBodyHandle::generate();
    RigidBodyHandle body_b = RigidBodyHandle::generate();

    REQUIRE_FALSE(binder.bind(node_a, body_a).has_value());
    REQUIRE(binder.node_of(body_a) == node_a);
    REQUIRE(binder.body_of(node_a) == body_a);

    SECTION("rebinding a node returns the old body") {
        REQUIRE(binder.bind(node_a, body_b) == body_a);
        REQUIRE_FALSE(binder.node_of(body_a).has_value());
        REQUIRE(binder.len() == 1);
    }

    SECTION("binding a body to another node moves it") {
        binder.bind(node_b, body_a);
        REQUIRE(binder.node_of(body_a) == node_b);
        REQUIRE_FALSE(binder.body_of(node_a).has_value());
    }

    SECTION("unbinding") {
        binder.bind(node_b, body_b);
        REQUIRE(binder.unbind_by_node(node_a) == body_a);
        REQUIRE(binder.unbind_by_body(body_b) == node_b);
        REQUIRE(binder.is_empty());
    }
}

TEST_CASE("PhysicsBinder persists through the visitor", "[scene][binder]") {
    PhysicsBinder binder;
    NodeHandle node = NodeHandle::from_raw_parts(3, 1);
    RigidBodyHandle body = RigidBodyHandle::generate();
    binder.bind(node, body);

    auto visitor = tether_core::Visitor::writer();
    REQUIRE(binder.visit("Binder", visitor).is_ok());
    visitor.rewind_for_reading();

    PhysicsBinder loaded;
    REQUIRE(loaded.visit("Binder", visitor).is_ok());
    REQUIRE(loaded.len() == 1);
    REQUIRE(loaded.body_of(node) == body);
}
