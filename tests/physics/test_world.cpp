// tether_physics world tests

#include <catch2/catch_test_macros.hpp>
#include <tether/physics/physics.hpp>

#include <set>

using namespace tether_physics;
using tether_math::Vec3;

namespace {

bool maps_are_injective(const Physics& physics) {
    std::set<RawBodyHandle> bodies;
    for (const auto& [handle, raw] : physics.body_handle_map().forward_map()) {
        if (!bodies.insert(raw).second || physics.body_handle_map().key_of(raw) != handle) {
            return false;
        }
    }
    std::set<RawColliderHandle> colliders;
    for (const auto& [handle, raw] : physics.collider_handle_map().forward_map()) {
        if (!colliders.insert(raw).second || physics.collider_handle_map().key_of(raw) != handle) {
            return false;
        }
    }
    return true;
}

RigidBodyHandle add_ball_body(Physics& physics, const Vec3& at) {
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_dynamic().translation(at).build());
    auto collider = physics.add_collider(ColliderBuilder(shapes::ball(0.5f)).build(), body);
    REQUIRE(collider.has_value());
    return body;
}

} // namespace

TEST_CASE("Physics add_body registers a fresh handle", "[physics][world]") {
    Physics physics;

    RigidBodyHandle a = physics.add_body(RigidBodyBuilder::new_dynamic().build());
    RigidBodyHandle b = physics.add_body(RigidBodyBuilder::new_static().build());

    REQUIRE(a != b);
    REQUIRE(physics.body_count() == 2);
    REQUIRE(physics.body_handle_map().len() == 2);
    REQUIRE(physics.contains_body(a));
    REQUIRE(physics.body(b)->is_static());
}

TEST_CASE("Physics add_collider requires a live parent", "[physics][world]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_dynamic().build());

    auto collider = physics.add_collider(ColliderBuilder(shapes::cuboid(Vec3(1.0f))).build(), body);
    REQUIRE(collider.has_value());
    REQUIRE(physics.collider_parent(*collider) == body);
    REQUIRE(physics.body(body)->colliders().size() == 1);

    auto orphan = physics.add_collider(ColliderBuilder(shapes::ball(1.0f)).build(), RigidBodyHandle::generate());
    REQUIRE_FALSE(orphan.has_value());
    REQUIRE(physics.collider_count() == 1);
    REQUIRE(physics.collider_handle_map().len() == 1);
}

TEST_CASE("Physics add_joint requires both bodies", "[physics][world]") {
    Physics physics;
    RigidBodyHandle a = physics.add_body(RigidBodyBuilder::new_dynamic().build());
    RigidBodyHandle b = physics.add_body(RigidBodyBuilder::new_dynamic().build());

    auto joint = physics.add_joint(a, b, BallJoint{Vec3(0.5f, 0.0f, 0.0f), Vec3(-0.5f, 0.0f, 0.0f)});
    REQUIRE(joint.has_value());
    REQUIRE(physics.joint(*joint) != nullptr);

    REQUIRE_FALSE(physics.add_joint(a, RigidBodyHandle::generate(), FixedJoint{}).has_value());
    REQUIRE(physics.joint_count() == 1);
}

TEST_CASE("Physics remove_body cascades to colliders and joints", "[physics][world]") {
    Physics physics;
    RigidBodyHandle a = add_ball_body(physics, Vec3(0.0f));
    RigidBodyHandle b = add_ball_body(physics, Vec3(2.0f, 0.0f, 0.0f));
    auto extra = physics.add_collider(ColliderBuilder(shapes::cuboid(Vec3(0.2f))).build(), a);
    REQUIRE(extra.has_value());
    auto joint = physics.add_joint(a, b, FixedJoint{});
    REQUIRE(joint.has_value());

    REQUIRE(physics.remove_body(a));

    REQUIRE_FALSE(physics.contains_body(a));
    REQUIRE_FALSE(physics.contains_collider(*extra));
    REQUIRE(physics.joint(*joint) == nullptr);
    REQUIRE(physics.body_count() == 1);
    REQUIRE(physics.collider_count() == 1);
    REQUIRE(physics.joint_count() == 0);
    REQUIRE(physics.body_handle_map().len() == 1);
    REQUIRE(physics.collider_handle_map().len() == 1);
    REQUIRE(physics.joint_handle_map().len() == 0);
    REQUIRE(maps_are_injective(physics));
}

TEST_CASE("Physics removal of unknown handles is a no-op", "[physics][world]") {
    Physics physics;
    RigidBodyHandle body = add_ball_body(physics, Vec3(0.0f));

    REQUIRE_FALSE(physics.remove_body(RigidBodyHandle::generate()));
    REQUIRE_FALSE(physics.remove_collider(ColliderHandle::generate()));
    REQUIRE_FALSE(physics.remove_joint(JointHandle::generate(), true));
    REQUIRE(physics.contains_body(body));
    REQUIRE(physics.collider_count() == 1);
}

TEST_CASE("Physics remove_collider detaches from the parent", "[physics][world]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_dynamic().build());
    auto collider = physics.add_collider(ColliderBuilder(shapes::ball(0.5f)).build(), body);
    REQUIRE(collider.has_value());

    REQUIRE(physics.remove_collider(*collider));
    REQUIRE_FALSE(physics.contains_collider(*collider));
    REQUIRE(physics.body(body)->colliders().empty());
    REQUIRE_FALSE(physics.collider_parent(*collider).has_value());
    REQUIRE_FALSE(physics.remove_collider(*collider));
}

TEST_CASE("Physics handles stay injective under churn", "[physics][world]") {
    Physics physics;
    std::vector<RigidBodyHandle> live;

    for (int round = 0; round < 5; ++round) {
        for (int i = 0; i < 4; ++i) {
            live.push_back(add_ball_body(physics, Vec3(static_cast<float>(i), 0.0f, 0.0f)));
        }
        REQUIRE(physics.remove_body(live.front()));
        live.erase(live.begin());
        REQUIRE(physics.remove_body(live.back()));
        live.pop_back();
        REQUIRE(maps_are_injective(physics));
    }

    REQUIRE(physics.body_count() == live.size());
    REQUIRE(physics.body_handle_map().len() == live.size());
    REQUIRE(physics.collider_handle_map().len() == live.size());
    for (const auto& handle : live) {
        REQUIRE(physics.contains_body(handle));
    }
}

TEST_CASE("Physics stale handles are not found after slot reuse", "[physics][world]") {
    Physics physics;
    RigidBodyHandle old_body = physics.add_body(RigidBodyBuilder::new_dynamic().build());
    REQUIRE(physics.remove_body(old_body));

    RigidBodyHandle new_body = physics.add_body(RigidBodyBuilder::new_dynamic().build());
    REQUIRE(new_body != old_body);
    REQUIRE(physics.body(old_body) == nullptr);
    REQUIRE(physics.body(new_body) != nullptr);
}

TEST_CASE("Physics body_mut edits the stored body", "[physics][world]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_dynamic().build());

    physics.body_mut(body)->set_linvel(Vec3(1.0f, 2.0f, 3.0f), true);
    REQUIRE(physics.body(body)->linvel() == Vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(physics.body_mut(RigidBodyHandle::generate()) == nullptr);
}

TEST_CASE("PerformanceStatistics formats both timings", "[physics][world]") {
    PerformanceStatistics stats;
    stats.step_time = std::chrono::milliseconds(3);
    stats.total_ray_cast_time = std::chrono::microseconds(500);

    std::string text = stats.to_string();
    REQUIRE(text.find("Physics Step Time: 3") != std::string::npos);
    REQUIRE(text.find("Physics Ray Cast Time: 0.5") != std::string::npos);

    stats.reset();
    REQUIRE(stats.step_time.count() == 0);
    REQUIRE(stats.total_ray_cast_time.count() == 0);
}
