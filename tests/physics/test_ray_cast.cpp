// tether_physics ray cast tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tether/physics/physics.hpp>

#include <vector>

using namespace tether_physics;
using Catch::Matchers::WithinAbs;
using tether_math::Ray;
using tether_math::Vec3;

namespace {

/// Balls of radius 0.5 at x = 20, 5, 15, 10, inserted out of distance order
struct BallRow {
    Physics physics;
    std::vector<RigidBodyHandle> bodies;
    std::vector<ColliderHandle> colliders;

    BallRow() {
        for (float x : {20.0f, 5.0f, 15.0f, 10.0f}) {
            RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_static().translation(Vec3(x, 0.0f, 0.0f)).build());
            auto collider = physics.add_collider(ColliderBuilder(shapes::ball(0.5f)).build(), body);
            REQUIRE(collider.has_value());
            bodies.push_back(body);
            colliders.push_back(*collider);
        }
    }
};

RayCastOptions along_x(float max_len = tether_math::consts::MAX_FLOAT) {
    return RayCastOptions{Ray(Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f)), max_len, InteractionGroups::all(), true};
}

} // namespace

TEST_CASE("cast_ray sorts hits by distance", "[physics][ray]") {
    BallRow row;
    std::vector<Intersection> hits;

    REQUIRE(row.physics.cast_ray(along_x(), hits) == 0);
    REQUIRE(hits.size() == 4);
    for (std::size_t i = 1; i < hits.size(); ++i) {
        REQUIRE(hits[i - 1].toi <= hits[i].toi);
    }
    REQUIRE_THAT(hits[0].toi, WithinAbs(4.5f, 1e-4));
    REQUIRE(hits[0].collider == row.colliders[1]);
    REQUIRE(tether_math::approx_eq(hits[0].position, Vec3(4.5f, 0.0f, 0.0f), 1e-4f));
    REQUIRE(tether_math::approx_eq(hits[0].normal, Vec3(-1.0f, 0.0f, 0.0f), 1e-4f));
}

TEST_CASE("cast_ray respects max_len", "[physics][ray]") {
    BallRow row;
    std::vector<Intersection> hits;

    row.physics.cast_ray(along_x(12.0f), hits);
    REQUIRE(hits.size() == 2);
    for (const auto& hit : hits) {
        REQUIRE(hit.toi <= 12.0f);
    }

    row.physics.cast_ray(along_x(1.0f), hits);
    REQUIRE(hits.empty());
}

TEST_CASE("cast_ray measures distance along a normalized ray", "[physics][ray]") {
    BallRow row;
    std::vector<Intersection> hits;

    RayCastOptions opts = along_x();
    opts.ray.dir = Vec3(4.0f, 0.0f, 0.0f);
    row.physics.cast_ray(opts, hits);
    REQUIRE_FALSE(hits.empty());
    REQUIRE_THAT(hits[0].toi, WithinAbs(4.5f, 1e-4));
}

TEST_CASE("cast_ray reports hits dropped by fixed storage", "[physics][ray]") {
    BallRow row;
    tether_core::FixedVector<Intersection, 2> hits;

    std::size_t dropped = row.physics.cast_ray(along_x(), hits);
    REQUIRE(hits.size() == 2);
    REQUIRE(dropped == 2);
    REQUIRE(hits[0].toi <= hits[1].toi);
}

TEST_CASE("cast_ray clears previous results", "[physics][ray]") {
    BallRow row;
    std::vector<Intersection> hits;
    row.physics.cast_ray(along_x(), hits);
    REQUIRE(hits.size() == 4);

    RayCastOptions miss{Ray(Vec3(0.0f, 10.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f)), 100.0f, InteractionGroups::all(), true};
    row.physics.cast_ray(miss, hits);
    REQUIRE(hits.empty());
}

TEST_CASE("cast_ray filters by interaction groups", "[physics][ray]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_static().translation(Vec3(5.0f, 0.0f, 0.0f)).build());
    auto collider = physics.add_collider(ColliderBuilder(shapes::cuboid(Vec3(0.5f)))
                                             .collision_groups(InteractionGroups::with(0x2, 0xFFFF))
                                             .build(),
                                         body);
    REQUIRE(collider.has_value());

    std::vector<Intersection> hits;

    RayCastOptions opts = along_x();
    opts.groups = InteractionGroups::with(0xFFFF, 0x1);
    physics.cast_ray(opts, hits);
    REQUIRE(hits.empty());

    opts.groups = InteractionGroups::with(0xFFFF, 0x2);
    physics.cast_ray(opts, hits);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].collider == *collider);
    REQUIRE_THAT(hits[0].toi, WithinAbs(4.5f, 1e-4));
}

TEST_CASE("cast_ray follows body and collider offsets", "[physics][ray]") {
    Physics physics;
    RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_dynamic().translation(Vec3(0.0f, 0.0f, 8.0f)).build());
    auto collider = physics.add_collider(ColliderBuilder(shapes::cuboid(Vec3(1.0f)))
                                             .translation(Vec3(0.0f, 3.0f, 0.0f))
                                             .build(),
                                         body);
    REQUIRE(collider.has_value());

    std::vector<Intersection> hits;
    RayCastOptions opts{Ray(Vec3(0.0f, 3.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f)), 100.0f, InteractionGroups::all(), true};
    physics.cast_ray(opts, hits);
    REQUIRE(hits.size() == 1);
    REQUIRE_THAT(hits[0].toi, WithinAbs(7.0f, 1e-4));
    REQUIRE(tether_math::approx_eq(hits[0].normal, Vec3(0.0f, 0.0f, -1.0f), 1e-4f));

    // Moving the body moves the query proxy on the next cast
    physics.body_mut(body)->set_position(tether_math::Isometry::from_translation(Vec3(0.0f, 0.0f, 20.0f)), true);
    physics.cast_ray(opts, hits);
    REQUIRE(hits.size() == 1);
    REQUIRE_THAT(hits[0].toi, WithinAbs(19.0f, 1e-4));
}

TEST_CASE("cast_ray ignores removed colliders", "[physics][ray]") {
    BallRow row;
    std::vector<Intersection> hits;

    REQUIRE(row.physics.remove_body(row.bodies[1]));
    REQUIRE(row.physics.remove_collider(row.colliders[3]));

    row.physics.cast_ray(along_x(), hits);
    REQUIRE(hits.size() == 2);
    REQUIRE_THAT(hits[0].toi, WithinAbs(14.5f, 1e-4));
    REQUIRE(hits[1].collider == row.colliders[0]);
}

TEST_CASE("cast_ray without sorting still finds everything", "[physics][ray]") {
    BallRow row;
    std::vector<Intersection> hits;

    RayCastOptions opts = along_x();
    opts.sort_results = false;
    row.physics.cast_ray(opts, hits);
    REQUIRE(hits.size() == 4);

    float total = 0.0f;
    for (const auto& hit : hits) {
        total += hit.toi;
    }
    REQUIRE_THAT(total, WithinAbs(4.5f + 9.5f + 14.5f + 19.5f, 1e-3));
}
