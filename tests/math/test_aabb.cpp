// tether_math AABB tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tether/math/aabb.hpp>

using namespace tether_math;
using Catch::Matchers::WithinAbs;

TEST_CASE("AABB construction", "[math][aabb]") {
    AABB empty;
    REQUIRE_FALSE(empty.is_valid());

    empty.expand_to_include(Vec3(1.0f, 2.0f, 3.0f));
    empty.expand_to_include(Vec3(-1.0f, 0.0f, 1.0f));
    REQUIRE(empty.is_valid());
    REQUIRE(empty.min == Vec3(-1.0f, 0.0f, 1.0f));
    REQUIRE(empty.max == Vec3(1.0f, 2.0f, 3.0f));

    AABB box = AABB::from_half_extents(Vec3(1.0f), Vec3(0.5f));
    REQUIRE(box.center() == Vec3(1.0f));
    REQUIRE(box.half_extents() == Vec3(0.5f));
    REQUIRE_THAT(box.surface_area(), WithinAbs(6.0, 1e-6));
}

TEST_CASE("AABB merge and containment", "[math][aabb]") {
    AABB a(Vec3(0.0f), Vec3(1.0f));
    AABB b(Vec3(2.0f), Vec3(3.0f));
    AABB merged = a.merged(b);

    REQUIRE(merged.contains(a));
    REQUIRE(merged.contains(b));
    REQUIRE_FALSE(a.contains(merged));
}

TEST_CASE("AABB under a rotation", "[math][aabb]") {
    AABB box(Vec3(-1.0f, -0.5f, -0.5f), Vec3(1.0f, 0.5f, 0.5f));
    Isometry iso{Vec3(0.0f, 1.0f, 0.0f), glm::angleAxis(consts::PI * 0.5f, vec3::Z)};

    AABB world = box.transformed_by(iso);
    REQUIRE(approx_eq(world.center(), Vec3(0.0f, 1.0f, 0.0f)));
    REQUIRE(approx_eq(world.half_extents(), Vec3(0.5f, 1.0f, 0.5f)));
}

TEST_CASE("AABB ray slab test", "[math][aabb]") {
    AABB box(Vec3(-1.0f), Vec3(1.0f));

    auto hit = box.cast_ray(Ray(Vec3(0.0f, 5.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f)), 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE_THAT(*hit, WithinAbs(4.0, 1e-5));

    REQUIRE_FALSE(box.cast_ray(Ray(Vec3(0.0f, 5.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f)), 3.0f).has_value());
    REQUIRE_FALSE(box.cast_ray(Ray(Vec3(3.0f, 5.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f)), 100.0f).has_value());

    auto inside = box.cast_ray(Ray(vec3::ZERO, vec3::X), 100.0f);
    REQUIRE(inside.has_value());
    REQUIRE(*inside == 0.0f);
}
