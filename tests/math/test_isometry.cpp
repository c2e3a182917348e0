// tether_math Isometry and Ray tests

#include <catch2/catch_test_macros.hpp>
#include <tether/math/isometry.hpp>
#include <tether/math/ray.hpp>
#include <tether/math/serialize.hpp>

using namespace tether_math;

namespace {

const Quat QUARTER_TURN_Y = glm::angleAxis(consts::PI * 0.5f, vec3::Y);

} // namespace

TEST_CASE("Isometry transforms points", "[math][isometry]") {
    Isometry iso{Vec3(1.0f, 2.0f, 3.0f), QUARTER_TURN_Y};

    // +X rotates to -Z around Y
    REQUIRE(approx_eq(iso.transform_vector(vec3::X), Vec3(0.0f, 0.0f, -1.0f)));
    REQUIRE(approx_eq(iso.transform_point(vec3::X), Vec3(1.0f, 2.0f, 2.0f)));
    REQUIRE(approx_eq(iso.inverse_transform_point(iso.transform_point(Vec3(4.0f, 5.0f, 6.0f))),
                      Vec3(4.0f, 5.0f, 6.0f)));
}

TEST_CASE("Isometry composition and inverse", "[math][isometry]") {
    Isometry a{Vec3(1.0f, 0.0f, 0.0f), QUARTER_TURN_Y};
    Isometry b = Isometry::from_translation(Vec3(0.0f, 0.0f, 2.0f));
    Vec3 p(0.5f, -1.0f, 2.0f);

    REQUIRE(approx_eq((a * b).transform_point(p), a.transform_point(b.transform_point(p))));

    Isometry identity = a * a.inverse();
    REQUIRE(approx_eq(identity.translation, vec3::ZERO));
    REQUIRE(approx_eq(identity.transform_vector(vec3::X), vec3::X));
}

TEST_CASE("Isometry matrix form", "[math][isometry]") {
    Isometry iso{Vec3(1.0f, 2.0f, 3.0f), QUARTER_TURN_Y};
    Vec3 p(2.0f, 0.0f, 1.0f);
    Vec3 via_matrix = Vec3(iso.to_mat4() * Vec4(p, 1.0f));
    REQUIRE(approx_eq(via_matrix, iso.transform_point(p)));
}

TEST_CASE("Ray helpers", "[math][ray]") {
    Ray ray(Vec3(0.0f, 10.0f, 0.0f), Vec3(0.0f, -2.0f, 0.0f));
    REQUIRE(approx_eq(ray.point_at(1.0f), Vec3(0.0f, 8.0f, 0.0f)));

    Ray unit = ray.normalized();
    REQUIRE(approx_eq(unit.dir, Vec3(0.0f, -1.0f, 0.0f)));
    REQUIRE(approx_eq(unit.point_at(1.0f), Vec3(0.0f, 9.0f, 0.0f)));

    Ray degenerate = Ray(vec3::ZERO, vec3::ZERO).normalized();
    REQUIRE(approx_eq(degenerate.dir, vec3::ZERO));

    Isometry frame = Isometry::from_translation(Vec3(0.0f, 5.0f, 0.0f));
    Ray local = unit.inverse_transform_by(frame);
    REQUIRE(approx_eq(local.origin, Vec3(0.0f, 5.0f, 0.0f)));
}

TEST_CASE("Math types go through the visitor", "[math][serialize]") {
    Vec3 position(1.0f, 2.0f, 3.0f);
    Quat rotation = QUARTER_TURN_Y;

    auto visitor = tether_core::Visitor::writer();
    REQUIRE(tether_core::visit(visitor, "Position", position).is_ok());
    REQUIRE(tether_core::visit(visitor, "Rotation", rotation).is_ok());
    visitor.rewind_for_reading();

    Vec3 read_position{0.0f};
    Quat read_rotation = quat::IDENTITY;
    REQUIRE(tether_core::visit(visitor, "Position", read_position).is_ok());
    REQUIRE(tether_core::visit(visitor, "Rotation", read_rotation).is_ok());

    REQUIRE(read_position == position);
    REQUIRE(read_rotation == rotation);
}
