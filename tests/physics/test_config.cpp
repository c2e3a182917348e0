// tether_physics configuration tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tether/core/config.hpp>
#include <tether/physics/config.hpp>
#include <tether/physics/physics.hpp>

#include "log_capture.hpp"

#include <string>
#include <vector>

using namespace tether_physics;
using Catch::Matchers::WithinAbs;
using tether_core::ConfigManager;
namespace keys = tether_core::config_keys;

TEST_CASE("Physics config defaults match a fresh world", "[physics][config]") {
    ConfigManager config;
    config.setup_defaults();

    PhysicsConfig physics_config = build_physics_config(config);
    Physics physics;

    REQUIRE(tether_math::approx_eq(physics_config.gravity, physics.gravity()));
    REQUIRE_THAT(physics_config.integration_parameters.dt, WithinAbs(physics.integration_parameters().dt, 1e-7));
    REQUIRE(physics_config.integration_parameters.max_velocity_iterations == 4);
    REQUIRE(physics_config.integration_parameters.max_position_iterations == 1);
    REQUIRE(physics_config.integration_parameters.min_island_size == 128);
}

TEST_CASE("Physics config reads overrides", "[physics][config]") {
    ConfigManager config;
    config.setup_defaults();
    REQUIRE(config.parse_args(std::vector<std::string>{
        "--physics-gravity-y=-1.62", "--physics-dt=0.01", "--physics.max_velocity_iterations=8"}).is_ok());

    PhysicsConfig physics_config = build_physics_config(config);
    REQUIRE_THAT(physics_config.gravity.y, WithinAbs(-1.62f, 1e-6));
    REQUIRE_THAT(physics_config.integration_parameters.dt, WithinAbs(0.01f, 1e-7));
    REQUIRE_THAT(physics_config.integration_parameters.min_ccd_dt, WithinAbs(0.0001f, 1e-8));
    REQUIRE(physics_config.integration_parameters.max_velocity_iterations == 8);

    Physics physics;
    apply_physics_config(physics_config, physics);
    REQUIRE_THAT(physics.gravity().y, WithinAbs(-1.62f, 1e-6));
    REQUIRE(physics.integration_parameters().max_velocity_iterations == 8);
}

TEST_CASE("Physics config ignores non-positive values", "[physics][config]") {
    ConfigManager config;
    config.setup_defaults();
    config.set_float(keys::PHYSICS_DT, -0.5);
    config.set_int(keys::PHYSICS_MIN_ISLAND_SIZE, 0);

    tether_test::LogCapture capture;
    PhysicsConfig physics_config = build_physics_config(config);

    REQUIRE_THAT(physics_config.integration_parameters.dt, WithinAbs(1.0f / 60.0f, 1e-7));
    REQUIRE(physics_config.integration_parameters.min_island_size == 128);
    REQUIRE(capture.count("warning", keys::PHYSICS_DT) == 1);
    REQUIRE(capture.count("warning", keys::PHYSICS_MIN_ISLAND_SIZE) == 1);
}

TEST_CASE("Physics config reads JSON layers", "[physics][config]") {
    ConfigManager config;
    config.setup_defaults();
    REQUIRE(config.load_json_string(R"({"physics": {"gravity": {"x": 1.0, "z": -2.0}}})", "project").is_ok());

    PhysicsConfig physics_config = build_physics_config(config);
    REQUIRE_THAT(physics_config.gravity.x, WithinAbs(1.0f, 1e-6));
    REQUIRE_THAT(physics_config.gravity.y, WithinAbs(-9.81f, 1e-6));
    REQUIRE_THAT(physics_config.gravity.z, WithinAbs(-2.0f, 1e-6));
}
