// tether_core ConfigManager tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <tether/core/config.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace tether_core;
using Catch::Matchers::WithinAbs;

TEST_CASE("Config value parsing", "[core][config]") {
    REQUIRE(std::get<bool>(parse_config_value("true")));
    REQUIRE(std::get<std::int64_t>(parse_config_value("42")) == 42);
    REQUIRE_THAT(std::get<double>(parse_config_value("0.5")), WithinAbs(0.5, 1e-12));
    REQUIRE(std::get<std::string>(parse_config_value("hello")) == "hello");
}

TEST_CASE("Config defaults", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_GRAVITY_Y), WithinAbs(-9.81, 1e-9));
    REQUIRE(config.get_int(config_keys::PHYSICS_MIN_ISLAND_SIZE) == 128);
    REQUIRE(config.get_int("missing.key", 17) == 17);
}

TEST_CASE("Config layer priority", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    config.set_float(config_keys::PHYSICS_DT, 0.02, "project");
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_DT), WithinAbs(0.02, 1e-12));

    config.set_float(config_keys::PHYSICS_DT, 0.01, "user");
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_DT), WithinAbs(0.01, 1e-12));

    REQUIRE(config.parse_args(std::vector<std::string>{"--physics-dt=0.005"}).is_ok());
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_DT), WithinAbs(0.005, 1e-12));
}

TEST_CASE("Config command line", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("key value pairs and flags") {
        REQUIRE(config.parse_args(std::vector<std::string>{
            "--log.level", "debug", "--log.file", "--physics.min_island_size=64"}).is_ok());
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");
        REQUIRE(config.get_bool(config_keys::LOG_FILE));
        REQUIRE(config.get_int(config_keys::PHYSICS_MIN_ISLAND_SIZE) == 64);
    }

    SECTION("positional arguments are rejected") {
        auto result = config.parse_args(std::vector<std::string>{"world.bin"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Config json layers", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.load_json_string(R"({"physics": {"gravity": {"y": -1.62}, "dt": 0.01}})", "project").is_ok());
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_GRAVITY_Y), WithinAbs(-1.62, 1e-9));
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_DT), WithinAbs(0.01, 1e-12));
    REQUIRE_THAT(config.get_float(config_keys::PHYSICS_GRAVITY_X), WithinAbs(0.0, 1e-12));

    auto bad = config.load_json_string("[1, 2]", "project");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code() == ErrorCode::ParseError);

    REQUIRE(config.load_json_string("{ broken", "project").is_err());
}

TEST_CASE("Config log settings", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();
    config.set_string(config_keys::LOG_LEVEL, "warn");

    LogConfig log = config.build_log_config();
    REQUIRE(log.level == spdlog::level::warn);
    REQUIRE(log.console_enabled);
    REQUIRE_FALSE(log.file_enabled);
}

TEST_CASE("Config json files", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();
    config.set_float(config_keys::PHYSICS_GRAVITY_Y, -3.7, "project");
    config.set_int(config_keys::PHYSICS_MAX_VELOCITY_ITERATIONS, 6, "project");

    const auto path = std::filesystem::temp_directory_path() / "tether_config_test.json";
    REQUIRE(config.save_json(path, "project").is_ok());

    ConfigManager restored;
    restored.setup_defaults();
    REQUIRE(restored.load_json(path, "project").is_ok());
    REQUIRE_THAT(restored.get_float(config_keys::PHYSICS_GRAVITY_Y), WithinAbs(-3.7, 1e-9));
    REQUIRE(restored.get_int(config_keys::PHYSICS_MAX_VELOCITY_ITERATIONS) == 6);
    std::filesystem::remove(path);

    auto missing = restored.load_json(path, "project");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code() == ErrorCode::IOError);
}
