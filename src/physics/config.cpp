/// @file config.cpp
/// @brief Physics settings read from the layered configuration

#include <tether/physics/config.hpp>
#include <tether/physics/physics.hpp>

namespace tether_physics {

namespace keys = tether_core::config_keys;

namespace {

std::uint32_t read_count(const tether_core::ConfigManager& config, const char* key, std::uint32_t fallback) {
    std::int64_t value = config.get_int(key, fallback);
    if (value <= 0) {
        physics_logger()->warn("Ignoring {} = {}, it must be positive", key, value);
        return fallback;
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

PhysicsConfig build_physics_config(const tether_core::ConfigManager& config) {
    PhysicsConfig result;

    result.gravity = tether_math::Vec3(
        static_cast<float>(config.get_float(keys::PHYSICS_GRAVITY_X, result.gravity.x)),
        static_cast<float>(config.get_float(keys::PHYSICS_GRAVITY_Y, result.gravity.y)),
        static_cast<float>(config.get_float(keys::PHYSICS_GRAVITY_Z, result.gravity.z)));

    IntegrationParameters& params = result.integration_parameters;

    double dt = config.get_float(keys::PHYSICS_DT, params.dt);
    if (dt > 0.0) {
        params.dt = static_cast<float>(dt);
        params.min_ccd_dt = params.dt / 100.0f;
    } else {
        physics_logger()->warn("Ignoring {} = {}, it must be positive", keys::PHYSICS_DT, dt);
    }

    params.max_velocity_iterations =
        read_count(config, keys::PHYSICS_MAX_VELOCITY_ITERATIONS, params.max_velocity_iterations);
    params.max_position_iterations =
        read_count(config, keys::PHYSICS_MAX_POSITION_ITERATIONS, params.max_position_iterations);
    params.min_island_size = read_count(config, keys::PHYSICS_MIN_ISLAND_SIZE, params.min_island_size);

    return result;
}

void apply_physics_config(const PhysicsConfig& config, Physics& physics) {
    physics.set_gravity(config.gravity);
    physics.set_integration_parameters(config.integration_parameters);
}

} // namespace tether_physics
