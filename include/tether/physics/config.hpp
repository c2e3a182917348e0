/// @file config.hpp
/// @brief Physics settings read from the layered configuration

#pragma once

#include "fwd.hpp"
#include "integration_parameters.hpp"

#include <tether/core/config.hpp>
#include <tether/math/types.hpp>

namespace tether_physics {

struct PhysicsConfig {
    tether_math::Vec3 gravity{0.0f, -9.81f, 0.0f};
    IntegrationParameters integration_parameters;
};

/// Read the `physics.*` keys. Missing keys keep their defaults; non-positive
/// dt and zero iteration counts are rejected with a warning.
[[nodiscard]] PhysicsConfig build_physics_config(const tether_core::ConfigManager& config);

/// Apply gravity and integration parameters to a live world
void apply_physics_config(const PhysicsConfig& config, Physics& physics);

} // namespace tether_physics
