/// @file integration_parameters.hpp
/// @brief Solver tuning parameters

#pragma once

#include <cstdint>

namespace tether_physics {

/// Parameters of one simulation step. The minimal pipeline only consumes
/// `dt`; the rest is carried so that descriptors round-trip losslessly.
struct IntegrationParameters {
    float dt = 1.0f / 60.0f;
    float min_ccd_dt = 1.0f / 60.0f / 100.0f;
    float erp = 0.2f;
    float joint_erp = 0.2f;
    float warmstart_coeff = 1.0f;
    float warmstart_correction_slope = 10.0f;
    float velocity_solve_fraction = 1.0f;
    float velocity_based_erp = 0.0f;
    float allowed_linear_error = 0.005f;
    float prediction_distance = 0.002f;
    float allowed_angular_error = 0.001f;
    float max_linear_correction = 0.2f;
    float max_angular_correction = 0.2f;
    std::uint32_t max_velocity_iterations = 4;
    std::uint32_t max_position_iterations = 1;
    std::uint32_t min_island_size = 128;
    std::uint32_t max_ccd_substeps = 1;

    bool operator==(const IntegrationParameters&) const = default;
};

} // namespace tether_physics
