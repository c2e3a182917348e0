#pragma once

/// @file types.hpp
/// @brief Core math type definitions for tether_math

#define GLM_FORCE_RADIANS
#define GLM_FORCE_DEPTH_ZERO_TO_ONE
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#include <limits>

namespace tether_math {

// =============================================================================
// GLM Aliases
// =============================================================================

using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;
using Mat3 = glm::mat3;
using Mat4 = glm::mat4;
using Quat = glm::quat;

struct Isometry;
struct Ray;
struct AABB;

// =============================================================================
// Constants
// =============================================================================

namespace consts {
    inline constexpr float PI = 3.14159265358979323846f;
    inline constexpr float TAU = 2.0f * PI;
    inline constexpr float EPSILON = 1e-6f;
    inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();
    inline constexpr float INF = std::numeric_limits<float>::infinity();
}

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
}

namespace quat {
    /// Identity rotation (glm stores w first in the constructor)
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f);
}

// =============================================================================
// Helpers
// =============================================================================

/// Normalize, or return zero when the vector is too short to have a direction
[[nodiscard]] inline Vec3 try_normalize(const Vec3& v) noexcept {
    float len2 = glm::length2(v);
    if (len2 <= consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }
    return v / std::sqrt(len2);
}

[[nodiscard]] inline bool approx_eq(float a, float b, float eps = 1e-5f) noexcept {
    return std::abs(a - b) <= eps;
}

[[nodiscard]] inline bool approx_eq(const Vec3& a, const Vec3& b, float eps = 1e-5f) noexcept {
    return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
}

/// Component of v along the given axis (0 = x, 1 = y, 2 = z)
[[nodiscard]] inline float axis_component(const Vec3& v, int axis) noexcept {
    return v[axis];
}

} // namespace tether_math
