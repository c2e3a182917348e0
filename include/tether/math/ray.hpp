#pragma once

/// @file ray.hpp
/// @brief Ray type for tether_math

#include "types.hpp"
#include "isometry.hpp"

namespace tether_math {

/// Ray with origin and direction. The direction is not normalized implicitly;
/// `t` values are in units of the direction's length.
struct Ray {
    Vec3 origin = vec3::ZERO;
    Vec3 dir = vec3::Z;

    Ray() = default;

    Ray(const Vec3& o, const Vec3& d) noexcept
        : origin(o), dir(d) {}

    [[nodiscard]] Vec3 point_at(float t) const noexcept {
        return origin + dir * t;
    }

    /// Same ray with a unit (or zero, if degenerate) direction
    [[nodiscard]] Ray normalized() const noexcept {
        return Ray{origin, try_normalize(dir)};
    }

    /// Express the ray in the local frame of `iso`
    [[nodiscard]] Ray inverse_transform_by(const Isometry& iso) const noexcept {
        return Ray{iso.inverse_transform_point(origin), iso.inverse_transform_vector(dir)};
    }
};

} // namespace tether_math
