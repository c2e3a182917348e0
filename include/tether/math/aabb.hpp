#pragma once

/// @file aabb.hpp
/// @brief Axis-aligned bounding box for tether_math

#include "types.hpp"
#include "isometry.hpp"
#include "ray.hpp"

#include <algorithm>
#include <optional>

namespace tether_math {

/// Axis-Aligned Bounding Box
struct AABB {
    Vec3 min = Vec3(consts::MAX_FLOAT);   ///< Minimum corner
    Vec3 max = Vec3(-consts::MAX_FLOAT);  ///< Maximum corner

    AABB() = default;

    AABB(const Vec3& min_point, const Vec3& max_point) noexcept
        : min(min_point), max(max_point) {}

    [[nodiscard]] static AABB from_half_extents(const Vec3& center, const Vec3& half_extents) noexcept {
        return AABB(center - half_extents, center + half_extents);
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    [[nodiscard]] Vec3 center() const noexcept { return (min + max) * 0.5f; }
    [[nodiscard]] Vec3 half_extents() const noexcept { return (max - min) * 0.5f; }

    [[nodiscard]] float surface_area() const noexcept {
        Vec3 s = max - min;
        return 2.0f * (s.x * s.y + s.y * s.z + s.z * s.x);
    }

    void expand_to_include(const Vec3& p) noexcept {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    [[nodiscard]] AABB merged(const AABB& other) const noexcept {
        return AABB(glm::min(min, other.min), glm::max(max, other.max));
    }

    [[nodiscard]] bool contains(const AABB& other) const noexcept {
        return min.x <= other.min.x && min.y <= other.min.y && min.z <= other.min.z &&
               max.x >= other.max.x && max.y >= other.max.y && max.z >= other.max.z;
    }

    /// World-space box enclosing this box after applying `iso`
    [[nodiscard]] AABB transformed_by(const Isometry& iso) const noexcept {
        Vec3 c = iso.transform_point(center());
        Mat3 r = glm::mat3_cast(iso.rotation);
        Vec3 he = half_extents();
        Vec3 world_he{
            std::abs(r[0][0]) * he.x + std::abs(r[1][0]) * he.y + std::abs(r[2][0]) * he.z,
            std::abs(r[0][1]) * he.x + std::abs(r[1][1]) * he.y + std::abs(r[2][1]) * he.z,
            std::abs(r[0][2]) * he.x + std::abs(r[1][2]) * he.y + std::abs(r[2][2]) * he.z,
        };
        return from_half_extents(c, world_he);
    }

    /// Slab test. Returns the entry time in [0, max_toi], or nullopt on a miss.
    [[nodiscard]] std::optional<float> cast_ray(const Ray& ray, float max_toi) const noexcept {
        float t_min = 0.0f;
        float t_max = max_toi;

        for (int axis = 0; axis < 3; ++axis) {
            float o = ray.origin[axis];
            float d = ray.dir[axis];
            if (std::abs(d) < consts::EPSILON) {
                if (o < min[axis] || o > max[axis]) {
                    return std::nullopt;
                }
                continue;
            }
            float inv = 1.0f / d;
            float t1 = (min[axis] - o) * inv;
            float t2 = (max[axis] - o) * inv;
            if (t1 > t2) std::swap(t1, t2);
            t_min = std::max(t_min, t1);
            t_max = std::min(t_max, t2);
            if (t_min > t_max) {
                return std::nullopt;
            }
        }
        return t_min;
    }
};

} // namespace tether_math
