#pragma once

/// @file isometry.hpp
/// @brief Rigid transform (rotation followed by translation)

#include "types.hpp"

namespace tether_math {

/// Rotation + translation, no scale. Applied as p' = rotation * p + translation.
struct Isometry {
    Vec3 translation = vec3::ZERO;
    Quat rotation = quat::IDENTITY;

    Isometry() = default;

    Isometry(const Vec3& t, const Quat& r) noexcept
        : translation(t), rotation(r) {}

    [[nodiscard]] static Isometry identity() noexcept { return Isometry{}; }

    [[nodiscard]] static Isometry from_translation(const Vec3& t) noexcept {
        return Isometry{t, quat::IDENTITY};
    }

    [[nodiscard]] static Isometry from_rotation(const Quat& r) noexcept {
        return Isometry{vec3::ZERO, r};
    }

    [[nodiscard]] Vec3 transform_point(const Vec3& p) const noexcept {
        return rotation * p + translation;
    }

    [[nodiscard]] Vec3 transform_vector(const Vec3& v) const noexcept {
        return rotation * v;
    }

    [[nodiscard]] Vec3 inverse_transform_point(const Vec3& p) const noexcept {
        return glm::conjugate(rotation) * (p - translation);
    }

    [[nodiscard]] Vec3 inverse_transform_vector(const Vec3& v) const noexcept {
        return glm::conjugate(rotation) * v;
    }

    [[nodiscard]] Isometry inverse() const noexcept {
        Quat inv = glm::conjugate(rotation);
        return Isometry{inv * -translation, inv};
    }

    /// Composition: (a * b).transform_point(p) == a.transform_point(b.transform_point(p))
    [[nodiscard]] Isometry operator*(const Isometry& rhs) const noexcept {
        return Isometry{transform_point(rhs.translation), glm::normalize(rotation * rhs.rotation)};
    }

    [[nodiscard]] Mat4 to_mat4() const noexcept {
        Mat4 m = glm::mat4_cast(rotation);
        m[3] = Vec4(translation, 1.0f);
        return m;
    }
};

} // namespace tether_math
