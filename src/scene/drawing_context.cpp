/// @file drawing_context.cpp
/// @brief SceneDrawingContext primitives

#include <tether/scene/drawing_context.hpp>

#include <array>
#include <cmath>

namespace tether_scene {

using tether_math::Mat4;
using tether_math::Vec3;
using tether_math::Vec4;

namespace {

Vec3 transform_point(const Mat4& m, const Vec3& p) {
    return Vec3(m * Vec4(p, 1.0f));
}

/// Point on a circle of `radius` around local Y at height `y`
Vec3 ring_point(float radius, float y, std::uint32_t i, std::uint32_t segments) {
    float angle = tether_math::consts::TAU * static_cast<float>(i) / static_cast<float>(segments);
    return Vec3(std::cos(angle) * radius, y, std::sin(angle) * radius);
}

} // namespace

void SceneDrawingContext::add_transformed(const Mat4& transform, const Vec3& a, const Vec3& b, Color color) {
    m_lines.push_back(Line{transform_point(transform, a), transform_point(transform, b), color});
}

void SceneDrawingContext::draw_transform(const Mat4& transform) {
    Vec3 origin = transform_point(transform, Vec3(0.0f));
    m_lines.push_back(Line{origin, transform_point(transform, tether_math::vec3::X), colors::Red});
    m_lines.push_back(Line{origin, transform_point(transform, tether_math::vec3::Y), colors::Green});
    m_lines.push_back(Line{origin, transform_point(transform, tether_math::vec3::Z), colors::Blue});
}

void SceneDrawingContext::draw_triangle(const Vec3& a, const Vec3& b, const Vec3& c, Color color) {
    m_lines.push_back(Line{a, b, color});
    m_lines.push_back(Line{b, c, color});
    m_lines.push_back(Line{c, a, color});
}

void SceneDrawingContext::draw_oob(const tether_math::AABB& aabb, const Mat4& transform, Color color) {
    const Vec3& lo = aabb.min;
    const Vec3& hi = aabb.max;

    // Bit 0 selects x, bit 1 y, bit 2 z
    std::array<Vec3, 8> corners;
    for (std::uint32_t i = 0; i < 8; ++i) {
        corners[i] = Vec3((i & 1) ? hi.x : lo.x, (i & 2) ? hi.y : lo.y, (i & 4) ? hi.z : lo.z);
    }

    for (std::uint32_t i = 0; i < 8; ++i) {
        for (std::uint32_t bit : {1u, 2u, 4u}) {
            if ((i & bit) == 0) {
                add_transformed(transform, corners[i], corners[i | bit], color);
            }
        }
    }
}

void SceneDrawingContext::draw_sphere(const Vec3& position, std::uint32_t slices, std::uint32_t stacks,
                                      float radius, Color color) {
    if (slices < 3 || stacks < 2) {
        return;
    }

    auto point = [&](std::uint32_t stack, std::uint32_t slice) {
        float theta = tether_math::consts::PI * static_cast<float>(stack) / static_cast<float>(stacks);
        float phi = tether_math::consts::TAU * static_cast<float>(slice) / static_cast<float>(slices);
        return position + Vec3(std::sin(theta) * std::cos(phi),
                               std::cos(theta),
                               std::sin(theta) * std::sin(phi)) * radius;
    };

    for (std::uint32_t stack = 0; stack < stacks; ++stack) {
        for (std::uint32_t slice = 0; slice < slices; ++slice) {
            // Meridian segment
            m_lines.push_back(Line{point(stack, slice), point(stack + 1, slice), color});
            // Parallel segment, skipping the degenerate north pole ring
            if (stack > 0) {
                m_lines.push_back(Line{point(stack, slice), point(stack, (slice + 1) % slices), color});
            }
        }
    }
}

void SceneDrawingContext::draw_cone(std::uint32_t sides, float radius, float height,
                                    const Mat4& transform, Color color) {
    if (sides < 3) {
        return;
    }

    float half = height * 0.5f;
    Vec3 apex(0.0f, half, 0.0f);
    for (std::uint32_t i = 0; i < sides; ++i) {
        Vec3 current = ring_point(radius, -half, i, sides);
        Vec3 next = ring_point(radius, -half, i + 1, sides);
        add_transformed(transform, current, next, color);
        add_transformed(transform, current, apex, color);
    }
}

void SceneDrawingContext::draw_cylinder(std::uint32_t sides, float radius, float height, bool caps,
                                        const Mat4& transform, Color color) {
    if (sides < 3) {
        return;
    }

    float half = height * 0.5f;
    Vec3 top_center(0.0f, half, 0.0f);
    Vec3 bottom_center(0.0f, -half, 0.0f);
    for (std::uint32_t i = 0; i < sides; ++i) {
        Vec3 top = ring_point(radius, half, i, sides);
        Vec3 bottom = ring_point(radius, -half, i, sides);
        add_transformed(transform, top, ring_point(radius, half, i + 1, sides), color);
        add_transformed(transform, bottom, ring_point(radius, -half, i + 1, sides), color);
        add_transformed(transform, top, bottom, color);
        if (caps) {
            add_transformed(transform, top_center, top, color);
            add_transformed(transform, bottom_center, bottom, color);
        }
    }
}

void SceneDrawingContext::draw_segment_capsule(const Vec3& a, const Vec3& b, float radius,
                                               std::uint32_t v_segments, std::uint32_t h_segments,
                                               const Mat4& transform, Color color) {
    if (v_segments == 0 || h_segments < 3) {
        return;
    }

    Vec3 axis = tether_math::try_normalize(b - a);
    if (glm::length2(axis) == 0.0f) {
        axis = tether_math::vec3::Y;
    }
    Vec3 helper = std::abs(axis.y) < 0.9f ? tether_math::vec3::Y : tether_math::vec3::X;
    Vec3 u = glm::normalize(glm::cross(axis, helper));
    Vec3 w = glm::cross(axis, u);

    auto around = [&](std::uint32_t i) {
        float angle = tether_math::consts::TAU * static_cast<float>(i) / static_cast<float>(h_segments);
        return u * std::cos(angle) + w * std::sin(angle);
    };

    for (std::uint32_t i = 0; i < h_segments; ++i) {
        Vec3 dir = around(i);
        Vec3 next = around(i + 1);

        // Side line and the two equator rings
        add_transformed(transform, a + dir * radius, b + dir * radius, color);
        add_transformed(transform, a + dir * radius, a + next * radius, color);
        add_transformed(transform, b + dir * radius, b + next * radius, color);

        // Hemisphere arcs from the equator to each pole
        for (std::uint32_t j = 0; j < v_segments; ++j) {
            float phi0 = 0.5f * tether_math::consts::PI * static_cast<float>(j) / static_cast<float>(v_segments);
            float phi1 = 0.5f * tether_math::consts::PI * static_cast<float>(j + 1) / static_cast<float>(v_segments);
            Vec3 cap0 = dir * std::cos(phi0);
            Vec3 cap1 = dir * std::cos(phi1);
            add_transformed(transform,
                b + (cap0 + axis * std::sin(phi0)) * radius,
                b + (cap1 + axis * std::sin(phi1)) * radius, color);
            add_transformed(transform,
                a + (cap0 - axis * std::sin(phi0)) * radius,
                a + (cap1 - axis * std::sin(phi1)) * radius, color);
        }
    }
}

} // namespace tether_scene
