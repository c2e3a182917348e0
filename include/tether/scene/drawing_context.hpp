#pragma once

/// @file drawing_context.hpp
/// @brief Line list for debug visualization

#include "fwd.hpp"
#include <tether/math/types.hpp>
#include <tether/math/aabb.hpp>

#include <cstdint>
#include <vector>

namespace tether_scene {

// =============================================================================
// Color
// =============================================================================

struct Color {
    std::uint8_t r = 255;
    std::uint8_t g = 255;
    std::uint8_t b = 255;
    std::uint8_t a = 255;

    [[nodiscard]] static constexpr Color opaque(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
        return Color{r, g, b, 255};
    }

    constexpr bool operator==(const Color&) const noexcept = default;
};

namespace colors {
    constexpr Color Red   = Color::opaque(255, 0, 0);
    constexpr Color Green = Color::opaque(0, 255, 0);
    constexpr Color Blue  = Color::opaque(0, 0, 255);
    constexpr Color White = Color::opaque(255, 255, 255);
}

// =============================================================================
// Line
// =============================================================================

struct Line {
    tether_math::Vec3 begin{0.0f};
    tether_math::Vec3 end{0.0f};
    Color color;
};

// =============================================================================
// SceneDrawingContext
// =============================================================================

/// Immediate-mode collector of world-space line segments. Every primitive
/// is decomposed into lines; the renderer consumes `lines()` once per frame
/// and calls `clear_lines()`.
class SceneDrawingContext {
public:
    SceneDrawingContext() { m_lines.reserve(1024); }

    void add_line(const Line& line) { m_lines.push_back(line); }

    /// Unit-length basis axes of `transform` (X red, Y green, Z blue)
    void draw_transform(const tether_math::Mat4& transform);

    void draw_triangle(const tether_math::Vec3& a, const tether_math::Vec3& b,
                       const tether_math::Vec3& c, Color color);

    /// The twelve edges of `aabb` placed by `transform`
    void draw_oob(const tether_math::AABB& aabb, const tether_math::Mat4& transform, Color color);

    /// Latitude/longitude wire sphere
    void draw_sphere(const tether_math::Vec3& position, std::uint32_t slices, std::uint32_t stacks,
                     float radius, Color color);

    /// Cone along local Y with the apex at +height/2
    void draw_cone(std::uint32_t sides, float radius, float height,
                   const tether_math::Mat4& transform, Color color);

    /// Cylinder along local Y, centered at the origin
    void draw_cylinder(std::uint32_t sides, float radius, float height, bool caps,
                       const tether_math::Mat4& transform, Color color);

    /// Capsule around the segment [a, b]
    void draw_segment_capsule(const tether_math::Vec3& a, const tether_math::Vec3& b, float radius,
                              std::uint32_t v_segments, std::uint32_t h_segments,
                              const tether_math::Mat4& transform, Color color);

    void clear_lines() { m_lines.clear(); }

    [[nodiscard]] const std::vector<Line>& lines() const noexcept { return m_lines; }

private:
    void add_transformed(const tether_math::Mat4& transform, const tether_math::Vec3& a,
                         const tether_math::Vec3& b, Color color);

    std::vector<Line> m_lines;
};

} // namespace tether_scene
