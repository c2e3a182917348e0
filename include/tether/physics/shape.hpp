/// @file shape.hpp
/// @brief Collision shape definitions for tether_physics

#pragma once

#include "fwd.hpp"

#include <tether/math/types.hpp>
#include <tether/math/aabb.hpp>
#include <tether/math/isometry.hpp>
#include <tether/math/ray.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace tether_physics {

// =============================================================================
// Shape Type
// =============================================================================

/// Shape kinds known to the solver
enum class ShapeType : std::uint8_t {
    Ball,
    Cylinder,
    RoundCylinder,
    Cone,
    Cuboid,
    Capsule,
    Segment,
    Triangle,
    TriMesh,
    HeightField,
};

[[nodiscard]] const char* shape_type_name(ShapeType type);

// =============================================================================
// Ray Hit
// =============================================================================

/// Which part of a shape a ray hit
struct FeatureId {
    enum class Kind : std::uint8_t {
        Unknown,
        Vertex,
        Edge,
        Face,
    };

    Kind kind = Kind::Unknown;
    std::uint32_t index = 0;

    [[nodiscard]] static constexpr FeatureId unknown() noexcept { return FeatureId{}; }
    [[nodiscard]] static constexpr FeatureId vertex(std::uint32_t i) noexcept { return FeatureId{Kind::Vertex, i}; }
    [[nodiscard]] static constexpr FeatureId edge(std::uint32_t i) noexcept { return FeatureId{Kind::Edge, i}; }
    [[nodiscard]] static constexpr FeatureId face(std::uint32_t i) noexcept { return FeatureId{Kind::Face, i}; }

    constexpr bool operator==(const FeatureId&) const noexcept = default;
};

/// Result of a ray cast against a single shape
struct RayHit {
    float toi = 0.0f;                       ///< Ray parameter at the hit
    tether_math::Vec3 normal{0.0f};         ///< Surface normal (zero when the origin is inside a solid)
    FeatureId feature;
};

// =============================================================================
// Shape Interface
// =============================================================================

/// Base interface for all collision shapes. Shapes are immutable once built
/// and shared between colliders through SharedShape.
class IShape {
public:
    virtual ~IShape() = default;

    /// Get shape type
    [[nodiscard]] virtual ShapeType type() const noexcept = 0;

    /// Bounds in the shape's local frame
    [[nodiscard]] virtual tether_math::AABB local_aabb() const = 0;

    /// Cast a ray expressed in the local frame.
    /// Solid shapes report toi 0 when the origin is inside.
    [[nodiscard]] virtual std::optional<RayHit> cast_local_ray(
        const tether_math::Ray& ray, float max_toi) const = 0;

    /// Bounds after placing the shape at `pose`
    [[nodiscard]] tether_math::AABB compute_aabb(const tether_math::Isometry& pose) const {
        return local_aabb().transformed_by(pose);
    }

    /// Cast a world-space ray against the shape placed at `pose`.
    /// The returned normal is in world space.
    [[nodiscard]] std::optional<RayHit> cast_ray(
        const tether_math::Isometry& pose, const tether_math::Ray& ray, float max_toi) const;

    /// Downcast helper, nullptr on type mismatch
    template<typename S>
    [[nodiscard]] const S* as() const noexcept {
        return type() == S::TYPE ? static_cast<const S*>(this) : nullptr;
    }
};

using SharedShape = std::shared_ptr<const IShape>;

// =============================================================================
// Convex Shapes
// =============================================================================

/// Sphere centered at the origin
class BallShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Ball;

    explicit BallShape(float radius) : m_radius(radius) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] float radius() const noexcept { return m_radius; }

private:
    float m_radius;
};

/// Cylinder along the Y axis
class CylinderShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Cylinder;

    CylinderShape(float half_height, float radius)
        : m_half_height(half_height), m_radius(radius) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] float half_height() const noexcept { return m_half_height; }
    [[nodiscard]] float radius() const noexcept { return m_radius; }

private:
    float m_half_height;
    float m_radius;
};

/// Cylinder along the Y axis with rounded edges
class RoundCylinderShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::RoundCylinder;

    RoundCylinderShape(float half_height, float radius, float border_radius)
        : m_half_height(half_height), m_radius(radius), m_border_radius(border_radius) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;

    /// Approximated as a cylinder inflated by the border radius
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] float half_height() const noexcept { return m_half_height; }
    [[nodiscard]] float radius() const noexcept { return m_radius; }
    [[nodiscard]] float border_radius() const noexcept { return m_border_radius; }

private:
    float m_half_height;
    float m_radius;
    float m_border_radius;
};

/// Cone along the Y axis, apex at +half_height, base at -half_height
class ConeShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Cone;

    ConeShape(float half_height, float radius)
        : m_half_height(half_height), m_radius(radius) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] float half_height() const noexcept { return m_half_height; }
    [[nodiscard]] float radius() const noexcept { return m_radius; }

private:
    float m_half_height;
    float m_radius;
};

/// Box centered at the origin
class CuboidShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Cuboid;

    explicit CuboidShape(const tether_math::Vec3& half_extents) : m_half_extents(half_extents) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] const tether_math::Vec3& half_extents() const noexcept { return m_half_extents; }

private:
    tether_math::Vec3 m_half_extents;
};

/// Segment swept by a sphere
class CapsuleShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Capsule;

    CapsuleShape(const tether_math::Vec3& a, const tether_math::Vec3& b, float radius)
        : m_a(a), m_b(b), m_radius(radius) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] const tether_math::Vec3& a() const noexcept { return m_a; }
    [[nodiscard]] const tether_math::Vec3& b() const noexcept { return m_b; }
    [[nodiscard]] float radius() const noexcept { return m_radius; }

private:
    tether_math::Vec3 m_a;
    tether_math::Vec3 m_b;
    float m_radius;
};

// =============================================================================
// Non-Solid Shapes
// =============================================================================

class SegmentShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Segment;

    SegmentShape(const tether_math::Vec3& a, const tether_math::Vec3& b) : m_a(a), m_b(b) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] const tether_math::Vec3& a() const noexcept { return m_a; }
    [[nodiscard]] const tether_math::Vec3& b() const noexcept { return m_b; }

private:
    tether_math::Vec3 m_a;
    tether_math::Vec3 m_b;
};

class TriangleShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::Triangle;

    TriangleShape(const tether_math::Vec3& a, const tether_math::Vec3& b, const tether_math::Vec3& c)
        : m_a(a), m_b(b), m_c(c) {}

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override;
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] const tether_math::Vec3& a() const noexcept { return m_a; }
    [[nodiscard]] const tether_math::Vec3& b() const noexcept { return m_b; }
    [[nodiscard]] const tether_math::Vec3& c() const noexcept { return m_c; }

private:
    tether_math::Vec3 m_a;
    tether_math::Vec3 m_b;
    tether_math::Vec3 m_c;
};

/// Indexed triangle soup
class TriMeshShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::TriMesh;

    using Triangle = std::array<std::uint32_t, 3>;

    /// Indices must reference existing vertices
    TriMeshShape(std::vector<tether_math::Vec3> vertices, std::vector<Triangle> indices);

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override { return m_aabb; }
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] const std::vector<tether_math::Vec3>& vertices() const noexcept { return m_vertices; }
    [[nodiscard]] const std::vector<Triangle>& indices() const noexcept { return m_indices; }

    [[nodiscard]] std::size_t triangle_count() const noexcept { return m_indices.size(); }

    /// Corner positions of triangle `i`
    [[nodiscard]] std::array<tether_math::Vec3, 3> triangle(std::size_t i) const;

private:
    std::vector<tether_math::Vec3> m_vertices;
    std::vector<Triangle> m_indices;
    tether_math::AABB m_aabb;
};

/// Regular height grid over the XZ plane, centered at the origin.
/// Rows run along Z, columns along X, heights are stored column-major.
class HeightFieldShape : public IShape {
public:
    static constexpr ShapeType TYPE = ShapeType::HeightField;

    HeightFieldShape(std::uint32_t nrows, std::uint32_t ncols,
                     std::vector<float> heights, const tether_math::Vec3& scale);

    [[nodiscard]] ShapeType type() const noexcept override { return TYPE; }
    [[nodiscard]] tether_math::AABB local_aabb() const override { return m_aabb; }
    [[nodiscard]] std::optional<RayHit> cast_local_ray(const tether_math::Ray& ray, float max_toi) const override;

    [[nodiscard]] std::uint32_t nrows() const noexcept { return m_nrows; }
    [[nodiscard]] std::uint32_t ncols() const noexcept { return m_ncols; }
    [[nodiscard]] const std::vector<float>& heights() const noexcept { return m_heights; }
    [[nodiscard]] const tether_math::Vec3& scale() const noexcept { return m_scale; }

    [[nodiscard]] float height_at(std::uint32_t row, std::uint32_t col) const {
        return m_heights[row + col * m_nrows];
    }

    /// Local position of the grid point (row, col)
    [[nodiscard]] tether_math::Vec3 grid_point(std::uint32_t row, std::uint32_t col) const;

private:
    std::uint32_t m_nrows;
    std::uint32_t m_ncols;
    std::vector<float> m_heights;
    tether_math::Vec3 m_scale;
    tether_math::AABB m_aabb;
};

// =============================================================================
// Factories
// =============================================================================

namespace shapes {

[[nodiscard]] SharedShape ball(float radius);
[[nodiscard]] SharedShape cylinder(float half_height, float radius);
[[nodiscard]] SharedShape round_cylinder(float half_height, float radius, float border_radius);
[[nodiscard]] SharedShape cone(float half_height, float radius);
[[nodiscard]] SharedShape cuboid(const tether_math::Vec3& half_extents);
[[nodiscard]] SharedShape capsule(const tether_math::Vec3& a, const tether_math::Vec3& b, float radius);
[[nodiscard]] SharedShape segment(const tether_math::Vec3& a, const tether_math::Vec3& b);
[[nodiscard]] SharedShape triangle(const tether_math::Vec3& a, const tether_math::Vec3& b, const tether_math::Vec3& c);
[[nodiscard]] SharedShape trimesh(std::vector<tether_math::Vec3> vertices,
                                  std::vector<TriMeshShape::Triangle> indices);
[[nodiscard]] SharedShape heightfield(std::uint32_t nrows, std::uint32_t ncols,
                                      std::vector<float> heights, const tether_math::Vec3& scale);

} // namespace shapes

} // namespace tether_physics
