/// @file shape.cpp
/// @brief Collision shape implementations for tether_physics

#include <tether/physics/shape.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tether_physics {

using tether_math::AABB;
using tether_math::Isometry;
using tether_math::Ray;
using tether_math::Vec3;

namespace consts = tether_math::consts;

const char* shape_type_name(ShapeType type) {
    switch (type) {
        case ShapeType::Ball: return "Ball";
        case ShapeType::Cylinder: return "Cylinder";
        case ShapeType::RoundCylinder: return "RoundCylinder";
        case ShapeType::Cone: return "Cone";
        case ShapeType::Cuboid: return "Cuboid";
        case ShapeType::Capsule: return "Capsule";
        case ShapeType::Segment: return "Segment";
        case ShapeType::Triangle: return "Triangle";
        case ShapeType::TriMesh: return "TriMesh";
        case ShapeType::HeightField: return "HeightField";
        default: return "Unknown";
    }
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

bool accept_toi(float t, float max_toi) {
    return t >= 0.0f && t <= max_toi;
}

RayHit inside_hit() {
    return RayHit{0.0f, Vec3(0.0f), FeatureId::unknown()};
}

/// Front-facing root of |o + d t - center|^2 = r^2
std::optional<float> sphere_entry(const Vec3& center, float radius, const Ray& ray) {
    Vec3 oc = ray.origin - center;
    float a = glm::dot(ray.dir, ray.dir);
    if (a < consts::EPSILON * consts::EPSILON) {
        return std::nullopt;
    }
    float b = glm::dot(oc, ray.dir);
    float c = glm::dot(oc, oc) - radius * radius;
    float disc = b * b - a * c;
    if (disc < 0.0f) {
        return std::nullopt;
    }
    return (-b - std::sqrt(disc)) / a;
}

Vec3 closest_point_on_segment(const Vec3& a, const Vec3& b, const Vec3& p) {
    Vec3 ab = b - a;
    float len2 = glm::dot(ab, ab);
    if (len2 < consts::EPSILON * consts::EPSILON) {
        return a;
    }
    float t = std::clamp(glm::dot(p - a, ab) / len2, 0.0f, 1.0f);
    return a + ab * t;
}

/// Two-sided Moller-Trumbore. Returns (t, normal facing the ray).
std::optional<std::pair<float, Vec3>> ray_triangle(
    const Ray& ray, const Vec3& a, const Vec3& b, const Vec3& c)
{
    Vec3 e1 = b - a;
    Vec3 e2 = c - a;
    Vec3 p = glm::cross(ray.dir, e2);
    float det = glm::dot(e1, p);
    if (std::abs(det) < 1e-12f) {
        return std::nullopt;
    }
    float inv_det = 1.0f / det;
    Vec3 s = ray.origin - a;
    float u = glm::dot(s, p) * inv_det;
    if (u < 0.0f || u > 1.0f) {
        return std::nullopt;
    }
    Vec3 q = glm::cross(s, e1);
    float v = glm::dot(ray.dir, q) * inv_det;
    if (v < 0.0f || u + v > 1.0f) {
        return std::nullopt;
    }
    float t = glm::dot(e2, q) * inv_det;

    Vec3 n = tether_math::try_normalize(glm::cross(e1, e2));
    if (glm::dot(n, ray.dir) > 0.0f) {
        n = -n;
    }
    return std::make_pair(t, n);
}

/// Solid Y-axis cylinder shared by the plain and rounded variants
std::optional<RayHit> cast_cylinder(const Ray& ray, float half_height, float radius, float max_toi) {
    const Vec3& o = ray.origin;
    const Vec3& d = ray.dir;

    if (o.x * o.x + o.z * o.z <= radius * radius && std::abs(o.y) <= half_height) {
        return inside_hit();
    }

    // Slab between the caps
    float ty0 = -consts::INF;
    float ty1 = consts::INF;
    if (std::abs(d.y) < consts::EPSILON) {
        if (std::abs(o.y) > half_height) {
            return std::nullopt;
        }
    } else {
        ty0 = (-half_height - o.y) / d.y;
        ty1 = (half_height - o.y) / d.y;
        if (ty0 > ty1) std::swap(ty0, ty1);
    }

    // Infinite tube
    float tr0 = -consts::INF;
    float tr1 = consts::INF;
    float a = d.x * d.x + d.z * d.z;
    float c = o.x * o.x + o.z * o.z - radius * radius;
    if (a < consts::EPSILON * consts::EPSILON) {
        if (c > 0.0f) {
            return std::nullopt;
        }
    } else {
        float b = o.x * d.x + o.z * d.z;
        float disc = b * b - a * c;
        if (disc < 0.0f) {
            return std::nullopt;
        }
        float s = std::sqrt(disc);
        tr0 = (-b - s) / a;
        tr1 = (-b + s) / a;
    }

    float t0 = std::max(ty0, tr0);
    float t1 = std::min(ty1, tr1);
    if (t0 > t1 || !accept_toi(t0, max_toi)) {
        return std::nullopt;
    }

    if (ty0 >= tr0) {
        bool top = d.y < 0.0f;
        return RayHit{t0, Vec3(0.0f, top ? 1.0f : -1.0f, 0.0f), FeatureId::face(top ? 0u : 1u)};
    }
    Vec3 p = ray.point_at(t0);
    return RayHit{t0, tether_math::try_normalize(Vec3(p.x, 0.0f, p.z)), FeatureId::face(2)};
}

} // namespace

// =============================================================================
// IShape
// =============================================================================

std::optional<RayHit> IShape::cast_ray(const Isometry& pose, const Ray& ray, float max_toi) const {
    auto hit = cast_local_ray(ray.inverse_transform_by(pose), max_toi);
    if (hit) {
        hit->normal = pose.transform_vector(hit->normal);
    }
    return hit;
}

// =============================================================================
// Ball
// =============================================================================

AABB BallShape::local_aabb() const {
    return AABB::from_half_extents(Vec3(0.0f), Vec3(m_radius));
}

std::optional<RayHit> BallShape::cast_local_ray(const Ray& ray, float max_toi) const {
    if (glm::dot(ray.origin, ray.origin) <= m_radius * m_radius) {
        return inside_hit();
    }
    auto t = sphere_entry(Vec3(0.0f), m_radius, ray);
    if (!t || !accept_toi(*t, max_toi)) {
        return std::nullopt;
    }
    return RayHit{*t, tether_math::try_normalize(ray.point_at(*t)), FeatureId::face(0)};
}

// =============================================================================
// Cylinder / Round Cylinder
// =============================================================================

AABB CylinderShape::local_aabb() const {
    return AABB::from_half_extents(Vec3(0.0f), Vec3(m_radius, m_half_height, m_radius));
}

std::optional<RayHit> CylinderShape::cast_local_ray(const Ray& ray, float max_toi) const {
    return cast_cylinder(ray, m_half_height, m_radius, max_toi);
}

AABB RoundCylinderShape::local_aabb() const {
    float r = m_radius + m_border_radius;
    return AABB::from_half_extents(Vec3(0.0f), Vec3(r, m_half_height + m_border_radius, r));
}

std::optional<RayHit> RoundCylinderShape::cast_local_ray(const Ray& ray, float max_toi) const {
    return cast_cylinder(ray, m_half_height + m_border_radius, m_radius + m_border_radius, max_toi);
}

// =============================================================================
// Cone
// =============================================================================

AABB ConeShape::local_aabb() const {
    return AABB::from_half_extents(Vec3(0.0f), Vec3(m_radius, m_half_height, m_radius));
}

std::optional<RayHit> ConeShape::cast_local_ray(const Ray& ray, float max_toi) const {
    const Vec3& o = ray.origin;
    const Vec3& d = ray.dir;
    const float h = m_half_height;

    if (h <= 0.0f) {
        return std::nullopt;
    }

    // Radius shrinks linearly from m_radius at y = -h to zero at y = +h
    const float k = m_radius / (2.0f * h);
    const float k2 = k * k;

    auto radius_at = [&](float y) { return k * (h - y); };

    if (std::abs(o.y) <= h) {
        float r = radius_at(o.y);
        if (o.x * o.x + o.z * o.z <= r * r) {
            return inside_hit();
        }
    }

    std::optional<RayHit> best;
    auto consider = [&](float t, const Vec3& normal, FeatureId feature) {
        if (!accept_toi(t, max_toi)) return;
        if (!best || t < best->toi) {
            best = RayHit{t, normal, feature};
        }
    };

    auto side_candidate = [&](float t) {
        Vec3 p = ray.point_at(t);
        if (p.y < -h || p.y > h) return;
        Vec3 n = tether_math::try_normalize(Vec3(p.x, k2 * (h - p.y), p.z));
        if (glm::length2(n) == 0.0f) {
            n = tether_math::vec3::Y;
        }
        consider(t, n, FeatureId::face(1));
    };

    float hy = h - o.y;
    float a = d.x * d.x + d.z * d.z - k2 * d.y * d.y;
    float b = o.x * d.x + o.z * d.z + k2 * hy * d.y;
    float c = o.x * o.x + o.z * o.z - k2 * hy * hy;

    if (std::abs(a) > consts::EPSILON) {
        float disc = b * b - a * c;
        if (disc >= 0.0f) {
            float s = std::sqrt(disc);
            side_candidate((-b - s) / a);
            side_candidate((-b + s) / a);
        }
    } else if (std::abs(b) > consts::EPSILON) {
        side_candidate(-c / (2.0f * b));
    }

    // Base disc
    if (std::abs(d.y) > consts::EPSILON) {
        float t = (-h - o.y) / d.y;
        Vec3 p = ray.point_at(t);
        if (p.x * p.x + p.z * p.z <= m_radius * m_radius) {
            consider(t, Vec3(0.0f, -1.0f, 0.0f), FeatureId::face(0));
        }
    }

    return best;
}

// =============================================================================
// Cuboid
// =============================================================================

AABB CuboidShape::local_aabb() const {
    return AABB::from_half_extents(Vec3(0.0f), m_half_extents);
}

std::optional<RayHit> CuboidShape::cast_local_ray(const Ray& ray, float max_toi) const {
    float t_min = -consts::INF;
    float t_max = consts::INF;
    int entry_axis = -1;
    float entry_sign = 0.0f;

    for (int axis = 0; axis < 3; ++axis) {
        float o = ray.origin[axis];
        float d = ray.dir[axis];
        float he = m_half_extents[axis];

        if (std::abs(d) < consts::EPSILON) {
            if (o < -he || o > he) {
                return std::nullopt;
            }
            continue;
        }

        float t1 = (-he - o) / d;
        float t2 = (he - o) / d;
        float sign = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            sign = 1.0f;
        }
        if (t1 > t_min) {
            t_min = t1;
            entry_axis = axis;
            entry_sign = sign;
        }
        t_max = std::min(t_max, t2);
        if (t_min > t_max) {
            return std::nullopt;
        }
    }

    if (entry_axis < 0 || t_min <= 0.0f) {
        // Origin inside (or every axis parallel and contained)
        if (t_max >= 0.0f) {
            return inside_hit();
        }
        return std::nullopt;
    }

    if (t_min > max_toi) {
        return std::nullopt;
    }

    Vec3 normal(0.0f);
    normal[entry_axis] = entry_sign;
    auto face = static_cast<std::uint32_t>(entry_axis + (entry_sign > 0.0f ? 0 : 3));
    return RayHit{t_min, normal, FeatureId::face(face)};
}

// =============================================================================
// Capsule
// =============================================================================

AABB CapsuleShape::local_aabb() const {
    Vec3 r(m_radius);
    return AABB(glm::min(m_a, m_b) - r, glm::max(m_a, m_b) + r);
}

std::optional<RayHit> CapsuleShape::cast_local_ray(const Ray& ray, float max_toi) const {
    Vec3 closest = closest_point_on_segment(m_a, m_b, ray.origin);
    if (glm::distance2(closest, ray.origin) <= m_radius * m_radius) {
        return inside_hit();
    }

    float best = consts::INF;

    // Cylindrical body around the segment
    Vec3 ba = m_b - m_a;
    Vec3 oa = ray.origin - m_a;
    float baba = glm::dot(ba, ba);
    float bard = glm::dot(ba, ray.dir);
    float baoa = glm::dot(ba, oa);
    float rdoa = glm::dot(ray.dir, oa);
    float oaoa = glm::dot(oa, oa);
    float dd = glm::dot(ray.dir, ray.dir);

    float a = baba * dd - bard * bard;
    if (a > consts::EPSILON) {
        float b = baba * rdoa - baoa * bard;
        float c = baba * oaoa - baoa * baoa - m_radius * m_radius * baba;
        float disc = b * b - a * c;
        if (disc >= 0.0f) {
            float t = (-b - std::sqrt(disc)) / a;
            float y = baoa + t * bard;
            if (y > 0.0f && y < baba && t >= 0.0f) {
                best = t;
            }
        }
    }

    // End caps
    for (const Vec3* center : {&m_a, &m_b}) {
        auto t = sphere_entry(*center, m_radius, ray);
        if (t && *t >= 0.0f && *t < best) {
            best = *t;
        }
    }

    if (!accept_toi(best, max_toi)) {
        return std::nullopt;
    }

    Vec3 p = ray.point_at(best);
    Vec3 n = tether_math::try_normalize(p - closest_point_on_segment(m_a, m_b, p));
    return RayHit{best, n, FeatureId::face(0)};
}

// =============================================================================
// Segment
// =============================================================================

AABB SegmentShape::local_aabb() const {
    return AABB(glm::min(m_a, m_b), glm::max(m_a, m_b));
}

std::optional<RayHit> SegmentShape::cast_local_ray(const Ray& ray, float max_toi) const {
    // Closest points between the ray line and the segment
    Vec3 u = ray.dir;
    Vec3 v = m_b - m_a;
    Vec3 w = ray.origin - m_a;
    float a = glm::dot(u, u);
    float b = glm::dot(u, v);
    float c = glm::dot(v, v);
    float d = glm::dot(u, w);
    float e = glm::dot(v, w);
    float denom = a * c - b * b;

    if (a < consts::EPSILON * consts::EPSILON || denom < consts::EPSILON * consts::EPSILON) {
        return std::nullopt;
    }

    float t = (b * e - c * d) / denom;
    float s = std::clamp((a * e - b * d) / denom, 0.0f, 1.0f);

    Vec3 on_ray = ray.point_at(t);
    Vec3 on_segment = m_a + v * s;
    if (glm::distance2(on_ray, on_segment) > 1e-8f || !accept_toi(t, max_toi)) {
        return std::nullopt;
    }

    return RayHit{t, -tether_math::try_normalize(ray.dir), FeatureId::edge(0)};
}

// =============================================================================
// Triangle
// =============================================================================

AABB TriangleShape::local_aabb() const {
    return AABB(glm::min(m_a, glm::min(m_b, m_c)), glm::max(m_a, glm::max(m_b, m_c)));
}

std::optional<RayHit> TriangleShape::cast_local_ray(const Ray& ray, float max_toi) const {
    auto hit = ray_triangle(ray, m_a, m_b, m_c);
    if (!hit || !accept_toi(hit->first, max_toi)) {
        return std::nullopt;
    }
    return RayHit{hit->first, hit->second, FeatureId::face(0)};
}

// =============================================================================
// TriMesh
// =============================================================================

TriMeshShape::TriMeshShape(std::vector<Vec3> vertices, std::vector<Triangle> indices)
    : m_vertices(std::move(vertices))
    , m_indices(std::move(indices))
{
    for (const auto& tri : m_indices) {
        for (std::uint32_t idx : tri) {
            if (idx >= m_vertices.size()) {
                throw std::out_of_range("Trimesh index " + std::to_string(idx) +
                                        " out of range for " + std::to_string(m_vertices.size()) + " vertices");
            }
        }
    }
    for (const auto& v : m_vertices) {
        m_aabb.expand_to_include(v);
    }
}

std::array<Vec3, 3> TriMeshShape::triangle(std::size_t i) const {
    const auto& tri = m_indices[i];
    return {m_vertices[tri[0]], m_vertices[tri[1]], m_vertices[tri[2]]};
}

std::optional<RayHit> TriMeshShape::cast_local_ray(const Ray& ray, float max_toi) const {
    if (!m_aabb.cast_ray(ray, max_toi)) {
        return std::nullopt;
    }

    std::optional<RayHit> best;
    for (std::size_t i = 0; i < m_indices.size(); ++i) {
        auto [a, b, c] = triangle(i);
        auto hit = ray_triangle(ray, a, b, c);
        if (!hit || !accept_toi(hit->first, max_toi)) continue;
        if (!best || hit->first < best->toi) {
            best = RayHit{hit->first, hit->second, FeatureId::face(static_cast<std::uint32_t>(i))};
        }
    }
    return best;
}

// =============================================================================
// HeightField
// =============================================================================

HeightFieldShape::HeightFieldShape(std::uint32_t nrows, std::uint32_t ncols,
                                   std::vector<float> heights, const Vec3& scale)
    : m_nrows(nrows)
    , m_ncols(ncols)
    , m_heights(std::move(heights))
    , m_scale(scale)
{
    if (m_nrows < 2 || m_ncols < 2) {
        throw std::invalid_argument("Heightfield needs at least 2x2 samples");
    }
    if (m_heights.size() != static_cast<std::size_t>(m_nrows) * m_ncols) {
        throw std::invalid_argument("Heightfield expects " + std::to_string(m_nrows * m_ncols) +
                                    " heights, got " + std::to_string(m_heights.size()));
    }
    for (std::uint32_t row = 0; row < m_nrows; ++row) {
        for (std::uint32_t col = 0; col < m_ncols; ++col) {
            m_aabb.expand_to_include(grid_point(row, col));
        }
    }
}

Vec3 HeightFieldShape::grid_point(std::uint32_t row, std::uint32_t col) const {
    float x = -0.5f + static_cast<float>(col) / static_cast<float>(m_ncols - 1);
    float z = -0.5f + static_cast<float>(row) / static_cast<float>(m_nrows - 1);
    return Vec3(x, height_at(row, col), z) * m_scale;
}

std::optional<RayHit> HeightFieldShape::cast_local_ray(const Ray& ray, float max_toi) const {
    if (!m_aabb.cast_ray(ray, max_toi)) {
        return std::nullopt;
    }

    std::optional<RayHit> best;
    for (std::uint32_t row = 0; row + 1 < m_nrows; ++row) {
        for (std::uint32_t col = 0; col + 1 < m_ncols; ++col) {
            Vec3 p00 = grid_point(row, col);
            Vec3 p01 = grid_point(row, col + 1);
            Vec3 p10 = grid_point(row + 1, col);
            Vec3 p11 = grid_point(row + 1, col + 1);

            std::uint32_t cell = row * (m_ncols - 1) + col;
            const std::array<std::array<Vec3, 3>, 2> tris{{{p00, p10, p11}, {p00, p11, p01}}};
            for (std::uint32_t k = 0; k < 2; ++k) {
                auto hit = ray_triangle(ray, tris[k][0], tris[k][1], tris[k][2]);
                if (!hit || !accept_toi(hit->first, max_toi)) continue;
                if (!best || hit->first < best->toi) {
                    best = RayHit{hit->first, hit->second, FeatureId::face(cell * 2 + k)};
                }
            }
        }
    }
    return best;
}

// =============================================================================
// Factories
// =============================================================================

namespace shapes {

SharedShape ball(float radius) {
    return std::make_shared<BallShape>(radius);
}

SharedShape cylinder(float half_height, float radius) {
    return std::make_shared<CylinderShape>(half_height, radius);
}

SharedShape round_cylinder(float half_height, float radius, float border_radius) {
    return std::make_shared<RoundCylinderShape>(half_height, radius, border_radius);
}

SharedShape cone(float half_height, float radius) {
    return std::make_shared<ConeShape>(half_height, radius);
}

SharedShape cuboid(const Vec3& half_extents) {
    return std::make_shared<CuboidShape>(half_extents);
}

SharedShape capsule(const Vec3& a, const Vec3& b, float radius) {
    return std::make_shared<CapsuleShape>(a, b, radius);
}

SharedShape segment(const Vec3& a, const Vec3& b) {
    return std::make_shared<SegmentShape>(a, b);
}

SharedShape triangle(const Vec3& a, const Vec3& b, const Vec3& c) {
    return std::make_shared<TriangleShape>(a, b, c);
}

SharedShape trimesh(std::vector<Vec3> vertices, std::vector<TriMeshShape::Triangle> indices) {
    return std::make_shared<TriMeshShape>(std::move(vertices), std::move(indices));
}

SharedShape heightfield(std::uint32_t nrows, std::uint32_t ncols,
                        std::vector<float> heights, const Vec3& scale) {
    return std::make_shared<HeightFieldShape>(nrows, ncols, std::move(heights), scale);
}

} // namespace shapes

} // namespace tether_physics
