/// @file raw_mesh.hpp
/// @brief Vertex-welding triangle list builder

#pragma once

#include <tether/math/types.hpp>

#include <array>
#include <bit>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tether_physics {

/// Indexed triangle list produced by RawMeshBuilder
struct RawMesh {
    std::vector<tether_math::Vec3> vertices;
    std::vector<std::array<std::uint32_t, 3>> triangles;
};

/// Collects vertices three at a time and welds bit-identical positions
/// into a single index.
class RawMeshBuilder {
public:
    RawMeshBuilder(std::size_t vertex_capacity = 0, std::size_t triangle_capacity = 0) {
        m_vertices.reserve(vertex_capacity);
        m_indices.reserve(triangle_capacity * 3);
    }

    /// Add one vertex. Every third call closes a triangle.
    /// @return true if the vertex was new
    bool insert(const tether_math::Vec3& vertex) {
        Key key{std::bit_cast<std::uint32_t>(vertex.x),
                std::bit_cast<std::uint32_t>(vertex.y),
                std::bit_cast<std::uint32_t>(vertex.z)};

        auto [it, inserted] = m_lookup.try_emplace(key, static_cast<std::uint32_t>(m_vertices.size()));
        if (inserted) {
            m_vertices.push_back(vertex);
        }
        m_indices.push_back(it->second);
        return inserted;
    }

    [[nodiscard]] std::size_t vertex_count() const noexcept { return m_vertices.size(); }

    /// Finish the mesh. A trailing incomplete triangle is dropped.
    [[nodiscard]] RawMesh build() && {
        RawMesh mesh;
        mesh.vertices = std::move(m_vertices);
        mesh.triangles.reserve(m_indices.size() / 3);
        for (std::size_t i = 0; i + 2 < m_indices.size(); i += 3) {
            mesh.triangles.push_back({m_indices[i], m_indices[i + 1], m_indices[i + 2]});
        }
        return mesh;
    }

private:
    using Key = std::array<std::uint32_t, 3>;

    struct KeyHash {
        std::size_t operator()(const Key& k) const noexcept {
            std::uint64_t h = 0xcbf29ce484222325ULL;
            for (std::uint32_t part : k) {
                h ^= part;
                h *= 0x100000001b3ULL;
            }
            return static_cast<std::size_t>(h);
        }
    };

    std::vector<tether_math::Vec3> m_vertices;
    std::vector<std::uint32_t> m_indices;
    std::unordered_map<Key, std::uint32_t, KeyHash> m_lookup;
};

} // namespace tether_physics
