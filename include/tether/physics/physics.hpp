#pragma once

/// @file physics.hpp
/// @brief Physics world with stable engine handles
///
/// Physics owns the solver state (bodies, colliders, joints, pipelines)
/// and three injective tables that translate engine handles to solver
/// handles. Engine handles are what the rest of the engine stores; solver
/// handles never leave this class.
///
/// A world read from storage starts as PendingPhysics, a descriptor set
/// with no live entities. PendingPhysics::resolve is the only way to turn
/// it into a live Physics, so "resolve before use" is enforced by type.

#include "fwd.hpp"
#include "handles.hpp"
#include "shape.hpp"
#include "rigid_body.hpp"
#include "collider.hpp"
#include "joint.hpp"
#include "integration_parameters.hpp"
#include "pipeline.hpp"
#include "query_pipeline.hpp"
#include "desc.hpp"

#include <tether/core/error.hpp>
#include <tether/core/fixed_vector.hpp>
#include <tether/core/visitor.hpp>
#include <tether/math/types.hpp>
#include <tether/math/ray.hpp>
#include <tether/scene/fwd.hpp>
#include <tether/scene/graph.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether_physics {

/// Logger used by the physics layer
std::shared_ptr<spdlog::logger> physics_logger();

// =============================================================================
// Ray Casting
// =============================================================================

/// One ray hit, keyed by engine handle
struct Intersection {
    ColliderHandle collider;
    tether_math::Vec3 normal{0.0f};     ///< World-space surface normal
    tether_math::Vec3 position{0.0f};   ///< World-space hit point
    FeatureId feature;
    float toi = 0.0f;                   ///< Distance along the ray
};

struct RayCastOptions {
    tether_math::Ray ray;
    float max_len = tether_math::consts::MAX_FLOAT;
    InteractionGroups groups;
    bool sort_results = true;
};

/// Adapts a container to receive ray cast results.
/// push returns false when the hit did not fit.
template<typename S>
struct QueryResultsStorage;

template<>
struct QueryResultsStorage<std::vector<Intersection>> {
    static bool push(std::vector<Intersection>& storage, const Intersection& hit) {
        storage.push_back(hit);
        return true;
    }

    static void clear(std::vector<Intersection>& storage) { storage.clear(); }

    static void sort_by_toi(std::vector<Intersection>& storage) {
        std::stable_sort(storage.begin(), storage.end(),
            [](const Intersection& a, const Intersection& b) { return a.toi < b.toi; });
    }
};

template<std::size_t N>
struct QueryResultsStorage<tether_core::FixedVector<Intersection, N>> {
    static bool push(tether_core::FixedVector<Intersection, N>& storage, const Intersection& hit) {
        return storage.try_push(hit);
    }

    static void clear(tether_core::FixedVector<Intersection, N>& storage) { storage.clear(); }

    static void sort_by_toi(tether_core::FixedVector<Intersection, N>& storage) {
        std::stable_sort(storage.begin(), storage.end(),
            [](const Intersection& a, const Intersection& b) { return a.toi < b.toi; });
    }
};

// =============================================================================
// Statistics / Resource Links
// =============================================================================

/// Cumulative timings. The owner resets them once per reporting interval.
struct PerformanceStatistics {
    std::chrono::nanoseconds step_time{0};
    std::chrono::nanoseconds total_ray_cast_time{0};

    void reset() {
        step_time = std::chrono::nanoseconds{0};
        total_ray_cast_time = std::chrono::nanoseconds{0};
    }

    [[nodiscard]] std::string to_string() const;
};

/// Engine handles in a host world that came from one instantiated resource,
/// keyed by the handle the entity has in the resource's own world
struct ResourceLink {
    std::string model;
    std::unordered_map<RigidBodyHandle, RigidBodyHandle> bodies;
    std::unordered_map<ColliderHandle, ColliderHandle> colliders;
    std::unordered_map<JointHandle, JointHandle> joints;

    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);
};

/// Physics content of a resource about to be instantiated
struct ResourceScene {
    std::string path;
    const Physics& physics;
    const tether_scene::PhysicsBinder& binder;
};

// =============================================================================
// PendingPhysics
// =============================================================================

/// Deserialized world waiting for its scene graph
class PendingPhysics {
public:
    PendingPhysics() = default;
    explicit PendingPhysics(PhysicsDesc desc, std::vector<ResourceLink> embedded_resources = {})
        : m_desc(std::move(desc)), m_embedded_resources(std::move(embedded_resources)) {}

    [[nodiscard]] const PhysicsDesc& desc() const noexcept { return m_desc; }
    [[nodiscard]] PhysicsDesc& desc_mut() noexcept { return m_desc; }
    [[nodiscard]] const std::vector<ResourceLink>& embedded_resources() const noexcept { return m_embedded_resources; }

    /// {Desc, EmbeddedResources}
    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor);

    /// Read a world stored by Physics::save
    [[nodiscard]] static tether_core::Result<PendingPhysics> load(const std::string& name,
                                                                  tether_core::Visitor& visitor);

    /// Materialize the live world.
    ///
    /// Bodies are created first, then colliders, then joints. Trimesh
    /// colliders get their geometry from the node `binder` associates with
    /// their parent body; when that node is missing the collider is skipped
    /// and an error is logged. Handles of skipped entities are dropped from
    /// the translation tables.
    [[nodiscard]] Physics resolve(const tether_scene::PhysicsBinder& binder,
                                  const tether_scene::SceneGraphView& graph) const;

private:
    PhysicsDesc m_desc;
    std::vector<ResourceLink> m_embedded_resources;
};

// =============================================================================
// Physics
// =============================================================================

class Physics {
public:
    /// Empty world with gravity (0, -9.81, 0) and default parameters
    Physics();

    // -------------------------------------------------------------------------
    // Entities
    // -------------------------------------------------------------------------

    RigidBodyHandle add_body(RigidBody body);

    /// std::nullopt when `parent` is not a live body
    std::optional<ColliderHandle> add_collider(Collider collider, const RigidBodyHandle& parent);

    /// std::nullopt when either body is not live
    std::optional<JointHandle> add_joint(const RigidBodyHandle& body1, const RigidBodyHandle& body2,
                                         JointParams params);

    /// Removes the body, its colliders and every joint attached to it
    bool remove_body(const RigidBodyHandle& handle);
    bool remove_collider(const ColliderHandle& handle);
    bool remove_joint(const JointHandle& handle, bool wake_up);

    [[nodiscard]] const RigidBody* body(const RigidBodyHandle& handle) const;
    [[nodiscard]] RigidBody* body_mut(const RigidBodyHandle& handle);
    [[nodiscard]] const Collider* collider(const ColliderHandle& handle) const;
    [[nodiscard]] Collider* collider_mut(const ColliderHandle& handle);
    [[nodiscard]] const Joint* joint(const JointHandle& handle) const;

    [[nodiscard]] bool contains_body(const RigidBodyHandle& handle) const { return body(handle) != nullptr; }
    [[nodiscard]] bool contains_collider(const ColliderHandle& handle) const { return collider(handle) != nullptr; }

    /// Engine handle of the body owning `handle`
    [[nodiscard]] std::optional<RigidBodyHandle> collider_parent(const ColliderHandle& handle) const;

    // -------------------------------------------------------------------------
    // Simulation / Queries
    // -------------------------------------------------------------------------

    /// Advance by one tick of `integration_parameters().dt`
    void step();

    /// Collect every collider hit by `opts.ray` into `storage`.
    ///
    /// The query tree is rebuilt on every call so it never refers to
    /// removed colliders. Returns the number of hits that did not fit into
    /// `storage`.
    template<typename S>
    std::size_t cast_ray(const RayCastOptions& opts, S& storage);

    // -------------------------------------------------------------------------
    // Descriptors / Geometry
    // -------------------------------------------------------------------------

    /// Snapshot of the live state. Solver handles are renumbered densely
    /// (i, 0) in iteration order, so unchanged worlds produce identical
    /// descriptors.
    [[nodiscard]] PhysicsDesc generate_desc() const;

    /// Bake the meshes under `root` into one triangle mesh, expressed in the
    /// frame of `root` with scale kept. An empty subtree gives a single
    /// degenerate triangle and a warning.
    [[nodiscard]] static SharedShape make_trimesh(tether_scene::NodeHandle root,
                                                  const tether_scene::SceneGraphView& graph);

    /// Static body at the global pose of `root` with a frictionless trimesh
    /// collider built from its subtree
    RigidBodyHandle mesh_to_trimesh(tether_scene::NodeHandle root, const tether_scene::SceneGraphView& graph);

    /// Instantiate `resource` into this world. `old_to_new` maps the nodes
    /// of the resource scene to their copies in the target scene.
    void embed_resource(tether_scene::PhysicsBinder& target_binder,
                        const tether_scene::SceneGraphView& target_graph,
                        const tether_scene::Graph::NodeRemap& old_to_new,
                        const ResourceScene& resource);

    /// Independent copy built from generate_desc()
    [[nodiscard]] Physics deep_copy(const tether_scene::PhysicsBinder& binder,
                                    const tether_scene::SceneGraphView& graph) const;

    /// Body frames and collider outlines
    void draw(tether_scene::SceneDrawingContext& context) const;

    // -------------------------------------------------------------------------
    // Persistence
    // -------------------------------------------------------------------------

    /// Use `desc` instead of generate_desc() on the next saves
    void set_desc_override(PhysicsDesc desc) { m_desc_override = std::move(desc); }
    void clear_desc_override() { m_desc_override.reset(); }
    [[nodiscard]] bool has_desc_override() const noexcept { return m_desc_override.has_value(); }

    /// Write {Desc, EmbeddedResources}. `visitor` must be writing.
    [[nodiscard]] tether_core::Result<void> save(const std::string& name, tether_core::Visitor& visitor) const;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] const tether_math::Vec3& gravity() const noexcept { return m_gravity; }
    void set_gravity(const tether_math::Vec3& gravity) { m_gravity = gravity; }

    [[nodiscard]] const IntegrationParameters& integration_parameters() const noexcept { return m_integration_parameters; }
    void set_integration_parameters(const IntegrationParameters& params) { m_integration_parameters = params; }

    [[nodiscard]] const PerformanceStatistics& performance() const noexcept { return m_performance; }
    [[nodiscard]] PerformanceStatistics& performance_mut() noexcept { return m_performance; }

    [[nodiscard]] const BodyHandleMap& body_handle_map() const noexcept { return m_body_handle_map; }
    [[nodiscard]] const ColliderHandleMap& collider_handle_map() const noexcept { return m_collider_handle_map; }
    [[nodiscard]] const JointHandleMap& joint_handle_map() const noexcept { return m_joint_handle_map; }

    [[nodiscard]] const std::vector<ResourceLink>& embedded_resources() const noexcept { return m_embedded_resources; }

    [[nodiscard]] const RigidBodySet& bodies() const noexcept { return m_bodies; }
    [[nodiscard]] const ColliderSet& colliders() const noexcept { return m_colliders; }
    [[nodiscard]] const JointSet& joints() const noexcept { return m_joints; }

    [[nodiscard]] std::size_t body_count() const noexcept { return m_bodies.len(); }
    [[nodiscard]] std::size_t collider_count() const noexcept { return m_colliders.len(); }
    [[nodiscard]] std::size_t joint_count() const noexcept { return m_joints.len(); }

private:
    friend class PendingPhysics;

    RigidBodySet m_bodies;
    ColliderSet m_colliders;
    JointSet m_joints;
    PhysicsPipeline m_pipeline;
    QueryPipeline m_query;

    tether_math::Vec3 m_gravity{0.0f, -9.81f, 0.0f};
    IntegrationParameters m_integration_parameters;

    BodyHandleMap m_body_handle_map;
    ColliderHandleMap m_collider_handle_map;
    JointHandleMap m_joint_handle_map;

    PerformanceStatistics m_performance;
    std::vector<ResourceLink> m_embedded_resources;
    std::optional<PhysicsDesc> m_desc_override;
};

// =============================================================================
// Template Implementation
// =============================================================================

template<typename S>
std::size_t Physics::cast_ray(const RayCastOptions& opts, S& storage) {
    using Storage = QueryResultsStorage<S>;
    auto start = std::chrono::steady_clock::now();

    m_query.update(m_bodies, m_colliders);
    Storage::clear(storage);

    const tether_math::Ray ray = opts.ray.normalized();
    std::size_t dropped = 0;
    m_query.intersections_with_ray(m_colliders, ray, opts.max_len, opts.groups,
        [&](RawColliderHandle raw, const RayHit& hit) {
            auto handle = m_collider_handle_map.key_of(raw);
            if (!handle) {
                return true;
            }
            Intersection intersection{*handle, hit.normal, ray.point_at(hit.toi), hit.feature, hit.toi};
            if (!Storage::push(storage, intersection)) {
                ++dropped;
            }
            return true;
        });

    if (opts.sort_results) {
        Storage::sort_by_toi(storage);
    }

    m_performance.total_ray_cast_time += std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
    return dropped;
}

} // namespace tether_physics
