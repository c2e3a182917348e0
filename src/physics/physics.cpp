/// @file physics.cpp
/// @brief Physics world, resolve and embed

#include <tether/physics/physics.hpp>
#include <tether/physics/raw_mesh.hpp>
#include <tether/core/log.hpp>
#include <tether/scene/drawing_context.hpp>
#include <tether/scene/physics_binder.hpp>

#include <sstream>

namespace tether_physics {

using tether_core::Err;
using tether_core::Ok;
using tether_core::Result;
using tether_math::Mat4;
using tether_math::Vec3;
using tether_math::Vec4;
using tether_scene::NodeHandle;

std::shared_ptr<spdlog::logger> physics_logger() {
    return tether_core::get_logger("physics");
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

/// Renumber the solver side of `map` to (i, 0), i being the position of the
/// handle in `order`
template<typename EngineH, typename RawH>
tether_core::BiDirHashMap<EngineH, RawH> to_dense(const tether_core::BiDirHashMap<EngineH, RawH>& map,
                                                  const std::vector<RawH>& order) {
    std::unordered_map<RawH, RawH> dense;
    dense.reserve(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        dense.emplace(order[i], RawH::from_raw_parts(static_cast<std::uint32_t>(i), 0));
    }

    tether_core::BiDirHashMap<EngineH, RawH> result;
    for (const auto& [engine, raw] : map.forward_map()) {
        auto it = dense.find(raw);
        if (it != dense.end()) {
            result.insert(engine, it->second);
        }
    }
    return result;
}

/// Replace persisted (i, 0) handles with the live handle created for
/// descriptor i. Entries whose descriptor was skipped are dropped.
template<typename EngineH, typename RawH>
tether_core::BiDirHashMap<EngineH, RawH> to_live(const tether_core::BiDirHashMap<EngineH, RawH>& persisted,
                                                 const std::vector<std::optional<RawH>>& created) {
    tether_core::BiDirHashMap<EngineH, RawH> result;
    for (const auto& [engine, raw] : persisted.forward_map()) {
        if (raw.index < created.size() && created[raw.index]) {
            result.insert(engine, *created[raw.index]);
        }
    }
    return result;
}

Vec3 transform_point(const Mat4& m, const Vec3& p) {
    return Vec3(m * Vec4(p, 1.0f));
}

} // namespace

// =============================================================================
// PerformanceStatistics
// =============================================================================

std::string PerformanceStatistics::to_string() const {
    std::ostringstream ss;
    ss << "Physics Step Time: " << std::chrono::duration<double, std::milli>(step_time).count() << " ms\n"
       << "Physics Ray Cast Time: " << std::chrono::duration<double, std::milli>(total_ray_cast_time).count() << " ms";
    return ss.str();
}

// =============================================================================
// ResourceLink
// =============================================================================

Result<void> ResourceLink::visit(const std::string& name, tether_core::Visitor& visitor) {
    tether_core::RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Model", model));
    TETHER_TRY(tether_core::visit(visitor, "Bodies", bodies));
    TETHER_TRY(tether_core::visit(visitor, "Colliders", colliders));
    TETHER_TRY(tether_core::visit(visitor, "Joints", joints));
    return Ok();
}

// =============================================================================
// PendingPhysics
// =============================================================================

Result<void> PendingPhysics::visit(const std::string& name, tether_core::Visitor& visitor) {
    tether_core::RegionScope region(visitor, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(tether_core::visit(visitor, "Desc", m_desc));
    TETHER_TRY(tether_core::visit(visitor, "EmbeddedResources", m_embedded_resources));
    return Ok();
}

Result<PendingPhysics> PendingPhysics::load(const std::string& name, tether_core::Visitor& visitor) {
    if (!visitor.is_reading()) {
        return Err<PendingPhysics>(tether_core::PhysicsError::invalid_state("load needs a reading visitor"));
    }
    PendingPhysics pending;
    auto result = pending.visit(name, visitor);
    if (result.is_err()) {
        return Err<PendingPhysics>(std::move(result.error()));
    }
    return pending;
}

Physics PendingPhysics::resolve(const tether_scene::PhysicsBinder& binder,
                                const tether_scene::SceneGraphView& graph) const {
    auto logger = physics_logger();

    Physics physics;
    physics.m_integration_parameters = m_desc.integration_parameters.into_parameters();
    physics.m_gravity = m_desc.gravity;
    physics.m_embedded_resources = m_embedded_resources;

    // Bodies go into a fresh pool, so descriptor i lands in slot (i, 0)
    std::vector<std::optional<RawBodyHandle>> bodies;
    bodies.reserve(m_desc.bodies.size());
    for (const auto& desc : m_desc.bodies) {
        bodies.emplace_back(physics.m_bodies.insert(desc.convert_to_body()));
    }
    physics.m_body_handle_map = to_live(m_desc.body_handle_map, bodies);

    std::vector<std::optional<RawColliderHandle>> colliders;
    colliders.reserve(m_desc.colliders.size());
    for (const auto& desc : m_desc.colliders) {
        colliders.emplace_back(std::nullopt);

        auto parent = physics.m_body_handle_map.value_of(desc.parent);
        if (!parent) {
            logger->error("Collider parent {} does not exist, collider skipped!", desc.parent.to_string());
            continue;
        }

        Collider collider = desc.convert_to_collider();
        if (desc.shape.is_trimesh()) {
            // Trimesh geometry is never stored, it comes from the bound mesh node
            auto node = binder.node_of(desc.parent);
            if (!node) {
                logger->error("Unable to get geometry for trimesh, body {} has no bound node!",
                              desc.parent.to_string());
                continue;
            }
            if (!graph.is_valid_handle(*node)) {
                logger->error("Unable to get geometry for trimesh, node at handle {} does not exists!",
                              node->to_string());
                continue;
            }
            collider.set_shape(Physics::make_trimesh(*node, graph));
            logger->info("Geometry for trimesh {} was restored from node at handle {}!",
                         desc.parent.to_string(), node->to_string());
        }

        RawColliderHandle raw = physics.m_colliders.insert(std::move(collider), *parent, physics.m_bodies);
        if (raw.is_valid()) {
            colliders.back() = raw;
        }
    }
    physics.m_collider_handle_map = to_live(m_desc.collider_handle_map, colliders);

    std::vector<std::optional<RawJointHandle>> joints;
    joints.reserve(m_desc.joints.size());
    for (const auto& desc : m_desc.joints) {
        joints.emplace_back(std::nullopt);

        auto body1 = physics.m_body_handle_map.value_of(desc.body1);
        auto body2 = physics.m_body_handle_map.value_of(desc.body2);
        if (!body1 || !body2) {
            logger->error("Joint between {} and {} references a missing body, joint skipped!",
                          desc.body1.to_string(), desc.body2.to_string());
            continue;
        }

        RawJointHandle raw = physics.m_joints.insert(physics.m_bodies, *body1, *body2, desc.params.into_params());
        if (raw.is_valid()) {
            joints.back() = raw;
        }
    }
    physics.m_joint_handle_map = to_live(m_desc.joint_handle_map, joints);

    return physics;
}

// =============================================================================
// Physics - Entities
// =============================================================================

Physics::Physics() = default;

RigidBodyHandle Physics::add_body(RigidBody body) {
    RawBodyHandle raw = m_bodies.insert(std::move(body));
    RigidBodyHandle handle = RigidBodyHandle::generate();
    m_body_handle_map.insert(handle, raw);
    return handle;
}

std::optional<ColliderHandle> Physics::add_collider(Collider collider, const RigidBodyHandle& parent) {
    auto raw_parent = m_body_handle_map.value_of(parent);
    if (!raw_parent) {
        return std::nullopt;
    }
    RawColliderHandle raw = m_colliders.insert(std::move(collider), *raw_parent, m_bodies);
    if (!raw.is_valid()) {
        return std::nullopt;
    }
    ColliderHandle handle = ColliderHandle::generate();
    m_collider_handle_map.insert(handle, raw);
    return handle;
}

std::optional<JointHandle> Physics::add_joint(const RigidBodyHandle& body1, const RigidBodyHandle& body2,
                                              JointParams params) {
    auto raw1 = m_body_handle_map.value_of(body1);
    auto raw2 = m_body_handle_map.value_of(body2);
    if (!raw1 || !raw2) {
        return std::nullopt;
    }
    RawJointHandle raw = m_joints.insert(m_bodies, *raw1, *raw2, std::move(params));
    if (!raw.is_valid()) {
        return std::nullopt;
    }
    JointHandle handle = JointHandle::generate();
    m_joint_handle_map.insert(handle, raw);
    return handle;
}

bool Physics::remove_body(const RigidBodyHandle& handle) {
    auto raw = m_body_handle_map.remove_by_key(handle);
    if (!raw) {
        return false;
    }

    std::vector<RawJointHandle> removed_joints;
    auto removed = m_bodies.remove(*raw, m_colliders, m_joints, &removed_joints);
    if (!removed) {
        return false;
    }

    for (RawColliderHandle collider : removed->colliders()) {
        m_collider_handle_map.remove_by_value(collider);
    }
    for (RawJointHandle joint : removed_joints) {
        m_joint_handle_map.remove_by_value(joint);
    }
    return true;
}

bool Physics::remove_collider(const ColliderHandle& handle) {
    auto raw = m_collider_handle_map.remove_by_key(handle);
    if (!raw) {
        return false;
    }
    return m_colliders.remove(*raw, m_bodies, true).has_value();
}

bool Physics::remove_joint(const JointHandle& handle, bool wake_up) {
    auto raw = m_joint_handle_map.remove_by_key(handle);
    if (!raw) {
        return false;
    }
    return m_joints.remove(*raw, m_bodies, wake_up).has_value();
}

const RigidBody* Physics::body(const RigidBodyHandle& handle) const {
    auto raw = m_body_handle_map.value_of(handle);
    return raw ? m_bodies.get(*raw) : nullptr;
}

RigidBody* Physics::body_mut(const RigidBodyHandle& handle) {
    auto raw = m_body_handle_map.value_of(handle);
    return raw ? m_bodies.get_mut(*raw) : nullptr;
}

const Collider* Physics::collider(const ColliderHandle& handle) const {
    auto raw = m_collider_handle_map.value_of(handle);
    return raw ? m_colliders.get(*raw) : nullptr;
}

Collider* Physics::collider_mut(const ColliderHandle& handle) {
    auto raw = m_collider_handle_map.value_of(handle);
    return raw ? m_colliders.get_mut(*raw) : nullptr;
}

const Joint* Physics::joint(const JointHandle& handle) const {
    auto raw = m_joint_handle_map.value_of(handle);
    return raw ? m_joints.get(*raw) : nullptr;
}

std::optional<RigidBodyHandle> Physics::collider_parent(const ColliderHandle& handle) const {
    const Collider* c = collider(handle);
    if (!c) {
        return std::nullopt;
    }
    return m_body_handle_map.key_of(c->parent());
}

// =============================================================================
// Physics - Simulation
// =============================================================================

void Physics::step() {
    auto start = std::chrono::steady_clock::now();
    m_pipeline.step(m_gravity, m_integration_parameters, m_bodies, m_colliders, m_joints);
    m_performance.step_time += std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
}

// =============================================================================
// Physics - Descriptors / Geometry
// =============================================================================

PhysicsDesc Physics::generate_desc() const {
    PhysicsDesc desc;
    desc.integration_parameters = IntegrationParametersDesc(m_integration_parameters);
    desc.gravity = m_gravity;

    desc.bodies.reserve(m_bodies.len());
    m_bodies.for_each([&](RawBodyHandle, const RigidBody& body) {
        desc.bodies.push_back(RigidBodyDesc::from_body(body, m_collider_handle_map));
    });

    desc.colliders.reserve(m_colliders.len());
    m_colliders.for_each([&](RawColliderHandle, const Collider& collider) {
        desc.colliders.push_back(ColliderDesc::from_collider(collider, m_body_handle_map));
    });

    desc.joints.reserve(m_joints.len());
    m_joints.for_each([&](RawJointHandle, const Joint& joint) {
        desc.joints.push_back(JointDesc::from_joint(joint, m_body_handle_map));
    });

    desc.body_handle_map = to_dense(m_body_handle_map, m_bodies.handles());
    desc.collider_handle_map = to_dense(m_collider_handle_map, m_colliders.handles());
    desc.joint_handle_map = to_dense(m_joint_handle_map, m_joints.handles());
    return desc;
}

SharedShape Physics::make_trimesh(NodeHandle root, const tether_scene::SceneGraphView& graph) {
    RawMeshBuilder builder;

    // Drops the root's rotation and translation but keeps its scale, since
    // the body placed at the root supplies the rest
    const Mat4 root_inv_transform = glm::inverse(graph.isometric_global_transform(root));

    std::vector<NodeHandle> stack{root};
    while (!stack.empty()) {
        NodeHandle handle = stack.back();
        stack.pop_back();

        const tether_scene::Node* node = graph.node(handle);
        if (!node) {
            continue;
        }

        if (node->mesh) {
            const Mat4 transform = root_inv_transform * graph.global_transform(handle);
            for (const auto& surface : node->mesh->surfaces) {
                const auto& positions = surface.positions;
                for (const auto& triangle : surface.triangles) {
                    if (triangle[0] >= positions.size() || triangle[1] >= positions.size() ||
                        triangle[2] >= positions.size()) {
                        continue;
                    }
                    builder.insert(transform_point(transform, positions[triangle[0]]));
                    builder.insert(transform_point(transform, positions[triangle[1]]));
                    builder.insert(transform_point(transform, positions[triangle[2]]));
                }
            }
        }

        stack.insert(stack.end(), node->children.begin(), node->children.end());
    }

    RawMesh mesh = std::move(builder).build();
    if (mesh.triangles.empty()) {
        const tether_scene::Node* node = graph.node(root);
        physics_logger()->warn("Failed to create triangle mesh collider for {}, it has no vertices!",
                               node ? node->name : root.to_string());
        return shapes::trimesh(std::vector<Vec3>{Vec3(0.0f)},
                               std::vector<TriMeshShape::Triangle>{TriMeshShape::Triangle{0, 0, 0}});
    }
    return shapes::trimesh(std::move(mesh.vertices), std::move(mesh.triangles));
}

RigidBodyHandle Physics::mesh_to_trimesh(NodeHandle root, const tether_scene::SceneGraphView& graph) {
    Collider collider = ColliderBuilder(make_trimesh(root, graph)).friction(0.0f).build();

    auto [rotation, position] = graph.isometric_global_rotation_position(root);
    RigidBodyHandle handle = add_body(RigidBodyBuilder::new_static()
        .position(tether_math::Isometry{position, rotation})
        .build());

    // Cannot fail, the parent was just added
    auto collider_handle = add_collider(std::move(collider), handle);
    if (!collider_handle) {
        physics_logger()->error("Failed to attach trimesh collider to body {}!", handle.to_string());
    }
    return handle;
}

void Physics::embed_resource(tether_scene::PhysicsBinder& target_binder,
                             const tether_scene::SceneGraphView& target_graph,
                             const tether_scene::Graph::NodeRemap& old_to_new,
                             const ResourceScene& resource) {
    auto logger = physics_logger();
    const Physics& source = resource.physics;

    ResourceLink link;
    link.model = resource.path;

    // Bodies first, colliders and joints refer to them
    source.m_bodies.for_each([&](RawBodyHandle raw, const RigidBody& body) {
        auto source_handle = source.m_body_handle_map.key_of(raw);
        if (!source_handle) {
            return;
        }
        RigidBodyDesc desc = RigidBodyDesc::from_body(body, source.m_collider_handle_map);
        link.bodies.emplace(*source_handle, add_body(desc.convert_to_body()));
    });

    for (const auto& [source_node, source_body] : resource.binder.forward_map()) {
        auto new_node = old_to_new.find(source_node);
        auto new_body = link.bodies.find(source_body);
        if (new_node == old_to_new.end() || new_body == link.bodies.end()) {
            logger->error("Unable to rebind node {} of resource {}, it has no instance!",
                          source_node.to_string(), resource.path);
            continue;
        }
        target_binder.bind(new_node->second, new_body->second);
    }

    source.m_colliders.for_each([&](RawColliderHandle raw, const Collider& collider) {
        auto source_handle = source.m_collider_handle_map.key_of(raw);
        if (!source_handle) {
            return;
        }

        ColliderDesc desc = ColliderDesc::from_collider(collider, source.m_body_handle_map);
        auto parent = link.bodies.find(desc.parent);
        if (parent == link.bodies.end()) {
            logger->error("Collider {} of resource {} has no parent, collider skipped!",
                          source_handle->to_string(), resource.path);
            return;
        }

        Collider instance = desc.convert_to_collider();
        if (desc.shape.is_trimesh()) {
            // Geometry comes from the instantiated node, not from the resource
            auto node = target_binder.node_of(parent->second);
            if (!node || !target_graph.is_valid_handle(*node)) {
                logger->error("Unable to get geometry for trimesh collider {} of resource {}!",
                              source_handle->to_string(), resource.path);
                return;
            }
            instance.set_shape(make_trimesh(*node, target_graph));
        }

        if (auto new_handle = add_collider(std::move(instance), parent->second)) {
            link.colliders.emplace(*source_handle, *new_handle);
        }
    });

    source.m_joints.for_each([&](RawJointHandle raw, const Joint& joint) {
        auto source_handle = source.m_joint_handle_map.key_of(raw);
        if (!source_handle) {
            return;
        }

        JointDesc desc = JointDesc::from_joint(joint, source.m_body_handle_map);
        auto body1 = link.bodies.find(desc.body1);
        auto body2 = link.bodies.find(desc.body2);
        if (body1 == link.bodies.end() || body2 == link.bodies.end()) {
            logger->error("Joint {} of resource {} references a missing body, joint skipped!",
                          source_handle->to_string(), resource.path);
            return;
        }

        if (auto new_handle = add_joint(body1->second, body2->second, desc.params.into_params())) {
            link.joints.emplace(*source_handle, *new_handle);
        }
    });

    m_embedded_resources.push_back(std::move(link));

    logger->info("Resource {} was successfully embedded into physics world!", resource.path);
}

Physics Physics::deep_copy(const tether_scene::PhysicsBinder& binder,
                           const tether_scene::SceneGraphView& graph) const {
    return PendingPhysics(generate_desc(), m_embedded_resources).resolve(binder, graph);
}

void Physics::draw(tether_scene::SceneDrawingContext& context) const {
    m_bodies.for_each([&](RawBodyHandle, const RigidBody& body) {
        context.draw_transform(body.position().to_mat4());
    });

    const tether_scene::Color color = tether_scene::Color::opaque(200, 200, 200);

    m_colliders.for_each([&](RawColliderHandle, const Collider& collider) {
        const RigidBody* body = m_bodies.get(collider.parent());
        if (!body) {
            return;
        }
        const Mat4 transform = body->position().to_mat4() * collider.position_wrt_parent().to_mat4();
        const IShape& shape = collider.shape();

        switch (shape.type()) {
            case ShapeType::TriMesh: {
                const auto* trimesh = shape.as<TriMeshShape>();
                for (std::size_t i = 0; i < trimesh->triangle_count(); ++i) {
                    auto corners = trimesh->triangle(i);
                    context.draw_triangle(transform_point(transform, corners[0]),
                                          transform_point(transform, corners[1]),
                                          transform_point(transform, corners[2]), color);
                }
                break;
            }
            case ShapeType::Cuboid: {
                const Vec3& half = shape.as<CuboidShape>()->half_extents();
                tether_math::AABB box;
                box.min = -half;
                box.max = half;
                context.draw_oob(box, transform, color);
                break;
            }
            case ShapeType::Ball:
                context.draw_sphere(transform_point(transform, Vec3(0.0f)), 10, 10,
                                    shape.as<BallShape>()->radius(), color);
                break;
            case ShapeType::Cone: {
                const auto* cone = shape.as<ConeShape>();
                context.draw_cone(10, cone->radius(), cone->half_height() * 2.0f, transform, color);
                break;
            }
            case ShapeType::Cylinder: {
                const auto* cylinder = shape.as<CylinderShape>();
                context.draw_cylinder(10, cylinder->radius(), cylinder->half_height() * 2.0f, true, transform, color);
                break;
            }
            case ShapeType::RoundCylinder: {
                const auto* round = shape.as<RoundCylinderShape>();
                context.draw_cylinder(10, round->radius(), round->half_height() * 2.0f, false, transform, color);
                break;
            }
            case ShapeType::Triangle: {
                const auto* triangle = shape.as<TriangleShape>();
                context.draw_triangle(transform_point(transform, triangle->a()),
                                      transform_point(transform, triangle->b()),
                                      transform_point(transform, triangle->c()), color);
                break;
            }
            case ShapeType::Capsule: {
                const auto* capsule = shape.as<CapsuleShape>();
                context.draw_segment_capsule(capsule->a(), capsule->b(), capsule->radius(), 10, 10, transform, color);
                break;
            }
            case ShapeType::Segment: {
                const auto* segment = shape.as<SegmentShape>();
                context.add_line(tether_scene::Line{transform_point(transform, segment->a()),
                                                    transform_point(transform, segment->b()), color});
                break;
            }
            case ShapeType::HeightField:
                break;
        }
    });
}

// =============================================================================
// Physics - Persistence
// =============================================================================

Result<void> Physics::save(const std::string& name, tether_core::Visitor& visitor) const {
    if (visitor.is_reading()) {
        return Err(tether_core::PhysicsError::invalid_state("save needs a writing visitor"));
    }

    PendingPhysics snapshot(m_desc_override ? *m_desc_override : generate_desc(), m_embedded_resources);
    return snapshot.visit(name, visitor);
}

} // namespace tether_physics
