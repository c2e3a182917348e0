/// @file main.cpp
/// @brief Physics integration demo
///
/// Builds a small scene with a trimesh ground and a falling ball, saves the
/// world to JSON, reloads and resolves it against the scene, then embeds a
/// crate resource and casts a ray through everything.
///
/// Options use the layered config: `--physics-dt=0.01`,
/// `--physics-gravity-y=-1.62`, `--log-level=debug`, or TETHER_* variables.
/// `--demo.save_path=world.json` also writes the saved world to disk.

#include <tether/core/config.hpp>
#include <tether/core/log.hpp>
#include <tether/core/visitor.hpp>
#include <tether/physics/config.hpp>
#include <tether/physics/physics.hpp>
#include <tether/scene/drawing_context.hpp>
#include <tether/scene/graph.hpp>
#include <tether/scene/physics_binder.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace tether_physics;
using tether_math::Vec3;

namespace {

/// Flat 20x20 quad on the XZ plane
tether_scene::Mesh make_ground_mesh() {
    tether_scene::SurfaceData surface;
    surface.positions = {
        Vec3(-10.0f, 0.0f, -10.0f),
        Vec3(10.0f, 0.0f, -10.0f),
        Vec3(10.0f, 0.0f, 10.0f),
        Vec3(-10.0f, 0.0f, 10.0f),
    };
    surface.triangles.push_back({0, 2, 1});
    surface.triangles.push_back({0, 3, 2});

    tether_scene::Mesh mesh;
    mesh.surfaces.push_back(std::move(surface));
    return mesh;
}

/// Resource with a single dynamic crate bound to its root node
struct CrateResource {
    tether_scene::Graph graph;
    tether_scene::PhysicsBinder binder;
    Physics physics;
    tether_scene::NodeHandle crate;

    CrateResource() {
        tether_scene::Node node("Crate");
        node.local_transform.position = Vec3(2.0f, 3.0f, 0.0f);
        crate = graph.add_node(std::move(node));

        RigidBodyHandle body = physics.add_body(RigidBodyBuilder::new_dynamic()
            .translation(Vec3(2.0f, 3.0f, 0.0f))
            .build());
        auto collider = physics.add_collider(ColliderBuilder(shapes::cuboid(Vec3(0.5f))).build(), body);
        if (!collider) {
            TETHER_LOG_ERROR("Crate collider was rejected");
        }
        binder.bind(crate, body);
    }
};

void report_hits(Physics& physics, const tether_math::Ray& ray) {
    TETHER_LOG_FUNC();

    std::vector<Intersection> hits;
    std::size_t dropped = physics.cast_ray(RayCastOptions{ray, 100.0f, InteractionGroups::all(), true}, hits);

    tether_core::log_structured(spdlog::level::info, "demo", "Ray cast", {
        {"origin_y", std::to_string(ray.origin.y)},
        {"hits", std::to_string(hits.size())},
        {"dropped", std::to_string(dropped)},
    });
    for (const auto& hit : hits) {
        TETHER_LOG_INFO("  {} at toi {:.3f}, point ({:.2f}, {:.2f}, {:.2f})",
                        hit.collider.to_string(), hit.toi, hit.position.x, hit.position.y, hit.position.z);
    }
}

} // namespace

int main(int argc, char** argv) {
    tether_core::ConfigManager config;
    config.setup_defaults();
    config.load_environment();
    if (auto result = config.parse_args(argc, argv); result.is_err()) {
        TETHER_LOG_ERROR("{}", result.error().message());
        return EXIT_FAILURE;
    }
    tether_core::configure_logging(config.build_log_config());

    const PhysicsConfig physics_config = build_physics_config(config);

    // -------------------------------------------------------------------------
    // Scene and live world
    // -------------------------------------------------------------------------

    tether_scene::Graph graph;
    tether_scene::PhysicsBinder binder;
    Physics physics;
    apply_physics_config(physics_config, physics);

    tether_scene::Node ground_node("Ground");
    ground_node.mesh = make_ground_mesh();
    tether_scene::NodeHandle ground = graph.add_node(std::move(ground_node));
    binder.bind(ground, physics.mesh_to_trimesh(ground, graph));

    tether_scene::Node ball_node("Ball");
    ball_node.local_transform.position = Vec3(0.0f, 5.0f, 0.0f);
    tether_scene::NodeHandle ball_node_handle = graph.add_node(std::move(ball_node));

    RigidBodyHandle ball = physics.add_body(RigidBodyBuilder::new_dynamic()
        .translation(Vec3(0.0f, 5.0f, 0.0f))
        .build());
    if (!physics.add_collider(ColliderBuilder(shapes::ball(0.5f)).restitution(0.3f).build(), ball)) {
        TETHER_LOG_ERROR("Ball collider was rejected");
        return EXIT_FAILURE;
    }
    binder.bind(ball_node_handle, ball);

    {
        TETHER_LOG_SCOPE("simulate");
        for (int i = 0; i < 30; ++i) {
            physics.step();
        }
    }
    if (const RigidBody* body = physics.body(ball)) {
        TETHER_LOG_INFO("Ball height after 30 steps: {:.3f}", body->position().translation.y);
    }

    // -------------------------------------------------------------------------
    // Save, reload, resolve
    // -------------------------------------------------------------------------

    tether_core::Visitor writer = tether_core::Visitor::writer();
    if (auto result = physics.save("Physics", writer); result.is_err()) {
        TETHER_LOG_ERROR("Save failed: {}", result.error().message());
        return EXIT_FAILURE;
    }
    const std::string json = writer.to_json();
    TETHER_LOG_INFO("Saved world: {} bytes of JSON", json.size());

    const std::string save_path = config.get_string("demo.save_path", "");
    if (!save_path.empty()) {
        if (auto result = writer.save_file(save_path, tether_core::VisitorFormat::Json); result.is_err()) {
            TETHER_LOG_ERROR("Writing {} failed: {}", save_path, result.error().message());
        }
    }

    auto reader = tether_core::Visitor::from_json(json);
    if (reader.is_err()) {
        TETHER_LOG_ERROR("Parse failed: {}", reader.error().message());
        return EXIT_FAILURE;
    }
    auto pending = PendingPhysics::load("Physics", reader.value());
    if (pending.is_err()) {
        TETHER_LOG_ERROR("Load failed: {}", pending.error().message());
        return EXIT_FAILURE;
    }
    Physics restored = pending.value().resolve(binder, graph);
    TETHER_LOG_INFO("Restored world: {} bodies, {} colliders, ball kept its handle: {}",
                    restored.body_count(), restored.collider_count(), restored.contains_body(ball));

    // -------------------------------------------------------------------------
    // Embed a resource
    // -------------------------------------------------------------------------

    CrateResource crate;
    auto [crate_root, old_to_new] = crate.graph.copy_subtree(crate.crate, graph);
    restored.embed_resource(binder, graph, old_to_new,
                            ResourceScene{"crate.scene", crate.physics, crate.binder});
    TETHER_LOG_INFO("Crate instance node {} bound to body {}", crate_root.to_string(),
                    binder.body_of(crate_root) ? binder.body_of(crate_root)->to_string() : "none");

    // -------------------------------------------------------------------------
    // Queries and debug draw
    // -------------------------------------------------------------------------

    report_hits(restored, tether_math::Ray(Vec3(0.0f, 20.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f)));
    report_hits(restored, tether_math::Ray(Vec3(2.0f, 20.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f)));

    tether_scene::SceneDrawingContext drawing;
    restored.draw(drawing);
    TETHER_LOG_INFO("Debug draw produced {} lines", drawing.lines().size());

    TETHER_LOG_INFO("{}", physics.performance().to_string());

    tether_core::shutdown_logging();
    return EXIT_SUCCESS;
}
