#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tether_physics

#include <tether/core/fwd.hpp>

namespace tether_physics {

// Shapes
enum class ShapeType : std::uint8_t;
struct FeatureId;
struct RayHit;
class IShape;
class BallShape;
class CylinderShape;
class RoundCylinderShape;
class ConeShape;
class CuboidShape;
class CapsuleShape;
class SegmentShape;
class TriangleShape;
class TriMeshShape;
class HeightFieldShape;

// Live entities
class RigidBody;
class RigidBodyBuilder;
class RigidBodySet;
class Collider;
class ColliderBuilder;
class ColliderSet;
struct InteractionGroups;
class Joint;
class JointSet;
struct IntegrationParameters;
class PhysicsPipeline;
class QueryPipeline;

// Solver-side handles
using RawBodyHandle = tether_core::Handle<RigidBody>;
using RawColliderHandle = tether_core::Handle<Collider>;
using RawJointHandle = tether_core::Handle<Joint>;

// Descriptors
enum class BodyStatusDesc : std::uint32_t;
struct RigidBodyDesc;
struct ColliderShapeDesc;
struct ColliderDesc;
struct JointParamsDesc;
struct JointDesc;
struct IntegrationParametersDesc;
struct PhysicsDesc;

// World
struct Intersection;
struct RayCastOptions;
struct ResourceLink;
struct PerformanceStatistics;
class PendingPhysics;
class Physics;
struct PhysicsConfig;

} // namespace tether_physics
