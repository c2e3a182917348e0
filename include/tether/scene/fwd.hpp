#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tether_scene

#include <tether/core/fwd.hpp>

namespace tether_scene {

struct SurfaceData;
struct Mesh;
struct LocalTransform;
struct Node;
class SceneGraphView;
class Graph;
class PhysicsBinder;
struct Color;
struct Line;
class SceneDrawingContext;

using NodeHandle = tether_core::Handle<Node>;

} // namespace tether_scene
