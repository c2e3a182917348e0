#pragma once

/// @file serialize.hpp
/// @brief Visitor overloads for tether_math types

#include "types.hpp"
#include <tether/core/visitor.hpp>

namespace tether_core {

/// Vec3 stored as a vec3 field
inline Result<void> visit(Visitor& v, const std::string& name, glm::vec3& value) {
    Vec3f raw{value.x, value.y, value.z};
    TETHER_TRY(v.visit_primitive(name, raw));
    value = glm::vec3(raw[0], raw[1], raw[2]);
    return Ok();
}

/// Quat stored as a vec4 field in (x, y, z, w) order
inline Result<void> visit(Visitor& v, const std::string& name, glm::quat& value) {
    Vec4f raw{value.x, value.y, value.z, value.w};
    TETHER_TRY(v.visit_primitive(name, raw));
    value = glm::quat(raw[3], raw[0], raw[1], raw[2]);
    return Ok();
}

} // namespace tether_core
