#pragma once

/// @file handles.hpp
/// @brief Engine-side handles for physics entities
///
/// Engine handles are random UUIDs. They are minted once per entity, never
/// reused, and are the only handles that get persisted. The solver's own
/// generational handles (RawBodyHandle and friends) are mapped to these
/// through per-world bidirectional tables.

#include "fwd.hpp"
#include <tether/core/uuid.hpp>
#include <tether/core/visitor.hpp>

#include <compare>
#include <functional>
#include <string>

namespace tether_physics {

/// Strongly typed UUID. `Tag` only distinguishes the entity kind.
template<typename Tag>
struct EngineHandle {
    tether_core::Uuid uuid;

    constexpr EngineHandle() noexcept = default;
    constexpr explicit EngineHandle(const tether_core::Uuid& id) noexcept : uuid(id) {}

    /// Mint a fresh random handle
    [[nodiscard]] static EngineHandle generate() { return EngineHandle{tether_core::Uuid::new_v4()}; }

    [[nodiscard]] constexpr bool is_nil() const noexcept { return uuid.is_nil(); }
    [[nodiscard]] std::string to_string() const { return uuid.to_string(); }

    /// Stored as a single uuid field
    tether_core::Result<void> visit(const std::string& name, tether_core::Visitor& visitor) {
        return visitor.visit_primitive(name, uuid);
    }

    constexpr auto operator<=>(const EngineHandle&) const noexcept = default;
    constexpr bool operator==(const EngineHandle&) const noexcept = default;
};

struct RigidBodyTag {};
struct ColliderTag {};
struct JointTag {};

using RigidBodyHandle = EngineHandle<RigidBodyTag>;
using ColliderHandle = EngineHandle<ColliderTag>;
using JointHandle = EngineHandle<JointTag>;

} // namespace tether_physics

template<typename Tag>
struct std::hash<tether_physics::EngineHandle<Tag>> {
    std::size_t operator()(const tether_physics::EngineHandle<Tag>& h) const noexcept {
        return std::hash<tether_core::Uuid>{}(h.uuid);
    }
};
