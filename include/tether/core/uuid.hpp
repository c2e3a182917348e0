#pragma once

/// @file uuid.hpp
/// @brief 128-bit globally unique identifiers for tether_core

#include "fwd.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace tether_core {

// =============================================================================
// Uuid
// =============================================================================

/// RFC 4122 style identifier stored as 16 raw bytes.
/// Ordering is lexicographic over the bytes.
struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    constexpr Uuid() noexcept = default;

    /// Nil uuid (all zero)
    [[nodiscard]] static constexpr Uuid nil() noexcept { return Uuid{}; }

    /// Random version 4 uuid
    [[nodiscard]] static Uuid new_v4();

    [[nodiscard]] static constexpr Uuid from_bytes(const std::array<std::uint8_t, 16>& raw) noexcept {
        Uuid u;
        u.bytes = raw;
        return u;
    }

    /// Build from two little-endian 64-bit halves (low goes to bytes 0..7)
    [[nodiscard]] static constexpr Uuid from_u64_pair(std::uint64_t low, std::uint64_t high) noexcept {
        Uuid u;
        for (int i = 0; i < 8; ++i) {
            u.bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(low >> (8 * i));
            u.bytes[static_cast<std::size_t>(i + 8)] = static_cast<std::uint8_t>(high >> (8 * i));
        }
        return u;
    }

    /// Parse canonical 8-4-4-4-12 hex form
    [[nodiscard]] static std::optional<Uuid> parse(const std::string& text);

    /// Canonical lowercase 8-4-4-4-12 hex form
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr auto operator<=>(const Uuid&) const noexcept = default;
    constexpr bool operator==(const Uuid&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const Uuid& id) {
    return os << id.to_string();
}

} // namespace tether_core

template<>
struct std::hash<tether_core::Uuid> {
    std::size_t operator()(const tether_core::Uuid& id) const noexcept {
        // FNV-1a over the raw bytes
        std::uint64_t hash = 0xcbf29ce484222325ULL;
        for (auto b : id.bytes) {
            hash ^= b;
            hash *= 0x100000001b3ULL;
        }
        return static_cast<std::size_t>(hash);
    }
};
