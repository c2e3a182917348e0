#pragma once

/// @file handle.hpp
/// @brief Generational index handles and the pool that issues them
///
/// These are the solver-side handles: dense, reused after a slot is freed,
/// and never persisted directly. Engine-side identity lives in uuid.hpp.

#include "fwd.hpp"
#include "error.hpp"
#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tether_core {

// =============================================================================
// Handle<T>
// =============================================================================

/// Type-safe generational index handle
/// Layout: 32-bit slot index + 32-bit generation
template<typename T>
struct Handle {
    static constexpr std::uint32_t INVALID = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index = INVALID;
    std::uint32_t generation = INVALID;

    constexpr Handle() noexcept = default;

    /// Construct from index and generation
    [[nodiscard]] static constexpr Handle from_raw_parts(std::uint32_t index, std::uint32_t generation) noexcept {
        Handle h;
        h.index = index;
        h.generation = generation;
        return h;
    }

    /// Split into (index, generation)
    [[nodiscard]] constexpr std::pair<std::uint32_t, std::uint32_t> into_raw_parts() const noexcept {
        return {index, generation};
    }

    [[nodiscard]] static constexpr Handle invalid() noexcept { return Handle{}; }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return index != INVALID && generation != INVALID;
    }

    /// Pack into a single 64-bit value (generation in the high half)
    [[nodiscard]] constexpr std::uint64_t to_bits() const noexcept {
        return (static_cast<std::uint64_t>(generation) << 32) | index;
    }

    [[nodiscard]] static constexpr Handle from_bits(std::uint64_t raw) noexcept {
        return from_raw_parts(static_cast<std::uint32_t>(raw & 0xFFFFFFFFu),
                              static_cast<std::uint32_t>(raw >> 32));
    }

    [[nodiscard]] std::string to_string() const {
        if (!is_valid()) {
            return "Handle(invalid)";
        }
        return "Handle(" + std::to_string(index) + "v" + std::to_string(generation) + ")";
    }

    /// Orders by index, then generation
    constexpr auto operator<=>(const Handle&) const noexcept = default;
    constexpr bool operator==(const Handle&) const noexcept = default;

    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

// =============================================================================
// Pool<T>
// =============================================================================

/// Slot storage that hands out generational handles.
/// Fresh slots start at generation 0; freeing a slot bumps its generation
/// and pushes it on a LIFO free list for reuse.
template<typename T>
class Pool {
public:
    Pool() = default;

    explicit Pool(std::size_t capacity) { reserve(capacity); }

    /// Insert value and get handle
    [[nodiscard]] Handle<T> insert(T value) {
        std::uint32_t index;
        if (!m_free_list.empty()) {
            index = m_free_list.back();
            m_free_list.pop_back();
        } else {
            index = static_cast<std::uint32_t>(m_slots.size());
            m_slots.push_back(Slot{0, std::nullopt});
        }

        m_slots[index].value = std::move(value);
        ++m_len;
        return Handle<T>::from_raw_parts(index, m_slots[index].generation);
    }

    /// Remove value by handle
    std::optional<T> remove(Handle<T> handle) {
        if (!contains(handle)) {
            return std::nullopt;
        }

        auto& slot = m_slots[handle.index];
        std::optional<T> result = std::move(slot.value);
        slot.value.reset();
        ++slot.generation;
        m_free_list.push_back(handle.index);
        --m_len;
        return result;
    }

    [[nodiscard]] const T* get(Handle<T> handle) const {
        return contains(handle) ? &*m_slots[handle.index].value : nullptr;
    }

    [[nodiscard]] T* get_mut(Handle<T> handle) {
        return contains(handle) ? &*m_slots[handle.index].value : nullptr;
    }

    [[nodiscard]] bool contains(Handle<T> handle) const noexcept {
        return handle.index < m_slots.size() &&
               m_slots[handle.index].generation == handle.generation &&
               m_slots[handle.index].value.has_value();
    }

    [[nodiscard]] std::size_t len() const noexcept { return m_len; }
    [[nodiscard]] bool is_empty() const noexcept { return m_len == 0; }

    /// Total slots including freed ones
    [[nodiscard]] std::size_t capacity() const noexcept { return m_slots.size(); }

    void clear() {
        m_slots.clear();
        m_free_list.clear();
        m_len = 0;
    }

    void reserve(std::size_t capacity) {
        m_slots.reserve(capacity);
        m_free_list.reserve(capacity);
    }

    /// Iterate over live entries in slot order
    template<typename F>
    void for_each(F&& func) const {
        for (std::size_t i = 0; i < m_slots.size(); ++i) {
            const auto& slot = m_slots[i];
            if (slot.value.has_value()) {
                func(Handle<T>::from_raw_parts(static_cast<std::uint32_t>(i), slot.generation), *slot.value);
            }
        }
    }

    /// Iterate over live entries in slot order (mutable)
    template<typename F>
    void for_each_mut(F&& func) {
        for (std::size_t i = 0; i < m_slots.size(); ++i) {
            auto& slot = m_slots[i];
            if (slot.value.has_value()) {
                func(Handle<T>::from_raw_parts(static_cast<std::uint32_t>(i), slot.generation), *slot.value);
            }
        }
    }

    /// Live handles in slot order
    [[nodiscard]] std::vector<Handle<T>> handles() const {
        std::vector<Handle<T>> result;
        result.reserve(m_len);
        for_each([&result](Handle<T> h, const T&) { result.push_back(h); });
        return result;
    }

private:
    struct Slot {
        std::uint32_t generation;
        std::optional<T> value;
    };

    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_free_list;
    std::size_t m_len = 0;
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const Handle<T>& h) {
    return os << h.to_string();
}

} // namespace tether_core

// =============================================================================
// Hash Specializations
// =============================================================================

template<typename T>
struct std::hash<tether_core::Handle<T>> {
    std::size_t operator()(const tether_core::Handle<T>& h) const noexcept {
        return std::hash<std::uint64_t>{}(h.to_bits());
    }
};
