#pragma once

/// @file bidir_map.hpp
/// @brief Injective bidirectional hash map

#include "fwd.hpp"
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>

namespace tether_core {

// =============================================================================
// BiDirHashMap<K, V>
// =============================================================================

/// One-to-one mapping with O(1) lookup in both directions.
/// Inserting a pair evicts any existing pair sharing its key or its value,
/// so the map never becomes non-injective.
template<typename K, typename V>
class BiDirHashMap {
public:
    using ForwardMap = std::unordered_map<K, V>;
    using BackwardMap = std::unordered_map<V, K>;

    BiDirHashMap() = default;

    /// Insert a pair. Returns the value previously mapped to @p key, if any.
    std::optional<V> insert(const K& key, const V& value) {
        std::optional<V> previous = remove_by_key(key);
        remove_by_value(value);
        m_forward.emplace(key, value);
        m_backward.emplace(value, key);
        return previous;
    }

    /// Remove pair by key. Returns the value it mapped to.
    std::optional<V> remove_by_key(const K& key) {
        auto it = m_forward.find(key);
        if (it == m_forward.end()) {
            return std::nullopt;
        }
        V value = std::move(it->second);
        m_forward.erase(it);
        m_backward.erase(value);
        return value;
    }

    /// Remove pair by value. Returns the key it was mapped from.
    std::optional<K> remove_by_value(const V& value) {
        auto it = m_backward.find(value);
        if (it == m_backward.end()) {
            return std::nullopt;
        }
        K key = std::move(it->second);
        m_backward.erase(it);
        m_forward.erase(key);
        return key;
    }

    [[nodiscard]] std::optional<V> value_of(const K& key) const {
        auto it = m_forward.find(key);
        if (it == m_forward.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::optional<K> key_of(const V& value) const {
        auto it = m_backward.find(value);
        if (it == m_backward.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains_key(const K& key) const { return m_forward.count(key) != 0; }
    [[nodiscard]] bool contains_value(const V& value) const { return m_backward.count(value) != 0; }

    [[nodiscard]] std::size_t len() const noexcept { return m_forward.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_forward.empty(); }

    void clear() {
        m_forward.clear();
        m_backward.clear();
    }

    [[nodiscard]] const ForwardMap& forward_map() const noexcept { return m_forward; }
    [[nodiscard]] const BackwardMap& backward_map() const noexcept { return m_backward; }

    bool operator==(const BiDirHashMap& other) const { return m_forward == other.m_forward; }

private:
    ForwardMap m_forward;
    BackwardMap m_backward;
};

} // namespace tether_core
