#pragma once

/// @file visitor.hpp
/// @brief Visit-based serialization for tether_core
///
/// A Visitor holds a tree of named regions, each with an ordered list of
/// named, typed fields. Types describe themselves once through
/// `Result<void> visit(const std::string& name, Visitor& visitor)` and the
/// same code path reads or writes depending on `Visitor::is_reading()`.
///
/// The tree can be stored as a compact binary blob or as JSON. Both
/// backends keep insertion order, so writing the same data twice yields
/// identical bytes.

#include "fwd.hpp"
#include "error.hpp"
#include "handle.hpp"
#include "uuid.hpp"
#include "bidir_map.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tether_core {

// =============================================================================
// Field Values
// =============================================================================

using Vec3f = std::array<float, 3>;
using Vec4f = std::array<float, 4>;

/// Stored field value. Alternative order is the on-disk type tag.
using FieldValue = std::variant<
    bool,
    std::uint32_t,
    std::uint64_t,
    std::int32_t,
    float,
    std::string,
    Vec3f,
    Vec4f,
    Uuid
>;

/// Human-readable name of a field type tag
[[nodiscard]] const char* field_type_name(std::size_t index);

template<typename T>
inline constexpr bool is_field_type_v =
    std::is_same_v<T, bool> || std::is_same_v<T, std::uint32_t> ||
    std::is_same_v<T, std::uint64_t> || std::is_same_v<T, std::int32_t> ||
    std::is_same_v<T, float> || std::is_same_v<T, std::string> ||
    std::is_same_v<T, Vec3f> || std::is_same_v<T, Vec4f> || std::is_same_v<T, Uuid>;

struct VisitorField {
    std::string name;
    FieldValue value;
};

struct VisitorNode {
    std::string name;
    std::vector<VisitorField> fields;
    std::vector<std::size_t> children;
    std::size_t parent = 0;
};

enum class VisitorFormat : std::uint8_t {
    Binary,
    Json,
};

// =============================================================================
// Visitor
// =============================================================================

class Visitor {
public:
    /// Magic bytes at the start of a binary blob
    static constexpr std::array<std::uint8_t, 4> BINARY_MAGIC{'T', 'T', 'H', 'R'};
    static constexpr std::uint32_t BINARY_FORMAT_VERSION = 1;

    /// Empty tree in writing mode
    [[nodiscard]] static Visitor writer();

    /// Parse a binary blob into a tree in reading mode
    [[nodiscard]] static Result<Visitor> from_binary(const std::vector<std::uint8_t>& data);

    /// Parse JSON text into a tree in reading mode
    [[nodiscard]] static Result<Visitor> from_json(const std::string& text);

    /// Load a file written by save_file
    [[nodiscard]] static Result<Visitor> load_file(const std::filesystem::path& path, VisitorFormat format);

    [[nodiscard]] std::vector<std::uint8_t> to_binary() const;
    [[nodiscard]] std::string to_json(int indent = 2) const;
    [[nodiscard]] Result<void> save_file(const std::filesystem::path& path, VisitorFormat format) const;

    [[nodiscard]] bool is_reading() const noexcept { return m_reading; }

    /// Reuse the written tree for reading, starting at the root
    void rewind_for_reading();

    // =========================================================================
    // Regions
    // =========================================================================

    /// Enter a child region of the current one. Writing creates it if needed,
    /// reading fails with RegionNotFound when it is absent.
    [[nodiscard]] Result<void> enter_region(const std::string& name);

    /// Return to the parent region. No-op at the root.
    void leave_region();

    [[nodiscard]] bool has_region(const std::string& name) const;
    [[nodiscard]] bool has_field(const std::string& name) const;

    /// Slash separated path of the current region
    [[nodiscard]] std::string current_path() const;

    [[nodiscard]] const VisitorNode& current_node() const { return m_nodes[m_stack.back()]; }

    /// Upper bound on the items a length-prefixed region can hold
    [[nodiscard]] std::size_t current_entry_count() const {
        const auto& node = current_node();
        return node.fields.size() + node.children.size();
    }

    // =========================================================================
    // Fields
    // =========================================================================

    /// Read or write one primitive field of the current region
    template<typename T>
    [[nodiscard]] Result<void> visit_primitive(const std::string& name, T& value) {
        static_assert(is_field_type_v<T>, "Unsupported field type");

        if (!m_reading) {
            set_field(name, FieldValue{std::in_place_type<T>, value});
            return Ok();
        }

        const FieldValue* stored = find_field(name);
        if (!stored) {
            return Err(VisitError::field_not_found(current_path() + "/" + name));
        }
        const T* typed = std::get_if<T>(stored);
        if (!typed) {
            return Err(VisitError::type_mismatch(current_path() + "/" + name,
                field_type_name(FieldValue{std::in_place_type<T>}.index())));
        }
        value = *typed;
        return Ok();
    }

    [[nodiscard]] const std::vector<VisitorNode>& nodes() const noexcept { return m_nodes; }

private:
    Visitor();

    void set_field(const std::string& name, FieldValue value);
    [[nodiscard]] const FieldValue* find_field(const std::string& name) const;
    [[nodiscard]] std::optional<std::size_t> find_child(const std::string& name) const;

    friend class VisitorCodec;

    std::vector<VisitorNode> m_nodes;
    std::vector<std::size_t> m_stack;
    bool m_reading = false;
};

// =============================================================================
// RegionScope
// =============================================================================

/// Enters a region on construction and leaves it on destruction
class RegionScope {
public:
    RegionScope(Visitor& visitor, const std::string& name)
        : m_visitor(visitor)
        , m_result(visitor.enter_region(name))
    {}

    ~RegionScope() {
        if (m_result.is_ok()) {
            m_visitor.leave_region();
        }
    }

    RegionScope(const RegionScope&) = delete;
    RegionScope& operator=(const RegionScope&) = delete;

    [[nodiscard]] bool ok() const noexcept { return m_result.is_ok(); }
    [[nodiscard]] const Error& error() const { return m_result.error(); }

private:
    Visitor& m_visitor;
    Result<void> m_result;
};

// =============================================================================
// Visit Overloads
// =============================================================================

/// Types that describe themselves to a Visitor
template<typename T>
concept Visitable = requires(T& value, const std::string& name, Visitor& visitor) {
    { value.visit(name, visitor) } -> std::same_as<Result<void>>;
};

inline Result<void> visit(Visitor& v, const std::string& name, bool& value) { return v.visit_primitive(name, value); }
inline Result<void> visit(Visitor& v, const std::string& name, std::uint32_t& value) { return v.visit_primitive(name, value); }
inline Result<void> visit(Visitor& v, const std::string& name, std::uint64_t& value) { return v.visit_primitive(name, value); }
inline Result<void> visit(Visitor& v, const std::string& name, std::int32_t& value) { return v.visit_primitive(name, value); }
inline Result<void> visit(Visitor& v, const std::string& name, float& value) { return v.visit_primitive(name, value); }
inline Result<void> visit(Visitor& v, const std::string& name, std::string& value) { return v.visit_primitive(name, value); }
inline Result<void> visit(Visitor& v, const std::string& name, Uuid& value) { return v.visit_primitive(name, value); }

template<Visitable T>
Result<void> visit(Visitor& v, const std::string& name, T& value);

template<typename T>
Result<void> visit(Visitor& v, const std::string& name, Handle<T>& handle);

template<typename T>
Result<void> visit(Visitor& v, const std::string& name, std::optional<T>& value);

template<typename T>
Result<void> visit(Visitor& v, const std::string& name, std::vector<T>& values);

template<typename K, typename V>
Result<void> visit(Visitor& v, const std::string& name, std::unordered_map<K, V>& map);

template<typename K, typename V>
Result<void> visit(Visitor& v, const std::string& name, BiDirHashMap<K, V>& map);

template<Visitable T>
Result<void> visit(Visitor& v, const std::string& name, T& value) {
    return value.visit(name, v);
}

/// Solver handle as {Index, Generation}
template<typename T>
Result<void> visit(Visitor& v, const std::string& name, Handle<T>& handle) {
    RegionScope region(v, name);
    if (!region.ok()) return region.error();

    TETHER_TRY(v.visit_primitive("Index", handle.index));
    TETHER_TRY(v.visit_primitive("Generation", handle.generation));
    return Ok();
}

/// Optional as {IsSome, Data?}
template<typename T>
Result<void> visit(Visitor& v, const std::string& name, std::optional<T>& value) {
    RegionScope region(v, name);
    if (!region.ok()) return region.error();

    bool is_some = value.has_value();
    TETHER_TRY(v.visit_primitive("IsSome", is_some));

    if (is_some) {
        if (v.is_reading()) {
            value.emplace();
        }
        TETHER_TRY(visit(v, "Data", *value));
    } else if (v.is_reading()) {
        value.reset();
    }
    return Ok();
}

/// Vector as {Length, Item0, Item1, ...}
template<typename T>
Result<void> visit(Visitor& v, const std::string& name, std::vector<T>& values) {
    RegionScope region(v, name);
    if (!region.ok()) return region.error();

    auto length = static_cast<std::uint32_t>(values.size());
    TETHER_TRY(v.visit_primitive("Length", length));

    if (v.is_reading()) {
        if (length > v.current_entry_count()) {
            return Err(VisitError::malformed_data(
                "Region '" + name + "' claims " + std::to_string(length) + " items"));
        }
        values.clear();
        values.resize(length);
    }
    for (std::uint32_t i = 0; i < length; ++i) {
        TETHER_TRY(visit(v, "Item" + std::to_string(i), values[i]));
    }
    return Ok();
}

/// Hash map as {Length, Item{i}{Key, Value}}, written in ascending key order
template<typename K, typename V>
Result<void> visit(Visitor& v, const std::string& name, std::unordered_map<K, V>& map) {
    RegionScope region(v, name);
    if (!region.ok()) return region.error();

    auto length = static_cast<std::uint32_t>(map.size());
    TETHER_TRY(v.visit_primitive("Length", length));

    if (v.is_reading()) {
        if (length > v.current_entry_count()) {
            return Err(VisitError::malformed_data(
                "Region '" + name + "' claims " + std::to_string(length) + " entries"));
        }
        map.clear();
        for (std::uint32_t i = 0; i < length; ++i) {
            RegionScope item(v, "Item" + std::to_string(i));
            if (!item.ok()) return item.error();

            K key{};
            V value{};
            TETHER_TRY(visit(v, "Key", key));
            TETHER_TRY(visit(v, "Value", value));
            map.emplace(std::move(key), std::move(value));
        }
        return Ok();
    }

    std::vector<K> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());

    for (std::uint32_t i = 0; i < length; ++i) {
        RegionScope item(v, "Item" + std::to_string(i));
        if (!item.ok()) return item.error();

        K key = keys[i];
        TETHER_TRY(visit(v, "Key", key));
        TETHER_TRY(visit(v, "Value", map.at(keys[i])));
    }
    return Ok();
}

/// Bidirectional map persisted through its forward side
template<typename K, typename V>
Result<void> visit(Visitor& v, const std::string& name, BiDirHashMap<K, V>& map) {
    std::unordered_map<K, V> forward = map.forward_map();
    TETHER_TRY(visit(v, name, forward));

    if (v.is_reading()) {
        map.clear();
        for (const auto& [key, value] : forward) {
            map.insert(key, value);
        }
    }
    return Ok();
}

} // namespace tether_core
