/// @file visitor.cpp
/// @brief Region tree navigation and the binary / JSON backends

#include <tether/core/visitor.hpp>

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace tether_core {

namespace {

constexpr const char* FIELD_TYPE_NAMES[] = {
    "bool", "u32", "u64", "i32", "f32", "string", "vec3", "vec4", "uuid",
};

constexpr std::size_t FIELD_TYPE_COUNT = std::variant_size_v<FieldValue>;

// Nesting deeper than this is treated as corrupt input
constexpr std::size_t MAX_DEPTH = 256;

// =============================================================================
// Binary Writer / Reader
// =============================================================================

/// Little-endian byte writer
class BinaryWriter {
public:
    void write_u8(std::uint8_t value) { m_data.push_back(value); }

    void write_u32(std::uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            m_data.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
        }
    }

    void write_u64(std::uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            m_data.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
        }
    }

    void write_f32(float value) {
        std::uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        write_u32(bits);
    }

    void write_string(const std::string& s) {
        write_u32(static_cast<std::uint32_t>(s.size()));
        m_data.insert(m_data.end(), s.begin(), s.end());
    }

    void write_bytes(const std::uint8_t* data, std::size_t size) {
        m_data.insert(m_data.end(), data, data + size);
    }

    [[nodiscard]] std::vector<std::uint8_t> take_data() { return std::move(m_data); }

private:
    std::vector<std::uint8_t> m_data;
};

/// Little-endian byte reader. Reads past the end set the failure flag.
class BinaryReader {
public:
    explicit BinaryReader(const std::vector<std::uint8_t>& data)
        : m_data(data)
    {}

    std::uint8_t read_u8() {
        if (!ensure(1)) return 0;
        return m_data[m_pos++];
    }

    std::uint32_t read_u32() {
        if (!ensure(4)) return 0;
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<std::uint32_t>(m_data[m_pos++]) << (8 * i);
        }
        return value;
    }

    std::uint64_t read_u64() {
        if (!ensure(8)) return 0;
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<std::uint64_t>(m_data[m_pos++]) << (8 * i);
        }
        return value;
    }

    float read_f32() {
        std::uint32_t bits = read_u32();
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string read_string() {
        std::uint32_t len = read_u32();
        if (!ensure(len)) return {};
        std::string s(reinterpret_cast<const char*>(m_data.data() + m_pos), len);
        m_pos += len;
        return s;
    }

    void read_bytes(std::uint8_t* dest, std::size_t size) {
        if (!ensure(size)) return;
        std::memcpy(dest, m_data.data() + m_pos, size);
        m_pos += size;
    }

    [[nodiscard]] bool failed() const noexcept { return m_failed; }
    [[nodiscard]] bool at_end() const noexcept { return m_pos >= m_data.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return m_pos; }

private:
    bool ensure(std::size_t size) {
        if (m_failed || m_pos + size > m_data.size()) {
            m_failed = true;
            return false;
        }
        return true;
    }

    const std::vector<std::uint8_t>& m_data;
    std::size_t m_pos = 0;
    bool m_failed = false;
};

} // anonymous namespace

const char* field_type_name(std::size_t index) {
    return index < FIELD_TYPE_COUNT ? FIELD_TYPE_NAMES[index] : "unknown";
}

// =============================================================================
// VisitorCodec
// =============================================================================

/// Conversion between a Visitor tree and its stored forms
class VisitorCodec {
public:
    using Json = nlohmann::ordered_json;

    // -------------------------------------------------------------------------
    // Binary
    // -------------------------------------------------------------------------

    static void write_node(BinaryWriter& w, const Visitor& visitor, std::size_t index) {
        const auto& node = visitor.m_nodes[index];
        w.write_string(node.name);

        w.write_u32(static_cast<std::uint32_t>(node.fields.size()));
        for (const auto& field : node.fields) {
            w.write_string(field.name);
            w.write_u8(static_cast<std::uint8_t>(field.value.index()));
            std::visit([&w](const auto& value) { write_value(w, value); }, field.value);
        }

        w.write_u32(static_cast<std::uint32_t>(node.children.size()));
        for (auto child : node.children) {
            write_node(w, visitor, child);
        }
    }

    static void write_value(BinaryWriter& w, bool value) { w.write_u8(value ? 1 : 0); }
    static void write_value(BinaryWriter& w, std::uint32_t value) { w.write_u32(value); }
    static void write_value(BinaryWriter& w, std::uint64_t value) { w.write_u64(value); }
    static void write_value(BinaryWriter& w, std::int32_t value) { w.write_u32(static_cast<std::uint32_t>(value)); }
    static void write_value(BinaryWriter& w, float value) { w.write_f32(value); }
    static void write_value(BinaryWriter& w, const std::string& value) { w.write_string(value); }
    static void write_value(BinaryWriter& w, const Uuid& value) { w.write_bytes(value.bytes.data(), value.bytes.size()); }

    template<std::size_t N>
    static void write_value(BinaryWriter& w, const std::array<float, N>& value) {
        for (float f : value) {
            w.write_f32(f);
        }
    }

    static Result<FieldValue> read_value(BinaryReader& r, std::uint8_t tag) {
        switch (tag) {
            case 0: {
                std::uint8_t b = r.read_u8();
                if (b > 1) {
                    return Err<FieldValue>(VisitError::malformed_data("Invalid bool byte " + std::to_string(b)));
                }
                return FieldValue{b == 1};
            }
            case 1: return FieldValue{std::in_place_type<std::uint32_t>, r.read_u32()};
            case 2: return FieldValue{std::in_place_type<std::uint64_t>, r.read_u64()};
            case 3: return FieldValue{std::in_place_type<std::int32_t>, static_cast<std::int32_t>(r.read_u32())};
            case 4: return FieldValue{std::in_place_type<float>, r.read_f32()};
            case 5: return FieldValue{std::in_place_type<std::string>, r.read_string()};
            case 6: return FieldValue{Vec3f{r.read_f32(), r.read_f32(), r.read_f32()}};
            case 7: return FieldValue{Vec4f{r.read_f32(), r.read_f32(), r.read_f32(), r.read_f32()}};
            case 8: {
                Uuid id;
                r.read_bytes(id.bytes.data(), id.bytes.size());
                return FieldValue{id};
            }
            default:
                return Err<FieldValue>(VisitError::malformed_data("Unknown field type tag " + std::to_string(tag)));
        }
    }

    static Result<void> read_node(BinaryReader& r, Visitor& visitor, std::size_t index, std::size_t depth) {
        if (depth > MAX_DEPTH) {
            return Err(VisitError::malformed_data("Region nesting too deep"));
        }

        visitor.m_nodes[index].name = r.read_string();

        std::uint32_t field_count = r.read_u32();
        for (std::uint32_t i = 0; i < field_count && !r.failed(); ++i) {
            std::string name = r.read_string();
            std::uint8_t tag = r.read_u8();
            auto value = read_value(r, tag);
            if (value.is_err()) {
                return std::move(value.error());
            }
            visitor.m_nodes[index].fields.push_back(VisitorField{std::move(name), std::move(value.value())});
        }

        std::uint32_t child_count = r.read_u32();
        for (std::uint32_t i = 0; i < child_count && !r.failed(); ++i) {
            std::size_t child = visitor.m_nodes.size();
            visitor.m_nodes.push_back(VisitorNode{{}, {}, {}, index});
            visitor.m_nodes[index].children.push_back(child);
            TETHER_TRY(read_node(r, visitor, child, depth + 1));
        }

        if (r.failed()) {
            return Err(VisitError::io("Unexpected end of data at offset " + std::to_string(r.position())));
        }
        return Ok();
    }

    // -------------------------------------------------------------------------
    // JSON
    // -------------------------------------------------------------------------

    static Json node_to_json(const Visitor& visitor, std::size_t index) {
        const auto& node = visitor.m_nodes[index];
        Json fields = Json::object();
        for (const auto& field : node.fields) {
            Json entry = Json::object();
            entry[field_type_name(field.value.index())] =
                std::visit([](const auto& value) { return value_to_json(value); }, field.value);
            fields[field.name] = std::move(entry);
        }

        Json regions = Json::object();
        for (auto child : node.children) {
            regions[visitor.m_nodes[child].name] = node_to_json(visitor, child);
        }

        Json out = Json::object();
        out["fields"] = std::move(fields);
        out["regions"] = std::move(regions);
        return out;
    }

    template<typename T>
    static Json value_to_json(const T& value) {
        if constexpr (std::is_same_v<T, Uuid>) {
            return value.to_string();
        } else {
            return Json(value);
        }
    }

    /// nlohmann converts out of range numbers by wrapping, so integers are
    /// read at full width and range checked here.
    template<typename T>
    static Result<FieldValue> integer_from_json(const std::string& tag, const Json& value) {
        if (!value.is_number_integer()) {
            return Err<FieldValue>(VisitError::type_mismatch(tag, value.type_name()));
        }
        bool in_range = false;
        if (value.is_number_unsigned()) {
            in_range = value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
        } else {
            const auto wide = value.get<std::int64_t>();
            in_range = wide >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
                       (wide < 0 || static_cast<std::uint64_t>(wide) <=
                                        static_cast<std::uint64_t>(std::numeric_limits<T>::max()));
        }
        if (!in_range) {
            return Err<FieldValue>(VisitError::malformed_data(
                "Value " + value.dump() + " does not fit in a " + tag + " field"));
        }
        return FieldValue{std::in_place_type<T>, value.get<T>()};
    }

    static Result<FieldValue> value_from_json(const std::string& tag, const Json& value) {
        try {
            if (tag == "bool") return FieldValue{value.get<bool>()};
            if (tag == "u32") return integer_from_json<std::uint32_t>(tag, value);
            if (tag == "u64") return integer_from_json<std::uint64_t>(tag, value);
            if (tag == "i32") return integer_from_json<std::int32_t>(tag, value);
            if (tag == "f32") return FieldValue{std::in_place_type<float>, value.get<float>()};
            if (tag == "string") return FieldValue{std::in_place_type<std::string>, value.get<std::string>()};
            if (tag == "vec3") return FieldValue{value.get<Vec3f>()};
            if (tag == "vec4") return FieldValue{value.get<Vec4f>()};
            if (tag == "uuid") {
                auto id = Uuid::parse(value.get<std::string>());
                if (!id) {
                    return Err<FieldValue>(VisitError::malformed_data("Invalid uuid " + value.dump()));
                }
                return FieldValue{*id};
            }
        } catch (const Json::exception& ex) {
            return Err<FieldValue>(VisitError::type_mismatch(tag, ex.what()));
        }
        return Err<FieldValue>(VisitError::malformed_data("Unknown field type tag " + tag));
    }

    static Result<void> node_from_json(const Json& json, Visitor& visitor, std::size_t index, std::size_t depth) {
        if (depth > MAX_DEPTH) {
            return Err(VisitError::malformed_data("Region nesting too deep"));
        }
        if (!json.is_object() || !json.contains("fields") || !json.contains("regions")) {
            return Err(VisitError::malformed_data("Region '" + visitor.m_nodes[index].name + "' is not a region object"));
        }

        for (const auto& [name, entry] : json["fields"].items()) {
            if (!entry.is_object() || entry.size() != 1) {
                return Err(VisitError::malformed_data("Field '" + name + "' must hold exactly one typed value"));
            }
            auto it = entry.begin();
            auto value = value_from_json(it.key(), it.value());
            if (value.is_err()) {
                return std::move(value.error());
            }
            visitor.m_nodes[index].fields.push_back(VisitorField{name, std::move(value.value())});
        }

        for (const auto& [name, child_json] : json["regions"].items()) {
            std::size_t child = visitor.m_nodes.size();
            visitor.m_nodes.push_back(VisitorNode{name, {}, {}, index});
            visitor.m_nodes[index].children.push_back(child);
            TETHER_TRY(node_from_json(child_json, visitor, child, depth + 1));
        }
        return Ok();
    }
};

// =============================================================================
// Visitor
// =============================================================================

Visitor::Visitor() {
    m_nodes.push_back(VisitorNode{"", {}, {}, 0});
    m_stack.push_back(0);
}

Visitor Visitor::writer() {
    return Visitor();
}

Result<Visitor> Visitor::from_binary(const std::vector<std::uint8_t>& data) {
    BinaryReader r(data);

    std::array<std::uint8_t, 4> magic{};
    r.read_bytes(magic.data(), magic.size());
    if (r.failed() || magic != BINARY_MAGIC) {
        return Err<Visitor>(VisitError::malformed_data("Not a tether binary blob"));
    }

    std::uint32_t version = r.read_u32();
    if (version > BINARY_FORMAT_VERSION) {
        return Err<Visitor>(VisitError::unsupported_version(version, BINARY_FORMAT_VERSION));
    }

    Visitor visitor;
    auto result = VisitorCodec::read_node(r, visitor, 0, 0);
    if (result.is_err()) {
        return Err<Visitor>(std::move(result.error()));
    }
    if (!r.at_end()) {
        return Err<Visitor>(VisitError::malformed_data("Trailing bytes after root region"));
    }

    visitor.m_reading = true;
    return visitor;
}

Result<Visitor> Visitor::from_json(const std::string& text) {
    VisitorCodec::Json json;
    try {
        json = VisitorCodec::Json::parse(text);
    } catch (const VisitorCodec::Json::parse_error& ex) {
        return Err<Visitor>(Error(ErrorCode::ParseError, ex.what()));
    }

    Visitor visitor;
    auto result = VisitorCodec::node_from_json(json, visitor, 0, 0);
    if (result.is_err()) {
        return Err<Visitor>(std::move(result.error()));
    }

    visitor.m_reading = true;
    return visitor;
}

Result<Visitor> Visitor::load_file(const std::filesystem::path& path, VisitorFormat format) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<Visitor>(VisitError::io("Cannot open " + path.string()));
    }

    std::vector<std::uint8_t> data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return Err<Visitor>(VisitError::io("Failed reading " + path.string()));
    }

    if (format == VisitorFormat::Binary) {
        return from_binary(data);
    }
    return from_json(std::string(data.begin(), data.end()));
}

std::vector<std::uint8_t> Visitor::to_binary() const {
    BinaryWriter w;
    w.write_bytes(BINARY_MAGIC.data(), BINARY_MAGIC.size());
    w.write_u32(BINARY_FORMAT_VERSION);
    VisitorCodec::write_node(w, *this, 0);
    return w.take_data();
}

std::string Visitor::to_json(int indent) const {
    return VisitorCodec::node_to_json(*this, 0).dump(indent);
}

Result<void> Visitor::save_file(const std::filesystem::path& path, VisitorFormat format) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Err(VisitError::io("Cannot open " + path.string() + " for writing"));
    }

    if (format == VisitorFormat::Binary) {
        auto data = to_binary();
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    } else {
        file << to_json();
    }

    if (!file) {
        return Err(VisitError::io("Failed writing " + path.string()));
    }
    return Ok();
}

void Visitor::rewind_for_reading() {
    m_stack.assign(1, 0);
    m_reading = true;
}

Result<void> Visitor::enter_region(const std::string& name) {
    if (auto child = find_child(name)) {
        m_stack.push_back(*child);
        return Ok();
    }

    if (m_reading) {
        return Err(VisitError::region_not_found(current_path() + "/" + name));
    }

    std::size_t parent = m_stack.back();
    std::size_t child = m_nodes.size();
    m_nodes.push_back(VisitorNode{name, {}, {}, parent});
    m_nodes[parent].children.push_back(child);
    m_stack.push_back(child);
    return Ok();
}

void Visitor::leave_region() {
    if (m_stack.size() > 1) {
        m_stack.pop_back();
    }
}

bool Visitor::has_region(const std::string& name) const {
    return find_child(name).has_value();
}

bool Visitor::has_field(const std::string& name) const {
    return find_field(name) != nullptr;
}

std::string Visitor::current_path() const {
    std::string path;
    for (std::size_t i = 1; i < m_stack.size(); ++i) {
        path += "/";
        path += m_nodes[m_stack[i]].name;
    }
    return path.empty() ? "/" : path;
}

void Visitor::set_field(const std::string& name, FieldValue value) {
    auto& fields = m_nodes[m_stack.back()].fields;
    for (auto& field : fields) {
        if (field.name == name) {
            field.value = std::move(value);
            return;
        }
    }
    fields.push_back(VisitorField{name, std::move(value)});
}

const FieldValue* Visitor::find_field(const std::string& name) const {
    for (const auto& field : m_nodes[m_stack.back()].fields) {
        if (field.name == name) {
            return &field.value;
        }
    }
    return nullptr;
}

std::optional<std::size_t> Visitor::find_child(const std::string& name) const {
    for (auto child : m_nodes[m_stack.back()].children) {
        if (m_nodes[child].name == name) {
            return child;
        }
    }
    return std::nullopt;
}

} // namespace tether_core
