/// @file config.cpp
/// @brief Configuration system implementation for tether_core

#include <tether/core/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tether_core {

namespace {

using Json = nlohmann::json;

/// Flatten nested JSON objects into dotted keys
Result<void> flatten_json(const Json& json, const std::string& prefix, ConfigLayer& layer) {
    for (const auto& [name, value] : json.items()) {
        std::string key = prefix.empty() ? name : prefix + "." + name;

        if (value.is_object()) {
            TETHER_TRY(flatten_json(value, key, layer));
        } else if (value.is_boolean()) {
            layer.set(key, ConfigValue{value.get<bool>()});
        } else if (value.is_number_integer()) {
            layer.set(key, ConfigValue{value.get<std::int64_t>()});
        } else if (value.is_number_float()) {
            layer.set(key, ConfigValue{value.get<double>()});
        } else if (value.is_string()) {
            layer.set(key, ConfigValue{value.get<std::string>()});
        } else if (value.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return Err(Error(ErrorCode::ParseError, "Array at '" + key + "' must contain only strings"));
                }
                items.push_back(item.get<std::string>());
            }
            layer.set(key, ConfigValue{std::move(items)});
        } else {
            return Err(Error(ErrorCode::ParseError, "Unsupported value at '" + key + "'"));
        }
    }
    return Ok();
}

/// Insert a dotted key as a nested JSON path
void insert_nested(Json& root, const std::string& key, Json value) {
    Json* node = &root;
    std::size_t start = 0;
    while (true) {
        auto dot = key.find('.', start);
        if (dot == std::string::npos) {
            (*node)[key.substr(start)] = std::move(value);
            return;
        }
        node = &(*node)[key.substr(start, dot - start)];
        start = dot + 1;
    }
}

std::string env_name_for(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    for (char c : key) {
        name.push_back(c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

} // anonymous namespace

ConfigValue parse_config_value(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue{text == "true"};
    }

    std::int64_t int_val = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), int_val);
    if (ec == std::errc{} && ptr == text.data() + text.size() && !text.empty()) {
        return ConfigValue{int_val};
    }

    if (!text.empty()) {
        char* end = nullptr;
        errno = 0;
        double float_val = std::strtod(text.c_str(), &end);
        if (errno == 0 && end == text.c_str() + text.size()) {
            return ConfigValue{float_val};
        }
    }

    return ConfigValue{text};
}

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v == "true" || *v == "1" || *v == "yes";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        auto parsed = parse_config_value(*v);
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return *i;
        }
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        auto parsed = parse_config_value(*v);
        if (auto* d = std::get_if<double>(&parsed)) {
            return *d;
        }
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return static_cast<double>(*i);
        }
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

std::vector<std::string> ConfigManager::get_string_array(
    const std::string& key,
    const std::vector<std::string>& default_value) const
{
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::vector<std::string>>(&*value)) {
        return *v;
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    ConfigValue notified = value;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        ConfigLayer* target = nullptr;
        for (auto& layer : m_layers) {
            if (layer->name() == layer_name) {
                target = layer.get();
                break;
            }
        }
        if (!target) {
            m_layers.push_back(std::make_unique<ConfigLayer>(layer_name));
            target = m_layers.back().get();
        }
        target->set(key, std::move(value));
    }
    notify_change(key, notified);
}

void ConfigManager::set_bool(const std::string& key, bool value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_int(const std::string& key, std::int64_t value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_float(const std::string& key, double value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_string(const std::string& key, const std::string& value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

Result<void> ConfigManager::load_json(const std::filesystem::path& path, const std::string& layer_name) {
    std::ifstream file(path);
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to open file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_json_string(buffer.str(), layer_name);
    if (result.is_err()) {
        result.error().with_context("file", path.string());
    }
    return result;
}

Result<void> ConfigManager::load_json_string(const std::string& text, const std::string& layer_name) {
    Json json;
    try {
        json = Json::parse(text);
    } catch (const Json::parse_error& ex) {
        return Err(Error(ErrorCode::ParseError, ex.what()));
    }

    if (!json.is_object()) {
        return Err(Error(ErrorCode::ParseError, "Configuration root must be an object"));
    }

    ConfigLayer staged(layer_name);
    TETHER_TRY(flatten_json(json, "", staged));

    ConfigLayer* layer = find_or_create_layer(layer_name, ConfigLayerPriority::User);
    for (const auto& key : staged.keys()) {
        layer->set(key, *staged.get(key));
    }
    return Ok();
}

Result<void> ConfigManager::save_json(const std::filesystem::path& path, const std::string& layer_name) const {
    const ConfigLayer* layer = get_layer(layer_name);
    if (!layer) {
        return Err(Error(ErrorCode::NotFound, "Layer not found: " + layer_name));
    }

    Json root = Json::object();
    for (const auto& key : layer->keys()) {
        auto value = layer->get(key);
        std::visit([&root, &key](const auto& arg) { insert_nested(root, key, Json(arg)); }, *value);
    }

    std::ofstream file(path);
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to create file: " + path.string()));
    }
    file << root.dump(2) << "\n";
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed writing file: " + path.string()));
    }
    return Ok();
}

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    ConfigLayer* layer = find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (!arg.starts_with("--")) {
            return Err(Error(ErrorCode::InvalidArgument, "Unexpected argument: " + arg));
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
            key = key_value;
            value = args[++i];
        } else {
            key = key_value;
            value = "true";
        }

        if (key.empty()) {
            return Err(Error(ErrorCode::InvalidArgument, "Empty option name in: " + arg));
        }

        // --physics-dt -> physics.dt
        std::replace(key.begin(), key.end(), '-', '.');
        layer->set(key, parse_config_value(value));
    }

    return Ok();
}

void ConfigManager::load_environment(const std::string& prefix) {
    std::vector<std::string> known_keys;
    if (const ConfigLayer* defaults = get_layer("defaults")) {
        known_keys = defaults->keys();
    }

    ConfigLayer* layer = find_or_create_layer("environment", ConfigLayerPriority::Environment);

    for (const auto& key : known_keys) {
        std::string env_name = env_name_for(prefix, key);
        if (const char* value = std::getenv(env_name.c_str())) {
            layer->set(key, parse_config_value(value));
        }
    }
}

void ConfigManager::on_change(std::function<void(const std::string& key, const ConfigValue& value)> callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_change_callbacks.push_back(std::move(callback));
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    auto* defaults = get_layer("defaults");
    if (!defaults) return;

    // Logging
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_CONSOLE, ConfigValue{true});
    defaults->set(config_keys::LOG_FILE, ConfigValue{false});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});

    // Physics
    defaults->set(config_keys::PHYSICS_GRAVITY_X, ConfigValue{0.0});
    defaults->set(config_keys::PHYSICS_GRAVITY_Y, ConfigValue{-9.81});
    defaults->set(config_keys::PHYSICS_GRAVITY_Z, ConfigValue{0.0});
    defaults->set(config_keys::PHYSICS_DT, ConfigValue{1.0 / 60.0});
    defaults->set(config_keys::PHYSICS_MAX_VELOCITY_ITERATIONS, ConfigValue{std::int64_t(4)});
    defaults->set(config_keys::PHYSICS_MAX_POSITION_ITERATIONS, ConfigValue{std::int64_t(1)});
    defaults->set(config_keys::PHYSICS_MIN_ISLAND_SIZE, ConfigValue{std::int64_t(128)});
}

void ConfigManager::create_default_layers() {
    find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);
    find_or_create_layer("environment", ConfigLayerPriority::Environment);
    find_or_create_layer("user", ConfigLayerPriority::User);
    find_or_create_layer("project", ConfigLayerPriority::Project);
    find_or_create_layer("system", ConfigLayerPriority::System);
    find_or_create_layer("defaults", ConfigLayerPriority::Default);
}

LogConfig ConfigManager::build_log_config() const {
    LogConfig config;
    config.console_enabled = get_bool(config_keys::LOG_CONSOLE, true);
    config.file_enabled = get_bool(config_keys::LOG_FILE, false);
    config.log_directory = get_string(config_keys::LOG_DIRECTORY, "logs");

    auto level_name = get_string(config_keys::LOG_LEVEL, "info");
    if (auto level = parse_log_level(level_name)) {
        config.level = *level;
    } else {
        core_logger()->warn("Unknown log level '{}', using info", level_name);
    }
    return config;
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<ConfigLayer*> result;
    result.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    std::stable_sort(result.begin(), result.end(), [](const ConfigLayer* a, const ConfigLayer* b) {
        return static_cast<std::int32_t>(a->priority()) < static_cast<std::int32_t>(b->priority());
    });
    return result;
}

ConfigLayer* ConfigManager::find_or_create_layer(const std::string& name, ConfigLayerPriority priority) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

void ConfigManager::notify_change(const std::string& key, const ConfigValue& value) {
    std::vector<std::function<void(const std::string&, const ConfigValue&)>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callbacks = m_change_callbacks;
    }
    for (const auto& callback : callbacks) {
        callback(key, value);
    }
}

} // namespace tether_core
