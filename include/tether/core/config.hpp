/// @file config.hpp
/// @brief Layered configuration for tether
///
/// Provides layered configuration with:
/// - Built-in default values
/// - JSON configuration files
/// - Environment variables
/// - Command-line arguments

#pragma once

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tether_core {

// =============================================================================
// Config Value
// =============================================================================

using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// Infer the most specific value from text ("true" -> bool, "12" -> int, ...)
[[nodiscard]] ConfigValue parse_config_value(const std::string& text);

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< User configuration file
    Project = 100,          ///< Project configuration file
    System = 500,           ///< System defaults
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A named set of key/value pairs at one priority
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    /// All keys in ascending order
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    bool remove_layer(const std::string& name);

    [[nodiscard]] std::size_t layer_count() const;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value from the highest priority layer that contains it
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    /// Get value with default
    template<typename T>
    [[nodiscard]] T get_or(const std::string& key, T default_value) const {
        auto value = get(key);
        if (!value) return default_value;

        if constexpr (std::is_same_v<T, bool>) {
            if (auto* v = std::get_if<bool>(&*value)) return *v;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto* v = std::get_if<double>(&*value)) return static_cast<T>(*v);
            if (auto* v = std::get_if<std::int64_t>(&*value)) return static_cast<T>(*v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (auto* v = std::get_if<std::string>(&*value)) return *v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (auto* v = std::get_if<std::vector<std::string>>(&*value)) return *v;
        }

        return default_value;
    }

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;
    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key,
        const std::vector<std::string>& default_value = {}) const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in a layer (created at User priority if missing)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    void set_bool(const std::string& key, bool value, const std::string& layer_name = "user");
    void set_int(const std::string& key, std::int64_t value, const std::string& layer_name = "user");
    void set_float(const std::string& key, double value, const std::string& layer_name = "user");
    void set_string(const std::string& key, const std::string& value, const std::string& layer_name = "user");

    // =========================================================================
    // File Operations
    // =========================================================================

    /// Load a JSON file into a layer. Nested objects flatten to dotted keys.
    [[nodiscard]] Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name);

    /// Load JSON text into a layer
    [[nodiscard]] Result<void> load_json_string(const std::string& text, const std::string& layer_name);

    /// Save a layer as nested JSON
    [[nodiscard]] Result<void> save_json(const std::filesystem::path& path, const std::string& layer_name) const;

    // =========================================================================
    // Command Line / Environment
    // =========================================================================

    /// Parse --key=value, --key value and --flag arguments
    [[nodiscard]] Result<void> parse_args(int argc, char** argv);
    [[nodiscard]] Result<void> parse_args(const std::vector<std::string>& args);

    /// For every key in the defaults layer, read PREFIX + KEY_IN_UPPER_SNAKE_CASE
    void load_environment(const std::string& prefix = "TETHER_");

    // =========================================================================
    // Events
    // =========================================================================

    void on_change(std::function<void(const std::string& key, const ConfigValue& value)> callback);

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create the default layers and fill in built-in defaults
    void setup_defaults();

    /// Create default layers (cmdline, environment, user, project, system, defaults)
    void create_default_layers();

    /// Logging configuration from the log.* keys
    [[nodiscard]] LogConfig build_log_config() const;

private:
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;
    ConfigLayer* find_or_create_layer(const std::string& name, ConfigLayerPriority priority);
    void notify_change(const std::string& key, const ConfigValue& value);

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
    std::vector<std::function<void(const std::string&, const ConfigValue&)>> m_change_callbacks;
};

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Logging
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_CONSOLE = "log.console";
constexpr const char* LOG_FILE = "log.file";
constexpr const char* LOG_DIRECTORY = "log.directory";

// Physics
constexpr const char* PHYSICS_GRAVITY_X = "physics.gravity.x";
constexpr const char* PHYSICS_GRAVITY_Y = "physics.gravity.y";
constexpr const char* PHYSICS_GRAVITY_Z = "physics.gravity.z";
constexpr const char* PHYSICS_DT = "physics.dt";
constexpr const char* PHYSICS_MAX_VELOCITY_ITERATIONS = "physics.max_velocity_iterations";
constexpr const char* PHYSICS_MAX_POSITION_ITERATIONS = "physics.max_position_iterations";
constexpr const char* PHYSICS_MIN_ISLAND_SIZE = "physics.min_island_size";

} // namespace config_keys

} // namespace tether_core
