#pragma once

/// @file log.hpp
/// @brief Logging utilities for tether

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define TETHER_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TETHER_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TETHER_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define TETHER_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define TETHER_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define TETHER_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace tether_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Attach an extra sink to every existing and future named logger
void attach_sink(const spdlog::sink_ptr& sink);

/// Detach a sink previously passed to attach_sink
void detach_sink(const spdlog::sink_ptr& sink);

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);
void set_logger_level(const std::string& name, spdlog::level::level_enum level);
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace", "debug", "info", "warn", ...)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log entry with key/value fields appended as {key="value", ...}
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "tether");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define TETHER_LOG_SCOPE(name) ::tether_core::LogScope _log_scope_##__LINE__(name)
#define TETHER_LOG_FUNC() ::tether_core::LogScope _log_scope_func(__FUNCTION__)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();
void shutdown_logging();

} // namespace tether_core
