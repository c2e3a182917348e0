#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tether_core module

#include <cstddef>
#include <cstdint>

namespace tether_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Handle Types
// =============================================================================

template<typename T>
struct Handle;

template<typename T>
class Pool;

struct Uuid;

template<typename K, typename V>
class BiDirHashMap;

template<typename T, std::size_t N>
class FixedVector;

// =============================================================================
// Serialization
// =============================================================================

class Visitor;
enum class VisitorFormat : std::uint8_t;

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;

// =============================================================================
// Logging
// =============================================================================

class LoggerRegistry;
class LogScope;

} // namespace tether_core
