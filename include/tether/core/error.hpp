#pragma once

/// @file error.hpp
/// @brief Error handling types for tether_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

/// Propagate the error of a Result-returning expression
#define TETHER_TRY(expr) \
    do { \
        auto _tether_try_result = (expr); \
        if (_tether_try_result.is_err()) { \
            return std::move(_tether_try_result.error()); \
        } \
    } while (0)

namespace tether_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    MalformedData,
    MissingData,
    IncompatibleVersion,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::MalformedData: return "MalformedData";
        case ErrorCode::MissingData: return "MissingData";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Physics world errors
struct PhysicsError {
    enum class Kind : std::uint8_t {
        NotFound,       // Engine handle has no live entity
        MissingData,    // Geometry source node is absent or invalid
        MalformedData,  // Descriptor cannot be turned into a live entity
        Degenerate,     // Input produced no usable geometry
        InvalidState,   // World is not in the state the operation requires
    };

    Kind kind;
    std::string message;
    std::string handle;

    [[nodiscard]] static PhysicsError not_found(const std::string& what, const std::string& handle) {
        return PhysicsError{Kind::NotFound, what + " not found: " + handle, handle};
    }

    [[nodiscard]] static PhysicsError missing_data(const std::string& reason) {
        return PhysicsError{Kind::MissingData, "Missing data: " + reason, {}};
    }

    [[nodiscard]] static PhysicsError malformed_data(const std::string& reason) {
        return PhysicsError{Kind::MalformedData, reason, {}};
    }

    [[nodiscard]] static PhysicsError degenerate(const std::string& reason) {
        return PhysicsError{Kind::Degenerate, "Degenerate input: " + reason, {}};
    }

    [[nodiscard]] static PhysicsError invalid_state(const std::string& reason) {
        return PhysicsError{Kind::InvalidState, "Invalid state: " + reason, {}};
    }
};

/// Serialization visitor errors
struct VisitError {
    enum class Kind : std::uint8_t {
        RegionNotFound,      // Named region absent while reading
        FieldNotFound,       // Named field absent while reading
        TypeMismatch,        // Field stored with a different type
        MalformedData,       // Value read but semantically invalid
        Io,                  // Underlying stream failure
        UnsupportedVersion,  // Stored schema is newer than this build
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static VisitError region_not_found(const std::string& path) {
        return VisitError{Kind::RegionNotFound, "Region not found: " + path, path};
    }

    [[nodiscard]] static VisitError field_not_found(const std::string& path) {
        return VisitError{Kind::FieldNotFound, "Field not found: " + path, path};
    }

    [[nodiscard]] static VisitError type_mismatch(const std::string& path, const std::string& expected) {
        return VisitError{Kind::TypeMismatch, "Type mismatch at " + path + ", expected " + expected, path};
    }

    [[nodiscard]] static VisitError malformed_data(const std::string& reason) {
        return VisitError{Kind::MalformedData, reason, {}};
    }

    [[nodiscard]] static VisitError io(const std::string& reason) {
        return VisitError{Kind::Io, "I/O error: " + reason, {}};
    }

    [[nodiscard]] static VisitError unsupported_version(std::uint32_t found, std::uint32_t supported) {
        return VisitError{Kind::UnsupportedVersion,
            "Unsupported schema version " + std::to_string(found) +
            " (newest supported is " + std::to_string(supported) + ")", {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PhysicsError,
        VisitError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(PhysicsError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(VisitError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(PhysicsError::Kind kind) {
        switch (kind) {
            case PhysicsError::Kind::NotFound: return ErrorCode::NotFound;
            case PhysicsError::Kind::MissingData: return ErrorCode::MissingData;
            case PhysicsError::Kind::MalformedData: return ErrorCode::MalformedData;
            case PhysicsError::Kind::Degenerate: return ErrorCode::InvalidArgument;
            case PhysicsError::Kind::InvalidState: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(VisitError::Kind kind) {
        switch (kind) {
            case VisitError::Kind::RegionNotFound: return ErrorCode::MissingData;
            case VisitError::Kind::FieldNotFound: return ErrorCode::MissingData;
            case VisitError::Kind::TypeMismatch: return ErrorCode::ParseError;
            case VisitError::Kind::MalformedData: return ErrorCode::MalformedData;
            case VisitError::Kind::Io: return ErrorCode::IOError;
            case VisitError::Kind::UnsupportedVersion: return ErrorCode::IncompatibleVersion;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

} // namespace tether_core
