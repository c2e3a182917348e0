/// @file error.cpp
/// @brief Error formatting and common Result instantiations for tether_core

#include <tether/core/error.hpp>
#include <sstream>
#include <vector>

namespace tether_core {

namespace detail {

const char* physics_kind_name(PhysicsError::Kind kind) {
    switch (kind) {
        case PhysicsError::Kind::NotFound: return "NotFound";
        case PhysicsError::Kind::MissingData: return "MissingData";
        case PhysicsError::Kind::MalformedData: return "MalformedData";
        case PhysicsError::Kind::Degenerate: return "Degenerate";
        case PhysicsError::Kind::InvalidState: return "InvalidState";
        default: return "Unknown";
    }
}

std::string format_physics_error(const PhysicsError& err) {
    std::ostringstream oss;
    oss << "[PhysicsError:" << physics_kind_name(err.kind) << "] " << err.message;
    if (!err.handle.empty() && err.message.find(err.handle) == std::string::npos) {
        oss << " (handle: " << err.handle << ")";
    }
    return oss.str();
}

std::string format_visit_error(const VisitError& err) {
    std::ostringstream oss;
    oss << "[VisitError] " << err.message;
    if (!err.path.empty() && err.message.find(err.path) == std::string::npos) {
        oss << " (at: " << err.path << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PhysicsError>) {
            oss << detail::format_physics_error(err);
        } else if constexpr (std::is_same_v<T, VisitError>) {
            oss << detail::format_visit_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<float, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace tether_core
