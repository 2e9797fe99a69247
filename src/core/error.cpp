/// @file error.cpp
/// @brief Error handling implementation for deptrace_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <deptrace/core/error.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace deptrace_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format graph error with full context
std::string format_graph_error(const GraphError& err) {
    std::ostringstream oss;
    oss << "[GraphError] " << err.message;

    if (!err.package.empty()) {
        oss << " (package: " << err.package << ")";
    }

    return oss.str();
}

/// Format source error with full context
std::string format_source_error(const SourceError& err) {
    std::ostringstream oss;
    oss << "[SourceError] " << err.message;

    if (!err.location.empty() && err.message.find(err.location) == std::string::npos) {
        oss << " (at: " << err.location << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GraphError>) {
            oss << detail::format_graph_error(err);
        } else if constexpr (std::is_same_v<T, SourceError>) {
            oss << detail::format_source_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace deptrace_core
