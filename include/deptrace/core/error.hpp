#pragma once

/// @file error.hpp
/// @brief Error handling types for deptrace_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace deptrace_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    IOError,
    ParseError,
    FetchFailed,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::FetchFailed: return "FetchFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Errors raised at the boundary of a graph traversal
struct GraphError {
    enum class Kind : std::uint8_t {
        RootNotFound,  // Traversal root is not a node of the graph
    };

    Kind kind;
    std::string message;
    std::string package;

    [[nodiscard]] static GraphError root_not_found(const std::string& name) {
        return GraphError{Kind::RootNotFound, "Package not found in graph: " + name, name};
    }
};

/// Errors raised while reading manifests, edge lists or registry data
struct SourceError {
    enum class Kind : std::uint8_t {
        NotFound,     // Source file or registry entry does not exist
        IOError,      // Source exists but could not be read
        ParseError,   // Source content is malformed
        FetchFailed,  // Registry lookup failed for another reason
    };

    Kind kind;
    std::string message;
    std::string location;  // File path or package name

    [[nodiscard]] static SourceError not_found(const std::string& where) {
        return SourceError{Kind::NotFound, "Not found: " + where, where};
    }

    [[nodiscard]] static SourceError io_error(const std::string& where) {
        return SourceError{Kind::IOError, "Failed to read: " + where, where};
    }

    [[nodiscard]] static SourceError parse_error(const std::string& where, const std::string& reason) {
        return SourceError{Kind::ParseError, "Parse error in " + where + ": " + reason, where};
    }

    [[nodiscard]] static SourceError fetch_failed(const std::string& package, const std::string& reason) {
        return SourceError{Kind::FetchFailed,
            "Failed to fetch '" + package + "': " + reason, package};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        GraphError,
        SourceError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(GraphError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(SourceError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
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

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(GraphError::Kind kind) {
        switch (kind) {
            case GraphError::Kind::RootNotFound: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SourceError::Kind kind) {
        switch (kind) {
            case SourceError::Kind::NotFound: return ErrorCode::NotFound;
            case SourceError::Kind::IOError: return ErrorCode::IOError;
            case SourceError::Kind::ParseError: return ErrorCode::ParseError;
            case SourceError::Kind::FetchFailed: return ErrorCode::FetchFailed;
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

/// Result type holding either a value or an error
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

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

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

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

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

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error);

} // namespace deptrace_core
