#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for deptrace_core module

#include <cstdint>

namespace deptrace_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct GraphError;
struct SourceError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace deptrace_core
