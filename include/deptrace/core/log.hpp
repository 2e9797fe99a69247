#pragma once

/// @file log.hpp
/// @brief Logging utilities for deptrace

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <map>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define DEPTRACE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define DEPTRACE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define DEPTRACE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define DEPTRACE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define DEPTRACE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define DEPTRACE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace deptrace_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
///
/// Console output goes to stderr; stdout is reserved for program output.
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::warn;
};

/// Configure logging system with full options
///
/// Also replaces the spdlog default logger so the DEPTRACE_LOG_* macros
/// honour the configured sinks.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the graph traversal logger
std::shared_ptr<spdlog::logger> graph_logger();

/// Get the manifest/registry logger
std::shared_ptr<spdlog::logger> source_logger();

/// Get the command-line logger
std::shared_ptr<spdlog::logger> cli_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log entry with structured data
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace deptrace_core
