#pragma once

/// @file options.hpp
/// @brief Command-line configuration for the deptrace tool

#include <deptrace/core/error.hpp>

#include <spdlog/common.h>

#include <cstddef>
#include <string>
#include <vector>

namespace deptrace_cli {

/// Edge-list file used in test mode when no --repo is given
inline constexpr const char* k_default_test_graph = "test_graph.txt";

/// Default tree depth
inline constexpr std::size_t k_default_max_depth = 3;

// =============================================================================
// Options
// =============================================================================

/// Parsed command-line options
struct Options {
    std::string package;                 ///< Root package (--package)
    std::string repo;                    ///< Edge-list file or project path (--repo)
    bool test_mode = false;              ///< Read an edge-list file (--test-mode)
    std::string output;                  ///< DOT output file, empty for none (--output)
    std::size_t max_depth = k_default_max_depth;  ///< Tree depth (--max-depth)
    std::string filter;                  ///< Name substring to exclude (--filter)
    std::string index;                   ///< Sparse-index mirror directory (--index)
    spdlog::level::level_enum log_level = spdlog::level::warn;  ///< (--log-level)
    std::string log_directory;           ///< Enables file logging (--log-dir)
    bool show_help = false;
    bool show_version = false;

    /// Graph source actually used: --repo, or the test-mode default
    [[nodiscard]] std::string graph_source() const;
};

// =============================================================================
// Parsing
// =============================================================================

/// Parse arguments (without the program name)
///
/// @return Options, or an InvalidArgument error describing the problem
[[nodiscard]] deptrace_core::Result<Options> parse_options(const std::vector<std::string>& args);

/// Parse a strictly positive integer
[[nodiscard]] deptrace_core::Result<std::size_t> parse_positive_int(const std::string& value);

/// Lines listing the configured parameters
[[nodiscard]] std::vector<std::string> describe(const Options& options);

/// Usage text
[[nodiscard]] std::string usage_text(const std::string& program_name);

/// Version text
[[nodiscard]] std::string version_text();

} // namespace deptrace_cli
