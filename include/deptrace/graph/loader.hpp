#pragma once

/// @file loader.hpp
/// @brief Edge-list loading into a DependencyGraph
///
/// Format, one record per line:
///
///     name: dep1 dep2 dep3
///
/// Blank lines, `#` comments and lines without a colon are skipped.
/// Names are taken verbatim.

#include "fwd.hpp"
#include "graph.hpp"
#include <deptrace/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace deptrace_graph {

// =============================================================================
// GraphLoader
// =============================================================================

/// Builds a DependencyGraph from line-based edge-list text
class GraphLoader {
public:
    /// Parse edge-list text; malformed lines are skipped, never reported
    [[nodiscard]] static DependencyGraph parse(std::string_view text);

    /// Parse edge-list text into an existing graph
    ///
    /// @return Number of records accepted
    static std::size_t parse_into(std::string_view text, DependencyGraph& graph);

    /// Read and parse an edge-list file
    ///
    /// @return Graph, or SourceError if the file is missing or unreadable
    [[nodiscard]] static deptrace_core::Result<DependencyGraph> load(const std::filesystem::path& path);
};

} // namespace deptrace_graph
