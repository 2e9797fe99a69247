#pragma once

/// @file dot_export.hpp
/// @brief GraphViz DOT source for a dependency graph

#include "fwd.hpp"
#include "graph.hpp"
#include <deptrace/core/error.hpp>

#include <filesystem>
#include <string>

namespace deptrace_graph {

/// Generate GraphViz DOT source for the subgraph reachable from `root`
///
/// Filtered packages and edges into them are left out. Nodes and edges are
/// emitted in name order. The root is highlighted.
[[nodiscard]] deptrace_core::Result<std::string> to_dot(
    const DependencyGraph& graph,
    const std::string& root,
    const std::string& filter = {});

/// Write DOT source to a file
[[nodiscard]] deptrace_core::Result<void> write_dot_file(
    const std::filesystem::path& path,
    const std::string& dot_source);

} // namespace deptrace_graph
