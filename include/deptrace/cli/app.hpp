#pragma once

/// @file app.hpp
/// @brief deptrace program flow
///
/// Builds the dependency graph from the configured source, then prints the
/// rendered tree and the load order.

#include "options.hpp"
#include <deptrace/graph/graph.hpp>

#include <ostream>

namespace deptrace_cli {

inline constexpr int k_exit_success = 0;
inline constexpr int k_exit_failure = 1;

/// Build the graph described by the options
///
/// Test mode loads an edge-list file. Otherwise the root manifest is read
/// from --repo and the rest of the graph is crawled from the --index mirror.
///
/// @return Graph, or the error that made the whole source unusable
[[nodiscard]] deptrace_core::Result<deptrace_graph::DependencyGraph> build_graph(const Options& options);

/// Run the tool with already parsed options
///
/// @param out Receives the configured parameters, tree and load order
/// @param err Receives fatal error messages
/// @return Process exit code
int run(const Options& options, std::ostream& out, std::ostream& err);

} // namespace deptrace_cli
