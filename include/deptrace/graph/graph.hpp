#pragma once

/// @file graph.hpp
/// @brief In-memory package dependency graph
///
/// Every name that appears as a dependency is also a node, so traversal
/// code never has to special-case an unknown package.

#include "fwd.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace deptrace_graph {

// =============================================================================
// DependencyGraph
// =============================================================================

/// Adjacency model mapping package names to their direct dependencies
///
/// Names are case-sensitive and compared exactly. Duplicate edges collapse.
/// Built once per invocation and read-only while traversed.
class DependencyGraph {
public:
    using DependencySet = std::set<std::string>;

    DependencyGraph() = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Register a package with no dependencies unless it already exists
    void ensure_node(const std::string& name);

    /// Add `to` as a direct dependency of `from`, registering both
    void add_edge(const std::string& from, const std::string& to);

    /// Register a package together with a batch of dependencies
    void add_dependencies(const std::string& name, const std::vector<std::string>& dependencies);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Direct dependencies of a package, empty if the package is unknown
    [[nodiscard]] const DependencySet& dependencies_of(const std::string& name) const;

    /// Check if a package is a node of the graph
    [[nodiscard]] bool contains(const std::string& name) const;

    /// All package names, sorted
    [[nodiscard]] std::vector<std::string> nodes() const;

    [[nodiscard]] std::size_t node_count() const noexcept { return m_adjacency.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return m_adjacency.empty(); }

private:
    std::map<std::string, DependencySet> m_adjacency;
};

} // namespace deptrace_graph
