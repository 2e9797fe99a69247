#pragma once

/// @file tree_renderer.hpp
/// @brief Depth-bounded, cycle-annotated dependency tree rendering
///
/// Produces one line per visited package using box-drawing connectors:
///
///     app
///     ├── core
///     │   └── util
///     └── net
///         └── app (cyclic)
///
/// A package that repeats one of its own ancestors is marked `(cyclic)` and
/// not expanded. Ancestors are the packages on the current branch only, so a
/// package reached twice through different branches is rendered in full both
/// times. The walk uses an explicit work stack rather than recursion.

#include "fwd.hpp"
#include "graph.hpp"
#include <deptrace/core/error.hpp>

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace deptrace_graph {

/// Connector for a child that has following siblings
inline constexpr const char* k_branch_connector = "├── ";
/// Connector for the last child of a node
inline constexpr const char* k_last_connector = "└── ";
/// Prefix continuation below a child that has following siblings
inline constexpr const char* k_branch_continuation = "│   ";
/// Prefix continuation below the last child
inline constexpr const char* k_last_continuation = "    ";
/// Suffix appended to a repeated ancestor
inline constexpr const char* k_cyclic_marker = " (cyclic)";

// =============================================================================
// TreeRenderer
// =============================================================================

/// Renders the dependency tree below a root package
///
/// The renderer holds a reference to the graph; the graph must outlive it.
class TreeRenderer {
public:
    explicit TreeRenderer(const DependencyGraph& graph) : m_graph(graph) {}

    /// Render the tree rooted at `root`
    ///
    /// @param root Package to start from (never filtered)
    /// @param max_depth Deepest level whose children are still listed;
    ///        the root is level 0
    /// @param filter Packages whose name contains this text are omitted
    ///        together with their subtrees; empty disables filtering
    /// @return Output lines, or GraphError::RootNotFound
    [[nodiscard]] deptrace_core::Result<std::vector<std::string>> render(
        const std::string& root,
        std::size_t max_depth,
        const std::string& filter = {}) const;

private:
    /// An expanded package whose children are being rendered
    struct Frame {
        std::string name;
        std::size_t depth;
        std::string child_prefix;
        std::vector<std::string> children;
        std::size_t next = 0;
    };

    struct RenderState {
        std::size_t max_depth;
        const std::string& filter;
        std::vector<Frame> stack;
        std::set<std::string> ancestors;  ///< Names of the packages on `stack`
        std::vector<std::string> lines;
    };

    /// Emit the line for a package and push a frame if it is expanded
    void enter(
        const std::string& name,
        std::size_t depth,
        const std::string& label_prefix,
        std::string child_prefix,
        RenderState& state) const;

    /// Dependencies of a package, filtered and sorted
    [[nodiscard]] std::vector<std::string> visible_children(
        const std::string& name,
        const std::string& filter) const;

    const DependencyGraph& m_graph;
};

/// Join rendered lines into a single newline-terminated string
[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

} // namespace deptrace_graph
