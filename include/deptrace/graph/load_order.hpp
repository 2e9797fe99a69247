#pragma once

/// @file load_order.hpp
/// @brief Reverse-topological load order with cycle detection
///
/// The LoadOrderResolver performs a depth-first post-order walk driven by an
/// explicit work stack, so chain length is not limited by the call stack:
/// - Dependencies are emitted before the packages that need them
/// - Siblings are visited in ascending name order, so output is deterministic
/// - A dependency that is still on the active chain is recorded as a
///   cycle point and not descended into again

#include "fwd.hpp"
#include "graph.hpp"
#include <deptrace/core/error.hpp>

#include <set>
#include <string>
#include <vector>

namespace deptrace_graph {

/// Separator between package names in a formatted load order
inline constexpr const char* k_load_order_separator = "-> ";

// =============================================================================
// LoadOrder
// =============================================================================

/// Result of a load-order computation
struct LoadOrder {
    std::vector<std::string> order;  ///< Packages, dependencies first
    std::set<std::string> cycles;    ///< Packages where a repeat was detected

    [[nodiscard]] bool has_cycles() const noexcept { return !cycles.empty(); }

    /// Cycle points that also appear in the order, sorted
    [[nodiscard]] std::vector<std::string> cycles_in_order() const;
};

// =============================================================================
// LoadOrderResolver
// =============================================================================

/// Computes the order in which packages must be loaded
///
/// Cycle reporting is partial: only the package at which a repeat was
/// detected is recorded, not every member of the cycle.
///
/// The resolver holds a reference to the graph; the graph must outlive it.
class LoadOrderResolver {
public:
    explicit LoadOrderResolver(const DependencyGraph& graph) : m_graph(graph) {}

    /// Compute the load order of everything reachable from `start`
    ///
    /// @param start Package to start from; a filtered start yields an
    ///        empty order
    /// @param filter Packages whose name contains this text are treated as
    ///        absent; empty disables filtering
    /// @return Load order, or GraphError::RootNotFound
    [[nodiscard]] deptrace_core::Result<LoadOrder> compute(
        const std::string& start,
        const std::string& filter = {}) const;

private:
    /// One package on the active DFS chain and the next dependency to examine
    struct Frame {
        std::string name;
        DependencyGraph::DependencySet::const_iterator next;
        DependencyGraph::DependencySet::const_iterator end;
    };

    struct VisitState {
        std::vector<Frame> stack;
        std::set<std::string> visited;
        std::set<std::string> on_stack;
        LoadOrder result;
    };

    /// Push a package onto the active chain
    void enter(const std::string& name, VisitState& state) const;

    /// Topological sort (DFS with an explicit work stack)
    void visit(const std::string& start, const std::string& filter, VisitState& state) const;

    const DependencyGraph& m_graph;
};

// =============================================================================
// Formatting
// =============================================================================

/// Format a load order for display
///
/// The first line holds the names joined by k_load_order_separator. A second
/// line is added when cycle points appear in the order.
[[nodiscard]] std::vector<std::string> format_load_order(const LoadOrder& load_order);

} // namespace deptrace_graph
