#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for deptrace_graph module

#include <string>

namespace deptrace_graph {

// =============================================================================
// Graph Types
// =============================================================================

class DependencyGraph;
class GraphLoader;

// =============================================================================
// Traversal Types
// =============================================================================

class TreeRenderer;
struct LoadOrder;
class LoadOrderResolver;

// =============================================================================
// Utility Functions
// =============================================================================

/// True when a non-empty filter occurs in the package name
[[nodiscard]] bool is_filtered_out(const std::string& name, const std::string& filter) noexcept;

} // namespace deptrace_graph
