/// @file graph.cpp
/// @brief DependencyGraph implementation

#include <deptrace/graph/graph.hpp>

namespace deptrace_graph {

bool is_filtered_out(const std::string& name, const std::string& filter) noexcept {
    return !filter.empty() && name.find(filter) != std::string::npos;
}

// =============================================================================
// DependencyGraph Implementation
// =============================================================================

void DependencyGraph::ensure_node(const std::string& name) {
    m_adjacency.try_emplace(name);
}

void DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    ensure_node(to);
    m_adjacency[from].insert(to);
}

void DependencyGraph::add_dependencies(
    const std::string& name,
    const std::vector<std::string>& dependencies) {

    ensure_node(name);
    for (const auto& dep : dependencies) {
        add_edge(name, dep);
    }
}

const DependencyGraph::DependencySet& DependencyGraph::dependencies_of(const std::string& name) const {
    static const DependencySet s_empty;

    auto it = m_adjacency.find(name);
    if (it == m_adjacency.end()) {
        return s_empty;
    }
    return it->second;
}

bool DependencyGraph::contains(const std::string& name) const {
    return m_adjacency.count(name) > 0;
}

std::vector<std::string> DependencyGraph::nodes() const {
    std::vector<std::string> names;
    names.reserve(m_adjacency.size());
    for (const auto& [name, _] : m_adjacency) {
        names.push_back(name);
    }
    return names;
}

std::size_t DependencyGraph::edge_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [_, deps] : m_adjacency) {
        count += deps.size();
    }
    return count;
}

} // namespace deptrace_graph
