/// @file tree_renderer.cpp
/// @brief TreeRenderer implementation

#include <deptrace/graph/tree_renderer.hpp>
#include <deptrace/core/log.hpp>

#include <algorithm>

namespace deptrace_graph {

// =============================================================================
// TreeRenderer Implementation
// =============================================================================

deptrace_core::Result<std::vector<std::string>> TreeRenderer::render(
    const std::string& root,
    std::size_t max_depth,
    const std::string& filter) const {

    if (!m_graph.contains(root)) {
        return deptrace_core::Err<std::vector<std::string>>(
            deptrace_core::GraphError::root_not_found(root));
    }

    RenderState state{max_depth, filter, {}, {}, {}};
    enter(root, 0, "", "", state);

    while (!state.stack.empty()) {
        Frame& top = state.stack.back();

        if (top.next == top.children.size()) {
            state.ancestors.erase(top.name);
            state.stack.pop_back();
            continue;
        }

        std::size_t i = top.next++;
        bool is_last = (i + 1 == top.children.size());
        std::string child = top.children[i];
        std::size_t child_depth = top.depth + 1;
        std::string label_prefix = top.child_prefix + (is_last ? k_last_connector : k_branch_connector);
        std::string child_prefix = top.child_prefix + (is_last ? k_last_continuation : k_branch_continuation);

        enter(child, child_depth, label_prefix, std::move(child_prefix), state);
    }

    std::vector<std::string> lines = std::move(state.lines);

    deptrace_core::graph_logger()->debug("Rendered {} lines for '{}' (max depth {}, filter '{}')",
        lines.size(), root, max_depth, filter);

    return deptrace_core::Ok(std::move(lines));
}

void TreeRenderer::enter(
    const std::string& name,
    std::size_t depth,
    const std::string& label_prefix,
    std::string child_prefix,
    RenderState& state) const {

    if (state.ancestors.count(name)) {
        state.lines.push_back(label_prefix + name + k_cyclic_marker);
        return;
    }

    state.lines.push_back(label_prefix + name);

    if (depth >= state.max_depth) {
        return;
    }

    auto children = visible_children(name, state.filter);
    if (children.empty()) {
        return;
    }

    state.ancestors.insert(name);
    state.stack.push_back(Frame{name, depth, std::move(child_prefix), std::move(children)});
}

std::vector<std::string> TreeRenderer::visible_children(
    const std::string& name,
    const std::string& filter) const {

    std::vector<std::string> children;
    for (const auto& dep : m_graph.dependencies_of(name)) {
        if (!is_filtered_out(dep, filter)) {
            children.push_back(dep);
        }
    }
    std::sort(children.begin(), children.end());
    return children;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string output;
    for (const auto& line : lines) {
        output += line;
        output += '\n';
    }
    return output;
}

} // namespace deptrace_graph
