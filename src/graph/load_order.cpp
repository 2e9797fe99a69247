/// @file load_order.cpp
/// @brief LoadOrderResolver implementation

#include <deptrace/graph/load_order.hpp>
#include <deptrace/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace deptrace_graph {

// =============================================================================
// LoadOrder
// =============================================================================

std::vector<std::string> LoadOrder::cycles_in_order() const {
    std::vector<std::string> names;
    for (const auto& name : cycles) {
        if (std::find(order.begin(), order.end(), name) != order.end()) {
            names.push_back(name);
        }
    }
    return names;  // std::set iteration is already sorted
}

// =============================================================================
// LoadOrderResolver Implementation
// =============================================================================

deptrace_core::Result<LoadOrder> LoadOrderResolver::compute(
    const std::string& start,
    const std::string& filter) const {

    if (!m_graph.contains(start)) {
        return deptrace_core::Err<LoadOrder>(
            deptrace_core::GraphError::root_not_found(start));
    }

    VisitState state;
    visit(start, filter, state);

    if (state.result.has_cycles()) {
        deptrace_core::graph_logger()->info("Cycles detected below '{}' at {} package(s)",
            start, state.result.cycles.size());
    }
    deptrace_core::graph_logger()->debug("Load order for '{}' has {} packages",
        start, state.result.order.size());

    return deptrace_core::Ok(std::move(state.result));
}

void LoadOrderResolver::enter(const std::string& name, VisitState& state) const {
    const auto& deps = m_graph.dependencies_of(name);
    state.on_stack.insert(name);
    state.stack.push_back(Frame{name, deps.begin(), deps.end()});
}

void LoadOrderResolver::visit(
    const std::string& start,
    const std::string& filter,
    VisitState& state) const {

    if (is_filtered_out(start, filter)) {
        return;
    }

    enter(start, state);

    while (!state.stack.empty()) {
        Frame& top = state.stack.back();

        // All dependencies done: emit in post-order
        if (top.next == top.end) {
            std::string name = std::move(top.name);
            state.stack.pop_back();
            state.on_stack.erase(name);
            state.visited.insert(name);
            state.result.order.push_back(std::move(name));
            continue;
        }

        // std::set iterates in ascending order
        const std::string& dep = *top.next;
        ++top.next;

        if (is_filtered_out(dep, filter)) {
            continue;
        }
        if (state.on_stack.count(dep)) {
            state.result.cycles.insert(dep);
            continue;
        }
        if (state.visited.count(dep)) {
            continue;
        }

        enter(dep, state);
    }
}

// =============================================================================
// Formatting
// =============================================================================

std::vector<std::string> format_load_order(const LoadOrder& load_order) {
    std::vector<std::string> lines;

    std::ostringstream oss;
    for (std::size_t i = 0; i < load_order.order.size(); ++i) {
        if (i > 0) oss << k_load_order_separator;
        oss << load_order.order[i];
    }
    lines.push_back(oss.str());

    auto cyclic = load_order.cycles_in_order();
    if (!cyclic.empty()) {
        std::ostringstream note;
        note << "Note: cyclic dependencies detected at: ";
        for (std::size_t i = 0; i < cyclic.size(); ++i) {
            if (i > 0) note << ", ";
            note << cyclic[i];
        }
        lines.push_back(note.str());
    }

    return lines;
}

} // namespace deptrace_graph
