/// @file dot_export.cpp
/// @brief DOT export implementation

#include <deptrace/graph/dot_export.hpp>
#include <deptrace/core/log.hpp>

#include <fstream>
#include <set>
#include <sstream>
#include <vector>

namespace deptrace_graph {

namespace {

/// Quote a name as a DOT identifier
std::string quote(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

deptrace_core::Result<std::string> to_dot(
    const DependencyGraph& graph,
    const std::string& root,
    const std::string& filter) {

    if (!graph.contains(root)) {
        return deptrace_core::Err<std::string>(
            deptrace_core::GraphError::root_not_found(root));
    }

    // Collect reachable packages; the root is kept even when it matches
    std::set<std::string> reachable;
    std::vector<std::string> to_visit = {root};

    while (!to_visit.empty()) {
        std::string current = to_visit.back();
        to_visit.pop_back();

        if (!reachable.insert(current).second) {
            continue;
        }

        for (const auto& dep : graph.dependencies_of(current)) {
            if (!is_filtered_out(dep, filter) && !reachable.count(dep)) {
                to_visit.push_back(dep);
            }
        }
    }

    std::ostringstream oss;
    oss << "digraph dependencies {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=box];\n\n";

    for (const auto& name : reachable) {
        oss << "  " << quote(name);
        if (name == root) {
            oss << " [style=filled, fillcolor=lightblue]";
        }
        oss << ";\n";
    }
    oss << "\n";

    for (const auto& name : reachable) {
        for (const auto& dep : graph.dependencies_of(name)) {
            if (reachable.count(dep) && !is_filtered_out(dep, filter)) {
                oss << "  " << quote(name) << " -> " << quote(dep) << ";\n";
            }
        }
    }

    oss << "}\n";
    return deptrace_core::Ok(oss.str());
}

deptrace_core::Result<void> write_dot_file(
    const std::filesystem::path& path,
    const std::string& dot_source) {

    std::ofstream file(path);
    if (!file.is_open()) {
        return deptrace_core::Err(
            deptrace_core::Error(deptrace_core::ErrorCode::IOError,
                "Failed to open output file: " + path.string()));
    }

    file << dot_source;
    if (!file) {
        return deptrace_core::Err(
            deptrace_core::Error(deptrace_core::ErrorCode::IOError,
                "Failed to write output file: " + path.string()));
    }

    deptrace_core::graph_logger()->info("Wrote DOT graph to {}", path.string());
    return deptrace_core::Ok();
}

} // namespace deptrace_graph
