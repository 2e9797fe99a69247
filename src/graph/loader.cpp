/// @file loader.cpp
/// @brief Edge-list loader implementation

#include <deptrace/graph/loader.hpp>
#include <deptrace/core/log.hpp>

#include <fstream>
#include <sstream>

namespace deptrace_graph {

namespace {

constexpr std::string_view k_whitespace = " \t\r\n\v\f";

std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(k_whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(k_whitespace);
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

// =============================================================================
// GraphLoader Implementation
// =============================================================================

DependencyGraph GraphLoader::parse(std::string_view text) {
    DependencyGraph graph;
    parse_into(text, graph);
    return graph;
}

std::size_t GraphLoader::parse_into(std::string_view text, DependencyGraph& graph) {
    std::size_t records = 0;

    while (!text.empty()) {
        auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1);

        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }

        std::string_view name = trim(line.substr(0, colon));
        if (name.empty()) {
            continue;
        }

        std::string package(name);
        graph.ensure_node(package);

        std::string_view rest = line.substr(colon + 1);
        while (!rest.empty()) {
            auto start = rest.find_first_not_of(k_whitespace);
            if (start == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(start);
            auto stop = rest.find_first_of(k_whitespace);
            graph.add_edge(package, std::string(rest.substr(0, stop)));
            rest = (stop == std::string_view::npos) ? std::string_view{} : rest.substr(stop);
        }

        ++records;
    }

    return records;
}

deptrace_core::Result<DependencyGraph> GraphLoader::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return deptrace_core::Err<DependencyGraph>(
            deptrace_core::SourceError::not_found(path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return deptrace_core::Err<DependencyGraph>(
            deptrace_core::SourceError::io_error(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    DependencyGraph graph;
    std::size_t records = parse_into(buffer.str(), graph);

    deptrace_core::graph_logger()->debug("Loaded {} records ({} packages, {} edges) from {}",
        records, graph.node_count(), graph.edge_count(), path.string());

    return deptrace_core::Ok(std::move(graph));
}

} // namespace deptrace_graph
