/// @file crawler.cpp
/// @brief GraphCrawler implementation

#include <deptrace/source/crawler.hpp>
#include <deptrace/core/log.hpp>

#include <deque>
#include <set>
#include <utility>

namespace deptrace_source {

deptrace_graph::DependencyGraph GraphCrawler::crawl(
    const std::string& root,
    const std::vector<std::string>& root_dependencies) {

    m_stats = CrawlStats{};
    auto logger = deptrace_core::source_logger();

    deptrace_graph::DependencyGraph graph;
    graph.ensure_node(root);

    std::set<std::string> seen = {root};
    std::deque<std::pair<std::string, std::size_t>> queue;

    // Register the dependencies of `name` and queue the new ones
    auto expand = [&](const std::string& name, const DependencyList& deps, std::size_t depth) {
        for (const auto& dep : deps) {
            if (deptrace_graph::is_filtered_out(dep, m_options.filter)) {
                ++m_stats.skipped;
                continue;
            }
            graph.add_edge(name, dep);
            if (seen.insert(dep).second) {
                queue.emplace_back(dep, depth + 1);
            }
        }
    };

    if (m_options.max_depth > 0) {
        expand(root, root_dependencies, 0);
    }

    while (!queue.empty()) {
        auto [name, depth] = queue.front();
        queue.pop_front();

        if (depth >= m_options.max_depth) {
            continue;
        }

        auto result = m_registry.fetch_dependencies(name);
        if (!result) {
            ++m_stats.failed;
            logger->warn("No dependency data for '{}': {}",
                name, deptrace_core::build_error_chain(result.error()));
            continue;
        }

        ++m_stats.fetched;
        expand(name, result.value(), depth);
    }

    logger->info("Crawled '{}': {} packages, {} fetched, {} unknown, {} filtered",
        root, graph.node_count(), m_stats.fetched, m_stats.failed, m_stats.skipped);

    return graph;
}

} // namespace deptrace_source
