#pragma once

/// @file crawler.hpp
/// @brief Builds a DependencyGraph by querying a registry

#include "fwd.hpp"
#include "registry.hpp"
#include <deptrace/graph/graph.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace deptrace_source {

/// Limits applied while crawling
struct CrawlOptions {
    std::size_t max_depth = 3;  ///< Packages deeper than this are not fetched
    std::string filter;         ///< Packages containing this text are skipped
};

/// Counters from the last crawl
struct CrawlStats {
    std::size_t fetched = 0;  ///< Registry lookups that succeeded
    std::size_t failed = 0;   ///< Registry lookups degraded to leaves
    std::size_t skipped = 0;  ///< Dependencies dropped by the filter
};

// =============================================================================
// GraphCrawler
// =============================================================================

/// Breadth-first registry crawl from a root package
///
/// The root's direct dependencies are supplied by the caller (usually from
/// its manifest). Every other package at depth below max_depth is looked up
/// in the registry once. A failed lookup leaves the package as a leaf.
class GraphCrawler {
public:
    GraphCrawler(Registry& registry, CrawlOptions options)
        : m_registry(registry), m_options(std::move(options)) {}

    /// Crawl from `root`
    [[nodiscard]] deptrace_graph::DependencyGraph crawl(
        const std::string& root,
        const std::vector<std::string>& root_dependencies);

    [[nodiscard]] const CrawlStats& stats() const noexcept { return m_stats; }

private:
    Registry& m_registry;
    CrawlOptions m_options;
    CrawlStats m_stats;
};

} // namespace deptrace_source
