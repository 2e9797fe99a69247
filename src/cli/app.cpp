/// @file app.cpp
/// @brief deptrace program flow implementation

#include <deptrace/cli/app.hpp>
#include <deptrace/core/log.hpp>
#include <deptrace/graph/dot_export.hpp>
#include <deptrace/graph/load_order.hpp>
#include <deptrace/graph/loader.hpp>
#include <deptrace/graph/tree_renderer.hpp>
#include <deptrace/source/crawler.hpp>
#include <deptrace/source/manifest.hpp>
#include <deptrace/source/registry.hpp>

namespace deptrace_cli {

deptrace_core::Result<deptrace_graph::DependencyGraph> build_graph(const Options& options) {
    auto logger = deptrace_core::cli_logger();

    if (options.test_mode) {
        logger->info("Loading edge list: {}", options.graph_source());
        return deptrace_graph::GraphLoader::load(options.graph_source());
    }

    auto manifest = deptrace_source::ManifestReader::load(options.repo);
    if (!manifest) {
        return deptrace_core::Err<deptrace_graph::DependencyGraph>(manifest.error());
    }

    if (!manifest->package_name.empty() && manifest->package_name != options.package) {
        logger->warn("Manifest {} declares package '{}', exploring '{}'",
            manifest->source_path.string(), manifest->package_name, options.package);
    }

    // Without an index only the manifest's own dependencies are known
    deptrace_source::CrawlOptions crawl_options;
    crawl_options.max_depth = options.index.empty() ? 1 : options.max_depth;
    crawl_options.filter = options.filter;

    deptrace_source::IndexRegistry index(options.index);
    deptrace_source::RegistryCache cache(index);
    deptrace_source::GraphCrawler crawler(cache, crawl_options);

    auto graph = crawler.crawl(options.package, manifest->dependencies);

    deptrace_core::log_structured(spdlog::level::debug, "source", "Registry cache",
        {{"hits", std::to_string(cache.hits())}, {"misses", std::to_string(cache.misses())}});

    return deptrace_core::Ok(std::move(graph));
}

int run(const Options& options, std::ostream& out, std::ostream& err) {
    for (const auto& line : describe(options)) {
        out << line << "\n";
    }

    auto graph = build_graph(options);
    if (!graph) {
        err << "Error: " << graph.error().message() << "\n";
        deptrace_core::cli_logger()->debug("{}", deptrace_core::build_error_chain(graph.error()));
        return k_exit_failure;
    }

    // Root absent: report and skip traversal, not a failure
    if (!graph->contains(options.package)) {
        deptrace_core::Error missing = deptrace_core::GraphError::root_not_found(options.package);
        missing.with_context("source", options.graph_source());
        err << missing.message() << "\n";
        deptrace_core::cli_logger()->debug("{}", deptrace_core::build_error_chain(missing));
        return k_exit_success;
    }

    deptrace_graph::TreeRenderer renderer(*graph);
    auto lines = renderer.render(options.package, options.max_depth, options.filter);
    if (!lines) {
        err << lines.error().message() << "\n";
        return k_exit_success;
    }

    out << "\nDependency tree:\n" << deptrace_graph::join_lines(*lines);

    deptrace_graph::LoadOrderResolver resolver(*graph);
    auto order = resolver.compute(options.package, options.filter);
    if (!order) {
        err << order.error().message() << "\n";
        return k_exit_success;
    }

    out << "\nLoading order:\n" << deptrace_graph::join_lines(deptrace_graph::format_load_order(*order));

    if (!options.output.empty()) {
        auto dot = deptrace_graph::to_dot(*graph, options.package, options.filter);
        if (!dot) {
            err << "Error: " << dot.error().message() << "\n";
            return k_exit_failure;
        }
        auto written = deptrace_graph::write_dot_file(options.output, *dot);
        if (!written) {
            err << "Error: " << written.error().message() << "\n";
            return k_exit_failure;
        }
    }

    return k_exit_success;
}

} // namespace deptrace_cli
