// deptrace_source GraphCrawler tests

#include <catch2/catch_test_macros.hpp>
#include <deptrace/source/crawler.hpp>

#include <algorithm>
#include <map>

using namespace deptrace_source;
using Names = std::vector<std::string>;

namespace {

/// In-memory registry recording which packages were requested
class FakeRegistry : public Registry {
public:
    std::map<std::string, Names> packages;
    Names requested;

    FetchResult fetch_dependencies(const std::string& package) override {
        requested.push_back(package);
        auto it = packages.find(package);
        if (it == packages.end()) {
            return deptrace_core::Err<DependencyList>(
                deptrace_core::SourceError::not_found(package));
        }
        return deptrace_core::Ok(it->second);
    }
};

} // anonymous namespace

TEST_CASE("GraphCrawler expansion", "[source][crawler]") {
    FakeRegistry registry;
    registry.packages["web"] = {"http", "log"};
    registry.packages["http"] = {"bytes"};
    registry.packages["bytes"] = {"deep"};
    registry.packages["log"] = {};

    SECTION("root dependencies come from the caller") {
        GraphCrawler crawler(registry, CrawlOptions{3, ""});
        auto graph = crawler.crawl("app", {"web"});

        REQUIRE(graph.dependencies_of("app") == deptrace_graph::DependencyGraph::DependencySet{"web"});
        REQUIRE(graph.dependencies_of("web").size() == 2);
        REQUIRE(graph.dependencies_of("http").count("bytes") == 1);
        // The root itself is never looked up
        REQUIRE(std::find(registry.requested.begin(), registry.requested.end(), "app") ==
            registry.requested.end());
    }

    SECTION("depth limit stops lookups") {
        GraphCrawler crawler(registry, CrawlOptions{2, ""});
        auto graph = crawler.crawl("app", {"web"});

        REQUIRE(graph.contains("http"));
        REQUIRE(graph.dependencies_of("http").empty());
        REQUIRE_FALSE(graph.contains("bytes"));
        REQUIRE(registry.requested == Names{"web"});
    }

    SECTION("depth one uses only the root dependencies") {
        GraphCrawler crawler(registry, CrawlOptions{1, ""});
        auto graph = crawler.crawl("app", {"web", "other"});

        REQUIRE(graph.node_count() == 3);
        REQUIRE(registry.requested.empty());
    }

    SECTION("unknown packages become leaves") {
        GraphCrawler crawler(registry, CrawlOptions{5, ""});
        auto graph = crawler.crawl("app", {"web", "ghost"});

        REQUIRE(graph.contains("ghost"));
        REQUIRE(graph.dependencies_of("ghost").empty());
        REQUIRE(crawler.stats().failed >= 1);
    }

    SECTION("every package is fetched once") {
        registry.packages["log"] = {"http"};
        GraphCrawler crawler(registry, CrawlOptions{10, ""});
        (void)crawler.crawl("app", {"web", "log", "http"});

        std::map<std::string, int> counts;
        for (const auto& name : registry.requested) {
            ++counts[name];
        }
        for (const auto& [name, count] : counts) {
            REQUIRE(count == 1);
        }
    }

    SECTION("filtered packages are neither added nor fetched") {
        registry.packages["web"] = {"http", "log", "test-utils"};
        GraphCrawler crawler(registry, CrawlOptions{5, "test"});
        auto graph = crawler.crawl("app", {"web", "testing"});

        REQUIRE_FALSE(graph.contains("testing"));
        REQUIRE_FALSE(graph.contains("test-utils"));
        REQUIRE(crawler.stats().skipped == 2);
        for (const auto& name : registry.requested) {
            REQUIRE(name.find("test") == std::string::npos);
        }
    }

    SECTION("cycles terminate") {
        registry.packages["a"] = {"b"};
        registry.packages["b"] = {"a"};
        GraphCrawler crawler(registry, CrawlOptions{50, ""});
        auto graph = crawler.crawl("root", {"a"});

        REQUIRE(graph.dependencies_of("b").count("a") == 1);
        REQUIRE(registry.requested == Names{"a", "b"});
    }
}
