// deptrace_source registry tests
//
// IndexRegistry reads a sparse-index layout from a temporary directory;
// RegistryCache is exercised against a counting in-memory registry.

#include <catch2/catch_test_macros.hpp>
#include <deptrace/source/registry.hpp>

#include <filesystem>
#include <fstream>
#include <map>

using namespace deptrace_source;
using Names = std::vector<std::string>;

namespace {

namespace fs = std::filesystem;

/// Write an index file for a package under the sparse-index layout
void write_index(const fs::path& root, const std::string& package, const std::string& content) {
    auto path = root / IndexRegistry::index_path(package);
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

/// In-memory registry that counts lookups
class CountingRegistry : public Registry {
public:
    std::map<std::string, Names> packages;
    std::size_t calls = 0;

    FetchResult fetch_dependencies(const std::string& package) override {
        ++calls;
        auto it = packages.find(package);
        if (it == packages.end()) {
            return deptrace_core::Err<DependencyList>(
                deptrace_core::SourceError::fetch_failed(package, "unknown package"));
        }
        return deptrace_core::Ok(it->second);
    }
};

} // anonymous namespace

TEST_CASE("Sparse index paths", "[source][registry]") {
    REQUIRE(IndexRegistry::index_path("a") == fs::path("1") / "a");
    REQUIRE(IndexRegistry::index_path("cc") == fs::path("2") / "cc");
    REQUIRE(IndexRegistry::index_path("syn") == fs::path("3") / "s" / "syn");
    REQUIRE(IndexRegistry::index_path("serde") == fs::path("se") / "rd" / "serde");
    REQUIRE(IndexRegistry::index_path("Inflector") == fs::path("in") / "fl" / "inflector");
}

TEST_CASE("Index entry parsing", "[source][registry]") {
    SECTION("uses the last non-yanked version") {
        auto result = IndexRegistry::parse_index_entry(
            R"({"name":"x","vers":"1.0.0","deps":[{"name":"old","kind":"normal"}],"yanked":false})" "\n"
            R"({"name":"x","vers":"1.1.0","deps":[{"name":"new","kind":"normal"}],"yanked":false})" "\n"
            R"({"name":"x","vers":"1.2.0","deps":[{"name":"bad","kind":"normal"}],"yanked":true})" "\n",
            "x");
        REQUIRE(result.is_ok());
        REQUIRE(*result == Names{"new"});
    }

    SECTION("keeps only normal dependencies") {
        auto result = IndexRegistry::parse_index_entry(
            R"({"name":"x","vers":"1.0.0","deps":[)"
            R"({"name":"serde","kind":"normal","optional":true},)"
            R"({"name":"cc","kind":"build"},)"
            R"({"name":"proptest","kind":"dev"},)"
            R"({"name":"libc","kind":null},)"
            R"({"name":"log"})"
            R"(]})",
            "x");
        REQUIRE(result.is_ok());
        REQUIRE(*result == Names{"libc", "log", "serde"});
    }

    SECTION("renamed dependency uses the real crate name") {
        auto result = IndexRegistry::parse_index_entry(
            R"({"name":"x","vers":"1.0.0","deps":[{"name":"alias","package":"real","kind":"normal"}]})",
            "x");
        REQUIRE(result.is_ok());
        REQUIRE(*result == Names{"real"});
    }

    SECTION("malformed lines are skipped") {
        auto result = IndexRegistry::parse_index_entry(
            R"({"name":"x","vers":"1.0.0","deps":[{"name":"ok"}]})" "\n"
            "not json\n"
            "[1, 2]\n",
            "x");
        REQUIRE(result.is_ok());
        REQUIRE(*result == Names{"ok"});
    }

    SECTION("no deps field") {
        auto result = IndexRegistry::parse_index_entry(R"({"name":"x","vers":"0.1.0"})", "x");
        REQUIRE(result.is_ok());
        REQUIRE(result->empty());
    }

    SECTION("nothing usable") {
        auto result = IndexRegistry::parse_index_entry("garbage\n\n", "x");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == deptrace_core::ErrorCode::ParseError);
    }
}

TEST_CASE("IndexRegistry lookups", "[source][registry]") {
    auto root = fs::temp_directory_path() / "deptrace_index_test";
    fs::create_directories(root);
    write_index(root, "serde", R"({"name":"serde","vers":"1.0.0","deps":[{"name":"serde_derive","kind":"normal","optional":true}]})" "\n");

    IndexRegistry registry(root);

    SECTION("known package") {
        auto result = registry.fetch_dependencies("serde");
        REQUIRE(result.is_ok());
        REQUIRE(*result == Names{"serde_derive"});
    }

    SECTION("unknown package") {
        auto result = registry.fetch_dependencies("does-not-exist");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == deptrace_core::ErrorCode::NotFound);
    }

    SECTION("empty name") {
        REQUIRE(registry.fetch_dependencies("").is_err());
    }

    fs::remove_all(root);
}

TEST_CASE("RegistryCache", "[source][registry]") {
    CountingRegistry upstream;
    upstream.packages["a"] = {"b", "c"};
    RegistryCache cache(upstream);

    SECTION("successes are fetched once") {
        REQUIRE(*cache.fetch_dependencies("a") == Names{"b", "c"});
        REQUIRE(*cache.fetch_dependencies("a") == Names{"b", "c"});
        REQUIRE(upstream.calls == 1);
        REQUIRE(cache.hits() == 1);
        REQUIRE(cache.misses() == 1);
    }

    SECTION("failures are cached too") {
        REQUIRE(cache.fetch_dependencies("zz").is_err());
        REQUIRE(cache.fetch_dependencies("zz").is_err());
        REQUIRE(upstream.calls == 1);
    }

    SECTION("clear resets state") {
        (void)cache.fetch_dependencies("a");
        cache.clear();
        REQUIRE(cache.size() == 0);
        REQUIRE(cache.hits() == 0);
        (void)cache.fetch_dependencies("a");
        REQUIRE(upstream.calls == 2);
    }
}
