// deptrace_graph DOT export tests

#include <catch2/catch_test_macros.hpp>
#include <deptrace/graph/dot_export.hpp>
#include <deptrace/graph/loader.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace deptrace_graph;

TEST_CASE("DOT export", "[graph][dot]") {
    auto graph = GraphLoader::parse("A: B testlib\nB: A\ntestlib: C\nX: A\n");

    SECTION("reachable nodes and edges") {
        auto dot = to_dot(graph, "A");
        REQUIRE(dot.is_ok());
        REQUIRE(dot->find("digraph dependencies {") == 0);
        REQUIRE(dot->find("\"A\" [style=filled, fillcolor=lightblue];") != std::string::npos);
        REQUIRE(dot->find("\"A\" -> \"B\";") != std::string::npos);
        REQUIRE(dot->find("\"B\" -> \"A\";") != std::string::npos);
        REQUIRE(dot->find("\"testlib\" -> \"C\";") != std::string::npos);
        REQUIRE(dot->find("\"X\"") == std::string::npos);
    }

    SECTION("filter removes nodes and edges") {
        auto dot = to_dot(graph, "A", "test");
        REQUIRE(dot.is_ok());
        REQUIRE(dot->find("testlib") == std::string::npos);
        REQUIRE(dot->find("\"C\"") == std::string::npos);
    }

    SECTION("quotes special characters") {
        auto quoted = GraphLoader::parse("a: b\"c\n");
        auto dot = to_dot(quoted, "a");
        REQUIRE(dot.is_ok());
        REQUIRE(dot->find("\"b\\\"c\"") != std::string::npos);
    }

    SECTION("unknown root") {
        REQUIRE(to_dot(graph, "nope").is_err());
    }
}

TEST_CASE("DOT file writing", "[graph][dot]") {
    auto dir = std::filesystem::temp_directory_path() / "deptrace_dot_test";
    std::filesystem::create_directories(dir);

    SECTION("writes content") {
        auto path = dir / "graph.dot";
        REQUIRE(write_dot_file(path, "digraph {}\n").is_ok());

        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        REQUIRE(buffer.str() == "digraph {}\n");
    }

    SECTION("unwritable path") {
        auto result = write_dot_file(dir / "missing" / "graph.dot", "digraph {}\n");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == deptrace_core::ErrorCode::IOError);
    }

    std::filesystem::remove_all(dir);
}
