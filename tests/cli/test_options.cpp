// deptrace_cli option parsing tests

#include <catch2/catch_test_macros.hpp>
#include <deptrace/cli/options.hpp>

using namespace deptrace_cli;
using Args = std::vector<std::string>;

TEST_CASE("Option parsing", "[cli][options]") {
    SECTION("defaults") {
        auto result = parse_options({"--package", "serde", "--repo", "./serde"});
        REQUIRE(result.is_ok());
        REQUIRE(result->package == "serde");
        REQUIRE(result->repo == "./serde");
        REQUIRE_FALSE(result->test_mode);
        REQUIRE(result->max_depth == 3);
        REQUIRE(result->filter.empty());
        REQUIRE(result->output.empty());
        REQUIRE(result->log_level == spdlog::level::warn);
    }

    SECTION("short flags") {
        auto result = parse_options({"-p", "A", "-t", "-r", "g.txt", "-d", "5", "-f", "test",
                                     "-o", "out.dot", "-i", "idx", "-l", "debug"});
        REQUIRE(result.is_ok());
        REQUIRE(result->package == "A");
        REQUIRE(result->test_mode);
        REQUIRE(result->repo == "g.txt");
        REQUIRE(result->max_depth == 5);
        REQUIRE(result->filter == "test");
        REQUIRE(result->output == "out.dot");
        REQUIRE(result->index == "idx");
        REQUIRE(result->log_level == spdlog::level::debug);
    }

    SECTION("inline values") {
        auto result = parse_options({"--package=A", "--test-mode", "--max-depth=2", "--filter="});
        REQUIRE(result.is_ok());
        REQUIRE(result->package == "A");
        REQUIRE(result->max_depth == 2);
        REQUIRE(result->filter.empty());
    }

    SECTION("test mode without repo uses the default graph file") {
        auto result = parse_options({"-p", "A", "-t"});
        REQUIRE(result.is_ok());
        REQUIRE(result->graph_source() == k_default_test_graph);
    }

    SECTION("help skips validation") {
        auto result = parse_options({"--help"});
        REQUIRE(result.is_ok());
        REQUIRE(result->show_help);
    }
}

TEST_CASE("Option validation", "[cli][options]") {
    SECTION("package is required") {
        auto result = parse_options({"-t"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("--package") != std::string::npos);
    }

    SECTION("repo is required outside test mode") {
        auto result = parse_options({"-p", "A"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("--repo") != std::string::npos);
    }

    SECTION("max depth must be positive") {
        for (const char* bad : {"0", "-1", "abc", "3x", ""}) {
            auto result = parse_options({"-p", "A", "-t", "-d", bad});
            REQUIRE(result.is_err());
            REQUIRE(result.error().code() == deptrace_core::ErrorCode::InvalidArgument);
        }
    }

    SECTION("missing value") {
        REQUIRE(parse_options({"-p", "A", "-t", "--filter"}).is_err());
    }

    SECTION("unknown option") {
        auto result = parse_options({"-p", "A", "-t", "--frobnicate"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("--frobnicate") != std::string::npos);
    }

    SECTION("unknown log level") {
        REQUIRE(parse_options({"-p", "A", "-t", "-l", "loud"}).is_err());
    }
}

TEST_CASE("Positive integer parsing", "[cli][options]") {
    REQUIRE(*parse_positive_int("1") == 1);
    REQUIRE(*parse_positive_int("42") == 42);
    REQUIRE(parse_positive_int("0").is_err());

    SECTION("sign and surrounding whitespace like an integer literal") {
        REQUIRE(*parse_positive_int("+3") == 3);
        REQUIRE(*parse_positive_int(" 3") == 3);
        REQUIRE(*parse_positive_int("\t7 \n") == 7);
    }

    SECTION("still rejected") {
        for (const char* bad : {"+", "++3", "+0", "-3", "3 3", " ", "1.5"}) {
            REQUIRE(parse_positive_int(bad).is_err());
        }
    }

    SECTION("through --max-depth") {
        auto result = parse_options({"-p", "A", "-t", "--max-depth=+4"});
        REQUIRE(result.is_ok());
        REQUIRE(result->max_depth == 4);
    }
}

TEST_CASE("Configured parameters", "[cli][options]") {
    Options options;
    options.package = "A";
    options.test_mode = true;
    options.max_depth = 4;
    options.filter = "dev";

    auto lines = describe(options);
    REQUIRE(lines.front() == "Configured parameters:");
    REQUIRE(lines == Args{
        "Configured parameters:",
        "  Package: A",
        "  Repository: None",
        "  Test mode: True",
        "  Output file: None",
        "  Max depth: 4",
        "  Filter: dev",
    });
}

TEST_CASE("Usage text", "[cli][options]") {
    auto usage = usage_text("deptrace");
    REQUIRE(usage.find("Usage: deptrace") == 0);
    REQUIRE(usage.find("--max-depth") != std::string::npos);
    REQUIRE(version_text().find("deptrace") == 0);
}
