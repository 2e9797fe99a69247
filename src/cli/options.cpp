/// @file options.cpp
/// @brief Command-line option parsing

#include <deptrace/cli/options.hpp>
#include <deptrace/core/log.hpp>

#include <charconv>
#include <sstream>
#include <string_view>

namespace deptrace_cli {

namespace {

constexpr std::string_view k_whitespace = " \t\r\n\v\f";

deptrace_core::Error invalid(const std::string& message) {
    return deptrace_core::Error(deptrace_core::ErrorCode::InvalidArgument, message);
}

} // anonymous namespace

std::string Options::graph_source() const {
    if (repo.empty() && test_mode) {
        return k_default_test_graph;
    }
    return repo;
}

deptrace_core::Result<std::size_t> parse_positive_int(const std::string& value) {
    // Surrounding whitespace and a leading '+' are accepted
    std::string_view digits = value;
    auto first = digits.find_first_not_of(k_whitespace);
    if (first != std::string_view::npos) {
        auto last = digits.find_last_not_of(k_whitespace);
        digits = digits.substr(first, last - first + 1);
    } else {
        digits = {};
    }
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    std::size_t parsed = 0;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);

    if (digits.empty() || ec != std::errc() || ptr != end || parsed == 0) {
        return deptrace_core::Err<std::size_t>(
            invalid(value + " is not a positive integer"));
    }
    return deptrace_core::Ok(parsed);
}

deptrace_core::Result<Options> parse_options(const std::vector<std::string>& args) {
    Options options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Options taking a value accept "--name value" and "--name=value"
        std::string name = arg;
        std::string inline_value;
        bool has_inline_value = false;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
                has_inline_value = true;
            }
        }

        auto take_value = [&](std::string& out) -> deptrace_core::Result<void> {
            if (has_inline_value) {
                out = inline_value;
                return deptrace_core::Ok();
            }
            if (i + 1 >= args.size()) {
                return deptrace_core::Err(invalid("Option " + name + " requires a value"));
            }
            out = args[++i];
            return deptrace_core::Ok();
        };

        std::string value;
        deptrace_core::Result<void> taken = deptrace_core::Ok();

        if (name == "--help" || name == "-h") {
            options.show_help = true;
        } else if (name == "--version" || name == "-v") {
            options.show_version = true;
        } else if (name == "--test-mode" || name == "-t") {
            options.test_mode = true;
        } else if (name == "--package" || name == "-p") {
            taken = take_value(options.package);
        } else if (name == "--repo" || name == "-r") {
            taken = take_value(options.repo);
        } else if (name == "--output" || name == "-o") {
            taken = take_value(options.output);
        } else if (name == "--filter" || name == "-f") {
            taken = take_value(options.filter);
        } else if (name == "--index" || name == "-i") {
            taken = take_value(options.index);
        } else if (name == "--log-dir") {
            taken = take_value(options.log_directory);
        } else if (name == "--max-depth" || name == "-d") {
            taken = take_value(value);
            if (taken) {
                auto depth = parse_positive_int(value);
                if (!depth) {
                    return deptrace_core::Err<Options>(
                        invalid("argument --max-depth: " + depth.error().message()));
                }
                options.max_depth = *depth;
            }
        } else if (name == "--log-level" || name == "-l") {
            taken = take_value(value);
            if (taken) {
                auto level = deptrace_core::parse_log_level(value);
                if (!level) {
                    return deptrace_core::Err<Options>(
                        invalid("argument --log-level: unknown level '" + value + "'"));
                }
                options.log_level = *level;
            }
        } else {
            return deptrace_core::Err<Options>(invalid("Unknown option: " + arg));
        }

        if (!taken) {
            return deptrace_core::Err<Options>(taken.error());
        }
    }

    // --help and --version short-circuit validation
    if (options.show_help || options.show_version) {
        return deptrace_core::Ok(std::move(options));
    }

    if (options.package.empty()) {
        return deptrace_core::Err<Options>(invalid("the following arguments are required: --package"));
    }
    if (!options.test_mode && options.repo.empty()) {
        return deptrace_core::Err<Options>(invalid("--repo is required when not using test mode"));
    }

    return deptrace_core::Ok(std::move(options));
}

std::vector<std::string> describe(const Options& options) {
    return {
        "Configured parameters:",
        "  Package: " + options.package,
        "  Repository: " + (options.repo.empty() ? std::string("None") : options.repo),
        "  Test mode: " + std::string(options.test_mode ? "True" : "False"),
        "  Output file: " + (options.output.empty() ? std::string("None") : options.output),
        "  Max depth: " + std::to_string(options.max_depth),
        "  Filter: " + options.filter,
    };
}

std::string usage_text(const std::string& program_name) {
    std::ostringstream oss;
    oss << "Usage: " << program_name << " --package NAME [OPTIONS]\n"
        << "\n"
        << "Options:\n"
        << "  --package, -p NAME     Root package to explore (required)\n"
        << "  --repo, -r PATH        Project directory or Cargo.toml; edge-list file in test mode\n"
        << "  --test-mode, -t        Read the graph from an edge-list file\n"
        << "                         (default " << k_default_test_graph << ")\n"
        << "  --index, -i DIR        Local sparse-index mirror for transitive dependencies\n"
        << "  --output, -o FILE      Write the reachable graph as GraphViz DOT source\n"
        << "  --max-depth, -d N      Tree depth, positive (default " << k_default_max_depth << ")\n"
        << "  --filter, -f TEXT      Hide packages whose name contains TEXT\n"
        << "  --log-level, -l LEVEL  trace, debug, info, warn, error, critical, off (default warn)\n"
        << "  --log-dir DIR          Also write rotating log files to DIR\n"
        << "  --help, -h             Show this help message\n"
        << "  --version, -v          Show version information\n"
        << "\n"
        << "Edge-list format (test mode), one package per line:\n"
        << "  name: dep1 dep2 dep3\n"
        << "\n"
        << "Examples:\n"
        << "  " << program_name << " -p A -t -r graph.txt -d 5\n"
        << "  " << program_name << " -p serde -r ./serde -i ./index -f test\n";
    return oss.str();
}

std::string version_text() {
    return "deptrace 0.1.0\n";
}

} // namespace deptrace_cli
