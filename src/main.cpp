/// @file main.cpp
/// @brief deptrace entry point - explores a package dependency graph
///
/// Prints a depth-bounded dependency tree and the load order of a package.
/// The graph comes either from an edge-list file (test mode) or from a
/// project manifest plus a local registry index mirror.

#include <deptrace/cli/app.hpp>
#include <deptrace/cli/options.hpp>
#include <deptrace/core/log.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    const std::string program_name = argc > 0 ? argv[0] : "deptrace";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto options = deptrace_cli::parse_options(args);
    if (!options) {
        std::cerr << "Error: " << options.error().message() << "\n\n";
        std::cerr << deptrace_cli::usage_text(program_name);
        return deptrace_cli::k_exit_failure;
    }

    if (options->show_help) {
        std::cout << deptrace_cli::usage_text(program_name);
        return deptrace_cli::k_exit_success;
    }
    if (options->show_version) {
        std::cout << deptrace_cli::version_text();
        return deptrace_cli::k_exit_success;
    }

    deptrace_core::LogConfig log_config;
    log_config.level = options->log_level;
    if (!options->log_directory.empty()) {
        log_config.file_enabled = true;
        log_config.log_directory = options->log_directory;
    }
    deptrace_core::configure_logging(log_config);

    int exit_code = deptrace_cli::k_exit_failure;
    try {
        exit_code = deptrace_cli::run(*options, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        DEPTRACE_LOG_DEBUG("Unhandled exception: {}", e.what());
    }

    deptrace_core::shutdown_logging();
    return exit_code;
}
