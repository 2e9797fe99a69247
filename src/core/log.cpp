/// @file log.cpp
/// @brief Logging system implementation for deptrace_core
///
/// Extends the spdlog-based logging with:
/// - Multiple named loggers for different subsystems
/// - Log level configuration
/// - Structured logging support

#include <deptrace/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <sstream>
#include <vector>
#include <filesystem>

namespace deptrace_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::warn;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration
std::vector<spdlog::sink_ptr> create_sinks(const std::string& name) {
    auto& reg = get_registry();
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    // File sink
    if (reg.file_enabled && !reg.log_directory.empty()) {
        try {
            std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            // Keep console-only logging; report once through the console sinks
            if (!sinks.empty()) {
                spdlog::logger fallback(name, sinks.begin(), sinks.end());
                fallback.warn("File logging disabled: {}", e.what());
            }
        }
    }

    return sinks;
}

/// Create a logger without touching the registry lock
std::shared_ptr<spdlog::logger> make_logger(const std::string& name) {
    auto& reg = get_registry();
    auto sinks = create_sinks(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);
    return logger;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

/// Configure logging system
void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Rebuild existing loggers so new sinks take effect
    for (auto& [name, logger] : reg.loggers) {
        auto sinks = create_sinks(name);
        logger->sinks() = sinks;
        logger->set_level(reg.global_level);
    }

    // Default logger backs the DEPTRACE_LOG_* macros
    auto default_logger = make_logger("deptrace");
    spdlog::set_default_logger(default_logger);
    spdlog::set_level(reg.global_level);
}

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // Check if logger already exists
    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto logger = make_logger(name);
    reg.loggers[name] = logger;
    spdlog::register_logger(logger);

    return logger;
}

/// Get the graph traversal logger
std::shared_ptr<spdlog::logger> graph_logger() {
    return get_logger("graph");
}

/// Get the manifest/registry logger
std::shared_ptr<spdlog::logger> source_logger() {
    return get_logger("source");
}

/// Get the command-line logger
std::shared_ptr<spdlog::logger> cli_logger() {
    return get_logger("cli");
}

// =============================================================================
// Log Level Management
// =============================================================================

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

// =============================================================================
// Structured Logging Support
// =============================================================================

/// Log entry with structured data
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);

    // Build structured message
    std::ostringstream oss;
    oss << message;

    if (!fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) oss << ", ";
            oss << key << "=\"" << value << "\"";
            first = false;
        }
        oss << "}";
    }

    logger->log(level, oss.str());
}

// =============================================================================
// Logging Shutdown
// =============================================================================

/// Flush all loggers
void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    if (auto default_logger = spdlog::default_logger()) {
        default_logger->flush();
    }
}

/// Shutdown logging system
void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    // Drop all loggers
    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();

    spdlog::shutdown();
}

} // namespace deptrace_core
