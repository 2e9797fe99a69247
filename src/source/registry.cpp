/// @file registry.cpp
/// @brief Registry implementations

#include <deptrace/source/registry.hpp>
#include <deptrace/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

namespace deptrace_source {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Name of the crate a dependency entry refers to (renamed deps carry "package")
std::optional<std::string> dependency_crate(const nlohmann::json& dep) {
    if (dep.contains("package") && dep["package"].is_string()) {
        return dep["package"].get<std::string>();
    }
    if (dep.contains("name") && dep["name"].is_string()) {
        return dep["name"].get<std::string>();
    }
    return std::nullopt;
}

/// Dev and build dependencies are not needed to load a package
bool is_normal_dependency(const nlohmann::json& dep) {
    if (!dep.contains("kind") || dep["kind"].is_null()) {
        return true;
    }
    return dep["kind"].is_string() && dep["kind"].get<std::string>() == "normal";
}

} // anonymous namespace

// =============================================================================
// IndexRegistry Implementation
// =============================================================================

FetchResult IndexRegistry::fetch_dependencies(const std::string& package) {
    if (package.empty()) {
        return deptrace_core::Err<DependencyList>(
            deptrace_core::SourceError::fetch_failed(package, "empty package name"));
    }

    auto path = m_root / index_path(package);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return deptrace_core::Err<DependencyList>(
            deptrace_core::SourceError::not_found(path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return deptrace_core::Err<DependencyList>(
            deptrace_core::SourceError::io_error(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_index_entry(buffer.str(), package);
}

std::filesystem::path IndexRegistry::index_path(const std::string& package) {
    std::string name = to_lower(package);

    switch (name.size()) {
        case 0:
            return {};
        case 1:
            return std::filesystem::path("1") / name;
        case 2:
            return std::filesystem::path("2") / name;
        case 3:
            return std::filesystem::path("3") / name.substr(0, 1) / name;
        default:
            return std::filesystem::path(name.substr(0, 2)) / name.substr(2, 2) / name;
    }
}

FetchResult IndexRegistry::parse_index_entry(
    const std::string& content,
    const std::string& package) {

    std::optional<nlohmann::json> latest;
    std::size_t skipped = 0;

    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        nlohmann::json entry;
        try {
            entry = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error&) {
            ++skipped;
            continue;
        }

        if (!entry.is_object()) {
            ++skipped;
            continue;
        }
        if (entry.contains("yanked") && entry["yanked"].is_boolean() && entry["yanked"].get<bool>()) {
            continue;
        }

        latest = std::move(entry);
    }

    if (skipped > 0) {
        deptrace_core::source_logger()->debug("Skipped {} malformed index lines for '{}'",
            skipped, package);
    }

    if (!latest) {
        return deptrace_core::Err<DependencyList>(
            deptrace_core::SourceError::parse_error(package, "no usable version entry"));
    }

    DependencyList deps;
    if (latest->contains("deps") && (*latest)["deps"].is_array()) {
        for (const auto& dep : (*latest)["deps"]) {
            if (!dep.is_object() || !is_normal_dependency(dep)) {
                continue;
            }
            if (auto crate = dependency_crate(dep)) {
                deps.push_back(std::move(*crate));
            }
        }
    }

    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());

    return deptrace_core::Ok(std::move(deps));
}

// =============================================================================
// RegistryCache Implementation
// =============================================================================

FetchResult RegistryCache::fetch_dependencies(const std::string& package) {
    auto it = m_entries.find(package);
    if (it != m_entries.end()) {
        ++m_hits;
        return it->second;
    }

    ++m_misses;
    auto result = m_upstream.fetch_dependencies(package);
    m_entries.emplace(package, result);
    return result;
}

void RegistryCache::clear() {
    m_entries.clear();
    m_hits = 0;
    m_misses = 0;
}

} // namespace deptrace_source
