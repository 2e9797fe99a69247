/// @file manifest.cpp
/// @brief Manifest (Cargo.toml) dependency extraction implementation

#include <deptrace/source/manifest.hpp>
#include <deptrace/core/log.hpp>

#include <toml++/toml.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string_view>

namespace deptrace_source {

namespace {

/// Walk a dotted table path such as "workspace.dependencies"
const toml::table* find_table(const toml::table& root, std::string_view dotted) {
    const toml::table* current = &root;

    while (current) {
        auto dot = dotted.find('.');
        const toml::node* node = current->get(dotted.substr(0, dot));
        if (!node) {
            return nullptr;
        }
        current = node->as_table();
        if (dot == std::string_view::npos) {
            break;
        }
        dotted.remove_prefix(dot + 1);
    }

    return current;
}

} // anonymous namespace

// =============================================================================
// ManifestReader Implementation
// =============================================================================

deptrace_core::Result<Manifest> ManifestReader::parse_string(
    const std::string& content,
    const std::string& source_name) {

    Manifest manifest;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto name = tbl["package"]["name"].value<std::string>()) {
            manifest.package_name = *name;
        }

        for (const char* section : k_dependency_tables) {
            const toml::table* deps = find_table(tbl, section);
            if (!deps) {
                continue;
            }
            for (const auto& [key, value] : *deps) {
                manifest.dependencies.emplace_back(key.str());
            }
        }

    } catch (const toml::parse_error& err) {
        return deptrace_core::Err<Manifest>(
            deptrace_core::SourceError::parse_error(source_name, err.what()));
    }

    std::sort(manifest.dependencies.begin(), manifest.dependencies.end());
    manifest.dependencies.erase(
        std::unique(manifest.dependencies.begin(), manifest.dependencies.end()),
        manifest.dependencies.end());

    return deptrace_core::Ok(std::move(manifest));
}

deptrace_core::Result<Manifest> ManifestReader::load(const std::filesystem::path& path) {
    auto manifest_path = resolve_manifest_path(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(manifest_path, ec)) {
        return deptrace_core::Err<Manifest>(
            deptrace_core::SourceError::not_found(manifest_path.string()));
    }

    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        return deptrace_core::Err<Manifest>(
            deptrace_core::SourceError::io_error(manifest_path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_string(buffer.str(), manifest_path.string());
    if (!result) {
        return result;
    }

    result->source_path = manifest_path;

    deptrace_core::source_logger()->debug("Manifest {} lists {} dependencies",
        manifest_path.string(), result->dependencies.size());

    return result;
}

std::filesystem::path ManifestReader::resolve_manifest_path(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return path / k_manifest_file_name;
    }
    return path;
}

} // namespace deptrace_source
