#pragma once

/// @file manifest.hpp
/// @brief Cargo-style manifest (Cargo.toml) dependency extraction

#include "fwd.hpp"
#include <deptrace/core/error.hpp>

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace deptrace_source {

/// Manifest tables whose keys name dependencies, as dotted paths
inline constexpr std::array<const char*, 5> k_dependency_tables = {
    "dependencies",
    "dev-dependencies",
    "build-dependencies",
    "workspace.dependencies",
    "workspace.dev-dependencies",
};

/// Default manifest file name inside a project directory
inline constexpr const char* k_manifest_file_name = "Cargo.toml";

// =============================================================================
// Manifest
// =============================================================================

/// Dependency-relevant content of a manifest
struct Manifest {
    std::string package_name;               ///< [package].name, empty for virtual workspaces
    std::vector<std::string> dependencies;  ///< Union of all dependency tables, sorted
    std::filesystem::path source_path;      ///< Where the manifest was read from
};

// =============================================================================
// ManifestReader
// =============================================================================

/// Reads dependency names from TOML manifests; version requirements are ignored
class ManifestReader {
public:
    /// Parse manifest text
    ///
    /// @param content TOML text
    /// @param source_name Used in error messages
    /// @return Manifest, or SourceError::ParseError for invalid TOML
    [[nodiscard]] static deptrace_core::Result<Manifest> parse_string(
        const std::string& content,
        const std::string& source_name = "manifest");

    /// Read a manifest file
    ///
    /// A directory resolves to the Cargo.toml inside it.
    [[nodiscard]] static deptrace_core::Result<Manifest> load(const std::filesystem::path& path);

    /// Resolve a project directory or manifest path to the manifest file
    [[nodiscard]] static std::filesystem::path resolve_manifest_path(const std::filesystem::path& path);
};

} // namespace deptrace_source
