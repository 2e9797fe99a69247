#pragma once

/// @file registry.hpp
/// @brief Package registry lookups
///
/// A Registry answers one question: which packages does a package directly
/// depend on. Lookups may fail; callers decide how to degrade.
///
/// IndexRegistry reads a local mirror of the crates.io sparse index:
/// - 1/<name>, 2/<name> for one and two character names
/// - 3/<c0>/<name> for three character names
/// - <c0c1>/<c2c3>/<name> otherwise
/// Each file holds one JSON object per published version.
///
/// RegistryCache memoizes another registry for the lifetime of one run.

#include "fwd.hpp"
#include <deptrace/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace deptrace_source {

using DependencyList = std::vector<std::string>;
using FetchResult = deptrace_core::Result<DependencyList>;

// =============================================================================
// Registry
// =============================================================================

/// Source of direct dependency lists
class Registry {
public:
    virtual ~Registry() = default;

    /// Direct normal dependencies of a package, sorted
    ///
    /// @return Dependency names, or SourceError when the package is unknown
    ///         or its data cannot be read
    [[nodiscard]] virtual FetchResult fetch_dependencies(const std::string& package) = 0;
};

// =============================================================================
// IndexRegistry
// =============================================================================

/// Registry backed by a sparse-index directory on disk
class IndexRegistry : public Registry {
public:
    explicit IndexRegistry(std::filesystem::path root) : m_root(std::move(root)) {}

    [[nodiscard]] FetchResult fetch_dependencies(const std::string& package) override;

    /// Relative index path of a package (lowercased)
    [[nodiscard]] static std::filesystem::path index_path(const std::string& package);

    /// Extract normal dependencies from index file content
    ///
    /// Uses the last non-yanked version entry. Lines that are not valid JSON
    /// objects are skipped.
    [[nodiscard]] static FetchResult parse_index_entry(
        const std::string& content,
        const std::string& package);

private:
    std::filesystem::path m_root;
};

// =============================================================================
// RegistryCache
// =============================================================================

/// Memoizing decorator over another registry
///
/// Both successes and failures are cached, so each package is fetched from
/// the upstream registry at most once. The upstream must outlive the cache.
class RegistryCache : public Registry {
public:
    explicit RegistryCache(Registry& upstream) : m_upstream(upstream) {}

    // Non-copyable
    RegistryCache(const RegistryCache&) = delete;
    RegistryCache& operator=(const RegistryCache&) = delete;

    [[nodiscard]] FetchResult fetch_dependencies(const std::string& package) override;

    [[nodiscard]] std::size_t hits() const noexcept { return m_hits; }
    [[nodiscard]] std::size_t misses() const noexcept { return m_misses; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    /// Drop all cached entries and reset counters
    void clear();

private:
    Registry& m_upstream;
    std::map<std::string, FetchResult> m_entries;
    std::size_t m_hits = 0;
    std::size_t m_misses = 0;
};

} // namespace deptrace_source
