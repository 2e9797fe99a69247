#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for deptrace_source module

namespace deptrace_source {

// =============================================================================
// Manifest Types
// =============================================================================

struct Manifest;
class ManifestReader;

// =============================================================================
// Registry Types
// =============================================================================

class Registry;
class IndexRegistry;
class RegistryCache;

// =============================================================================
// Crawler Types
// =============================================================================

struct CrawlOptions;
struct CrawlStats;
class GraphCrawler;

} // namespace deptrace_source
