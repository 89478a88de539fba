#pragma once

#include <beacon/core/types.h>
#include <beacon/retrieval/service_metrics.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace beacon::config {

/**
 * @brief Settings for the retrieval orchestrator and its cache
 *
 * Read from the [retrieval] section of config.toml. Every key can be
 * overridden by an environment variable named BEACON_<KEY> (upper-cased), e.g.
 * BEACON_CACHE_TTL_SECONDS=60.
 */
struct RetrievalConfig {
    // Cache
    bool cacheEnabled = true;                       // cache_enabled
    std::chrono::seconds cacheTtl{3600};            // cache_ttl_seconds
    size_t cacheMaxEntries = 1000;                  // cache_max_entries
    size_t cacheEntryBytes = 1000;                  // cache_entry_bytes
    bool partitionedInvalidation = false;           // partitioned_invalidation
    std::chrono::seconds cacheSweepInterval{0};     // cache_sweep_interval_seconds (0 = off)

    // Fan-out
    std::chrono::milliseconds adapterTimeout{5000}; // adapter_timeout_ms
    size_t workerThreads = 4;                       // worker_threads

    // Ranking
    bool clampScores = false;                       // clamp_scores

    // Health
    retrieval::SloConfig slo;                       // slo_* keys
    size_t latencyWindow = 1024;                    // latency_window

    std::string logLevel = "info";                  // log_level

    // Optional data files
    std::string documentIndexPath;                  // document_index
    std::string patternTablePath;                   // pattern_table
    std::string playbookTablePath;                  // playbook_table
};

/**
 * @brief Apply key/value pairs on top of a config
 *
 * Unknown keys are ignored. Values that fail to parse are logged at warn
 * level and leave the previous value in place.
 */
void applyConfigValues(RetrievalConfig& cfg, const std::map<std::string, std::string>& values);

/// Collect BEACON_<KEY> environment overrides for all known keys.
std::map<std::string, std::string> environmentOverrides();

/**
 * @brief Load defaults, then the config file section, then environment overrides
 *
 * @param configPath Explicit file; when empty the standard location is used and
 *        a missing file is not an error
 * @return FileNotFound when an explicitly requested file does not exist
 */
Result<RetrievalConfig> loadRetrievalConfig(const std::filesystem::path& configPath = {});

} // namespace beacon::config
