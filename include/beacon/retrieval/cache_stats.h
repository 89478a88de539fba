#pragma once

#include <cstddef>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace beacon::retrieval {

/**
 * @brief Snapshot of semantic cache counters
 */
struct CacheStats {
    uint64_t hits = 0;           ///< Lookups served from the cache
    uint64_t misses = 0;         ///< Lookups that found nothing or an expired entry
    uint64_t insertions = 0;     ///< Entries written
    uint64_t evictions = 0;      ///< Entries dropped to respect maxEntries
    uint64_t invalidations = 0;  ///< Entries removed by invalidate()
    uint64_t ttlExpirations = 0; ///< Entries removed because their TTL elapsed
    size_t entries = 0;          ///< Live entries
    size_t memoryUsage = 0;      ///< Estimate: entries * per-entry size
    size_t maxEntries = 0;

    uint64_t totalRequests() const { return hits + misses; }

    /**
     * @brief Hit rate in [0, 1]
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

    nlohmann::json toJson() const {
        return nlohmann::json{{"hit_rate_percent", hitRate() * 100.0},
                              {"hits", hits},
                              {"misses", misses},
                              {"entries", entries},
                              {"memory_usage_bytes", memoryUsage},
                              {"invalidations", invalidations},
                              {"evictions", evictions},
                              {"expirations", ttlExpirations},
                              {"insertions", insertions},
                              {"max_entries", maxEntries},
                              {"total_requests", totalRequests()}};
    }
};

} // namespace beacon::retrieval
