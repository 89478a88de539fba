#pragma once

#include <beacon/core/types.h>
#include <beacon/retrieval/cache_key.h>
#include <beacon/retrieval/cache_stats.h>
#include <beacon/retrieval/evidence.h>

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief Configuration for the semantic response cache
 */
struct SemanticCacheConfig {
    std::chrono::seconds defaultTTL{3600}; ///< Entry lifetime unless overridden per set()
    size_t maxEntries = 1000;              ///< 0 disables the cap
    size_t perEntryBytes = 1000;           ///< Fixed size used for the memory estimate
    bool partitionedInvalidation = false;  ///< invalidate(type) only drops entries built from type
};

/**
 * @brief Response metadata stored next to the cached evidence
 */
struct CacheMetadata {
    std::map<std::string, int64_t> sourceLatencies;
    std::string cacheKey;
    float avgRelevanceScore = 0.0f;
    std::map<std::string, size_t> sourceDistribution;
    size_t totalFound = 0;
    std::set<std::string> sourceTypes; ///< Source types of the adapters that produced the entry
};

/**
 * @brief TTL cache of retrieval responses keyed by normalized request
 *
 * Entries are spread over kShardCount shards selected by key hash, each with
 * its own lock, so concurrent lookups for different requests do not contend.
 * Counters are relaxed atomics aggregated on getStats(). Expired entries are
 * removed lazily when read and in bulk by cleanupExpired(). When maxEntries is
 * reached, the entry closest to expiry across all shards makes room for the
 * new one.
 */
class SemanticCache {
public:
    static constexpr size_t kShardCount = 16;

    struct CacheEntry {
        CacheKey key;
        std::vector<Evidence> evidence;
        CacheMetadata metadata;
        TimePoint createdAt;
        TimePoint expiresAt;
    };

    struct Hit {
        std::vector<Evidence> evidence;
        CacheMetadata metadata;
    };

    explicit SemanticCache(const SemanticCacheConfig& config = {});
    virtual ~SemanticCache() = default;

    SemanticCache(const SemanticCache&) = delete;
    SemanticCache& operator=(const SemanticCache&) = delete;

    /**
     * @brief Look up a key; an entry past its expiry counts as a miss and is removed
     */
    virtual std::optional<Hit> get(const CacheKey& key);

    /**
     * @brief Store or replace an entry
     *
     * @param ttl Overrides the configured default TTL
     */
    virtual void set(const CacheKey& key, std::vector<Evidence> evidence, CacheMetadata metadata,
                     std::optional<std::chrono::seconds> ttl = std::nullopt);

    /**
     * @brief Drop entries
     *
     * Without a source type every entry is removed. With one, every entry is
     * removed unless partitioned invalidation is enabled, in which case only
     * entries whose producing sources include that type go.
     *
     * @return Number of entries removed
     */
    size_t invalidate(const std::optional<std::string>& sourceType = std::nullopt);

    /// Sweep all expired entries; returns how many were removed.
    size_t cleanupExpired();

    CacheStats getStats() const;
    size_t size() const;
    bool contains(const CacheKey& key) const;

    const SemanticCacheConfig& config() const { return config_; }

    void setClock(Clock clock);

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> entries;
    };

    Shard& shardFor(const CacheKey& key) { return shards_[key.hash() % kShardCount]; }
    const Shard& shardFor(const CacheKey& key) const { return shards_[key.hash() % kShardCount]; }

    TimePoint now() const;
    bool evictOne();

    SemanticCacheConfig config_;

    mutable std::mutex clockMutex_;
    Clock clock_;

    std::array<Shard, kShardCount> shards_;
    std::atomic<size_t> entryCount_{0};

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> insertions_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> invalidations_{0};
    std::atomic<uint64_t> ttlExpirations_{0};
};

} // namespace beacon::retrieval
