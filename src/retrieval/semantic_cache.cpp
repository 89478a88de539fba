#include <beacon/profiling.h>
#include <beacon/retrieval/semantic_cache.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace beacon::retrieval {

SemanticCache::SemanticCache(const SemanticCacheConfig& config)
    : config_(config), clock_([] { return std::chrono::system_clock::now(); }) {}

void SemanticCache::setClock(Clock clock) {
    std::lock_guard<std::mutex> lock(clockMutex_);
    if (clock) {
        clock_ = std::move(clock);
    }
}

TimePoint SemanticCache::now() const {
    std::lock_guard<std::mutex> lock(clockMutex_);
    return clock_();
}

std::optional<SemanticCache::Hit> SemanticCache::get(const CacheKey& key) {
    BEACON_CACHE_ZONE("get");
    const auto current = now();
    auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    if (current >= it->second.expiresAt) {
        shard.entries.erase(it);
        entryCount_.fetch_sub(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        ttlExpirations_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Cache entry {} expired", key.digest());
        return std::nullopt;
    }

    hits_.fetch_add(1, std::memory_order_relaxed);
    return Hit{it->second.evidence, it->second.metadata};
}

void SemanticCache::set(const CacheKey& key, std::vector<Evidence> evidence,
                        CacheMetadata metadata, std::optional<std::chrono::seconds> ttl) {
    BEACON_CACHE_ZONE("set");
    const auto created = now();
    CacheEntry entry{key, std::move(evidence), std::move(metadata), created,
                     created + ttl.value_or(config_.defaultTTL)};
    auto& shard = shardFor(key);

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            it->second = std::move(entry);
            insertions_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }

    // Eviction scans every shard, so it runs without holding this shard's lock.
    if (config_.maxEntries > 0) {
        while (entryCount_.load(std::memory_order_relaxed) >= config_.maxEntries) {
            if (!evictOne()) {
                break;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (shard.entries.insert_or_assign(key, std::move(entry)).second) {
            entryCount_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    insertions_.fetch_add(1, std::memory_order_relaxed);
}

size_t SemanticCache::invalidate(const std::optional<std::string>& sourceType) {
    BEACON_CACHE_ZONE("invalidate");
    const bool partitioned = sourceType && config_.partitionedInvalidation;

    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (!partitioned) {
            removed += shard.entries.size();
            shard.entries.clear();
            continue;
        }
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (it->second.metadata.sourceTypes.count(*sourceType) > 0) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    entryCount_.fetch_sub(removed, std::memory_order_relaxed);
    invalidations_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

size_t SemanticCache::cleanupExpired() {
    BEACON_CACHE_ZONE("cleanup");
    const auto current = now();

    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (current >= it->second.expiresAt) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        entryCount_.fetch_sub(removed, std::memory_order_relaxed);
        ttlExpirations_.fetch_add(removed, std::memory_order_relaxed);
        spdlog::debug("Cleaned up {} expired cache entries", removed);
    }
    return removed;
}

CacheStats SemanticCache::getStats() const {
    CacheStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.insertions = insertions_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.invalidations = invalidations_.load(std::memory_order_relaxed);
    stats.ttlExpirations = ttlExpirations_.load(std::memory_order_relaxed);
    stats.entries = size();
    stats.memoryUsage = stats.entries * config_.perEntryBytes;
    stats.maxEntries = config_.maxEntries;
    return stats;
}

size_t SemanticCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

bool SemanticCache::contains(const CacheKey& key) const {
    const auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.entries.find(key) != shard.entries.end();
}

bool SemanticCache::evictOne() {
    Shard* victimShard = nullptr;
    std::optional<CacheKey> victimKey;
    TimePoint victimExpiry = TimePoint::max();

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [key, entry] : shard.entries) {
            if (!victimKey || entry.expiresAt < victimExpiry) {
                victimShard = &shard;
                victimKey = key;
                victimExpiry = entry.expiresAt;
            }
        }
    }
    if (!victimKey) {
        return false;
    }

    std::lock_guard<std::mutex> lock(victimShard->mutex);
    auto it = victimShard->entries.find(*victimKey);
    if (it != victimShard->entries.end()) {
        spdlog::debug("Cache full ({} entries), evicting {}",
                      entryCount_.load(std::memory_order_relaxed), victimKey->digest());
        victimShard->entries.erase(it);
        entryCount_.fetch_sub(1, std::memory_order_relaxed);
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }
    return true;
}

} // namespace beacon::retrieval
