// Tests for the sharded TTL response cache.

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

#include <beacon/retrieval/semantic_cache.h>

#include "../../common/test_helpers_catch2.h"

using namespace beacon::retrieval;
using beacon::test::make_evidence;
using beacon::test::ManualClock;

namespace {

CacheKey keyFor(const std::string& query) {
    RetrievalRequest r;
    r.query = query;
    return CacheKey::fromRequest(query, r, {"document", "pattern", "playbook"});
}

CacheMetadata metadataFor(std::set<std::string> types) {
    CacheMetadata m;
    m.totalFound = 1;
    m.sourceTypes = std::move(types);
    return m;
}

std::vector<Evidence> oneResult() {
    return {make_evidence("pattern#p1", SourceType::Pattern, 0.5f)};
}

} // namespace

TEST_CASE("SemanticCache counts hits and misses", "[retrieval][cache][catch2]") {
    SemanticCache cache;
    auto key = keyFor("slow response");

    CHECK_FALSE(cache.get(key).has_value());
    cache.set(key, oneResult(), metadataFor({"pattern"}));

    auto hit = cache.get(key);
    REQUIRE(hit.has_value());
    REQUIRE(hit->evidence.size() == 1);
    CHECK(hit->evidence[0].source == "pattern#p1");
    CHECK(hit->metadata.totalFound == 1);

    auto stats = cache.getStats();
    CHECK(stats.hits == 1);
    CHECK(stats.misses == 1);
    CHECK(stats.insertions == 1);
    CHECK(stats.entries == 1);
    CHECK(stats.memoryUsage == 1000);
    CHECK(stats.hitRate() == 0.5);
    CHECK(stats.toJson()["hit_rate_percent"].get<double>() == 50.0);
}

TEST_CASE("SemanticCache expires entries at their TTL", "[retrieval][cache][catch2]") {
    ManualClock clock;
    SemanticCacheConfig cfg;
    cfg.defaultTTL = std::chrono::seconds(60);
    SemanticCache cache(cfg);
    cache.setClock(clock.fn());

    auto key = keyFor("timeout");
    cache.set(key, oneResult(), metadataFor({"pattern"}));

    clock.advance(std::chrono::seconds(59));
    CHECK(cache.get(key).has_value());

    clock.advance(std::chrono::seconds(1));
    CHECK_FALSE(cache.get(key).has_value());

    auto stats = cache.getStats();
    CHECK(stats.ttlExpirations == 1);
    CHECK(stats.entries == 0);
    CHECK(stats.misses == 1);
}

TEST_CASE("SemanticCache honors a per-entry TTL override", "[retrieval][cache][catch2]") {
    ManualClock clock;
    SemanticCache cache;
    cache.setClock(clock.fn());

    auto key = keyFor("override");
    cache.set(key, oneResult(), metadataFor({"pattern"}), std::chrono::seconds(5));
    clock.advance(std::chrono::seconds(5));
    CHECK_FALSE(cache.get(key).has_value());
}

TEST_CASE("SemanticCache cleanupExpired sweeps only expired entries",
          "[retrieval][cache][catch2]") {
    ManualClock clock;
    SemanticCache cache;
    cache.setClock(clock.fn());

    cache.set(keyFor("a"), oneResult(), metadataFor({"pattern"}), std::chrono::seconds(10));
    cache.set(keyFor("b"), oneResult(), metadataFor({"pattern"}), std::chrono::seconds(10));
    cache.set(keyFor("c"), oneResult(), metadataFor({"pattern"}), std::chrono::seconds(100));

    clock.advance(std::chrono::seconds(20));
    CHECK(cache.cleanupExpired() == 2);
    CHECK(cache.size() == 1);
    CHECK(cache.contains(keyFor("c")));
    CHECK(cache.getStats().ttlExpirations == 2);
    CHECK(cache.cleanupExpired() == 0);
}

TEST_CASE("SemanticCache invalidate clears everything by default", "[retrieval][cache][catch2]") {
    SemanticCache cache;
    cache.set(keyFor("a"), oneResult(), metadataFor({"pattern"}));
    cache.set(keyFor("b"), oneResult(), metadataFor({"document"}));

    SECTION("without a source type") {
        CHECK(cache.invalidate() == 2);
    }
    SECTION("with a source type but partitioning disabled") {
        CHECK(cache.invalidate(std::string("pattern")) == 2);
    }
    CHECK(cache.size() == 0);
    CHECK(cache.getStats().invalidations == 2);
}

TEST_CASE("SemanticCache partitioned invalidation keeps unrelated entries",
          "[retrieval][cache][catch2]") {
    SemanticCacheConfig cfg;
    cfg.partitionedInvalidation = true;
    SemanticCache cache(cfg);

    cache.set(keyFor("a"), oneResult(), metadataFor({"pattern"}));
    cache.set(keyFor("b"), oneResult(), metadataFor({"document"}));
    cache.set(keyFor("c"), oneResult(), metadataFor({"document", "pattern"}));

    CHECK(cache.invalidate(std::string("pattern")) == 2);
    CHECK(cache.size() == 1);
    CHECK(cache.contains(keyFor("b")));

    CHECK(cache.invalidate() == 1);
    CHECK(cache.size() == 0);
}

TEST_CASE("SemanticCache evicts the entry closest to expiry when full",
          "[retrieval][cache][catch2]") {
    ManualClock clock;
    SemanticCacheConfig cfg;
    cfg.maxEntries = 2;
    SemanticCache cache(cfg);
    cache.setClock(clock.fn());

    cache.set(keyFor("long"), oneResult(), metadataFor({"pattern"}), std::chrono::seconds(300));
    cache.set(keyFor("short"), oneResult(), metadataFor({"pattern"}), std::chrono::seconds(30));
    cache.set(keyFor("new"), oneResult(), metadataFor({"pattern"}));

    CHECK(cache.size() == 2);
    CHECK(cache.contains(keyFor("long")));
    CHECK(cache.contains(keyFor("new")));
    CHECK_FALSE(cache.contains(keyFor("short")));
    CHECK(cache.getStats().evictions == 1);

    // Replacing an existing key never evicts.
    cache.set(keyFor("new"), oneResult(), metadataFor({"pattern"}));
    CHECK(cache.getStats().evictions == 1);
    CHECK(cache.size() == 2);
}

TEST_CASE("SemanticCache tolerates concurrent readers and writers",
          "[retrieval][cache][catch2]") {
    SemanticCache cache;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 50; ++i) {
                auto key = keyFor("q" + std::to_string(t) + "-" + std::to_string(i));
                cache.set(key, oneResult(), metadataFor({"pattern"}));
                (void)cache.get(key);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    auto stats = cache.getStats();
    CHECK(stats.entries == 200);
    CHECK(stats.hits == 200);
    CHECK(stats.insertions == 200);
}
