// Tests for federated search: validation, fan-out isolation, caching and health.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <future>
#include <thread>

#include <beacon/retrieval/document_adapter.h>
#include <beacon/retrieval/pattern_adapter.h>
#include <beacon/retrieval/playbook_adapter.h>
#include <beacon/retrieval/retrieval_orchestrator.h>

#include "../../common/test_helpers_catch2.h"

using namespace beacon::retrieval;
using beacon::ErrorCode;
using beacon::config::RetrievalConfig;
using beacon::test::FakeAdapter;
using beacon::test::make_evidence;
using beacon::test::ManualClock;
using Catch::Approx;

namespace {

constexpr std::chrono::milliseconds kTimeout{2000};

RetrievalConfig testConfig() {
    RetrievalConfig cfg;
    cfg.workerThreads = 4;
    cfg.adapterTimeout = kTimeout;
    return cfg;
}

void registerBuiltins(RetrievalOrchestrator& orchestrator) {
    REQUIRE(orchestrator.registerAdapter(
        std::make_shared<DocumentAdapter>(nullptr, nullptr, kTimeout)));
    REQUIRE(orchestrator.registerAdapter(std::make_shared<PatternAdapter>(kTimeout)));
    REQUIRE(orchestrator.registerAdapter(std::make_shared<PlaybookAdapter>(kTimeout)));
}

RetrievalRequest request(std::string query) {
    RetrievalRequest r;
    r.query = std::move(query);
    return r;
}

class ThrowingCache final : public SemanticCache {
public:
    std::optional<Hit> get(const CacheKey&) override { throw std::runtime_error("cache down"); }
    void set(const CacheKey&, std::vector<Evidence>, CacheMetadata,
             std::optional<std::chrono::seconds>) override {
        throw std::runtime_error("cache down");
    }
};

class SleepyAdapter final : public KnowledgeAdapter {
public:
    explicit SleepyAdapter(std::chrono::milliseconds nap)
        : KnowledgeAdapter("sleepy", SourceType::Document, kTimeout), nap_(nap) {}

protected:
    beacon::Result<std::vector<Evidence>> doSearch(const std::string&,
                                                   const std::vector<std::string>&, int,
                                                   const SearchFilters&) override {
        std::this_thread::sleep_for(nap_);
        return std::vector<Evidence>{};
    }

private:
    std::chrono::milliseconds nap_;
};

class ConstantSanitizer final : public ISanitizer {
public:
    explicit ConstantSanitizer(std::string out) : out_(std::move(out)) {}
    std::string sanitize(std::string_view) const override { return out_; }

private:
    std::string out_;
};

} // namespace

TEST_CASE("Orchestrator rejects invalid requests", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);

    auto expectInvalid = [&](const RetrievalRequest& r) {
        auto result = orchestrator.search(r);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::ValidationError);
    };

    expectInvalid(request(""));
    expectInvalid(request("   \t"));

    auto r = request("disk full");
    r.maxResults = 0;
    expectInvalid(r);
    r.maxResults = 101;
    expectInvalid(r);

    r = request("disk full");
    r.semanticSimilarityThreshold = -0.1f;
    expectInvalid(r);
    r.semanticSimilarityThreshold = 1.5f;
    expectInvalid(r);

    r = request("disk full");
    r.enabledSources = {"pattern", "wiki"};
    auto unknown = orchestrator.search(r);
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().message.find("wiki") != std::string::npos);

    CHECK(orchestrator.metrics().validationErrors == 7);
    CHECK(orchestrator.metrics().searchesPerformed == 0);
}

TEST_CASE("Orchestrator rejects queries that sanitize to nothing",
          "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig(), std::make_shared<ConstantSanitizer>(""));
    registerBuiltins(orchestrator);

    auto result = orchestrator.search(request("password=hunter2"));
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::ValidationError);
}

TEST_CASE("Orchestrator registry keeps registration order", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    CHECK_FALSE(orchestrator.readyCheck());

    registerBuiltins(orchestrator);
    CHECK(orchestrator.readyCheck());
    CHECK(orchestrator.adapterNames() == std::vector<std::string>{"document", "pattern", "playbook"});

    auto dup = orchestrator.registerAdapter(std::make_shared<PatternAdapter>(kTimeout));
    REQUIRE_FALSE(dup);
    CHECK(dup.error().code == ErrorCode::AlreadyExists);

    CHECK(orchestrator.unregisterAdapter("pattern"));
    CHECK(orchestrator.unregisterAdapter("pattern").error().code == ErrorCode::NotFound);
    CHECK(orchestrator.adapterNames() == std::vector<std::string>{"document", "playbook"});

    CHECK(orchestrator.setAdapterTimeout("document", std::chrono::milliseconds(100)));
    CHECK(orchestrator.setAdapterTimeout("nope", std::chrono::milliseconds(100)).error().code ==
          ErrorCode::NotFound);
    CHECK(orchestrator.reconfigureAdapters(std::chrono::milliseconds(300)));
    CHECK_FALSE(orchestrator.reconfigureAdapters(std::chrono::milliseconds(0)));

    auto stats = orchestrator.getAdapterStatistics();
    CHECK(stats["total_adapters"].get<size_t>() == 2);
    CHECK(stats["adapters"].contains("document"));
}

TEST_CASE("Pattern match outranks generic documents", "[retrieval][orchestrator][catch2]") {
    ManualClock clock;
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);
    orchestrator.setClock(clock.fn());

    auto r = request("connection refused");
    r.enabledSources = {"pattern", "document"};
    r.maxResults = 5;

    auto result = orchestrator.search(r);
    REQUIRE(result);
    const auto& response = result.value();

    REQUIRE_FALSE(response.evidence.empty());
    CHECK(response.evidence[0].sourceType == SourceType::Pattern);
    CHECK(response.evidence[0].source == "pattern#pattern-2");
    CHECK(response.evidence[0].score == Approx((0.3 * 0.92 * 0.92 + 0.1) * 1.2));
    CHECK(response.sourceDistribution.at("pattern") == 1);
    CHECK(response.sourceDistribution.at("document") == 3);
    CHECK(response.totalFound == 4);
    CHECK_FALSE(response.cacheHit);
    REQUIRE(response.cacheKey.has_value());
    CHECK(response.cacheKey->size() == 16);
    CHECK(response.sourceLatencies.count("pattern") == 1);
    CHECK(response.sourceLatencies.count("document") == 1);
    CHECK(response.sourceLatencies.count("playbook") == 0);

    for (size_t i = 0; i < response.evidence.size(); ++i) {
        CHECK(response.evidence[i].rank == static_cast<int>(i + 1));
        if (i > 0) {
            CHECK(response.evidence[i - 1].score >= response.evidence[i].score);
        }
    }
}

TEST_CASE("Caller source weights shift the ranking", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);

    auto r = request("connection refused");
    r.enabledSources = {"pattern", "document"};
    r.sourceWeights = {{"document", 10.0f}};

    auto result = orchestrator.search(r);
    REQUIRE(result);
    CHECK(result.value().evidence[0].sourceType == SourceType::Document);
}

TEST_CASE("Threshold and truncation keep ranks contiguous", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);

    auto r = request("connection refused");
    r.enabledSources = {"pattern", "document"};
    r.maxResults = 2;
    auto truncated = orchestrator.search(r);
    REQUIRE(truncated);
    REQUIRE(truncated.value().evidence.size() == 2);
    CHECK(truncated.value().totalFound == 4);
    CHECK(truncated.value().evidence[1].rank == 2);

    r.maxResults = 8;
    r.semanticSimilarityThreshold = 0.4f;
    auto filtered = orchestrator.search(r);
    REQUIRE(filtered);
    REQUIRE(filtered.value().evidence.size() == 1);
    CHECK(filtered.value().evidence[0].rank == 1);
}

TEST_CASE("Repeated requests are served from the cache", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);

    auto first = orchestrator.search(request("Slow Response"));
    REQUIRE(first);
    CHECK_FALSE(first.value().cacheHit);

    auto second = orchestrator.search(request("  slow response "));
    REQUIRE(second);
    CHECK(second.value().cacheHit);
    CHECK(second.value().cacheKey == first.value().cacheKey);
    CHECK(second.value().evidence == first.value().evidence);
    CHECK(second.value().totalFound == first.value().totalFound);

    auto stats = orchestrator.getCacheStats();
    CHECK(stats["cache_enabled"].get<bool>());
    CHECK(stats["cache_stats"]["hits"].get<uint64_t>() == 1);
    CHECK(stats["service_metrics"]["cache_hits"].get<uint64_t>() == 1);
}

TEST_CASE("Requests after the TTL are recomputed", "[retrieval][orchestrator][catch2]") {
    auto cfg = testConfig();
    cfg.cacheTtl = std::chrono::seconds(60);
    RetrievalOrchestrator orchestrator(cfg);
    ManualClock clock;
    orchestrator.setClock(clock.fn());

    auto docs = std::make_shared<FakeAdapter>(
        "docs", SourceType::Document,
        std::vector<Evidence>{make_evidence("docs#1", SourceType::Document, 0.7f)});
    REQUIRE(orchestrator.registerAdapter(docs));

    auto first = orchestrator.search(request("disk full"));
    REQUIRE(first);
    CHECK_FALSE(first.value().cacheHit);

    auto cached = orchestrator.search(request("disk full"));
    REQUIRE(cached);
    CHECK(cached.value().cacheHit);
    CHECK(docs->calls() == 1);

    clock.advance(std::chrono::seconds(61));
    auto expired = orchestrator.search(request("disk full"));
    REQUIRE(expired);
    CHECK_FALSE(expired.value().cacheHit);
    CHECK(docs->calls() == 2);
    REQUIRE(expired.value().evidence.size() == 1);
    CHECK(expired.value().evidence[0].source == "docs#1");

    auto stats = orchestrator.getCacheStats();
    CHECK(stats["cache_stats"]["expirations"].get<uint64_t>() == 1);
    CHECK(stats["cache_stats"]["entries"].get<size_t>() == 1);
}

TEST_CASE("Invalidation without a source type clears every entry",
          "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);

    REQUIRE(orchestrator.search(request("connection refused")));
    REQUIRE(orchestrator.search(request("out of memory")));
    CHECK(orchestrator.getCacheStats()["cache_stats"]["entries"].get<size_t>() == 2);

    CHECK(orchestrator.invalidateCache());

    auto again = orchestrator.search(request("connection refused"));
    REQUIRE(again);
    CHECK_FALSE(again.value().cacheHit);
    CHECK(orchestrator.getCacheStats()["cache_stats"]["entries"].get<size_t>() == 1);
}

TEST_CASE("Partitioned invalidation only drops matching entries",
          "[retrieval][orchestrator][catch2]") {
    auto cfg = testConfig();
    cfg.partitionedInvalidation = true;
    RetrievalOrchestrator orchestrator(cfg);
    registerBuiltins(orchestrator);

    auto patternOnly = request("connection refused");
    patternOnly.enabledSources = {"pattern"};
    auto playbookOnly = request("network timeout");
    playbookOnly.enabledSources = {"playbook"};
    REQUIRE(orchestrator.search(patternOnly));
    REQUIRE(orchestrator.search(playbookOnly));

    CHECK(orchestrator.invalidateCache(std::string("pattern")));

    auto pb = orchestrator.search(playbookOnly);
    REQUIRE(pb);
    CHECK(pb.value().cacheHit);
    auto pat = orchestrator.search(patternOnly);
    REQUIRE(pat);
    CHECK_FALSE(pat.value().cacheHit);
}

TEST_CASE("Disabled cache never reports hits", "[retrieval][orchestrator][catch2]") {
    auto cfg = testConfig();
    cfg.cacheEnabled = false;
    RetrievalOrchestrator orchestrator(cfg);
    registerBuiltins(orchestrator);
    CHECK_FALSE(orchestrator.cacheEnabled());

    REQUIRE(orchestrator.search(request("slow response")));
    auto again = orchestrator.search(request("slow response"));
    REQUIRE(again);
    CHECK_FALSE(again.value().cacheHit);
    CHECK_FALSE(again.value().cacheKey.has_value());
    CHECK(orchestrator.invalidateCache());
    CHECK(orchestrator.cleanupCache() == 0);

    auto stats = orchestrator.getCacheStats();
    CHECK_FALSE(stats["cache_enabled"].get<bool>());
    CHECK(stats["cache_stats"].is_null());
}

TEST_CASE("Cache faults fail open", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig(), std::make_unique<ThrowingCache>());
    registerBuiltins(orchestrator);

    auto result = orchestrator.search(request("connection refused"));
    REQUIRE(result);
    CHECK_FALSE(result.value().cacheHit);
    CHECK_FALSE(result.value().evidence.empty());
    CHECK(orchestrator.metrics().cacheFailures == 2);
}

TEST_CASE("A slow adapter cannot hold up the others", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());

    auto stuck = std::make_shared<FakeAdapter>(
        "stuck", SourceType::Document,
        std::vector<Evidence>{make_evidence("stuck#1", SourceType::Document, 0.99f)},
        std::chrono::milliseconds(100));
    auto patterns = std::make_shared<FakeAdapter>(
        "patterns", SourceType::Pattern,
        std::vector<Evidence>{make_evidence("patterns#1", SourceType::Pattern, 0.5f)});
    auto playbooks = std::make_shared<FakeAdapter>(
        "playbooks", SourceType::Playbook,
        std::vector<Evidence>{make_evidence("playbooks#1", SourceType::Playbook, 0.4f)});
    stuck->block();
    REQUIRE(orchestrator.registerAdapter(stuck));
    REQUIRE(orchestrator.registerAdapter(patterns));
    REQUIRE(orchestrator.registerAdapter(playbooks));

    const auto start = std::chrono::steady_clock::now();
    auto result = orchestrator.search(request("anything"));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stuck->release();

    REQUIRE(result);
    const auto& response = result.value();
    CHECK(response.totalFound == 2);
    REQUIRE(response.evidence.size() == 2);
    CHECK(response.evidence[0].source == "patterns#1");
    CHECK(response.evidence[1].source == "playbooks#1");
    CHECK(response.sourceLatencies.at("stuck") == 100);
    CHECK(elapsed < std::chrono::milliseconds(1500));

    auto metrics = orchestrator.metrics();
    CHECK(metrics.adapterTimeouts == 1);
    CHECK(metrics.adapterCalls == 3);
}

TEST_CASE("A hung adapter does not starve the worker pool", "[retrieval][orchestrator][catch2]") {
    auto cfg = testConfig();
    cfg.cacheSweepInterval = std::chrono::seconds(1);
    RetrievalOrchestrator orchestrator(cfg);

    auto stuck = std::make_shared<FakeAdapter>(
        "stuck", SourceType::Document,
        std::vector<Evidence>{make_evidence("stuck#1", SourceType::Document, 0.99f)},
        std::chrono::milliseconds(100));
    auto patterns = std::make_shared<FakeAdapter>(
        "patterns", SourceType::Pattern,
        std::vector<Evidence>{make_evidence("patterns#1", SourceType::Pattern, 0.5f)});
    auto playbooks = std::make_shared<FakeAdapter>(
        "playbooks", SourceType::Playbook,
        std::vector<Evidence>{make_evidence("playbooks#1", SourceType::Playbook, 0.4f)});
    stuck->block();
    REQUIRE(orchestrator.registerAdapter(stuck));
    REQUIRE(orchestrator.registerAdapter(patterns));
    REQUIRE(orchestrator.registerAdapter(playbooks));

    // More distinct searches than there are workers.
    constexpr int kSearches = 8;
    for (int i = 0; i < kSearches; ++i) {
        auto result = orchestrator.search(request("incident " + std::to_string(i)));
        REQUIRE(result);
        CHECK_FALSE(result.value().cacheHit);
        CHECK(result.value().totalFound == 2);
        CHECK(result.value().evidence.size() == 2);
    }

    CHECK(stuck->calls() == 1);
    CHECK(patterns->calls() == kSearches);
    CHECK(orchestrator.metrics().adapterTimeouts == kSearches);

    auto health = orchestrator.healthCheck();
    CHECK(health["adapters"]["stuck"]["status"] == "degraded");
    CHECK(health["adapters"]["stuck"]["metrics"]["timeout_count"].get<uint64_t>() == kSearches);
    CHECK(health["adapters"]["patterns"]["status"] == "healthy");

    stuck->release();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (stuck->hasStuckCalls() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE_FALSE(stuck->hasStuckCalls());
    // The late return is not counted a second time.
    CHECK(stuck->getMetrics().timeoutCount == kSearches);

    auto recovered = orchestrator.search(request("incident after release"));
    REQUIRE(recovered);
    CHECK(recovered.value().totalFound == 3);
    CHECK(stuck->calls() == 2);
}

TEST_CASE("A failing adapter contributes nothing", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    auto broken = std::make_shared<FakeAdapter>(
        "broken", SourceType::Document,
        std::vector<Evidence>{make_evidence("broken#1", SourceType::Document, 0.9f)});
    broken->setThrowing(true);
    REQUIRE(orchestrator.registerAdapter(broken));
    REQUIRE(orchestrator.registerAdapter(std::make_shared<PatternAdapter>(kTimeout)));

    auto result = orchestrator.search(request("connection refused"));
    REQUIRE(result);
    REQUIRE(result.value().evidence.size() == 1);
    CHECK(result.value().evidence[0].sourceType == SourceType::Pattern);
    CHECK(orchestrator.metrics().adapterFailures == 1);
    CHECK(broken->getMetrics().errorCount == 1);
}

TEST_CASE("Merge order follows registration, not completion",
          "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    auto first = std::make_shared<FakeAdapter>(
        "first", SourceType::Document,
        std::vector<Evidence>{make_evidence("first#1", SourceType::Document, 0.5f)});
    auto second = std::make_shared<FakeAdapter>(
        "second", SourceType::Document,
        std::vector<Evidence>{make_evidence("second#1", SourceType::Document, 0.5f)});
    REQUIRE(orchestrator.registerAdapter(first));
    REQUIRE(orchestrator.registerAdapter(second));

    first->block();
    auto pending = std::async(std::launch::async, [&] {
        auto r = request("tie");
        r.includeRecencyBias = false;
        return orchestrator.search(r);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    first->release();

    auto result = pending.get();
    REQUIRE(result);
    REQUIRE(result.value().evidence.size() == 2);
    CHECK(result.value().evidence[0].source == "first#1");
    CHECK(result.value().evidence[1].source == "second#1");
}

TEST_CASE("searchPatterns only queries the pattern adapter", "[retrieval][orchestrator][catch2]") {
    RetrievalOrchestrator orchestrator(testConfig());
    registerBuiltins(orchestrator);

    auto empty = orchestrator.searchPatterns({}, {});
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == ErrorCode::ValidationError);

    auto result = orchestrator.searchPatterns({"slow response", "timeout"},
                                              {{"service", "checkout saw high latency"}});
    REQUIRE(result);
    REQUIRE(result.value().evidence.size() == 1);
    CHECK(result.value().evidence[0].source == "pattern#pattern-1");
    CHECK(result.value().sourceLatencies.size() == 1);
}

TEST_CASE("Health reflects adapters and SLOs", "[retrieval][orchestrator][catch2]") {
    SECTION("no adapters is unhealthy") {
        RetrievalOrchestrator orchestrator(testConfig());
        auto health = orchestrator.healthCheck();
        CHECK(health["status"] == "unhealthy");
        CHECK(health["service"] == "beacon_retrieval");
        CHECK(health["version"] == "1.0.0");
    }

    SECTION("fresh orchestrator is healthy") {
        RetrievalOrchestrator orchestrator(testConfig());
        registerBuiltins(orchestrator);
        REQUIRE(orchestrator.search(request("slow response")));
        auto health = orchestrator.healthCheck();
        CHECK(health["status"] == "healthy");
        CHECK(health["errors"].empty());
        CHECK(health["metrics"]["total_searches"].get<uint64_t>() == 1);
        CHECK(health["adapters"]["pattern"]["status"] == "healthy");
        CHECK(health["cache_enabled"].get<bool>());
    }

    SECTION("adapter failures degrade") {
        RetrievalOrchestrator orchestrator(testConfig());
        auto broken = std::make_shared<FakeAdapter>("broken", SourceType::Document,
                                                    std::vector<Evidence>{});
        broken->setFailing(true);
        REQUIRE(orchestrator.registerAdapter(broken));
        REQUIRE(orchestrator.search(request("anything")));

        auto health = orchestrator.healthCheck();
        CHECK(health["status"] == "degraded");
        CHECK(health["metrics"]["adapter_failure_rate"].get<double>() == Approx(100.0));
        CHECK(health["adapters"]["broken"]["status"] == "degraded");
    }

    SECTION("low cache hit rate degrades once enough lookups happened") {
        auto cfg = testConfig();
        cfg.slo.minCacheSamples = 2;
        RetrievalOrchestrator orchestrator(cfg);
        registerBuiltins(orchestrator);
        REQUIRE(orchestrator.search(request("slow response")));
        CHECK(orchestrator.healthCheck()["status"] == "healthy");
        REQUIRE(orchestrator.search(request("out of memory")));
        CHECK(orchestrator.healthCheck()["status"] == "degraded");
    }

    SECTION("slow searches degrade") {
        auto cfg = testConfig();
        cfg.slo.p95LatencyMs = 5.0;
        RetrievalOrchestrator orchestrator(cfg);
        REQUIRE(orchestrator.registerAdapter(
            std::make_shared<SleepyAdapter>(std::chrono::milliseconds(30))));
        REQUIRE(orchestrator.search(request("anything")));
        CHECK(orchestrator.healthCheck()["status"] == "degraded");
    }
}

TEST_CASE("Background sweeper removes expired entries", "[retrieval][orchestrator][catch2]") {
    ManualClock clock;
    auto cfg = testConfig();
    cfg.cacheTtl = std::chrono::seconds(60);
    cfg.cacheSweepInterval = std::chrono::seconds(1);
    RetrievalOrchestrator orchestrator(cfg);
    registerBuiltins(orchestrator);
    orchestrator.setClock(clock.fn());

    REQUIRE(orchestrator.search(request("slow response")));
    CHECK(orchestrator.getCacheStats()["cache_stats"]["entries"].get<size_t>() == 1);

    clock.advance(std::chrono::seconds(120));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    size_t entries = 1;
    while (entries > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        entries = orchestrator.getCacheStats()["cache_stats"]["entries"].get<size_t>();
    }
    CHECK(entries == 0);
    CHECK(orchestrator.getCacheStats()["cache_stats"]["expirations"].get<uint64_t>() == 1);
}

TEST_CASE("createDefault wires the built-in adapters", "[retrieval][orchestrator][catch2]") {
    auto dir = beacon::test::make_temp_dir();
    auto indexPath = beacon::test::write_file(dir / "docs.json", R"([
        {"id": "pg-failover", "title": "Postgres failover", "content": "Promote the replica.",
         "document_type": "runbook"}
    ])");

    auto cfg = testConfig();
    cfg.documentIndexPath = indexPath.string();
    auto created = RetrievalOrchestrator::createDefault(cfg);
    REQUIRE(created);
    auto orchestrator = std::move(created).value();
    CHECK(orchestrator->adapterNames() ==
          std::vector<std::string>{"document", "pattern", "playbook"});

    auto r = request("postgres failover");
    r.enabledSources = {"document"};
    auto result = orchestrator->search(r);
    REQUIRE(result);
    REQUIRE_FALSE(result.value().evidence.empty());
    CHECK(result.value().evidence[0].source == "document#pg-failover");

    cfg.documentIndexPath = (dir / "missing.json").string();
    auto missing = RetrievalOrchestrator::createDefault(cfg);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);

    std::filesystem::remove_all(dir);
}
