#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

namespace beacon::retrieval {

/**
 * @brief Latency distribution over a sample set
 */
struct LatencySummary {
    double meanMs = 0.0;
    double p50Ms = 0.0;
    double p95Ms = 0.0;
    double p99Ms = 0.0;
    double maxMs = 0.0;
    size_t sampleCount = 0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"mean_ms", meanMs}, {"p50_ms", p50Ms},
                              {"p95_ms", p95Ms},   {"p99_ms", p99Ms},
                              {"max_ms", maxMs},   {"sample_count", sampleCount}};
    }

    static LatencySummary compute(std::vector<double> samples);
};

/**
 * @brief Service level objectives used to derive health status
 */
struct SloConfig {
    double p95LatencyMs = 200.0;
    double maxAdapterFailureRatePercent = 10.0;
    double minCacheHitRatePercent = 30.0;
    uint64_t minCacheSamples = 20; ///< Lookups required before the hit-rate SLO applies
};

/**
 * @brief Orchestrator-level counters plus a bounded window of recent latencies
 */
class ServiceMetrics {
public:
    struct Snapshot {
        uint64_t searchesPerformed = 0;
        uint64_t cacheHits = 0;
        uint64_t adapterCalls = 0;
        uint64_t adapterFailures = 0;
        uint64_t adapterTimeouts = 0;
        uint64_t cacheFailures = 0;
        uint64_t validationErrors = 0;
        uint64_t resultsReturned = 0;
        double avgLatencyMs = 0.0;
        double avgRelevanceScore = 0.0;
        LatencySummary latency;

        /// Failed or timed-out adapter calls as a percentage of all adapter calls.
        double adapterFailureRatePercent() const;

        [[nodiscard]] nlohmann::json toJson() const;
    };

    explicit ServiceMetrics(size_t windowSize = 1024);

    void recordSearch(double latencyMs, size_t resultCount, double avgRelevance, bool cacheHit);
    void recordAdapterCalls(uint64_t count);
    void recordAdapterFailure();
    void recordAdapterTimeout();
    void recordCacheFailure();
    void recordValidationError();

    Snapshot snapshot() const;
    void reset();

private:
    const size_t windowSize_;
    mutable std::mutex mutex_;
    Snapshot counters_;
    double totalLatencyMs_ = 0.0;
    double totalRelevance_ = 0.0;
    std::deque<double> window_;
};

} // namespace beacon::retrieval
