#include <beacon/retrieval/service_metrics.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace beacon::retrieval {

LatencySummary LatencySummary::compute(std::vector<double> samples) {
    LatencySummary s;
    if (samples.empty()) {
        return s;
    }

    std::sort(samples.begin(), samples.end());
    s.sampleCount = samples.size();
    s.maxMs = samples.back();
    s.meanMs = std::accumulate(samples.begin(), samples.end(), 0.0) /
               static_cast<double>(samples.size());

    auto percentile = [&samples](double p) -> double {
        double idx = p * static_cast<double>(samples.size() - 1);
        size_t lower = static_cast<size_t>(std::floor(idx));
        size_t upper = static_cast<size_t>(std::ceil(idx));
        if (lower == upper || upper >= samples.size()) {
            return samples[std::min(lower, samples.size() - 1)];
        }
        double frac = idx - static_cast<double>(lower);
        return samples[lower] * (1.0 - frac) + samples[upper] * frac;
    };

    s.p50Ms = percentile(0.50);
    s.p95Ms = percentile(0.95);
    s.p99Ms = percentile(0.99);
    return s;
}

double ServiceMetrics::Snapshot::adapterFailureRatePercent() const {
    if (adapterCalls == 0) {
        return 0.0;
    }
    return static_cast<double>(adapterFailures + adapterTimeouts) /
           static_cast<double>(adapterCalls) * 100.0;
}

nlohmann::json ServiceMetrics::Snapshot::toJson() const {
    return nlohmann::json{{"searches_performed", searchesPerformed},
                          {"cache_hits", cacheHits},
                          {"adapter_calls", adapterCalls},
                          {"adapter_failures", adapterFailures},
                          {"adapter_timeouts", adapterTimeouts},
                          {"cache_failures", cacheFailures},
                          {"validation_errors", validationErrors},
                          {"results_returned", resultsReturned},
                          {"avg_latency_ms", avgLatencyMs},
                          {"avg_relevance_score", avgRelevanceScore},
                          {"adapter_failure_rate_percent", adapterFailureRatePercent()},
                          {"latency", latency.toJson()}};
}

ServiceMetrics::ServiceMetrics(size_t windowSize) : windowSize_(std::max<size_t>(windowSize, 1)) {}

void ServiceMetrics::recordSearch(double latencyMs, size_t resultCount, double avgRelevance,
                                  bool cacheHit) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.searchesPerformed++;
    if (cacheHit) {
        counters_.cacheHits++;
    }
    counters_.resultsReturned += resultCount;
    totalLatencyMs_ += latencyMs;
    totalRelevance_ += avgRelevance;

    window_.push_back(latencyMs);
    while (window_.size() > windowSize_) {
        window_.pop_front();
    }
}

void ServiceMetrics::recordAdapterCalls(uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.adapterCalls += count;
}

void ServiceMetrics::recordAdapterFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.adapterFailures++;
}

void ServiceMetrics::recordAdapterTimeout() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.adapterTimeouts++;
}

void ServiceMetrics::recordCacheFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.cacheFailures++;
}

void ServiceMetrics::recordValidationError() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.validationErrors++;
}

ServiceMetrics::Snapshot ServiceMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot snap = counters_;
    if (snap.searchesPerformed > 0) {
        const auto n = static_cast<double>(snap.searchesPerformed);
        snap.avgLatencyMs = totalLatencyMs_ / n;
        snap.avgRelevanceScore = totalRelevance_ / n;
    }
    snap.latency = LatencySummary::compute(std::vector<double>(window_.begin(), window_.end()));
    return snap;
}

void ServiceMetrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = Snapshot{};
    totalLatencyMs_ = 0.0;
    totalRelevance_ = 0.0;
    window_.clear();
}

} // namespace beacon::retrieval
