// Tests for orchestrator metrics and latency summaries.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <beacon/retrieval/service_metrics.h>

using namespace beacon::retrieval;
using Catch::Approx;

TEST_CASE("LatencySummary interpolates percentiles", "[retrieval][metrics][catch2]") {
    std::vector<double> samples;
    for (int i = 1; i <= 100; ++i) {
        samples.push_back(static_cast<double>(i));
    }
    auto s = LatencySummary::compute(samples);
    CHECK(s.sampleCount == 100);
    CHECK(s.meanMs == Approx(50.5));
    CHECK(s.p50Ms == Approx(50.5));
    CHECK(s.p95Ms == Approx(95.05));
    CHECK(s.maxMs == Approx(100.0));

    auto empty = LatencySummary::compute({});
    CHECK(empty.sampleCount == 0);
    CHECK(empty.p95Ms == 0.0);
}

TEST_CASE("ServiceMetrics aggregates searches and adapter calls",
          "[retrieval][metrics][catch2]") {
    ServiceMetrics metrics(4);
    metrics.recordSearch(10.0, 3, 0.6, false);
    metrics.recordSearch(30.0, 1, 0.2, true);
    metrics.recordAdapterCalls(10);
    metrics.recordAdapterFailure();
    metrics.recordAdapterTimeout();
    metrics.recordCacheFailure();
    metrics.recordValidationError();

    auto snap = metrics.snapshot();
    CHECK(snap.searchesPerformed == 2);
    CHECK(snap.cacheHits == 1);
    CHECK(snap.resultsReturned == 4);
    CHECK(snap.avgLatencyMs == Approx(20.0));
    CHECK(snap.avgRelevanceScore == Approx(0.4));
    CHECK(snap.adapterFailureRatePercent() == Approx(20.0));
    CHECK(snap.cacheFailures == 1);
    CHECK(snap.validationErrors == 1);

    auto j = snap.toJson();
    CHECK(j["adapter_timeouts"].get<uint64_t>() == 1);
    CHECK(j["latency"]["sample_count"].get<size_t>() == 2);

    metrics.reset();
    CHECK(metrics.snapshot().searchesPerformed == 0);
}

TEST_CASE("ServiceMetrics keeps a bounded latency window", "[retrieval][metrics][catch2]") {
    ServiceMetrics metrics(3);
    for (double l : {1000.0, 1.0, 2.0, 3.0}) {
        metrics.recordSearch(l, 0, 0.0, false);
    }
    auto snap = metrics.snapshot();
    CHECK(snap.latency.sampleCount == 3);
    CHECK(snap.latency.maxMs == Approx(3.0));
    CHECK(snap.searchesPerformed == 4);
}
