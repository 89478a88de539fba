#include <beacon/common/utf8_utils.h>
#include <beacon/profiling.h>
#include <beacon/retrieval/document_adapter.h>
#include <beacon/retrieval/pattern_adapter.h>
#include <beacon/retrieval/playbook_adapter.h>
#include <beacon/retrieval/retrieval_orchestrator.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <numeric>
#include <set>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

namespace beacon::retrieval {

namespace {

constexpr size_t kLogQueryChars = 50;

std::string logQuery(std::string_view q) {
    return common::truncateUtf8(q, kLogQueryChars);
}

void spanAttr(const std::unique_ptr<ITraceSpan>& span, std::string_view key,
              std::string_view value) {
    if (span) {
        span->setAttribute(key, value);
    }
}

void spanError(const std::unique_ptr<ITraceSpan>& span, std::string_view message) {
    if (span) {
        span->setError(message);
    }
}

SemanticCacheConfig cacheConfigFrom(const config::RetrievalConfig& cfg) {
    SemanticCacheConfig c;
    c.defaultTTL = cfg.cacheTtl;
    c.maxEntries = cfg.cacheMaxEntries;
    c.perEntryBytes = cfg.cacheEntryBytes;
    c.partitionedInvalidation = cfg.partitionedInvalidation;
    return c;
}

} // namespace

RetrievalOrchestrator::RetrievalOrchestrator(const config::RetrievalConfig& config,
                                             std::unique_ptr<SemanticCache> cache,
                                             std::shared_ptr<ISanitizer> sanitizer,
                                             std::shared_ptr<ITracer> tracer)
    : config_(config), cache_(std::move(cache)),
      sanitizer_(sanitizer ? std::move(sanitizer) : std::make_shared<PassthroughSanitizer>()),
      tracer_(tracer ? std::move(tracer) : std::make_shared<NoopTracer>()),
      ranker_(RankingConfig{config.clampScores}), metrics_(config.latencyWindow),
      clock_([] { return std::chrono::system_clock::now(); }),
      pool_(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(config.workerThreads, 1))),
      sweepPool_(std::make_unique<boost::asio::thread_pool>(1)),
      strand_(boost::asio::make_strand(sweepPool_->get_executor())) {
    spdlog::info("Retrieval orchestrator initialized (cache={}, workers={}, adapter_timeout={}ms)",
                 cache_ ? "on" : "off", std::max<size_t>(config.workerThreads, 1),
                 config.adapterTimeout.count());
    if (cache_ && config_.cacheSweepInterval.count() > 0) {
        startSweeper();
    }
}

RetrievalOrchestrator::RetrievalOrchestrator(const config::RetrievalConfig& config,
                                             std::shared_ptr<ISanitizer> sanitizer,
                                             std::shared_ptr<ITracer> tracer)
    : RetrievalOrchestrator(config,
                            config.cacheEnabled
                                ? std::make_unique<SemanticCache>(cacheConfigFrom(config))
                                : nullptr,
                            std::move(sanitizer), std::move(tracer)) {}

RetrievalOrchestrator::~RetrievalOrchestrator() {
    stopSweeper();
    if (sweepPool_) {
        sweepPool_->stop();
        sweepPool_->join();
    }
    if (pool_) {
        pool_->stop();
        pool_->join();
    }
}

Result<std::unique_ptr<RetrievalOrchestrator>>
RetrievalOrchestrator::createDefault(const config::RetrievalConfig& config,
                                     std::shared_ptr<IVectorStore> vectorStore,
                                     std::shared_ptr<IDocumentIndex> documentIndex,
                                     std::shared_ptr<ISanitizer> sanitizer,
                                     std::shared_ptr<ITracer> tracer) {
    if (!documentIndex && !config.documentIndexPath.empty()) {
        auto loaded = InMemoryDocumentIndex::fromJsonFile(config.documentIndexPath);
        if (!loaded) {
            return loaded.error();
        }
        documentIndex = std::shared_ptr<IDocumentIndex>(std::move(loaded).value());
    }

    auto patterns = PatternAdapter::defaultTable();
    if (!config.patternTablePath.empty()) {
        auto loaded = PatternAdapter::loadTable(config.patternTablePath);
        if (!loaded) {
            return loaded.error();
        }
        patterns = std::move(loaded).value();
    }

    auto playbooks = PlaybookAdapter::defaultTable();
    if (!config.playbookTablePath.empty()) {
        auto loaded = PlaybookAdapter::loadTable(config.playbookTablePath);
        if (!loaded) {
            return loaded.error();
        }
        playbooks = std::move(loaded).value();
    }

    auto orchestrator = std::make_unique<RetrievalOrchestrator>(
        config, sanitizer ? std::move(sanitizer) : std::make_shared<RedactingSanitizer>(),
        tracer ? std::move(tracer) : std::make_shared<LoggingTracer>());

    const auto timeout = config.adapterTimeout;
    std::vector<std::shared_ptr<KnowledgeAdapter>> adapters = {
        std::make_shared<DocumentAdapter>(std::move(vectorStore), std::move(documentIndex),
                                          timeout),
        std::make_shared<PatternAdapter>(std::move(patterns), timeout),
        std::make_shared<PlaybookAdapter>(std::move(playbooks), timeout),
    };
    for (auto& adapter : adapters) {
        if (auto r = orchestrator->registerAdapter(std::move(adapter)); !r) {
            return r.error();
        }
    }
    return std::move(orchestrator);
}

// ===== Adapter registry =====

Result<void> RetrievalOrchestrator::registerAdapter(std::shared_ptr<KnowledgeAdapter> adapter) {
    if (!adapter) {
        return Error{ErrorCode::InvalidArgument, "Adapter is null"};
    }
    std::unique_lock lock(registryMutex_);
    auto dup = std::find_if(adapters_.begin(), adapters_.end(),
                            [&](const auto& a) { return a->name() == adapter->name(); });
    if (dup != adapters_.end()) {
        return Error{ErrorCode::AlreadyExists, "Adapter already registered: " + adapter->name()};
    }
    adapter->setClock(clock_);
    spdlog::info("Registered adapter '{}' ({}, timeout={}ms)", adapter->name(),
                 sourceTypeToString(adapter->sourceType()), adapter->timeout().count());
    adapters_.push_back(std::move(adapter));
    return {};
}

Result<void> RetrievalOrchestrator::unregisterAdapter(const std::string& name) {
    std::unique_lock lock(registryMutex_);
    auto it = std::find_if(adapters_.begin(), adapters_.end(),
                           [&](const auto& a) { return a->name() == name; });
    if (it == adapters_.end()) {
        return Error{ErrorCode::NotFound, "Unknown adapter: " + name};
    }
    adapters_.erase(it);
    spdlog::info("Unregistered adapter '{}'", name);
    return {};
}

Result<void> RetrievalOrchestrator::setAdapterTimeout(const std::string& name,
                                                      std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "Adapter timeout must be positive"};
    }
    std::shared_lock lock(registryMutex_);
    for (const auto& a : adapters_) {
        if (a->name() == name) {
            a->setTimeout(timeout);
            spdlog::info("Adapter '{}' timeout set to {}ms", name, timeout.count());
            return {};
        }
    }
    return Error{ErrorCode::NotFound, "Unknown adapter: " + name};
}

Result<void> RetrievalOrchestrator::reconfigureAdapters(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "Adapter timeout must be positive"};
    }
    std::unique_lock lock(registryMutex_);
    for (const auto& a : adapters_) {
        a->setTimeout(timeout);
    }
    spdlog::info("Reconfigured {} adapters: timeout={}ms", adapters_.size(), timeout.count());
    return {};
}

std::vector<std::string> RetrievalOrchestrator::adapterNames() const {
    std::shared_lock lock(registryMutex_);
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& a : adapters_) {
        names.push_back(a->name());
    }
    return names;
}

void RetrievalOrchestrator::setClock(Clock clock) {
    if (!clock) {
        return;
    }
    if (cache_) {
        cache_->setClock(clock);
    }
    std::unique_lock lock(registryMutex_);
    clock_ = clock;
    for (const auto& a : adapters_) {
        a->setClock(clock);
    }
}

TimePoint RetrievalOrchestrator::now() const {
    std::shared_lock lock(registryMutex_);
    return clock_();
}

// ===== Retrieval =====

Result<void> RetrievalOrchestrator::validate(const RetrievalRequest& request) const {
    auto blank = std::all_of(request.query.begin(), request.query.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (request.query.empty() || blank) {
        return Error{ErrorCode::ValidationError, "Query cannot be empty"};
    }
    if (request.maxResults <= 0) {
        return Error{ErrorCode::ValidationError, "max_results must be positive"};
    }
    if (request.maxResults > kMaxResultsLimit) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("max_results cannot exceed {}", kMaxResultsLimit)};
    }
    if (!(request.semanticSimilarityThreshold >= 0.0f &&
          request.semanticSimilarityThreshold <= 1.0f)) {
        return Error{ErrorCode::ValidationError,
                     "semantic_similarity_threshold must be between 0.0 and 1.0"};
    }

    std::shared_lock lock(registryMutex_);
    std::vector<std::string> unknown;
    for (const auto& source : request.enabledSources) {
        bool found = std::any_of(adapters_.begin(), adapters_.end(),
                                 [&](const auto& a) { return a->name() == source; });
        if (!found) {
            unknown.push_back(source);
        }
    }
    if (!unknown.empty()) {
        std::vector<std::string> valid;
        for (const auto& a : adapters_) {
            valid.push_back(a->name());
        }
        return Error{ErrorCode::ValidationError,
                     fmt::format("Invalid sources: {}. Valid: {}", fmt::join(unknown, ", "),
                                 fmt::join(valid, ", "))};
    }
    return {};
}

std::vector<std::shared_ptr<KnowledgeAdapter>>
RetrievalOrchestrator::resolveAdapters(const RetrievalRequest& request) const {
    std::shared_lock lock(registryMutex_);
    if (request.enabledSources.empty()) {
        return adapters_;
    }
    std::vector<std::shared_ptr<KnowledgeAdapter>> selected;
    for (const auto& a : adapters_) {
        if (request.enabledSources.count(a->name()) > 0) {
            selected.push_back(a);
        }
    }
    return selected;
}

std::vector<AdapterOutcome>
RetrievalOrchestrator::fanOut(const std::vector<std::shared_ptr<KnowledgeAdapter>>& adapters,
                              const std::string& query, const RetrievalRequest& request) {
    BEACON_ZONE_SCOPED_N("RetrievalOrchestrator::fanOut");
    BEACON_FANOUT_PLOT(adapters.size());
    auto span = tracer_->startSpan("retrieval.fanout");
    spanAttr(span, "adapters", std::to_string(adapters.size()));

    const auto start = std::chrono::steady_clock::now();
    std::vector<AdapterCall> calls;
    calls.reserve(adapters.size());

    for (const auto& adapter : adapters) {
        if (adapter->hasStuckCalls()) {
            adapter->recordSkipped();
            spdlog::warn("Adapter '{}' still has an abandoned search running, skipping it",
                         adapter->name());
            calls.push_back(AdapterCall{adapter, {}, nullptr});
            continue;
        }
        auto promise = std::make_shared<std::promise<AdapterOutcome>>();
        auto ticket = std::make_shared<KnowledgeAdapter::CallTicket>();
        calls.push_back(AdapterCall{adapter, promise->get_future(), ticket});
        // Everything is captured by value: the task may outlive this call when abandoned.
        boost::asio::post(*pool_, [adapter, promise, ticket, query, context = request.context,
                                   maxResults = request.maxResults, filters = request.filters]() {
            promise->set_value(
                adapter->execute(query, context, maxResults, filters, ticket.get()));
        });
    }
    metrics_.recordAdapterCalls(calls.size());

    std::vector<AdapterOutcome> outcomes;
    outcomes.reserve(calls.size());
    for (auto& call : calls) {
        const auto budget = call.adapter->timeout();
        const auto& name = call.adapter->name();
        AdapterOutcome outcome;

        if (!call.ticket) {
            outcome.status = AdapterOutcome::Status::Timeout;
        } else if (call.future.wait_until(start + budget) != std::future_status::ready &&
                   call.adapter->abandon(*call.ticket)) {
            outcome.status = AdapterOutcome::Status::Timeout;
            outcome.latencyMs = budget.count();
            spdlog::warn("Adapter '{}' missed its {}ms deadline for query: {}", name,
                         budget.count(), logQuery(query));
        } else {
            try {
                outcome = call.future.get();
            } catch (const std::exception& e) {
                outcome.status = AdapterOutcome::Status::Error;
                spdlog::error("Adapter '{}' failed: {}", name, e.what());
            }
        }

        switch (outcome.status) {
            case AdapterOutcome::Status::Ok:
                break;
            case AdapterOutcome::Status::Error:
                metrics_.recordAdapterFailure();
                break;
            case AdapterOutcome::Status::Timeout:
                metrics_.recordAdapterTimeout();
                break;
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

std::optional<SemanticCache::Hit> RetrievalOrchestrator::cacheLookup(const CacheKey& key) {
    try {
        return cache_->get(key);
    } catch (const std::exception& e) {
        metrics_.recordCacheFailure();
        spdlog::warn("Cache lookup failed, computing fresh: {}", e.what());
        return std::nullopt;
    }
}

void RetrievalOrchestrator::cacheStore(const CacheKey& key, const std::vector<Evidence>& evidence,
                                       CacheMetadata metadata) {
    try {
        cache_->set(key, evidence, std::move(metadata));
    } catch (const std::exception& e) {
        metrics_.recordCacheFailure();
        spdlog::warn("Cache store failed, result not cached: {}", e.what());
    }
}

Result<RetrievalResponse> RetrievalOrchestrator::search(const RetrievalRequest& request) {
    BEACON_ZONE_SCOPED_N("RetrievalOrchestrator::search");
    const auto start = std::chrono::steady_clock::now();
    auto span = tracer_->startSpan("retrieval.search");
    auto elapsedMs = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    if (auto v = validate(request); !v) {
        metrics_.recordValidationError();
        spanError(span, v.error().message);
        spdlog::debug("Rejected retrieval request: {}", v.error().message);
        return v.error();
    }

    try {
        const std::string query = sanitizer_->sanitize(request.query);
        if (std::all_of(query.begin(), query.end(),
                        [](unsigned char c) { return std::isspace(c); })) {
            metrics_.recordValidationError();
            spanError(span, "empty after sanitization");
            return Error{ErrorCode::ValidationError, "Query is empty after sanitization"};
        }
        spanAttr(span, "query", logQuery(query));

        const auto adapters = resolveAdapters(request);
        std::vector<std::string> sourceNames;
        std::set<std::string> sourceTypes;
        for (const auto& a : adapters) {
            sourceNames.push_back(a->name());
            sourceTypes.insert(sourceTypeToString(a->sourceType()));
        }

        std::optional<CacheKey> key;
        if (cache_) {
            try {
                key = CacheKey::fromRequest(query, request, sourceNames);
            } catch (const std::exception& e) {
                metrics_.recordCacheFailure();
                spdlog::warn("Cache key computation failed, bypassing cache: {}", e.what());
            }
        }

        if (key) {
            if (auto hit = cacheLookup(*key)) {
                RetrievalResponse response;
                response.evidence = std::move(hit->evidence);
                response.totalFound = hit->metadata.totalFound;
                response.sourceLatencies = hit->metadata.sourceLatencies;
                response.cacheHit = true;
                response.cacheKey = key->digest();
                response.avgRelevanceScore = hit->metadata.avgRelevanceScore;
                response.sourceDistribution = hit->metadata.sourceDistribution;
                response.elapsedMs = elapsedMs();
                metrics_.recordSearch(static_cast<double>(response.elapsedMs),
                                      response.evidence.size(), response.avgRelevanceScore, true);
                spanAttr(span, "cache_hit", "true");
                spdlog::debug("Cache hit {} for query: {}", key->digest(), logQuery(query));
                return response;
            }
        }

        auto outcomes = fanOut(adapters, query, request);

        std::vector<Evidence> merged;
        std::map<std::string, int64_t> sourceLatencies;
        std::map<std::string, float> adapterWeights;
        const QueryContext queryContext{query, request.context};
        for (size_t i = 0; i < adapters.size(); ++i) {
            const auto& name = adapters[i]->name();
            sourceLatencies[name] = outcomes[i].latencyMs;
            adapterWeights[name] = adapters[i]->scoreWeight(queryContext);
            for (auto& e : outcomes[i].evidence) {
                merged.push_back(std::move(e));
            }
        }
        const size_t totalFound = merged.size();

        {
            auto rankSpan = tracer_->startSpan("retrieval.rank");
            ranker_.applyWeights(merged, adapterWeights, request.sourceWeights);
            if (request.includeRecencyBias) {
                ranker_.applyRecencyBias(merged, now());
            }
            HybridRanker::filterByThreshold(merged, request.semanticSimilarityThreshold);
            if (merged.size() > static_cast<size_t>(request.maxResults)) {
                merged.resize(static_cast<size_t>(request.maxResults));
            }
            HybridRanker::assignRanks(merged);
        }

        RetrievalResponse response;
        response.totalFound = totalFound;
        response.sourceLatencies = std::move(sourceLatencies);
        if (!merged.empty()) {
            float sum = std::accumulate(merged.begin(), merged.end(), 0.0f,
                                        [](float acc, const Evidence& e) { return acc + e.score; });
            response.avgRelevanceScore = sum / static_cast<float>(merged.size());
        }
        for (const auto& e : merged) {
            response.sourceDistribution[sourceTypeToString(e.sourceType)]++;
        }
        response.evidence = std::move(merged);

        if (key) {
            CacheMetadata metadata;
            metadata.sourceLatencies = response.sourceLatencies;
            metadata.cacheKey = key->digest();
            metadata.avgRelevanceScore = response.avgRelevanceScore;
            metadata.sourceDistribution = response.sourceDistribution;
            metadata.totalFound = totalFound;
            metadata.sourceTypes = sourceTypes;
            cacheStore(*key, response.evidence, std::move(metadata));
            response.cacheKey = key->digest();
        }

        response.elapsedMs = elapsedMs();
        metrics_.recordSearch(static_cast<double>(response.elapsedMs), response.evidence.size(),
                              response.avgRelevanceScore, false);
        spanAttr(span, "results", std::to_string(response.evidence.size()));
        spdlog::debug("Retrieved {} of {} results from {} adapters in {}ms", response.evidence.size(),
                      totalFound, adapters.size(), response.elapsedMs);
        return response;
    } catch (const std::exception& e) {
        spanError(span, e.what());
        spdlog::error("Retrieval failed for query '{}': {}", logQuery(request.query), e.what());
        return Error{ErrorCode::InternalError, std::string("Search failed: ") + e.what()};
    }
}

Result<RetrievalResponse>
RetrievalOrchestrator::searchPatterns(const std::vector<std::string>& symptoms,
                                      const std::map<std::string, std::string>& context) {
    if (symptoms.empty()) {
        metrics_.recordValidationError();
        return Error{ErrorCode::ValidationError, "Symptoms cannot be empty"};
    }

    RetrievalRequest request;
    request.query = fmt::format("{}", fmt::join(symptoms, " | "));
    for (const auto& [k, v] : context) {
        request.context.push_back(v);
    }
    request.enabledSources = {PatternAdapter::kName};
    request.maxResults = 10;
    request.includeRecencyBias = false;
    return search(request);
}

// ===== Administration =====

bool RetrievalOrchestrator::invalidateCache(const std::optional<std::string>& sourceType) {
    if (!cache_) {
        spdlog::debug("Cache not enabled - nothing to invalidate");
        return true;
    }
    try {
        size_t removed = cache_->invalidate(sourceType);
        spdlog::info("Cache invalidated for source_type: {} ({} entries)",
                     sourceType.value_or("all"), removed);
        return true;
    } catch (const std::exception& e) {
        metrics_.recordCacheFailure();
        spdlog::error("Cache invalidation failed: {}", e.what());
        return false;
    }
}

size_t RetrievalOrchestrator::cleanupCache() {
    if (!cache_) {
        return 0;
    }
    try {
        return cache_->cleanupExpired();
    } catch (const std::exception& e) {
        metrics_.recordCacheFailure();
        spdlog::warn("Cache cleanup failed: {}", e.what());
        return 0;
    }
}

nlohmann::json RetrievalOrchestrator::getAdapterStatistics() const {
    std::shared_lock lock(registryMutex_);
    nlohmann::json adapters = nlohmann::json::object();
    for (const auto& a : adapters_) {
        adapters[a->name()] = a->getMetrics().toJson();
    }
    return nlohmann::json{{"timestamp", formatTimestamp(clock_())},
                          {"total_adapters", adapters_.size()},
                          {"adapters", std::move(adapters)}};
}

nlohmann::json RetrievalOrchestrator::getCacheStats() const {
    nlohmann::json j;
    j["cache_enabled"] = cache_ != nullptr;
    if (cache_) {
        j["cache_stats"] = cache_->getStats().toJson();
    } else {
        j["cache_stats"] = nullptr;
        j["message"] = "Caching is disabled";
    }
    j["adapter_stats"] = getAdapterStatistics()["adapters"];
    j["service_metrics"] = metrics_.snapshot().toJson();
    j["timestamp"] = formatTimestamp(now());
    return j;
}

bool RetrievalOrchestrator::readyCheck() const {
    std::shared_lock lock(registryMutex_);
    return !adapters_.empty();
}

nlohmann::json RetrievalOrchestrator::healthCheck() const {
    const auto timestamp = formatTimestamp(now());
    try {
        const auto snap = metrics_.snapshot();
        const auto& slo = config_.slo;

        std::string status = "healthy";
        std::vector<std::string> errors;

        if (!readyCheck()) {
            status = "unhealthy";
            errors.emplace_back("No adapters registered");
        }

        if (snap.latency.sampleCount > 0 && snap.latency.p95Ms > slo.p95LatencyMs) {
            if (status == "healthy")
                status = "degraded";
            errors.push_back(fmt::format("High p95 latency: {:.1f}ms (SLO {:.0f}ms)",
                                         snap.latency.p95Ms, slo.p95LatencyMs));
        }

        const double failureRate = snap.adapterFailureRatePercent();
        if (failureRate > slo.maxAdapterFailureRatePercent) {
            if (status == "healthy")
                status = "degraded";
            errors.push_back(fmt::format("High adapter failure rate: {:.1f}%", failureRate));
        }

        double cacheHitRate = 0.0;
        if (cache_) {
            const auto stats = cache_->getStats();
            cacheHitRate = stats.hitRate() * 100.0;
            if (stats.totalRequests() >= slo.minCacheSamples &&
                cacheHitRate < slo.minCacheHitRatePercent) {
                if (status == "healthy")
                    status = "degraded";
                errors.push_back(fmt::format("Low cache hit rate: {:.1f}%", cacheHitRate));
            }
        }

        nlohmann::json adapters = nlohmann::json::object();
        {
            std::shared_lock lock(registryMutex_);
            for (const auto& a : adapters_) {
                const auto m = a->getMetrics();
                adapters[a->name()] = {
                    {"status", (m.errorRate < 0.1 && m.timeoutRate < 0.1) ? "healthy" : "degraded"},
                    {"metrics", m.toJson()}};
            }
        }

        if (status != "healthy") {
            spdlog::warn("Retrieval health {}: {}", status, fmt::join(errors, "; "));
        }

        return nlohmann::json{{"service", kServiceName},
                              {"status", status},
                              {"timestamp", timestamp},
                              {"version", kServiceVersion},
                              {"metrics",
                               {{"total_searches", snap.searchesPerformed},
                                {"avg_latency_ms", snap.avgLatencyMs},
                                {"p95_latency_ms", snap.latency.p95Ms},
                                {"adapter_failure_rate", failureRate},
                                {"avg_relevance_score", snap.avgRelevanceScore},
                                {"cache_hit_rate", cacheHitRate}}},
                              {"adapters", std::move(adapters)},
                              {"cache_enabled", cache_ != nullptr},
                              {"errors", errors}};
    } catch (const std::exception& e) {
        spdlog::error("Health check failed: {}", e.what());
        return nlohmann::json{{"service", kServiceName},
                              {"status", "unhealthy"},
                              {"timestamp", timestamp},
                              {"version", kServiceVersion},
                              {"errors", {std::string(e.what())}}};
    }
}

// ===== Periodic cache sweep =====

void RetrievalOrchestrator::startSweeper() {
    if (sweeping_.exchange(true))
        return;
    sweepTimer_.emplace(strand_);
    sweepFuture_ = boost::asio::co_spawn(strand_, sweepLoop(), boost::asio::use_future);
    spdlog::debug("Cache sweeper started (interval={}s)", config_.cacheSweepInterval.count());
}

void RetrievalOrchestrator::stopSweeper() {
    if (!sweeping_.exchange(false))
        return;

    boost::asio::post(strand_, [this] {
        if (sweepTimer_) {
            sweepTimer_->cancel();
        }
    });
    try {
        if (sweepFuture_.valid()) {
            sweepFuture_.get();
        }
    } catch (const std::exception& e) {
        spdlog::debug("Cache sweeper stop wait error: {}", e.what());
    }
}

boost::asio::awaitable<void> RetrievalOrchestrator::sweepLoop() {
    BEACON_SET_THREAD_NAME("beacon-cache-sweep");
    while (sweeping_.load()) {
        sweepTimer_->expires_after(config_.cacheSweepInterval);
        boost::system::error_code ec;
        co_await sweepTimer_->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || !sweeping_.load()) {
            break;
        }
        size_t removed = cleanupCache();
        if (removed > 0) {
            spdlog::debug("Cache sweep removed {} expired entries", removed);
        }
    }
    spdlog::debug("Cache sweeper exiting");
}

} // namespace beacon::retrieval
