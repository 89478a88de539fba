#pragma once

#include <beacon/config/retrieval_config.h>
#include <beacon/core/types.h>
#include <beacon/retrieval/backing_store.h>
#include <beacon/retrieval/collaborators.h>
#include <beacon/retrieval/evidence.h>
#include <beacon/retrieval/hybrid_ranker.h>
#include <beacon/retrieval/knowledge_adapter.h>
#include <beacon/retrieval/semantic_cache.h>
#include <beacon/retrieval/service_metrics.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

namespace beacon::retrieval {

/**
 * @brief Federated retrieval across registered knowledge adapters
 *
 * A search validates and sanitizes the request, consults the semantic cache,
 * fans out to the enabled adapters on a worker pool, merges their evidence in
 * registration order, ranks it, filters by threshold, truncates and caches the
 * result. Each adapter gets its own deadline measured from the start of the
 * fan-out; a task that misses it is abandoned and contributes nothing. An
 * adapter with an abandoned task still running is not dispatched again until
 * that task returns, so a hung source holds at most one worker per caller.
 *
 * Cache faults never fail a search: lookups degrade to a miss and stores are
 * skipped.
 */
class RetrievalOrchestrator {
public:
    static constexpr const char* kServiceName = "beacon_retrieval";
    static constexpr const char* kServiceVersion = "1.0.0";

    /**
     * @param cache Response cache; nullptr disables caching
     * @param sanitizer Defaults to PassthroughSanitizer when null
     * @param tracer Defaults to NoopTracer when null
     */
    RetrievalOrchestrator(const config::RetrievalConfig& config,
                          std::unique_ptr<SemanticCache> cache,
                          std::shared_ptr<ISanitizer> sanitizer = nullptr,
                          std::shared_ptr<ITracer> tracer = nullptr);

    /// Builds the cache from the config (or none when cache_enabled is false).
    explicit RetrievalOrchestrator(const config::RetrievalConfig& config,
                                   std::shared_ptr<ISanitizer> sanitizer = nullptr,
                                   std::shared_ptr<ITracer> tracer = nullptr);

    ~RetrievalOrchestrator();

    RetrievalOrchestrator(const RetrievalOrchestrator&) = delete;
    RetrievalOrchestrator& operator=(const RetrievalOrchestrator&) = delete;

    /**
     * @brief Orchestrator with the document, pattern and playbook adapters registered
     *
     * Missing sanitizer/tracer default to RedactingSanitizer and LoggingTracer.
     * Table and index paths from the config are loaded here.
     */
    static Result<std::unique_ptr<RetrievalOrchestrator>>
    createDefault(const config::RetrievalConfig& config,
                  std::shared_ptr<IVectorStore> vectorStore = nullptr,
                  std::shared_ptr<IDocumentIndex> documentIndex = nullptr,
                  std::shared_ptr<ISanitizer> sanitizer = nullptr,
                  std::shared_ptr<ITracer> tracer = nullptr);

    // ===== Adapter registry =====

    /// AlreadyExists when an adapter with the same name is registered.
    Result<void> registerAdapter(std::shared_ptr<KnowledgeAdapter> adapter);
    Result<void> unregisterAdapter(const std::string& name);
    Result<void> setAdapterTimeout(const std::string& name, std::chrono::milliseconds timeout);

    /// Apply one timeout to every registered adapter.
    Result<void> reconfigureAdapters(std::chrono::milliseconds timeout);

    /// Registered names in registration order.
    std::vector<std::string> adapterNames() const;

    // ===== Retrieval =====

    Result<RetrievalResponse> search(const RetrievalRequest& request);

    /**
     * @brief Pattern-only search for a list of symptoms
     *
     * Symptoms are joined with " | " into the query, context values become the
     * context list, recency bias is off and at most 10 results are returned.
     */
    Result<RetrievalResponse> searchPatterns(const std::vector<std::string>& symptoms,
                                             const std::map<std::string, std::string>& context);

    // ===== Administration =====

    bool invalidateCache(const std::optional<std::string>& sourceType = std::nullopt);

    /// Remove expired cache entries now; returns the number removed.
    size_t cleanupCache();

    nlohmann::json getCacheStats() const;
    nlohmann::json getAdapterStatistics() const;
    nlohmann::json healthCheck() const;

    /// True iff at least one adapter is registered.
    bool readyCheck() const;

    ServiceMetrics::Snapshot metrics() const { return metrics_.snapshot(); }
    bool cacheEnabled() const { return cache_ != nullptr; }

    /// Override "now" for the cache, the adapters and recency bias.
    void setClock(Clock clock);

private:
    struct AdapterCall {
        std::shared_ptr<KnowledgeAdapter> adapter;
        std::future<AdapterOutcome> future;
        std::shared_ptr<KnowledgeAdapter::CallTicket> ticket; // null when skipped
    };

    Result<void> validate(const RetrievalRequest& request) const;
    std::vector<std::shared_ptr<KnowledgeAdapter>> resolveAdapters(const RetrievalRequest& request) const;
    std::vector<AdapterOutcome> fanOut(const std::vector<std::shared_ptr<KnowledgeAdapter>>& adapters,
                                       const std::string& query, const RetrievalRequest& request);

    std::optional<SemanticCache::Hit> cacheLookup(const CacheKey& key);
    void cacheStore(const CacheKey& key, const std::vector<Evidence>& evidence,
                    CacheMetadata metadata);

    void startSweeper();
    void stopSweeper();
    boost::asio::awaitable<void> sweepLoop();

    TimePoint now() const;

    config::RetrievalConfig config_;
    std::unique_ptr<SemanticCache> cache_;
    std::shared_ptr<ISanitizer> sanitizer_;
    std::shared_ptr<ITracer> tracer_;
    HybridRanker ranker_;
    ServiceMetrics metrics_;

    mutable std::shared_mutex registryMutex_;
    std::vector<std::shared_ptr<KnowledgeAdapter>> adapters_;
    Clock clock_;

    std::unique_ptr<boost::asio::thread_pool> pool_;
    // The sweeper runs apart from adapter calls so stuck adapters cannot stall it.
    std::unique_ptr<boost::asio::thread_pool> sweepPool_;
    boost::asio::strand<boost::asio::thread_pool::executor_type> strand_;
    std::optional<boost::asio::steady_timer> sweepTimer_;
    std::atomic<bool> sweeping_{false};
    std::future<void> sweepFuture_{};
};

} // namespace beacon::retrieval
