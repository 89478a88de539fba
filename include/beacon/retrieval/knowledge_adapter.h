#pragma once

#include <beacon/core/types.h>
#include <beacon/retrieval/evidence.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace beacon::retrieval {

/**
 * @brief Query shape handed to adapters when they choose their ranking weight
 */
struct QueryContext {
    std::string query;
    std::vector<std::string> context;
};

/**
 * @brief Point-in-time view of an adapter's counters
 */
struct AdapterMetricsSnapshot {
    std::string name;
    uint64_t queriesProcessed = 0;
    uint64_t timeoutCount = 0;
    uint64_t errorCount = 0;
    double avgLatencyMs = 0.0;
    double timeoutRate = 0.0;
    double errorRate = 0.0;

    nlohmann::json toJson() const;
};

/**
 * @brief Result of one adapter call as seen by the orchestrator
 */
struct AdapterOutcome {
    enum class Status { Ok, Error, Timeout };

    Status status = Status::Ok;
    std::vector<Evidence> evidence;
    int64_t latencyMs = 0;
};

/**
 * @brief Base class for a single knowledge source
 *
 * Concrete adapters implement doSearch(). The public search() wrapper measures
 * latency, enforces the adapter's time budget and turns every failure into an
 * empty result so a misbehaving source cannot break the fan-out.
 */
class KnowledgeAdapter {
public:
    static constexpr const char* kVersion = "1.0";

    /**
     * @brief State of one call posted to a worker, shared with the caller waiting on it
     *
     * Whichever side moves it out of Running first decides the call: the worker
     * finishing it, or the caller abandoning it at its deadline.
     */
    class CallTicket {
    public:
        enum class State { Running, Finished, Abandoned };

        State state() const { return state_.load(std::memory_order_acquire); }

    private:
        friend class KnowledgeAdapter;
        std::atomic<State> state_{State::Running};
    };

    KnowledgeAdapter(std::string name, SourceType type, std::chrono::milliseconds timeout);
    virtual ~KnowledgeAdapter() = default;

    KnowledgeAdapter(const KnowledgeAdapter&) = delete;
    KnowledgeAdapter& operator=(const KnowledgeAdapter&) = delete;

    const std::string& name() const { return name_; }
    SourceType sourceType() const { return type_; }

    /**
     * @brief Multiplier applied to this adapter's scores for the given query
     *
     * @return 1.0 unless the adapter is particularly suited to the query shape
     */
    virtual float scoreWeight(const QueryContext& ctx) const;

    /**
     * @brief Search the source; never throws
     *
     * Returns an empty list on internal error or when the call exceeded the
     * adapter's timeout. Both cases are counted in the adapter metrics.
     */
    std::vector<Evidence> search(const std::string& query, const std::vector<std::string>& context,
                                 int maxResults, const SearchFilters& filters) noexcept;

    /**
     * @brief Same as search() but also reports how the call ended
     *
     * When @p ticket is given and the caller abandoned the call before it
     * returned, the late result is dropped without touching the metrics a
     * second time.
     */
    AdapterOutcome execute(const std::string& query, const std::vector<std::string>& context,
                           int maxResults, const SearchFilters& filters,
                           CallTicket* ticket = nullptr) noexcept;

    /**
     * @brief Give up on a posted call whose deadline passed
     *
     * Counts the call as a timeout right away and marks it stuck until the
     * worker returns.
     *
     * @return false if the call finished first and its result can be collected
     */
    bool abandon(CallTicket& ticket);

    /// True while an abandoned call is still occupying a worker.
    bool hasStuckCalls() const { return stuckCalls_.load(std::memory_order_acquire) > 0; }

    /// Count a call that was not dispatched because an earlier one is stuck.
    void recordSkipped();

    std::chrono::milliseconds timeout() const {
        return std::chrono::milliseconds(timeoutMs_.load(std::memory_order_relaxed));
    }
    void setTimeout(std::chrono::milliseconds timeout);

    void setClock(Clock clock);

    AdapterMetricsSnapshot getMetrics() const;

protected:
    virtual Result<std::vector<Evidence>> doSearch(const std::string& query,
                                                   const std::vector<std::string>& context,
                                                   int maxResults,
                                                   const SearchFilters& filters) = 0;

    TimePoint now() const;

    /// Base provenance map: adapter name and version.
    std::map<std::string, std::string> baseProvenance() const;

private:
    std::string name_;
    SourceType type_;
    std::atomic<int64_t> timeoutMs_;
    mutable std::mutex clockMutex_;
    Clock clock_;

    std::atomic<uint64_t> queriesProcessed_{0};
    std::atomic<uint64_t> totalLatencyUs_{0};
    std::atomic<uint64_t> timeoutCount_{0};
    std::atomic<uint64_t> errorCount_{0};
    std::atomic<int64_t> stuckCalls_{0};
};

/// Lower-case ASCII copy of the input.
std::string toLower(std::string_view s);

/// True if any of the phrases occurs in the (already lower-cased) haystack.
template <typename Range> bool containsAny(std::string_view haystack, const Range& phrases) {
    for (std::string_view p : phrases) {
        if (haystack.find(p) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

inline bool containsAny(std::string_view haystack,
                        std::initializer_list<std::string_view> phrases) {
    return containsAny<std::initializer_list<std::string_view>>(haystack, phrases);
}

} // namespace beacon::retrieval
