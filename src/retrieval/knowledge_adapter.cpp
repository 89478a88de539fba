#include <beacon/common/utf8_utils.h>
#include <beacon/profiling.h>
#include <beacon/retrieval/knowledge_adapter.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace beacon::retrieval {

nlohmann::json AdapterMetricsSnapshot::toJson() const {
    return nlohmann::json{{"name", name},
                          {"queries_processed", queriesProcessed},
                          {"avg_latency_ms", avgLatencyMs},
                          {"timeout_rate", timeoutRate},
                          {"error_rate", errorRate},
                          {"timeout_count", timeoutCount},
                          {"error_count", errorCount}};
}

KnowledgeAdapter::KnowledgeAdapter(std::string name, SourceType type,
                                   std::chrono::milliseconds timeout)
    : name_(std::move(name)), type_(type), timeoutMs_(timeout.count()),
      clock_([] { return std::chrono::system_clock::now(); }) {}

float KnowledgeAdapter::scoreWeight(const QueryContext&) const {
    return 1.0f;
}

void KnowledgeAdapter::setTimeout(std::chrono::milliseconds timeout) {
    timeoutMs_.store(timeout.count(), std::memory_order_relaxed);
}

void KnowledgeAdapter::setClock(Clock clock) {
    std::lock_guard<std::mutex> lock(clockMutex_);
    if (clock) {
        clock_ = std::move(clock);
    }
}

TimePoint KnowledgeAdapter::now() const {
    std::lock_guard<std::mutex> lock(clockMutex_);
    return clock_();
}

std::map<std::string, std::string> KnowledgeAdapter::baseProvenance() const {
    return {{"adapter", name_}, {"version", kVersion}};
}

std::vector<Evidence> KnowledgeAdapter::search(const std::string& query,
                                               const std::vector<std::string>& context,
                                               int maxResults,
                                               const SearchFilters& filters) noexcept {
    return execute(query, context, maxResults, filters).evidence;
}

AdapterOutcome KnowledgeAdapter::execute(const std::string& query,
                                         const std::vector<std::string>& context, int maxResults,
                                         const SearchFilters& filters,
                                         CallTicket* ticket) noexcept {
    BEACON_ZONE_SCOPED_N("KnowledgeAdapter::execute");
    const auto start = std::chrono::steady_clock::now();
    const auto budget = timeout();

    AdapterOutcome outcome;
    if (ticket && ticket->state() == CallTicket::State::Abandoned) {
        // Abandoned while still queued; nothing is waiting for the result.
        stuckCalls_.fetch_sub(1, std::memory_order_acq_rel);
        outcome.status = AdapterOutcome::Status::Timeout;
        return outcome;
    }
    try {
        auto r = doSearch(query, context, maxResults, filters);
        if (r) {
            outcome.evidence = std::move(r).value();
        } else {
            outcome.status = AdapterOutcome::Status::Error;
            spdlog::error("[{}] search failed: {}", name_, r.error().message);
        }
    } catch (const std::exception& e) {
        outcome.status = AdapterOutcome::Status::Error;
        spdlog::error("[{}] search threw: {}", name_, e.what());
    } catch (...) {
        outcome.status = AdapterOutcome::Status::Error;
        spdlog::error("[{}] search threw a non-standard exception", name_);
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    const auto elapsedUs = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    outcome.latencyMs = elapsedUs / 1000;

    if (ticket) {
        auto expected = CallTicket::State::Running;
        if (!ticket->state_.compare_exchange_strong(expected, CallTicket::State::Finished,
                                                    std::memory_order_acq_rel)) {
            // Already counted as a timeout by abandon().
            stuckCalls_.fetch_sub(1, std::memory_order_acq_rel);
            spdlog::info("[{}] abandoned search returned after {}ms", name_, outcome.latencyMs);
            outcome.status = AdapterOutcome::Status::Timeout;
            outcome.evidence.clear();
            return outcome;
        }
    }
    queriesProcessed_.fetch_add(1, std::memory_order_relaxed);
    totalLatencyUs_.fetch_add(static_cast<uint64_t>(elapsedUs), std::memory_order_relaxed);

    if (outcome.status == AdapterOutcome::Status::Error) {
        errorCount_.fetch_add(1, std::memory_order_relaxed);
        outcome.evidence.clear();
        return outcome;
    }
    if (elapsed > budget) {
        timeoutCount_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[{}] search timeout after {}ms for query: {}", name_, outcome.latencyMs,
                     common::truncateUtf8(query, 50));
        outcome.status = AdapterOutcome::Status::Timeout;
        outcome.evidence.clear();
        return outcome;
    }

    if (maxResults > 0 && outcome.evidence.size() > static_cast<size_t>(maxResults)) {
        outcome.evidence.resize(static_cast<size_t>(maxResults));
    }
    spdlog::debug("[{}] search completed: query='{}', results={}, latency_ms={:.1f}", name_,
                  common::truncateUtf8(query, 60), outcome.evidence.size(), elapsedUs / 1000.0);
    return outcome;
}

bool KnowledgeAdapter::abandon(CallTicket& ticket) {
    // Raise the stuck count first so the worker's decrement can never run ahead of it.
    stuckCalls_.fetch_add(1, std::memory_order_acq_rel);
    auto expected = CallTicket::State::Running;
    if (!ticket.state_.compare_exchange_strong(expected, CallTicket::State::Abandoned,
                                               std::memory_order_acq_rel)) {
        stuckCalls_.fetch_sub(1, std::memory_order_acq_rel);
        return false;
    }
    const auto budget = timeout();
    queriesProcessed_.fetch_add(1, std::memory_order_relaxed);
    totalLatencyUs_.fetch_add(
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(budget).count()),
        std::memory_order_relaxed);
    timeoutCount_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void KnowledgeAdapter::recordSkipped() {
    queriesProcessed_.fetch_add(1, std::memory_order_relaxed);
    timeoutCount_.fetch_add(1, std::memory_order_relaxed);
}

AdapterMetricsSnapshot KnowledgeAdapter::getMetrics() const {
    AdapterMetricsSnapshot snap;
    snap.name = name_;
    snap.queriesProcessed = queriesProcessed_.load(std::memory_order_relaxed);
    snap.timeoutCount = timeoutCount_.load(std::memory_order_relaxed);
    snap.errorCount = errorCount_.load(std::memory_order_relaxed);
    const double queries = static_cast<double>(std::max<uint64_t>(snap.queriesProcessed, 1));
    snap.avgLatencyMs =
        static_cast<double>(totalLatencyUs_.load(std::memory_order_relaxed)) / 1000.0 / queries;
    snap.timeoutRate = static_cast<double>(snap.timeoutCount) / queries;
    snap.errorRate = static_cast<double>(snap.errorCount) / queries;
    return snap;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace beacon::retrieval
