#include <beacon/common/utf8_utils.h>
#include <beacon/retrieval/evidence.h>

#include <ctime>

namespace beacon::retrieval {

std::optional<SourceType> sourceTypeFromString(std::string_view name) {
    if (name == "document")
        return SourceType::Document;
    if (name == "pattern")
        return SourceType::Pattern;
    if (name == "playbook")
        return SourceType::Playbook;
    return std::nullopt;
}

std::string boundSnippet(std::string_view text) {
    return common::truncateUtf8(common::sanitizeUtf8(text), kMaxSnippetLength);
}

std::string formatTimestamp(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void to_json(nlohmann::json& j, const Evidence& e) {
    j = nlohmann::json{{"source", e.source},
                       {"source_type", sourceTypeToString(e.sourceType)},
                       {"snippet", e.snippet},
                       {"score", e.score},
                       {"timestamp", formatTimestamp(e.timestamp)},
                       {"provenance", e.provenance},
                       {"rank", e.rank},
                       {"confidence", e.confidence},
                       {"recency_boost", e.recencyBoost}};
    j["url"] = e.url ? nlohmann::json(*e.url) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const RetrievalRequest& r) {
    j = nlohmann::json{{"query", r.query},
                       {"context", r.context},
                       {"filters", r.filters},
                       {"enabled_sources", r.enabledSources},
                       {"max_results", r.maxResults},
                       {"include_recency_bias", r.includeRecencyBias},
                       {"semantic_similarity_threshold", r.semanticSimilarityThreshold},
                       {"source_weights", r.sourceWeights}};
}

void to_json(nlohmann::json& j, const RetrievalResponse& r) {
    j = nlohmann::json{{"evidence", r.evidence},
                       {"total_found", r.totalFound},
                       {"elapsed_ms", r.elapsedMs},
                       {"source_latencies", r.sourceLatencies},
                       {"cache_hit", r.cacheHit},
                       {"avg_relevance_score", r.avgRelevanceScore},
                       {"source_distribution", r.sourceDistribution}};
    j["cache_key"] = r.cacheKey ? nlohmann::json(*r.cacheKey) : nlohmann::json(nullptr);
}

} // namespace beacon::retrieval
