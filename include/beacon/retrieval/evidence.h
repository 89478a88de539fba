#pragma once

#include <beacon/core/types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace beacon::retrieval {

/// Source of "now" for age and expiry computations; overridable in tests.
using Clock = std::function<TimePoint()>;

/**
 * @brief Kind of knowledge source an Evidence item came from
 */
enum class SourceType { Document, Pattern, Playbook };

constexpr const char* sourceTypeToString(SourceType type) {
    switch (type) {
        case SourceType::Document: return "document";
        case SourceType::Pattern: return "pattern";
        case SourceType::Playbook: return "playbook";
    }
    return "document";
}

std::optional<SourceType> sourceTypeFromString(std::string_view name);

inline constexpr size_t kMaxSnippetLength = 500;
inline constexpr int kMaxResultsLimit = 100;

/// Free-form filter map passed through to adapters (e.g. "category", "document_type").
using SearchFilters = std::map<std::string, std::string>;

/**
 * @brief A single result from one adapter, carrying score and provenance
 */
struct Evidence {
    std::string source; ///< "<ADAPTER>#<record id>"
    SourceType sourceType = SourceType::Document;
    std::string snippet; ///< At most kMaxSnippetLength bytes
    float score = 0.0f;
    std::optional<std::string> url;
    TimePoint timestamp{};
    std::map<std::string, std::string> provenance;
    int rank = 0; ///< 1-based; 0 until the orchestrator assigns it
    float confidence = 0.0f;
    float recencyBoost = 0.0f;

    bool operator==(const Evidence&) const = default;
};

/// Truncate and repair a snippet so it satisfies the Evidence bound.
std::string boundSnippet(std::string_view text);

struct RetrievalRequest {
    std::string query;
    std::vector<std::string> context;
    SearchFilters filters;
    std::set<std::string> enabledSources; ///< Empty means every registered adapter
    int maxResults = 8;
    bool includeRecencyBias = true;
    float semanticSimilarityThreshold = 0.0f;
    std::map<std::string, float> sourceWeights; ///< sourceType -> weight, default 1.0
};

struct RetrievalResponse {
    std::vector<Evidence> evidence;
    size_t totalFound = 0;
    int64_t elapsedMs = 0;
    std::map<std::string, int64_t> sourceLatencies;
    bool cacheHit = false;
    std::optional<std::string> cacheKey;
    float avgRelevanceScore = 0.0f;
    std::map<std::string, size_t> sourceDistribution;
};

/// ISO-8601 UTC rendering used in JSON output
std::string formatTimestamp(TimePoint tp);

void to_json(nlohmann::json& j, const Evidence& e);
void to_json(nlohmann::json& j, const RetrievalRequest& r);
void to_json(nlohmann::json& j, const RetrievalResponse& r);

} // namespace beacon::retrieval
