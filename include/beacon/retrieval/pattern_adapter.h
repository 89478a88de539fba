#pragma once

#include <beacon/retrieval/knowledge_adapter.h>

#include <filesystem>
#include <string>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief Curated symptom to cause mapping
 */
struct SymptomPattern {
    std::string id;
    std::vector<std::string> symptoms;
    std::vector<std::string> causes;
    float confidence = 0.0f;
    float successRate = 0.0f;
    std::string category;
};

/**
 * @brief Adapter over an in-memory symptom pattern table
 *
 * Scoring per pattern: +0.3 for every symptom phrase found in the query, +0.2
 * per symptom phrase for the first context entry containing it. Patterns without any
 * hit are dropped; the rest are scaled by confidence * (0.5 + 0.5 * successRate).
 */
class PatternAdapter final : public KnowledgeAdapter {
public:
    static constexpr const char* kName = "pattern";
    static constexpr float kRecencyBoost = 0.1f;

    /// Uses the built-in pattern table.
    explicit PatternAdapter(std::chrono::milliseconds timeout);
    PatternAdapter(std::vector<SymptomPattern> patterns, std::chrono::milliseconds timeout);

    /// Load a table from a JSON array of {id, symptoms, causes, confidence, success_rate, category}.
    static Result<std::vector<SymptomPattern>> loadTable(const std::filesystem::path& path);
    static std::vector<SymptomPattern> defaultTable();

    float scoreWeight(const QueryContext& ctx) const override;

    /// Raw match score before confidence scaling; 0 when no symptom matched.
    static float matchScore(const SymptomPattern& p, std::string_view loweredQuery,
                            const std::vector<std::string>& loweredContext);

    size_t size() const { return patterns_.size(); }

protected:
    Result<std::vector<Evidence>> doSearch(const std::string& query,
                                           const std::vector<std::string>& context, int maxResults,
                                           const SearchFilters& filters) override;

private:
    const std::vector<SymptomPattern> patterns_;
};

} // namespace beacon::retrieval
