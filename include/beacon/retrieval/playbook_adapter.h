#pragma once

#include <beacon/retrieval/knowledge_adapter.h>

#include <filesystem>
#include <string>
#include <vector>

namespace beacon::retrieval {

struct Playbook {
    std::string id;
    std::string title;
    std::vector<std::string> keywords;
    std::vector<std::string> steps;
    std::string category;
    std::string difficulty;
    std::string estimatedTime;
};

/**
 * @brief Adapter over an in-memory table of procedural playbooks
 *
 * Scoring: +0.4 when any whitespace-separated query token appears in the title,
 * +0.2 per keyword found in the query, +0.1 per keyword for the first context
 * entry that contains it. A "category" filter removes non-matching playbooks
 * before scoring.
 */
class PlaybookAdapter final : public KnowledgeAdapter {
public:
    static constexpr const char* kName = "playbook";
    static constexpr float kRecencyBoost = 0.05f;
    static constexpr float kConfidence = 0.9f;
    static constexpr const char* kUrlPrefix = "https://playbooks.example.com/";

    explicit PlaybookAdapter(std::chrono::milliseconds timeout);
    PlaybookAdapter(std::vector<Playbook> playbooks, std::chrono::milliseconds timeout);

    static Result<std::vector<Playbook>> loadTable(const std::filesystem::path& path);
    static std::vector<Playbook> defaultTable();

    float scoreWeight(const QueryContext& ctx) const override;

    static float matchScore(const Playbook& pb, std::string_view loweredQuery,
                            const std::vector<std::string>& loweredContext);

    /// "Playbook: <title> - Steps: a; b; c; ... (N total steps)"
    static std::string formatSnippet(const Playbook& pb);

    size_t size() const { return playbooks_.size(); }

protected:
    Result<std::vector<Evidence>> doSearch(const std::string& query,
                                           const std::vector<std::string>& context, int maxResults,
                                           const SearchFilters& filters) override;

private:
    const std::vector<Playbook> playbooks_;
};

} // namespace beacon::retrieval
