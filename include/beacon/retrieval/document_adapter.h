#pragma once

#include <beacon/retrieval/backing_store.h>
#include <beacon/retrieval/knowledge_adapter.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief Adapter over documentation and runbooks
 *
 * Search order:
 *  1. vector store (with query expansion for connectivity phrasing; per-id max score)
 *  2. document index (keyword search honoring document_type/tags filters)
 *  3. built-in topic seeds, then generic low-score fallback documents
 *
 * A path that errors or yields nothing falls through to the next one, so the
 * adapter always returns something deterministic without any backing store.
 */
class DocumentAdapter final : public KnowledgeAdapter {
public:
    static constexpr const char* kName = "document";

    DocumentAdapter(std::shared_ptr<IVectorStore> vectorStore,
                    std::shared_ptr<IDocumentIndex> documentIndex,
                    std::chrono::milliseconds timeout);

    float scoreWeight(const QueryContext& ctx) const override;

    /// Age-bucketed additive boost: <30d 0.2, <90d 0.1, otherwise 0.
    static float recencyBoostFor(std::optional<TimePoint> lastModified, TimePoint now);

    /// Queries issued against the vector store for the given input.
    static std::vector<std::string> expandQuery(const std::string& query);

protected:
    Result<std::vector<Evidence>> doSearch(const std::string& query,
                                           const std::vector<std::string>& context, int maxResults,
                                           const SearchFilters& filters) override;

private:
    struct Candidate {
        std::string id;
        std::string content;
        float score = 0.0f;
        float confidence = 0.0f;
        std::string documentType;
        std::optional<std::string> url;
        std::optional<TimePoint> lastModified;
    };

    std::vector<Candidate> searchVectorStore(const std::string& query, size_t k);
    std::vector<Candidate> searchIndex(const std::string& query, const SearchFilters& filters,
                                       size_t k);
    std::vector<Candidate> searchSeeds(const std::string& query, size_t k) const;

    Evidence toEvidence(const Candidate& c, std::string_view searchPath) const;

    std::shared_ptr<IVectorStore> vectorStore_;
    std::shared_ptr<IDocumentIndex> documentIndex_;
};

} // namespace beacon::retrieval
