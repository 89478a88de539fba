#pragma once

#include <beacon/core/types.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief A similarity hit returned by an embedding-backed store
 */
struct VectorHit {
    std::string id;
    std::string content;
    float score = 0.0f;
    std::string documentType = "unknown";
    std::optional<std::string> url;
    std::optional<TimePoint> lastModified;
};

/**
 * @brief Embedding/vector similarity search
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;
    virtual Result<std::vector<VectorHit>> search(const std::string& query, size_t k) = 0;
};

struct IndexedDocument {
    std::string id;
    std::string title;
    std::string content;
    float score = 0.0f;
    std::string documentType = "unknown";
    std::optional<std::string> url;
    std::vector<std::string> tags;
    std::optional<TimePoint> lastModified;
};

/**
 * @brief Keyword/textual document search
 */
class IDocumentIndex {
public:
    virtual ~IDocumentIndex() = default;
    virtual Result<std::vector<IndexedDocument>>
    searchDocuments(const std::string& query, const std::optional<std::string>& documentType,
                    const std::vector<std::string>& tags, size_t limit) = 0;
};

/**
 * @brief Simple term-overlap index held in memory
 *
 * Scores a document by the fraction of distinct query terms found in its title
 * or content, with a small bonus for title matches. Documents can be added
 * programmatically or loaded from a JSON array:
 *
 *   [{"id": "...", "title": "...", "content": "...", "document_type": "...",
 *     "url": "...", "tags": ["..."], "last_modified": "2024-01-31T00:00:00Z"}]
 */
class InMemoryDocumentIndex final : public IDocumentIndex {
public:
    InMemoryDocumentIndex() = default;

    static Result<std::unique_ptr<InMemoryDocumentIndex>>
    fromJsonFile(const std::filesystem::path& path);

    void addDocument(IndexedDocument doc);
    size_t size() const;

    Result<std::vector<IndexedDocument>> searchDocuments(const std::string& query,
                                                         const std::optional<std::string>& documentType,
                                                         const std::vector<std::string>& tags,
                                                         size_t limit) override;

private:
    mutable std::mutex mutex_;
    std::vector<IndexedDocument> documents_;
};

/// Split into lower-cased alphanumeric terms.
std::vector<std::string> tokenize(std::string_view text);

/// Parse "YYYY-MM-DDTHH:MM:SSZ" (or a bare date) as UTC.
std::optional<TimePoint> parseTimestamp(std::string_view text);

} // namespace beacon::retrieval
