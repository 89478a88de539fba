#pragma once

#include <beacon/retrieval/evidence.h>

#include <functional>
#include <string>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief Normalized identity of a retrieval request
 *
 * Two requests map to the same key when they differ only in query case or
 * surrounding whitespace, context order or case, or source ordering.
 */
class CacheKey {
public:
    /**
     * @brief Build a key from a request whose query has already been sanitized
     *
     * @param sanitizedQuery Query after the sanitizer ran
     * @param request Request supplying context, filters and ranking options
     * @param sources Adapters the request resolves to
     */
    static CacheKey fromRequest(const std::string& sanitizedQuery, const RetrievalRequest& request,
                                const std::vector<std::string>& sources);

    CacheKey() = default;

    /// 16 hex characters of the SHA-256 digest of the canonical form.
    const std::string& digest() const { return digest_; }

    /// Canonical pre-hash form; useful in debug logs.
    const std::string& canonical() const { return canonical_; }

    size_t hash() const { return hashValue_; }

    bool operator==(const CacheKey& other) const { return digest_ == other.digest_; }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    struct Components {
        std::string query;
        std::vector<std::string> context;
        std::vector<std::string> filters;
        std::vector<std::string> sources;
        int maxResults = 0;
        bool recency = false;
        float threshold = 0.0f;
        std::vector<std::string> weights;
    };

    const Components& components() const { return components_; }

private:
    void buildKey();

    Components components_;
    std::string canonical_;
    std::string digest_;
    size_t hashValue_ = 0;
};

/// Lower-case and trim surrounding whitespace.
std::string normalizeText(std::string_view text);

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

} // namespace beacon::retrieval
