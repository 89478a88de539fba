#include <beacon/crypto/hasher.h>
#include <beacon/retrieval/cache_key.h>

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace beacon::retrieval {

namespace {
constexpr size_t kDigestLength = 16;
}

std::string normalizeText(std::string_view text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) {
        --e;
    }
    std::string out(text.substr(b, e - b));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

CacheKey CacheKey::fromRequest(const std::string& sanitizedQuery, const RetrievalRequest& request,
                               const std::vector<std::string>& sources) {
    CacheKey key;
    key.components_.query = normalizeText(sanitizedQuery);

    for (const auto& c : request.context) {
        key.components_.context.push_back(normalizeText(c));
    }
    std::sort(key.components_.context.begin(), key.components_.context.end());

    // std::map iteration is already ordered by key.
    for (const auto& [k, v] : request.filters) {
        key.components_.filters.push_back(k + "=" + v);
    }

    key.components_.sources = sources;
    std::sort(key.components_.sources.begin(), key.components_.sources.end());

    key.components_.maxResults = request.maxResults;
    key.components_.recency = request.includeRecencyBias;
    key.components_.threshold = request.semanticSimilarityThreshold;

    for (const auto& [type, weight] : request.sourceWeights) {
        key.components_.weights.push_back(fmt::format("{}={:.4f}", type, weight));
    }

    key.buildKey();
    return key;
}

void CacheKey::buildKey() {
    auto joined = [](const std::vector<std::string>& parts) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0)
                out += '\x1f';
            out += parts[i];
        }
        return out;
    };

    std::stringstream ss;
    ss << "q:" << components_.query << "|";
    ss << "c:" << joined(components_.context) << "|";
    ss << "f:" << joined(components_.filters) << "|";
    ss << "s:" << joined(components_.sources) << "|";
    ss << "n:" << components_.maxResults << ",r:" << (components_.recency ? 1 : 0)
       << ",t:" << fmt::format("{:.4f}", components_.threshold) << "|";
    ss << "w:" << joined(components_.weights);

    canonical_ = ss.str();
    digest_ = crypto::SHA256Hasher::hash(canonical_).substr(0, kDigestLength);
    hashValue_ = std::hash<std::string>{}(digest_);
}

} // namespace beacon::retrieval
