#include <beacon/retrieval/backing_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

namespace beacon::retrieval {

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> terms;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            terms.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(std::move(current));
    }
    return terms;
}

std::optional<TimePoint> parseTimestamp(std::string_view text) {
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    std::string buf(text);
    int n = std::sscanf(buf.c_str(), "%d-%d-%dT%d:%d:%d", &year, &month, &day, &hour, &minute,
                        &second);
    if (n != 3 && n != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

Result<std::unique_ptr<InMemoryDocumentIndex>>
InMemoryDocumentIndex::fromJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open document index: " + path.string()};
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Failed to parse document index " + path.string() + ": " + e.what()};
    }
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidData, "Document index must be a JSON array"};
    }

    auto index = std::make_unique<InMemoryDocumentIndex>();
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("id") || !item.contains("content")) {
            spdlog::warn("Skipping document index entry without id/content");
            continue;
        }
        IndexedDocument doc;
        doc.id = item.value("id", "");
        doc.title = item.value("title", "");
        doc.content = item.value("content", "");
        doc.documentType = item.value("document_type", "unknown");
        if (item.contains("url") && item["url"].is_string()) {
            doc.url = item["url"].get<std::string>();
        }
        if (item.contains("tags") && item["tags"].is_array()) {
            for (const auto& t : item["tags"]) {
                if (t.is_string()) {
                    doc.tags.push_back(t.get<std::string>());
                }
            }
        }
        if (item.contains("last_modified") && item["last_modified"].is_string()) {
            doc.lastModified = parseTimestamp(item["last_modified"].get<std::string>());
        }
        index->addDocument(std::move(doc));
    }
    spdlog::info("Loaded {} documents from {}", index->size(), path.string());
    return std::move(index);
}

void InMemoryDocumentIndex::addDocument(IndexedDocument doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_.push_back(std::move(doc));
}

size_t InMemoryDocumentIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.size();
}

Result<std::vector<IndexedDocument>>
InMemoryDocumentIndex::searchDocuments(const std::string& query,
                                       const std::optional<std::string>& documentType,
                                       const std::vector<std::string>& tags, size_t limit) {
    auto terms = tokenize(query);
    std::set<std::string> queryTerms(terms.begin(), terms.end());
    if (queryTerms.empty() || limit == 0) {
        return std::vector<IndexedDocument>{};
    }

    std::vector<IndexedDocument> hits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& doc : documents_) {
            if (documentType && doc.documentType != *documentType) {
                continue;
            }
            if (!tags.empty()) {
                bool tagMatch = std::any_of(tags.begin(), tags.end(), [&](const std::string& t) {
                    return std::find(doc.tags.begin(), doc.tags.end(), t) != doc.tags.end();
                });
                if (!tagMatch) {
                    continue;
                }
            }

            auto titleTerms = tokenize(doc.title);
            auto bodyTerms = tokenize(doc.content);
            std::set<std::string> titleSet(titleTerms.begin(), titleTerms.end());
            std::set<std::string> bodySet(bodyTerms.begin(), bodyTerms.end());

            size_t matched = 0;
            bool titleHit = false;
            for (const auto& t : queryTerms) {
                bool inTitle = titleSet.count(t) > 0;
                if (inTitle || bodySet.count(t) > 0) {
                    ++matched;
                }
                titleHit = titleHit || inTitle;
            }
            if (matched == 0) {
                continue;
            }

            IndexedDocument hit = doc;
            float score = static_cast<float>(matched) / static_cast<float>(queryTerms.size());
            if (titleHit) {
                score += 0.1f;
            }
            hit.score = std::min(score, 1.0f);
            hits.push_back(std::move(hit));
        }
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const auto& a, const auto& b) { return a.score > b.score; });
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

} // namespace beacon::retrieval
