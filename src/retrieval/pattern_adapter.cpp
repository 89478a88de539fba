#include <beacon/profiling.h>
#include <beacon/retrieval/pattern_adapter.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

namespace beacon::retrieval {

namespace {

std::vector<std::string> stringArray(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& v : j[key]) {
            if (v.is_string()) {
                out.push_back(v.get<std::string>());
            }
        }
    }
    return out;
}

} // namespace

std::vector<SymptomPattern> PatternAdapter::defaultTable() {
    return {
        {"pattern-1",
         {"slow response", "high latency", "timeout"},
         {"database overload", "network congestion", "memory pressure"},
         0.85f,
         0.78f,
         "performance"},
        {"pattern-2",
         {"connection refused", "cannot connect", "port closed"},
         {"service down", "firewall blocking", "wrong port"},
         0.92f,
         0.84f,
         "connectivity"},
        {"pattern-3",
         {"memory error", "out of memory", "segfault"},
         {"memory leak", "insufficient RAM", "buffer overflow"},
         0.88f,
         0.76f,
         "memory"},
    };
}

Result<std::vector<SymptomPattern>> PatternAdapter::loadTable(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open pattern table: " + path.string()};
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid pattern table: ") + e.what()};
    }
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidData, "Pattern table must be a JSON array"};
    }

    std::vector<SymptomPattern> table;
    for (const auto& item : j) {
        if (!item.is_object()) {
            continue;
        }
        SymptomPattern p;
        p.id = item.value("id", "");
        p.symptoms = stringArray(item, "symptoms");
        p.causes = stringArray(item, "causes");
        p.confidence = item.value("confidence", 0.5f);
        p.successRate = item.value("success_rate", 0.5f);
        p.category = item.value("category", "general");
        if (p.id.empty() || p.symptoms.empty()) {
            spdlog::warn("Skipping pattern without id or symptoms in {}", path.string());
            continue;
        }
        table.push_back(std::move(p));
    }
    return table;
}

PatternAdapter::PatternAdapter(std::chrono::milliseconds timeout)
    : PatternAdapter(defaultTable(), timeout) {}

PatternAdapter::PatternAdapter(std::vector<SymptomPattern> patterns,
                               std::chrono::milliseconds timeout)
    : KnowledgeAdapter(kName, SourceType::Pattern, timeout), patterns_(std::move(patterns)) {}

float PatternAdapter::scoreWeight(const QueryContext& ctx) const {
    const auto q = toLower(ctx.query);
    if (containsAny(q, {"error", "issue", "problem", "symptom", "fail"})) {
        return 1.3f;
    }
    return 1.0f;
}

float PatternAdapter::matchScore(const SymptomPattern& p, std::string_view loweredQuery,
                                 const std::vector<std::string>& loweredContext) {
    float score = 0.0f;
    for (const auto& symptom : p.symptoms) {
        const auto s = toLower(symptom);
        if (loweredQuery.find(s) != std::string_view::npos) {
            score += 0.3f;
        }
        // At most one context hit per symptom.
        for (const auto& ctx : loweredContext) {
            if (ctx.find(s) != std::string::npos) {
                score += 0.2f;
                break;
            }
        }
    }
    return score;
}

Result<std::vector<Evidence>> PatternAdapter::doSearch(const std::string& query,
                                                       const std::vector<std::string>& context,
                                                       int maxResults,
                                                       const SearchFilters& filters) {
    BEACON_ADAPTER_ZONE("Pattern");
    const auto q = toLower(query);
    std::vector<std::string> ctx;
    ctx.reserve(context.size());
    for (const auto& c : context) {
        ctx.push_back(toLower(c));
    }

    std::optional<std::string> category;
    if (auto it = filters.find("category"); it != filters.end()) {
        category = it->second;
    }

    std::vector<std::pair<const SymptomPattern*, float>> matched;
    for (const auto& p : patterns_) {
        if (category && p.category != *category) {
            continue;
        }
        float raw = matchScore(p, q, ctx);
        if (raw <= 0.0f) {
            continue;
        }
        matched.emplace_back(&p, raw * p.confidence * (0.5f + 0.5f * p.successRate));
    }
    std::stable_sort(matched.begin(), matched.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    const auto current = now();
    std::vector<Evidence> out;
    for (const auto& [p, score] : matched) {
        if (maxResults > 0 && out.size() >= static_cast<size_t>(maxResults)) {
            break;
        }
        Evidence e;
        e.source = name() + "#" + p->id;
        e.sourceType = SourceType::Pattern;
        e.snippet = boundSnippet(fmt::format("Pattern: {} → Common causes: {}",
                                             fmt::join(p->symptoms, " | "),
                                             fmt::join(p->causes, ", ")));
        e.score = score;
        e.timestamp = current;
        e.provenance = baseProvenance();
        e.provenance["pattern_id"] = p->id;
        e.provenance["category"] = p->category;
        e.provenance["success_rate"] = fmt::format("{:.2f}", p->successRate);
        e.confidence = p->confidence;
        e.recencyBoost = kRecencyBoost;
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace beacon::retrieval
