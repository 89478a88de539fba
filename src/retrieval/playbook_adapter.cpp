#include <beacon/profiling.h>
#include <beacon/retrieval/playbook_adapter.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>

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

std::vector<std::string> whitespaceTokens(std::string_view text) {
    std::vector<std::string> tokens;
    std::istringstream ss{std::string(text)};
    std::string tok;
    while (ss >> tok) {
        tokens.push_back(std::move(tok));
    }
    return tokens;
}

} // namespace

std::vector<Playbook> PlaybookAdapter::defaultTable() {
    return {
        {"playbook-1",
         "Database Performance Troubleshooting",
         {"database", "performance", "slow", "query", "optimization"},
         {"Check database connection pool", "Analyze slow query log", "Review index usage",
          "Monitor resource utilization"},
         "database",
         "intermediate",
         "30-45 minutes"},
        {"playbook-2",
         "Network Connectivity Issues",
         {"network", "connectivity", "connection", "timeout", "firewall"},
         {"Test basic connectivity with ping", "Check port availability with telnet",
          "Review firewall rules", "Verify DNS resolution", "Analyze network routes"},
         "network",
         "beginner",
         "15-30 minutes"},
        {"playbook-3",
         "Application Memory Issues",
         {"memory", "ram", "leak", "garbage collection", "heap"},
         {"Monitor memory usage trends", "Analyze garbage collection logs",
          "Check for memory leaks", "Review application heap dumps",
          "Optimize memory configuration"},
         "application",
         "advanced",
         "45-60 minutes"},
        {"playbook-4",
         "Using Feature Flags for Safe Releases",
         {"feature", "flags", "release", "risk", "canary", "toggle"},
         {"Define flag default and scope", "Guard new code paths with flags",
          "Enable canary cohort and monitor metrics", "Ramp gradually and enable kill switch",
          "Remove stale flags after rollout"},
         "release",
         "beginner",
         "15-30 minutes"},
        {"playbook-5",
         "Circuit Breakers Implementation Guide",
         {"circuit", "breaker", "fallback", "retry", "backoff"},
         {"Identify external call sites", "Add timeouts and classify errors",
          "Configure thresholds and half-open probing",
          "Implement fallbacks and idempotent retries", "Monitor open/close rates"},
         "architecture",
         "intermediate",
         "30-45 minutes"},
        {"playbook-6",
         "Canary Deployment Rollout",
         {"canary", "rollout", "traffic", "guardrail", "rollback"},
         {"Deploy canary version alongside stable", "Route 1% traffic to canary",
          "Check SLO guardrails and errors", "Increase to 5%, 20%, 50%, 100%",
          "Rollback on guardrail breach"},
         "deployment",
         "intermediate",
         "30-60 minutes"},
        {"playbook-7",
         "Disaster Recovery Drill Runbook",
         {"disaster", "recovery", "dr", "drill", "failover", "restore"},
         {"Schedule drill and define scope", "Restore from backups to DR region",
          "Failover traffic and validate RTO/RPO", "Capture evidence and findings",
          "Update runbooks and follow-ups"},
         "operations",
         "advanced",
         "60-120 minutes"},
        {"playbook-8",
         "Safely Draining Traffic from a Node",
         {"drain", "traffic", "node", "rotation", "connection draining"},
         {"Cordon/unschedulable and set LB weight to 0",
          "Enable connection draining/graceful termination",
          "Wait for in-flight requests to complete", "Verify health checks and zero active conns",
          "Remove from rotation and decommission"},
         "operations",
         "beginner",
         "10-20 minutes"},
    };
}

Result<std::vector<Playbook>> PlaybookAdapter::loadTable(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open playbook table: " + path.string()};
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid playbook table: ") + e.what()};
    }
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidData, "Playbook table must be a JSON array"};
    }

    std::vector<Playbook> table;
    for (const auto& item : j) {
        if (!item.is_object()) {
            continue;
        }
        Playbook pb;
        pb.id = item.value("id", "");
        pb.title = item.value("title", "");
        pb.keywords = stringArray(item, "keywords");
        pb.steps = stringArray(item, "steps");
        pb.category = item.value("category", "general");
        pb.difficulty = item.value("difficulty", "unknown");
        pb.estimatedTime = item.value("estimated_time", "unknown");
        if (pb.id.empty() || pb.title.empty()) {
            spdlog::warn("Skipping playbook without id or title in {}", path.string());
            continue;
        }
        table.push_back(std::move(pb));
    }
    return table;
}

PlaybookAdapter::PlaybookAdapter(std::chrono::milliseconds timeout)
    : PlaybookAdapter(defaultTable(), timeout) {}

PlaybookAdapter::PlaybookAdapter(std::vector<Playbook> playbooks,
                                 std::chrono::milliseconds timeout)
    : KnowledgeAdapter(kName, SourceType::Playbook, timeout), playbooks_(std::move(playbooks)) {}

float PlaybookAdapter::scoreWeight(const QueryContext& ctx) const {
    const auto q = toLower(ctx.query);
    if (containsAny(q, {"how", "steps", "procedure", "process", "fix"})) {
        return 1.1f;
    }
    return 1.0f;
}

float PlaybookAdapter::matchScore(const Playbook& pb, std::string_view loweredQuery,
                                  const std::vector<std::string>& loweredContext) {
    float score = 0.0f;

    const auto title = toLower(pb.title);
    const auto tokens = whitespaceTokens(loweredQuery);
    if (std::any_of(tokens.begin(), tokens.end(),
                    [&](const std::string& t) { return title.find(t) != std::string::npos; })) {
        score += 0.4f;
    }

    for (const auto& keyword : pb.keywords) {
        const auto k = toLower(keyword);
        if (loweredQuery.find(k) != std::string_view::npos) {
            score += 0.2f;
        }
        for (const auto& ctx : loweredContext) {
            if (ctx.find(k) != std::string::npos) {
                score += 0.1f;
                break;
            }
        }
    }
    return score;
}

std::string PlaybookAdapter::formatSnippet(const Playbook& pb) {
    std::string preview;
    const size_t shown = std::min<size_t>(pb.steps.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            preview += "; ";
        }
        preview += pb.steps[i];
    }
    if (pb.steps.size() > 3) {
        preview += fmt::format("; ... ({} total steps)", pb.steps.size());
    }
    return fmt::format("Playbook: {} - Steps: {}", pb.title, preview);
}

Result<std::vector<Evidence>> PlaybookAdapter::doSearch(const std::string& query,
                                                        const std::vector<std::string>& context,
                                                        int maxResults,
                                                        const SearchFilters& filters) {
    BEACON_ADAPTER_ZONE("Playbook");
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

    std::vector<std::pair<const Playbook*, float>> matched;
    for (const auto& pb : playbooks_) {
        if (category && pb.category != *category) {
            continue;
        }
        float score = matchScore(pb, q, ctx);
        if (score > 0.0f) {
            matched.emplace_back(&pb, score);
        }
    }
    std::stable_sort(matched.begin(), matched.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    const auto current = now();
    std::vector<Evidence> out;
    for (const auto& [pb, score] : matched) {
        if (maxResults > 0 && out.size() >= static_cast<size_t>(maxResults)) {
            break;
        }
        Evidence e;
        e.source = name() + "#" + pb->id;
        e.sourceType = SourceType::Playbook;
        e.snippet = boundSnippet(formatSnippet(*pb));
        e.score = score;
        e.url = std::string(kUrlPrefix) + pb->id;
        e.timestamp = current;
        e.provenance = baseProvenance();
        e.provenance["playbook_id"] = pb->id;
        e.provenance["category"] = pb->category;
        e.provenance["difficulty"] = pb->difficulty;
        e.provenance["estimated_time"] = pb->estimatedTime;
        e.confidence = kConfidence;
        e.recencyBoost = kRecencyBoost;
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace beacon::retrieval
