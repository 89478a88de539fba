#include <beacon/profiling.h>
#include <beacon/retrieval/hybrid_ranker.h>

#include <algorithm>

namespace beacon::retrieval {

HybridRanker::HybridRanker(const RankingConfig& config) : config_(config) {}

float HybridRanker::clamp(float score) const {
    return config_.clampScores ? std::clamp(score, 0.0f, 1.0f) : score;
}

void HybridRanker::applyWeights(std::vector<Evidence>& evidence,
                                const std::map<std::string, float>& adapterWeights,
                                const std::map<std::string, float>& callerWeights) const {
    BEACON_ZONE_SCOPED_N("HybridRanker::applyWeights");
    for (auto& e : evidence) {
        float adapterWeight = 1.0f;
        if (auto p = e.provenance.find("adapter"); p != e.provenance.end()) {
            if (auto w = adapterWeights.find(p->second); w != adapterWeights.end()) {
                adapterWeight = w->second;
            }
        }

        float callerWeight = 1.0f;
        if (auto w = callerWeights.find(sourceTypeToString(e.sourceType));
            w != callerWeights.end()) {
            callerWeight = w->second;
        }

        e.score = clamp(e.score * adapterWeight * callerWeight + e.recencyBoost);
    }
    sortByScore(evidence);
    assignRanks(evidence);
}

float HybridRanker::recencyMultiplier(TimePoint timestamp, TimePoint now) const {
    const auto days = std::chrono::duration_cast<std::chrono::hours>(now - timestamp).count() / 24;
    if (days <= 7) {
        return config_.recentMultiplier;
    }
    if (days <= 30) {
        return config_.monthMultiplier;
    }
    if (days <= 90) {
        return config_.quarterMultiplier;
    }
    return config_.staleMultiplier;
}

void HybridRanker::applyRecencyBias(std::vector<Evidence>& evidence, TimePoint now) const {
    BEACON_ZONE_SCOPED_N("HybridRanker::applyRecencyBias");
    for (auto& e : evidence) {
        e.score = clamp(e.score * recencyMultiplier(e.timestamp, now));
    }
    sortByScore(evidence);
    assignRanks(evidence);
}

void HybridRanker::filterByThreshold(std::vector<Evidence>& evidence, float threshold) {
    evidence.erase(std::remove_if(evidence.begin(), evidence.end(),
                                  [threshold](const Evidence& e) { return e.score < threshold; }),
                   evidence.end());
}

void HybridRanker::sortByScore(std::vector<Evidence>& evidence) {
    std::stable_sort(evidence.begin(), evidence.end(),
                     [](const Evidence& a, const Evidence& b) { return a.score > b.score; });
}

void HybridRanker::assignRanks(std::vector<Evidence>& evidence) {
    int rank = 1;
    for (auto& e : evidence) {
        e.rank = rank++;
    }
}

} // namespace beacon::retrieval
