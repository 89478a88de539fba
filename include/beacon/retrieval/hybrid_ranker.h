#pragma once

#include <beacon/retrieval/evidence.h>

#include <map>
#include <string>
#include <vector>

namespace beacon::retrieval {

/**
 * @brief Configuration for hybrid ranking
 */
struct RankingConfig {
    // Clamp fused scores into [0,1] after each scoring stage
    bool clampScores = false;

    // Recency bias multipliers by evidence age
    float recentMultiplier = 1.2f; // <= 7 days
    float monthMultiplier = 1.1f;  // <= 30 days
    float quarterMultiplier = 1.0f; // <= 90 days
    float staleMultiplier = 0.9f;  // older
};

/**
 * @brief Fuses adapter weights, caller weights, recency boosts and recency bias
 *
 * All sorts are stable, so equal scores keep the order the evidence was merged
 * in (adapter registration order, then adapter emission order).
 */
class HybridRanker {
public:
    explicit HybridRanker(const RankingConfig& config = {});

    void setConfig(const RankingConfig& config) { config_ = config; }
    const RankingConfig& config() const { return config_; }

    /**
     * @brief Weight scores and add each item's recency boost, then sort and rank
     *
     * @param adapterWeights Adapter name -> scoreWeight() for this query
     * @param callerWeights Source type name -> caller override (default 1.0)
     */
    void applyWeights(std::vector<Evidence>& evidence,
                      const std::map<std::string, float>& adapterWeights,
                      const std::map<std::string, float>& callerWeights) const;

    /**
     * @brief Multiply each score by its age-bucket factor relative to now, then re-sort
     */
    void applyRecencyBias(std::vector<Evidence>& evidence, TimePoint now) const;

    /// Age-bucket factor for a single timestamp.
    float recencyMultiplier(TimePoint timestamp, TimePoint now) const;

    /// Drop items scoring below the threshold; order is preserved.
    static void filterByThreshold(std::vector<Evidence>& evidence, float threshold);

    static void sortByScore(std::vector<Evidence>& evidence);

    /// Assign ranks 1..N in current order.
    static void assignRanks(std::vector<Evidence>& evidence);

private:
    float clamp(float score) const;

    RankingConfig config_;
};

} // namespace beacon::retrieval
