#pragma once

#include <homematch/core/types.h>
#include <homematch/search/facet_profile.h>

#include <cstddef>
#include <map>
#include <vector>

namespace homematch::search {

/**
 * @brief One neighbor returned by a facet index
 */
struct ScoredEntity {
    EntityId id;
    float similarity = 0.0f;
};

// Ordered by descending similarity; rank is the 0-based position
using RankedList = std::vector<ScoredEntity>;
using FacetRankings = std::map<Facet, RankedList>;

/**
 * @brief Entity with its fused score and per-facet breakdown
 */
struct FusedEntry {
    EntityId id;
    double score = 0.0;
    std::map<Facet, double> facetContributions;
    std::map<Facet, std::size_t> facetRanks;
};

struct RankFusionConfig {
    // RRF smoothing constant; larger k flattens the gap between top and lower ranks
    double rrfK = 60.0;

    // 0 = keep every fused entity
    std::size_t maxResults = 0;
};

/**
 * @brief Weighted Reciprocal Rank Fusion over per-facet rankings
 *
 * Each facet f with weight w_f adds w_f / (k + rank + 1) to the entity at position rank.
 * Fusing ranks instead of raw similarities keeps facets with unrelated score scales
 * comparable. Output is sorted by descending score; ties keep first-appearance order, so
 * identical inputs always produce identical output.
 */
class RankFusionEngine {
public:
    RankFusionEngine() = default;
    explicit RankFusionEngine(RankFusionConfig config) : config_(config) {}

    /**
     * @brief Fuse rankings with the configured k
     *
     * @return Fused entries, or InvalidWeight for a negative/non-finite weight and
     *         InvalidArgument for a bad k
     */
    Result<std::vector<FusedEntry>> fuse(const FacetRankings& rankings,
                                         const FacetWeightProfile& profile) const;

    /// Same as fuse() with an explicit k.
    Result<std::vector<FusedEntry>> fuse(const FacetRankings& rankings,
                                         const FacetWeightProfile& profile, double k) const;

    const RankFusionConfig& config() const { return config_; }

private:
    RankFusionConfig config_;
};

} // namespace homematch::search
