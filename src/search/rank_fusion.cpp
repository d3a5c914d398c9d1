#include <homematch/search/rank_fusion.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace homematch::search {

Result<std::vector<FusedEntry>> RankFusionEngine::fuse(const FacetRankings& rankings,
                                                       const FacetWeightProfile& profile) const {
    return fuse(rankings, profile, config_.rrfK);
}

Result<std::vector<FusedEntry>> RankFusionEngine::fuse(const FacetRankings& rankings,
                                                       const FacetWeightProfile& profile,
                                                       double k) const {
    if (!std::isfinite(k) || k < 0.0) {
        return Error{ErrorCode::InvalidArgument, "RRF constant k must be >= 0, got " +
                                                     std::to_string(k)};
    }
    for (const auto& [facet, weight] : profile.weights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return Error{ErrorCode::InvalidWeight, "Weight for facet '" +
                                                       std::string(facetToString(facet)) +
                                                       "' must be non-negative, got " +
                                                       std::to_string(weight)};
        }
    }

    if (rankings.empty()) {
        return std::vector<FusedEntry>{};
    }

    // Entries stay in first-appearance order; the index map points into it
    std::vector<FusedEntry> fused;
    std::unordered_map<EntityId, size_t> index;

    for (const auto& [facet, list] : rankings) {
        const double weight = profile.weightFor(facet);
        if (weight == 0.0 || list.empty()) {
            continue;
        }

        std::unordered_set<EntityId> seenInFacet;
        seenInFacet.reserve(list.size());

        for (size_t rank = 0; rank < list.size(); ++rank) {
            const auto& id = list[rank].id;
            if (!seenInFacet.insert(id).second) {
                spdlog::debug("Duplicate id '{}' in {} ranking at rank {}; ignored", id,
                              facetToString(facet), rank);
                continue;
            }

            const double contribution = weight * (1.0 / (k + static_cast<double>(rank) + 1.0));

            auto [it, inserted] = index.try_emplace(id, fused.size());
            if (inserted) {
                FusedEntry entry;
                entry.id = id;
                fused.push_back(std::move(entry));
            }
            auto& entry = fused[it->second];
            entry.score += contribution;
            entry.facetContributions[facet] += contribution;
            entry.facetRanks.emplace(facet, rank);
        }
    }

    std::stable_sort(fused.begin(), fused.end(),
                     [](const FusedEntry& a, const FusedEntry& b) { return a.score > b.score; });

    if (config_.maxResults > 0 && fused.size() > config_.maxResults) {
        fused.resize(config_.maxResults);
    }

    spdlog::debug("Fused {} facet rankings into {} entities (k={})", rankings.size(),
                  fused.size(), k);
    return fused;
}

} // namespace homematch::search
