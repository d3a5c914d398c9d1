#pragma once

#include <homematch/core/types.h>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace homematch::search {

/**
 * @brief Independent similarity dimension, each backed by its own vector index
 */
enum class Facet { Location, Features, Visual };

// Canonical order; fusion visits facets in this order
inline constexpr std::array<Facet, 3> kAllFacets = {Facet::Location, Facet::Features,
                                                    Facet::Visual};

inline constexpr const char* facetToString(Facet facet) noexcept {
    switch (facet) {
        case Facet::Location:
            return "location";
        case Facet::Features:
            return "features";
        case Facet::Visual:
            return "visual";
    }
    return "unknown";
}

std::optional<Facet> parseFacet(std::string_view name);

/**
 * @brief Built-in search modes, each mapping to a weight profile of the same name
 */
enum class SearchMode { Balanced, VisualFocus, FeaturesFocus, LocationFocus };

inline constexpr const char* searchModeToString(SearchMode mode) noexcept {
    switch (mode) {
        case SearchMode::Balanced:
            return "balanced";
        case SearchMode::VisualFocus:
            return "visual_focus";
        case SearchMode::FeaturesFocus:
            return "features_focus";
        case SearchMode::LocationFocus:
            return "location_focus";
    }
    return "unknown";
}

std::optional<SearchMode> parseSearchMode(std::string_view name);

/**
 * @brief Named facet -> weight mapping
 *
 * Weights lie in [0, 1] and are used as given; they are not required to sum to 1 because
 * RRF contributions are already local to each facet. A facet absent from the map weighs 0.
 */
struct FacetWeightProfile {
    std::string name;
    std::map<Facet, double> weights;

    double weightFor(Facet facet) const {
        auto it = weights.find(facet);
        return it == weights.end() ? 0.0 : it->second;
    }
};

/// Weights must be finite and within [0, 1].
Result<void> validateProfile(const FacetWeightProfile& profile);

/// The four built-in profiles (balanced, visual_focus, features_focus, location_focus).
std::vector<FacetWeightProfile> builtinProfiles();

FacetWeightProfile profileFor(SearchMode mode);

/**
 * @brief Immutable name -> profile table
 *
 * Built once and validated up front, so lookups never re-validate. Safe to share across
 * threads since nothing mutates it after construction.
 */
class WeightProfileRegistry {
public:
    static WeightProfileRegistry withBuiltins();

    /**
     * @brief Build a registry holding the built-ins plus @p extra profiles
     *
     * Fails with InvalidWeight for an out-of-range weight and InvalidArgument for an empty or
     * duplicate name.
     */
    static Result<WeightProfileRegistry> create(std::vector<FacetWeightProfile> extra = {});

    Result<FacetWeightProfile> find(const std::string& name) const;
    bool contains(const std::string& name) const { return profiles_.count(name) > 0; }
    std::vector<std::string> names() const;
    size_t size() const { return profiles_.size(); }

private:
    WeightProfileRegistry() = default;

    std::unordered_map<std::string, FacetWeightProfile> profiles_;
};

} // namespace homematch::search
