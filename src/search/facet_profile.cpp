#include <homematch/search/facet_profile.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace homematch::search {

std::optional<Facet> parseFacet(std::string_view name) {
    for (auto facet : kAllFacets) {
        if (name == facetToString(facet)) {
            return facet;
        }
    }
    return std::nullopt;
}

std::optional<SearchMode> parseSearchMode(std::string_view name) {
    for (auto mode : {SearchMode::Balanced, SearchMode::VisualFocus, SearchMode::FeaturesFocus,
                      SearchMode::LocationFocus}) {
        if (name == searchModeToString(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

Result<void> validateProfile(const FacetWeightProfile& profile) {
    if (profile.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Weight profile name must not be empty"};
    }
    for (const auto& [facet, weight] : profile.weights) {
        if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
            return Error{ErrorCode::InvalidWeight, "Profile '" + profile.name + "' has weight " +
                                                       std::to_string(weight) + " for facet '" +
                                                       facetToString(facet) +
                                                       "' (expected 0.0 - 1.0)"};
        }
    }
    return {};
}

FacetWeightProfile profileFor(SearchMode mode) {
    FacetWeightProfile profile;
    profile.name = searchModeToString(mode);

    switch (mode) {
        case SearchMode::Balanced:
            profile.weights = {{Facet::Location, 0.4}, {Facet::Features, 0.4}, {Facet::Visual, 0.2}};
            break;
        case SearchMode::VisualFocus:
            profile.weights = {{Facet::Location, 0.1}, {Facet::Features, 0.1}, {Facet::Visual, 0.8}};
            break;
        case SearchMode::FeaturesFocus:
            profile.weights = {{Facet::Location, 0.1}, {Facet::Features, 0.8}, {Facet::Visual, 0.1}};
            break;
        case SearchMode::LocationFocus:
            profile.weights = {{Facet::Location, 0.8}, {Facet::Features, 0.1}, {Facet::Visual, 0.1}};
            break;
    }
    return profile;
}

std::vector<FacetWeightProfile> builtinProfiles() {
    return {profileFor(SearchMode::Balanced), profileFor(SearchMode::VisualFocus),
            profileFor(SearchMode::FeaturesFocus), profileFor(SearchMode::LocationFocus)};
}

WeightProfileRegistry WeightProfileRegistry::withBuiltins() {
    WeightProfileRegistry registry;
    for (auto& profile : builtinProfiles()) {
        auto name = profile.name;
        registry.profiles_.emplace(std::move(name), std::move(profile));
    }
    return registry;
}

Result<WeightProfileRegistry> WeightProfileRegistry::create(std::vector<FacetWeightProfile> extra) {
    auto registry = withBuiltins();
    for (auto& profile : extra) {
        if (auto valid = validateProfile(profile); !valid) {
            return valid.error();
        }
        if (registry.contains(profile.name)) {
            return Error{ErrorCode::InvalidArgument,
                         "Duplicate weight profile name: " + profile.name};
        }
        spdlog::debug("Registered weight profile '{}' ({} facets)", profile.name,
                      profile.weights.size());
        auto name = profile.name;
        registry.profiles_.emplace(std::move(name), std::move(profile));
    }
    return registry;
}

Result<FacetWeightProfile> WeightProfileRegistry::find(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        return Error{ErrorCode::UnknownSearchMode, "Unknown search mode: '" + name + "'"};
    }
    return it->second;
}

std::vector<std::string> WeightProfileRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& [name, _] : profiles_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace homematch::search
