#pragma once

#include <homematch/core/types.h>
#include <homematch/search/facet_profile.h>
#include <homematch/search/similarity_search.h>

#include <filesystem>
#include <vector>

namespace homematch::config {

/**
 * @brief Settings read from config.toml and HOMEMATCH_* overrides
 */
struct SearchSettings {
    search::SimilaritySearchConfig search;
    std::vector<search::FacetWeightProfile> profiles; // [profiles.<name>] sections

    /// Built-ins plus the configured profiles, validated.
    Result<search::WeightProfileRegistry> buildRegistry() const;
};

/**
 * @brief Load search settings from @p config_path, then apply environment overrides
 *
 * A missing file yields defaults. Unparsable values and unknown facet names fail with
 * InvalidArgument naming the offending section and key.
 */
Result<SearchSettings> load_search_settings(const std::filesystem::path& config_path);

/// Resolve the path with get_config_path() and load from there.
Result<SearchSettings> load_search_settings();

} // namespace homematch::config
