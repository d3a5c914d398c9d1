#include <homematch/config/config_helpers.h>
#include <homematch/config/search_config.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace homematch::config {

namespace {

constexpr std::string_view kProfilePrefix = "profiles.";

Error badValue(const std::string& where, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value '" + value + "' for " + where + " (expected " + expected + ")"};
}

Result<double> parseDouble(const std::string& where, const std::string& value) {
    if (value.empty()) {
        return badValue(where, value, "a number");
    }
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(value.c_str(), &end);
    if (errno != 0 || end != value.c_str() + value.size()) {
        return badValue(where, value, "a number");
    }
    return d;
}

Result<std::size_t> parseCount(const std::string& where, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        return badValue(where, value, "a non-negative integer");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(value.c_str(), &end, 10);
    if (errno != 0 || end != value.c_str() + value.size()) {
        return badValue(where, value, "a non-negative integer");
    }
    return static_cast<std::size_t>(n);
}

Result<bool> parseBool(const std::string& where, std::string value) {
    for (auto& c : value)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (value == "true" || value == "1" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "0" || value == "no" || value == "off")
        return false;
    return badValue(where, value, "a boolean");
}

Result<void> applySearchKey(search::SimilaritySearchConfig& cfg, const std::string& key,
                            const std::string& value) {
    const std::string where = "search." + key;
    if (key == "rrf_k") {
        auto v = parseDouble(where, value);
        if (!v)
            return v.error();
        cfg.rrfK = v.value();
    } else if (key == "over_fetch_factor") {
        auto v = parseCount(where, value);
        if (!v)
            return v.error();
        cfg.overFetchFactor = v.value();
    } else if (key == "hydration_factor") {
        auto v = parseCount(where, value);
        if (!v)
            return v.error();
        cfg.hydrationFactor = v.value();
    } else if (key == "parallel") {
        auto v = parseBool(where, value);
        if (!v)
            return v.error();
        cfg.enableParallelExecution = v.value();
    } else if (key == "collaborator_timeout_ms") {
        auto v = parseCount(where, value);
        if (!v)
            return v.error();
        cfg.collaboratorTimeout = std::chrono::milliseconds(v.value());
    } else if (key == "worker_threads") {
        auto v = parseCount(where, value);
        if (!v)
            return v.error();
        cfg.workerThreads = v.value();
    } else {
        spdlog::warn("Ignoring unknown config key '{}'", where);
    }
    return {};
}

Result<void> applyEnvOverride(search::SimilaritySearchConfig& cfg, const char* var,
                              const char* key) {
    const char* env = std::getenv(var);
    if (!env || !*env) {
        return {};
    }
    std::string value(env);
    trim(value);
    auto r = applySearchKey(cfg, key, value);
    if (!r) {
        return Error{ErrorCode::InvalidArgument, std::string(var) + ": " + r.error().message};
    }
    spdlog::debug("{} overrides search.{} = {}", var, key, value);
    return {};
}

} // namespace

Result<search::WeightProfileRegistry> SearchSettings::buildRegistry() const {
    return search::WeightProfileRegistry::create(profiles);
}

Result<SearchSettings> load_search_settings(const std::filesystem::path& config_path) {
    SearchSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config at {}, using defaults", config_path.string());
    } else {
        auto sections = parse_config_sections(config_path);
        for (const auto& [section, entries] : sections) {
            if (section == "search") {
                for (const auto& [key, value] : entries) {
                    if (auto r = applySearchKey(settings.search, key, value); !r) {
                        return r.error();
                    }
                }
                continue;
            }

            if (section.rfind(kProfilePrefix, 0) == 0) {
                search::FacetWeightProfile profile;
                profile.name = section.substr(kProfilePrefix.size());
                if (profile.name.empty()) {
                    return Error{ErrorCode::InvalidArgument,
                                 "Profile section '" + section + "' has no name"};
                }
                for (const auto& [key, value] : entries) {
                    auto facet = search::parseFacet(key);
                    if (!facet) {
                        return Error{ErrorCode::InvalidArgument,
                                     "Unknown facet '" + key + "' in [" + section + "]"};
                    }
                    auto weight = parseDouble(section + "." + key, value);
                    if (!weight) {
                        return weight.error();
                    }
                    profile.weights[*facet] = weight.value();
                }
                settings.profiles.push_back(std::move(profile));
                continue;
            }

            if (!section.empty()) {
                spdlog::debug("Ignoring config section [{}]", section);
            }
        }
    }

    const std::pair<const char*, const char*> overrides[] = {
        {"HOMEMATCH_RRF_K", "rrf_k"},
        {"HOMEMATCH_OVER_FETCH", "over_fetch_factor"},
        {"HOMEMATCH_HYDRATION", "hydration_factor"},
        {"HOMEMATCH_TIMEOUT_MS", "collaborator_timeout_ms"},
    };
    for (const auto& [var, key] : overrides) {
        if (auto r = applyEnvOverride(settings.search, var, key); !r) {
            return r.error();
        }
    }

    return settings;
}

Result<SearchSettings> load_search_settings() {
    return load_search_settings(get_config_path());
}

} // namespace homematch::config
