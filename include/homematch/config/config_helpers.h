#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace homematch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value; keys before any header live under ""
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Read every section of a TOML-style file. Missing file yields an empty map.
ConfigSections parse_config_sections(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/homematch or ~/.config/homematch
std::filesystem::path get_config_dir();

// Config path precedence: override > HOMEMATCH_CONFIG > <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Log level names accepted by HOMEMATCH_LOG_LEVEL
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// Apply HOMEMATCH_LOG_LEVEL to the default spdlog logger; returns false when unset or invalid
bool apply_log_level_from_env();

} // namespace homematch::config
