#include <homematch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace homematch::config {

ConfigSections parse_config_sections(const std::filesystem::path& config_path) {
    ConfigSections sections;
    std::ifstream file(config_path);
    if (!file) {
        return sections;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section] or [profiles.name]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                sections[currentSection];
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        sections[currentSection][k] = unquote(v);
    }

    return sections;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto sections = parse_config_sections(config_path);
    auto sit = sections.find(section);
    if (sit == sections.end()) {
        return "";
    }
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? "" : kit->second;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "homematch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "homematch";
    }
    return std::filesystem::path("~/.config") / "homematch";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("HOMEMATCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    trim(v);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

bool apply_log_level_from_env() {
    const char* envLvl = std::getenv("HOMEMATCH_LOG_LEVEL");
    if (!envLvl || !*envLvl) {
        return false;
    }
    auto lvl = parse_log_level(envLvl);
    if (!lvl) {
        spdlog::warn("Ignoring unknown HOMEMATCH_LOG_LEVEL '{}'", envLvl);
        return false;
    }
    spdlog::set_level(*lvl);
    return true;
}

} // namespace homematch::config
