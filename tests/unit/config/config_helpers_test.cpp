#include <gtest/gtest.h>

#include <homematch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include "common/env_guard.h"

using namespace homematch::config;
using homematch::test::EnvGuard;
using homematch::test::TempDir;

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");

    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote("  'single'  "), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
    EXPECT_EQ(unquote("plain"), "plain");
}

TEST(ConfigHelpersTest, ExpandTilde) {
    EnvGuard home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/cfg/homematch.toml"),
              std::filesystem::path("/home/tester/cfg/homematch.toml"));
    EXPECT_EQ(expand_tilde("/etc/homematch.toml"), std::filesystem::path("/etc/homematch.toml"));
}

TEST(ConfigHelpersTest, ParsesSectionsAndComments) {
    TempDir dir("homematch_config_helpers_");
    auto path = dir.write("config.toml", R"(# top comment
name = "root"

[search]
rrf_k = 42        # inline comment
parallel = "true"

[profiles.waterfront]
location = 0.6
label = "pool # not a comment"
)");

    auto sections = parse_config_sections(path);
    EXPECT_EQ(sections[""]["name"], "root");
    EXPECT_EQ(sections["search"]["rrf_k"], "42");
    EXPECT_EQ(sections["search"]["parallel"], "true");
    EXPECT_EQ(sections["profiles.waterfront"]["location"], "0.6");
    EXPECT_EQ(sections["profiles.waterfront"]["label"], "pool # not a comment");

    EXPECT_EQ(parse_config_value(path, "search", "rrf_k"), "42");
    EXPECT_EQ(parse_config_value(path, "search", "missing"), "");
    EXPECT_EQ(parse_config_value(path, "nosuch", "rrf_k"), "");
}

TEST(ConfigHelpersTest, MissingFileIsEmpty) {
    EXPECT_TRUE(parse_config_sections("/nonexistent/homematch/config.toml").empty());
}

TEST(ConfigHelpersTest, ConfigPathPrecedence) {
    EnvGuard xdg("XDG_CONFIG_HOME", "/xdg");
    EnvGuard env("HOMEMATCH_CONFIG", std::nullopt);

    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/homematch/config.toml"));

    {
        EnvGuard fromEnv("HOMEMATCH_CONFIG", "/etc/homematch/custom.toml");
        EXPECT_EQ(get_config_path(), std::filesystem::path("/etc/homematch/custom.toml"));
        EXPECT_EQ(get_config_path("/tmp/explicit.toml"),
                  std::filesystem::path("/tmp/explicit.toml"));
    }

    EnvGuard noXdg("XDG_CONFIG_HOME", std::nullopt);
    EnvGuard home("HOME", "/home/tester");
    EXPECT_EQ(get_config_dir(), std::filesystem::path("/home/tester/.config/homematch"));
}

TEST(ConfigHelpersTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("WARNING"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level(" err "), spdlog::level::err);
    EXPECT_EQ(parse_log_level("silent"), spdlog::level::off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(ConfigHelpersTest, ApplyLogLevelFromEnv) {
    const auto previous = spdlog::get_level();

    {
        EnvGuard unset("HOMEMATCH_LOG_LEVEL", std::nullopt);
        EXPECT_FALSE(apply_log_level_from_env());
    }
    {
        EnvGuard bad("HOMEMATCH_LOG_LEVEL", "chatty");
        EXPECT_FALSE(apply_log_level_from_env());
    }
    {
        EnvGuard trace("HOMEMATCH_LOG_LEVEL", "trace");
        EXPECT_TRUE(apply_log_level_from_env());
        EXPECT_EQ(spdlog::get_level(), spdlog::level::trace);
    }

    spdlog::set_level(previous);
}
