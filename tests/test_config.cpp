#include "jb/core/config.hpp"

#include <gtest/gtest.h>

#include <map>
#include <vector>

using namespace jb;

namespace {

env_lookup from_map(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

// With nothing set every component keeps its own defaults
TEST(Config, Defaults)
{
    const auto cfg = load_app_config(from_map({}));

    EXPECT_TRUE(cfg.token.empty());
    EXPECT_EQ(cfg.lavalink.host, "127.0.0.1");
    EXPECT_EQ(cfg.lavalink.port, 2333);
    EXPECT_FALSE(cfg.lavalink.https);
    EXPECT_EQ(cfg.cache.max_files, 10u);
    EXPECT_EQ(cfg.cache.max_bytes, 500ULL * 1024 * 1024);
    EXPECT_EQ(cfg.player.idle_disconnect, std::chrono::minutes(5));
    EXPECT_EQ(cfg.player.history_size, 3u);
    EXPECT_EQ(cfg.recommender.played_history_cap, 200u);
    EXPECT_EQ(cfg.workers, 3u);
}

// Every variable overrides its field
TEST(Config, Overrides)
{
    const auto cfg = load_app_config(from_map({
        {"token", "abc.def"},
        {"JB_LAVALINK_HOST", "lavalink.internal"},
        {"JB_LAVALINK_PORT", "443"},
        {"JB_LAVALINK_HTTPS", "yes"},
        {"JB_LAVALINK_PASSWORD", "hunter2"},
        {"JB_LAVALINK_SESSION", "s1"},
        {"JB_CACHE_DIR", "/tmp/jb-cache"},
        {"JB_CACHE_MAX_FILES", "25"},
        {"JB_CACHE_MAX_MB", "64"},
        {"JB_IDLE_DISCONNECT_SECONDS", "90"},
        {"JB_WORKERS", "8"},
    }));

    EXPECT_EQ(cfg.token, "abc.def");
    EXPECT_EQ(cfg.lavalink.host, "lavalink.internal");
    EXPECT_EQ(cfg.lavalink.port, 443);
    EXPECT_TRUE(cfg.lavalink.https);
    EXPECT_EQ(cfg.lavalink.password, "hunter2");
    EXPECT_EQ(cfg.lavalink.session_id, "s1");
    EXPECT_EQ(cfg.cache.directory, std::filesystem::path("/tmp/jb-cache"));
    EXPECT_EQ(cfg.cache.max_files, 25u);
    EXPECT_EQ(cfg.cache.max_bytes, 64ULL * 1024 * 1024);
    EXPECT_EQ(cfg.player.idle_disconnect, std::chrono::seconds(90));
    EXPECT_EQ(cfg.workers, 8u);
}

// Bad values are reported and the default stays
TEST(Config, InvalidValuesKeepDefaults)
{
    std::vector<std::string> warnings;
    const logger log([&warnings](dpp::loglevel, const std::string& msg) { warnings.push_back(msg); });

    const auto cfg = load_app_config(from_map({
        {"JB_LAVALINK_PORT", "70000"},
        {"JB_LAVALINK_HTTPS", "maybe"},
        {"JB_CACHE_MAX_FILES", "12abc"},
        {"JB_CACHE_MAX_MB", "-5"},
        {"JB_IDLE_DISCONNECT_SECONDS", "soon"},
        {"JB_WORKERS", "0"},
    }), log);

    EXPECT_EQ(cfg.lavalink.port, 2333);
    EXPECT_FALSE(cfg.lavalink.https);
    EXPECT_EQ(cfg.cache.max_files, 10u);
    EXPECT_EQ(cfg.cache.max_bytes, 500ULL * 1024 * 1024);
    EXPECT_EQ(cfg.player.idle_disconnect, std::chrono::minutes(5));
    EXPECT_EQ(cfg.workers, 3u);
    EXPECT_EQ(warnings.size(), 6u);
}

// Empty strings count as unset
TEST(Config, EmptyValuesIgnored)
{
    std::vector<std::string> warnings;
    const logger log([&warnings](dpp::loglevel, const std::string& msg) { warnings.push_back(msg); });

    const auto cfg = load_app_config(from_map({{"JB_LAVALINK_HOST", ""}, {"JB_WORKERS", ""}}), log);

    EXPECT_EQ(cfg.lavalink.host, "127.0.0.1");
    EXPECT_EQ(cfg.workers, 3u);
    EXPECT_TRUE(warnings.empty());
}

// Boolean flags accept the usual spellings
TEST(Config, FlagSpellings)
{
    for (const char* on : {"1", "true", "TRUE", "on", "Yes"}) {
        EXPECT_TRUE(load_app_config(from_map({{"JB_LAVALINK_HTTPS", on}})).lavalink.https) << on;
    }
    for (const char* off : {"0", "false", "off", "NO"}) {
        EXPECT_FALSE(load_app_config(from_map({{"JB_LAVALINK_HTTPS", off}})).lavalink.https) << off;
    }
}
