#include "jb/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace jb {

namespace {

template <typename T>
void read_number(const env_lookup& env, const logger& log, const std::string& name,
                 T& target, long long min_value, long long max_value)
{
    const auto raw = env(name);
    if (!raw || raw->empty()) {
        return;
    }

    long long value = 0;
    try {
        std::size_t used = 0;
        value = std::stoll(*raw, &used);
        if (used != raw->size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        log.log(dpp::ll_warning, "[Config] " + name + "='" + *raw + "' is not a number, keeping default");
        return;
    }

    if (value < min_value || value > max_value) {
        log.log(dpp::ll_warning, "[Config] " + name + "=" + *raw + " is out of range, keeping default");
        return;
    }
    target = static_cast<T>(value);
}

void read_string(const env_lookup& env, const std::string& name, std::string& target)
{
    const auto raw = env(name);
    if (raw && !raw->empty()) {
        target = *raw;
    }
}

void read_flag(const env_lookup& env, const logger& log, const std::string& name, bool& target)
{
    const auto raw = env(name);
    if (!raw || raw->empty()) {
        return;
    }

    std::string lower(*raw);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        target = true;
    } else if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        target = false;
    } else {
        log.log(dpp::ll_warning, "[Config] " + name + "='" + *raw + "' is not a boolean, keeping default");
    }
}

} // namespace

std::optional<std::string> process_env(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

app_config load_app_config(const env_lookup& env, const logger& log)
{
    app_config cfg;

    read_string(env, "token", cfg.token);

    read_string(env, "JB_LAVALINK_HOST", cfg.lavalink.host);
    read_number(env, log, "JB_LAVALINK_PORT", cfg.lavalink.port, 1, 65535);
    read_flag(env, log, "JB_LAVALINK_HTTPS", cfg.lavalink.https);
    read_string(env, "JB_LAVALINK_PASSWORD", cfg.lavalink.password);
    read_string(env, "JB_LAVALINK_SESSION", cfg.lavalink.session_id);

    std::string cache_dir;
    read_string(env, "JB_CACHE_DIR", cache_dir);
    if (!cache_dir.empty()) {
        cfg.cache.directory = cache_dir;
    }
    read_number(env, log, "JB_CACHE_MAX_FILES", cfg.cache.max_files, 1, 100000);

    long long max_mb = -1;
    read_number(env, log, "JB_CACHE_MAX_MB", max_mb, 1, 1024 * 1024);
    if (max_mb > 0) {
        cfg.cache.max_bytes = static_cast<std::uint64_t>(max_mb) * 1024 * 1024;
    }

    long long idle_seconds = -1;
    read_number(env, log, "JB_IDLE_DISCONNECT_SECONDS", idle_seconds, 1, 24 * 60 * 60);
    if (idle_seconds > 0) {
        cfg.player.idle_disconnect = std::chrono::seconds(idle_seconds);
    }

    read_number(env, log, "JB_WORKERS", cfg.workers, 1, 64);

    return cfg;
}

} // namespace jb
