#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "jb/core/logger.hpp"
#include "jb/lavalink/client.hpp"
#include "jb/music/prefetch_cache.hpp"
#include "jb/music/recommender.hpp"
#include "jb/music/session_player.hpp"

namespace jb {

struct app_config {
    std::string                token;
    lavalink::node_config      lavalink;
    music::cache_config        cache;
    music::player_config       player;
    music::recommender_config  recommender;
    std::size_t                workers = 3;
};

// Returns the value of an environment variable, or nullopt when unset.
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

// Builds the configuration from the environment. Values that do not parse
// keep their default and are reported through `log`.
app_config load_app_config(const env_lookup& env = process_env, const logger& log = {});

} // namespace jb
