#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/snowflake.h>

#include "jb/core/event_loop.hpp"
#include "jb/core/logger.hpp"
#include "jb/core/worker_pool.hpp"
#include "jb/music/audio_sink.hpp"
#include "jb/music/prefetch_cache.hpp"
#include "jb/music/rating_store.hpp"
#include "jb/music/recommender.hpp"
#include "jb/music/resolver.hpp"
#include "jb/music/session_player.hpp"

namespace jb::music {

// Owns one session_player per guild, created on first use, and routes
// commands from the gateway layer to it.
class session_registry {
public:
    struct dependencies {
        track_resolver&     resolver;
        catalog&            catalog_source;
        const rating_store& ratings;
        prefetch_cache&     cache;
        voice_gateway&      voice;
        core::event_loop&   loop;
        core::worker_pool&  pool;
    };

    session_registry(dependencies deps, player_config player_cfg = {},
                     recommender_config recommender_cfg = {}, logger log = {},
                     session_player::clock_fn now = {});
    ~session_registry();

    session_registry(const session_registry&) = delete;
    session_registry& operator=(const session_registry&) = delete;

    std::shared_ptr<session_player> get(dpp::snowflake key);
    std::size_t size() const;

    // Joins `channel_id`, or moves there if connected elsewhere.
    bool connect(dpp::snowflake key, dpp::snowflake channel_id);
    void disconnect(dpp::snowflake key);
    bool is_connected(dpp::snowflake key);
    std::optional<dpp::snowflake> connected_channel(dpp::snowflake key) const;

    // The bot was removed from voice by someone else. False when no
    // connection was known for `key`.
    bool handle_forced_disconnect(dpp::snowflake key);

    std::size_t enqueue(dpp::snowflake key, track t);
    play_result play_next(dpp::snowflake key);

    // Starts playback unless something is already playing.
    play_result start_if_idle(dpp::snowflake key);

    bool skip(dpp::snowflake key);
    bool pause(dpp::snowflake key);
    bool resume(dpp::snowflake key);
    bool toggle_autoplay(dpp::snowflake key);
    void clear_history(dpp::snowflake key);
    std::size_t shuffle_queue(dpp::snowflake key);

    std::vector<track>   get_queue(dpp::snowflake key);
    std::vector<track>   get_autoplay_queue(dpp::snowflake key);
    std::optional<track> get_current_track(dpp::snowflake key);
    bool is_playing(dpp::snowflake key);
    bool is_paused(dpp::snowflake key);
    bool autoplay_enabled(dpp::snowflake key);
    std::optional<std::int64_t> elapsed_seconds(dpp::snowflake key);

    int set_volume(dpp::snowflake key, int percent);
    int get_volume(dpp::snowflake key);

    bool play_audio_file(dpp::snowflake key, const std::string& path,
                         std::function<void(bool)> on_done = {});

    // Tears every session down; used on shutdown.
    void disconnect_all();

private:
    dependencies             m_deps;
    player_config            m_player_cfg;
    recommender_config       m_recommender_cfg;
    logger                   m_log;
    session_player::clock_fn m_now;

    mutable std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::shared_ptr<session_player>> m_sessions;
    std::unordered_map<dpp::snowflake, dpp::snowflake>                  m_channels;
};

} // namespace jb::music
