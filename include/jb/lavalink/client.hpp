#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <chrono>
#include <condition_variable>
#include <unordered_map>
#include <cstdint>

#include <dpp/dpp.h>
#include <dpp/json.h>

#include "jb/core/logger.hpp"

namespace jb::lavalink {

using json = dpp::json;

struct node_config {
    std::string host = "127.0.0.1";
    uint16_t    port = 2333;
    bool        https = false;
    std::string password = "youshallnotpass";
    std::string session_id = "default"; // Lavalink v4 session id
};

struct track_info {
    std::string  encoded;
    std::string  identifier;
    std::string  title;
    std::string  author;
    std::string  uri;
    std::string  artwork_url;
    std::int64_t length_ms = 0;
    bool         is_stream = false;
    std::string  source;        // sourceName: "youtube", "http", ...
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type               type = load_type::empty;
    std::vector<track_info> tracks;
    std::string             playlist_name;
    std::string             error_message; // for load_type::error
};

// What GET /v4/sessions/{id}/players/{guild} reports.
struct player_state {
    bool         has_track   = false;
    std::string  track_encoded;
    bool         paused      = false;
    std::int64_t position_ms = 0;
    int          volume      = 100;
    bool         connected   = false;
};

// Parses a /v4/loadtracks body. Never throws.
load_result parse_load_result(const std::string& body);

// Parses a player object; nullopt when the body is not one.
std::optional<player_state> parse_player_state(const std::string& body);

class node {
public:
    node(dpp::cluster& cluster, const node_config& cfg, logger log);

    // Hook these from your bot:
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    // True once both halves of the voice handshake arrived for `guild_id`.
    bool has_voice(dpp::snowflake guild_id) const;

    // Blocks until has_voice() or the timeout. The updates arrive on the
    // gateway thread, so this must not run there.
    bool wait_for_voice(dpp::snowflake guild_id, std::chrono::milliseconds timeout) const;
    void forget_voice(dpp::snowflake guild_id);

    // Sends the cached voice credentials without touching the track.
    bool push_voice(dpp::snowflake guild_id);

    // PATCH /v4/sessions/{sessionId}; call after the cluster is running.
    bool ensure_session();

    // Track lookup
    load_result load_tracks(const std::string& identifier) const;

    // Player controls
    bool play(dpp::snowflake guild_id,
              const std::string& encoded_track,
              bool no_replace = false,
              std::optional<std::int64_t> start_ms = std::nullopt,
              std::optional<int> volume = std::nullopt);

    bool stop(dpp::snowflake guild_id);
    bool pause(dpp::snowflake guild_id, bool pause_flag);
    bool set_volume(dpp::snowflake guild_id, int volume_percent);
    bool destroy_player(dpp::snowflake guild_id);

    std::optional<player_state> get_player(dpp::snowflake guild_id) const;

    const node_config& config() const { return m_cfg; }

private:
    struct voice_state {
        std::string session_id;      // Discord voice session id
        std::string token;
        std::string endpoint;
    };

    dpp::cluster& m_cluster;
    node_config   m_cfg;
    logger        m_log;

    mutable std::mutex m_voice_mutex;
    mutable std::condition_variable m_voice_cv;
    std::unordered_map<dpp::snowflake, voice_state> m_voice_states;

    // Blocks until the response arrives. Returns nullopt on transport
    // failure or a non-2xx status; the body otherwise (possibly empty).
    std::optional<std::string> http_request(dpp::http_method method,
                                            const std::string& urlpath,
                                            const std::string& body_json = "") const;

    std::optional<voice_state> get_voice_state_locked(dpp::snowflake guild_id) const;

    // Copies complete voice credentials into payload["voice"].
    bool add_voice(dpp::snowflake guild_id, json& payload) const;

    bool send_player_update(dpp::snowflake guild_id, const json& payload);

    std::string player_path(dpp::snowflake guild_id) const;
};

} // namespace jb::lavalink
