#include "jb/lavalink/client.hpp"

#include <sstream>
#include <future>
#include <map>

namespace jb::lavalink {

namespace {

const char* method_name(dpp::http_method method)
{
    switch (method) {
        case dpp::m_post:   return "POST";
        case dpp::m_patch:  return "PATCH";
        case dpp::m_delete: return "DELETE";
        case dpp::m_put:    return "PUT";
        default:            return "GET";
    }
}

track_info parse_track(const json& el)
{
    track_info t;
    t.encoded = el.value("encoded", "");

    if (el.contains("info") && el["info"].is_object()) {
        const auto& info = el["info"];
        t.identifier = info.value("identifier", "");
        t.title      = info.value("title", "");
        t.author     = info.value("author", "");
        t.uri        = info.value("uri", "");
        t.length_ms  = info.value("length", static_cast<std::int64_t>(0));
        t.is_stream  = info.value("isStream", false);
        t.source     = info.value("sourceName", "");

        // artworkUrl is null for sources without thumbnails
        if (info.contains("artworkUrl") && info["artworkUrl"].is_string()) {
            t.artwork_url = info["artworkUrl"].get<std::string>();
        }
    }
    return t;
}

} // namespace

load_result parse_load_result(const std::string& body)
{
    load_result res;

    if (body.empty()) {
        res.type = load_type::empty;
        return res;
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception& e) {
        res.type = load_type::error;
        res.error_message = std::string("Failed to parse Lavalink response: ") + e.what();
        return res;
    }

    if (!j.is_object()) {
        res.type = load_type::error;
        res.error_message = "Lavalink response is not an object";
        return res;
    }

    const std::string load_type_str = j.value("loadType", "");
    const json data = j.contains("data") ? j["data"] : json();

    try {
        if (load_type_str == "track") {
            res.type = load_type::track;
            if (data.is_object()) {
                res.tracks.push_back(parse_track(data));
            }
        } else if (load_type_str == "search") {
            res.type = load_type::search;
            if (data.is_array()) {
                for (const auto& el : data) {
                    res.tracks.push_back(parse_track(el));
                }
            }
        } else if (load_type_str == "playlist") {
            res.type = load_type::playlist;
            if (data.is_object()) {
                if (data.contains("info") && data["info"].is_object()) {
                    res.playlist_name = data["info"].value("name", "");
                }
                if (data.contains("tracks") && data["tracks"].is_array()) {
                    for (const auto& el : data["tracks"]) {
                        res.tracks.push_back(parse_track(el));
                    }
                }
            }
        } else if (load_type_str == "empty") {
            res.type = load_type::empty;
        } else if (load_type_str == "error") {
            res.type = load_type::error;
            if (data.is_object()) {
                res.error_message = data.value("message", "Unknown Lavalink error");
                if (data.contains("cause") && data["cause"].is_string()) {
                    res.error_message += " (" + data["cause"].get<std::string>() + ")";
                }
            } else {
                res.error_message = "Unknown Lavalink error (no data field)";
            }
        } else {
            res.type = load_type::error;
            res.error_message = "Unknown loadType: " + load_type_str;
        }
    } catch (const std::exception& e) {
        res.type = load_type::error;
        res.tracks.clear();
        res.error_message = std::string("Malformed Lavalink track data: ") + e.what();
    }

    return res;
}

std::optional<player_state> parse_player_state(const std::string& body)
{
    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (!j.is_object() || !j.contains("guildId")) {
        return std::nullopt;
    }

    player_state ps;
    try {
        if (j.contains("track") && j["track"].is_object()) {
            ps.has_track     = true;
            ps.track_encoded = j["track"].value("encoded", "");
        }
        ps.paused = j.value("paused", false);
        ps.volume = j.value("volume", 100);

        if (j.contains("state") && j["state"].is_object()) {
            const auto& state = j["state"];
            ps.position_ms = state.value("position", static_cast<std::int64_t>(0));
            ps.connected   = state.value("connected", false);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return ps;
}

node::node(dpp::cluster& cluster, const node_config& cfg, logger log)
    : m_cluster(cluster)
    , m_cfg(cfg)
    , m_log(std::move(log))
{
    std::ostringstream oss;
    oss << "[Lavalink] Initialising node at "
        << (m_cfg.https ? "https://" : "http://")
        << m_cfg.host << ":" << m_cfg.port
        << " with session_id='" << m_cfg.session_id << "'";
    m_log.log(dpp::ll_info, oss.str());
}

void node::handle_voice_state_update(const dpp::voice_state_update_t& ev)
{
    // Only cache our own bot's voice state
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_voice_mutex);
    if (ev.state.channel_id.empty()) {
        m_voice_states.erase(ev.state.guild_id);
        return;
    }

    auto& vs = m_voice_states[ev.state.guild_id];
    vs.session_id = ev.state.session_id;
    m_voice_cv.notify_all();

    std::ostringstream oss;
    oss << "[Lavalink] Cached voice_state for guild " << ev.state.guild_id
        << " session_id=" << vs.session_id;
    m_log.log(dpp::ll_debug, oss.str());
}

void node::handle_voice_server_update(const dpp::voice_server_update_t& ev)
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.guild_id];
    vs.token    = ev.token;
    vs.endpoint = ev.endpoint;
    m_voice_cv.notify_all();

    std::ostringstream oss;
    oss << "[Lavalink] Cached voice_server for guild " << ev.guild_id
        << " token=" << (!vs.token.empty() ? "<set>" : "<empty>")
        << " endpoint=" << vs.endpoint;
    m_log.log(dpp::ll_debug, oss.str());
}

bool node::has_voice(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    return get_voice_state_locked(guild_id).has_value();
}

bool node::wait_for_voice(dpp::snowflake guild_id, std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_voice_mutex);
    return m_voice_cv.wait_for(lock, timeout, [this, guild_id] {
        return get_voice_state_locked(guild_id).has_value();
    });
}

void node::forget_voice(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    m_voice_states.erase(guild_id);
}

bool node::push_voice(dpp::snowflake guild_id)
{
    json payload;
    if (!add_voice(guild_id, payload)) {
        return false;
    }
    return send_player_update(guild_id, payload);
}

bool node::add_voice(dpp::snowflake guild_id, json& payload) const
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    const auto vs = get_voice_state_locked(guild_id);
    if (!vs) {
        return false;
    }
    payload["voice"] = json{
        {"token", vs->token},
        {"endpoint", vs->endpoint},
        {"sessionId", vs->session_id},
    };
    return true;
}

std::optional<node::voice_state> node::get_voice_state_locked(dpp::snowflake guild_id) const
{
    auto it = m_voice_states.find(guild_id);
    if (it == m_voice_states.end()) {
        return std::nullopt;
    }
    const auto& vs = it->second;
    if (vs.token.empty() || vs.endpoint.empty() || vs.session_id.empty()) {
        return std::nullopt;
    }
    return vs;
}

std::optional<std::string> node::http_request(dpp::http_method method,
                                              const std::string& urlpath,
                                              const std::string& body_json) const
{
    const std::string scheme   = m_cfg.https ? "https://" : "http://";
    const std::string full_url = scheme + m_cfg.host + ":" + std::to_string(m_cfg.port) + urlpath;
    const std::string verb     = method_name(method);

    std::multimap<std::string, std::string> headers;
    headers.emplace("Authorization", m_cfg.password);
    headers.emplace("User-Id",       m_cluster.me.id.str());
    headers.emplace("Client-Name",   "Jukebox");

    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_log.log(
        dpp::ll_debug,
        "[Lavalink] HTTP request: " + verb + " " + urlpath +
        " (body=" + (body_json.empty() ? "empty" : std::to_string(body_json.size()) + " bytes") + ")"
    );

    m_cluster.request(
        full_url,
        method,
        [prom](const dpp::http_request_completion_t& cc) {
            prom->set_value(cc);
        },
        body_json,
        body_json.empty() ? "" : "application/json",
        headers
    );

    const auto cc = fut.get();

    std::ostringstream oss;
    oss << "[Lavalink] HTTP " << cc.status << " on " << verb << " " << urlpath
        << " (response length=" << cc.body.size() << ")";

    if (cc.status == 0) {
        m_log.log(dpp::ll_warning, oss.str() + " (request failed)");
        return std::nullopt;
    }
    if (cc.status < 200 || cc.status >= 300) {
        m_log.log(dpp::ll_warning, oss.str() + " response: " + cc.body);
        return std::nullopt;
    }

    m_log.log(dpp::ll_debug, oss.str());
    return cc.body;
}

bool node::ensure_session()
{
    json payload;
    payload["resuming"] = true;
    payload["timeout"]  = 60;

    const std::string path = "/v4/sessions/" + m_cfg.session_id;
    m_log.log(dpp::ll_debug,
              "[Lavalink] Ensuring session '" + m_cfg.session_id + "' via PATCH " + path);

    if (!http_request(dpp::m_patch, path, payload.dump())) {
        m_log.log(dpp::ll_warning, "[Lavalink] Failed to ensure session '" + m_cfg.session_id + "'");
        return false;
    }

    m_log.log(dpp::ll_info, "[Lavalink] Session '" + m_cfg.session_id + "' ready");
    return true;
}

load_result node::load_tracks(const std::string& identifier) const
{
    m_log.log(dpp::ll_debug, "[Lavalink] Requesting /v4/loadtracks for identifier: " + identifier);

    const std::string path = "/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier);
    const auto body = http_request(dpp::m_get, path);

    if (!body) {
        load_result res;
        res.type = load_type::error;
        res.error_message = "Lavalink request failed";
        return res;
    }

    load_result res = parse_load_result(*body);

    if (res.type == load_type::error) {
        m_log.log(
            dpp::ll_warning,
            "[Lavalink] /loadtracks error for identifier '" + identifier +
            "': " + res.error_message
        );
    } else {
        std::ostringstream oss;
        oss << "[Lavalink] Loaded " << res.tracks.size()
            << " track(s) for identifier: " << identifier;
        m_log.log(dpp::ll_debug, oss.str());
    }

    return res;
}

std::string node::player_path(dpp::snowflake guild_id) const
{
    return "/v4/sessions/" + m_cfg.session_id + "/players/" + guild_id.str();
}

bool node::send_player_update(dpp::snowflake guild_id, const json& payload)
{
    if (m_cfg.session_id.empty()) {
        m_log.log(dpp::ll_warning, "[Lavalink] Cannot send player update: session id is empty");
        return false;
    }

    std::ostringstream oss;
    oss << "[Lavalink] Player update for guild " << guild_id << ": "
        << (payload.contains("voice") ? std::string("<voice credentials>") : payload.dump());
    m_log.log(dpp::ll_debug, oss.str());

    return http_request(dpp::m_patch, player_path(guild_id), payload.dump()).has_value();
}

bool node::play(dpp::snowflake guild_id,
                const std::string& encoded_track,
                bool no_replace,
                std::optional<std::int64_t> start_ms,
                std::optional<int> volume)
{
    json payload;
    payload["track"]["encoded"] = encoded_track;

    if (start_ms.has_value() && *start_ms > 0) {
        payload["position"] = *start_ms;
    }
    if (volume.has_value()) {
        payload["volume"] = *volume;
    }
    payload["paused"] = false;

    if (!add_voice(guild_id, payload)) {
        // Lavalink keeps whatever push_voice sent earlier
        m_log.log(dpp::ll_debug, "[Lavalink] No voice credentials cached for guild " + guild_id.str());
    }

    if (m_cfg.session_id.empty()) {
        m_log.log(dpp::ll_warning, "[Lavalink] Cannot play: session id is empty");
        return false;
    }

    std::ostringstream oss;
    oss << "[Lavalink] Sending play for guild " << guild_id
        << " (noReplace=" << std::boolalpha << no_replace << ")";
    m_log.log(dpp::ll_info, oss.str());

    const std::string path = player_path(guild_id) + "?noReplace=" + (no_replace ? "true" : "false");
    return http_request(dpp::m_patch, path, payload.dump()).has_value();
}

bool node::stop(dpp::snowflake guild_id)
{
    json payload;
    payload["track"]["encoded"] = nullptr;

    m_log.log(dpp::ll_info, "[Lavalink] Sending stop for guild " + guild_id.str());
    return send_player_update(guild_id, payload);
}

bool node::pause(dpp::snowflake guild_id, bool pause_flag)
{
    json payload;
    payload["paused"] = pause_flag;

    std::ostringstream oss;
    oss << "[Lavalink] Sending paused=" << std::boolalpha << pause_flag
        << " for guild " << guild_id;
    m_log.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload);
}

bool node::set_volume(dpp::snowflake guild_id, int volume_percent)
{
    json payload;
    payload["volume"] = volume_percent;

    std::ostringstream oss;
    oss << "[Lavalink] Sending volume=" << volume_percent << " for guild " << guild_id;
    m_log.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload);
}

bool node::destroy_player(dpp::snowflake guild_id)
{
    m_log.log(dpp::ll_info, "[Lavalink] Destroying player for guild " + guild_id.str());
    return http_request(dpp::m_delete, player_path(guild_id)).has_value();
}

std::optional<player_state> node::get_player(dpp::snowflake guild_id) const
{
    const auto body = http_request(dpp::m_get, player_path(guild_id));
    if (!body) {
        return std::nullopt;
    }
    return parse_player_state(*body);
}

} // namespace jb::lavalink
