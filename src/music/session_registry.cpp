#include "jb/music/session_registry.hpp"

#include <sstream>

namespace jb::music {

session_registry::session_registry(dependencies deps, player_config player_cfg,
                                   recommender_config recommender_cfg, logger log,
                                   session_player::clock_fn now)
    : m_deps(deps)
    , m_player_cfg(player_cfg)
    , m_recommender_cfg(recommender_cfg)
    , m_log(std::move(log))
    , m_now(std::move(now))
{
}

session_registry::~session_registry()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [key, session] : m_sessions) {
        (void)key;
        session->on_idle({});
    }
}

std::shared_ptr<session_player> session_registry::get(dpp::snowflake key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(key);
    if (it != m_sessions.end()) {
        return it->second;
    }

    auto rec = std::make_unique<recommender>(m_deps.catalog_source, m_deps.ratings, key,
                                             m_recommender_cfg, m_log);
    auto session = std::make_shared<session_player>(
        key,
        session_player::services{m_deps.resolver, m_deps.cache, m_deps.loop, m_deps.pool},
        std::move(rec), m_player_cfg, m_log, m_now);

    session->on_idle([this](dpp::snowflake idle_key) {
        disconnect(idle_key);
    });

    m_sessions.emplace(key, session);
    m_log.log(dpp::ll_debug, "[Registry] Created session for guild " + key.str());
    return session;
}

std::size_t session_registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

bool session_registry::connect(dpp::snowflake key, dpp::snowflake channel_id)
{
    auto session = get(key);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(key);
        if (it != m_channels.end() && it->second == channel_id && session->is_connected()) {
            return true;
        }
    }

    auto sink = m_deps.voice.join(key, channel_id);
    if (!sink) {
        std::ostringstream oss;
        oss << "[Registry] Could not join channel " << channel_id << " in guild " << key;
        m_log.log(dpp::ll_warning, oss.str());
        return false;
    }

    session->attach(std::move(sink));

    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels[key] = channel_id;
    return true;
}

void session_registry::disconnect(dpp::snowflake key)
{
    // Forget the channel first so the resulting voice state update is not
    // mistaken for a forced removal.
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channels.erase(key);
    }

    get(key)->disconnect();
    m_deps.voice.leave(key);
}

bool session_registry::handle_forced_disconnect(dpp::snowflake key)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_channels.erase(key) == 0) {
            return false;
        }
    }

    m_log.log(dpp::ll_info, "[Registry] Removed from voice in guild " + key.str());
    get(key)->disconnect();
    m_deps.voice.leave(key);
    return true;
}

bool session_registry::is_connected(dpp::snowflake key)
{
    return get(key)->is_connected();
}

std::optional<dpp::snowflake> session_registry::connected_channel(dpp::snowflake key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_channels.find(key);
    if (it == m_channels.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t session_registry::enqueue(dpp::snowflake key, track t)
{
    return get(key)->enqueue(std::move(t));
}

play_result session_registry::play_next(dpp::snowflake key)
{
    return get(key)->play_next();
}

play_result session_registry::start_if_idle(dpp::snowflake key)
{
    return get(key)->play_if_idle();
}

bool session_registry::skip(dpp::snowflake key)
{
    return get(key)->skip();
}

bool session_registry::pause(dpp::snowflake key)
{
    return get(key)->pause();
}

bool session_registry::resume(dpp::snowflake key)
{
    return get(key)->resume();
}

bool session_registry::toggle_autoplay(dpp::snowflake key)
{
    return get(key)->toggle_autoplay();
}

void session_registry::clear_history(dpp::snowflake key)
{
    get(key)->clear_history();
}

std::size_t session_registry::shuffle_queue(dpp::snowflake key)
{
    return get(key)->shuffle_queue();
}

std::vector<track> session_registry::get_queue(dpp::snowflake key)
{
    return get(key)->get_queue();
}

std::vector<track> session_registry::get_autoplay_queue(dpp::snowflake key)
{
    return get(key)->get_autoplay_queue();
}

std::optional<track> session_registry::get_current_track(dpp::snowflake key)
{
    return get(key)->current_track();
}

bool session_registry::is_playing(dpp::snowflake key)
{
    return get(key)->is_playing();
}

bool session_registry::is_paused(dpp::snowflake key)
{
    return get(key)->is_paused();
}

bool session_registry::autoplay_enabled(dpp::snowflake key)
{
    return get(key)->autoplay_enabled();
}

std::optional<std::int64_t> session_registry::elapsed_seconds(dpp::snowflake key)
{
    return get(key)->elapsed_seconds();
}

int session_registry::set_volume(dpp::snowflake key, int percent)
{
    return get(key)->set_volume(percent);
}

int session_registry::get_volume(dpp::snowflake key)
{
    return get(key)->get_volume();
}

bool session_registry::play_audio_file(dpp::snowflake key, const std::string& path,
                                       std::function<void(bool)> on_done)
{
    return get(key)->play_audio_file(path, std::move(on_done));
}

void session_registry::disconnect_all()
{
    std::vector<dpp::snowflake> keys;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, session] : m_sessions) {
            (void)session;
            keys.push_back(key);
        }
    }
    for (const auto& key : keys) {
        disconnect(key);
    }
}

} // namespace jb::music
