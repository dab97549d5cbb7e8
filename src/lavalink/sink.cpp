#include "jb/lavalink/sink.hpp"

#include <sstream>
#include <utility>

namespace jb::lavalink {

namespace {

// Lavalink may not report the new track on the first poll after a PATCH.
constexpr auto start_grace = std::chrono::seconds(3);
constexpr int  max_poll_failures = 3;

} // namespace

sink::sink(node& lavalink, dpp::snowflake guild_id, logger log,
           std::chrono::milliseconds poll_interval)
    : m_node(lavalink)
    , m_guild_id(guild_id)
    , m_log(std::move(log))
    , m_poll_interval(poll_interval)
{
    m_watcher = std::thread([this] { watch(); });
}

sink::~sink()
{
    close();
}

void sink::close()
{
    completion pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) {
            return;
        }
        m_open = false;
        pending = take_completion_locked();
    }
    m_cv.notify_all();

    if (m_watcher.joinable() && m_watcher.get_id() != std::this_thread::get_id()) {
        m_watcher.join();
    }
    if (pending) {
        pending("voice connection closed");
    }
}

sink::completion sink::take_completion_locked()
{
    completion cb = std::move(m_on_complete);
    m_on_complete = nullptr;
    m_active      = false;
    m_paused      = false;
    m_seen_track  = false;
    m_failures    = 0;
    return cb;
}

bool sink::is_connected() const
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) {
            return false;
        }
    }
    return m_node.has_voice(m_guild_id);
}

bool sink::play(const std::string& source, std::int64_t start_ms, completion on_complete)
{
    const load_result loaded = m_node.load_tracks(source);
    if (loaded.tracks.empty() || loaded.tracks.front().encoded.empty()) {
        std::ostringstream oss;
        oss << "[Lavalink] Nothing playable at " << source << " for guild " << m_guild_id;
        if (!loaded.error_message.empty()) {
            oss << ": " << loaded.error_message;
        }
        m_log.log(dpp::ll_warning, oss.str());
        return false;
    }

    int volume = 100;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) {
            return false;
        }
        volume = m_volume;
    }

    if (!m_node.play(m_guild_id, loaded.tracks.front().encoded, false, start_ms, volume)) {
        return false;
    }

    completion replaced;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        replaced = take_completion_locked();
        m_on_complete = std::move(on_complete);
        m_active      = true;
        m_started     = std::chrono::steady_clock::now();
        ++m_play_id;
    }
    m_cv.notify_all();

    if (replaced) {
        replaced("");
    }
    return true;
}

void sink::stop()
{
    completion pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending = take_completion_locked();
    }

    if (!m_node.stop(m_guild_id)) {
        m_log.log(dpp::ll_warning, "[Lavalink] Stop failed for guild " + m_guild_id.str());
    }
    if (pending) {
        pending("");
    }
}

bool sink::pause()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active || m_paused) {
            return false;
        }
    }
    if (!m_node.pause(m_guild_id, true)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paused = m_active;
    return m_paused;
}

bool sink::resume()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active || !m_paused) {
            return false;
        }
    }
    if (!m_node.pause(m_guild_id, false)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paused = false;
    return m_active;
}

bool sink::is_playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active && !m_paused;
}

bool sink::is_paused() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active && m_paused;
}

void sink::set_volume(int percent)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_volume = percent;
    }
    if (!m_node.set_volume(m_guild_id, percent)) {
        m_log.log(dpp::ll_warning, "[Lavalink] Volume change failed for guild " + m_guild_id.str());
    }
}

void sink::watch()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_open) {
        m_cv.wait_for(lock, m_poll_interval);
        if (!m_open) {
            break;
        }
        if (!m_active || m_paused) {
            continue;
        }

        const std::uint64_t play_id = m_play_id;
        lock.unlock();
        const auto state = m_node.get_player(m_guild_id);
        lock.lock();

        if (!m_open || !m_active || play_id != m_play_id) {
            continue;
        }

        std::string error;
        if (!state) {
            if (++m_failures < max_poll_failures) {
                continue;
            }
            error = "Lavalink player unavailable";
        } else {
            m_failures = 0;
            if (state->has_track) {
                m_seen_track = true;
                continue;
            }
            if (!m_seen_track && std::chrono::steady_clock::now() - m_started < start_grace) {
                continue;
            }
        }

        completion done = take_completion_locked();
        lock.unlock();
        if (!error.empty()) {
            m_log.log(dpp::ll_warning, "[Lavalink] " + error + " for guild " + m_guild_id.str());
        }
        if (done) {
            done(error);
        }
        lock.lock();
    }
}

} // namespace jb::lavalink
