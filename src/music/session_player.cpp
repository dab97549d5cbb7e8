#include "jb/music/session_player.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <random>
#include <sstream>

namespace jb::music {

int clamp_volume(int percent)
{
    return std::clamp(percent, 0, 1000);
}

session_player::session_player(dpp::snowflake key, services svc, std::unique_ptr<recommender> rec,
                               player_config cfg, logger log, clock_fn now)
    : m_key(key)
    , m_resolver(svc.resolver)
    , m_cache(svc.cache)
    , m_loop(svc.loop)
    , m_pool(svc.pool)
    , m_recommender(std::move(rec))
    , m_cfg(cfg)
    , m_log(std::move(log))
    , m_now(now ? std::move(now) : clock_fn([]() { return clock::now(); }))
    , m_volume(clamp_volume(cfg.default_volume))
{
}

session_player::~session_player()
{
    if (m_disconnect_timer) {
        m_loop.cancel(*m_disconnect_timer);
    }
    if (m_retry_timer) {
        m_loop.cancel(*m_retry_timer);
    }
    m_refill.cancel();
}

void session_player::on_idle(idle_fn fn)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_idle = std::move(fn);
}

void session_player::attach(std::shared_ptr<audio_sink> sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = std::move(sink);
    if (m_sink) {
        m_sink->set_volume(m_volume);
    }
}

bool session_player::is_connected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sink && m_sink->is_connected();
}

std::size_t session_player::enqueue(track t)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.push_back(std::move(t));
    return m_queue.size();
}

// ---------- play_next ----------

play_result session_player::play_next()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return play_next_locked();
}

play_result session_player::play_next_locked()
{
    cancel_disconnect_timer_locked();
    cancel_retry_locked();

    if (!m_sink || !m_sink->is_connected()) {
        m_log.log(dpp::ll_debug, "[Player] No voice connection for guild " + m_key.str());
        return {play_status::disconnected, std::nullopt};
    }

    auto next = next_candidate_locked();
    if (!next) {
        m_current.reset();
        freeze_elapsed_locked();
        m_suspended.reset();
        start_disconnect_timer_locked();
        m_log.log(dpp::ll_info, "[Player] Nothing left to play in guild " + m_key.str());
        return {play_status::exhausted, std::nullopt};
    }

    m_current = *next;
    remember_locked(next->identifier);
    m_recommender->mark_played(next->identifier);

    const auto source = acquire_source_locked(*next);
    if (!source || !start_sink_locked(*next, *source, 0)) {
        std::ostringstream oss;
        oss << "[Player] Cannot play '" << next->title << "' (" << next->identifier
            << ") in guild " << m_key << ", skipping";
        m_log.log(dpp::ll_warning, oss.str());

        m_cache.remove(next->identifier);
        m_current.reset();
        freeze_elapsed_locked();
        start_disconnect_timer_locked();
        return {play_status::acquisition_failed, next};
    }

    m_current = *next;
    m_started_at = m_now();
    m_paused_at.reset();
    m_paused_total = clock::duration::zero();
    m_suspended.reset();

    if (m_autoplay) {
        start_refill_locked();
    }
    prefetch_upcoming_locked();

    std::ostringstream oss;
    oss << "[Player] Now playing '" << next->title << "' in guild " << m_key
        << (next->local_path ? " from cache" : " from stream");
    m_log.log(dpp::ll_info, oss.str());

    return {play_status::played, next};
}

play_result session_player::play_until_started()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return play_until_started_locked();
}

play_result session_player::play_if_idle()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sink && (m_sink->is_playing() || m_sink->is_paused())) {
        return {play_status::played, m_current};
    }
    return play_until_started_locked();
}

play_result session_player::play_until_started_locked()
{
    play_result result = play_next_locked();
    for (std::size_t attempt = 1;
         result.status == play_status::acquisition_failed && attempt < m_cfg.max_play_attempts;
         ++attempt) {
        result = play_next_locked();
    }

    const bool more = !m_queue.empty() || (m_autoplay && !m_autoplay_buffer.empty());
    if (result.status == play_status::acquisition_failed && more) {
        schedule_retry_locked();
    }
    return result;
}

std::optional<track> session_player::next_candidate_locked()
{
    if (!m_queue.empty()) {
        track t = std::move(m_queue.front());
        m_queue.pop_front();
        return t;
    }

    if (!m_autoplay) {
        return std::nullopt;
    }

    if (!m_autoplay_buffer.empty()) {
        track t = std::move(m_autoplay_buffer.front());
        m_autoplay_buffer.pop_front();
        return t;
    }

    if (m_current || !m_recent.empty()) {
        return fetch_fallback_locked();
    }
    return std::nullopt;
}

std::optional<track> session_player::fetch_fallback_locked()
{
    if (m_recent.empty()) {
        return std::nullopt;
    }

    const std::vector<std::string> recent(m_recent.begin(), m_recent.end());
    try {
        for (const auto& candidate : m_recommender->blended_recommendations(recent, m_cfg.blended_limit)) {
            auto resolved = m_resolver.resolve(candidate.identifier);
            if (resolved.ok()) {
                m_log.log(dpp::ll_debug, "[Autoplay] Fallback pick " + candidate.identifier);
                return resolved.value;
            }
        }
    } catch (const std::exception& e) {
        m_log.log(dpp::ll_error, std::string("[Autoplay] Fallback lookup threw: ") + e.what());
    }
    return std::nullopt;
}

void session_player::remember_locked(const std::string& identifier)
{
    if (identifier.empty()) {
        return;
    }
    m_recent.erase(std::remove(m_recent.begin(), m_recent.end(), identifier), m_recent.end());
    m_recent.push_back(identifier);
    while (m_recent.size() > m_cfg.history_size) {
        m_recent.pop_front();
    }
}

// Runs on the scheduler thread, so it only takes a file that is already
// there. A miss streams; prefetch fills the cache for later tracks.
std::optional<std::string> session_player::acquire_source_locked(track& t)
{
    if (auto path = m_cache.cached_path(t.identifier)) {
        t.local_path = path->string();
        return t.local_path;
    }
    if (is_network_url(t.stream_url)) {
        return t.stream_url;
    }
    return std::nullopt;
}

bool session_player::start_sink_locked(const track& t, const std::string& source, std::int64_t start_ms)
{
    const std::uint64_t generation = ++m_generation;
    std::weak_ptr<session_player> weak = weak_from_this();
    core::event_loop& loop = m_loop;
    const std::string identifier = t.identifier;

    return m_sink->play(source, start_ms,
        [weak, generation, identifier, &loop](const std::string& error) {
            loop.post([weak, generation, identifier, error]() {
                if (auto self = weak.lock()) {
                    self->on_track_finished(generation, identifier, error);
                }
            });
        });
}

void session_player::on_track_finished(std::uint64_t generation, const std::string& identifier,
                                       const std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
        if (!error.empty()) {
            m_log.log(dpp::ll_warning,
                      "[Player] Playback of " + identifier + " ended with error: " + error);
        }
    }

    m_cache.remove(identifier);
    play_until_started();
}

// ---------- background work ----------

void session_player::start_refill_locked()
{
    if (m_refill.pending() || m_autoplay_buffer.size() >= m_cfg.autoplay_target) {
        return;
    }

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    std::weak_ptr<session_player> weak = weak_from_this();
    const std::size_t target = m_cfg.autoplay_target;

    auto done = m_pool.submit([weak, cancelled, target]() {
        if (auto self = weak.lock()) {
            self->refill_autoplay_buffer(target, cancelled);
        }
    });
    m_refill = core::background_task{cancelled, done.share()};
}

void session_player::prefetch_upcoming_locked()
{
    std::size_t n = 0;
    for (const auto& t : m_queue) {
        if (n++ >= m_cfg.queue_prefetch_depth) {
            break;
        }
        m_cache.start_background_download(t);
    }

    n = 0;
    for (const auto& t : m_autoplay_buffer) {
        if (n++ >= m_cfg.autoplay_prefetch_depth) {
            break;
        }
        m_cache.start_background_download(t);
    }
}

std::size_t session_player::refill_autoplay_buffer(std::size_t target_count,
                                                   const std::shared_ptr<std::atomic<bool>>& cancelled)
{
    auto is_cancelled = [&cancelled]() { return cancelled && cancelled->load(); };
    auto buffered = [this](const std::string& identifier) {
        return std::any_of(m_autoplay_buffer.begin(), m_autoplay_buffer.end(),
                           [&identifier](const track& t) { return t.identifier == identifier; });
    };

    std::vector<std::string> recent;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (is_cancelled() || m_recent.empty() || m_autoplay_buffer.size() >= target_count) {
            return 0;
        }
        recent.assign(m_recent.begin(), m_recent.end());
    }

    std::size_t added = 0;
    try {
        const auto candidates = m_recommender->blended_recommendations(recent, target_count + 2);
        for (const auto& candidate : candidates) {
            if (is_cancelled()) {
                break;
            }
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_autoplay_buffer.size() >= target_count) {
                    break;
                }
                if (buffered(candidate.identifier)) {
                    continue;
                }
            }

            // resolution runs unlocked
            auto resolved = m_resolver.resolve(candidate.identifier);
            if (!resolved.ok()) {
                m_log.log(dpp::ll_debug, "[Autoplay] Could not resolve " + candidate.identifier);
                continue;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            if (is_cancelled() || m_autoplay_buffer.size() >= target_count) {
                break;
            }
            if (buffered(resolved.value->identifier)) {
                continue;
            }
            m_autoplay_buffer.push_back(std::move(*resolved.value));
            ++added;
        }
    } catch (const std::exception& e) {
        m_log.log(dpp::ll_error, std::string("[Autoplay] Refill threw: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (added > 0 && !is_cancelled()) {
        std::size_t n = 0;
        for (const auto& t : m_autoplay_buffer) {
            if (n++ >= m_cfg.autoplay_prefetch_depth) {
                break;
            }
            m_cache.start_background_download(t);
        }
    }

    std::ostringstream oss;
    oss << "[Autoplay] Added " << added << " track(s) for guild " << m_key
        << " (buffer " << m_autoplay_buffer.size() << "/" << target_count << ")";
    m_log.log(dpp::ll_debug, oss.str());
    return added;
}

// ---------- disconnect timer ----------

void session_player::start_disconnect_timer_locked()
{
    cancel_disconnect_timer_locked();

    const std::uint64_t token = ++m_idle_token;
    std::weak_ptr<session_player> weak = weak_from_this();
    m_disconnect_timer = m_loop.post_after(m_cfg.idle_disconnect, [weak, token]() {
        if (auto self = weak.lock()) {
            self->on_idle_timeout(token);
        }
    });
}

void session_player::cancel_disconnect_timer_locked()
{
    if (m_disconnect_timer) {
        m_loop.cancel(*m_disconnect_timer);
        m_disconnect_timer.reset();
    }
}

void session_player::schedule_retry_locked()
{
    cancel_retry_locked();

    const std::uint64_t token = ++m_retry_token;
    std::weak_ptr<session_player> weak = weak_from_this();
    m_retry_timer = m_loop.post_after(m_cfg.retry_delay, [weak, token]() {
        if (auto self = weak.lock()) {
            self->on_retry(token);
        }
    });

    std::ostringstream oss;
    oss << "[Player] Retrying guild " << m_key << " in " << m_cfg.retry_delay.count() << " ms";
    m_log.log(dpp::ll_debug, oss.str());
}

void session_player::cancel_retry_locked()
{
    if (m_retry_timer) {
        m_loop.cancel(*m_retry_timer);
        m_retry_timer.reset();
    }
}

void session_player::on_retry(std::uint64_t token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (token != m_retry_token || !m_retry_timer) {
        return;
    }
    m_retry_timer.reset();
    if (m_sink && (m_sink->is_playing() || m_sink->is_paused())) {
        return;
    }
    play_until_started_locked();
}

// Elapsed stays at the last position reached once nothing plays.
void session_player::freeze_elapsed_locked()
{
    if (m_started_at && !m_paused_at) {
        m_paused_at = m_now();
    }
}

void session_player::on_idle_timeout(std::uint64_t token)
{
    idle_fn fn;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (token != m_idle_token || !m_disconnect_timer) {
            return;
        }
        m_disconnect_timer.reset();
        fn = m_on_idle;
    }

    m_log.log(dpp::ll_info, "[Player] Idle timeout reached for guild " + m_key.str());
    if (fn) {
        fn(m_key);
    } else {
        disconnect();
    }
}

// ---------- controls ----------

bool session_player::skip()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_sink || !(m_sink->is_playing() || m_sink->is_paused())) {
        return false;
    }
    // completion fires as for a natural end
    m_sink->stop();
    return true;
}

bool session_player::pause()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_sink || !m_sink->is_playing() || m_sink->is_paused()) {
        return false;
    }
    if (!m_sink->pause()) {
        return false;
    }
    m_paused_at = m_now();
    return true;
}

bool session_player::resume()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_sink || !m_sink->is_paused()) {
        return false;
    }
    if (!m_sink->resume()) {
        return false;
    }
    if (m_paused_at) {
        m_paused_total += m_now() - *m_paused_at;
        m_paused_at.reset();
    }
    return true;
}

bool session_player::toggle_autoplay()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_autoplay = !m_autoplay;
    return m_autoplay;
}

bool session_player::autoplay_enabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_autoplay;
}

void session_player::clear_history()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_refill.cancel();
        m_recent.clear();
        m_autoplay_buffer.clear();
    }
    m_recommender->clear_history();
}

std::size_t session_player::shuffle_queue()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.size() >= 2) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::shuffle(m_queue.begin(), m_queue.end(), rng);
    }
    return m_queue.size();
}

void session_player::disconnect()
{
    core::background_task refill;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cancel_disconnect_timer_locked();
        cancel_retry_locked();
        ++m_idle_token;
        ++m_retry_token;
        refill = m_refill;
        m_refill = core::background_task{};
        refill.cancel();
        // completions already on their way are now stale
        ++m_generation;
        if (m_sink && (m_sink->is_playing() || m_sink->is_paused())) {
            m_sink->stop();
        }
    }

    // A refill finishing late must not repopulate the buffers cleared below.
    refill.wait();

    std::vector<std::string> identifiers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_current) {
            identifiers.push_back(m_current->identifier);
        }
        for (const auto& t : m_queue) {
            identifiers.push_back(t.identifier);
        }
        for (const auto& t : m_autoplay_buffer) {
            identifiers.push_back(t.identifier);
        }
        identifiers.insert(identifiers.end(), m_recent.begin(), m_recent.end());

        m_queue.clear();
        m_autoplay_buffer.clear();
        m_recent.clear();
        m_current.reset();
        m_started_at.reset();
        m_paused_at.reset();
        m_paused_total = clock::duration::zero();
        m_suspended.reset();
        m_sink.reset();
    }

    m_recommender->clear_history();
    m_cache.purge(identifiers);

    m_log.log(dpp::ll_info, "[Player] Session cleared for guild " + m_key.str());
}

// ---------- queries ----------

std::int64_t session_player::elapsed_ms_locked() const
{
    if (!m_started_at) {
        return 0;
    }
    const auto now = m_now();
    auto paused = m_paused_total;
    if (m_paused_at) {
        paused += now - *m_paused_at;
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - *m_started_at - paused).count();
    return std::max<std::int64_t>(ms, 0);
}

std::optional<std::int64_t> session_player::elapsed_seconds() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_started_at) {
        return std::nullopt;
    }
    return elapsed_ms_locked() / 1000;
}

std::vector<track> session_player::get_queue() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_queue.begin(), m_queue.end()};
}

std::vector<track> session_player::get_autoplay_queue() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_autoplay_buffer.begin(), m_autoplay_buffer.end()};
}

std::optional<track> session_player::current_track() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

std::vector<std::string> session_player::recent_history() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_recent.begin(), m_recent.end()};
}

bool session_player::is_playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sink && (m_sink->is_playing() || m_sink->is_paused());
}

bool session_player::is_paused() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sink && m_sink->is_paused();
}

int session_player::set_volume(int percent)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_volume = clamp_volume(percent);
    if (m_sink) {
        m_sink->set_volume(m_volume);
    }
    return m_volume;
}

int session_player::get_volume() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_volume;
}

bool session_player::disconnect_pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disconnect_timer.has_value();
}

bool session_player::refill_pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_refill.pending();
}

// ---------- out-of-band audio ----------

bool session_player::play_audio_file(const std::string& path, std::function<void(bool)> on_done)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_sink || !m_sink->is_connected()) {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        m_log.log(dpp::ll_warning, "[Player] Audio file not found: " + path);
        return false;
    }

    std::optional<suspended_music> suspended;
    if (!m_suspended && m_current && (m_sink->is_playing() || m_sink->is_paused())) {
        suspended = suspended_music{elapsed_ms_locked(), m_sink->is_paused(), m_volume};
    }

    const std::uint64_t generation = ++m_generation;
    std::weak_ptr<session_player> weak = weak_from_this();
    core::event_loop& loop = m_loop;

    const bool started = m_sink->play(path, 0,
        [weak, generation, on_done, &loop](const std::string& error) {
            loop.post([weak, generation, on_done, error]() {
                if (auto self = weak.lock()) {
                    self->on_file_finished(generation, error, on_done);
                } else if (on_done) {
                    on_done(false);
                }
            });
        });

    if (!started) {
        m_log.log(dpp::ll_warning, "[Player] Could not play audio file " + path);
        if (suspended) {
            resume_music_locked(*suspended);
        }
        return false;
    }

    if (suspended) {
        m_suspended = suspended;
        if (!m_paused_at) {
            m_paused_at = m_now();
        }
    }
    return true;
}

bool session_player::resume_music_locked(const suspended_music& s)
{
    m_suspended.reset();
    if (!m_current || !m_sink) {
        return false;
    }

    const track t = *m_current;
    std::string source;
    std::error_code ec;
    if (t.local_path && std::filesystem::exists(*t.local_path, ec)) {
        source = *t.local_path;
    } else if (is_network_url(t.stream_url)) {
        source = t.stream_url;
    } else {
        return false;
    }

    m_sink->set_volume(s.volume);
    if (!start_sink_locked(t, source, s.offset_ms)) {
        return false;
    }

    const auto now = m_now();
    m_started_at   = now - std::chrono::milliseconds(s.offset_ms);
    m_paused_total = clock::duration::zero();
    m_paused_at.reset();
    if (s.was_paused && m_sink->pause()) {
        m_paused_at = now;
    }
    return true;
}

void session_player::on_file_finished(std::uint64_t generation, const std::string& error,
                                      const std::function<void(bool)>& on_done)
{
    bool advance = false;
    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // a newer play or a teardown replaced this file; nothing to resume
        superseded = generation != m_generation;
        if (!superseded) {
            if (!error.empty()) {
                m_log.log(dpp::ll_warning, "[Player] Audio file playback failed: " + error);
            }
            if (m_suspended) {
                const suspended_music s = *m_suspended;
                advance = !resume_music_locked(s);
            } else {
                // requests queued while the file played have not started yet
                advance = !m_current && !m_queue.empty();
            }
        }
    }

    if (advance) {
        play_until_started();
    }
    if (on_done) {
        on_done(!superseded && error.empty());
    }
}

} // namespace jb::music
