#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "jb/core/event_loop.hpp"
#include "jb/core/logger.hpp"
#include "jb/core/worker_pool.hpp"
#include "jb/music/audio_sink.hpp"
#include "jb/music/prefetch_cache.hpp"
#include "jb/music/recommender.hpp"
#include "jb/music/resolver.hpp"
#include "jb/music/track.hpp"

namespace jb::music {

struct player_config {
    std::size_t               history_size            = 3;
    std::chrono::milliseconds idle_disconnect{300000};
    std::size_t               autoplay_target         = 3;
    std::size_t               queue_prefetch_depth    = 2;
    std::size_t               autoplay_prefetch_depth = 1;
    std::size_t               blended_limit           = 5;
    std::size_t               max_play_attempts       = 5;
    std::chrono::milliseconds retry_delay{1000};   // after max_play_attempts failures in a row
    int                       default_volume          = 100;
};

enum class play_status {
    played,
    exhausted,           // nothing queued and nothing to recommend
    disconnected,        // no usable voice connection
    acquisition_failed   // chosen track had neither a cached file nor a valid stream URL
};

struct play_result {
    play_status          status = play_status::exhausted;
    std::optional<track> played;

    bool ok() const { return status == play_status::played; }
};

int clamp_volume(int percent);

// Playback state machine for one session: request queue, autoplay buffer,
// current track and timing. Everything that decides "what plays next" runs
// under one mutex. Sink completions arrive on foreign threads and are handed
// to the event loop before they touch any state.
class session_player : public std::enable_shared_from_this<session_player> {
public:
    using clock      = std::chrono::steady_clock;
    using clock_fn   = std::function<clock::time_point()>;
    using idle_fn    = std::function<void(dpp::snowflake)>;

    struct services {
        track_resolver&    resolver;
        prefetch_cache&    cache;
        core::event_loop&  loop;
        core::worker_pool& pool;
    };

    session_player(dpp::snowflake key, services svc, std::unique_ptr<recommender> rec,
                   player_config cfg = {}, logger log = {}, clock_fn now = {});
    ~session_player();

    session_player(const session_player&) = delete;
    session_player& operator=(const session_player&) = delete;

    dpp::snowflake key() const { return m_key; }

    // Called when the idle timer expires; the registry tears the session down.
    void on_idle(idle_fn fn);

    void attach(std::shared_ptr<audio_sink> sink);
    bool is_connected() const;

    // 1-based position in the request queue.
    std::size_t enqueue(track t);

    play_result play_next();

    // play_next(), retried while a track cannot be acquired and more remain.
    // If every attempt fails with tracks still queued, another round runs
    // after retry_delay.
    play_result play_until_started();

    // play_until_started() unless something is already playing; checked and
    // started under one lock so concurrent callers cannot both start.
    play_result play_if_idle();

    bool skip();
    bool pause();
    bool resume();

    bool toggle_autoplay();
    bool autoplay_enabled() const;

    void clear_history();
    std::size_t shuffle_queue();

    // Stops playback and wipes queues, history and this session's cache entries.
    void disconnect();

    std::optional<std::int64_t> elapsed_seconds() const;

    std::vector<track>       get_queue() const;
    std::vector<track>       get_autoplay_queue() const;
    std::optional<track>     current_track() const;
    std::vector<std::string> recent_history() const;

    bool is_playing() const;
    bool is_paused() const;

    int  set_volume(int percent);
    int  get_volume() const;

    // Plays an out-of-band file. Music that is playing is suspended and picks
    // up where it left off afterwards. on_done(true) once the file finished.
    bool play_audio_file(const std::string& path, std::function<void(bool)> on_done);

    // Appends resolved recommendations until the buffer holds target_count
    // tracks or candidates run out. Returns how many were added.
    std::size_t refill_autoplay_buffer(std::size_t target_count,
                                       const std::shared_ptr<std::atomic<bool>>& cancelled = nullptr);

    bool disconnect_pending() const;
    bool refill_pending() const;

    recommender& recommendations() { return *m_recommender; }

private:
    struct suspended_music {
        std::int64_t offset_ms  = 0;
        bool         was_paused = false;
        int          volume     = 100;
    };

    play_result play_next_locked();
    play_result play_until_started_locked();

    std::optional<track> next_candidate_locked();
    std::optional<track> fetch_fallback_locked();
    void remember_locked(const std::string& identifier);
    bool start_sink_locked(const track& t, const std::string& source, std::int64_t start_ms);
    std::optional<std::string> acquire_source_locked(track& t);
    bool resume_music_locked(const suspended_music& s);

    void start_disconnect_timer_locked();
    void cancel_disconnect_timer_locked();
    void schedule_retry_locked();
    void cancel_retry_locked();
    void freeze_elapsed_locked();
    void start_refill_locked();
    void prefetch_upcoming_locked();

    void on_track_finished(std::uint64_t generation, const std::string& identifier, const std::string& error);
    void on_file_finished(std::uint64_t generation, const std::string& error, const std::function<void(bool)>& on_done);
    void on_idle_timeout(std::uint64_t token);
    void on_retry(std::uint64_t token);

    std::int64_t elapsed_ms_locked() const;

    dpp::snowflake     m_key;
    track_resolver&    m_resolver;
    prefetch_cache&    m_cache;
    core::event_loop&  m_loop;
    core::worker_pool& m_pool;
    std::unique_ptr<recommender> m_recommender;
    player_config      m_cfg;
    logger             m_log;
    clock_fn           m_now;
    idle_fn            m_on_idle;

    mutable std::mutex m_mutex;

    std::shared_ptr<audio_sink> m_sink;
    std::deque<track>           m_queue;
    std::deque<track>           m_autoplay_buffer;
    std::optional<track>        m_current;
    std::deque<std::string>     m_recent;
    bool                        m_autoplay = false;
    int                         m_volume   = 100;

    std::optional<clock::time_point> m_started_at;
    std::optional<clock::time_point> m_paused_at;
    clock::duration                  m_paused_total{0};

    std::uint64_t                   m_generation = 0;
    std::optional<suspended_music>  m_suspended;

    std::optional<core::event_loop::timer_id> m_disconnect_timer;
    std::uint64_t                   m_idle_token = 0;
    std::optional<core::event_loop::timer_id> m_retry_timer;
    std::uint64_t                   m_retry_token = 0;
    core::background_task           m_refill;
};

} // namespace jb::music
