#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <dpp/snowflake.h>

#include "jb/core/logger.hpp"
#include "jb/lavalink/client.hpp"
#include "jb/music/audio_sink.hpp"

namespace jb::lavalink {

// audio_sink backed by one guild's Lavalink player. Lavalink reports track
// ends over its websocket; this sink polls the REST player instead and fires
// the completion from its watcher thread.
class sink : public music::audio_sink {
public:
    sink(node& lavalink, dpp::snowflake guild_id, logger log,
         std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
    ~sink() override;

    sink(const sink&) = delete;
    sink& operator=(const sink&) = delete;

    bool is_connected() const override;

    bool play(const std::string& source, std::int64_t start_ms, completion on_complete) override;
    void stop() override;
    bool pause() override;
    bool resume() override;

    bool is_playing() const override;
    bool is_paused() const override;

    void set_volume(int percent) override;

    // Ends the watcher; a pending completion fires with an error.
    void close();

private:
    void watch();

    // Takes the pending completion; call it after releasing the lock.
    completion take_completion_locked();

    node&                     m_node;
    dpp::snowflake            m_guild_id;
    logger                    m_log;
    std::chrono::milliseconds m_poll_interval;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    completion              m_on_complete;
    std::uint64_t           m_play_id    = 0;
    bool                    m_active     = false;
    bool                    m_paused     = false;
    bool                    m_seen_track = false;
    bool                    m_open       = true;
    int                     m_failures   = 0;
    int                     m_volume     = 100;
    std::chrono::steady_clock::time_point m_started;

    std::thread m_watcher;
};

} // namespace jb::lavalink
