#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <dpp/snowflake.h>

namespace jb::music {

// Voice output for one session. play() takes a local file path or a
// network URL.
class audio_sink {
public:
    // Called once per play() when the source ends for any reason: natural end,
    // stop(), decode error or transport loss. `error` is empty on a clean end.
    // May be invoked from any thread.
    using completion = std::function<void(const std::string& error)>;

    virtual ~audio_sink() = default;

    virtual bool is_connected() const = 0;

    virtual bool play(const std::string& source, std::int64_t start_ms, completion on_complete) = 0;
    virtual void stop() = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;

    virtual bool is_playing() const = 0;
    virtual bool is_paused() const = 0;

    virtual void set_volume(int percent) = 0;
};

// Joins and leaves voice channels; a joined channel yields a sink.
class voice_gateway {
public:
    virtual ~voice_gateway() = default;

    virtual std::shared_ptr<audio_sink> join(dpp::snowflake session_key, dpp::snowflake channel_id) = 0;
    virtual void leave(dpp::snowflake session_key) = 0;
};

} // namespace jb::music
