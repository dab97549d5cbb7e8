#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <dpp/dpp.h>

#include "jb/core/logger.hpp"
#include "jb/lavalink/client.hpp"
#include "jb/lavalink/sink.hpp"
#include "jb/music/audio_sink.hpp"

namespace jb::lavalink {

// Joins voice through the gateway (opcode 4) and hands the voice
// credentials to Lavalink, which does the actual streaming.
class voice_link : public music::voice_gateway {
public:
    voice_link(dpp::cluster& cluster, node& lavalink, logger log,
               std::chrono::milliseconds handshake_timeout = std::chrono::milliseconds(5000));
    ~voice_link() override;

    std::shared_ptr<music::audio_sink> join(dpp::snowflake guild_id, dpp::snowflake channel_id) override;
    void leave(dpp::snowflake guild_id) override;

private:
    bool send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id);
    bool wait_for_handshake(dpp::snowflake guild_id);

    dpp::cluster&             m_cluster;
    node&                     m_node;
    logger                    m_log;
    std::chrono::milliseconds m_handshake_timeout;

    std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::shared_ptr<sink>> m_sinks;
};

} // namespace jb::lavalink
