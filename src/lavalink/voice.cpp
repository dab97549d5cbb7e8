#include "jb/lavalink/voice.hpp"

#include <sstream>

namespace jb::lavalink {

voice_link::voice_link(dpp::cluster& cluster, node& lavalink, logger log,
                       std::chrono::milliseconds handshake_timeout)
    : m_cluster(cluster)
    , m_node(lavalink)
    , m_log(std::move(log))
    , m_handshake_timeout(handshake_timeout)
{
}

voice_link::~voice_link()
{
    std::unordered_map<dpp::snowflake, std::shared_ptr<sink>> sinks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sinks.swap(m_sinks);
    }
    for (auto& [guild_id, s] : sinks) {
        (void)guild_id;
        s->close();
    }
}

bool voice_link::send_voice_state(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    const dpp::guild* g = dpp::find_guild(guild_id);
    if (g == nullptr) {
        m_log.log(dpp::ll_warning, "[Lavalink] Guild " + guild_id.str() + " is not in the cache");
        return false;
    }

    dpp::discord_client* shard = m_cluster.get_shard(g->shard_id);
    if (shard == nullptr) {
        std::ostringstream oss;
        oss << "[Lavalink] No shard " << g->shard_id << " for guild " << guild_id;
        m_log.log(dpp::ll_warning, oss.str());
        return false;
    }

    json d;
    d["guild_id"]   = guild_id.str();
    d["channel_id"] = channel_id.empty() ? json(nullptr) : json(channel_id.str());
    d["self_mute"]  = false;
    d["self_deaf"]  = true;

    json payload;
    payload["op"] = 4;
    payload["d"]  = d;

    shard->queue_message(payload.dump());
    return true;
}

bool voice_link::wait_for_handshake(dpp::snowflake guild_id)
{
    return m_node.wait_for_voice(guild_id, m_handshake_timeout);
}

std::shared_ptr<music::audio_sink> voice_link::join(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    std::shared_ptr<sink> existing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sinks.find(guild_id);
        if (it != m_sinks.end()) {
            existing = it->second;
        }
    }

    if (!existing) {
        m_node.forget_voice(guild_id);
    }

    if (!send_voice_state(guild_id, channel_id)) {
        return nullptr;
    }

    if (!wait_for_handshake(guild_id)) {
        std::ostringstream oss;
        oss << "[Lavalink] Voice handshake timed out for guild " << guild_id
            << " channel " << channel_id;
        m_log.log(dpp::ll_warning, oss.str());
        send_voice_state(guild_id, dpp::snowflake());
        return nullptr;
    }

    if (!m_node.push_voice(guild_id)) {
        m_log.log(dpp::ll_warning, "[Lavalink] Could not hand voice credentials to Lavalink for guild " + guild_id.str());
    }

    if (existing) {
        return existing;
    }

    auto created = std::make_shared<sink>(m_node, guild_id, m_log);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sinks[guild_id] = created;
    }

    std::ostringstream oss;
    oss << "[Lavalink] Joined channel " << channel_id << " in guild " << guild_id;
    m_log.log(dpp::ll_info, oss.str());
    return created;
}

void voice_link::leave(dpp::snowflake guild_id)
{
    std::shared_ptr<sink> s;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sinks.find(guild_id);
        if (it != m_sinks.end()) {
            s = it->second;
            m_sinks.erase(it);
        }
    }

    if (s) {
        s->close();
    }

    send_voice_state(guild_id, dpp::snowflake());
    m_node.destroy_player(guild_id);
    m_node.forget_voice(guild_id);
}

} // namespace jb::lavalink
