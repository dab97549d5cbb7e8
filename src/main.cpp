#include <dpp/dpp.h>                // D++
#include <dpp/presence.h>           // D++ Presence
#include <dpp/appcommand.h>         // D++ Commands
#include <dpp/utility.h>            // D++ Utility

#include <atomic>                   // Shutdown flag
#include <chrono>                   // Time
#include <csignal>                  // SIGINT, SIGTERM
#include <iostream>                 // std::cout, std::cerr
#include <thread>                   // std::this_thread

#include "jb/core/config.hpp"               // Environment configuration
#include "jb/core/event_loop.hpp"           // Scheduler thread
#include "jb/core/logger.hpp"               // Log forwarding
#include "jb/core/worker_pool.hpp"          // Blocking work
#include "jb/lavalink/client.hpp"           // Lavalink connection
#include "jb/lavalink/resolver.hpp"         // Track lookup
#include "jb/lavalink/voice.hpp"            // Voice channels
#include "jb/music/downloader.hpp"          // Prefetch downloads
#include "jb/music/prefetch_cache.hpp"      // Audio cache
#include "jb/music/rating_store.hpp"        // Likes/dislikes
#include "jb/music/session_registry.hpp"    // Per-guild players
#include "jb/commands/music.hpp"            // Slash commands

using namespace dpp;

namespace {

std::atomic<bool> g_shutdown{false};

void request_shutdown(int) {
    g_shutdown = true;
}

} // namespace

int main() {
    // The cluster does not exist yet, so config warnings go to stderr
    const jb::app_config cfg = jb::load_app_config(jb::process_env, jb::logger(
        [](dpp::loglevel, const std::string& msg) { std::cerr << msg << std::endl; }));
    if (cfg.token.empty()) {
        std::cerr << "The 'token' environment variable is not set" << std::endl;
        return 1;
    }

    cluster bot(cfg.token, i_default_intents | i_guild_voice_states);
    bot.on_log(utility::cout_logger()); // D++ logger

    const jb::logger log = jb::logger::for_cluster(bot);

    // ---------- Core ----------
    jb::core::event_loop loop(log);
    jb::core::worker_pool pool(cfg.workers, log);

    // ---------- Lavalink node ----------
    jb::lavalink::node lavalink(bot, cfg.lavalink, log);
    jb::lavalink::resolver resolver(lavalink, log);
    jb::lavalink::voice_link voice(bot, lavalink, log);

    // ---------- Music ----------
    jb::music::http_downloader downloader(bot, log);
    jb::music::prefetch_cache cache(cfg.cache, downloader, pool, log);
    jb::music::memory_rating_store ratings;

    jb::music::session_registry registry(
        jb::music::session_registry::dependencies{resolver, resolver, ratings, cache, voice, loop, pool},
        cfg.player, cfg.recommender, log);

    jb::commands::music_context music{registry, resolver, resolver, ratings, pool, log};

    // ---------- Voice glue for Lavalink ----------
    bot.on_voice_state_update([&bot, &lavalink, &registry, &pool](const voice_state_update_t& ev) {
        lavalink.handle_voice_state_update(ev);

        // Someone else moved us out of the channel; teardown talks to Lavalink, so not on this thread
        if (ev.state.user_id == bot.me.id && ev.state.channel_id.empty()) {
            const dpp::snowflake guild_id = ev.state.guild_id;
            pool.submit([&registry, guild_id]() { registry.handle_forced_disconnect(guild_id); });
        }
    });

    bot.on_voice_server_update([&lavalink](const voice_server_update_t& ev) {
        lavalink.handle_voice_server_update(ev);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&music](const slashcommand_t& event) {
        jb::commands::route_slashcommand(event, music);
    });

    bot.on_autocomplete([&bot, &music](const autocomplete_t& event) {
        jb::commands::route_autocomplete(event, bot, music);
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot, &lavalink](const ready_t& event) {
        (void)event;

        std::cout << "Logged in as " << bot.me.username << "!" << std::endl;

        if (run_once<struct ensure_lavalink_session>()) {
            lavalink.ensure_session();
        }

        if (run_once<struct set_status>()) {
            bot.set_presence(presence(ps_online, at_listening, "/play"));
        }

        if (run_once<struct register_bot_commands>()) {
            std::cout << "Registering slash commands..." << std::endl;
            bot.global_bulk_command_create(jb::commands::make_commands(bot));
            std::cout << "Registered slash commands!" << std::endl;
        }
    });

    // ---------- Start bot ----------
    std::signal(SIGINT, request_shutdown);
    std::signal(SIGTERM, request_shutdown);

    loop.start();
    bot.start(st_return);

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down..." << std::endl;
    registry.disconnect_all();
    cache.cleanup_all();
    loop.stop();
    bot.shutdown();
    pool.wait_idle();
    return 0;
}
