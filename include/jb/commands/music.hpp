#pragma once

#include <optional>
#include <string>
#include <vector>

#include <dpp/dpp.h>

#include "jb/core/logger.hpp"
#include "jb/core/worker_pool.hpp"
#include "jb/music/rating_store.hpp"
#include "jb/music/resolver.hpp"
#include "jb/music/session_player.hpp"
#include "jb/music/session_registry.hpp"
#include "jb/music/track.hpp"

namespace jb::commands {

// Discord caps choice lists and choice names.
constexpr std::size_t max_autocomplete_choices = 25;
constexpr std::size_t max_choice_name_length   = 100;

constexpr std::size_t queue_display_limit    = 10;
constexpr std::size_t autoplay_display_limit = 5;

// Playlist entries resolved per /play; the rest are ignored.
constexpr std::size_t max_playlist_entries = 50;

struct music_context {
    music::session_registry&    registry;
    music::track_resolver&      resolver;
    music::catalog&             catalog_source;
    music::memory_rating_store& ratings;
    core::worker_pool&          pool;
    logger                      log;
};

/// Build the music slash commands.
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Commands that join or leave voice. They wait for gateway events, so they
/// run on the worker pool instead of the event thread.
bool waits_on_gateway(const std::string& command_name);

/// Dispatch a music slash command. Returns false for commands it does not own.
bool route_slashcommand(const dpp::slashcommand_t& ev, music_context& ctx);

/// Answer /play autocomplete from the catalog.
void route_autocomplete(const dpp::autocomplete_t& ev, dpp::cluster& bot, music_context& ctx);

// ---------- text helpers ----------

std::vector<dpp::command_option_choice> autocomplete_choices(const std::vector<music::catalog_entry>& entries);

std::string describe_track(const music::track& t);

std::string describe_play_result(const music::play_result& result);

std::string describe_queue(const std::optional<music::track>& current,
                           const std::vector<music::track>& queue,
                           const std::vector<music::track>& autoplay,
                           bool autoplay_enabled);

std::string describe_now_playing(const music::track& current,
                                 std::optional<std::int64_t> elapsed,
                                 bool paused,
                                 std::pair<int, int> likes_dislikes);

} // namespace jb::commands
