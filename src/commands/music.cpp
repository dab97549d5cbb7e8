#include "jb/commands/music.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <variant>

#include "jb/util/format.hpp"

namespace jb::commands {

namespace {

std::optional<dpp::snowflake> user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id)
{
    const dpp::guild* g = dpp::find_guild(guild_id);
    if (g == nullptr) {
        return std::nullopt;
    }
    auto it = g->voice_members.find(user_id);
    if (it == g->voice_members.end() || it->second.channel_id.empty()) {
        return std::nullopt;
    }
    return it->second.channel_id;
}

std::string resolve_failure_text(const music::resolve_result& res, const std::string& query)
{
    switch (res.status) {
        case music::resolve_status::missing_runtime:
            return "The music source is misconfigured (missing JavaScript runtime). Ask an admin to check Lavalink.";
        case music::resolve_status::error:
            return "Could not load **" + query + "**: " + res.error_message;
        default:
            return "No results for **" + query + "**.";
    }
}

// Resolves the rest of a playlist off the event thread.
void enqueue_remaining(music_context& ctx, dpp::snowflake guild_id,
                       std::vector<music::playlist_entry> entries)
{
    ctx.pool.submit([&ctx, guild_id, entries = std::move(entries)]() {
        std::size_t added = 0;
        for (const auto& entry : entries) {
            if (!ctx.registry.is_connected(guild_id)) {
                break;
            }
            auto res = ctx.resolver.resolve(entry.url);
            if (!res.ok()) {
                continue;
            }
            ctx.registry.enqueue(guild_id, *res.value);
            ++added;
        }

        std::ostringstream oss;
        oss << "[Player] Queued " << added << " playlist track(s) for guild " << guild_id;
        ctx.log.log(dpp::ll_info, oss.str());
    });
}

void handle_play(const dpp::slashcommand_t& ev, music_context& ctx)
{
    const dpp::snowflake guild_id = ev.command.guild_id;
    const std::string query = std::get<std::string>(ev.get_parameter("query"));

    auto channel = user_voice_channel(guild_id, ev.command.get_issuing_user().id);
    if (!channel) {
        ev.edit_original_response(dpp::message("Join a voice channel first."));
        return;
    }

    if (!ctx.registry.connect(guild_id, *channel)) {
        ev.edit_original_response(dpp::message("I could not join your voice channel."));
        return;
    }

    std::vector<music::playlist_entry> rest;
    music::resolve_result res;

    if (music::is_network_url(query) && music::is_playlist_url(query)) {
        auto entries = ctx.resolver.resolve_playlist(query);
        if (entries.size() > max_playlist_entries) {
            entries.resize(max_playlist_entries);
        }
        if (!entries.empty()) {
            res = ctx.resolver.resolve(entries.front().url);
            rest.assign(entries.begin() + 1, entries.end());
        } else {
            res = ctx.resolver.resolve(query);
        }
    } else {
        res = ctx.resolver.resolve(query);
    }

    if (!res.ok()) {
        ev.edit_original_response(dpp::message(resolve_failure_text(res, query)));
        return;
    }

    const bool was_playing = ctx.registry.is_playing(guild_id);
    const music::track requested = *res.value;
    const std::size_t position = ctx.registry.enqueue(guild_id, requested);

    std::string reply;
    if (was_playing) {
        std::ostringstream oss;
        oss << "Queued " << describe_track(requested) << " at position " << position << ".";
        reply = oss.str();
    } else {
        reply = describe_play_result(ctx.registry.start_if_idle(guild_id));
    }

    if (!rest.empty()) {
        reply += "\nAdding " + std::to_string(rest.size()) + " more from the playlist.";
        enqueue_remaining(ctx, guild_id, std::move(rest));
    }

    ev.edit_original_response(dpp::message(reply));
}

void handle_rate(const dpp::slashcommand_t& ev, music_context& ctx, int rating)
{
    const dpp::snowflake guild_id = ev.command.guild_id;
    auto current = ctx.registry.get_current_track(guild_id);
    if (!current) {
        ev.edit_original_response(dpp::message("Nothing is playing."));
        return;
    }

    ctx.ratings.rate(guild_id, current->identifier, ev.command.get_issuing_user().id, rating);
    const auto [likes, dislikes] = ctx.ratings.counts(guild_id, current->identifier);

    std::ostringstream oss;
    oss << (rating > 0 ? "Liked " : "Disliked ") << describe_track(*current)
        << " (" << likes << " likes, " << dislikes << " dislikes)";
    ev.edit_original_response(dpp::message(oss.str()));
}

void run_command(const dpp::slashcommand_t& ev, music_context& ctx)
{
    const std::string name = ev.command.get_command_name();
    const dpp::snowflake guild_id = ev.command.guild_id;

    try {
        // ---------- /play ----------
        if (name == "play") {
            handle_play(ev, ctx);
        }

        // ---------- /skip ----------
        else if (name == "skip") {
            ev.edit_original_response(dpp::message(
                ctx.registry.skip(guild_id) ? "Skipped." : "Nothing is playing."));
        }

        // ---------- /stop ----------
        else if (name == "stop") {
            ctx.registry.disconnect(guild_id);
            ev.edit_original_response(dpp::message("Stopped and left the voice channel."));
        }

        // ---------- /pause ----------
        else if (name == "pause") {
            ev.edit_original_response(dpp::message(
                ctx.registry.pause(guild_id) ? "Paused." : "Nothing is playing."));
        }

        // ---------- /resume ----------
        else if (name == "resume") {
            ev.edit_original_response(dpp::message(
                ctx.registry.resume(guild_id) ? "Resumed." : "Nothing is paused."));
        }

        // ---------- /queue ----------
        else if (name == "queue") {
            ev.edit_original_response(dpp::message(describe_queue(
                ctx.registry.get_current_track(guild_id),
                ctx.registry.get_queue(guild_id),
                ctx.registry.get_autoplay_queue(guild_id),
                ctx.registry.autoplay_enabled(guild_id))));
        }

        // ---------- /nowplaying ----------
        else if (name == "nowplaying") {
            auto current = ctx.registry.get_current_track(guild_id);
            if (!current) {
                ev.edit_original_response(dpp::message("Nothing is playing."));
            } else {
                ev.edit_original_response(dpp::message(describe_now_playing(
                    *current,
                    ctx.registry.elapsed_seconds(guild_id),
                    ctx.registry.is_paused(guild_id),
                    ctx.ratings.counts(guild_id, current->identifier))));
            }
        }

        // ---------- /autoplay ----------
        else if (name == "autoplay") {
            const bool enabled = ctx.registry.toggle_autoplay(guild_id);
            ev.edit_original_response(dpp::message(enabled ? "Autoplay enabled." : "Autoplay disabled."));
        }

        // ---------- /clearhistory ----------
        else if (name == "clearhistory") {
            ctx.registry.clear_history(guild_id);
            ev.edit_original_response(dpp::message("Autoplay history cleared."));
        }

        // ---------- /shuffle ----------
        else if (name == "shuffle") {
            const std::size_t count = ctx.registry.shuffle_queue(guild_id);
            ev.edit_original_response(dpp::message(
                count < 2 ? "Not enough songs in the queue to shuffle."
                          : "Shuffled " + std::to_string(count) + " songs."));
        }

        // ---------- /volume ----------
        else if (name == "volume") {
            const auto percent = std::get<std::int64_t>(ev.get_parameter("percent"));
            const int applied = ctx.registry.set_volume(guild_id, static_cast<int>(percent));
            ev.edit_original_response(dpp::message("Volume set to " + std::to_string(applied) + "%."));
        }

        // ---------- /like, /dislike ----------
        else if (name == "like") {
            handle_rate(ev, ctx, 1);
        } else if (name == "dislike") {
            handle_rate(ev, ctx, -1);
        }
    } catch (const std::exception& e) {
        ctx.log.log(dpp::ll_error, "[Commands] /" + name + " failed: " + e.what());
        ev.edit_original_response(dpp::message("Something went wrong."));
    }
}

} // namespace

bool waits_on_gateway(const std::string& command_name)
{
    return command_name == "play" || command_name == "stop";
}

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot)
{
    dpp::slashcommand play("play", "Play a song, URL or playlist", bot.me.id);
    play.add_option(
        dpp::command_option(dpp::co_string, "query", "Search text, URL or video id", true)
            .set_auto_complete(true)
    );

    dpp::slashcommand volume("volume", "Set the playback volume", bot.me.id);
    volume.add_option(
        dpp::command_option(dpp::co_integer, "percent", "0 to 1000, default 100", true)
            .set_min_value(std::int64_t{0})
            .set_max_value(std::int64_t{1000})
    );

    return {
        play,
        dpp::slashcommand("skip", "Skip the current song", bot.me.id),
        dpp::slashcommand("stop", "Stop playback and leave the voice channel", bot.me.id),
        dpp::slashcommand("pause", "Pause playback", bot.me.id),
        dpp::slashcommand("resume", "Resume playback", bot.me.id),
        dpp::slashcommand("queue", "Show the queue", bot.me.id),
        dpp::slashcommand("nowplaying", "Show the current song", bot.me.id),
        dpp::slashcommand("autoplay", "Toggle autoplay of similar songs", bot.me.id),
        dpp::slashcommand("clearhistory", "Forget what autoplay has already played", bot.me.id),
        dpp::slashcommand("shuffle", "Shuffle the queue", bot.me.id),
        volume,
        dpp::slashcommand("like", "Like the current song", bot.me.id),
        dpp::slashcommand("dislike", "Dislike the current song", bot.me.id),
    };
}

bool route_slashcommand(const dpp::slashcommand_t& ev, music_context& ctx)
{
    const std::string name = ev.command.get_command_name();

    static const std::vector<std::string> owned{
        "play", "skip", "stop", "pause", "resume", "queue", "nowplaying",
        "autoplay", "clearhistory", "shuffle", "volume", "like", "dislike"
    };
    if (std::find(owned.begin(), owned.end(), name) == owned.end()) {
        return false;
    }

    ev.thinking();

    if (ev.command.guild_id.empty()) {
        ev.edit_original_response(dpp::message("Music commands only work in a server."));
        return true;
    }

    if (waits_on_gateway(name)) {
        // the voice handshake is delivered on this thread
        ctx.pool.submit([ev, &ctx]() { run_command(ev, ctx); });
    } else {
        run_command(ev, ctx);
    }
    return true;
}

void route_autocomplete(const dpp::autocomplete_t& ev, dpp::cluster& bot, music_context& ctx)
{
    if (ev.name != "play") {
        return;
    }

    for (const auto& opt : ev.options) {
        if (!opt.focused) {
            continue;
        }

        std::string text;
        if (std::holds_alternative<std::string>(opt.value)) {
            text = std::get<std::string>(opt.value);
        }

        dpp::interaction_response response(dpp::ir_autocomplete_reply);
        for (auto& choice : autocomplete_choices(ctx.catalog_source.search_tracks(text, max_autocomplete_choices))) {
            response.add_autocomplete_choice(choice);
        }
        bot.interaction_response_create(ev.command.id, ev.command.token, response);
        break;
    }
}

std::vector<dpp::command_option_choice> autocomplete_choices(const std::vector<music::catalog_entry>& entries)
{
    std::vector<dpp::command_option_choice> choices;
    for (const auto& e : entries) {
        if (choices.size() >= max_autocomplete_choices) {
            break;
        }
        if (e.identifier.empty()) {
            continue;
        }

        std::string label = e.title;
        if (!e.artist.empty()) {
            label += " - " + e.artist;
        }
        if (e.duration > 0) {
            label += " (" + util::format_duration(e.duration) + ")";
        }

        choices.emplace_back(util::truncate_utf8(label, max_choice_name_length), e.identifier);
    }
    return choices;
}

std::string describe_track(const music::track& t)
{
    std::ostringstream oss;
    oss << "**" << (t.title.empty() ? t.identifier : t.title) << "**";
    if (!t.author.empty()) {
        oss << " by " << t.author;
    }
    oss << " (" << util::format_duration(t.duration) << ")";
    return oss.str();
}

std::string describe_play_result(const music::play_result& result)
{
    switch (result.status) {
        case music::play_status::played:
            return result.played ? "Now playing " + describe_track(*result.played) + "." : "Playing.";
        case music::play_status::disconnected:
            return "I am not connected to a voice channel.";
        case music::play_status::acquisition_failed:
            return result.played ? "Could not load " + describe_track(*result.played) + "."
                                 : "Could not load the next song.";
        case music::play_status::exhausted:
        default:
            return "Nothing left to play.";
    }
}

std::string describe_queue(const std::optional<music::track>& current,
                           const std::vector<music::track>& queue,
                           const std::vector<music::track>& autoplay,
                           bool autoplay_enabled)
{
    std::ostringstream oss;

    if (current) {
        oss << "Now playing: " << describe_track(*current) << "\n";
    } else {
        oss << "Nothing is playing.\n";
    }

    if (queue.empty()) {
        oss << "The queue is empty.\n";
    } else {
        oss << "\nUp next:\n";
        for (std::size_t i = 0; i < queue.size() && i < queue_display_limit; ++i) {
            oss << (i + 1) << ". " << describe_track(queue[i]) << "\n";
        }
        if (queue.size() > queue_display_limit) {
            oss << "...and " << (queue.size() - queue_display_limit) << " more\n";
        }
    }

    if (autoplay_enabled) {
        oss << "\nAutoplay: on";
        if (!autoplay.empty()) {
            oss << "\n";
            for (std::size_t i = 0; i < autoplay.size() && i < autoplay_display_limit; ++i) {
                oss << "- " << describe_track(autoplay[i]) << "\n";
            }
        }
    } else {
        oss << "\nAutoplay: off";
    }

    return oss.str();
}

std::string describe_now_playing(const music::track& current,
                                 std::optional<std::int64_t> elapsed,
                                 bool paused,
                                 std::pair<int, int> likes_dislikes)
{
    std::ostringstream oss;
    oss << (paused ? "Paused: " : "Now playing: ") << describe_track(current) << "\n"
        << util::render_progress_bar(elapsed.value_or(0), current.duration) << "\n"
        << likes_dislikes.first << " likes, " << likes_dislikes.second << " dislikes";
    if (!current.page_url.empty()) {
        oss << "\n<" << current.page_url << ">";
    }
    return oss.str();
}

} // namespace jb::commands
