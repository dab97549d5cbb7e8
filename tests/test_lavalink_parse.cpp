#include "jb/lavalink/client.hpp"
#include "jb/lavalink/resolver.hpp"

#include <gtest/gtest.h>

using namespace jb::lavalink;

namespace {

const char* track_json = R"({
    "encoded": "QAAA1",
    "info": {
        "identifier": "dQw4w9WgXcQ",
        "title": "Never Gonna Give You Up",
        "author": "Rick Astley",
        "uri": "https://www.youtube.com/watch?v=dQw4w9WgXcQ",
        "artworkUrl": "https://i.ytimg.com/vi/dQw4w9WgXcQ/hq.jpg",
        "length": 212000,
        "isStream": false,
        "sourceName": "youtube"
    }
})";

} // namespace

// A single track result keeps every field
TEST(LavalinkParse, TrackResult)
{
    const auto res = parse_load_result(std::string(R"({"loadType":"track","data":)") + track_json + "}");

    ASSERT_EQ(res.type, load_type::track);
    ASSERT_EQ(res.tracks.size(), 1u);
    const auto& t = res.tracks.front();
    EXPECT_EQ(t.encoded, "QAAA1");
    EXPECT_EQ(t.identifier, "dQw4w9WgXcQ");
    EXPECT_EQ(t.title, "Never Gonna Give You Up");
    EXPECT_EQ(t.author, "Rick Astley");
    EXPECT_EQ(t.length_ms, 212000);
    EXPECT_FALSE(t.is_stream);
    EXPECT_EQ(t.source, "youtube");
    EXPECT_EQ(t.artwork_url, "https://i.ytimg.com/vi/dQw4w9WgXcQ/hq.jpg");
}

// Search results are an array; null artwork is tolerated
TEST(LavalinkParse, SearchResult)
{
    const auto res = parse_load_result(std::string(R"({"loadType":"search","data":[)") + track_json +
        R"(,{"encoded":"QAAA2","info":{"identifier":"abc","title":"Live","author":"X",)"
        R"("uri":"u","artworkUrl":null,"length":0,"isStream":true}}]})");

    ASSERT_EQ(res.type, load_type::search);
    ASSERT_EQ(res.tracks.size(), 2u);
    EXPECT_TRUE(res.tracks[1].is_stream);
    EXPECT_TRUE(res.tracks[1].artwork_url.empty());
}

// Playlist results carry the name and all tracks
TEST(LavalinkParse, PlaylistResult)
{
    const auto res = parse_load_result(std::string(R"({"loadType":"playlist","data":{"info":{"name":"Mix"},"tracks":[)") +
                                       track_json + "," + track_json + "]}}");

    ASSERT_EQ(res.type, load_type::playlist);
    EXPECT_EQ(res.playlist_name, "Mix");
    EXPECT_EQ(res.tracks.size(), 2u);
}

// Empty bodies and empty results carry no tracks
TEST(LavalinkParse, EmptyResult)
{
    EXPECT_EQ(parse_load_result("").type, load_type::empty);

    const auto res = parse_load_result(R"({"loadType":"empty","data":{}})");
    EXPECT_EQ(res.type, load_type::empty);
    EXPECT_TRUE(res.tracks.empty());
}

// Errors keep the message and the cause
TEST(LavalinkParse, ErrorResult)
{
    const auto res = parse_load_result(
        R"({"loadType":"error","data":{"message":"Something broke","severity":"fault","cause":"IOException"}})");

    EXPECT_EQ(res.type, load_type::error);
    EXPECT_EQ(res.error_message, "Something broke (IOException)");
}

// Garbage never throws; it turns into an error result
TEST(LavalinkParse, MalformedBodies)
{
    EXPECT_EQ(parse_load_result("{not json").type, load_type::error);
    EXPECT_EQ(parse_load_result("[1,2,3]").type, load_type::error);

    const auto unknown = parse_load_result(R"({"loadType":"mystery"})");
    EXPECT_EQ(unknown.type, load_type::error);
    EXPECT_NE(unknown.error_message.find("mystery"), std::string::npos);

    const auto bad_track = parse_load_result(R"({"loadType":"track","data":{"encoded":5}})");
    EXPECT_EQ(bad_track.type, load_type::error);
    EXPECT_TRUE(bad_track.tracks.empty());
}

// Player state reads track, pause, volume and position
TEST(LavalinkParse, PlayerState)
{
    const auto ps = parse_player_state(
        R"({"guildId":"111","track":{"encoded":"QAAA1"},"volume":40,"paused":true,)"
        R"("state":{"time":1,"position":61000,"connected":true,"ping":20}})");

    ASSERT_TRUE(ps.has_value());
    EXPECT_TRUE(ps->has_track);
    EXPECT_EQ(ps->track_encoded, "QAAA1");
    EXPECT_TRUE(ps->paused);
    EXPECT_EQ(ps->volume, 40);
    EXPECT_EQ(ps->position_ms, 61000);
    EXPECT_TRUE(ps->connected);
}

// An idle player has no track; non-player bodies are rejected
TEST(LavalinkParse, PlayerStateIdleAndInvalid)
{
    const auto idle = parse_player_state(R"({"guildId":"111","track":null,"volume":100,"paused":false})");
    ASSERT_TRUE(idle.has_value());
    EXPECT_FALSE(idle->has_track);
    EXPECT_FALSE(idle->connected);

    EXPECT_FALSE(parse_player_state("oops").has_value());
    EXPECT_FALSE(parse_player_state(R"({"timestamp":1,"status":404})").has_value());
}

// Lavalink track info maps onto a playable track
TEST(LavalinkResolve, ToTrack)
{
    track_info info;
    info.encoded    = "QAAA1";
    info.identifier = "dQw4w9WgXcQ";
    info.title      = "Song";
    info.author     = "Band";
    info.uri        = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
    info.length_ms  = 212999;

    const auto t = to_track(info);
    EXPECT_EQ(t.identifier, "dQw4w9WgXcQ");
    EXPECT_EQ(t.encoded, "QAAA1");
    EXPECT_EQ(t.duration, 212);
    EXPECT_EQ(t.page_url, info.uri);

    info.is_stream = true;
    EXPECT_EQ(to_track(info).duration, 0);
}

// Only plain HTTP files are worth downloading
TEST(LavalinkResolve, CacheableOnlyForDirectMedia)
{
    track_info info;
    info.identifier = "dQw4w9WgXcQ";
    info.uri        = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
    info.source     = "youtube";
    EXPECT_FALSE(to_track(info).cacheable);

    info.identifier = "https://files.example.com/song.mp3";
    info.uri        = "https://files.example.com/song.mp3";
    info.source     = "http";
    EXPECT_TRUE(to_track(info).cacheable);

    info.is_stream = true;
    EXPECT_FALSE(to_track(info).cacheable);
}

// Load results map to resolve statuses
TEST(LavalinkResolve, ToResolveResult)
{
    load_result found;
    found.type = load_type::search;
    track_info info;
    info.identifier = "first";
    found.tracks.push_back(info);
    info.identifier = "second";
    found.tracks.push_back(info);

    const auto ok = to_resolve_result(found);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value->identifier, "first");

    load_result empty;
    empty.type = load_type::empty;
    EXPECT_EQ(to_resolve_result(empty).status, jb::music::resolve_status::not_found);

    load_result no_tracks;
    no_tracks.type = load_type::search;
    EXPECT_EQ(to_resolve_result(no_tracks).status, jb::music::resolve_status::not_found);

    load_result failed;
    failed.type = load_type::error;
    failed.error_message = "This video is unavailable";
    const auto err = to_resolve_result(failed);
    EXPECT_EQ(err.status, jb::music::resolve_status::error);
    EXPECT_EQ(err.error_message, "This video is unavailable");
}

// Errors about a missing JavaScript runtime get their own status
TEST(LavalinkResolve, MissingRuntime)
{
    load_result failed;
    failed.type = load_type::error;
    failed.error_message = "Signature decoding failed: no JavaScript runtime found";
    EXPECT_EQ(to_resolve_result(failed).status, jb::music::resolve_status::missing_runtime);

    failed.error_message = "Deno is missing";
    EXPECT_EQ(to_resolve_result(failed).status, jb::music::resolve_status::missing_runtime);

    failed.error_message = "Runtime exception";
    EXPECT_EQ(to_resolve_result(failed).status, jb::music::resolve_status::error);
}

TEST(LavalinkResolve, VideoIds)
{
    EXPECT_TRUE(is_video_id("dQw4w9WgXcQ"));
    EXPECT_TRUE(is_video_id("a-b_c1234XY"));
    EXPECT_FALSE(is_video_id("dQw4w9WgXc"));
    EXPECT_FALSE(is_video_id("dQw4w9WgXcQQ"));
    EXPECT_FALSE(is_video_id("dQw4w9 gXcQ"));
    EXPECT_FALSE(is_video_id("never gonna"));
}
