#include "jb/music/session_registry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <thread>

#include "fakes.hpp"

using namespace jb;
using namespace jb::music;
using namespace jb::testing;
using namespace std::chrono_literals;

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dl.fail_all(true);

        cache_config cfg;
        cfg.directory = dir.path() / "cache";
        cache = std::make_unique<prefetch_cache>(cfg, dl, pool);

        registry = std::make_unique<session_registry>(
            session_registry::dependencies{resolver, catalog, ratings, *cache, voice, loop, pool});
    }

    void TearDown() override
    {
        pool.wait_idle();
    }

    const dpp::snowflake guild_a   = 111;
    const dpp::snowflake guild_b   = 222;
    const dpp::snowflake channel_1 = 9001;
    const dpp::snowflake channel_2 = 9002;

    temp_dir                dir;
    fake_downloader         dl;
    core::worker_pool       pool{2};
    core::event_loop        loop;
    fake_resolver           resolver;
    fake_catalog            catalog;
    memory_rating_store     ratings;
    fake_voice              voice;

    std::unique_ptr<prefetch_cache>   cache;
    std::unique_ptr<session_registry> registry;
};

// Sessions are created on first use and reused afterwards
TEST_F(SessionRegistryTest, CreateOnFirstUse)
{
    EXPECT_EQ(registry->size(), 0u);
    auto first = registry->get(guild_a);
    auto again = registry->get(guild_a);
    EXPECT_EQ(first, again);
    EXPECT_EQ(registry->size(), 1u);

    registry->get(guild_b);
    EXPECT_EQ(registry->size(), 2u);
}

// Connect attaches a sink; same channel is a no-op, another channel re-joins
TEST_F(SessionRegistryTest, ConnectAndMove)
{
    EXPECT_FALSE(registry->is_connected(guild_a));

    ASSERT_TRUE(registry->connect(guild_a, channel_1));
    EXPECT_TRUE(registry->is_connected(guild_a));
    EXPECT_EQ(registry->connected_channel(guild_a), channel_1);
    EXPECT_EQ(voice.join_count(), 1u);

    EXPECT_TRUE(registry->connect(guild_a, channel_1));
    EXPECT_EQ(voice.join_count(), 1u);

    EXPECT_TRUE(registry->connect(guild_a, channel_2));
    EXPECT_EQ(voice.join_count(), 2u);
    EXPECT_EQ(registry->connected_channel(guild_a), channel_2);
}

// A failed join leaves the session disconnected
TEST_F(SessionRegistryTest, JoinFailure)
{
    voice.set_fail_join(true);
    EXPECT_FALSE(registry->connect(guild_a, channel_1));
    EXPECT_FALSE(registry->is_connected(guild_a));
    EXPECT_FALSE(registry->connected_channel(guild_a).has_value());
}

// Operations on one guild never show up in another
TEST_F(SessionRegistryTest, SessionsAreIsolated)
{
    ASSERT_TRUE(registry->connect(guild_a, channel_1));
    ASSERT_TRUE(registry->connect(guild_b, channel_2));

    registry->enqueue(guild_a, make_track("a1"));
    registry->enqueue(guild_a, make_track("a2"));
    registry->enqueue(guild_b, make_track("b1"));

    ASSERT_TRUE(registry->play_next(guild_a).ok());
    registry->toggle_autoplay(guild_a);
    registry->set_volume(guild_a, 40);

    EXPECT_EQ(registry->get_queue(guild_b).size(), 1u);
    EXPECT_EQ(registry->get_queue(guild_b).front().identifier, "b1");
    EXPECT_FALSE(registry->get_current_track(guild_b).has_value());
    EXPECT_FALSE(registry->autoplay_enabled(guild_b));
    EXPECT_EQ(registry->get_volume(guild_b), 100);
    EXPECT_TRUE(registry->get(guild_b)->recent_history().empty());

    registry->disconnect(guild_a);
    EXPECT_EQ(registry->get_queue(guild_b).size(), 1u);
    EXPECT_TRUE(registry->is_connected(guild_b));
    EXPECT_FALSE(registry->is_connected(guild_a));
}

// start_if_idle plays once and reports what is already playing afterwards
TEST_F(SessionRegistryTest, StartIfIdle)
{
    ASSERT_TRUE(registry->connect(guild_a, channel_1));
    registry->enqueue(guild_a, make_track("x"));
    registry->enqueue(guild_a, make_track("y"));

    auto first = registry->start_if_idle(guild_a);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.played->identifier, "x");

    auto second = registry->start_if_idle(guild_a);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.played->identifier, "x");
    EXPECT_EQ(registry->get_queue(guild_a).size(), 1u);
}

// Two requests racing on an idle session start only the first track
TEST_F(SessionRegistryTest, ConcurrentStartIfIdlePlaysOnce)
{
    for (std::uint64_t id = 500; id < 520; ++id) {
        const dpp::snowflake guild = id;
        ASSERT_TRUE(registry->connect(guild, channel_1));
        registry->enqueue(guild, make_track("A"));
        registry->enqueue(guild, make_track("B"));

        play_result r1;
        play_result r2;
        std::thread first([&] { r1 = registry->start_if_idle(guild); });
        std::thread second([&] { r2 = registry->start_if_idle(guild); });
        first.join();
        second.join();

        EXPECT_EQ(voice.sink_for(guild)->plays().size(), 1u);
        EXPECT_EQ(registry->get_current_track(guild)->identifier, "A");
        ASSERT_EQ(registry->get_queue(guild).size(), 1u);
        EXPECT_EQ(registry->get_queue(guild).front().identifier, "B");
        EXPECT_EQ(r1.played->identifier, "A");
        EXPECT_EQ(r2.played->identifier, "A");
    }
}

// disconnect tears the session down and leaves voice
TEST_F(SessionRegistryTest, DisconnectLeavesVoice)
{
    ASSERT_TRUE(registry->connect(guild_a, channel_1));
    registry->enqueue(guild_a, make_track("x"));
    registry->enqueue(guild_a, make_track("y"));
    ASSERT_TRUE(registry->play_next(guild_a).ok());

    registry->disconnect(guild_a);

    EXPECT_TRUE(registry->get_queue(guild_a).empty());
    EXPECT_FALSE(registry->get_current_track(guild_a).has_value());
    EXPECT_EQ(voice.leaves(), (std::vector<dpp::snowflake>{guild_a}));
    EXPECT_FALSE(registry->connected_channel(guild_a).has_value());

    // a voice state update for our own leave is not a forced removal
    EXPECT_FALSE(registry->handle_forced_disconnect(guild_a));
}

// Being removed from voice clears the session like disconnect
TEST_F(SessionRegistryTest, ForcedDisconnect)
{
    ASSERT_TRUE(registry->connect(guild_a, channel_1));
    registry->enqueue(guild_a, make_track("x"));
    registry->enqueue(guild_a, make_track("y"));
    ASSERT_TRUE(registry->play_next(guild_a).ok());

    EXPECT_TRUE(registry->handle_forced_disconnect(guild_a));
    EXPECT_TRUE(registry->get_queue(guild_a).empty());
    EXPECT_FALSE(registry->is_connected(guild_a));
    EXPECT_FALSE(registry->handle_forced_disconnect(guild_b));
}

// The idle timer disconnects through the registry
TEST_F(SessionRegistryTest, IdleTimeoutDisconnects)
{
    music::player_config cfg;
    cfg.idle_disconnect = 20ms;
    session_registry short_idle(
        session_registry::dependencies{resolver, catalog, ratings, *cache, voice, loop, pool}, cfg);

    ASSERT_TRUE(short_idle.connect(guild_a, channel_1));
    EXPECT_EQ(short_idle.play_next(guild_a).status, play_status::exhausted);

    std::this_thread::sleep_for(50ms);
    loop.poll();

    EXPECT_FALSE(short_idle.is_connected(guild_a));
    EXPECT_FALSE(short_idle.connected_channel(guild_a).has_value());
    EXPECT_EQ(voice.leaves().size(), 1u);
}

// Controls are routed to the right session
TEST_F(SessionRegistryTest, ControlsForwarded)
{
    ASSERT_TRUE(registry->connect(guild_a, channel_1));
    registry->enqueue(guild_a, make_track("x"));
    registry->enqueue(guild_a, make_track("y"));
    ASSERT_TRUE(registry->play_next(guild_a).ok());

    EXPECT_TRUE(registry->is_playing(guild_a));
    EXPECT_TRUE(registry->pause(guild_a));
    EXPECT_TRUE(registry->is_paused(guild_a));
    EXPECT_TRUE(registry->resume(guild_a));
    EXPECT_TRUE(registry->elapsed_seconds(guild_a).has_value());
    EXPECT_EQ(registry->shuffle_queue(guild_a), 1u);

    EXPECT_TRUE(registry->skip(guild_a));
    loop.poll();
    EXPECT_EQ(registry->get_current_track(guild_a)->identifier, "y");

    registry->clear_history(guild_a);
    EXPECT_TRUE(registry->get(guild_a)->recent_history().empty());
    EXPECT_TRUE(registry->get_autoplay_queue(guild_a).empty());

    EXPECT_FALSE(registry->is_playing(guild_b));
}
