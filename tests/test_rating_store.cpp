#include "jb/music/rating_store.hpp"

#include <gtest/gtest.h>

#include <utility>

using namespace jb::music;

namespace {

const dpp::snowflake guild_a = 111;
const dpp::snowflake guild_b = 222;
const dpp::snowflake alice   = 1;
const dpp::snowflake bob     = 2;
const dpp::snowflake carol   = 3;

} // namespace

TEST(RatingStoreTest, OnlyPlusOrMinusOneAccepted)
{
    memory_rating_store store;
    EXPECT_FALSE(store.rate(guild_a, "t1", alice, 0));
    EXPECT_FALSE(store.rate(guild_a, "t1", alice, 2));
    EXPECT_FALSE(store.rate(guild_a, "", alice, 1));
    EXPECT_TRUE(store.rate(guild_a, "t1", alice, 1));
    EXPECT_TRUE(store.rate(guild_a, "t1", bob, -1));
}

TEST(RatingStoreTest, LastVoteWins)
{
    memory_rating_store store;
    store.rate(guild_a, "t1", alice, 1);
    store.rate(guild_a, "t1", alice, -1);

    EXPECT_EQ(store.score(guild_a, "t1"), -1);
    EXPECT_EQ(store.user_rating(guild_a, "t1", alice), -1);
    EXPECT_EQ(store.counts(guild_a, "t1"), std::make_pair(0, 1));
}

TEST(RatingStoreTest, ScoresAreSummedPerSession)
{
    memory_rating_store store;
    store.rate(guild_a, "t1", alice, 1);
    store.rate(guild_a, "t1", bob, 1);
    store.rate(guild_a, "t1", carol, -1);
    store.rate(guild_a, "t2", alice, -1);
    store.rate(guild_b, "t1", alice, -1);

    EXPECT_EQ(store.score(guild_a, "t1"), 1);
    EXPECT_EQ(store.counts(guild_a, "t1"), std::make_pair(2, 1));

    const rating_map a = store.get_ratings_for_session(guild_a);
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(a.at("t1"), 1);
    EXPECT_EQ(a.at("t2"), -1);

    const rating_map b = store.get_ratings_for_session(guild_b);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b.at("t1"), -1);
}

TEST(RatingStoreTest, RemoveRating)
{
    memory_rating_store store;
    store.rate(guild_a, "t1", alice, 1);

    EXPECT_TRUE(store.remove_rating(guild_a, "t1", alice));
    EXPECT_FALSE(store.remove_rating(guild_a, "t1", alice));
    EXPECT_FALSE(store.user_rating(guild_a, "t1", alice).has_value());
    EXPECT_EQ(store.score(guild_a, "t1"), 0);
    EXPECT_TRUE(store.get_ratings_for_session(guild_a).empty());
}

TEST(RatingStoreTest, UnknownSessionIsEmpty)
{
    memory_rating_store store;
    EXPECT_EQ(store.score(guild_b, "x"), 0);
    EXPECT_EQ(store.counts(guild_b, "x"), std::make_pair(0, 0));
    EXPECT_TRUE(store.get_ratings_for_session(guild_b).empty());
}
