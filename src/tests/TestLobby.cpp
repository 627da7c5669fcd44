#include <gtest/gtest.h>

#include "../core/Exception.hpp"
#include "../net/Lobby.hpp"

using ddz::core::net::Lobby;

TEST(Lobby_Join, FullGroupLeavesInArrivalOrder)
{
    Lobby lobby;
    auto a = lobby.Join(10, "ann");
    auto b = lobby.Join(11, "bo");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_FALSE(a->has_value());
    EXPECT_FALSE(b->has_value());
    EXPECT_EQ(lobby.PositionOf(11), 2);

    auto c = lobby.Join(12, "cy");
    ASSERT_TRUE(c.has_value());
    ASSERT_TRUE(c->has_value());
    auto const& group = **c;
    ASSERT_EQ(group.size(), 3u);
    EXPECT_EQ(group[0].id, 10u);
    EXPECT_EQ(group[1].name, "bo");
    EXPECT_EQ(group[2].id, 12u);
    EXPECT_TRUE(lobby.Waiting().empty());
}

TEST(Lobby_Join, DuplicateIsRejected)
{
    Lobby lobby;
    ASSERT_TRUE(lobby.Join(1, "x").has_value());
    auto const again = lobby.Join(1, "x");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), "already waiting");
    EXPECT_EQ(lobby.Waiting().size(), 1u);
}

TEST(Lobby_Leave, QueueCloses)
{
    Lobby lobby;
    (void)lobby.Join(1, "a");
    (void)lobby.Join(2, "b");
    EXPECT_TRUE(lobby.Leave(1));
    EXPECT_FALSE(lobby.Leave(1));
    EXPECT_FALSE(lobby.Contains(1));
    EXPECT_EQ(lobby.PositionOf(2), 1);
    EXPECT_FALSE(lobby.PositionOf(1).has_value());
}

TEST(Lobby_Leave, LeaverIsNotSeated)
{
    Lobby lobby;
    (void)lobby.Join(1, "a");
    (void)lobby.Join(2, "b");
    ASSERT_TRUE(lobby.Leave(1));
    (void)lobby.Join(3, "c");

    auto const full = lobby.Join(4, "d");
    ASSERT_TRUE(full.has_value());
    ASSERT_TRUE(full->has_value());
    auto const& group = **full;
    ASSERT_EQ(group.size(), 3u);
    EXPECT_EQ(group[0].id, 2u);
    EXPECT_EQ(group[1].id, 3u);
    EXPECT_EQ(group[2].id, 4u);

    // a leaver may queue again
    auto const back = lobby.Join(1, "a");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(lobby.PositionOf(1), 1);
}

TEST(Lobby_Join, BotsFillTheRest)
{
    Lobby solo(1);
    auto const r = solo.Join(5, "only");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_EQ((*r)->size(), 1u);

    EXPECT_THROW(Lobby{0}, ddz::core::error::AssertionError);
    EXPECT_THROW(Lobby{4}, ddz::core::error::AssertionError);
}
