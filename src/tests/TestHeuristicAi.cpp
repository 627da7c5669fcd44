#include <gtest/gtest.h>
#include <memory>
#include <variant>

#include "../core/HeuristicAi.hpp"
#include "TestCards.hpp"

using namespace ddz::core;
using namespace ddz::test;

namespace
{
    auto Last(Cards cards, PlyrIdxT seat = 1) -> std::optional<PlayRecord>
    {
        auto const shape = Classify(cards);
        return PlayRecord{std::move(cards), seat, *shape};
    }
}

TEST(HeuristicAi_Bid, PolicyDrivesTheDecision)
{
    AiPolicy always{};
    always.open_bid_chance = 1.0;
    always.raise_bid_chance = 1.0;
    AiPolicy never{};
    never.open_bid_chance = 0.0;
    never.raise_bid_chance = 0.0;

    HeuristicAI yes(1, always), no(1, never);
    for (uint8_t bid = 0; bid < constants::MaxBid; ++bid)
    {
        EXPECT_TRUE(yes.DecideBid(bid));
        EXPECT_FALSE(no.DecideBid(bid));
    }
}

TEST(HeuristicAi_Lead, SmallShapedHandGoesOut)
{
    HeuristicAI ai(7);
    Cards const hand = Join({Of(Rank::Seven, 3), {S(Rank::Three)}});
    auto const p = ai.DecidePlay(hand, std::nullopt);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->size(), 4u);
}

TEST(HeuristicAi_Lead, OtherwiseWeakestShape)
{
    HeuristicAI ai(7);
    Cards const hand{S(Rank::King), D(Rank::Four), H(Rank::Nine), S(Rank::Nine), BigJoker()};
    auto const p = ai.DecidePlay(hand, std::nullopt);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->size(), 1u);
    EXPECT_EQ(p->front().rank, Rank::Four);
}

TEST(HeuristicAi_Follow, PrefersOrdinaryShapesOverBombs)
{
    HeuristicAI ai(7);
    Cards const hand = Join({Of(Rank::Nine, 2), Of(Rank::Five, 4)});
    auto const p = ai.DecidePlay(hand, Last(Of(Rank::Six, 2)));
    ASSERT_TRUE(p.has_value());
    auto const shape = Classify(*p);
    ASSERT_TRUE(shape.has_value());
    EXPECT_EQ(shape->type, ShapeType::Pair);
    EXPECT_EQ(shape->primary, Rank::Nine);
}

TEST(HeuristicAi_Follow, SpendsBombWithSmallHand)
{
    HeuristicAI ai(7);
    Cards const hand = Join({Of(Rank::Five, 4), {S(Rank::Three)}});
    auto const p = ai.DecidePlay(hand, Last(Of(Rank::Six, 2)));
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(Classify(*p)->type, ShapeType::Bomb);
}

TEST(HeuristicAi_Follow, HoldsBombWhenPolicySaysSo)
{
    AiPolicy hold{};
    hold.bomb_spend_chance = 0.0;
    HeuristicAI ai(7, hold);
    Cards const hand = Join({Of(Rank::Five, 4),
                             {S(Rank::Three), S(Rank::Four), S(Rank::Eight), S(Rank::Jack), S(Rank::King)}});
    EXPECT_FALSE(ai.DecidePlay(hand, Last(Of(Rank::Ace, 2))).has_value());
}

TEST(HeuristicAi_Follow, PassesWhenNothingBeats)
{
    HeuristicAI ai(7);
    Cards const hand{S(Rank::Three), S(Rank::Four)};
    EXPECT_FALSE(ai.DecidePlay(hand, Last({BigJoker()})).has_value());
}

TEST(HeuristicAi_Play, ActionFollowsPhase)
{
    AiPolicy always{};
    always.open_bid_chance = 1.0;
    HeuristicAI ai(3, always);

    auto snap = std::make_shared<GameSnapshot>();
    snap->phase = Phase::Bidding;
    snap->my_hand = {S(Rank::Three)};
    auto const bid = ai.Play(snap, std::chrono::steady_clock::now());
    ASSERT_TRUE(std::holds_alternative<BidAction>(bid));
    EXPECT_TRUE(std::get<BidAction>(bid).wants_to_bid);

    snap->phase = Phase::Playing;
    snap->last_play = Last({BigJoker()});
    EXPECT_TRUE(std::holds_alternative<PassAction>(ai.Play(snap, std::chrono::steady_clock::now())));

    snap->last_play.reset();
    auto const lead = ai.Play(snap, std::chrono::steady_clock::now());
    ASSERT_TRUE(std::holds_alternative<PlayAction>(lead));
    EXPECT_EQ(std::get<PlayAction>(lead).cards.size(), 1u);
}
