#include <gtest/gtest.h>
#include <optional>

#include "../core/HandShape.hpp"
#include "TestCards.hpp"

using namespace ddz::core;
using namespace ddz::test;

namespace
{
    auto Shape(Cards const& cards) -> std::optional<HandShape>
    {
        return Classify(cards);
    }

    auto Expect(Cards const& cards, ShapeType type, Rank primary) -> void
    {
        auto const s = Shape(cards);
        ASSERT_TRUE(s.has_value()) << "no shape for " << cards.size() << " cards";
        EXPECT_EQ(s->type, type) << to_string(s->type);
        EXPECT_EQ(s->primary, primary);
        EXPECT_EQ(s->card_count, cards.size());
    }
}

TEST(HandShape_Classify, TripleWithSingleBombAndRocket)
{
    Expect({S(Rank::Three), H(Rank::Three), C(Rank::Three), D(Rank::Five)}, ShapeType::TripleSingle, Rank::Three);
    Expect({S(Rank::Three), H(Rank::Three), C(Rank::Three), D(Rank::Three)}, ShapeType::Bomb, Rank::Three);
    Expect({SmallJoker(), BigJoker()}, ShapeType::Rocket, Rank::BigJoker);
}

TEST(HandShape_Classify, Sets)
{
    Expect({D(Rank::Two)}, ShapeType::Single, Rank::Two);
    Expect({SmallJoker()}, ShapeType::Single, Rank::SmallJoker);
    Expect(Of(Rank::King, 2), ShapeType::Pair, Rank::King);
    Expect(Of(Rank::Nine, 3), ShapeType::Triple, Rank::Nine);
    Expect(Join({Of(Rank::Jack, 3), Of(Rank::Four, 2)}), ShapeType::TriplePair, Rank::Jack);
}

TEST(HandShape_Classify, EmptyAndJunkAreIllegal)
{
    EXPECT_FALSE(Shape({}).has_value());
    EXPECT_FALSE(Shape({S(Rank::Three), S(Rank::Four)}).has_value());
    EXPECT_FALSE(Shape({SmallJoker(), S(Rank::Two)}).has_value());
    // triple with two different singles
    EXPECT_FALSE(Shape(Join({Of(Rank::Five, 3), {S(Rank::Six), S(Rank::Seven)}})).has_value());
}

TEST(HandShape_Classify, StraightBoundaries)
{
    Expect(ddz::test::Run(Rank::Three, Rank::Seven), ShapeType::Straight, Rank::Seven);
    Expect(ddz::test::Run(Rank::Ten, Rank::Ace), ShapeType::Straight, Rank::Ace);
    Expect(ddz::test::Run(Rank::Three, Rank::Ace), ShapeType::Straight, Rank::Ace);

    // too short
    EXPECT_FALSE(Shape(ddz::test::Run(Rank::Three, Rank::Six)).has_value());
    // 2 never sits in a chain
    EXPECT_FALSE(Shape(ddz::test::Run(Rank::Jack, Rank::Two)).has_value());
    // gap
    EXPECT_FALSE(Shape({S(Rank::Three), S(Rank::Four), S(Rank::Five), S(Rank::Six), S(Rank::Eight)}).has_value());
}

TEST(HandShape_Classify, PairStraight)
{
    Expect(ddz::test::Run(Rank::Three, Rank::Five, 2), ShapeType::PairStraight, Rank::Five);
    Expect(ddz::test::Run(Rank::Queen, Rank::Ace, 2), ShapeType::PairStraight, Rank::Ace);
    EXPECT_FALSE(Shape(ddz::test::Run(Rank::Three, Rank::Four, 2)).has_value());
    EXPECT_FALSE(Shape(ddz::test::Run(Rank::King, Rank::Two, 2)).has_value());
}

TEST(HandShape_Classify, Airplanes)
{
    Expect(ddz::test::Run(Rank::Three, Rank::Four, 3), ShapeType::Airplane, Rank::Four);
    Expect(Join({ddz::test::Run(Rank::Three, Rank::Four, 3), {S(Rank::Nine), S(Rank::Jack)}}),
           ShapeType::AirplaneSingles, Rank::Four);
    Expect(Join({ddz::test::Run(Rank::Seven, Rank::Nine, 3), Of(Rank::Three, 2), Of(Rank::Four, 2), Of(Rank::Ace, 2)}),
           ShapeType::AirplanePairs, Rank::Nine);

    // run through 2 is not an airplane
    EXPECT_FALSE(Shape(Join({Of(Rank::Ace, 3), Of(Rank::Two, 3)})).has_value());
    // wing count must match run length
    EXPECT_FALSE(Shape(Join({ddz::test::Run(Rank::Three, Rank::Four, 3), {S(Rank::Nine)}})).has_value());
    // pair wings must be pairs
    EXPECT_FALSE(Shape(Join({ddz::test::Run(Rank::Three, Rank::Four, 3), Of(Rank::Nine, 3), {S(Rank::Ten)}})).has_value());
}

TEST(HandShape_Classify, FourWithTwo)
{
    Expect(Join({Of(Rank::Six, 4), {S(Rank::Three), S(Rank::King)}}), ShapeType::FourTwoSingles, Rank::Six);
    Expect(Join({Of(Rank::Six, 4), Of(Rank::Three, 2), Of(Rank::King, 2)}), ShapeType::FourTwoPairs, Rank::Six);
    EXPECT_FALSE(Shape(Join({Of(Rank::Six, 4), {S(Rank::Three)}})).has_value());
}

TEST(HandShape_Matchers, EachMatcherInIsolation)
{
    auto const counts = [](Cards const& c) { return CountRanks(c); };

    EXPECT_TRUE(matchers::MatchRocket(counts({SmallJoker(), BigJoker()})).has_value());
    EXPECT_FALSE(matchers::MatchRocket(counts({SmallJoker()})).has_value());

    EXPECT_TRUE(matchers::MatchBomb(counts(Of(Rank::Two, 4))).has_value());
    EXPECT_FALSE(matchers::MatchBomb(counts(Of(Rank::Two, 3))).has_value());

    EXPECT_TRUE(matchers::MatchSet(counts(Of(Rank::Ten, 2))).has_value());
    EXPECT_FALSE(matchers::MatchSet(counts(Of(Rank::Ten, 4))).has_value());

    EXPECT_TRUE(matchers::MatchTripleWithKicker(counts(Join({Of(Rank::Ten, 3), {S(Rank::Ace)}}))).has_value());
    EXPECT_FALSE(matchers::MatchTripleWithKicker(counts(Of(Rank::Ten, 3))).has_value());

    EXPECT_TRUE(matchers::MatchStraight(counts(ddz::test::Run(Rank::Five, Rank::Nine))).has_value());
    EXPECT_FALSE(matchers::MatchStraight(counts(ddz::test::Run(Rank::Five, Rank::Seven, 2))).has_value());

    EXPECT_TRUE(matchers::MatchPairStraight(counts(ddz::test::Run(Rank::Five, Rank::Seven, 2))).has_value());
    EXPECT_TRUE(matchers::MatchAirplane(counts(ddz::test::Run(Rank::Five, Rank::Six, 3))).has_value());
    EXPECT_TRUE(matchers::MatchFourWithTwo(counts(Join({Of(Rank::Five, 4), Of(Rank::Six, 2)}))).has_value());
}

TEST(HandShape_Beats, SameTypeHigherPrimary)
{
    auto const p5 = *Shape(Of(Rank::Five, 2));
    auto const p7 = *Shape(Of(Rank::Seven, 2));
    EXPECT_TRUE(Beats(p7, p5));
    EXPECT_FALSE(Beats(p5, p7));
    EXPECT_FALSE(Beats(p5, p5));

    auto const two = *Shape({S(Rank::Two)});
    auto const ace = *Shape({S(Rank::Ace)});
    auto const sj = *Shape({SmallJoker()});
    auto const bj = *Shape({BigJoker()});
    EXPECT_TRUE(Beats(two, ace));
    EXPECT_TRUE(Beats(sj, two));
    EXPECT_TRUE(Beats(bj, sj));
}

TEST(HandShape_Beats, ChainsNeedTheSameLength)
{
    auto const five = *Shape(ddz::test::Run(Rank::Three, Rank::Seven));
    auto const six = *Shape(ddz::test::Run(Rank::Four, Rank::Nine));
    auto const higher_five = *Shape(ddz::test::Run(Rank::Four, Rank::Eight));
    EXPECT_FALSE(Beats(six, five));
    EXPECT_TRUE(Beats(higher_five, five));
}

TEST(HandShape_Beats, TypeMismatchLoses)
{
    auto const pair = *Shape(Of(Rank::Three, 2));
    auto const triple = *Shape(Of(Rank::King, 3));
    EXPECT_FALSE(Beats(triple, pair));
    EXPECT_FALSE(Beats(pair, triple));
}

TEST(HandShape_Beats, BombsAndRocket)
{
    auto const rocket = *Shape({SmallJoker(), BigJoker()});
    auto const bomb3 = *Shape(Of(Rank::Three, 4));
    auto const bomb2 = *Shape(Of(Rank::Two, 4));
    auto const straight = *Shape(ddz::test::Run(Rank::Ten, Rank::Ace));
    auto const twos = *Shape(Of(Rank::Two, 2));

    EXPECT_TRUE(Beats(bomb3, straight));
    EXPECT_TRUE(Beats(bomb3, twos));
    EXPECT_TRUE(Beats(bomb2, bomb3));
    EXPECT_FALSE(Beats(bomb3, bomb2));
    EXPECT_FALSE(Beats(straight, bomb3));

    EXPECT_TRUE(Beats(rocket, bomb2));
    EXPECT_TRUE(Beats(rocket, straight));
    EXPECT_FALSE(Beats(bomb2, rocket));
    EXPECT_FALSE(Beats(rocket, rocket));
}

TEST(HandShape_Names, SnakeCase)
{
    EXPECT_EQ(to_string(ShapeType::AirplanePairs), "airplane_pairs");
    EXPECT_EQ(to_string(ShapeType::Rocket), "rocket");
}
