#include <gtest/gtest.h>
#include <algorithm>
#include <random>

#include "../core/Deck.hpp"
#include "../core/HandShape.hpp"
#include "../core/Util.hpp"

using namespace ddz::core;

TEST(Deck_Build, FiftyFourDistinctCards)
{
    Cards const deck = BuildDeck();
    ASSERT_EQ(deck.size(), constants::DeckSize);
    EXPECT_FALSE(util::HasDuplicates(deck));

    auto const jokers = std::ranges::count_if(deck, [](Card const& c) { return c.suit == Suit::Joker; });
    EXPECT_EQ(jokers, 2);
    auto const twos = std::ranges::count_if(deck, [](Card const& c) { return c.rank == Rank::Two; });
    EXPECT_EQ(twos, 4);
}

TEST(Deck_Build, UidsCoverZeroToFiftyThree)
{
    util::CardUniqueChecker seen;
    for (Card const& c : BuildDeck())
    {
        auto const uid = util::CardToUID(c);
        ASSERT_LT(uid, 54);
        auto const back = util::CardFromUID(uid);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, c);
        seen.Add(c);
    }
    EXPECT_EQ(seen.Count(), 54);
    EXPECT_FALSE(util::CardFromUID(54).has_value());
}

TEST(Deck_Deal, SeventeenEachPlusThreeReserved)
{
    std::mt19937_64 rng{7};
    for (int round = 0; round < 20; ++round)
    {
        DealtHands const d = Deal(NewShuffledDeck(rng));
        util::CardUniqueChecker seen;
        for (auto const& h : d.hands)
        {
            ASSERT_EQ(h.size(), constants::InitialHandSize);
            for (auto const& c : h) seen.Add(c);
        }
        ASSERT_EQ(d.reserved.size(), constants::ReservedCount);
        for (auto const& c : d.reserved) seen.Add(c);

        EXPECT_FALSE(seen.ContainsDup());
        EXPECT_EQ(seen.Count(), 54);
    }
}

TEST(Deck_Deal, HandsComeBackSorted)
{
    std::mt19937_64 rng{99};
    DealtHands const d = Deal(NewShuffledDeck(rng));
    for (auto const& h : d.hands)
    {
        EXPECT_TRUE(std::ranges::is_sorted(h, CardLess));
    }
}

TEST(Deck_Shuffle, SameSeedSameDeck)
{
    std::mt19937_64 a{2024}, b{2024}, c{2025};
    Cards const da = NewShuffledDeck(a);
    Cards const db = NewShuffledDeck(b);
    Cards const dc = NewShuffledDeck(c);
    EXPECT_EQ(da, db);
    EXPECT_NE(da, dc);
}

TEST(Deck_Sort, ValueThenSuit)
{
    Cards cards{
        Card{Suit::Joker, Rank::BigJoker},
        Card{Suit::Spades, Rank::Two},
        Card{Suit::Diamonds, Rank::Three},
        Card{Suit::Spades, Rank::Three},
        Card{Suit::Hearts, Rank::Ace},
    };
    SortCards(cards);
    Cards const expected{
        Card{Suit::Diamonds, Rank::Three},
        Card{Suit::Spades, Rank::Three},
        Card{Suit::Hearts, Rank::Ace},
        Card{Suit::Spades, Rank::Two},
        Card{Suit::Joker, Rank::BigJoker},
    };
    EXPECT_EQ(cards, expected);
}

TEST(Util_Names, CardNames)
{
    EXPECT_EQ(util::CardName(Card{Suit::Hearts, Rank::Ten}), "10H");
    EXPECT_EQ(util::CardName(Card{Suit::Joker, Rank::SmallJoker}), "sj");
    EXPECT_EQ(util::CardName(Card{Suit::Joker, Rank::BigJoker}), "BJ");
    Cards const two{Card{Suit::Spades, Rank::Three}, Card{Suit::Diamonds, Rank::Two}};
    EXPECT_EQ(util::FormatCards(two), "[3S 2D]");
}
