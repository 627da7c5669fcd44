//
// Deck.cpp
//

#include "Deck.hpp"

#include <algorithm>
#include "Exception.hpp"

namespace ddz::core
{
    auto BuildDeck() -> Cards
    {
        Cards deck;
        deck.reserve(constants::DeckSize);
        constexpr auto first = std::to_underlying(Rank::Three);
        constexpr auto last = std::to_underlying(Rank::Two);
        for (uint8_t s{}; s < 4; ++s)
        {
            for (uint8_t r{first}; r <= last; ++r)
            {
                deck.push_back(Card{static_cast<Suit>(s), static_cast<Rank>(r)});
            }
        }
        deck.push_back(Card{Suit::Joker, Rank::SmallJoker});
        deck.push_back(Card{Suit::Joker, Rank::BigJoker});
        return deck;
    }

    auto NewShuffledDeck(std::mt19937_64& rng) -> Cards
    {
        Cards deck = BuildDeck();
        std::ranges::shuffle(deck, rng);
        return deck;
    }

    auto Deal(Cards const& deck) -> DealtHands
    {
        DDZ_ASSERT(deck.size() == constants::DeckSize, "Deal requires a full 54 card deck");
        DealtHands out;
        auto it = deck.begin();
        for (auto& hand : out.hands)
        {
            hand.assign(it, it + constants::InitialHandSize);
            it += constants::InitialHandSize;
            SortCards(hand);
        }
        out.reserved.assign(it, deck.end());
        return out;
    }

    auto SortCards(Cards& cards) -> void
    {
        std::ranges::sort(cards, CardLess);
    }
}
