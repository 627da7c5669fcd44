//
// Deck.hpp
//

#ifndef DOUDIZHU_DECK_HPP
#define DOUDIZHU_DECK_HPP

#include <array>
#include <random>
#include "Types.hpp"

namespace ddz::core
{
    struct DealtHands
    {
        std::array<Cards, constants::NumSeats> hands{};
        Cards reserved{};
    };

    // All 54 cards in a fixed order (suits x 3..2, then both jokers).
    auto BuildDeck() -> Cards;

    // Uniform Fisher-Yates permutation of BuildDeck().
    auto NewShuffledDeck(std::mt19937_64& rng) -> Cards;

    // Seat i receives deck[17i, 17i+17); the last 3 cards are reserved. Hands come back sorted.
    auto Deal(Cards const& deck) -> DealtHands;

    auto SortCards(Cards& cards) -> void;
}

#endif //DOUDIZHU_DECK_HPP
