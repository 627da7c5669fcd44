//
// Types.hpp
//

#ifndef DOUDIZHU_TYPES_HPP
#define DOUDIZHU_TYPES_HPP

#define DDZ_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <utility>

namespace ddz::core::constants
{
    inline constexpr std::size_t NumSeats = 3;
    inline constexpr std::size_t DeckSize = 54;
    inline constexpr std::size_t InitialHandSize = 17;
    inline constexpr std::size_t ReservedCount = 3;
    inline constexpr std::uint8_t MaxBid = 3;
    // shortest chains per shape
    inline constexpr std::size_t MinStraightLen = 5;
    inline constexpr std::size_t MinPairChainLen = 3;
    inline constexpr std::size_t MinAirplaneLen = 2;
}

namespace ddz::core
{
    enum class Suit : uint8_t
    {
        Spades = 0,
        Hearts,
        Clubs,
        Diamonds,
        Joker
    };

    // Numeric value doubles as comparison strength: 3 lowest, 2 above Ace, jokers on top.
    enum class Rank : uint8_t
    {
        Three = 3,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace,
        Two,
        SmallJoker,
        BigJoker
    };

    inline constexpr Rank LowestChainRank = Rank::Three;
    inline constexpr Rank HighestChainRank = Rank::Ace;

    struct Card
    {
        Suit suit{Suit::Spades};
        Rank rank{Rank::Three};

        [[nodiscard]]
        constexpr auto Value() const noexcept -> uint8_t { return std::to_underlying(rank); }
    };

    inline constexpr auto operator==(Card const& a, Card const& b) -> bool
    {
        return a.suit == b.suit && a.rank == b.rank;
    }

    // Display order within a rank: Diamonds, Clubs, Hearts, Spades.
    inline constexpr auto SuitOrder(Suit s) -> uint8_t
    {
        switch (s)
        {
        case Suit::Diamonds: return 0;
        case Suit::Clubs: return 1;
        case Suit::Hearts: return 2;
        case Suit::Spades: return 3;
        case Suit::Joker: return 4;
        }
        return 5;
    }

    inline constexpr auto CardLess(Card const& a, Card const& b) -> bool
    {
        if (a.rank != b.rank) return a.Value() < b.Value();
        return SuitOrder(a.suit) < SuitOrder(b.suit);
    }

    inline constexpr auto IsChainRank(Rank r) -> bool
    {
        return r >= LowestChainRank && r <= HighestChainRank;
    }

    using Cards = std::vector<Card>;

    // Absolute seat as assigned by the server (0..2). Only ToRelative maps it to a viewer's frame.
    using PlyrIdxT = uint8_t;

    // Seat as seen by one viewer: the viewer itself, then the next two seats in turn order.
    enum class RelSeat : uint8_t
    {
        Self = 0,
        Left = 1,
        Right = 2
    };

    inline constexpr auto NextSeat(PlyrIdxT s) -> PlyrIdxT
    {
        return static_cast<PlyrIdxT>((s + 1) % constants::NumSeats);
    }

    inline constexpr auto ToRelative(PlyrIdxT viewer, PlyrIdxT absolute) -> RelSeat
    {
        return static_cast<RelSeat>((absolute + constants::NumSeats - viewer) % constants::NumSeats);
    }

    inline constexpr auto ToAbsolute(PlyrIdxT viewer, RelSeat rel) -> PlyrIdxT
    {
        return static_cast<PlyrIdxT>((viewer + std::to_underlying(rel)) % constants::NumSeats);
    }

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30ULL)};
        std::chrono::milliseconds ai_think_delay{std::chrono::milliseconds(800ULL)};
        PlyrIdxT first_bidder{0};
    };

    struct AiPolicy
    {
        double open_bid_chance{0.6};
        double raise_bid_chance{0.3};
        // lead the whole hand when it is a single shape this small
        std::size_t empty_hand_threshold{4};
        // spend a bomb while following only at or below this hand size
        std::size_t bomb_hand_threshold{6};
        double bomb_spend_chance{0.5};
    };
}

#endif //DOUDIZHU_TYPES_HPP
