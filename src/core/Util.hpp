//
// Util.hpp
//

#ifndef DOUDIZHU_UTIL_HPP
#define DOUDIZHU_UTIL_HPP

#include <algorithm>
#include <array>
#include <bit>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <format>
#include "Types.hpp"

namespace ddz::core::util
{
    // Stable wire id 0..53: suit * 13 + (value - 3) for suited cards, 52/53 for the jokers.
    inline constexpr auto CardToUID(Card const& c) -> uint8_t
    {
        if (c.rank == Rank::SmallJoker) return 52;
        if (c.rank == Rank::BigJoker) return 53;
        return static_cast<uint8_t>(std::to_underlying(c.suit) * 13 + (c.Value() - 3));
    }

    inline constexpr auto CardFromUID(uint8_t uid) -> std::optional<Card>
    {
        if (uid == 52) return Card{Suit::Joker, Rank::SmallJoker};
        if (uid == 53) return Card{Suit::Joker, Rank::BigJoker};
        if (uid > 53) return std::nullopt;
        return Card{static_cast<Suit>(uid / 13), static_cast<Rank>(uid % 13 + 3)};
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> int
        {
            return std::popcount(cards_);
        }
    private:
        uint64_t cards_;
        bool contains_dup_;
    };

    inline auto HasDuplicates(std::span<Card const> cards) -> bool
    {
        CardUniqueChecker chk;
        for (auto const& c : cards) chk.Add(c);
        return chk.ContainsDup();
    }

    inline auto RankName(Rank r) -> std::string_view
    {
        static constexpr std::array<std::string_view, 15> names{
            "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A", "2", "sj", "BJ"};
        return names[std::to_underlying(r) - 3];
    }

    inline auto CardName(Card const& c) -> std::string
    {
        if (c.suit == Suit::Joker) return std::string(RankName(c.rank));
        static constexpr std::array<char, 4> suits{'S', 'H', 'C', 'D'};
        return std::format("{}{}", RankName(c.rank), suits[std::to_underlying(c.suit)]);
    }

    inline auto FormatCards(std::span<Card const> cards) -> std::string
    {
        std::string s = "[";
        for (std::size_t i = 0; i < cards.size(); ++i)
        {
            if (i) s += ' ';
            s += CardName(cards[i]);
        }
        s += ']';
        return s;
    }
}

#endif //DOUDIZHU_UTIL_HPP
