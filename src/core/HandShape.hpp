//
// HandShape.hpp
//

#ifndef DOUDIZHU_HANDSHAPE_HPP
#define DOUDIZHU_HANDSHAPE_HPP

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include "Types.hpp"

namespace ddz::core
{
    enum class ShapeType : uint8_t
    {
        Single = 0,
        Pair,
        Triple,
        TripleSingle,
        TriplePair,
        Straight,
        PairStraight,
        Airplane,
        AirplaneSingles,
        AirplanePairs,
        FourTwoSingles,
        FourTwoPairs,
        Bomb,
        Rocket
    };

    // Classification result. primary is the rank used for same-shape comparison
    // (highest rank of a chain, the triple/quad rank otherwise).
    struct HandShape
    {
        ShapeType type{ShapeType::Single};
        Rank primary{Rank::Three};
        uint8_t card_count{};

        friend auto operator==(HandShape const&, HandShape const&) -> bool = default;
    };

    [[nodiscard]]
    inline constexpr auto IsBombLike(ShapeType t) -> bool
    {
        return t == ShapeType::Bomb || t == ShapeType::Rocket;
    }

    auto to_string(ShapeType t) -> std::string_view;

    // Per-rank histogram indexed by Rank value (3..17).
    struct RankCounts
    {
        std::array<uint8_t, 18> count{};
        uint8_t total{};
        uint8_t distinct{};

        [[nodiscard]]
        auto operator[](Rank r) const -> uint8_t { return count[std::to_underlying(r)]; }
    };

    auto CountRanks(std::span<Card const> cards) -> RankCounts;

    namespace matchers
    {
        using Matcher = auto (*)(RankCounts const&) -> std::optional<HandShape>;

        auto MatchRocket(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchBomb(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchSet(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchTripleWithKicker(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchStraight(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchPairStraight(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchAirplane(RankCounts const& c) -> std::optional<HandShape>;
        auto MatchFourWithTwo(RankCounts const& c) -> std::optional<HandShape>;

        // Priority order; the first match wins.
        inline constexpr std::array<Matcher, 8> Ordered{
            MatchRocket,
            MatchBomb,
            MatchSet,
            MatchTripleWithKicker,
            MatchStraight,
            MatchPairStraight,
            MatchAirplane,
            MatchFourWithTwo,
        };
    }

    // nullopt when the cards form no legal shape (including the empty set).
    [[nodiscard]]
    auto Classify(std::span<Card const> cards) -> std::optional<HandShape>;

    // Rocket beats everything; a bomb beats any non-bomb; otherwise same type and
    // card count with a strictly higher primary rank.
    [[nodiscard]]
    auto Beats(HandShape const& candidate, HandShape const& previous) -> bool;
}

#endif //DOUDIZHU_HANDSHAPE_HPP
