//
// HandShape.cpp
//

#include "HandShape.hpp"

namespace ddz::core
{
    namespace
    {
        constexpr auto V(Rank r) -> std::size_t { return std::to_underlying(r); }

        auto Make(ShapeType t, std::size_t value, uint8_t n) -> HandShape
        {
            return HandShape{t, static_cast<Rank>(value), n};
        }

        // Every present rank has exactly `width` cards, all ranks lie in 3..A and form
        // one consecutive run of at least `min_len`. Returns the top rank value.
        auto UniformChain(RankCounts const& c, uint8_t width, std::size_t min_len) -> std::optional<std::size_t>
        {
            if (c.distinct < min_len) return std::nullopt;
            std::size_t lo = 0, hi = 0;
            for (std::size_t v = 3; v < c.count.size(); ++v)
            {
                if (c.count[v] == 0) continue;
                if (c.count[v] != width) return std::nullopt;
                if (v > V(HighestChainRank)) return std::nullopt;
                if (lo == 0) lo = v;
                hi = v;
            }
            if (hi - lo + 1 != c.distinct) return std::nullopt;
            return hi;
        }
    }

    auto to_string(ShapeType t) -> std::string_view
    {
        switch (t)
        {
        case ShapeType::Single: return "single";
        case ShapeType::Pair: return "pair";
        case ShapeType::Triple: return "triple";
        case ShapeType::TripleSingle: return "triple_single";
        case ShapeType::TriplePair: return "triple_pair";
        case ShapeType::Straight: return "straight";
        case ShapeType::PairStraight: return "pair_straight";
        case ShapeType::Airplane: return "airplane";
        case ShapeType::AirplaneSingles: return "airplane_singles";
        case ShapeType::AirplanePairs: return "airplane_pairs";
        case ShapeType::FourTwoSingles: return "four_two_singles";
        case ShapeType::FourTwoPairs: return "four_two_pairs";
        case ShapeType::Bomb: return "bomb";
        case ShapeType::Rocket: return "rocket";
        }
        return "unknown";
    }

    auto CountRanks(std::span<Card const> cards) -> RankCounts
    {
        RankCounts c;
        for (auto const& card : cards)
        {
            auto& slot = c.count[card.Value()];
            if (slot == 0) ++c.distinct;
            ++slot;
        }
        c.total = static_cast<uint8_t>(cards.size());
        return c;
    }

    namespace matchers
    {
        auto MatchRocket(RankCounts const& c) -> std::optional<HandShape>
        {
            if (c.total == 2 && c[Rank::SmallJoker] == 1 && c[Rank::BigJoker] == 1)
                return Make(ShapeType::Rocket, V(Rank::BigJoker), 2);
            return std::nullopt;
        }

        auto MatchBomb(RankCounts const& c) -> std::optional<HandShape>
        {
            if (c.total != 4 || c.distinct != 1) return std::nullopt;
            for (std::size_t v = 3; v < c.count.size(); ++v)
                if (c.count[v] == 4) return Make(ShapeType::Bomb, v, 4);
            return std::nullopt;
        }

        auto MatchSet(RankCounts const& c) -> std::optional<HandShape>
        {
            if (c.total < 1 || c.total > 3 || c.distinct != 1) return std::nullopt;
            static constexpr std::array<ShapeType, 3> kinds{ShapeType::Single, ShapeType::Pair, ShapeType::Triple};
            for (std::size_t v = 3; v < c.count.size(); ++v)
                if (c.count[v] != 0) return Make(kinds[c.total - 1], v, c.total);
            return std::nullopt;
        }

        auto MatchTripleWithKicker(RankCounts const& c) -> std::optional<HandShape>
        {
            if ((c.total != 4 && c.total != 5) || c.distinct != 2) return std::nullopt;
            std::size_t triple = 0;
            uint8_t other = 0;
            for (std::size_t v = 3; v < c.count.size(); ++v)
            {
                if (c.count[v] == 3) triple = v;
                else if (c.count[v] != 0) other = c.count[v];
            }
            if (triple == 0) return std::nullopt;
            if (c.total == 4 && other == 1) return Make(ShapeType::TripleSingle, triple, 4);
            if (c.total == 5 && other == 2) return Make(ShapeType::TriplePair, triple, 5);
            return std::nullopt;
        }

        auto MatchStraight(RankCounts const& c) -> std::optional<HandShape>
        {
            if (c.total < constants::MinStraightLen) return std::nullopt;
            if (auto hi = UniformChain(c, 1, constants::MinStraightLen))
                return Make(ShapeType::Straight, *hi, c.total);
            return std::nullopt;
        }

        auto MatchPairStraight(RankCounts const& c) -> std::optional<HandShape>
        {
            if (c.total < 2 * constants::MinPairChainLen || c.total % 2 != 0) return std::nullopt;
            if (auto hi = UniformChain(c, 2, constants::MinPairChainLen))
                return Make(ShapeType::PairStraight, *hi, c.total);
            return std::nullopt;
        }

        auto MatchAirplane(RankCounts const& c) -> std::optional<HandShape>
        {
            // longest run of exact triples within 3..A; the lowest such run on ties
            std::size_t best_lo = 0, best_len = 0, run_lo = 0, run_len = 0;
            for (std::size_t v = V(LowestChainRank); v <= V(HighestChainRank) + 1; ++v)
            {
                bool const triple = v <= V(HighestChainRank) && c.count[v] == 3;
                if (triple)
                {
                    if (run_len == 0) run_lo = v;
                    ++run_len;
                    continue;
                }
                if (run_len > best_len)
                {
                    best_len = run_len;
                    best_lo = run_lo;
                }
                run_len = 0;
            }
            if (best_len < constants::MinAirplaneLen) return std::nullopt;

            auto const top = best_lo + best_len - 1;
            auto const extra = static_cast<std::size_t>(c.total) - 3 * best_len;
            if (extra == 0) return Make(ShapeType::Airplane, top, c.total);
            if (extra == best_len) return Make(ShapeType::AirplaneSingles, top, c.total);
            if (extra == 2 * best_len)
            {
                for (std::size_t v = 3; v < c.count.size(); ++v)
                {
                    bool const in_run = v >= best_lo && v <= top;
                    if (!in_run && c.count[v] != 0 && c.count[v] != 2) return std::nullopt;
                }
                return Make(ShapeType::AirplanePairs, top, c.total);
            }
            return std::nullopt;
        }

        auto MatchFourWithTwo(RankCounts const& c) -> std::optional<HandShape>
        {
            if (c.total != 6 && c.total != 8) return std::nullopt;
            std::size_t quad = 0;
            uint8_t pairs = 0;
            for (std::size_t v = 3; v < c.count.size(); ++v)
            {
                if (c.count[v] == 4) quad = v;
                else if (c.count[v] == 2) ++pairs;
            }
            if (quad == 0) return std::nullopt;
            if (c.total == 6) return Make(ShapeType::FourTwoSingles, quad, 6);
            if (pairs == 2 && c.distinct == 3) return Make(ShapeType::FourTwoPairs, quad, 8);
            return std::nullopt;
        }
    }

    auto Classify(std::span<Card const> cards) -> std::optional<HandShape>
    {
        if (cards.empty()) return std::nullopt;
        auto const counts = CountRanks(cards);
        for (auto const match : matchers::Ordered)
        {
            if (auto shape = match(counts)) return shape;
        }
        return std::nullopt;
    }

    auto Beats(HandShape const& candidate, HandShape const& previous) -> bool
    {
        if (candidate.type == ShapeType::Rocket) return previous.type != ShapeType::Rocket;
        if (previous.type == ShapeType::Rocket) return false;
        if (candidate.type == ShapeType::Bomb)
        {
            if (previous.type != ShapeType::Bomb) return true;
            return candidate.primary > previous.primary;
        }
        if (previous.type == ShapeType::Bomb) return false;
        return candidate.type == previous.type
            && candidate.card_count == previous.card_count
            && candidate.primary > previous.primary;
    }
}
