//
// Moves.cpp
//

#include "Moves.hpp"

#include <algorithm>

namespace ddz::core
{
    namespace
    {
        using Buckets = std::array<Cards, 18>;

        constexpr std::size_t FirstValue = std::to_underlying(Rank::Three);
        constexpr std::size_t LastValue = std::to_underlying(Rank::BigJoker);
        constexpr std::size_t ChainLo = std::to_underlying(LowestChainRank);
        constexpr std::size_t ChainHi = std::to_underlying(HighestChainRank);
        constexpr std::size_t MaxSharedSingles = 2;

        auto Bucket(std::span<Card const> hand) -> Buckets
        {
            Cards sorted(hand.begin(), hand.end());
            std::ranges::sort(sorted, CardLess);
            Buckets b{};
            for (auto const& c : sorted) b[c.Value()].push_back(c);
            return b;
        }

        auto Take(Buckets const& b, std::size_t v, std::size_t n, Cards& out) -> void
        {
            out.insert(out.end(), b[v].begin(), b[v].begin() + static_cast<std::ptrdiff_t>(n));
        }

        // `groups` kicker groups of `width` cards from the lowest ranks outside [lo, hi].
        auto Kickers(Buckets const& b, std::size_t lo, std::size_t hi, std::size_t groups, std::size_t width)
            -> std::optional<Cards>
        {
            Cards out;
            std::size_t got{};
            for (std::size_t v = FirstValue; v <= LastValue && got < groups; ++v)
            {
                if (v >= lo && v <= hi) continue;
                if (b[v].size() < width) continue;
                Take(b, v, width, out);
                ++got;
            }
            if (got == groups) return out;
            if (width != 1) return std::nullopt;

            // not enough distinct ranks: singles may share a rank, but never three of
            // one, or the kickers turn into a triple and the shape changes
            out.clear();
            for (std::size_t v = FirstValue; v <= LastValue && out.size() < groups; ++v)
            {
                if (v >= lo && v <= hi) continue;
                auto const n = std::min({b[v].size(), MaxSharedSingles, groups - out.size()});
                Take(b, v, n, out);
            }
            if (out.size() == groups) return out;
            return std::nullopt;
        }

        class Collector
        {
        public:
            explicit Collector(std::optional<HandShape> const& to_beat) : to_beat_(to_beat) {}

            auto Offer(Cards cards) -> void
            {
                auto const shape = Classify(cards);
                if (!shape) return;
                if (to_beat_ && !Beats(*shape, *to_beat_)) return;
                out_.push_back(PlayOption{std::move(cards), *shape});
            }

            auto OfferWith(Cards core, std::optional<Cards> const& kickers) -> void
            {
                if (!kickers) return;
                core.insert(core.end(), kickers->begin(), kickers->end());
                Offer(std::move(core));
            }

            auto Take() -> std::vector<PlayOption> { return std::move(out_); }

        private:
            std::optional<HandShape> const& to_beat_;
            std::vector<PlayOption> out_;
        };

        auto EnumerateSets(Buckets const& b, Collector& col) -> void
        {
            for (std::size_t v = FirstValue; v <= LastValue; ++v)
            {
                auto const n = b[v].size();
                for (std::size_t k = 1; k <= std::min<std::size_t>(n, 3); ++k)
                {
                    Cards core;
                    Take(b, v, k, core);
                    col.Offer(core);
                    if (k == 3)
                    {
                        col.OfferWith(core, Kickers(b, v, v, 1, 1));
                        col.OfferWith(core, Kickers(b, v, v, 1, 2));
                    }
                }
                if (n == 4)
                {
                    Cards quad;
                    Take(b, v, 4, quad);
                    col.Offer(quad);
                    col.OfferWith(quad, Kickers(b, v, v, 2, 1));
                    col.OfferWith(quad, Kickers(b, v, v, 2, 2));
                }
            }
            auto const sj = std::to_underlying(Rank::SmallJoker);
            auto const bj = std::to_underlying(Rank::BigJoker);
            if (!b[sj].empty() && !b[bj].empty())
                col.Offer(Cards{b[sj].front(), b[bj].front()});
        }

        auto EnumerateChains(Buckets const& b, Collector& col) -> void
        {
            struct ChainKind
            {
                std::size_t width;
                std::size_t min_len;
            };
            static constexpr std::array<ChainKind, 3> kinds{
                ChainKind{1, constants::MinStraightLen},
                ChainKind{2, constants::MinPairChainLen},
                ChainKind{3, constants::MinAirplaneLen},
            };
            for (auto const& [width, min_len] : kinds)
            {
                for (std::size_t lo = ChainLo; lo <= ChainHi; ++lo)
                {
                    Cards core;
                    for (std::size_t hi = lo; hi <= ChainHi && b[hi].size() >= width; ++hi)
                    {
                        Take(b, hi, width, core);
                        if (hi - lo + 1 < min_len) continue;
                        col.Offer(core);
                        if (width == 3)
                        {
                            auto const len = hi - lo + 1;
                            col.OfferWith(core, Kickers(b, lo, hi, len, 1));
                            col.OfferWith(core, Kickers(b, lo, hi, len, 2));
                        }
                    }
                }
            }
        }

        auto BombClass(ShapeType t) -> int
        {
            if (t == ShapeType::Rocket) return 2;
            if (t == ShapeType::Bomb) return 1;
            return 0;
        }
    }

    auto WeakerPlay(PlayOption const& a, PlayOption const& b) -> bool
    {
        auto const ca = BombClass(a.shape.type), cb = BombClass(b.shape.type);
        if (ca != cb) return ca < cb;
        return a.shape.primary < b.shape.primary;
    }

    auto EnumeratePlays(std::span<Card const> hand, std::optional<HandShape> const& to_beat) -> std::vector<PlayOption>
    {
        if (hand.empty()) return {};
        Buckets const b = Bucket(hand);
        Collector col{to_beat};
        EnumerateSets(b, col);
        EnumerateChains(b, col);
        auto plays = col.Take();
        std::ranges::stable_sort(plays, WeakerPlay);
        return plays;
    }

    auto SuggestPlay(std::span<Card const> hand, std::optional<HandShape> const& to_beat) -> std::optional<PlayOption>
    {
        auto plays = EnumeratePlays(hand, to_beat);
        if (plays.empty()) return std::nullopt;
        return std::move(plays.front());
    }
}
