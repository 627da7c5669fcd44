//
// HeuristicAi.cpp
//

#include "HeuristicAi.hpp"

#include <algorithm>
#include "Exception.hpp"
#include "HandShape.hpp"

namespace ddz::core
{
    HeuristicAI::HeuristicAI(uint64_t rng_seed, AiPolicy policy):
        rng_(rng_seed), policy_(policy) {}

    auto HeuristicAI::Play(std::shared_ptr<const GameSnapshot> snapshot, std::chrono::steady_clock::time_point deadline)
        -> ddz::core::PlayerAction
    {
        (void)deadline;

        if (snapshot->phase == Phase::Bidding)
        {
            return BidAction{DecideBid(snapshot->highest_bid)};
        }
        if (auto cards = DecidePlay(snapshot->my_hand, snapshot->last_play))
        {
            return PlayAction{std::move(*cards)};
        }
        return PassAction{};
    }

    auto HeuristicAI::DecideBid(uint8_t const highest_bid) -> bool
    {
        return chance(highest_bid == 0 ? policy_.open_bid_chance : policy_.raise_bid_chance);
    }

    auto HeuristicAI::DecidePlay(std::span<Card const> hand, std::optional<PlayRecord> const& last_play)
        -> std::optional<Cards>
    {
        if (hand.empty()) return std::nullopt;

        if (!last_play)
        {
            // close out a small hand in one go when it is itself a shape
            if (hand.size() <= policy_.empty_hand_threshold && Classify(hand))
                return Cards(hand.begin(), hand.end());

            auto plays = EnumeratePlays(hand, std::nullopt);
            DDZ_ASSERT(!plays.empty(), "Leading hand produced no plays");
            return std::move(plays.front().cards);
        }

        auto plays = EnumeratePlays(hand, last_play->shape);
        if (plays.empty()) return std::nullopt;

        auto const normal = std::ranges::find_if(plays, [](PlayOption const& p)
        {
            return !IsBombLike(p.shape.type);
        });
        if (normal != plays.end()) return std::move(normal->cards);

        // only bombs left
        if (hand.size() <= policy_.bomb_hand_threshold || chance(policy_.bomb_spend_chance))
            return std::move(plays.front().cards);
        return std::nullopt;
    }
}
