//
// HeuristicAi.hpp
//

#ifndef DOUDIZHU_HEURISTICAI_HPP
#define DOUDIZHU_HEURISTICAI_HPP

#include <optional>
#include <random>
#include <span>
#include "Player.hpp"
#include "Moves.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace ddz::core
{
    // Greedy bot: sheds its weakest legal shape, saves bombs for the endgame.
    class HeuristicAI final : public ddz::core::Player
    {
    public:
        explicit HeuristicAI(uint64_t rng_seed, AiPolicy policy = {});

        auto Play(std::shared_ptr<const ddz::core::GameSnapshot> snapshot,
                  std::chrono::steady_clock::time_point deadline) -> ddz::core::PlayerAction override;

        auto Label() const -> std::string_view override { return "heuristic"; }

        auto DecideBid(uint8_t highest_bid) -> bool;

        // nullopt means pass. Never nullopt while leading with cards in hand.
        auto DecidePlay(std::span<Card const> hand, std::optional<PlayRecord> const& last_play) -> std::optional<Cards>;

    private:
        auto chance(double p) -> bool
        {
            return std::bernoulli_distribution{p}(rng_);
        }

    private:
        std::mt19937 rng_;
        AiPolicy policy_;
    };
}

#endif //DOUDIZHU_HEURISTICAI_HPP
