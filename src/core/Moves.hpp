//
// Moves.hpp
//

#ifndef DOUDIZHU_MOVES_HPP
#define DOUDIZHU_MOVES_HPP

#include <optional>
#include <span>
#include <vector>
#include "Types.hpp"
#include "HandShape.hpp"

namespace ddz::core
{
    struct PlayOption
    {
        Cards cards;
        HandShape shape{};
    };

    // Ordering used to pick the "weakest" play: ordinary shapes by primary rank,
    // then bombs by rank, the rocket last.
    auto WeakerPlay(PlayOption const& a, PlayOption const& b) -> bool;

    // Every distinct legal play from hand, weakest first. Kickers are the lowest
    // ranks outside the core, so each core rank/length appears once per shape.
    // With to_beat set, only plays that beat it; an empty result means the seat must pass.
    [[nodiscard]]
    auto EnumeratePlays(std::span<Card const> hand, std::optional<HandShape> const& to_beat) -> std::vector<PlayOption>;

    // Weakest legal play, nullopt when following and nothing beats.
    [[nodiscard]]
    auto SuggestPlay(std::span<Card const> hand, std::optional<HandShape> const& to_beat) -> std::optional<PlayOption>;
}

#endif //DOUDIZHU_MOVES_HPP
