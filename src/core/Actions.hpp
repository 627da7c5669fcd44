//
// Actions.hpp
//

#ifndef DOUDIZHU_ACTIONS_HPP
#define DOUDIZHU_ACTIONS_HPP

#include <string_view>
#include <variant>
#include "Types.hpp"

namespace ddz::core
{
    struct BidAction  { bool wants_to_bid{false}; };
    struct PlayAction { Cards cards; };
    struct PassAction {};

    using PlayerAction = std::variant<BidAction, PlayAction, PassAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TrickReset,   // second consecutive pass, next seat leads freely
        BiddingEnded, // landlord assigned, play begins
        Redeal,       // nobody bid, fresh deal
        GameEnded,
        Aborted
    };

    enum class Phase : uint8_t
    {
        Bidding,
        Playing,
        Finished
    };

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Bidding: return "bidding";
        case Phase::Playing: return "playing";
        case Phase::Finished: return "finished";
        }
        return "?";
    }

    inline auto to_string(MoveOutcome o) -> std::string_view
    {
        switch (o)
        {
        case MoveOutcome::Invalid: return "invalid";
        case MoveOutcome::Applied: return "applied";
        case MoveOutcome::TrickReset: return "trick_reset";
        case MoveOutcome::BiddingEnded: return "bidding_ended";
        case MoveOutcome::Redeal: return "redeal";
        case MoveOutcome::GameEnded: return "game_ended";
        case MoveOutcome::Aborted: return "aborted";
        }
        return "?";
    }
} // namespace ddz::core

#endif //DOUDIZHU_ACTIONS_HPP
