//
// State.hpp
//

#ifndef DOUDIZHU_STATE_HPP
#define DOUDIZHU_STATE_HPP

#include <optional>
#include "Types.hpp"
#include "Actions.hpp"
#include "HandShape.hpp"

namespace ddz::core
{
    struct PlayRecord
    {
        Cards cards;
        PlyrIdxT seat{};
        HandShape shape{};
    };

    struct BiddingState
    {
        PlyrIdxT current_bidder{};
        uint8_t highest_bid{};
        std::optional<PlyrIdxT> highest_bidder{};
        uint8_t bid_actions{};
    };

    enum class FinishReason : uint8_t
    {
        None,
        HandEmptied,
        PeerDisconnected
    };

    // Authoritative per-table state. Plain value so transitions can be computed on copies.
    struct TableState
    {
        Phase phase{Phase::Bidding};
        std::array<Cards, constants::NumSeats> hands{};
        Cards reserved{};            // face-up to everyone, owned by nobody until bidding ends
        bool reserved_claimed{false};
        Cards played{};              // every card that left a hand
        std::optional<PlyrIdxT> landlord{};
        PlyrIdxT current{};          // seat to play during Playing
        std::optional<PlayRecord> last_play{}; // cleared on a trick reset
        uint8_t consecutive_passes{};
        uint32_t bomb_multiplier{1};
        BiddingState bidding{};
        FinishReason finish_reason{FinishReason::None};
        std::optional<PlyrIdxT> winner{};
        std::optional<PlyrIdxT> departed{};
        uint32_t deal_no{};
    };

    [[nodiscard]]
    inline auto CurrentActor(TableState const& s) -> PlyrIdxT
    {
        return s.phase == Phase::Bidding ? s.bidding.current_bidder : s.current;
    }

    [[nodiscard]]
    inline auto IsLeading(TableState const& s) -> bool
    {
        return !s.last_play.has_value();
    }

    struct DealResult
    {
        PlyrIdxT winner{};
        PlyrIdxT landlord{};
        bool landlord_won{false};
        uint8_t bid{};
        uint32_t bomb_multiplier{1};
        std::array<int32_t, constants::NumSeats> score_delta{};
        Cards final_cards{};
        std::optional<ShapeType> final_shape{};
    };

    // Immutable view handed to a player: own hand revealed, counts for the others.
    struct GameSnapshot
    {
        PlyrIdxT seat{};
        Phase phase{Phase::Bidding};
        PlyrIdxT actor{};

        Cards my_hand;
        std::array<uint8_t, constants::NumSeats> hand_sizes{}; // by absolute seat
        Cards reserved;

        std::optional<PlyrIdxT> landlord{};
        std::optional<PlayRecord> last_play{};
        uint8_t consecutive_passes{};
        uint8_t highest_bid{};
        uint32_t bomb_multiplier{1};

        [[nodiscard]]
        auto Leading() const -> bool { return !last_play.has_value(); }
    };

} // namespace ddz::core

#endif //DOUDIZHU_STATE_HPP
