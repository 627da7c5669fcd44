//
// ClientTable.hpp
//

#ifndef DOUDIZHU_CLIENTTABLE_HPP
#define DOUDIZHU_CLIENTTABLE_HPP

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/State.hpp"
#include "../core/Types.hpp"
#include "codec.hpp"

namespace ddz::core::net
{
    // What one client knows about its table, rebuilt from server messages only.
    // Seats arrive absolute and are rotated so that this client is always RelSeat::Self;
    // opponents are tracked as card counts, never as cards.
    class ClientTable
    {
    public:
        auto Apply(std::span<std::byte const> frame) -> std::expected<ddz::gen::net::Message, ParseError>;
        auto Apply(ddz::gen::net::Envelope const& env) -> std::expected<ddz::gen::net::Message, ParseError>;

        auto Seated() const noexcept -> bool { return my_seat_.has_value(); }
        auto MySeat() const noexcept -> std::optional<PlyrIdxT> { return my_seat_; }
        auto Local(PlyrIdxT absolute) const -> RelSeat;

        auto MyHand() const noexcept -> Cards const& { return my_hand_; }
        auto HandCount(RelSeat who) const -> uint8_t { return counts_[std::to_underlying(who)]; }
        auto Reserved() const noexcept -> Cards const& { return reserved_; }

        auto PhaseNow() const noexcept -> Phase { return phase_; }
        auto Actor() const noexcept -> std::optional<PlyrIdxT> { return actor_; }
        auto IsMyTurn() const noexcept -> bool { return my_seat_ && actor_ && *actor_ == *my_seat_ && phase_ != Phase::Finished; }
        auto Landlord() const noexcept -> std::optional<PlyrIdxT> { return landlord_; }
        auto LastPlay() const noexcept -> std::optional<PlayRecord> const& { return last_play_; }
        auto Leading() const noexcept -> bool { return !last_play_.has_value(); }
        auto HighestBid() const noexcept -> uint8_t { return highest_bid_; }
        auto BombMultiplier() const noexcept -> uint32_t { return bomb_multiplier_; }
        auto ConsecutivePasses() const noexcept -> uint8_t { return consecutive_passes_; }

        auto Winner() const noexcept -> std::optional<PlyrIdxT> { return winner_; }
        auto LandlordWon() const noexcept -> bool { return landlord_won_; }
        auto ScoreDeltas() const noexcept -> std::vector<int32_t> const& { return score_deltas_; }
        auto DepartedSeat() const noexcept -> std::optional<PlyrIdxT> { return departed_; }
        auto PlayerNames() const noexcept -> std::vector<std::string> const& { return names_; }

        auto QueuePosition() const noexcept -> uint8_t { return queue_position_; }
        auto QueueTotal() const noexcept -> uint8_t { return queue_total_; }
        auto LastError() const noexcept -> std::optional<std::string> const& { return last_error_; }

        // Turn counter bumped by every state-changing message, to debounce replies.
        auto Revision() const noexcept -> uint64_t { return revision_; }

        // View in the engine's terms, for driving a local Player.
        auto Snapshot() const -> GameSnapshot;

    private:
        auto SetCounts(flatbuffers::Vector<uint8_t> const* sizes) -> void;
        auto ResetDeal() -> void;

    private:
        std::optional<PlyrIdxT> my_seat_{};
        Cards my_hand_{};
        std::array<uint8_t, constants::NumSeats> counts_{}; // by RelSeat
        Cards reserved_{};
        std::vector<std::string> names_{};

        Phase phase_{Phase::Bidding};
        std::optional<PlyrIdxT> actor_{};
        std::optional<PlyrIdxT> landlord_{};
        std::optional<PlayRecord> last_play_{};
        uint8_t highest_bid_{};
        uint8_t consecutive_passes_{};
        uint32_t bomb_multiplier_{1};

        std::optional<PlyrIdxT> winner_{};
        bool landlord_won_{false};
        std::vector<int32_t> score_deltas_{};
        std::optional<PlyrIdxT> departed_{};

        uint8_t queue_position_{};
        uint8_t queue_total_{};
        std::optional<std::string> last_error_{};
        uint64_t revision_{};
    };
}

#endif //DOUDIZHU_CLIENTTABLE_HPP
