//
// Inspector.hpp
//

#ifndef DOUDIZHU_INSPECTOR_HPP
#define DOUDIZHU_INSPECTOR_HPP

#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace ddz::core::debug
{
    // Test-only window into GameImpl internals.
    struct Inspector
    {
        struct SnapshotAll
        {
            std::array<Cards, constants::NumSeats> hands{};
            Cards reserved;
            Cards played;
            bool reserved_claimed{false};
            Phase phase{};
            std::optional<PlyrIdxT> landlord{};
            uint32_t bomb_multiplier{1};
            uint8_t highest_bid{};
            std::size_t local_players{};
        };

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.hands = g.state_.hands;
            ret.reserved = g.state_.reserved;
            ret.played = g.state_.played;
            ret.reserved_claimed = g.state_.reserved_claimed;
            ret.phase = g.state_.phase;
            ret.landlord = g.state_.landlord;
            ret.bomb_multiplier = g.state_.bomb_multiplier;
            ret.highest_bid = g.state_.bidding.highest_bid;
            for (auto const& p : g.players_) ret.local_players += static_cast<bool>(p);
            return ret;
        }

        // Replace the authoritative state, e.g. to stage a specific deal.
        static inline auto Overwrite(GameImpl& g, TableState s) -> void
        {
            g.state_ = std::move(s);
            g.last_move_.reset();
        }

        // The game owned by a net::TableActor, before Run() starts.
        template <class Table>
        static inline auto GameOf(Table& table) -> GameImpl&
        {
            return table.game_;
        }
    };
}

#endif //DOUDIZHU_INSPECTOR_HPP
