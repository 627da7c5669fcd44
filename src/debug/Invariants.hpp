//
// Invariants.hpp
//

#ifndef DOUDIZHU_INVARIANTS_HPP
#define DOUDIZHU_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <bit>
#include <format>

namespace ddz::core::debug
{
    // A second layer of checks run by tests after every step. Throws AssertionError.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if DDZ_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(g);

        // 1) every card lives in exactly one zone, all 54 accounted for
        {
            util::CardUniqueChecker seen;
            std::size_t total{};
            auto push = [&](Cards const& zone)
            {
                for (auto const& c : zone) seen.Add(c);
                total += zone.size();
            };
            for (auto const& h : s.hands) push(h);
            push(s.played);
            if (!s.reserved_claimed) push(s.reserved);

            DDZ_ASSERT(!seen.ContainsDup(), "Duplicate card across zones");
            DDZ_ASSERT(total == constants::DeckSize,
                       std::format("Card count {} != deck size", total));
        }

        // 2) the landlord exists exactly when the reserved cards were handed out
        DDZ_ASSERT(s.landlord.has_value() == s.reserved_claimed, "Landlord/reserved mismatch");
        if (s.phase == Phase::Playing)
            DDZ_ASSERT(s.landlord.has_value(), "Playing without a landlord");

        // 3) bids stay in range, the multiplier only ever doubles
        DDZ_ASSERT(s.highest_bid <= constants::MaxBid, "Bid above maximum");
        DDZ_ASSERT(std::has_single_bit(s.bomb_multiplier), "Bomb multiplier is not a power of two");
#endif // DDZ_ENABLE_TEST_HOOKS == true
    }
}
#endif //DOUDIZHU_INVARIANTS_HPP
