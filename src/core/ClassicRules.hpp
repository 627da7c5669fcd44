//
// ClassicRules.hpp
//

#ifndef DOUDIZHU_CLASSICRULES_HPP
#define DOUDIZHU_CLASSICRULES_HPP
#include "Rules.hpp"
#include "Deck.hpp"

namespace ddz::core
{
    // Three-player rules: one bidding round (bid/decline, ends at 3 or after three
    // actions), then trick play with the two-pass reset.
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(TableState const& s, PlyrIdxT actor, PlayerAction const& a) const -> CheckResult override;
        auto Apply(TableState& s, PlyrIdxT actor, PlayerAction const& a) -> void override;
        auto Advance(TableState& s) -> MoveOutcome override;
        auto Score(TableState const& s) const -> DealResult override;

        // Fresh bidding state over a new deal; deal_no and first bidder carried in.
        static auto StartDeal(DealtHands dealt, PlyrIdxT first_bidder, uint32_t deal_no) -> TableState;
    };
}

#endif //DOUDIZHU_CLASSICRULES_HPP
