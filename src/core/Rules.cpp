//
// Rules.cpp
//

#include "Rules.hpp"

namespace ddz::core
{
    auto ApplyAction(Rules& rules, TableState state, PlyrIdxT actor, PlayerAction const& a)
        -> std::expected<Transition, error::RuleViolation>
    {
        if (auto const ok = rules.Validate(state, actor, a); !ok.has_value())
            return std::unexpected(ok.error());
        rules.Apply(state, actor, a);
        MoveOutcome const outcome = rules.Advance(state);
        return Transition{std::move(state), outcome};
    }
}
