//
// Rules.hpp
//

#ifndef DOUDIZHU_RULES_HPP
#define DOUDIZHU_RULES_HPP

#include <expected>
#include "Actions.hpp"
#include "Types.hpp"
#include "State.hpp"
#include "Exception.hpp"

namespace ddz::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(TableState const& s, PlyrIdxT actor, PlayerAction const& a) const -> CheckResult = 0;

        // Mutates state for an already validated action.
        virtual auto Apply(TableState& s, PlyrIdxT actor, PlayerAction const& a) -> void = 0;

        // Moves the turn on and reports what the action caused. Redeal leaves the
        // reshuffle to the caller, which owns the rng.
        virtual auto Advance(TableState& s) -> MoveOutcome = 0;

        // Per-seat score deltas for a finished deal.
        [[nodiscard]]
        virtual auto Score(TableState const& s) const -> DealResult = 0;
    };

    struct Transition
    {
        TableState state;
        MoveOutcome outcome{MoveOutcome::Invalid};
    };

    // (state, action) -> new state or a violation; the input state is never touched.
    [[nodiscard]]
    auto ApplyAction(Rules& rules, TableState state, PlyrIdxT actor, PlayerAction const& a)
        -> std::expected<Transition, error::RuleViolation>;
}

#endif //DOUDIZHU_RULES_HPP
