//
// Judge.hpp
//

#ifndef DOUDIZHU_JUDGE_HPP
#define DOUDIZHU_JUDGE_HPP

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace ddz::core
{
    class GameImpl;

    enum class Verdict : uint8_t
    {
        InTime,
        TimedOut
    };

    struct TimedDecision
    {
        PlayerAction action{};
        Verdict verdict{Verdict::InTime};
    };

    // Runs a local Player against the table's turn clock. A Player that misses its
    // deadline finishes on its worker; its next turn starts only after that.
    class Judge
    {
    public:
        // The player's answer, or DefaultAction if turn_timeout passes first.
        static auto GetAction(GameImpl& game, PlyrIdxT actor) -> TimedDecision;

        // What a seat does when its turn timer runs out: decline a bid, pass when
        // following, otherwise lead the weakest legal shape.
        static auto DefaultAction(GameSnapshot const& s) -> PlayerAction;
    };
}
#endif //DOUDIZHU_JUDGE_HPP
