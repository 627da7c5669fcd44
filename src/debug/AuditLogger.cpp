//
// AuditLogger.cpp
//

#include "AuditLogger.hpp"

#include <format>
#include <string_view>

#include "../core/HandShape.hpp"
#include "../core/Util.hpp"

using namespace ddz::core;

namespace
{

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BidAction>)
            {
                return act.wants_to_bid ? "Bid" : "NoBid";
            }
            else if constexpr (std::is_same_v<T, PlayAction>)
            {
                auto const shape = Classify(act.cards);
                return std::format("Play{}{}", util::FormatCards(act.cards),
                                   shape ? std::format(" {}", to_string(shape->type)) : std::string{});
            }
            else
            {
                return "Pass";
            }
        },
        a
    );
}

auto s_sizes(GameSnapshot const& s) -> std::string
{
    return std::format("{}/{}/{}", s.hand_sizes[0], s.hand_sizes[1], s.hand_sizes[2]);
}

} // anonymous namespace

namespace ddz::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    auto const& st = game.State();
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Deal={}\n", st.deal_no);
    for (std::size_t i{}; i < st.hands.size(); ++i)
    {
        out_ << std::format("P{}({})={}\n", i, game.LabelAt(static_cast<PlyrIdxT>(i)),
                            util::FormatCards(st.hands[i]));
    }
    out_ << std::format("Reserved={}\n", util::FormatCards(st.reserved));
    out_.flush();
}

auto AuditLogger::turn(GameSnapshot const& s,
                       uint8_t actor,
                       PlayerAction const& a) -> void
{
    out_ << std::format(
        "Turn actor=P{} phase={} hands={} mult={} last={}\n",
        static_cast<int>(actor),
        to_string(s.phase),
        s_sizes(s),
        s.bomb_multiplier,
        s.last_play ? util::FormatCards(s.last_play->cards) : std::string("--")
    );

    out_ << std::format("Action: {}\n", s_action(a));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    out_ << std::format("Outcome: {}\n", to_string(m));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    auto const& st = game.State();
    if (auto const r = game.Result())
    {
        out_ << std::format("Winner=P{} Landlord=P{} LandlordWon={} Bid={} Mult={} Score=[{},{},{}]\n",
                            r->winner, r->landlord, r->landlord_won, r->bid, r->bomb_multiplier,
                            r->score_delta[0], r->score_delta[1], r->score_delta[2]);
    }
    else if (st.departed)
    {
        out_ << std::format("Aborted departed=P{}\n", static_cast<int>(*st.departed));
    }
    else
    {
        out_ << "Unfinished\n";
    }
    out_.flush();
}

} // namespace ddz::core::debug
