//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include "Util.hpp"
#include <algorithm>
#include <ranges>

namespace
{
    inline auto Viol(ddz::core::error::RuleViolationCode code) -> ddz::core::error::RuleViolation
    {
        return ddz::core::error::RuleViolation{ .code = code };
    }
}

namespace ddz::core
{
    static auto Holds(Cards const& hand, Card const& c) -> bool
    {
        return std::ranges::find(hand, c) != hand.end();
    }

    static auto RemoveFromHand(Cards& hand, Cards const& cards) -> void
    {
        for (auto const& c : cards)
        {
            auto const it = std::ranges::find(hand, c);
            DDZ_ASSERT(it != hand.end(), "Applied play holds a card not in hand");
            hand.erase(it);
        }
    }

    auto ClassicRules::StartDeal(DealtHands dealt, PlyrIdxT const first_bidder, uint32_t const deal_no) -> TableState
    {
        TableState s{};
        s.phase = Phase::Bidding;
        s.hands = std::move(dealt.hands);
        s.reserved = std::move(dealt.reserved);
        s.bidding.current_bidder = first_bidder;
        s.current = first_bidder;
        s.deal_no = deal_no;
        return s;
    }

    auto ClassicRules::Validate(TableState const& s, PlyrIdxT const actor, PlayerAction const& a) const -> CheckResult
    {
        using RVC = ::ddz::core::error::RuleViolationCode;

        if (s.phase == Phase::Finished && s.finish_reason == FinishReason::PeerDisconnected)
            return std::unexpected(Viol(RVC::Table_PeerDisconnected).with_phase(s.phase).with_actor(actor));
        if (s.phase == Phase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase_Finished).with_phase(s.phase).with_actor(actor));

        PlyrIdxT const expected = CurrentActor(s);
        if (actor != expected)
            return std::unexpected(Viol(RVC::NotYourTurn)
                                   .with_phase(s.phase).with_actor(actor).with_expected(expected));

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BidAction>)
            {
                if (s.phase != Phase::Bidding)
                    return std::unexpected(Viol(RVC::WrongPhase_BiddingRequired)
                                           .with_phase(s.phase).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, PlayAction>)
            {
                if (s.phase != Phase::Playing)
                    return std::unexpected(Viol(RVC::WrongPhase_PlayingRequired)
                                           .with_phase(s.phase).with_actor(actor));

                auto const n = static_cast<uint8_t>(act.cards.size());
                if (act.cards.empty())
                    return std::unexpected(Viol(RVC::Play_Empty).with_actor(actor));

                if (util::HasDuplicates(act.cards))
                    return std::unexpected(Viol(RVC::Play_DuplicateCards).with_actor(actor).with_attempted(n));

                auto const& hand = s.hands[actor];
                if (!std::ranges::all_of(act.cards, [&](Card const& c) { return Holds(hand, c); }))
                    return std::unexpected(Viol(RVC::Play_CardsNotHeld).with_actor(actor).with_attempted(n));

                auto const shape = Classify(act.cards);
                if (!shape)
                    return std::unexpected(Viol(RVC::Play_IllegalShape).with_actor(actor).with_attempted(n));

                if (s.last_play && !Beats(*shape, s.last_play->shape))
                    return std::unexpected(Viol(RVC::Play_CannotBeat)
                                           .with_actor(actor).with_attempted(n)
                                           .with_shape(shape->type).with_to_beat(s.last_play->shape.type));
                return {};
            }
            else if constexpr (std::is_same_v<T, PassAction>)
            {
                if (s.phase != Phase::Playing)
                    return std::unexpected(Viol(RVC::WrongPhase_PlayingRequired)
                                           .with_phase(s.phase).with_actor(actor));
                if (IsLeading(s))
                    return std::unexpected(Viol(RVC::Pass_WhileLeading).with_actor(actor));
                return {};
            }
            else
            {
                return std::unexpected(Viol(RVC::Internal_Unreachable));
            }
        }, a);
    }

    auto ClassicRules::Apply(TableState& s, PlyrIdxT const actor, PlayerAction const& a) -> void
    {
        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BidAction>)
            {
                ++s.bidding.bid_actions;
                if (act.wants_to_bid)
                {
                    s.bidding.highest_bid = std::min<uint8_t>(s.bidding.highest_bid + 1, constants::MaxBid);
                    s.bidding.highest_bidder = actor;
                }
            }
            else if constexpr (std::is_same_v<T, PlayAction>)
            {
                auto const shape = Classify(act.cards);
                DDZ_ASSERT(shape.has_value(), "Apply called with an unclassifiable play");
                RemoveFromHand(s.hands[actor], act.cards);
                s.played.insert(s.played.end(), act.cards.begin(), act.cards.end());
                s.last_play = PlayRecord{act.cards, actor, *shape};
                s.consecutive_passes = 0;
                if (IsBombLike(shape->type)) s.bomb_multiplier *= 2;
            }
            else if constexpr (std::is_same_v<T, PassAction>)
            {
                ++s.consecutive_passes;
            }
        }, a);
    }

    auto ClassicRules::Advance(TableState& s) -> MoveOutcome
    {
        switch (s.phase)
        {
        case Phase::Bidding:
            {
                auto& b = s.bidding;
                bool const done = b.highest_bid >= constants::MaxBid || b.bid_actions >= constants::NumSeats;
                if (!done)
                {
                    b.current_bidder = NextSeat(b.current_bidder);
                    return MoveOutcome::Applied;
                }
                if (!b.highest_bidder) return MoveOutcome::Redeal;

                PlyrIdxT const landlord = *b.highest_bidder;
                s.landlord = landlord;
                auto& hand = s.hands[landlord];
                hand.insert(hand.end(), s.reserved.begin(), s.reserved.end());
                SortCards(hand);
                s.reserved_claimed = true;
                s.phase = Phase::Playing;
                s.current = landlord;
                s.last_play.reset();
                s.consecutive_passes = 0;
                return MoveOutcome::BiddingEnded;
            }
        case Phase::Playing:
            {
                if (s.hands[s.current].empty())
                {
                    s.phase = Phase::Finished;
                    s.winner = s.current;
                    s.finish_reason = FinishReason::HandEmptied;
                    return MoveOutcome::GameEnded;
                }
                s.current = NextSeat(s.current);
                if (s.consecutive_passes >= 2 && s.last_play)
                {
                    s.last_play.reset();
                    return MoveOutcome::TrickReset;
                }
                return MoveOutcome::Applied;
            }
        case Phase::Finished:
            break;
        }
        DDZ_THROW(error::Code::Rules, "Advance called on a finished table");
    }

    auto ClassicRules::Score(TableState const& s) const -> DealResult
    {
        DDZ_ASSERT(s.phase == Phase::Finished && s.finish_reason == FinishReason::HandEmptied,
                   "Score requires a deal that ended by a hand emptying");
        DDZ_ASSERT(s.landlord.has_value() && s.winner.has_value(), "Finished deal without landlord or winner");

        DealResult r{};
        r.winner = *s.winner;
        r.landlord = *s.landlord;
        r.landlord_won = r.winner == r.landlord;
        r.bid = s.bidding.highest_bid;
        r.bomb_multiplier = s.bomb_multiplier;
        if (s.last_play)
        {
            r.final_cards = s.last_play->cards;
            r.final_shape = s.last_play->shape.type;
        }

        auto const base = static_cast<int32_t>(std::max<uint8_t>(r.bid, 1) * r.bomb_multiplier);
        int32_t const sign = r.landlord_won ? 1 : -1;
        for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
        {
            r.score_delta[seat] = seat == r.landlord ? 2 * sign * base : -sign * base;
        }
        return r;
    }
}
