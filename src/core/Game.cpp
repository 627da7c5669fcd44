//
// Game.cpp
//
#include "Game.hpp"

#include "ClassicRules.hpp"
#include "Deck.hpp"
#include "Util.hpp"
#include <print>
#include <utility>

namespace ddz::core
{
    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(std::move(players)),
        rng_{cfg_.seed}
    {
        DDZ_ASSERT(rules_ != nullptr, "No rules while initalising core");
        DDZ_ASSERT(players_.size() == constants::NumSeats, "Dou Dizhu needs exactly 3 seats");
        DDZ_ASSERT(cfg_.first_bidder < constants::NumSeats, "First bidder out of range");
        DealNew();
    }

    GameImpl::~GameImpl()
    {
        for (auto& f : late_)
        {
            if (f.valid()) f.wait();
        }
    }

    auto GameImpl::DealNew() -> void
    {
        uint32_t const deal_no = state_.deal_no + 1;
        state_ = ClassicRules::StartDeal(Deal(NewShuffledDeck(rng_)), cfg_.first_bidder, deal_no);
    }

    auto GameImpl::SnapshotFor(PlyrIdxT const seat) const -> std::shared_ptr<GameSnapshot const>
    {
        DDZ_ASSERT(seat < constants::NumSeats, "Snapshot for an unknown seat");
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->seat = seat;
        snap->phase = state_.phase;
        snap->actor = CurrentActor(state_);
        snap->my_hand = state_.hands[seat];
        for (PlyrIdxT s{}; s < constants::NumSeats; ++s)
        {
            snap->hand_sizes[s] = static_cast<uint8_t>(state_.hands[s].size());
        }
        snap->reserved = state_.reserved;
        snap->landlord = state_.landlord;
        snap->last_play = state_.last_play;
        snap->consecutive_passes = state_.consecutive_passes;
        snap->highest_bid = state_.bidding.highest_bid;
        snap->bomb_multiplier = state_.bomb_multiplier;
        return snap;
    }

    auto GameImpl::Submit(PlyrIdxT const seat, PlayerAction const& action, bool const timed_out)
        -> std::expected<MoveOutcome, error::RuleViolation>
    {
        if (auto const ok = rules_->Validate(state_, seat, action); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }
        rules_->Apply(state_, seat, action);
        MoveOutcome const outcome = rules_->Advance(state_);
        if (outcome == MoveOutcome::Redeal)
        {
            DealNew();
        }
        last_move_ = AppliedMove{seat, action, outcome, timed_out};
        return outcome;
    }

    auto GameImpl::Step() -> MoveOutcome
    {
        PlyrIdxT const actor = CurrentActor(state_);
        DDZ_ASSERT(state_.phase != Phase::Finished, "Step on a finished table");
        DDZ_ASSERT(players_[actor] != nullptr, "Step for a seat without a local player");

        TimedDecision const dec = Judge::GetAction(*this, actor);
        auto const res = Submit(actor, dec.action, dec.verdict == Verdict::TimedOut);
        if (!res)
        {
            std::print("[Game] P{} ({}) rejected: {}\n", static_cast<int>(actor), LabelAt(actor),
                       error::describe(res.error()));
            return MoveOutcome::Invalid;
        }
        return *res;
    }

    auto GameImpl::Abort(PlyrIdxT const departed) -> void
    {
        if (state_.phase == Phase::Finished) return;
        state_.phase = Phase::Finished;
        state_.finish_reason = FinishReason::PeerDisconnected;
        state_.departed = departed;
        last_move_ = AppliedMove{departed, PassAction{}, MoveOutcome::Aborted, false};
    }

    auto GameImpl::LabelAt(PlyrIdxT const seat) const -> std::string_view
    {
        return players_[seat] ? players_[seat]->Label() : std::string_view{"remote"};
    }

    auto GameImpl::Result() const -> std::optional<DealResult>
    {
        if (state_.phase != Phase::Finished || state_.finish_reason != FinishReason::HandEmptied)
            return std::nullopt;
        return rules_->Score(state_);
    }
}
