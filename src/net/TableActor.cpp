//
// TableActor.cpp
//
#include "TableActor.hpp"

#include <print>
#include <utility>

#include "../core/ClassicRules.hpp"
#include "../core/HeuristicAi.hpp"
#include "../core/Judge.hpp"
#include "codec.hpp"

namespace ddz::core::net
{
    static auto MakePlayers(Config const& cfg,
                            std::array<TableActor::SeatKind, constants::NumSeats> const& kinds,
                            AiPolicy const& policy)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> players;
        for (std::size_t i{}; i < kinds.size(); ++i)
        {
            if (kinds[i] == TableActor::SeatKind::Bot)
                players.emplace_back(std::make_unique<HeuristicAI>(cfg.seed + 1337 * (i + 1), policy));
            else
                players.emplace_back(nullptr);
        }
        return players;
    }

    TableActor::TableActor(Config const& cfg,
                           std::array<SeatKind, constants::NumSeats> kinds,
                           std::array<std::string, constants::NumSeats> names,
                           SendFn send,
                           AiPolicy policy) :
        cfg_(cfg),
        kinds_(kinds),
        names_(std::move(names)),
        send_(std::move(send)),
        game_(cfg, std::make_unique<ClassicRules>(), MakePlayers(cfg, kinds, policy))
    {
        DDZ_ASSERT(static_cast<bool>(send_), "TableActor needs a send function");
    }

    auto TableActor::Post(PlyrIdxT seat, std::vector<uint8_t> frame) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            inbox_.push_back(Inbound{seat, std::move(frame), false});
        }
        cv_.notify_all();
    }

    auto TableActor::PostDisconnect(PlyrIdxT seat) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            inbox_.push_back(Inbound{seat, {}, true});
        }
        cv_.notify_all();
    }

    auto TableActor::Stop() -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    auto TableActor::PopUntil(std::chrono::steady_clock::time_point deadline) -> std::optional<Inbound>
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_until(lk, deadline, [&]{ return stop_ || !inbox_.empty(); });
        if (stop_ || inbox_.empty())
        {
            return std::nullopt;
        }
        Inbound out = std::move(inbox_.front());
        inbox_.pop_front();
        return out;
    }

    auto TableActor::SendTo(PlyrIdxT seat, flatbuffers::DetachedBuffer frame) -> void
    {
        if (kinds_[seat] == SeatKind::Bot) return;
        send_(seat, std::move(frame));
    }

    auto TableActor::SendStart() -> void
    {
        for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
        {
            SendTo(seat, BuildGameStart(game_, seat, names_, NextId()));
        }
    }

    auto TableActor::Broadcast(AppliedMove const& m) -> void
    {
        std::visit([&]<typename T0>(T0 const&)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BidAction>)
            {
                for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
                    SendTo(seat, BuildBidUpdate(game_, m, NextId()));

                if (m.outcome == MoveOutcome::BiddingEnded)
                {
                    std::print("[Table] landlord is P{} (bid {})\n",
                               static_cast<int>(*game_.Landlord()), game_.State().bidding.highest_bid);
                    for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
                        SendTo(seat, BuildBidFinalized(game_, seat, NextId()));
                }
                else if (m.outcome == MoveOutcome::Redeal)
                {
                    std::print("[Table] nobody bid, redeal #{}\n", game_.State().deal_no);
                    for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
                        SendTo(seat, BuildRedeal(game_, seat, NextId()));
                }
            }
            else if constexpr (std::is_same_v<T, PlayAction>)
            {
                if (m.outcome == MoveOutcome::GameEnded)
                {
                    auto const r = game_.Result();
                    std::print("[Table] game over, winner P{} landlord_won={} multiplier={}\n",
                               static_cast<int>(r->winner), r->landlord_won, r->bomb_multiplier);
                    for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
                        SendTo(seat, BuildGameOver(game_, NextId()));
                }
                else
                {
                    for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
                        SendTo(seat, BuildPlayUpdate(game_, m, NextId()));
                }
            }
            else
            {
                for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
                    SendTo(seat, BuildPassUpdate(game_, m, NextId()));
            }
        }, m.action);
    }

    auto TableActor::SubmitAndBroadcast(PlyrIdxT seat, PlayerAction const& action, bool timed_out, uint64_t ref_id)
        -> bool
    {
        auto const res = game_.Submit(seat, action, timed_out);
        if (!res)
        {
            std::print("[Table] P{} rejected: {}\n", static_cast<int>(seat), error::describe(res.error()));
            SendTo(seat, BuildViolation(res.error(), ref_id, NextId()));
            return false;
        }
        Broadcast(*game_.LastMove());
        return true;
    }

    auto TableActor::Handle(Inbound in) -> bool
    {
        if (in.disconnect)
        {
            std::print("[Table] P{} disconnected, closing table\n", static_cast<int>(in.seat));
            game_.Abort(in.seat);
            for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
            {
                if (seat != in.seat) SendTo(seat, BuildPlayerLeft(in.seat, NextId()));
            }
            return true;
        }

        auto const bytes = std::as_bytes(std::span{in.frame});
        auto const req = DecodeClientRequest(bytes);
        if (!req)
        {
            std::print("[Table] P{} sent a bad frame: {}\n", static_cast<int>(in.seat), req.error().message);
            SendTo(in.seat, BuildError(req.error().message, 0, NextId()));
            return false;
        }

        auto const* action = std::get_if<PlayerAction>(&req->request);
        if (!action)
        {
            // join and leave are lobby requests
            SendTo(in.seat, BuildError("already seated", req->msg_id, NextId()));
            return false;
        }
        return SubmitAndBroadcast(in.seat, *action, false, req->msg_id);
    }

    auto TableActor::Run() -> void
    {
        try
        {
            Serve();
        }
        catch (OmegaException<error::Code> const& e)
        {
            // engine misuse or a broken invariant: this table is unusable, the server is not
            std::print("[Table] closing after engine failure: {}\n{}", e.summary(), e);
            for (PlyrIdxT seat{}; seat < constants::NumSeats; ++seat)
            {
                SendTo(seat, BuildError("table closed: internal error", 0, NextId()));
            }
        }
        finished_ = true;
    }

    auto TableActor::Serve() -> void
    {
        SendStart();
        while (game_.PhaseNow() != Phase::Finished)
        {
            PlyrIdxT const actor = game_.Actor();
            bool const bot = kinds_[actor] == SeatKind::Bot;
            auto const deadline = std::chrono::steady_clock::now() + (bot ? cfg_.ai_think_delay : cfg_.turn_timeout);

            bool advanced = false;
            while (!advanced)
            {
                auto in = PopUntil(deadline);
                if (!in) break;
                advanced = Handle(std::move(*in));
            }
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (stop_) break;
            }
            if (advanced) continue;

            if (bot)
            {
                if (game_.Step() != MoveOutcome::Invalid)
                {
                    Broadcast(*game_.LastMove());
                    continue;
                }
            }
            else
            {
                std::print("[Table] P{} timed out\n", static_cast<int>(actor));
            }
            SubmitAndBroadcast(actor, Judge::DefaultAction(*game_.SnapshotFor(actor)), true, 0);
        }
    }
}
