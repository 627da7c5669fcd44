//
// Judge.cpp
//
#include "Judge.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <utility>
#include "Exception.hpp"
#include "Game.hpp"
#include "Moves.hpp"
#include "Player.hpp"

namespace ddz::core
{
    auto Judge::DefaultAction(GameSnapshot const& s) -> PlayerAction
    {
        if (s.phase == Phase::Bidding)
            return BidAction{false};

        if (!s.Leading())
            return PassAction{};

        auto weakest = SuggestPlay(s.my_hand, std::nullopt);
        if (!weakest) [[unlikely]]
        {
            DDZ_THROW(error::Code::State, "Leading seat has no legal play");
        }
        return PlayAction{std::move(weakest->cards)};
    }

    auto Judge::GetAction(GameImpl& game, PlyrIdxT actor) -> TimedDecision
    {
        // a Player is never asked twice at once
        if (auto& late = game.late_[actor]; late.valid())
        {
            late.wait();
            late = {};
        }

        std::shared_ptr<const GameSnapshot> snap = game.SnapshotFor(actor);
        auto const deadline = std::chrono::steady_clock::now() + game.GetConfig().turn_timeout;

        std::packaged_task<PlayerAction()> task(
            [p = game.PlayerAt(actor),
             snp = std::move(snap),
             deadline]() mutable
            {
                return p->Play(std::move(snp), deadline);
            }
        );

        std::future<PlayerAction> fut = task.get_future();

        std::thread worker(std::move(task));
        worker.detach();

        if (fut.wait_until(deadline) == std::future_status::ready)
        {
            return {fut.get(), Verdict::InTime};
        }

        //Timeout: the worker keeps running, GameImpl waits for it before the Player goes away
        game.late_[actor] = std::move(fut);
        return {DefaultAction(*game.SnapshotFor(actor)), Verdict::TimedOut};
    }
}
