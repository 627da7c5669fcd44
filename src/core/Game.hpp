//
// Game.hpp
//

#ifndef DOUDIZHU_GAME_HPP
#define DOUDIZHU_GAME_HPP

#include <array>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"
#include "Judge.hpp"

namespace ddz::core::debug {struct Inspector;}
namespace ddz::core
{
    struct AppliedMove
    {
        PlyrIdxT actor{};
        PlayerAction action{};
        MoveOutcome outcome{MoveOutcome::Invalid};
        bool timed_out{false};
    };

    // One table's authoritative game. Not thread safe: exactly one owner (the table
    // actor or a test) calls Submit/Step, which makes it the single serialization point.
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // players may hold nullptr for seats whose actions arrive through Submit.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players);
        // Waits for any player still answering a turn it already lost to the clock.
        ~GameImpl();

        GameImpl(GameImpl const&) = delete;
        auto operator=(GameImpl const&) -> GameImpl& = delete;

        // Asks the current actor's Player (through the Judge) and submits its answer.
        auto Step() -> MoveOutcome;

        // Validate/apply/advance one action from seat. A Redeal outcome has already reshuffled.
        auto Submit(PlyrIdxT seat, PlayerAction const& action, bool timed_out = false)
            -> std::expected<MoveOutcome, error::RuleViolation>;

        // A seat left: the deal ends without a winner.
        auto Abort(PlyrIdxT departed) -> void;

        auto SnapshotFor(PlyrIdxT seat) const -> std::shared_ptr<GameSnapshot const>;

        auto State()        const noexcept -> TableState const& { return state_; }
        auto PhaseNow()     const noexcept -> Phase { return state_.phase; }
        auto Actor()        const noexcept -> PlyrIdxT { return CurrentActor(state_); }
        auto Landlord()     const noexcept -> std::optional<PlyrIdxT> { return state_.landlord; }
        auto LastMove()     const noexcept -> std::optional<AppliedMove> const& { return last_move_; }
        auto GetConfig()    const noexcept -> Config const& { return cfg_; }
        auto Result()       const -> std::optional<DealResult>;
        auto PlayerAt(PlyrIdxT seat) -> Player* { return players_[seat].get(); }
        // "remote" for seats without a local Player
        auto LabelAt(PlyrIdxT seat) const -> std::string_view;

        //allows class to directly access private data on an instance
        friend struct debug::Inspector;
        friend class Judge;

    private:
        auto DealNew() -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Player>> players_;
        std::mt19937_64 rng_;

        TableState state_{};
        std::optional<AppliedMove> last_move_{};
        // per seat, an answer that arrived after its deadline (or is still coming)
        std::array<std::future<PlayerAction>, constants::NumSeats> late_{};
    };
}
#endif //DOUDIZHU_GAME_HPP
