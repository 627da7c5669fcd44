//
// TableActor.hpp
//

#ifndef DOUDIZHU_TABLEACTOR_HPP
#define DOUDIZHU_TABLEACTOR_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <flatbuffers/flatbuffers.h>

#include "../core/Game.hpp"
#include "../core/Types.hpp"

namespace ddz::core::debug {struct Inspector;}
namespace ddz::core::net
{
    // Owns one table. Every inbound frame, disconnect, turn deadline and bot move is
    // handled on the thread that calls Run(), one at a time, so the GameImpl never
    // sees concurrent access. Other threads only Post().
    class TableActor
    {
    public:
        enum class SeatKind : uint8_t
        {
            Remote,
            Bot
        };

        using SendFn = std::function<void(PlyrIdxT seat, flatbuffers::DetachedBuffer frame)>;

        TableActor(Config const& cfg,
                   std::array<SeatKind, constants::NumSeats> kinds,
                   std::array<std::string, constants::NumSeats> names,
                   SendFn send,
                   AiPolicy policy = {});

        TableActor(TableActor const&) = delete;
        auto operator=(TableActor const&) -> TableActor& = delete;

        // Thread safe.
        auto Post(PlyrIdxT seat, std::vector<uint8_t> frame) -> void;
        auto PostDisconnect(PlyrIdxT seat) -> void;
        auto Stop() -> void;

        // Sends game_start, then serves the table until the deal ends or Stop().
        // An engine failure closes the table with an error frame to every remote seat.
        auto Run() -> void;

        auto Finished() const noexcept -> bool { return finished_.load(); }

        // Only once Run() has returned.
        auto Game() const noexcept -> GameImpl const& { return game_; }

        friend struct debug::Inspector;

    private:
        struct Inbound
        {
            PlyrIdxT seat{};
            std::vector<uint8_t> frame;
            bool disconnect{false};
        };

        auto Serve() -> void;
        auto PopUntil(std::chrono::steady_clock::time_point deadline) -> std::optional<Inbound>;
        // true once the game moved on (or ended)
        auto Handle(Inbound in) -> bool;
        auto SubmitAndBroadcast(PlyrIdxT seat, PlayerAction const& action, bool timed_out, uint64_t ref_id) -> bool;
        auto Broadcast(AppliedMove const& m) -> void;
        auto SendStart() -> void;
        auto SendTo(PlyrIdxT seat, flatbuffers::DetachedBuffer frame) -> void;
        auto NextId() -> uint64_t { return next_msg_id_++; }

    private:
        Config cfg_;
        std::array<SeatKind, constants::NumSeats> kinds_;
        std::array<std::string, constants::NumSeats> names_;
        SendFn send_;
        GameImpl game_;

        std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<Inbound> inbox_;
        bool stop_{false};

        std::atomic<bool> finished_{false};
        uint64_t next_msg_id_{1};
    };
}

#endif //DOUDIZHU_TABLEACTOR_HPP
