//
// Lobby.hpp
//

#ifndef DOUDIZHU_LOBBY_HPP
#define DOUDIZHU_LOBBY_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "../core/Types.hpp"

namespace ddz::core::net
{
    // FIFO matchmaking queue. Not thread safe; the server calls it from its io thread.
    class Lobby
    {
    public:
        using ConnId = uint64_t;

        struct Waiter
        {
            ConnId id{};
            std::string name;
        };

        // humans_per_table < 3 leaves the remaining seats to bots
        explicit Lobby(std::size_t humans_per_table = constants::NumSeats);

        // Queues id. Returns the seated group (in seat order) once enough have joined.
        auto Join(ConnId id, std::string name) -> std::expected<std::optional<std::vector<Waiter>>, std::string>;

        // Drops id from the queue; false when it was not queued.
        auto Leave(ConnId id) -> bool;

        auto Contains(ConnId id) const -> bool;
        // 1-based queue position
        auto PositionOf(ConnId id) const -> std::optional<uint8_t>;
        auto Waiting() const noexcept -> std::vector<Waiter> const& { return queue_; }
        auto HumansPerTable() const noexcept -> std::size_t { return humans_per_table_; }

    private:
        std::size_t humans_per_table_;
        std::vector<Waiter> queue_;
    };
}

#endif //DOUDIZHU_LOBBY_HPP
