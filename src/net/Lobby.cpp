//
// Lobby.cpp
//
#include "Lobby.hpp"

#include <algorithm>
#include "../core/Exception.hpp"

namespace ddz::core::net
{
    Lobby::Lobby(std::size_t humans_per_table) :
        humans_per_table_(humans_per_table)
    {
        DDZ_ASSERT(humans_per_table_ >= 1 && humans_per_table_ <= constants::NumSeats,
                   "A table seats one to three humans");
    }

    auto Lobby::Contains(ConnId id) const -> bool
    {
        return std::ranges::any_of(queue_, [id](Waiter const& w) { return w.id == id; });
    }

    auto Lobby::Join(ConnId id, std::string name) -> std::expected<std::optional<std::vector<Waiter>>, std::string>
    {
        if (Contains(id)) return std::unexpected(std::string{"already waiting"});

        queue_.push_back(Waiter{id, std::move(name)});
        if (queue_.size() < humans_per_table_) return std::optional<std::vector<Waiter>>{};

        auto const split = queue_.begin() + static_cast<std::ptrdiff_t>(humans_per_table_);
        std::vector<Waiter> group(std::make_move_iterator(queue_.begin()), std::make_move_iterator(split));
        queue_.erase(queue_.begin(), split);
        return std::optional<std::vector<Waiter>>{std::move(group)};
    }

    auto Lobby::Leave(ConnId id) -> bool
    {
        return std::erase_if(queue_, [id](Waiter const& w) { return w.id == id; }) > 0;
    }

    auto Lobby::PositionOf(ConnId id) const -> std::optional<uint8_t>
    {
        auto const it = std::ranges::find_if(queue_, [id](Waiter const& w) { return w.id == id; });
        if (it == queue_.end()) return std::nullopt;
        return static_cast<uint8_t>(std::distance(queue_.begin(), it) + 1);
    }
}
