//
// Player.hpp
//

#ifndef DOUDIZHU_PLAYER_HPP
#define DOUDIZHU_PLAYER_HPP

#include <chrono>
#include <memory>
#include <string_view>
#include "Actions.hpp"
#include "State.hpp"

namespace ddz::core
{
    // A seat the game loop asks for moves. Remote seats have no Player; their
    // actions reach GameImpl::Submit from the table actor instead.
    class Player
    {
    public:
        virtual ~Player() = default;

        // Deadline is authoritative; on timeout the caller substitutes Judge::DefaultAction.
        virtual auto Play(std::shared_ptr<const GameSnapshot> snapshot,
                          std::chrono::steady_clock::time_point deadline) -> PlayerAction = 0;

        // Short tag for logs and transcripts.
        virtual auto Label() const -> std::string_view = 0;
    };
}
#endif //DOUDIZHU_PLAYER_HPP
