//
// AuditLogger.hpp
//

#ifndef DOUDIZHU_AUDITLOGGER_HPP
#define DOUDIZHU_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace ddz::core::debug
{
    // Plain-text transcript of one table, one line per event.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, deal number, hands and reserved cards)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Per turn (before Submit): snapshot of the actor and the proposed action
        auto turn(GameSnapshot const& s,
                  std::uint8_t actor,
                  PlayerAction const& a) -> void;

        auto outcome(MoveOutcome m) -> void;

        // Footer: winner, landlord, score
        auto end(GameImpl const& game) -> void;

    private:
        std::ofstream out_;
    };
}

#endif //DOUDIZHU_AUDITLOGGER_HPP
