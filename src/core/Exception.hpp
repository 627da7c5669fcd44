//
// Exception.hpp
//

#ifndef DOUDIZHU_EXCEPTION_HPP
#define DOUDIZHU_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"
#include "HandShape.hpp"

namespace ddz::core::error
{
    // Engine failures only. Bad moves and bad frames are values (RuleViolation, ParseError).
    enum class Code : unsigned
    {
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        Assertion // internal assertion failed
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define DDZ_THROW(code_enum, msg) ::ddz::core::error::fail((code_enum), (msg))
#define DDZ_ASSERT(cond, msg) do { if(!(cond)) ::ddz::core::error::fail(::ddz::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase_BiddingRequired,
        WrongPhase_PlayingRequired,
        WrongPhase_Finished,
        NotYourTurn,

        // Play
        Play_Empty,
        Play_DuplicateCards,
        Play_CardsNotHeld,
        Play_IllegalShape,
        Play_CannotBeat,

        // Pass
        Pass_WhileLeading,

        // Table
        Table_PeerDisconnected,

        // Safety net
        Internal_Unreachable
    };

    // Coarse categories shown to players.
    enum class ErrorKind : std::uint8_t
    {
        WrongPhase,
        NotYourTurn,
        IllegalShape,
        CannotBeat,
        CardsNotHeld,
        IllegalPass,
        PeerDisconnected,
        Internal
    };

    inline auto KindOf(RuleViolationCode c) -> ErrorKind
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongPhase_BiddingRequired:
        case E::WrongPhase_PlayingRequired:
        case E::WrongPhase_Finished: return ErrorKind::WrongPhase;
        case E::NotYourTurn: return ErrorKind::NotYourTurn;
        case E::Play_Empty:
        case E::Play_IllegalShape: return ErrorKind::IllegalShape;
        case E::Play_CannotBeat: return ErrorKind::CannotBeat;
        case E::Play_DuplicateCards:
        case E::Play_CardsNotHeld: return ErrorKind::CardsNotHeld;
        case E::Pass_WhileLeading: return ErrorKind::IllegalPass;
        case E::Table_PeerDisconnected: return ErrorKind::PeerDisconnected;
        case E::Internal_Unreachable: return ErrorKind::Internal;
        }
        return ErrorKind::Internal;
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<PlyrIdxT> expected_actor{};

        std::optional<std::uint8_t> attempted_count{}; // number of cards in the play

        // Shape details
        std::optional<ShapeType> shape{};   // what the play classified as
        std::optional<ShapeType> to_beat{}; // what was on the table

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_expected(PlyrIdxT s) -> RuleViolation&
        {
            expected_actor = s;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_shape(ShapeType t) -> RuleViolation&
        {
            shape = t;
            return *this;
        }

        auto with_to_beat(ShapeType t) -> RuleViolation&
        {
            to_beat = t;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::WrongPhase_BiddingRequired: return "Wrong phase (bidding required)";
        case E::WrongPhase_PlayingRequired: return "Wrong phase (playing required)";
        case E::WrongPhase_Finished: return "Wrong phase (game finished)";
        case E::NotYourTurn: return "Not your turn";

        // Play
        case E::Play_Empty: return "Play: empty card list";
        case E::Play_DuplicateCards: return "Play: duplicate cards in action";
        case E::Play_CardsNotHeld: return "Play: card not in hand";
        case E::Play_IllegalShape: return "Play: cards form no legal shape";
        case E::Play_CannotBeat: return "Play: does not beat the last play";

        // Pass
        case E::Pass_WhileLeading: return "Pass: the leader must play";

        case E::Table_PeerDisconnected: return "Table: a player disconnected";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.expected_actor) s += std::format(" | expected=P{}", static_cast<int>(*v.expected_actor));
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        if (v.shape) s += std::format(" | shape={}", to_string(*v.shape));
        if (v.to_beat) s += std::format(" | to_beat={}", to_string(*v.to_beat));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //DOUDIZHU_EXCEPTION_HPP
