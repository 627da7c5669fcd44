//
// codec.hpp
//

#ifndef DOUDIZHU_CODEC_HPP
#define DOUDIZHU_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <string_view>
#include <expected>
#include <optional>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Game.hpp"
#include "../core/Exception.hpp"

#include "generated/ddz_net_generated.h"

namespace ddz::core::net
{
    struct ParseError
    {
        std::string message;
    };

    struct JoinRequest
    {
        std::string name;
    };

    struct LeaveRequest
    {
    };

    // Everything a client may send; the seat comes from the connection, never the payload.
    using ClientRequest = std::variant<JoinRequest, LeaveRequest, PlayerAction>;

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        ClientRequest request{};
    };

    auto ToFbSuit(ddz::core::Suit s) noexcept -> ddz::gen::net::Suit;
    auto ToFbRank(ddz::core::Rank r) noexcept -> ddz::gen::net::Rank;
    auto ToFbShape(ddz::core::ShapeType t) noexcept -> ddz::gen::net::ShapeType;

    auto FromFbShape(ddz::gen::net::ShapeType t) noexcept -> ddz::core::ShapeType;
    // nullopt for out-of-range values or an impossible suit/rank pair
    auto FromFbCard(ddz::gen::net::Card const* c) noexcept -> std::optional<ddz::core::Card>;
    auto ReadCards(flatbuffers::Vector<flatbuffers::Offset<ddz::gen::net::Card>> const* v)
        -> std::expected<ddz::core::Cards, ParseError>;

    // --- Client -> server ---

    auto BuildJoin(std::string_view name, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildBid(bool wants_to_bid, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildPlay(std::span<ddz::core::Card const> cards, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildPass(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildLeave(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Server -> client ---

    auto BuildWaiting(std::uint8_t position, std::uint8_t total, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildGameStart(ddz::core::GameImpl const& g,
                        ddz::core::PlyrIdxT seat,
                        std::span<std::string const> names,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildBidUpdate(ddz::core::GameImpl const& g,
                        ddz::core::AppliedMove const& m,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // my_cards is filled for the landlord only
    auto BuildBidFinalized(ddz::core::GameImpl const& g,
                           ddz::core::PlyrIdxT seat,
                           std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildRedeal(ddz::core::GameImpl const& g,
                     ddz::core::PlyrIdxT seat,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildPlayUpdate(ddz::core::GameImpl const& g,
                         ddz::core::AppliedMove const& m,
                         std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildPassUpdate(ddz::core::GameImpl const& g,
                         ddz::core::AppliedMove const& m,
                         std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildGameOver(ddz::core::GameImpl const& g, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildPlayerLeft(ddz::core::PlyrIdxT seat, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(ddz::core::error::RuleViolation const& v,
                        std::uint64_t ref_msg_id,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Transport-level problems (bad frame, duplicate join); code is -1
    auto BuildError(std::string_view message, std::uint64_t ref_msg_id, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    // Runs the FlatBuffers verifier before handing out the root.
    auto VerifyEnvelope(std::span<std::byte const> bytes)
        -> std::expected<ddz::gen::net::Envelope const*, ParseError>;

    auto DecodeClientRequest(std::span<std::byte const> bytes)
        -> std::expected<DecodedRequest, ParseError>;
} // namespace ddz::core::net


#endif //DOUDIZHU_CODEC_HPP
