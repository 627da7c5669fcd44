//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <vector>

#include "../core/HandShape.hpp"
#include "../core/Util.hpp"

namespace
{
    namespace fb = ddz::gen::net;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)ddz::core::Suit::Joker == (int)fb::Suit::Joker);
    static_assert((int)ddz::core::Rank::Three == (int)fb::Rank::Three);
    static_assert((int)ddz::core::Rank::BigJoker == (int)fb::Rank::BigJoker);
    static_assert((int)ddz::core::ShapeType::Rocket == (int)fb::ShapeType::Rocket);

    auto Seal(flatbuffers::FlatBufferBuilder& fbb,
              std::uint64_t msg_id,
              fb::Message type,
              flatbuffers::Offset<void> body)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, msg_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    auto HandSizes(ddz::core::TableState const& s) -> std::vector<uint8_t>
    {
        std::vector<uint8_t> out;
        out.reserve(s.hands.size());
        for (auto const& h : s.hands) out.push_back(static_cast<uint8_t>(h.size()));
        return out;
    }
} // anonymous

namespace ddz::core::net
{
    auto ToFbSuit(ddz::core::Suit s) noexcept -> ddz::gen::net::Suit
    {
        return static_cast<fb::Suit>(std::to_underlying(s));
    }

    auto ToFbRank(ddz::core::Rank r) noexcept -> ddz::gen::net::Rank
    {
        return static_cast<fb::Rank>(std::to_underlying(r));
    }

    auto ToFbShape(ddz::core::ShapeType t) noexcept -> ddz::gen::net::ShapeType
    {
        return static_cast<fb::ShapeType>(std::to_underlying(t));
    }

    auto FromFbShape(ddz::gen::net::ShapeType t) noexcept -> ddz::core::ShapeType
    {
        return static_cast<ShapeType>(std::to_underlying(t));
    }

    auto FromFbCard(ddz::gen::net::Card const* c) noexcept -> std::optional<ddz::core::Card>
    {
        if (!c) return std::nullopt;
        auto const s = std::to_underlying(c->suit());
        auto const r = std::to_underlying(c->rank());
        if (s > std::to_underlying(Suit::Joker)) return std::nullopt;
        if (r < std::to_underlying(Rank::Three) || r > std::to_underlying(Rank::BigJoker)) return std::nullopt;
        bool const joker_rank = r >= std::to_underlying(Rank::SmallJoker);
        bool const joker_suit = s == std::to_underlying(Suit::Joker);
        if (joker_rank != joker_suit) return std::nullopt;
        return Card{static_cast<Suit>(s), static_cast<Rank>(r)};
    }

    auto ReadCards(flatbuffers::Vector<flatbuffers::Offset<ddz::gen::net::Card>> const* v)
        -> std::expected<ddz::core::Cards, ParseError>
    {
        Cards out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* fb_c : *v)
        {
            auto const c = FromFbCard(fb_c);
            if (!c) return std::unexpected(ParseError{"invalid card"});
            out.push_back(*c);
        }
        return out;
    }

    static auto WriteCards(flatbuffers::FlatBufferBuilder& fbb, std::span<Card const> cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Card>>>
    {
        std::vector<flatbuffers::Offset<fb::Card>> vec;
        vec.reserve(cards.size());
        for (Card const& c : cards)
        {
            vec.push_back(fb::CreateCard(fbb, ToFbSuit(c.suit), ToFbRank(c.rank)));
        }
        return fbb.CreateVector(vec);
    }

    // ---------- Builders (client → server) ----------

    auto BuildJoin(std::string_view name, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const n = fbb.CreateString(name.data(), name.size());
        auto const j = fb::CreateJoinMsg(fbb, n);
        return Seal(fbb, msg_id, fb::Message::JoinMsg, j.Union());
    }

    auto BuildBid(bool wants_to_bid, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const b = fb::CreateBidMsg(fbb, wants_to_bid);
        return Seal(fbb, msg_id, fb::Message::BidMsg, b.Union());
    }

    auto BuildPlay(std::span<Card const> cards, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<uint8_t> ids;
        ids.reserve(cards.size());
        for (Card const& c : cards) ids.push_back(util::CardToUID(c));
        auto const p = fb::CreatePlayMsg(fbb, fbb.CreateVector(ids));
        return Seal(fbb, msg_id, fb::Message::PlayMsg, p.Union());
    }

    auto BuildPass(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const p = fb::CreatePassMsg(fbb);
        return Seal(fbb, msg_id, fb::Message::PassMsg, p.Union());
    }

    auto BuildLeave(std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const l = fb::CreateLeaveMsg(fbb);
        return Seal(fbb, msg_id, fb::Message::LeaveMsg, l.Union());
    }

    // ---------- Builders (server → client) ----------

    auto BuildWaiting(std::uint8_t position, std::uint8_t total, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const w = fb::CreateWaitingMsg(fbb, position, total);
        return Seal(fbb, msg_id, fb::Message::WaitingMsg, w.Union());
    }

    auto BuildGameStart(GameImpl const& g,
                        PlyrIdxT seat,
                        std::span<std::string const> names,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        auto const& s = g.State();
        flatbuffers::FlatBufferBuilder fbb;

        auto const mine = WriteCards(fbb, s.hands[seat]);
        auto const reserved = WriteCards(fbb, s.reserved);
        auto const sizes = fbb.CreateVector(HandSizes(s));
        auto const name_vec = fbb.CreateVectorOfStrings(std::vector<std::string>(names.begin(), names.end()));

        auto const gs = fb::CreateGameStartMsg(
            fbb,
            /*my_cards*/ mine,
            /*reserved_cards*/ reserved,
            /*my_seat*/ seat,
            /*first_bidder*/ s.bidding.current_bidder,
            /*hand_sizes*/ sizes,
            /*player_names*/ name_vec);
        return Seal(fbb, msg_id, fb::Message::GameStartMsg, gs.Union());
    }

    auto BuildBidUpdate(GameImpl const& g, AppliedMove const& m, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        auto const* bid = std::get_if<BidAction>(&m.action);
        DDZ_ASSERT(bid != nullptr, "BidUpdate built for a non-bid move");

        auto const& s = g.State();
        bool const done = m.outcome == MoveOutcome::BiddingEnded || m.outcome == MoveOutcome::Redeal;
        int8_t const next = done ? int8_t{-1} : static_cast<int8_t>(s.bidding.current_bidder);

        flatbuffers::FlatBufferBuilder fbb;
        auto const b = fb::CreateBidUpdateMsg(fbb, m.actor, bid->wants_to_bid,
                                              s.bidding.highest_bid, done, next);
        return Seal(fbb, msg_id, fb::Message::BidUpdateMsg, b.Union());
    }

    auto BuildBidFinalized(GameImpl const& g, PlyrIdxT seat, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        auto const& s = g.State();
        DDZ_ASSERT(s.landlord.has_value(), "BidFinalized without a landlord");

        flatbuffers::FlatBufferBuilder fbb;
        auto const reserved = WriteCards(fbb, s.reserved);
        auto const sizes = fbb.CreateVector(HandSizes(s));
        flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Card>>> mine{};
        if (seat == *s.landlord)
        {
            mine = WriteCards(fbb, s.hands[seat]);
        }
        auto const bf = fb::CreateBidFinalizedMsg(fbb, *s.landlord, reserved, sizes, mine);
        return Seal(fbb, msg_id, fb::Message::BidFinalizedMsg, bf.Union());
    }

    auto BuildRedeal(GameImpl const& g, PlyrIdxT seat, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        auto const& s = g.State();
        flatbuffers::FlatBufferBuilder fbb;
        auto const mine = WriteCards(fbb, s.hands[seat]);
        auto const reserved = WriteCards(fbb, s.reserved);
        auto const sizes = fbb.CreateVector(HandSizes(s));
        auto const r = fb::CreateRedealMsg(fbb, mine, reserved, s.bidding.current_bidder, sizes);
        return Seal(fbb, msg_id, fb::Message::RedealMsg, r.Union());
    }

    auto BuildPlayUpdate(GameImpl const& g, AppliedMove const& m, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        auto const* play = std::get_if<PlayAction>(&m.action);
        DDZ_ASSERT(play != nullptr, "PlayUpdate built for a non-play move");
        auto const shape = Classify(play->cards);
        DDZ_ASSERT(shape.has_value(), "PlayUpdate for an unclassifiable play");

        auto const& s = g.State();
        flatbuffers::FlatBufferBuilder fbb;
        auto const cards = WriteCards(fbb, play->cards);
        auto const pu = fb::CreatePlayUpdateMsg(
            fbb,
            /*seat*/ m.actor,
            /*cards*/ cards,
            /*shape_type*/ ToFbShape(shape->type),
            /*hand_size_remaining*/ static_cast<uint8_t>(s.hands[m.actor].size()),
            /*next_seat*/ s.current,
            /*bomb_multiplier*/ s.bomb_multiplier);
        return Seal(fbb, msg_id, fb::Message::PlayUpdateMsg, pu.Union());
    }

    auto BuildPassUpdate(GameImpl const& g, AppliedMove const& m, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        DDZ_ASSERT(std::holds_alternative<PassAction>(m.action), "PassUpdate built for a non-pass move");
        auto const& s = g.State();
        flatbuffers::FlatBufferBuilder fbb;
        auto const pu = fb::CreatePassUpdateMsg(fbb, m.actor, s.current,
                                                m.outcome == MoveOutcome::TrickReset,
                                                s.consecutive_passes);
        return Seal(fbb, msg_id, fb::Message::PassUpdateMsg, pu.Union());
    }

    auto BuildGameOver(GameImpl const& g, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        auto const r = g.Result();
        DDZ_ASSERT(r.has_value(), "GameOver built before the deal finished");

        flatbuffers::FlatBufferBuilder fbb;
        auto const cards = WriteCards(fbb, r->final_cards);
        std::vector<int32_t> const deltas(r->score_delta.begin(), r->score_delta.end());
        auto const go = fb::CreateGameOverMsg(
            fbb,
            /*winner_seat*/ r->winner,
            /*landlord_seat*/ r->landlord,
            /*landlord_won*/ r->landlord_won,
            /*final_cards*/ cards,
            /*final_shape_type*/ ToFbShape(r->final_shape.value_or(ShapeType::Single)),
            /*bomb_multiplier*/ r->bomb_multiplier,
            /*score_deltas*/ fbb.CreateVector(deltas));
        return Seal(fbb, msg_id, fb::Message::GameOverMsg, go.Union());
    }

    auto BuildPlayerLeft(PlyrIdxT seat, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const pl = fb::CreatePlayerLeftMsg(fbb, seat);
        return Seal(fbb, msg_id, fb::Message::PlayerLeftMsg, pl.Union());
    }

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t ref_msg_id, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const e = fb::CreateErrorMsg(fbb, ref_msg_id, static_cast<int16_t>(v.code),
                                          std::to_underlying(error::KindOf(v.code)), txt);
        return Seal(fbb, msg_id, fb::Message::ErrorMsg, e.Union());
    }

    auto BuildError(std::string_view message, std::uint64_t ref_msg_id, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(message.data(), message.size());
        auto const e = fb::CreateErrorMsg(fbb, ref_msg_id, int16_t{-1},
                                          std::to_underlying(error::ErrorKind::Internal), txt);
        return Seal(fbb, msg_id, fb::Message::ErrorMsg, e.Union());
    }

    // ---------- Decode (server ← client) ----------

    auto VerifyEnvelope(std::span<std::byte const> bytes)
        -> std::expected<ddz::gen::net::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }

    auto DecodeClientRequest(std::span<std::byte const> bytes)
        -> std::expected<DecodedRequest, ParseError>
    {
        auto const env = VerifyEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        DecodedRequest out{};
        out.msg_id = (*env)->msg_id();

        switch ((*env)->message_type())
        {
        case fb::Message::JoinMsg:
        {
            auto const* j = (*env)->message_as_JoinMsg();
            out.request = JoinRequest{j->name() ? j->name()->str() : std::string{}};
            return out;
        }
        case fb::Message::BidMsg:
        {
            out.request = PlayerAction{BidAction{(*env)->message_as_BidMsg()->wants_to_bid()}};
            return out;
        }
        case fb::Message::PlayMsg:
        {
            Cards cards;
            if (auto const* ids = (*env)->message_as_PlayMsg()->card_ids())
            {
                cards.reserve(ids->size());
                for (uint8_t const id : *ids)
                {
                    auto const c = util::CardFromUID(id);
                    if (!c) return std::unexpected(ParseError{"card id out of range"});
                    cards.push_back(*c);
                }
            }
            out.request = PlayerAction{PlayAction{std::move(cards)}};
            return out;
        }
        case fb::Message::PassMsg:
        {
            out.request = PlayerAction{PassAction{}};
            return out;
        }
        case fb::Message::LeaveMsg:
        {
            out.request = LeaveRequest{};
            return out;
        }
        default:
            break;
        }
        return std::unexpected(ParseError{"not a client message"});
    }
} // namespace ddz::core::net
