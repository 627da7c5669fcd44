//
// ClientTable.cpp
//
#include "ClientTable.hpp"

#include <algorithm>
#include "../core/Deck.hpp"
#include "../core/HandShape.hpp"

namespace ddz::core::net
{
    namespace fb = ddz::gen::net;

    auto ClientTable::Local(PlyrIdxT const absolute) const -> RelSeat
    {
        DDZ_ASSERT(my_seat_.has_value(), "Seat mapping before game start");
        return ToRelative(*my_seat_, absolute);
    }

    auto ClientTable::SetCounts(flatbuffers::Vector<uint8_t> const* sizes) -> void
    {
        if (!sizes || !my_seat_) return;
        for (PlyrIdxT abs{}; abs < sizes->size() && abs < constants::NumSeats; ++abs)
        {
            counts_[std::to_underlying(Local(abs))] = sizes->Get(abs);
        }
    }

    auto ClientTable::ResetDeal() -> void
    {
        phase_ = Phase::Bidding;
        landlord_.reset();
        last_play_.reset();
        highest_bid_ = 0;
        consecutive_passes_ = 0;
        bomb_multiplier_ = 1;
        winner_.reset();
        landlord_won_ = false;
        score_deltas_.clear();
    }

    auto ClientTable::Apply(std::span<std::byte const> frame) -> std::expected<fb::Message, ParseError>
    {
        auto const env = VerifyEnvelope(frame);
        if (!env) return std::unexpected(env.error());
        return Apply(**env);
    }

    auto ClientTable::Apply(fb::Envelope const& env) -> std::expected<fb::Message, ParseError>
    {
        auto const type = env.message_type();
        switch (type)
        {
        case fb::Message::WaitingMsg:
        {
            auto const* w = env.message_as_WaitingMsg();
            queue_position_ = w->position();
            queue_total_ = w->total();
            return type;
        }
        case fb::Message::GameStartMsg:
        {
            auto const* gs = env.message_as_GameStartMsg();
            auto mine = ReadCards(gs->my_cards());
            auto reserved = ReadCards(gs->reserved_cards());
            if (!mine || !reserved) return std::unexpected(ParseError{"game_start: invalid card"});
            if (gs->my_seat() >= constants::NumSeats || gs->first_bidder() >= constants::NumSeats)
                return std::unexpected(ParseError{"game_start: seat out of range"});

            ResetDeal();
            departed_.reset();
            my_seat_ = gs->my_seat();
            my_hand_ = std::move(*mine);
            SortCards(my_hand_);
            reserved_ = std::move(*reserved);
            actor_ = gs->first_bidder();
            names_.clear();
            if (auto const* names = gs->player_names())
                for (auto const* n : *names) names_.push_back(n->str());
            SetCounts(gs->hand_sizes());
            break;
        }
        case fb::Message::BidUpdateMsg:
        {
            auto const* bu = env.message_as_BidUpdateMsg();
            highest_bid_ = bu->highest_bid();
            if (!bu->done() && bu->next_bidder() >= 0)
                actor_ = static_cast<PlyrIdxT>(bu->next_bidder());
            else
                actor_.reset();
            break;
        }
        case fb::Message::BidFinalizedMsg:
        {
            auto const* bf = env.message_as_BidFinalizedMsg();
            if (bf->landlord_seat() >= constants::NumSeats)
                return std::unexpected(ParseError{"bid_finalized: seat out of range"});
            auto reserved = ReadCards(bf->reserved_cards());
            if (!reserved) return std::unexpected(reserved.error());
            landlord_ = bf->landlord_seat();
            reserved_ = std::move(*reserved);
            if (my_seat_ && *my_seat_ == *landlord_)
            {
                auto mine = ReadCards(bf->my_cards());
                if (!mine) return std::unexpected(mine.error());
                my_hand_ = std::move(*mine);
                SortCards(my_hand_);
            }
            SetCounts(bf->hand_sizes());
            phase_ = Phase::Playing;
            actor_ = *landlord_;
            last_play_.reset();
            consecutive_passes_ = 0;
            break;
        }
        case fb::Message::RedealMsg:
        {
            auto const* rd = env.message_as_RedealMsg();
            auto mine = ReadCards(rd->my_cards());
            auto reserved = ReadCards(rd->reserved_cards());
            if (!mine || !reserved) return std::unexpected(ParseError{"redeal: invalid card"});
            ResetDeal();
            my_hand_ = std::move(*mine);
            SortCards(my_hand_);
            reserved_ = std::move(*reserved);
            actor_ = rd->first_bidder();
            SetCounts(rd->hand_sizes());
            break;
        }
        case fb::Message::PlayUpdateMsg:
        {
            auto const* pu = env.message_as_PlayUpdateMsg();
            if (pu->seat() >= constants::NumSeats || pu->next_seat() >= constants::NumSeats)
                return std::unexpected(ParseError{"play_update: seat out of range"});
            auto cards = ReadCards(pu->cards());
            if (!cards) return std::unexpected(cards.error());

            if (my_seat_ && pu->seat() == *my_seat_)
            {
                for (auto const& c : *cards)
                {
                    if (auto const it = std::ranges::find(my_hand_, c); it != my_hand_.end())
                        my_hand_.erase(it);
                }
            }
            counts_[std::to_underlying(Local(pu->seat()))] = pu->hand_size_remaining();

            auto shape = Classify(*cards);
            HandShape const hs = shape ? *shape : HandShape{FromFbShape(pu->shape_type()), Rank::Three,
                                                            static_cast<uint8_t>(cards->size())};
            last_play_ = PlayRecord{std::move(*cards), pu->seat(), hs};
            consecutive_passes_ = 0;
            bomb_multiplier_ = pu->bomb_multiplier();
            actor_ = pu->next_seat();
            break;
        }
        case fb::Message::PassUpdateMsg:
        {
            auto const* pu = env.message_as_PassUpdateMsg();
            if (pu->next_seat() >= constants::NumSeats)
                return std::unexpected(ParseError{"pass_update: seat out of range"});
            consecutive_passes_ = pu->consecutive_passes();
            if (pu->is_new_trick()) last_play_.reset();
            actor_ = pu->next_seat();
            break;
        }
        case fb::Message::GameOverMsg:
        {
            auto const* go = env.message_as_GameOverMsg();
            phase_ = Phase::Finished;
            actor_.reset();
            winner_ = go->winner_seat();
            landlord_ = go->landlord_seat();
            landlord_won_ = go->landlord_won();
            bomb_multiplier_ = go->bomb_multiplier();
            score_deltas_.clear();
            if (auto const* d = go->score_deltas())
                score_deltas_.assign(d->begin(), d->end());
            if (my_seat_ && winner_ && *winner_ < constants::NumSeats)
                counts_[std::to_underlying(Local(*winner_))] = 0;
            break;
        }
        case fb::Message::PlayerLeftMsg:
        {
            phase_ = Phase::Finished;
            actor_.reset();
            departed_ = env.message_as_PlayerLeftMsg()->seat();
            break;
        }
        case fb::Message::ErrorMsg:
        {
            auto const* e = env.message_as_ErrorMsg();
            last_error_ = e->message() ? e->message()->str() : std::string{"error"};
            return type;
        }
        default:
            return std::unexpected(ParseError{"not a server message"});
        }
        ++revision_;
        return type;
    }

    auto ClientTable::Snapshot() const -> GameSnapshot
    {
        DDZ_ASSERT(my_seat_.has_value(), "Snapshot before game start");
        GameSnapshot s{};
        s.seat = *my_seat_;
        s.phase = phase_;
        s.actor = actor_.value_or(*my_seat_);
        s.my_hand = my_hand_;
        for (PlyrIdxT abs{}; abs < constants::NumSeats; ++abs)
        {
            s.hand_sizes[abs] = counts_[std::to_underlying(Local(abs))];
        }
        s.reserved = reserved_;
        s.landlord = landlord_;
        s.last_play = last_play_;
        s.consecutive_passes = consecutive_passes_;
        s.highest_bid = highest_bid_;
        s.bomb_multiplier = bomb_multiplier_;
        return s;
    }
}
