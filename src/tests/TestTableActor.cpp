#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "../debug/Inspector.hpp"
#include "../net/TableActor.hpp"
#include "../net/codec.hpp"

using namespace ddz::core;
namespace fb = ddz::gen::net;
using Kind = net::TableActor::SeatKind;

namespace
{
    using Frame = std::vector<uint8_t>;

    // Thread-safe sink standing in for the websocket connections.
    struct Outbox
    {
        std::mutex mx;
        std::array<std::vector<Frame>, 3> frames{};

        auto Sender() -> net::TableActor::SendFn
        {
            return [this](PlyrIdxT seat, flatbuffers::DetachedBuffer buf)
            {
                std::lock_guard<std::mutex> lock(mx);
                frames[seat].emplace_back(buf.data(), buf.data() + buf.size());
            };
        }

        auto Types(PlyrIdxT seat) -> std::vector<fb::Message>
        {
            std::lock_guard<std::mutex> lock(mx);
            std::vector<fb::Message> out;
            for (auto const& f : frames[seat])
            {
                auto const env = net::VerifyEnvelope(std::as_bytes(std::span{f}));
                out.push_back(env ? (*env)->message_type() : fb::Message::NONE);
            }
            return out;
        }

        auto Count(PlyrIdxT seat, fb::Message t) -> std::size_t
        {
            return std::ranges::count(Types(seat), t);
        }

        // first frame of type t sent to seat, copied out
        auto First(PlyrIdxT seat, fb::Message t) -> std::optional<Frame>
        {
            std::lock_guard<std::mutex> lock(mx);
            for (auto const& f : frames[seat])
            {
                auto const env = net::VerifyEnvelope(std::as_bytes(std::span{f}));
                if (env && (*env)->message_type() == t) return f;
            }
            return std::nullopt;
        }

        auto Last(PlyrIdxT seat) -> std::optional<Frame>
        {
            std::lock_guard<std::mutex> lock(mx);
            if (frames[seat].empty()) return std::nullopt;
            return frames[seat].back();
        }
    };

    auto ToFrame(flatbuffers::DetachedBuffer const& buf) -> Frame
    {
        return Frame(buf.data(), buf.data() + buf.size());
    }

    auto Root(Frame const& f) -> fb::Envelope const*
    {
        return fb::GetEnvelope(f.data());
    }

    auto Names() -> std::array<std::string, 3>
    {
        return {"ann", "bo", "cy"};
    }

    auto SlowClock() -> Config
    {
        Config cfg{};
        cfg.seed = 2024;
        cfg.turn_timeout = std::chrono::seconds(30);
        cfg.ai_think_delay = std::chrono::milliseconds(1);
        return cfg;
    }

    template <class Pred>
    auto WaitFor(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(5)) -> bool
    {
        auto const until = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < until)
        {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return pred();
    }
}

TEST(TableActor_Run, WrongSeatGetsPrivateError)
{
    Outbox box;
    net::TableActor table(SlowClock(), {Kind::Remote, Kind::Remote, Kind::Remote}, Names(), box.Sender());

    // first bidder is seat 0; seat 1 speaks out of turn
    table.Post(1, ToFrame(net::BuildBid(true, 5)));
    table.PostDisconnect(2);
    table.Run();

    EXPECT_TRUE(table.Finished());
    EXPECT_EQ(table.Game().State().finish_reason, FinishReason::PeerDisconnected);

    for (PlyrIdxT s = 0; s < 3; ++s) EXPECT_EQ(box.Count(s, fb::Message::GameStartMsg), 1u);

    EXPECT_EQ(box.Count(1, fb::Message::ErrorMsg), 1u);
    EXPECT_EQ(box.Count(0, fb::Message::ErrorMsg), 0u);
    auto const err = box.First(1, fb::Message::ErrorMsg);
    ASSERT_TRUE(err.has_value());
    auto const* e = Root(*err)->message_as_ErrorMsg();
    EXPECT_EQ(e->ref_msg_id(), 5u);
    EXPECT_EQ(e->code(), static_cast<int16_t>(error::RuleViolationCode::NotYourTurn));

    EXPECT_EQ(box.Count(0, fb::Message::PlayerLeftMsg), 1u);
    EXPECT_EQ(box.Count(1, fb::Message::PlayerLeftMsg), 1u);
    EXPECT_EQ(box.Count(2, fb::Message::PlayerLeftMsg), 0u);
}

TEST(TableActor_Run, ValidBidIsBroadcast)
{
    Outbox box;
    net::TableActor table(SlowClock(), {Kind::Remote, Kind::Remote, Kind::Remote}, Names(), box.Sender());

    table.Post(0, ToFrame(net::BuildBid(true, 1)));
    table.Post(1, ToFrame(net::BuildJoin("again", 2)));
    table.Post(1, Frame{1, 2, 3});
    table.Post(2, ToFrame(net::BuildLeave(3)));
    table.PostDisconnect(1);
    table.Run();

    for (PlyrIdxT s = 0; s < 3; ++s) EXPECT_EQ(box.Count(s, fb::Message::BidUpdateMsg), 1u);
    auto const bu = box.First(2, fb::Message::BidUpdateMsg);
    ASSERT_TRUE(bu.has_value());
    EXPECT_EQ(Root(*bu)->message_as_BidUpdateMsg()->seat(), 0);
    EXPECT_EQ(Root(*bu)->message_as_BidUpdateMsg()->next_bidder(), 1);

    // duplicate join and a junk frame each earn seat 1 an error, a seated leave earns seat 2 one
    EXPECT_EQ(box.Count(1, fb::Message::ErrorMsg), 2u);
    EXPECT_EQ(box.Count(2, fb::Message::ErrorMsg), 1u);
    EXPECT_EQ(table.Game().State().departed, PlyrIdxT{1});
}

TEST(TableActor_Run, TimeoutFallsBackToDefaultAction)
{
    Config cfg = SlowClock();
    cfg.turn_timeout = std::chrono::milliseconds(20);

    Outbox box;
    net::TableActor table(cfg, {Kind::Remote, Kind::Remote, Kind::Remote}, Names(), box.Sender());
    std::thread runner([&] { table.Run(); });

    bool const got = WaitFor([&] { return box.Count(0, fb::Message::BidUpdateMsg) > 0; });
    table.Stop();
    runner.join();

    ASSERT_TRUE(got);
    auto const bu = box.First(0, fb::Message::BidUpdateMsg);
    ASSERT_TRUE(bu.has_value());
    auto const* m = Root(*bu)->message_as_BidUpdateMsg();
    EXPECT_EQ(m->seat(), 0);
    EXPECT_FALSE(m->wants_to_bid());
}

TEST(TableActor_Run, BotsPlayToTheEnd)
{
    Outbox box;
    net::TableActor table(SlowClock(), {Kind::Bot, Kind::Bot, Kind::Bot}, Names(), box.Sender());
    table.Run();

    ASSERT_TRUE(table.Finished());
    auto const r = table.Game().Result();
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(table.Game().State().hands[r->winner].empty());
    EXPECT_EQ(r->landlord_won, r->winner == r->landlord);

    // bot seats never get frames
    for (PlyrIdxT s = 0; s < 3; ++s) EXPECT_TRUE(box.Types(s).empty());
}

TEST(TableActor_Run, HumanAgainstBotsSeesGameOver)
{
    Config cfg = SlowClock();
    cfg.turn_timeout = std::chrono::milliseconds(5);

    Outbox box;
    net::TableActor table(cfg, {Kind::Remote, Kind::Bot, Kind::Bot}, Names(), box.Sender());
    table.Run();

    // the human never answers, so every one of its turns is played by the timeout fallback
    ASSERT_TRUE(table.Finished());
    ASSERT_TRUE(table.Game().Result().has_value());
    EXPECT_EQ(box.Count(0, fb::Message::GameStartMsg), 1u);
    EXPECT_EQ(box.Count(0, fb::Message::GameOverMsg), 1u);
    EXPECT_EQ(box.Types(0).back(), fb::Message::GameOverMsg);
}

TEST(TableActor_Run, NobodyBidsRedealsToEverySeat)
{
    Outbox box;
    net::TableActor table(SlowClock(), {Kind::Remote, Kind::Remote, Kind::Remote}, Names(), box.Sender());

    table.Post(0, ToFrame(net::BuildBid(false, 1)));
    table.Post(1, ToFrame(net::BuildBid(false, 1)));
    table.Post(2, ToFrame(net::BuildBid(false, 1)));
    table.PostDisconnect(2);
    table.Run();

    EXPECT_EQ(table.Game().State().deal_no, 2u);
    for (PlyrIdxT s = 0; s < 3; ++s)
    {
        EXPECT_EQ(box.Count(s, fb::Message::BidUpdateMsg), 3u);
        ASSERT_EQ(box.Count(s, fb::Message::RedealMsg), 1u);
        EXPECT_EQ(box.Count(s, fb::Message::BidFinalizedMsg), 0u);

        auto const rd = box.First(s, fb::Message::RedealMsg);
        ASSERT_TRUE(rd.has_value());
        auto const* m = Root(*rd)->message_as_RedealMsg();
        EXPECT_EQ(m->my_cards()->size(), table.Game().State().hands[s].size());
        EXPECT_EQ(m->my_cards()->size(), constants::InitialHandSize);
        EXPECT_EQ(m->reserved_cards()->size(), constants::ReservedCount);
        EXPECT_EQ(m->first_bidder(), 0);
    }
}

TEST(TableActor_Run, EngineFailureClosesOnlyThatTable)
{
    Config cfg = SlowClock();
    cfg.turn_timeout = std::chrono::milliseconds(5);

    Outbox box;
    net::TableActor broken(cfg, {Kind::Remote, Kind::Remote, Kind::Remote}, Names(), box.Sender());

    // seat 0 has to lead but holds nothing, so its timeout has no default play
    GameImpl& g = debug::Inspector::GameOf(broken);
    TableState s = g.State();
    s.phase = Phase::Playing;
    s.landlord = PlyrIdxT{0};
    s.reserved_claimed = true;
    s.current = 0;
    s.hands[0].clear();
    s.last_play.reset();
    debug::Inspector::Overwrite(g, std::move(s));

    broken.Run();
    ASSERT_TRUE(broken.Finished());
    for (PlyrIdxT seat = 0; seat < 3; ++seat)
    {
        auto const last = box.Last(seat);
        ASSERT_TRUE(last.has_value());
        ASSERT_EQ(Root(*last)->message_type(), fb::Message::ErrorMsg);
        EXPECT_EQ(Root(*last)->message_as_ErrorMsg()->message()->str(), "table closed: internal error");
    }

    // a table next to it is unaffected
    Outbox other;
    net::TableActor healthy(SlowClock(), {Kind::Bot, Kind::Bot, Kind::Bot}, Names(), other.Sender());
    healthy.Run();
    ASSERT_TRUE(healthy.Game().Result().has_value());
}
