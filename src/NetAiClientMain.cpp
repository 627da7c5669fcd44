// File: src/NetAiClientMain.cpp
//
// Allman braces. Explicit types. High-verbosity logs.
//
// A headless client that plays via HeuristicAI. Connects to the server, joins the
// lobby, mirrors the table from server messages and answers on its own turns.
//
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <type_traits>
#include <variant>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Actions.hpp"
#include "core/HeuristicAi.hpp"
#include "core/Types.hpp"
#include "core/Util.hpp"
#include "net/ClientTable.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url {"ws://127.0.0.1:9002"};
        std::string name {"netai"};
        std::uint64_t seed {424242ULL};
    };

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string k = argv[i];
            if (k == "--url" && i + 1 < argc)
            {
                c.url = argv[++i];
            }
            else if (k == "--name" && i + 1 < argc)
            {
                c.name = argv[++i];
            }
            else if (k == "--seed" && i + 1 < argc)
            {
                c.seed = std::strtoull(argv[++i], nullptr, 10);
            }
        }
        return c;
    }

    auto encode(ddz::core::PlayerAction const& act, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        return std::visit([&]<typename T0>(T0 const& a) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ddz::core::BidAction>)
            {
                return ddz::core::net::BuildBid(a.wants_to_bid, msg_id);
            }
            else if constexpr (std::is_same_v<T, ddz::core::PlayAction>)
            {
                return ddz::core::net::BuildPlay(a.cards, msg_id);
            }
            else
            {
                return ddz::core::net::BuildPass(msg_id);
            }
        }, act);
    }
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = parse_args(argc, argv);

    std::print("[NetAI] Connecting to {} | seed={}\n", cfg.url, cfg.seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.init_asio();

    std::shared_ptr<websocketpp::connection_hdl> hdl_ptr = std::make_shared<websocketpp::connection_hdl>();
    ddz::core::HeuristicAI ai(cfg.seed);
    ddz::core::net::ClientTable table;
    std::uint64_t next_msg_id = 1;
    // last table revision answered, so a turn is acted on once
    std::uint64_t answered_rev = 0;

    auto send = [&](flatbuffers::DetachedBuffer const& buf) -> bool
    {
        websocketpp::lib::error_code ec;
        c.send(*hdl_ptr, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[NetAI] send() failed: {}\n", ec.message());
            return false;
        }
        return true;
    };

    auto close = [&]()
    {
        websocketpp::lib::error_code ec;
        c.close(*hdl_ptr, websocketpp::close::status::normal, "done", ec);
        if (ec)
        {
            std::print("[NetAI] close() failed: {}\n", ec.message());
        }
    };

    c.set_message_handler([&](websocketpp::connection_hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[NetAI] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        auto const applied = table.Apply(std::as_bytes(std::span{pl.data(), pl.size()}));
        if (!applied)
        {
            std::print("[NetAI] Bad frame: {}\n", applied.error().message);
            return;
        }

        switch (*applied)
        {
        case ddz::gen::net::Message::WaitingMsg:
            std::print("[NetAI] Waiting {}/{}\n", table.QueuePosition(), table.QueueTotal());
            return;
        case ddz::gen::net::Message::ErrorMsg:
            std::print("[NetAI] Server error: {}\n", table.LastError().value_or(""));
            return;
        case ddz::gen::net::Message::GameOverMsg:
        {
            bool const i_am_landlord = table.Landlord() && table.MySeat() && *table.Landlord() == *table.MySeat();
            bool const i_won = table.LandlordWon() == i_am_landlord;
            std::print("[NetAI] Game over: {} (multiplier {})\n", i_won ? "won" : "lost", table.BombMultiplier());
            close();
            return;
        }
        case ddz::gen::net::Message::PlayerLeftMsg:
            std::print("[NetAI] Seat {} left, table closed\n", static_cast<int>(table.DepartedSeat().value_or(0)));
            close();
            return;
        default:
            break;
        }

        if (!table.IsMyTurn() || answered_rev == table.Revision())
        {
            return;
        }

        auto const snap = std::make_shared<ddz::core::GameSnapshot const>(table.Snapshot());
        ddz::core::PlayerAction const act = ai.Play(snap, std::chrono::steady_clock::now());
        if (auto const* p = std::get_if<ddz::core::PlayAction>(&act))
        {
            std::print("[NetAI][seat {}] play {}\n", static_cast<int>(*table.MySeat()),
                       ddz::core::util::FormatCards(p->cards));
        }
        if (send(encode(act, next_msg_id++)))
        {
            answered_rev = table.Revision();
        }
    });

    c.set_open_handler([&](websocketpp::connection_hdl hdl)
    {
        *hdl_ptr = hdl;
        std::print("[NetAI] Connected, joining as {}\n", cfg.name);
        send(ddz::core::net::BuildJoin(cfg.name, next_msg_id++));
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[NetAI] Connection closed.\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print("[NetAI] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);

    // Run the client loop (blocking)
    c.run();

    return 0;
}
