// File: src/DdzServerMain.cpp
//
// Allman style. Explicit types. No K&R.
//
// Authoritative Dou Dizhu server using WebSocket++ (no TLS) over Asio.
// Clients join a FIFO lobby; every full group gets its own table running on its
// own thread (TableActor), which alone touches that table's game state.

#include <cstdint>
#include <array>
#include <cstdlib>
#include <format>
#include <span>
#include <map>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <vector>
#include <chrono>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/Types.hpp"
#include "net/codec.hpp"
#include "net/Lobby.hpp"
#include "net/SeatChannel.hpp"
#include "net/TableActor.hpp"
#include "net/TablePool.hpp"

namespace
{
    using ddz::net::WsServer;
    using ddz::net::Hdl;
    using ddz::net::SeatChannel;
    using ddz::core::net::Lobby;
    using ddz::core::net::TableActor;
    using ddz::core::net::TablePool;

    struct CmdLine
    {
        std::uint16_t port{9002};
        std::uint64_t seed{12345ULL};
        std::uint32_t turn_timeout_ms{30000};
        std::uint32_t ai_delay_ms{800};
        std::uint8_t bots{0};
    };

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string key = argv[i];
            auto read_u64 = [&](std::uint64_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = std::strtoull(argv[++i], nullptr, 10);
                }
            };
            auto read_u32 = [&](std::uint32_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };
            auto read_u16 = [&](std::uint16_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint16_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };
            auto read_u8 = [&](std::uint8_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint8_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };

            if (key == "--port") { read_u16(c.port); }
            else if (key == "--seed") { read_u64(c.seed); }
            else if (key == "--timeout_ms") { read_u32(c.turn_timeout_ms); }
            else if (key == "--ai_delay_ms") { read_u32(c.ai_delay_ms); }
            else if (key == "--bots") { read_u8(c.bots); }
        }
        if (c.bots > 2)
        {
            c.bots = 2;
        }
        return c;
    }

    auto as_span(flatbuffers::DetachedBuffer const& buf) -> std::span<const std::byte>
    {
        return std::as_bytes(std::span{buf.data(), buf.size()});
    }

    class Server
    {
    public:
        explicit Server(CmdLine cfg) :
            cfg_(cfg),
            ep_(std::make_shared<WsServer>()),
            lobby_(ddz::core::constants::NumSeats - cfg.bots)
        {
        }

        auto Run() -> int
        {
            ep_->clear_access_channels(websocketpp::log::alevel::all);
            ep_->set_access_channels(websocketpp::log::alevel::connect |
                websocketpp::log::alevel::disconnect);
            ep_->init_asio();
            ep_->set_reuse_addr(true);

            ep_->set_open_handler([this](Hdl hdl) { OnOpen(hdl); });
            ep_->set_close_handler([this](Hdl hdl) { OnClose(hdl); });
            ep_->set_message_handler([this](Hdl hdl, WsServer::message_ptr msg) { OnMessage(hdl, msg); });

            websocketpp::lib::error_code ec;
            ep_->listen(cfg_.port, ec);
            if (ec)
            {
                std::print("[ddzd] listen on {} failed: {}\n", cfg_.port, ec.message());
                return 1;
            }
            ep_->start_accept(ec);
            if (ec)
            {
                std::print("[ddzd] start_accept failed: {}\n", ec.message());
                return 1;
            }

            std::print("[ddzd] Listening on port {} | {} human(s) per table\n",
                       cfg_.port, lobby_.HumansPerTable());
            ep_->run();

            pool_.JoinAll();
            return 0;
        }

    private:
        auto OnOpen(Hdl hdl) -> void
        {
            std::lock_guard<std::mutex> lock(mx_);
            auto ch = std::make_shared<SeatChannel>();
            ch->ep = ep_;
            ch->hdl = hdl;
            ch->conn_id = next_conn_id_++;
            ch->connected = true;
            channels_[hdl] = ch;
            std::print("[ddzd] conn #{} opened\n", ch->conn_id);
        }

        auto OnClose(Hdl hdl) -> void
        {
            std::lock_guard<std::mutex> lock(mx_);
            auto it = channels_.find(hdl);
            if (it == channels_.end()) return;
            std::shared_ptr<SeatChannel> ch = it->second;
            channels_.erase(it);
            ch->connected = false;
            std::print("[ddzd] conn #{} closed\n", ch->conn_id);

            if (ch->table)
            {
                ch->table->PostDisconnect(ch->seat);
                ch->table.reset();
            }
            else if (lobby_.Leave(ch->conn_id))
            {
                SendWaitingLocked();
            }
            pool_.Reap();
        }

        auto OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void
        {
            if (msg->get_opcode() != websocketpp::frame::opcode::binary)
            {
                std::print("[ddzd] Ignoring non-binary frame\n");
                return;
            }

            std::lock_guard<std::mutex> lock(mx_);
            auto it = channels_.find(hdl);
            if (it == channels_.end()) return;
            std::shared_ptr<SeatChannel> const& ch = it->second;

            std::string const& payload = msg->get_payload();
            std::vector<std::uint8_t> bytes(payload.begin(), payload.end());

            if (ch->table && !ch->table->Finished())
            {
                ch->table->Post(ch->seat, std::move(bytes));
                return;
            }
            ch->table.reset();

            auto const req = ddz::core::net::DecodeClientRequest(std::as_bytes(std::span{bytes}));
            if (!req)
            {
                ch->SendBinary(as_span(ddz::core::net::BuildError(req.error().message, 0, next_msg_id_++)));
                return;
            }
            if (std::holds_alternative<ddz::core::net::LeaveRequest>(req->request))
            {
                if (lobby_.Leave(ch->conn_id))
                {
                    std::print("[ddzd] conn #{} left the queue\n", ch->conn_id);
                    SendWaitingLocked();
                }
                return;
            }

            auto const* join = std::get_if<ddz::core::net::JoinRequest>(&req->request);
            if (!join)
            {
                ch->SendBinary(as_span(ddz::core::net::BuildError("join first", req->msg_id, next_msg_id_++)));
                return;
            }

            std::string name = join->name.empty() ? std::format("player{}", ch->conn_id) : join->name;
            ch->name = name;
            auto joined = lobby_.Join(ch->conn_id, std::move(name));
            if (!joined)
            {
                ch->SendBinary(as_span(ddz::core::net::BuildError(joined.error(), req->msg_id, next_msg_id_++)));
                return;
            }
            if (!joined->has_value())
            {
                SendWaitingLocked();
                return;
            }
            StartTableLocked(**joined);
        }

        auto FindByConn(std::uint64_t id) const -> std::shared_ptr<SeatChannel>
        {
            for (auto const& [hdl, ch] : channels_)
            {
                if (ch->conn_id == id) return ch;
            }
            return nullptr;
        }

        auto SendWaitingLocked() -> void
        {
            auto const total = static_cast<std::uint8_t>(lobby_.Waiting().size());
            for (Lobby::Waiter const& w : lobby_.Waiting())
            {
                if (auto ch = FindByConn(w.id))
                {
                    auto const pos = lobby_.PositionOf(w.id).value_or(0);
                    ch->SendBinary(as_span(ddz::core::net::BuildWaiting(pos, total, next_msg_id_++)));
                }
            }
        }

        auto StartTableLocked(std::vector<Lobby::Waiter> const& group) -> void
        {

            std::array<std::shared_ptr<SeatChannel>, ddz::core::constants::NumSeats> seats{};
            std::array<TableActor::SeatKind, ddz::core::constants::NumSeats> kinds{};
            std::array<std::string, ddz::core::constants::NumSeats> names{};

            for (ddz::core::PlyrIdxT s{}; s < ddz::core::constants::NumSeats; ++s)
            {
                if (s < group.size())
                {
                    seats[s] = FindByConn(group[s].id);
                    kinds[s] = TableActor::SeatKind::Remote;
                    names[s] = group[s].name;
                }
                else
                {
                    kinds[s] = TableActor::SeatKind::Bot;
                    names[s] = std::format("bot{}", s);
                }
            }

            ddz::core::Config gcfg{};
            gcfg.seed = cfg_.seed + table_no_;
            gcfg.turn_timeout = std::chrono::milliseconds(cfg_.turn_timeout_ms);
            gcfg.ai_think_delay = std::chrono::milliseconds(cfg_.ai_delay_ms);

            auto send = [seats](ddz::core::PlyrIdxT seat, flatbuffers::DetachedBuffer buf)
            {
                if (seats[seat] && !seats[seat]->SendBinary(as_span(buf)))
                {
                    std::print("[ddzd] send to seat {} failed\n", static_cast<int>(seat));
                }
            };

            auto table = std::make_shared<TableActor>(gcfg, kinds, names, send);
            for (ddz::core::PlyrIdxT s{}; s < ddz::core::constants::NumSeats; ++s)
            {
                if (!seats[s]) continue;
                seats[s]->table = table;
                seats[s]->seat = s;
            }

            std::uint64_t const table_no = table_no_++;
            std::print("[ddzd] table #{} created (seed {})\n", table_no, gcfg.seed);

            // a seat may have dropped between Join and now
            for (ddz::core::PlyrIdxT s{}; s < group.size(); ++s)
            {
                if (!seats[s]) table->PostDisconnect(s);
            }

            pool_.Launch(table, [table_no]()
            {
                std::print("[ddzd] table #{} closed\n", table_no);
            });
        }

    private:
        CmdLine cfg_;
        std::shared_ptr<WsServer> ep_;

        std::mutex mx_;
        std::map<Hdl, std::shared_ptr<SeatChannel>, std::owner_less<Hdl>> channels_;
        Lobby lobby_;
        TablePool pool_;
        std::uint64_t next_conn_id_{1};
        std::uint64_t next_msg_id_{1};
        std::uint64_t table_no_{0};
    };
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = parse_args(argc, argv);
    Server server(cfg);
    return server.Run();
}
