//
// SeatChannel.hpp: server-side connection state for one WebSocket++ client
//

#ifndef DOUDIZHU_SEATCHANNEL_HPP
#define DOUDIZHU_SEATCHANNEL_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Types.hpp"
#include "net/TableActor.hpp"

namespace ddz::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // One per open connection. While queued it has no table; once seated, inbound
    // frames go straight to the table's actor under the seat assigned here.
    struct SeatChannel
    {
        std::weak_ptr<WsServer>                          ep;
        Hdl                                              hdl;
        std::uint64_t                                    conn_id{};
        std::string                                      name;

        std::shared_ptr<ddz::core::net::TableActor>      table;
        ddz::core::PlyrIdxT                              seat{};
        std::atomic<bool>                                connected{false};

        bool SendBinary(std::span<const std::byte> bytes)
        {
            auto ep_sp = ep.lock();
            if (!ep_sp || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(hdl,
                        reinterpret_cast<const void*>(bytes.data()),
                        bytes.size(),
                        websocketpp::frame::opcode::binary,
                        ec);
            return !ec;
        }
    };
}

#endif // DOUDIZHU_SEATCHANNEL_HPP
