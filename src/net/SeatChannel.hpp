//
// SeatChannel.hpp
//

#ifndef BLACKJACKSIM_SEATCHANNEL_HPP
#define BLACKJACKSIM_SEATCHANNEL_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "../core/Types.hpp"
#include "RemoteProvider.hpp"

namespace blackjack::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // One table seat as seen by the WebSocket server
    struct SeatChannel
    {
        blackjack::core::SeatIdxT seat{};
        WsServer*                 ep{nullptr};
        Hdl                       hdl;
        std::shared_ptr<SeatInbox> inbox{std::make_shared<SeatInbox>()};

        std::mutex                mtx;
        bool                      connected{false};

        void Attach(WsServer& server, Hdl h)
        {
            std::lock_guard<std::mutex> lock(mtx);
            ep = &server;
            hdl = std::move(h);
            connected = true;
        }

        void Detach()
        {
            std::lock_guard<std::mutex> lock(mtx);
            connected = false;
        }

        bool Connected()
        {
            std::lock_guard<std::mutex> lock(mtx);
            return connected;
        }

        bool SendBinary(std::span<const std::byte> bytes)
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!ep || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep->send(hdl,
                     reinterpret_cast<const void*>(bytes.data()),
                     bytes.size(),
                     websocketpp::frame::opcode::binary,
                     ec);
            return !ec;
        }

        // Closes the connection if one is attached; the handle is only read under the lock
        bool Close(websocketpp::close::status::value code, std::string const& reason)
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!ep || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep->close(hdl, code, reason, ec);
            connected = false;
            return !ec;
        }

        // Bound send function for a RemoteProvider on this seat
        RemoteProvider::SendFn Sender()
        {
            return [this](std::span<const std::byte> bytes) { return SendBinary(bytes); };
        }
    };
}

#endif //BLACKJACKSIM_SEATCHANNEL_HPP
