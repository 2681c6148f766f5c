//
// TableServerMain.cpp
//
// Table server with remote seats over WebSocket++.
//
// Waits for seats to connect (or for the join window to close), then plays the
// requested rounds. Connected seats are driven by RemoteProvider; empty seats by
// BasicStrategyProvider. Every finished round is broadcast to connected seats.
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/BasicStrategy.hpp"
#include "core/Exception.hpp"
#include "core/Table.hpp"
#include "analysis/Simulation.hpp"
#include "net/RemoteProvider.hpp"
#include "net/SeatChannel.hpp"
#include "net/codec.hpp"

namespace
{
    using blackjack::net::WsServer;
    using blackjack::net::Hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint32_t seats{1};
        std::uint64_t rounds{10};
        std::optional<std::uint64_t> seed{};
        blackjack::core::ChipsT chips{1000};
        std::chrono::milliseconds timeout{std::chrono::seconds(15)};
        std::chrono::milliseconds join_window{std::chrono::seconds(30)};
        std::optional<std::string> history{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--seats")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seats = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--rounds")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.rounds = v; }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--chips")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.chips = static_cast<blackjack::core::ChipsT>(v); }
            }
            else if (arg == "--timeout_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--join_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.join_window = std::chrono::milliseconds(v); }
            }
            else if (arg == "--history" && i + 1 < argc)
            {
                cfg.history = argv[++i];
            }
        }
        if (cfg.seats < 1) { cfg.seats = 1; }
        if (cfg.seats > blackjack::core::constants::MaxSeats) { cfg.seats = blackjack::core::constants::MaxSeats; }
        return cfg;
    }

    void BroadcastRecord(blackjack::core::RoundRecord const& rec,
                         std::vector<std::shared_ptr<blackjack::net::SeatChannel>> const& chans)
    {
        auto const buf = blackjack::core::net::BuildRoundRecord(rec, rec.round_number);
        std::span<std::byte const> b{reinterpret_cast<std::byte const*>(buf.data()), buf.size()};

        for (auto const& chan : chans)
        {
            if (chan->Connected() && !chan->SendBinary(b))
            {
                std::print("[server] seat {} missed round {} record\n",
                           static_cast<int>(chan->seat), rec.round_number);
            }
        }
    }
}

int main(int argc, char** argv)
{
    using namespace blackjack::core;

    ServerConfig const sc = ParseArgs(argc, argv);

    Config cfg{};
    if (sc.seed) cfg.seed = *sc.seed;

    std::print("[server] starting on port {} with {} seat(s), seed={}\n", sc.port, sc.seats, cfg.seed);

    WsServer ep;
    ep.clear_access_channels(websocketpp::log::alevel::all);
    ep.clear_error_channels(websocketpp::log::elevel::all);

    ep.init_asio();
    ep.set_reuse_addr(true);

    std::vector<std::shared_ptr<blackjack::net::SeatChannel>> chans(sc.seats);
    for (std::size_t i = 0; i < sc.seats; ++i)
    {
        chans[i] = std::make_shared<blackjack::net::SeatChannel>();
        chans[i]->seat = static_cast<SeatIdxT>(i);
    }

    // Touched only from the network thread
    std::map<Hdl, std::size_t, std::owner_less<Hdl>> hdl_to_seat;

    std::mutex join_mx;
    std::condition_variable join_cv;
    std::atomic<std::size_t> connected_count{0};
    std::atomic<bool> table_started{false};

    ep.set_open_handler([&](Hdl hdl)
    {
        std::size_t seat = chans.size();
        if (!table_started.load())
        {
            for (std::size_t i = 0; i < chans.size(); ++i)
            {
                if (!chans[i]->Connected())
                {
                    seat = i;
                    break;
                }
            }
        }
        if (seat == chans.size())
        {
            websocketpp::lib::error_code ec;
            ep.close(hdl, websocketpp::close::status::try_again_later, "No seat available", ec);
            return;
        }

        hdl_to_seat[hdl] = seat;
        chans[seat]->Attach(ep, hdl);
        std::print("[server] client connected -> seat {}\n", seat);

        {
            std::lock_guard<std::mutex> lock(join_mx);
            ++connected_count;
        }
        join_cv.notify_all();
    });

    ep.set_close_handler([&](Hdl hdl)
    {
        auto it = hdl_to_seat.find(hdl);
        if (it == hdl_to_seat.end())
        {
            return;
        }
        std::size_t const seat = it->second;
        hdl_to_seat.erase(it);
        chans[seat]->Detach();
        std::print("[server] seat {} disconnected\n", seat);
    });

    ep.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto it = hdl_to_seat.find(hdl);
        if (it == hdl_to_seat.end())
        {
            return;
        }
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[server] ignoring non-binary frame from seat {}\n", it->second);
            return;
        }

        auto const& payload = msg->get_payload();
        std::vector<std::uint8_t> bytes(payload.begin(), payload.end());
        chans[it->second]->inbox->Push(std::move(bytes));
    });

    websocketpp::lib::error_code ec;
    ep.listen(sc.port, ec);
    if (ec)
    {
        std::print("[server] listen failed: {}\n", ec.message());
        return 1;
    }
    ep.start_accept();
    std::thread net_thr([&ep]
    {
        ep.run();
    });

    {
        std::unique_lock<std::mutex> lock(join_mx);
        join_cv.wait_for(lock, sc.join_window, [&]
        {
            return connected_count.load() >= sc.seats;
        });
    }
    table_started = true;

    std::vector<SeatSpec> seats;
    seats.reserve(sc.seats);
    for (std::size_t i = 0; i < sc.seats; ++i)
    {
        std::string const name = std::format("Seat {}", i);
        if (chans[i]->Connected())
        {
            chans[i]->inbox->Clear();
            seats.push_back(SeatSpec{name, sc.chips,
                                     std::make_unique<blackjack::net::RemoteProvider>(static_cast<SeatIdxT>(i),
                                         chans[i]->inbox, chans[i]->Sender(), sc.timeout)});
        }
        else
        {
            std::print("[server] seat {} empty, played by basic strategy\n", i);
            seats.push_back(SeatSpec{name, sc.chips, std::make_unique<BasicStrategyProvider>()});
        }
    }

    int rc = 0;
    try
    {
        blackjack::analysis::Simulation sim(cfg, std::move(seats), blackjack::analysis::SimulationOptions{.history_path = sc.history});

        for (std::uint64_t r = 0; r < sc.rounds; ++r)
        {
            if (sim.Run(1) == 0)
            {
                break;
            }
            BroadcastRecord(sim.Records().back(), chans);
        }
        sim.Finish();
        std::print("{}", sim.Report());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("[server] {}", e);
        rc = 1;
    }

    std::print("[server] table closed\n");

    ep.stop_listening(ec);
    for (auto const& chan : chans)
    {
        chan->Close(websocketpp::close::status::going_away, "Table closed");
    }
    ep.stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return rc;
}
