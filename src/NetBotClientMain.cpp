//
// NetBotClientMain.cpp
//
// Headless seat that answers table requests.
//
// Connects to the table server, decodes every request envelope, asks a local
// provider (basic strategy, or naive with --naive) and replies with the same msg_id.
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Actions.hpp"
#include "core/BasicStrategy.hpp"
#include "core/NaiveProvider.hpp"
#include "core/State.hpp"
#include "core/Types.hpp"
#include "core/Util.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url{"ws://127.0.0.1:9002"};
        std::uint64_t seed{424242ULL};
        bool naive{false};
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
            else if (k == "--seed" && i + 1 < argc)
            {
                char const* s = argv[++i];
                std::uint64_t v{};
                auto res = std::from_chars(s, s + std::strlen(s), v);
                if (res.ec == std::errc{}) { c.seed = v; }
            }
            else if (k == "--naive")
            {
                c.naive = true;
            }
        }
        return c;
    }

    // Decides what to send for one decoded server message; empty when nothing is owed.
    std::vector<std::uint8_t> answer(blackjack::core::DecisionProvider& brain,
                                     blackjack::core::net::DecodedServerMsg const& m)
    {
        using namespace blackjack::core;

        return std::visit([&](auto const& body) -> std::vector<std::uint8_t>
        {
            using T = std::decay_t<decltype(body)>;

            if constexpr (std::is_same_v<T, BetRequest>)
            {
                ChipsT const amount = brain.ChooseBet(body);
                std::print("[bot][seat {}] bet {} (chips {})\n", static_cast<int>(body.seat), amount, body.chips);
                return net::BuildBetReply(body.seat, amount, m.msg_id);
            }
            else if constexpr (std::is_same_v<T, InsuranceSnapshot>)
            {
                bool const take = brain.DecideInsurance(body);
                std::print("[bot][seat {}] insurance {}\n", static_cast<int>(body.seat), take ? "yes" : "no");
                return net::BuildInsuranceReply(body.seat, take, m.msg_id);
            }
            else if constexpr (std::is_same_v<T, DecisionSnapshot>)
            {
                Decision const d = brain.Decide(body);
                std::print("[bot][seat {}] hand {} {} vs {} -> {}\n", static_cast<int>(body.seat),
                           static_cast<int>(body.hand_index), util::ToString(body.hand),
                           util::ToString(body.upcard), to_string(d));
                return net::BuildDecisionReply(body.seat, d, m.msg_id);
            }
            else
            {
                std::print("[bot] round {} finished, dealer {} ({})\n", body.round_number,
                           util::ToString(body.dealer.final_hand), body.dealer.final_value);
                for (ParticipantRecord const& p : body.participants)
                {
                    std::print("[bot]   {} chips {} -> {}\n", p.name, p.chips_before, p.chips_after);
                }
                return {};
            }
        }, m.body);
    }
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = parse_args(argc, argv);
    std::print("[bot] Connecting to {} | seed={} | {}\n", cfg.url, cfg.seed, cfg.naive ? "naive" : "basic");

    std::unique_ptr<blackjack::core::DecisionProvider> brain;
    if (cfg.naive)
    {
        brain = std::make_unique<blackjack::core::NaiveProvider>(cfg.seed);
    }
    else
    {
        brain = std::make_unique<blackjack::core::BasicStrategyProvider>();
    }

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.clear_error_channels(websocketpp::log::elevel::all);
    c.init_asio();

    c.set_message_handler([&](websocketpp::connection_hdl hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[bot] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        auto const parsed = blackjack::core::net::DecodeServerMessage(bytes);
        if (!parsed)
        {
            std::print("[bot] Bad envelope: {}\n", parsed.error().message);
            return;
        }

        std::vector<std::uint8_t> const out = answer(*brain, *parsed);
        if (out.empty())
        {
            return;
        }

        websocketpp::lib::error_code ec;
        c.send(hdl, out.data(), out.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[bot] send() failed: {}\n", ec.message());
        }
    });

    c.set_open_handler([&](websocketpp::connection_hdl)
    {
        std::print("[bot] Connected.\n");
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[bot] Closed by server.\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print("[bot] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);

    // Run the client loop (blocking)
    c.run();

    return 0;
}
