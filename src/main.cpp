//
// main.cpp
//
// Blackjack simulation CLI.
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "core/BasicStrategy.hpp"
#include "core/Exception.hpp"
#include "core/HumanProvider.hpp"
#include "core/NaiveProvider.hpp"
#include "core/Table.hpp"
#include "analysis/Simulation.hpp"

namespace
{
    using namespace blackjack::core;

    struct SimConfig
    {
        std::uint64_t rounds{1000};
        std::uint8_t  decks{2};
        std::optional<std::uint64_t> seed{};
        ChipsT        chips{1000};
        std::vector<std::string> players{"basic", "naive"};
        std::optional<std::string> history{};
        std::optional<std::string> log{};
        bool          interactive{false};
    };

    auto SplitList(std::string_view s) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        while (!s.empty())
        {
            auto const comma = s.find(',');
            std::string_view const item = s.substr(0, comma);
            if (!item.empty()) out.emplace_back(item);
            if (comma == std::string_view::npos) break;
            s.remove_prefix(comma + 1);
        }
        return out;
    }

    auto ParseArgs(int argc, char** argv) -> std::optional<SimConfig>
    {
        SimConfig cfg{};

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
            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            std::uint64_t v{};
            std::string str;
            if (arg == "--rounds")
            {
                if (!next_uint(v)) { return std::nullopt; }
                cfg.rounds = v;
            }
            else if (arg == "--decks")
            {
                if (!next_uint(v) || v == 0 || v > 255) { return std::nullopt; }
                cfg.decks = static_cast<std::uint8_t>(v);
            }
            else if (arg == "--seed")
            {
                if (!next_uint(v)) { return std::nullopt; }
                cfg.seed = v;
            }
            else if (arg == "--chips")
            {
                if (!next_uint(v)) { return std::nullopt; }
                cfg.chips = static_cast<ChipsT>(v);
            }
            else if (arg == "--players")
            {
                if (!next_str(str)) { return std::nullopt; }
                cfg.players = SplitList(str);
            }
            else if (arg == "--history")
            {
                if (!next_str(str)) { return std::nullopt; }
                cfg.history = str;
            }
            else if (arg == "--log")
            {
                if (!next_str(str)) { return std::nullopt; }
                cfg.log = str;
            }
            else if (arg == "--interactive")
            {
                cfg.interactive = true;
            }
            else
            {
                std::print("[sim] unknown argument '{}'\n", arg);
                return std::nullopt;
            }
        }
        return cfg;
    }

    auto MakeSeats(SimConfig const& sc, std::uint64_t seed) -> std::optional<std::vector<SeatSpec>>
    {
        std::vector<SeatSpec> seats;
        for (std::size_t i = 0; i < sc.players.size(); ++i)
        {
            std::string const& kind = sc.players[i];
            std::string const name = std::format("{} {}", kind, i + 1);

            if (kind == "basic")
                seats.push_back(SeatSpec{name, sc.chips, std::make_unique<BasicStrategyProvider>()});
            else if (kind == "naive")
                seats.push_back(SeatSpec{name, sc.chips,
                                         std::make_unique<NaiveProvider>(seed + static_cast<std::uint64_t>(i * 1337u))});
            else if (kind == "human")
                seats.push_back(SeatSpec{name, sc.chips, std::make_unique<HumanProvider>(name)});
            else
            {
                std::print("[sim] unknown player type '{}'\n", kind);
                return std::nullopt;
            }
        }
        if (seats.empty() || seats.size() > constants::MaxSeats)
        {
            std::print("[sim] need between 1 and {} players\n", constants::MaxSeats);
            return std::nullopt;
        }
        return seats;
    }

    void Usage()
    {
        std::print("usage: blackjack_sim [--rounds N] [--decks N] [--seed N] [--chips N]\n"
                   "                     [--players basic,naive,human] [--history FILE] [--log FILE]\n"
                   "                     [--interactive]\n");
    }
}

int main(int argc, char** argv)
{
    using namespace blackjack;
    using namespace blackjack::core;

    std::optional<SimConfig> const parsed = ParseArgs(argc, argv);
    if (!parsed)
    {
        Usage();
        return 2;
    }
    SimConfig const& sc = *parsed;

    Config cfg{};
    cfg.n_decks = sc.decks;
    if (sc.seed) cfg.seed = *sc.seed;

    if (auto const ok = ValidateConfig(cfg); !ok)
    {
        std::print("[sim] invalid configuration: {}\n", ok.error());
        return 2;
    }

    auto seats = MakeSeats(sc, cfg.seed);
    if (!seats) return 2;

    std::print("[sim] seed={} decks={} seats={}\n", cfg.seed, static_cast<int>(cfg.n_decks), seats->size());

    try
    {
        analysis::Simulation sim(cfg, std::move(*seats),
                                 analysis::SimulationOptions{.history_path = sc.history, .log_path = sc.log});

        std::uint64_t const played = sc.interactive ? sim.RunInteractive() : sim.Run(sc.rounds);
        sim.Finish();
        std::print("[sim] played {} round(s)\n", played);
        std::print("{}", sim.Report());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        return 1;
    }
    return 0;
}
