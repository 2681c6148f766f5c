//
// Simulation.hpp
//

#ifndef BLACKJACKSIM_SIMULATION_HPP
#define BLACKJACKSIM_SIMULATION_HPP

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/Table.hpp"
#include "../debug/RoundLogger.hpp"
#include "History.hpp"
#include "ResultsAnalyzer.hpp"

namespace blackjack::analysis
{
    struct SimulationOptions
    {
        std::optional<std::string> history_path{};
        std::optional<std::string> log_path{};
    };

    // Owns the table and every record it produced; feeds the analyzer and the optional sinks.
    class Simulation
    {
    public:
        Simulation(core::Config const& config, std::vector<core::SeatSpec> seats, SimulationOptions options = {});
        ~Simulation();
        Simulation(Simulation const&) = delete;
        auto operator=(Simulation const&) -> Simulation& = delete;

        // Plays up to `rounds` rounds, stopping early once no seat can bet. Returns rounds played.
        auto Run(uint64_t rounds) -> uint64_t;

        // Plays until the user declines another round or no seat can bet.
        auto RunInteractive(std::istream& in = std::cin, std::ostream& out = std::cout) -> uint64_t;

        auto TableNow() const noexcept -> core::Table const& { return table_; }
        auto Records() const noexcept -> std::vector<core::RoundRecord> const& { return records_; }
        auto Analyzer() const noexcept -> ResultsAnalyzer const& { return analyzer_; }
        auto Elapsed() const noexcept -> std::chrono::duration<double> { return elapsed_; }

        auto Report() const -> std::string { return analyzer_.Report(elapsed_); }

        // Writes the transcript footer and flushes the sinks; later calls do nothing.
        auto Finish() -> void;

    private:
        auto PlayOne() -> bool;

    private:
        core::Table table_;
        std::vector<core::RoundRecord> records_;
        ResultsAnalyzer analyzer_;
        std::unique_ptr<HistoryWriter> history_;
        std::unique_ptr<core::debug::RoundLogger> log_;
        std::chrono::duration<double> elapsed_{0.0};
        bool started_{false};
        bool finished_{false};
    };
}

#endif //BLACKJACKSIM_SIMULATION_HPP
