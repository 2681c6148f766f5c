//
// Simulation.cpp
//

#include "Simulation.hpp"

#include <ostream>
#include <print>
#include <string>
#include <utility>

#include "../core/Exception.hpp"
#include "../core/StandardRules.hpp"
#include "../core/Util.hpp"

namespace blackjack::analysis
{
    using namespace blackjack::core;

    Simulation::Simulation(Config const& config, std::vector<SeatSpec> seats, SimulationOptions options)
        : table_(config, std::make_unique<StandardRules>(), std::move(seats))
    {
        if (options.history_path)
            history_ = std::make_unique<HistoryWriter>(*options.history_path);
        if (options.log_path)
        {
            log_ = std::make_unique<debug::RoundLogger>(*options.log_path);
            if (!log_->is_open())
            {
                std::print("[sim] cannot open transcript '{}', logging disabled\n", *options.log_path);
                log_.reset();
            }
        }
    }

    auto Simulation::PlayOne() -> bool
    {
        if (!table_.CanAnySeatBet())
        {
            std::print("[sim] no seat can cover the minimum bet, stopping after {} rounds\n", records_.size());
            return false;
        }
        BJ_ASSERT(!finished_, "Round played after the session was finished");
        if (!started_)
        {
            if (log_) log_->start(table_, table_.Settings().seed);
            started_ = true;
        }

        RoundRecord rec = table_.PlayRound();
        analyzer_.Add(rec);
        if (history_) history_->Append(rec);
        if (log_) log_->round(table_, rec);
        records_.push_back(std::move(rec));
        return true;
    }

    Simulation::~Simulation()
    {
        Finish();
    }

    auto Simulation::Finish() -> void
    {
        if (finished_) return;
        finished_ = true;
        if (log_ && started_) log_->end(table_);
        if (history_) history_->Flush();
    }

    auto Simulation::Run(uint64_t const rounds) -> uint64_t
    {
        auto const t0 = std::chrono::steady_clock::now();
        uint64_t played{};
        while (played < rounds && PlayOne()) ++played;
        elapsed_ += std::chrono::steady_clock::now() - t0;
        if (history_) history_->Flush();
        return played;
    }

    auto Simulation::RunInteractive(std::istream& in, std::ostream& out) -> uint64_t
    {
        auto const t0 = std::chrono::steady_clock::now();
        uint64_t played{};
        while (PlayOne())
        {
            ++played;
            RoundRecord const& rec = records_.back();
            std::print(out, "Round {} done. Dealer {} ({})\n", rec.round_number,
                       util::ToString(rec.dealer.final_hand), rec.dealer.final_value);
            for (ParticipantRecord const& p : rec.participants)
                std::print(out, "  {} chips {} -> {}\n", p.name, p.chips_before, p.chips_after);

            std::print(out, "Play another round? (y/n): ");
            out.flush();
            std::string line;
            if (!std::getline(in, line)) break;
            if (line.empty() || (line.front() != 'y' && line.front() != 'Y')) break;
        }
        elapsed_ += std::chrono::steady_clock::now() - t0;
        if (history_) history_->Flush();
        return played;
    }
}
