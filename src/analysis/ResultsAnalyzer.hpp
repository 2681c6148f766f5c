//
// ResultsAnalyzer.hpp
//

#ifndef BLACKJACKSIM_RESULTSANALYZER_HPP
#define BLACKJACKSIM_RESULTSANALYZER_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace blackjack::analysis
{
    struct ParticipantStats
    {
        std::string name;
        core::SeatIdxT seat{};
        uint64_t hands_played{};
        core::ChipsT wagered{};
        // sum of per-hand net payouts
        core::ChipsT net{};
        core::ChipsT insurance_wagered{};
        core::ChipsT insurance_net{};
        core::ChipsT final_chips{};
        // wins include blackjacks, losses include busts and surrenders
        uint64_t wins{};
        uint64_t losses{};
        uint64_t pushes{};
        uint64_t blackjacks{};
        uint64_t busts{};
        uint64_t surrenders{};
        std::vector<core::ChipsT> payouts;

        auto WinRate() const -> double;
        auto LossRate() const -> double;
        auto PushRate() const -> double;
        auto BlackjackRate() const -> double;
        auto BustRate() const -> double;
        // (wagered + net) / wagered, 0 when nothing was wagered
        auto ReturnToPlayer() const -> double;
        // population variance of per-hand net payouts
        auto PayoutVariance() const -> double;
    };

    struct DealerStats
    {
        uint64_t rounds{};
        uint64_t busts{};
        uint64_t blackjacks{};
        core::ChipsT profit{};

        auto BustRate() const -> double;
        auto BlackjackRate() const -> double;
    };

    class ResultsAnalyzer
    {
    public:
        ResultsAnalyzer() = default;

        auto Add(core::RoundRecord const& rec) -> void;
        auto AddAll(std::vector<core::RoundRecord> const& recs) -> void;

        // Keyed by seat, so the report lists seats in table order
        auto Players() const noexcept -> std::map<core::SeatIdxT, ParticipantStats> const& { return players_; }
        auto Dealer() const noexcept -> DealerStats const& { return dealer_; }
        auto Rounds() const noexcept -> uint64_t { return rounds_; }
        auto TotalHands() const -> uint64_t;
        auto TotalWagered() const -> core::ChipsT;

        auto Report(std::chrono::duration<double> elapsed) const -> std::string;

    private:
        std::map<core::SeatIdxT, ParticipantStats> players_;
        DealerStats dealer_{};
        uint64_t rounds_{0};
    };
}

#endif //BLACKJACKSIM_RESULTSANALYZER_HPP
