//
// ResultsAnalyzer.cpp
//

#include "ResultsAnalyzer.hpp"

#include <format>
#include <numeric>

namespace
{
    auto rate(uint64_t n, uint64_t d) -> double
    {
        return d == 0 ? 0.0 : static_cast<double>(n) / static_cast<double>(d);
    }

    auto pct(double r) -> std::string
    {
        return std::format("{:.2f}%", r * 100.0);
    }
}

namespace blackjack::analysis
{
    using namespace blackjack::core;

    auto ParticipantStats::WinRate() const -> double { return rate(wins, hands_played); }
    auto ParticipantStats::LossRate() const -> double { return rate(losses, hands_played); }
    auto ParticipantStats::PushRate() const -> double { return rate(pushes, hands_played); }
    auto ParticipantStats::BlackjackRate() const -> double { return rate(blackjacks, hands_played); }
    auto ParticipantStats::BustRate() const -> double { return rate(busts, hands_played); }

    auto ParticipantStats::ReturnToPlayer() const -> double
    {
        if (wagered <= 0) return 0.0;
        return static_cast<double>(wagered + net) / static_cast<double>(wagered);
    }

    auto ParticipantStats::PayoutVariance() const -> double
    {
        if (payouts.empty()) return 0.0;
        double const n = static_cast<double>(payouts.size());
        double const mean = std::accumulate(payouts.begin(), payouts.end(), 0.0) / n;
        double acc = 0.0;
        for (ChipsT const p : payouts)
        {
            double const d = static_cast<double>(p) - mean;
            acc += d * d;
        }
        return acc / n;
    }

    auto DealerStats::BustRate() const -> double { return rate(busts, rounds); }
    auto DealerStats::BlackjackRate() const -> double { return rate(blackjacks, rounds); }

    auto ResultsAnalyzer::Add(RoundRecord const& rec) -> void
    {
        ++rounds_;
        ++dealer_.rounds;
        if (rec.dealer.is_busted) ++dealer_.busts;
        if (rec.dealer.is_blackjack) ++dealer_.blackjacks;

        for (ParticipantRecord const& pr : rec.participants)
        {
            ParticipantStats& s = players_[pr.seat];
            s.name = pr.name;
            s.seat = pr.seat;
            s.final_chips = pr.chips_after;

            if (pr.insurance_bet > 0)
            {
                ChipsT const ins = pr.insurance_payout - pr.insurance_bet;
                s.insurance_wagered += pr.insurance_bet;
                s.insurance_net += ins;
                dealer_.profit -= ins;
            }

            for (HandRecord const& h : pr.hands)
            {
                ++s.hands_played;
                s.wagered += h.bet;
                s.net += h.payout;
                s.payouts.push_back(h.payout);
                dealer_.profit -= h.payout;

                switch (h.outcome)
                {
                case Outcome::Win: ++s.wins; break;
                case Outcome::Loss: ++s.losses; break;
                case Outcome::Push: ++s.pushes; break;
                case Outcome::Blackjack: ++s.blackjacks; ++s.wins; break;
                case Outcome::Bust: ++s.busts; ++s.losses; break;
                case Outcome::Surrender: ++s.surrenders; ++s.losses; break;
                }
            }
        }
    }

    auto ResultsAnalyzer::AddAll(std::vector<RoundRecord> const& recs) -> void
    {
        for (RoundRecord const& r : recs) Add(r);
    }

    auto ResultsAnalyzer::TotalHands() const -> uint64_t
    {
        uint64_t n{};
        for (auto const& [seat, s] : players_) n += s.hands_played;
        return n;
    }

    auto ResultsAnalyzer::TotalWagered() const -> ChipsT
    {
        ChipsT n{};
        for (auto const& [seat, s] : players_) n += s.wagered;
        return n;
    }

    auto ResultsAnalyzer::Report(std::chrono::duration<double> const elapsed) const -> std::string
    {
        std::string out;
        std::string const rule(50, '=');
        std::string const thin(40, '-');

        out += std::format("\n{}\n{:^50}\n{}\n", rule, "BLACKJACK SIMULATION REPORT", rule);

        out += "\n--- Game ---\n";
        out += std::format("Duration:        {:.2f} s\n", elapsed.count());
        out += std::format("Rounds played:   {}\n", rounds_);
        out += std::format("Hands played:    {}\n", TotalHands());
        out += std::format("Total wagered:   {}\n", TotalWagered());

        out += "\n--- Dealer ---\n";
        out += std::format("Profit / loss:   {:+}\n", dealer_.profit);
        out += std::format("Blackjacks:      {} ({})\n", dealer_.blackjacks, pct(dealer_.BlackjackRate()));
        out += std::format("Busts:           {} ({})\n", dealer_.busts, pct(dealer_.BustRate()));

        out += "\n--- Participants ---\n";
        for (auto const& [seat, s] : players_)
        {
            out += std::format("{}\n{} (seat {})\n", thin, s.name, static_cast<int>(seat));
            out += std::format("  Final chips:   {}\n", s.final_chips);
            out += std::format("  Net:           {:+}\n", s.net);
            out += std::format("  Wagered:       {}\n", s.wagered);
            if (s.insurance_wagered > 0)
                out += std::format("  Insurance:     staked {} net {:+}\n", s.insurance_wagered, s.insurance_net);

            if (s.hands_played == 0)
            {
                out += "  No hands played.\n";
                continue;
            }
            out += std::format("  Wins:          {} ({})\n", s.wins, pct(s.WinRate()));
            out += std::format("  Losses:        {} ({})\n", s.losses, pct(s.LossRate()));
            out += std::format("  Pushes:        {} ({})\n", s.pushes, pct(s.PushRate()));
            out += std::format("  Blackjacks:    {} ({})\n", s.blackjacks, pct(s.BlackjackRate()));
            out += std::format("  Busts:         {} ({})\n", s.busts, pct(s.BustRate()));
            out += std::format("  Surrenders:    {}\n", s.surrenders);
            out += std::format("  RTP:           {}\n", pct(s.ReturnToPlayer()));
            out += std::format("  Variance:      {:.2f}\n", s.PayoutVariance());
        }
        out += std::format("\n{}\n", rule);
        return out;
    }
}
