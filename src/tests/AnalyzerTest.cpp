#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "../analysis/ResultsAnalyzer.hpp"

using namespace blackjack::core;
using blackjack::analysis::ResultsAnalyzer;

namespace
{
    auto MakeHand(ChipsT bet, Outcome o, ChipsT payout) -> HandRecord
    {
        HandRecord h{};
        h.bet = bet;
        h.outcome = o;
        h.payout = payout;
        h.is_blackjack = o == Outcome::Blackjack;
        h.is_busted = o == Outcome::Bust;
        return h;
    }

    auto MakeSeat(SeatIdxT seat, std::string name, ChipsT after, std::vector<HandRecord> hands) -> ParticipantRecord
    {
        ParticipantRecord p{};
        p.name = std::move(name);
        p.seat = seat;
        p.chips_after = after;
        p.hands = std::move(hands);
        return p;
    }

    // Two rounds, two seats:
    //   round 1: dealer busts. Ann wins 20, Bob splits into a win 20 and a bust -20
    //   round 2: dealer blackjack. Ann insured 10 and lost 20, Bob pushes with blackjack
    auto TwoRounds() -> std::vector<RoundRecord>
    {
        RoundRecord r1{};
        r1.round_number = 1;
        r1.dealer.is_busted = true;
        r1.participants.push_back(MakeSeat(0, "Ann", 1020, {MakeHand(20, Outcome::Win, 20)}));
        r1.participants.push_back(MakeSeat(1, "Bob", 1000, {MakeHand(20, Outcome::Win, 20),
                                                            MakeHand(20, Outcome::Bust, -20)}));

        RoundRecord r2{};
        r2.round_number = 2;
        r2.dealer.is_blackjack = true;
        ParticipantRecord ann = MakeSeat(0, "Ann", 1010, {MakeHand(20, Outcome::Loss, -20)});
        ann.insurance_bet = 10;
        ann.insurance_payout = 20;
        r2.participants.push_back(std::move(ann));
        r2.participants.push_back(MakeSeat(1, "Bob", 1000, {MakeHand(20, Outcome::Push, 0)}));
        return {r1, r2};
    }
}

TEST(Analyzer, CountsOutcomesPerSeat)
{
    ResultsAnalyzer a{};
    a.AddAll(TwoRounds());

    EXPECT_EQ(a.Rounds(), 2u);
    EXPECT_EQ(a.TotalHands(), 5u);
    EXPECT_EQ(a.TotalWagered(), 100);
    ASSERT_EQ(a.Players().size(), 2u);

    auto const& ann = a.Players().at(0);
    EXPECT_EQ(ann.name, "Ann");
    EXPECT_EQ(ann.hands_played, 2u);
    EXPECT_EQ(ann.wins, 1u);
    EXPECT_EQ(ann.losses, 1u);
    EXPECT_EQ(ann.net, 0);
    EXPECT_EQ(ann.insurance_wagered, 10);
    EXPECT_EQ(ann.insurance_net, 10);
    EXPECT_EQ(ann.final_chips, 1010);
    EXPECT_DOUBLE_EQ(ann.WinRate(), 0.5);

    auto const& bob = a.Players().at(1);
    EXPECT_EQ(bob.hands_played, 3u);
    EXPECT_EQ(bob.wins, 1u);
    EXPECT_EQ(bob.busts, 1u);
    EXPECT_EQ(bob.losses, 1u);
    EXPECT_EQ(bob.pushes, 1u);
    EXPECT_EQ(bob.blackjacks, 0u);
    EXPECT_DOUBLE_EQ(bob.BustRate(), 1.0 / 3.0);
}

TEST(Analyzer, BlackjackAndSurrenderCountTowardWinsAndLosses)
{
    RoundRecord r{};
    r.participants.push_back(MakeSeat(0, "Cy", 1000, {MakeHand(20, Outcome::Blackjack, 30)}));
    RoundRecord s{};
    s.participants.push_back(MakeSeat(0, "Cy", 1000, {MakeHand(20, Outcome::Surrender, -10)}));

    ResultsAnalyzer a{};
    a.Add(r);
    a.Add(s);
    auto const& cy = a.Players().at(0);
    EXPECT_EQ(cy.blackjacks, 1u);
    EXPECT_EQ(cy.wins, 1u);
    EXPECT_EQ(cy.surrenders, 1u);
    EXPECT_EQ(cy.losses, 1u);
    EXPECT_DOUBLE_EQ(cy.BlackjackRate(), 0.5);
}

TEST(Analyzer, ReturnToPlayerAndVariance)
{
    ResultsAnalyzer a{};
    a.AddAll(TwoRounds());

    // Bob: wagered 60, net 0
    auto const& bob = a.Players().at(1);
    EXPECT_DOUBLE_EQ(bob.ReturnToPlayer(), 1.0);
    // payouts 20, -20, 0: mean 0, population variance 800/3
    EXPECT_DOUBLE_EQ(bob.PayoutVariance(), 800.0 / 3.0);

    RoundRecord r{};
    r.participants.push_back(MakeSeat(0, "Dee", 990, {MakeHand(20, Outcome::Surrender, -10)}));
    ResultsAnalyzer b{};
    b.Add(r);
    EXPECT_DOUBLE_EQ(b.Players().at(0).ReturnToPlayer(), 0.5);
    EXPECT_DOUBLE_EQ(b.Players().at(0).PayoutVariance(), 0.0);
}

TEST(Analyzer, NothingWageredGivesZeroRates)
{
    blackjack::analysis::ParticipantStats const empty{};
    EXPECT_DOUBLE_EQ(empty.ReturnToPlayer(), 0.0);
    EXPECT_DOUBLE_EQ(empty.WinRate(), 0.0);
    EXPECT_DOUBLE_EQ(empty.PayoutVariance(), 0.0);
}

TEST(Analyzer, DealerTracksBustsBlackjacksAndProfit)
{
    ResultsAnalyzer a{};
    a.AddAll(TwoRounds());

    auto const& d = a.Dealer();
    EXPECT_EQ(d.rounds, 2u);
    EXPECT_EQ(d.busts, 1u);
    EXPECT_EQ(d.blackjacks, 1u);
    EXPECT_DOUBLE_EQ(d.BustRate(), 0.5);
    // hand payouts sum to 0, insurance paid out net 10
    EXPECT_EQ(d.profit, -10);
}

TEST(Analyzer, ReportListsEverySeat)
{
    ResultsAnalyzer a{};
    a.AddAll(TwoRounds());
    std::string const report = a.Report(std::chrono::duration<double>{1.5});

    EXPECT_NE(report.find("BLACKJACK SIMULATION REPORT"), std::string::npos);
    EXPECT_NE(report.find("Rounds played:   2"), std::string::npos);
    EXPECT_NE(report.find("Duration:        1.50 s"), std::string::npos);
    EXPECT_NE(report.find("Profit / loss:   -10"), std::string::npos);
    EXPECT_NE(report.find("Ann (seat 0)"), std::string::npos);
    EXPECT_NE(report.find("Bob (seat 1)"), std::string::npos);
    EXPECT_NE(report.find("Insurance:     staked 10 net +10"), std::string::npos);
    EXPECT_NE(report.find("RTP:           100.00%"), std::string::npos);
    EXPECT_LT(report.find("Ann (seat 0)"), report.find("Bob (seat 1)"));
}
