//
// BasicStrategy.cpp
//

#include "BasicStrategy.hpp"

#include <algorithm>
#include "Hand.hpp"

namespace blackjack::core
{
    static auto Has(std::vector<Decision> const& legal, Decision const d) -> bool
    {
        return std::ranges::find(legal, d) != legal.end();
    }

    static auto InRange(unsigned const v, unsigned const lo, unsigned const hi) -> bool
    {
        return v >= lo && v <= hi;
    }

    // Pair splitting; nullopt falls through to the totals below.
    static auto PairPlay(Rank const r, unsigned const up) -> std::optional<Decision>
    {
        switch (r)
        {
        case Rank::Ace:
        case Rank::Eight: return Decision::Split;
        case Rank::Nine:
            if (InRange(up, 2, 6) || InRange(up, 8, 9)) return Decision::Split;
            return Decision::Stand;
        case Rank::Seven:
            if (InRange(up, 2, 7)) return Decision::Split;
            return Decision::Hit;
        case Rank::Six:
            if (InRange(up, 2, 6)) return Decision::Split;
            return Decision::Hit;
        case Rank::Two:
        case Rank::Three:
            if (InRange(up, 2, 7)) return Decision::Split;
            return Decision::Hit;
        default:
            // tens, fives and fours play as totals
            return std::nullopt;
        }
    }

    static auto SoftPlay(unsigned const total, unsigned const up, bool const can_double) -> Decision
    {
        if (total >= 19) return Decision::Stand;
        if (total == 18)
        {
            if (can_double && InRange(up, 3, 6)) return Decision::DoubleDown;
            if (up == 2 || up == 7 || up == 8) return Decision::Stand;
            return Decision::Hit;
        }
        if (total == 17) return (can_double && InRange(up, 3, 6)) ? Decision::DoubleDown : Decision::Hit;
        if (total >= 15) return (can_double && InRange(up, 4, 6)) ? Decision::DoubleDown : Decision::Hit;
        if (total >= 13) return (can_double && InRange(up, 5, 6)) ? Decision::DoubleDown : Decision::Hit;
        return Decision::Hit;
    }

    static auto HardPlay(unsigned const total, unsigned const up, bool const can_double, bool const can_surrender)
        -> Decision
    {
        if (total >= 17) return Decision::Stand;
        if (total >= 13)
        {
            if (can_surrender && total == 16 && InRange(up, 9, 11)) return Decision::Surrender;
            if (can_surrender && total == 15 && up == 10) return Decision::Surrender;
            return InRange(up, 2, 6) ? Decision::Stand : Decision::Hit;
        }
        if (total == 12) return InRange(up, 4, 6) ? Decision::Stand : Decision::Hit;
        if (total == 11) return (can_double && up != 11) ? Decision::DoubleDown : Decision::Hit;
        if (total == 10) return (can_double && InRange(up, 2, 9)) ? Decision::DoubleDown : Decision::Hit;
        if (total == 9) return (can_double && InRange(up, 3, 6)) ? Decision::DoubleDown : Decision::Hit;
        return Decision::Hit;
    }

    auto BasicStrategyProvider::Chart(DecisionSnapshot const& s) -> Decision
    {
        HandValue const v = EvaluateCards(s.hand);
        unsigned const up = ValueOf(s.upcard.rank);
        bool const can_double = Has(s.legal, Decision::DoubleDown);

        if (Has(s.legal, Decision::Split) && s.hand.size() == 2)
        {
            if (auto const d = PairPlay(s.hand[0].rank, up)) return *d;
        }
        if (v.soft) return SoftPlay(v.total, up, can_double);
        return HardPlay(v.total, up, can_double, Has(s.legal, Decision::Surrender));
    }

    auto BasicStrategyProvider::Decide(DecisionSnapshot const& snapshot) -> Decision
    {
        Decision const d = Chart(snapshot);
        if (Has(snapshot.legal, d)) return d;
        return Has(snapshot.legal, Decision::Hit) && EvaluateCards(snapshot.hand).total < 17
                   ? Decision::Hit
                   : Decision::Stand;
    }

    auto BasicStrategyProvider::DecideInsurance(InsuranceSnapshot const& snapshot) -> bool
    {
        if (!snapshot.context || !snapshot.context->prob_hole_card_is_ten) return false;
        return *snapshot.context->prob_hole_card_is_ten >= InsuranceThreshold;
    }

    auto BasicStrategyProvider::ChooseBet(BetRequest const& request) -> ChipsT
    {
        return request.available.empty() ? 0 : request.available.front();
    }
}
