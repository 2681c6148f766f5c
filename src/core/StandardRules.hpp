//
// StandardRules.hpp
//

#ifndef BLACKJACKSIM_STANDARDRULES_HPP
#define BLACKJACKSIM_STANDARDRULES_HPP
#include "Rules.hpp"

namespace blackjack::core
{
    // Late surrender, double on any first two cards, a single split, split Aces take one card each.
    class StandardRules final : public Rules
    {
    public:
        auto LegalDecisions(Table const& table, SeatIdxT seat, std::size_t hand) const
            -> std::vector<Decision> override;
        auto Validate(Table const& table, SeatIdxT seat, std::size_t hand, Decision d) const
            -> CheckResult override;
        auto Apply(Table& table, SeatIdxT seat, std::size_t hand, Decision d) -> TurnResult override;
        auto DealerDecision(Table const& table) const -> Decision override;
    };
}

#endif //BLACKJACKSIM_STANDARDRULES_HPP
