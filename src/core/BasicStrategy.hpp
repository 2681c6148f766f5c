//
// BasicStrategy.hpp
//

#ifndef BLACKJACKSIM_BASICSTRATEGY_HPP
#define BLACKJACKSIM_BASICSTRATEGY_HPP

#include "DecisionProvider.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace blackjack::core
{
    // Deterministic chart play; never deviates, never counts beyond the insurance odds.
    class BasicStrategyProvider final : public DecisionProvider
    {
    public:
        static constexpr double InsuranceThreshold = 0.3;

        BasicStrategyProvider() = default;

        auto ChooseBet(BetRequest const& request) -> ChipsT override;
        auto Decide(DecisionSnapshot const& snapshot) -> Decision override;
        auto DecideInsurance(InsuranceSnapshot const& snapshot) -> bool override;

        // The chart's answer before legality is applied
        static auto Chart(DecisionSnapshot const& snapshot) -> Decision;
    };
}

#endif //BLACKJACKSIM_BASICSTRATEGY_HPP
