//
// DecisionProvider.hpp
//

#ifndef BLACKJACKSIM_DECISIONPROVIDER_HPP
#define BLACKJACKSIM_DECISIONPROVIDER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace blackjack::core
{
    class DecisionProvider
    {
    public:
        virtual ~DecisionProvider() = default;

        // Called synchronously by the table; may block. Implementations must not throw:
        // failures map to the safe default (minimum bet / Stand / no insurance).
        virtual auto ChooseBet(BetRequest const& request) -> ChipsT = 0;
        virtual auto Decide(DecisionSnapshot const& snapshot) -> Decision = 0;
        virtual auto DecideInsurance(InsuranceSnapshot const& snapshot) -> bool = 0;
    };
}
#endif //BLACKJACKSIM_DECISIONPROVIDER_HPP
