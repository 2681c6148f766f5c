//
// HumanProvider.hpp
//

#ifndef BLACKJACKSIM_HUMANPROVIDER_HPP
#define BLACKJACKSIM_HUMANPROVIDER_HPP

#include <iostream>
#include <optional>
#include <string>
#include "DecisionProvider.hpp"
#include "State.hpp"

namespace blackjack::core
{
    // Console seat. Keys: h=Hit s=Stand d=DoubleDown p=Split r=Surrender.
    // End of input answers with the safe default for every remaining question.
    class HumanProvider final : public DecisionProvider
    {
    public:
        explicit HumanProvider(std::string name, std::istream& in = std::cin, std::ostream& out = std::cout);

        auto ChooseBet(BetRequest const& request) -> ChipsT override;
        auto Decide(DecisionSnapshot const& snapshot) -> Decision override;
        auto DecideInsurance(InsuranceSnapshot const& snapshot) -> bool override;

        static auto KeyFor(Decision d) -> char;
        static auto FromKey(char key) -> std::optional<Decision>;

    private:
        // nullopt on end of input
        auto ReadLine() -> std::optional<std::string>;

    private:
        std::string name_;
        std::istream& in_;
        std::ostream& out_;
    };
}

#endif //BLACKJACKSIM_HUMANPROVIDER_HPP
