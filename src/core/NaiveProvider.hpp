//
// NaiveProvider.hpp
//

#ifndef BLACKJACKSIM_NAIVEPROVIDER_HPP
#define BLACKJACKSIM_NAIVEPROVIDER_HPP

#include <random>
#include "DecisionProvider.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace blackjack::core
{
    class NaiveProvider final : public DecisionProvider
    {
    public:
        explicit NaiveProvider(uint64_t rng_seed);

        auto ChooseBet(BetRequest const& request) -> ChipsT override;
        auto Decide(DecisionSnapshot const& snapshot) -> Decision override;
        auto DecideInsurance(InsuranceSnapshot const& snapshot) -> bool override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //BLACKJACKSIM_NAIVEPROVIDER_HPP
