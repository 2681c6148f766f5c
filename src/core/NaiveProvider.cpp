//
// NaiveProvider.cpp
//

#include "NaiveProvider.hpp"

namespace blackjack::core
{
    NaiveProvider::NaiveProvider(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto NaiveProvider::ChooseBet(BetRequest const& request) -> ChipsT
    {
        if (request.available.empty()) return 0;
        return request.available[pick(request.available)];
    }

    auto NaiveProvider::Decide(DecisionSnapshot const& snapshot) -> Decision
    {
        if (snapshot.legal.empty()) return Decision::Stand;
        return snapshot.legal[pick(snapshot.legal)];
    }

    auto NaiveProvider::DecideInsurance(InsuranceSnapshot const& snapshot) -> bool
    {
        (void)snapshot;
        return std::bernoulli_distribution{0.5}(rng_);
    }
}
