//
// Judge.hpp
//

#ifndef BLACKJACKSIM_JUDGE_HPP
#define BLACKJACKSIM_JUDGE_HPP

#include <optional>
#include <vector>
#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace blackjack::core
{
    class Table;

    enum class DecisionResult : uint8_t
    {
        OK,
        Substituted
    };

    struct RuledDecision
    {
        Decision requested{};
        Decision applied{};
        DecisionResult result{};
        std::optional<error::RuleViolation> violation{};
    };

    // Sits between the table and the providers: asks, then sanitizes what comes back.
    class Judge
    {
    public:
        Judge() = default;

        // Answers outside `offered` fall back to the smallest offered size.
        auto GetBet(Table& table, SeatIdxT seat, std::vector<ChipsT> const& offered) const -> ChipsT;
        // Illegal answers become Hit (unaffordable first-action double) or Stand.
        auto GetDecision(Table& table, SeatIdxT seat, std::size_t hand) const -> RuledDecision;
        auto GetInsurance(Table& table, SeatIdxT seat) const -> bool;
    };
}
#endif //BLACKJACKSIM_JUDGE_HPP
