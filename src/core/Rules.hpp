//
// Rules.hpp
//

#ifndef BLACKJACKSIM_RULES_HPP
#define BLACKJACKSIM_RULES_HPP

#include <cstddef>
#include <vector>
#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace blackjack::core
{
    //forward declaration
    class Table;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Decisions currently legal for hand `hand` of `seat`; empty once the hand is resolved.
        virtual auto LegalDecisions(Table const& table, SeatIdxT seat, std::size_t hand) const
            -> std::vector<Decision> = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Table const& table, SeatIdxT seat, std::size_t hand, Decision d) const
            -> CheckResult = 0;

        // Mutate authoritative state (move shared_ptr<Card> shoe -> hand, debit/refund chips).
        virtual auto Apply(Table& table, SeatIdxT seat, std::size_t hand, Decision d) -> TurnResult = 0;

        virtual auto DealerDecision(Table const& table) const -> Decision = 0;
    };
}

#endif //BLACKJACKSIM_RULES_HPP
