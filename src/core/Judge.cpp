//
// Judge.cpp
//
#include "Judge.hpp"
#include <algorithm>
#include <print>
#include <utility>
#include "Exception.hpp"
#include "Table.hpp"
#include "DecisionProvider.hpp"

namespace blackjack::core
{
    auto Judge::GetBet(Table& table, SeatIdxT const seat, std::vector<ChipsT> const& offered) const -> ChipsT
    {
        BJ_ASSERT(!offered.empty(), "Asked for a bet with nothing on offer");
        Participant& p = table.PlayerAt(seat);

        BetRequest const req{ .seat = seat, .chips = p.Chips(), .available = offered };
        ChipsT const amount = p.Provider()->ChooseBet(req);

        if (std::ranges::find(offered, amount) == std::ranges::end(offered))
        {
            std::print("[judge] seat {} bet {} not offered, using {}\n",
                       static_cast<int>(seat), amount, offered.front());
            return offered.front();
        }
        return amount;
    }

    auto Judge::GetDecision(Table& table, SeatIdxT const seat, std::size_t const hand) const -> RuledDecision
    {
        DecisionSnapshot const snap = table.SnapshotFor(seat, hand);
        Decision const requested = table.PlayerAt(seat).Provider()->Decide(snap);

        auto const ok = table.rules_->Validate(table, seat, hand, requested);
        if (ok)
        {
            return {requested, requested, DecisionResult::OK, std::nullopt};
        }

        bool const first_action = snap.hand.size() == 2;
        Decision const applied = (requested == Decision::DoubleDown && first_action)
                                     ? Decision::Hit
                                     : Decision::Stand;

        std::print("[judge] seat {} hand {}: {} -> {} ({})\n", static_cast<int>(seat), hand,
                   to_string(requested), to_string(applied), error::describe(ok.error()));

        return {requested, applied, DecisionResult::Substituted, ok.error()};
    }

    auto Judge::GetInsurance(Table& table, SeatIdxT const seat) const -> bool
    {
        InsuranceSnapshot const snap = table.InsuranceSnapshotFor(seat);
        return table.PlayerAt(seat).Provider()->DecideInsurance(snap);
    }
}
