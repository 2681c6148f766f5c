//
// Invariants.hpp
//

#ifndef BLACKJACKSIM_INVARIANTS_HPP
#define BLACKJACKSIM_INVARIANTS_HPP

#include "../core/Table.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <format>
#include <unordered_set>

namespace blackjack::core::debug
{
    // A second layer of checks over the whole table. Throws AssertionError on the first breach.
    inline auto CheckInvariants(Table const& t) -> void
    {
#if BJ_ENABLE_TEST_HOOKS == false
        (void)t;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(t);

    // 1) Every card owned exactly once; each exact card appears once per deck
    {
        std::size_t const expected = s.n_decks * constants::CardsPerDeck;
        std::unordered_set<Card const*> seen;
        seen.reserve(expected);
        util::CardCounter counter{};

        auto push_unique = [&](Card const* p)
        {
            BJ_ASSERT(p != nullptr, "Null card in a zone");
            bool const inserted = seen.insert(p).second;
            BJ_ASSERT(inserted, "Duplicate card pointer across zones");
            counter.Add(*p);
        };

        for (auto p : s.shoe) push_unique(p);
        for (auto p : s.dealer) push_unique(p);
        for (auto const& seat : s.seats)
            for (auto const& h : seat.hands)
                for (auto p : h.cards) push_unique(p);

        BJ_ASSERT(seen.size() == expected,
                  std::format("Materialized card count {} != shoe size {}", seen.size(), expected));
        for (std::size_t i{}; i < constants::SuitCount; ++i)
        {
            for (std::size_t j{}; j < constants::RankCount; ++j)
            {
                CardVal const c{static_cast<Suit>(i), static_cast<Rank>(j)};
                BJ_ASSERT(counter.Count(c) == s.n_decks, "Card multiplicity differs from deck count");
            }
        }
    }

    // 2) Chips never negative; every hand is funded
    for (auto const& seat : s.seats)
    {
        BJ_ASSERT(seat.chips >= 0, "Negative chip balance");
        BJ_ASSERT(seat.insurance_bet >= 0, "Negative insurance bet");
        for (auto const& h : seat.hands)
            BJ_ASSERT(h.bet > 0, "Hand without a bet");
    }

    // 3) Split-born hands never score Blackjack, frozen hands come from split Aces
    for (auto const& seat : s.seats)
    {
        for (auto const& h : seat.hands)
        {
            if (h.from_split)
                BJ_ASSERT(!h.outcome || *h.outcome != Outcome::Blackjack, "Split hand scored as Blackjack");
            if (h.frozen)
                BJ_ASSERT(h.from_split && !h.cards.empty() && h.cards.front()->rank == Rank::Ace,
                          "Frozen hand that is not a split Ace");
        }
    }

    // 4) Once settled, every hand holds exactly one outcome
    if (s.phase == Phase::Done || s.phase == Phase::Settlement)
    {
        for (auto const& seat : s.seats)
            for (auto const& h : seat.hands)
                BJ_ASSERT(h.outcome.has_value(), "Hand left without an outcome");
    }

    // 5) A busted hand carries Bust
    for (auto const& seat : s.seats)
    {
        for (auto const& h : seat.hands)
        {
            if (!h.outcome) continue;
            unsigned const v = Evaluate(h.cards, [](Card const* c) { return c->rank; }, s.blackjack_value).total;
            if (v > s.blackjack_value)
                BJ_ASSERT(*h.outcome == Outcome::Bust, "Busted hand without a Bust outcome");
        }
    }
#endif // BJ_ENABLE_TEST_HOOKS == true
    }
}
#endif //BLACKJACKSIM_INVARIANTS_HPP
