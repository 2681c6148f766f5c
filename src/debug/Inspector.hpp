//
// Inspector.hpp
//

#ifndef BLACKJACKSIM_INSPECTOR_HPP
#define BLACKJACKSIM_INSPECTOR_HPP

#include <vector>
#include <algorithm>
#include <iterator>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Table.hpp"

namespace blackjack::core::debug
{
    struct Inspector
    {
        struct HandView
        {
            std::vector<Card const*> cards;
            ChipsT bet{};
            std::optional<Outcome> outcome{};
            bool from_split{false};
            bool frozen{false};
        };

        struct SeatView
        {
            ChipsT chips{};
            ChipsT insurance_bet{};
            std::vector<HandView> hands;
        };

        struct SnapshotAll
        {
            std::vector<Card const*> shoe;
            std::vector<Card const*> dealer;
            std::vector<SeatView> seats;
            Phase phase{};
            uint8_t n_decks{};
            unsigned blackjack_value{};
        };

        static inline auto Gather(Table const& t) -> SnapshotAll
        {
            auto raw = [](CardSP const& c) -> Card const* { return c.get(); };

            SnapshotAll ret{};
            ret.phase = t.phase_;
            ret.n_decks = t.cfg_.n_decks;
            ret.blackjack_value = t.cfg_.blackjack_value;

            ret.shoe.reserve(t.shoe_.Size());
            std::ranges::transform(t.shoe_.Cards(), std::back_inserter(ret.shoe), raw);
            std::ranges::transform(t.dealer_.Cards(), std::back_inserter(ret.dealer), raw);

            ret.seats.reserve(t.participants_.size());
            for (Participant const& p : t.participants_)
            {
                SeatView sv{ .chips = p.Chips(), .insurance_bet = p.InsuranceBet() };
                for (HandSlot const& s : p.Slots())
                {
                    HandView hv{ .bet = s.bet, .outcome = s.outcome,
                                 .from_split = s.hand.FromSplit(), .frozen = s.frozen };
                    std::ranges::transform(s.hand.Cards(), std::back_inserter(hv.cards), raw);
                    sv.hands.push_back(std::move(hv));
                }
                ret.seats.push_back(std::move(sv));
            }
            return ret;
        }
    };
}

#endif //BLACKJACKSIM_INSPECTOR_HPP
