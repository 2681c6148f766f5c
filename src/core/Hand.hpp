//
// Hand.hpp
//

#ifndef BLACKJACKSIM_HAND_HPP
#define BLACKJACKSIM_HAND_HPP

#include <ranges>
#include <span>
#include <vector>
#include "Types.hpp"

namespace blackjack::core
{
    struct HandValue
    {
        unsigned total{};
        bool soft{false};
    };

    // Sum with every Ace at 11, then downgrade Aces to 1 one at a time while over target.
    template <std::ranges::input_range R, typename Proj>
    constexpr auto Evaluate(R&& cards, Proj proj, unsigned const target = constants::BlackjackValue) -> HandValue
    {
        unsigned total{};
        unsigned soft_aces{};
        for (auto const& c : cards)
        {
            Rank const r = proj(c);
            total += ValueOf(r);
            soft_aces += (r == Rank::Ace);
        }
        while (total > target && soft_aces > 0)
        {
            total -= constants::SoftAceBonus;
            --soft_aces;
        }
        return HandValue{total, soft_aces > 0 && total <= target};
    }

    auto EvaluateCards(std::span<CardVal const> cards, unsigned target = constants::BlackjackValue) -> HandValue;

    // Ordered cards funded by one bet. Owns its cards; move-only like the cards themselves.
    class Hand
    {
    public:
        Hand() = default;
        explicit Hand(bool from_split) : from_split_{from_split} {}

        Hand(Hand const&) = delete;
        auto operator=(Hand const&) -> Hand& = delete;
        Hand(Hand&&) noexcept = default;
        auto operator=(Hand&&) noexcept -> Hand& = default;

        auto Add(CardSP card) -> void;

        [[nodiscard]]
        auto Cards() const noexcept -> std::vector<CardSP> const& { return cards_; }
        auto Size() const noexcept -> std::size_t { return cards_.size(); }
        auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto FromSplit() const noexcept -> bool { return from_split_; }

        auto Evaluate(unsigned target = constants::BlackjackValue) const -> HandValue;
        auto Value(unsigned target = constants::BlackjackValue) const -> unsigned;
        auto IsSoft(unsigned target = constants::BlackjackValue) const -> bool;
        auto IsBust(unsigned target = constants::BlackjackValue) const -> bool;
        // Two-card target total on a hand that was not produced by a split
        auto IsBlackjack(unsigned target = constants::BlackjackValue) const -> bool;
        auto IsPair() const -> bool;

        // Removes the second card for a new hand and marks this one as split-born.
        auto SplitOff() -> CardSP;

        [[nodiscard]]
        auto Values() const -> std::vector<CardVal>;

    private:
        std::vector<CardSP> cards_;
        bool from_split_{false};
    };
}

#endif //BLACKJACKSIM_HAND_HPP
