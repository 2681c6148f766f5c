//
// Hand.cpp
//
#include "Hand.hpp"

#include <algorithm>
#include <iterator>
#include <utility>
#include "Exception.hpp"

namespace blackjack::core
{
    auto EvaluateCards(std::span<CardVal const> const cards, unsigned const target) -> HandValue
    {
        return core::Evaluate(cards, [](CardVal const& c) { return c.rank; }, target);
    }

    auto Hand::Add(CardSP card) -> void
    {
        BJ_ASSERT(card != nullptr, "Null card added to hand");
        cards_.push_back(std::move(card));
    }

    auto Hand::Evaluate(unsigned const target) const -> HandValue
    {
        return core::Evaluate(cards_, [](CardSP const& c) { return c->rank; }, target);
    }

    auto Hand::Value(unsigned const target) const -> unsigned
    {
        return Evaluate(target).total;
    }

    auto Hand::IsSoft(unsigned const target) const -> bool
    {
        return Evaluate(target).soft;
    }

    auto Hand::IsBust(unsigned const target) const -> bool
    {
        return Value(target) > target;
    }

    auto Hand::IsBlackjack(unsigned const target) const -> bool
    {
        return !from_split_ && cards_.size() == 2 && Value(target) == target;
    }

    auto Hand::IsPair() const -> bool
    {
        return cards_.size() == 2 && cards_[0]->rank == cards_[1]->rank;
    }

    auto Hand::SplitOff() -> CardSP
    {
        BJ_ASSERT(IsPair(), "SplitOff on a hand that is not a pair");
        CardSP second = std::move(cards_.back());
        cards_.pop_back();
        from_split_ = true;
        return second;
    }

    auto Hand::Values() const -> std::vector<CardVal>
    {
        std::vector<CardVal> out;
        out.reserve(cards_.size());
        std::ranges::transform(cards_, std::back_inserter(out),
                               [](CardSP const& c) { return ToVal(*c); });
        return out;
    }
}
