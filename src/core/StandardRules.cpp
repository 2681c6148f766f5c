//
// StandardRules.cpp
//

#include "StandardRules.hpp"

#include <array>
#include <format>
#include "Table.hpp"

namespace
{
    inline auto Viol(blackjack::core::error::RuleViolationCode code) -> blackjack::core::error::RuleViolation
    {
        return blackjack::core::error::RuleViolation{ .code = code };
    }

    constexpr std::array AllDecisions{
        blackjack::core::Decision::Hit,
        blackjack::core::Decision::Stand,
        blackjack::core::Decision::DoubleDown,
        blackjack::core::Decision::Split,
        blackjack::core::Decision::Surrender
    };
}

namespace blackjack::core
{
    auto StandardRules::LegalDecisions(Table const& table, SeatIdxT const seat, std::size_t const hand) const
        -> std::vector<Decision>
    {
        std::vector<Decision> legal;
        for (Decision const d : AllDecisions)
        {
            if (Validate(table, seat, hand, d)) legal.push_back(d);
        }
        return legal;
    }

auto StandardRules::Validate(Table const& table, SeatIdxT const seat, std::size_t const hand,
                             Decision const d) const -> CheckResult
{
    using RVC = ::blackjack::core::error::RuleViolationCode;

    BJ_ASSERT(seat < table.participants_.size(), "Seat out of range in Validate");
    Participant const& p = table.participants_[seat];
    auto const h = static_cast<uint8_t>(hand);

    if (hand >= p.HandCount())
        return std::unexpected(Viol(RVC::Hand_NoSuchHand).with_seat(seat).with_hand(h).with_decision(d));

    HandSlot const& s = p.Slot(hand);
    unsigned const target = table.cfg_.blackjack_value;

    if (s.outcome)
        return std::unexpected(Viol(RVC::Hand_AlreadyResolved).with_seat(seat).with_hand(h).with_decision(d));
    if (s.frozen)
        return std::unexpected(Viol(RVC::Hand_Frozen).with_seat(seat).with_hand(h).with_decision(d));
    if (s.hand.IsBust(target))
        return std::unexpected(Viol(RVC::Hand_Busted).with_seat(seat).with_hand(h).with_decision(d));

    switch (d)
    {
    case Decision::Hit:
    case Decision::Stand:
        return {};
    case Decision::DoubleDown:
        if (auto ok = p.ValidateDouble(hand); !ok) return std::unexpected(ok.error().with_decision(d));
        return {};
    case Decision::Split:
        if (auto ok = p.ValidateSplit(hand); !ok) return std::unexpected(ok.error().with_decision(d));
        return {};
    case Decision::Surrender:
        if (auto ok = p.ValidateSurrender(hand); !ok) return std::unexpected(ok.error().with_decision(d));
        return {};
    }
    return std::unexpected(Viol(RVC::Internal_Unreachable).with_seat(seat).with_decision(d));
}

    auto StandardRules::Apply(Table& table, SeatIdxT const seat, std::size_t const hand, Decision const d)
        -> TurnResult
    {
        if (auto const ok = Validate(table, seat, hand, d); !ok)
            BJ_THROW(error::Code::InvalidAction, error::describe(ok.error()));

        Participant& p = table.PlayerAt(seat);
        unsigned const target = table.cfg_.blackjack_value;

        auto bust_check = [&]() -> TurnResult
        {
            if (p.Slot(hand).hand.IsBust(target))
            {
                p.SetOutcome(hand, Outcome::Bust);
            }
            return TurnResult::HandEnded;
        };

        switch (d)
        {
        case Decision::Surrender:
        {
            auto const ok = p.Surrender(hand);
            BJ_ASSERT(ok.has_value(), "Surrender failed after validation");
            return TurnResult::HandEnded;
        }
        case Decision::Split:
        {
            bool const aces = p.Slot(hand).hand.Cards()[0]->rank == Rank::Ace;
            auto const ok = p.Split(hand);
            BJ_ASSERT(ok.has_value(), "Split failed after validation");
            std::size_t const fresh = p.HandCount() - 1;
            table.DealTo(seat, hand);
            table.DealTo(seat, fresh);
            if (aces)
            {
                p.Freeze(hand);
                p.Freeze(fresh);
                return TurnResult::HandEnded;
            }
            return TurnResult::Continue;
        }
        case Decision::DoubleDown:
        {
            auto const ok = p.DoubleDown(hand);
            BJ_ASSERT(ok.has_value(), "Double down failed after validation");
            table.DealTo(seat, hand);
            return bust_check();
        }
        case Decision::Hit:
        {
            table.DealTo(seat, hand);
            if (p.Slot(hand).hand.IsBust(target)) return bust_check();
            return TurnResult::Continue;
        }
        case Decision::Stand:
            return TurnResult::HandEnded;
        }
        BJ_THROW(error::Code::Rules, std::format("Unhandled decision {}", to_string(d)));
    }

    auto StandardRules::DealerDecision(Table const& table) const -> Decision
    {
        return table.dealer_.Value(table.cfg_.blackjack_value) < table.cfg_.dealer_stand_value
                   ? Decision::Hit
                   : Decision::Stand;
    }
}
