//
// Participant.cpp
//
#include "Participant.hpp"

#include <utility>

namespace
{
    inline auto Viol(blackjack::core::error::RuleViolationCode code) -> blackjack::core::error::RuleViolation
    {
        return blackjack::core::error::RuleViolation{ .code = code };
    }
}

namespace blackjack::core
{
    using RVC = error::RuleViolationCode;

    Participant::Participant(std::string name, SeatIdxT const seat, ChipsT const chips,
                             std::unique_ptr<DecisionProvider> provider) :
        name_(std::move(name)),
        seat_(seat),
        chips_(chips),
        chips_before_(chips),
        provider_(std::move(provider))
    {
        BJ_ASSERT(provider_ != nullptr, "Participant without a decision provider");
        BJ_ASSERT(chips_ >= 0, "Participant with negative chips");
    }

    auto Participant::ResetForRound() -> void
    {
        slots_.clear();
        insurance_bet_ = 0;
        insurance_payout_ = 0;
        chips_before_ = chips_;
    }

    auto Participant::Slot(std::size_t const idx) const -> HandSlot const&
    {
        BJ_ASSERT(idx < slots_.size(), "Hand index out of range");
        return slots_[idx];
    }

    auto Participant::SlotAt(std::size_t const idx) -> HandSlot&
    {
        BJ_ASSERT(idx < slots_.size(), "Hand index out of range");
        return slots_[idx];
    }

    auto Participant::PlaceBet(ChipsT const amount) -> error::ValidateResult
    {
        if (!slots_.empty())
            return std::unexpected(Viol(RVC::Bet_AlreadyPlaced).with_seat(seat_).with_bet(amount));
        if (amount <= 0)
            return std::unexpected(Viol(RVC::Bet_NotPositive).with_seat(seat_).with_bet(amount));
        if (amount > chips_)
            return std::unexpected(Viol(RVC::Bet_ExceedsChips).with_seat(seat_).with_bet(amount).with_chips(chips_));

        chips_ -= amount;
        slots_.push_back(HandSlot{ .bet = amount });
        return {};
    }

    auto Participant::CheckFirstAction(std::size_t const idx, RVC const not_first) const -> error::ValidateResult
    {
        auto const h = static_cast<uint8_t>(idx);
        if (idx >= slots_.size())
            return std::unexpected(Viol(RVC::Hand_NoSuchHand).with_seat(seat_).with_hand(h));

        HandSlot const& s = slots_[idx];
        if (s.outcome)
            return std::unexpected(Viol(RVC::Hand_AlreadyResolved).with_seat(seat_).with_hand(h));
        if (s.frozen)
            return std::unexpected(Viol(RVC::Hand_Frozen).with_seat(seat_).with_hand(h));
        if (s.hand.Size() != 2)
            return std::unexpected(Viol(not_first).with_seat(seat_).with_hand(h)
                                   .with_cards(static_cast<uint8_t>(s.hand.Size())));
        return {};
    }

    auto Participant::ValidateSplit(std::size_t const idx) const -> error::ValidateResult
    {
        if (auto ok = CheckFirstAction(idx, RVC::Split_NotFirstAction); !ok)
            return ok;

        HandSlot const& s = slots_[idx];
        auto const h = static_cast<uint8_t>(idx);
        if (slots_.size() != 1)
            return std::unexpected(Viol(RVC::Split_AlreadySplit).with_seat(seat_).with_hand(h));
        if (!s.hand.IsPair())
            return std::unexpected(Viol(RVC::Split_NotPair).with_seat(seat_).with_hand(h));
        if (chips_ < s.bet)
            return std::unexpected(Viol(RVC::Split_InsufficientChips).with_seat(seat_).with_hand(h)
                                   .with_bet(s.bet).with_chips(chips_).with_rank(s.hand.Cards()[0]->rank));
        return {};
    }

    auto Participant::Split(std::size_t const idx) -> error::ValidateResult
    {
        if (auto ok = ValidateSplit(idx); !ok)
            return ok;

        HandSlot& s = slots_[idx];
        ChipsT const bet = s.bet;
        CardSP second = s.hand.SplitOff();

        HandSlot fresh{ .hand = Hand{true}, .bet = bet };
        fresh.hand.Add(std::move(second));
        chips_ -= bet;
        slots_.push_back(std::move(fresh));
        return {};
    }

    auto Participant::ValidateDouble(std::size_t const idx) const -> error::ValidateResult
    {
        if (auto ok = CheckFirstAction(idx, RVC::Double_NotFirstAction); !ok)
            return ok;

        HandSlot const& s = slots_[idx];
        if (s.hand.IsBust())
            return std::unexpected(Viol(RVC::Hand_Busted).with_seat(seat_).with_hand(static_cast<uint8_t>(idx)));
        if (chips_ < s.bet)
            return std::unexpected(Viol(RVC::Double_InsufficientChips).with_seat(seat_)
                                   .with_hand(static_cast<uint8_t>(idx)).with_bet(s.bet).with_chips(chips_));
        return {};
    }

    auto Participant::DoubleDown(std::size_t const idx) -> error::ValidateResult
    {
        if (auto ok = ValidateDouble(idx); !ok)
            return ok;

        HandSlot& s = slots_[idx];
        chips_ -= s.bet;
        s.bet *= 2;
        return {};
    }

    auto Participant::ValidateSurrender(std::size_t const idx) const -> error::ValidateResult
    {
        return CheckFirstAction(idx, RVC::Surrender_NotFirstAction);
    }

    auto Participant::Surrender(std::size_t const idx) -> error::ValidateResult
    {
        if (auto ok = ValidateSurrender(idx); !ok)
            return ok;

        HandSlot& s = slots_[idx];
        s.refund = s.bet / 2;
        chips_ += s.refund;
        s.outcome = Outcome::Surrender;
        return {};
    }

    auto Participant::PlaceInsurance() -> error::ValidateResult
    {
        if (slots_.empty())
            return std::unexpected(Viol(RVC::Insurance_NoPrimaryBet).with_seat(seat_));
        if (insurance_bet_ > 0)
            return std::unexpected(Viol(RVC::Insurance_AlreadyPlaced).with_seat(seat_).with_bet(insurance_bet_));

        ChipsT const amount = slots_.front().bet / 2;
        if (amount <= 0)
            return std::unexpected(Viol(RVC::Bet_NotPositive).with_seat(seat_).with_bet(amount));
        if (chips_ < amount)
            return std::unexpected(Viol(RVC::Insurance_InsufficientChips).with_seat(seat_)
                                   .with_bet(amount).with_chips(chips_));

        chips_ -= amount;
        insurance_bet_ = amount;
        return {};
    }

    auto Participant::AddCard(std::size_t const idx, CardSP card) -> void
    {
        HandSlot& s = SlotAt(idx);
        s.hand.Add(std::move(card));
        // captured once: the dealt pair, or for a split-born hand its split card plus the first replacement
        if (s.initial.empty() && s.hand.Size() == 2) s.initial = s.hand.Values();
    }

    auto Participant::SetOutcome(std::size_t const idx, Outcome const o) -> void
    {
        HandSlot& s = SlotAt(idx);
        BJ_ASSERT(!s.outcome.has_value(), "Outcome assigned twice");
        s.outcome = o;
    }

    auto Participant::Freeze(std::size_t const idx) -> void
    {
        SlotAt(idx).frozen = true;
    }

    auto Participant::Credit(std::size_t const idx, ChipsT const gross) -> void
    {
        BJ_ASSERT(gross >= 0, "Negative credit");
        HandSlot& s = SlotAt(idx);
        s.credit += gross;
        chips_ += gross;
    }

    auto Participant::PayInsurance(ChipsT const gross) -> void
    {
        BJ_ASSERT(gross >= 0, "Negative insurance credit");
        insurance_payout_ += gross;
        chips_ += gross;
    }
}
