//
// Participant.hpp
//

#ifndef BLACKJACKSIM_PARTICIPANT_HPP
#define BLACKJACKSIM_PARTICIPANT_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"
#include "Hand.hpp"
#include "DecisionProvider.hpp"

namespace blackjack::core
{
    // One hand and the bet that funds it. A participant's slots replace parallel hand/bet lists.
    struct HandSlot
    {
        Hand hand;
        ChipsT bet{};
        std::optional<Outcome> outcome{};
        // split Aces: no further decisions
        bool frozen{false};
        ChipsT refund{};
        ChipsT credit{};
        std::vector<CardVal> initial;
    };

    class Participant
    {
    public:
        Participant() = delete;
        Participant(std::string name, SeatIdxT seat, ChipsT chips, std::unique_ptr<DecisionProvider> provider);

        Participant(Participant const&) = delete;
        auto operator=(Participant const&) -> Participant& = delete;
        Participant(Participant&&) noexcept = default;
        auto operator=(Participant&&) noexcept -> Participant& = default;

        // Clears hands/bets/insurance and remembers the opening balance.
        auto ResetForRound() -> void;

        // All of the below leave state untouched when they fail.
        auto PlaceBet(ChipsT amount) -> error::ValidateResult;
        auto ValidateSplit(std::size_t idx) const -> error::ValidateResult;
        auto Split(std::size_t idx) -> error::ValidateResult;
        auto ValidateDouble(std::size_t idx) const -> error::ValidateResult;
        auto DoubleDown(std::size_t idx) -> error::ValidateResult;
        auto ValidateSurrender(std::size_t idx) const -> error::ValidateResult;
        auto Surrender(std::size_t idx) -> error::ValidateResult;
        auto PlaceInsurance() -> error::ValidateResult;

        auto CanPairSplit(std::size_t idx) const -> bool { return ValidateSplit(idx).has_value(); }

        auto AddCard(std::size_t idx, CardSP card) -> void;
        auto SetOutcome(std::size_t idx, Outcome o) -> void;
        auto Freeze(std::size_t idx) -> void;
        auto Credit(std::size_t idx, ChipsT gross) -> void;
        auto PayInsurance(ChipsT gross) -> void;

        [[nodiscard]]
        auto Name() const noexcept -> std::string const& { return name_; }
        auto Seat() const noexcept -> SeatIdxT { return seat_; }
        auto Chips() const noexcept -> ChipsT { return chips_; }
        auto ChipsBefore() const noexcept -> ChipsT { return chips_before_; }
        auto InsuranceBet() const noexcept -> ChipsT { return insurance_bet_; }
        auto InsurancePayout() const noexcept -> ChipsT { return insurance_payout_; }
        auto InRound() const noexcept -> bool { return !slots_.empty(); }
        auto HandCount() const noexcept -> std::size_t { return slots_.size(); }

        [[nodiscard]]
        auto Slots() const noexcept -> std::vector<HandSlot> const& { return slots_; }
        auto Slot(std::size_t idx) const -> HandSlot const&;
        auto Provider() const noexcept -> DecisionProvider* { return provider_.get(); }

    private:
        auto CheckFirstAction(std::size_t idx, error::RuleViolationCode not_first) const -> error::ValidateResult;
        auto SlotAt(std::size_t idx) -> HandSlot&;

    private:
        std::string name_;
        SeatIdxT seat_{};
        ChipsT chips_{};
        ChipsT chips_before_{};
        std::unique_ptr<DecisionProvider> provider_;

        std::vector<HandSlot> slots_;
        ChipsT insurance_bet_{};
        ChipsT insurance_payout_{};
    };
}

#endif //BLACKJACKSIM_PARTICIPANT_HPP
