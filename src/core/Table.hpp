//
// Table.hpp
//

#ifndef BLACKJACKSIM_TABLE_HPP
#define BLACKJACKSIM_TABLE_HPP

#include <expected>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Judge.hpp"
#include "Hand.hpp"
#include "Shoe.hpp"
#include "Participant.hpp"
#include "DecisionProvider.hpp"

namespace blackjack::core::debug {struct Inspector;}
namespace blackjack::core
{
    struct SeatSpec
    {
        std::string name;
        ChipsT chips{};
        std::unique_ptr<DecisionProvider> provider;
    };

    // One provider answer as it reached the table, kept for the current round only.
    struct DecisionEntry
    {
        SeatIdxT seat{};
        uint8_t hand_index{};
        std::vector<CardVal> hand;
        Decision requested{};
        Decision applied{};
    };

    auto ValidateConfig(Config const& cfg) -> std::expected<void, std::string>;

    class Table
    {
    public:
        Table() = delete;
        Table(Config const& config,
              std::unique_ptr<Rules> rules,
              std::vector<SeatSpec> seats);

        // One state-machine step: run the current phase, return the phase that follows.
        // Stepping from Done opens the next round.
        auto Step() -> Phase;
        // Steps until Done and hands the record over; the table keeps no copy.
        auto PlayRound() -> RoundRecord;
        auto TakeRecord() -> std::optional<RoundRecord>;

        auto PhaseNow() const noexcept -> Phase { return phase_; }
        auto RoundNumber() const noexcept -> uint64_t { return round_number_; }
        auto SeatCount() const noexcept -> std::size_t { return participants_.size(); }
        auto Settings() const noexcept -> Config const& { return cfg_; }
        auto SeatAt(SeatIdxT seat) const -> Participant const&;
        auto DealerHand() const noexcept -> Hand const& { return dealer_; }
        auto ShoeNow() const noexcept -> Shoe const& { return shoe_; }
        auto Decisions() const noexcept -> std::vector<DecisionEntry> const& { return decisions_; }
        auto Upcard() const -> CardVal;

        // Denominations within [min_bet, max_bet] that the participant can cover
        auto OfferedBets(Participant const& p) const -> std::vector<ChipsT>;
        auto CanSeatBet(SeatIdxT seat) const -> bool;
        auto CanAnySeatBet() const -> bool;

        auto SnapshotFor(SeatIdxT seat, std::size_t hand) const -> DecisionSnapshot;
        auto InsuranceSnapshotFor(SeatIdxT seat) const -> InsuranceSnapshot;
        auto ContextFor(SeatIdxT seat) const -> ContextSP;

#if BJ_ENABLE_TEST_HOOKS
        // The next round's shoe deals `cards` first, in order.
        auto StackNextShoe(std::vector<CardVal> cards) -> void { stacked_ = std::move(cards); }
#endif

        //allows class to directly access private data on an instance
        friend class StandardRules;
        friend class Judge;
        friend struct debug::Inspector;

        auto DealTo(SeatIdxT seat, std::size_t hand) -> void;
        auto DealToDealer() -> void;
        auto PlayerAt(SeatIdxT seat) -> Participant&;

    private:
        auto RunSetup() -> Phase;
        auto RunDeal() -> Phase;
        auto RunInsurance() -> Phase;
        auto RunBlackjackCheck() -> Phase;
        auto RunPlayerTurns() -> Phase;
        auto RunDealerTurn() -> Phase;
        auto RunOutcomes() -> Phase;
        auto RunSettlement() -> Phase;

        auto PlayHand(SeatIdxT seat, std::size_t hand) -> void;
        auto AnyHandUnresolved() const -> bool;
        auto ActiveCount() const -> uint8_t;
        auto GrossReturn(HandSlot const& slot) const -> ChipsT;
        auto BuildRecord() const -> RoundRecord;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        Judge judge_{};
        std::vector<Participant> participants_;
        std::mt19937_64 rng_;

        // Authoritative round state
        Shoe shoe_;
        Hand dealer_{};
        std::vector<CardVal> dealer_initial_;
        Phase phase_{Phase::Setup};
        uint64_t round_number_{0};

        std::vector<DecisionEntry> decisions_;
        std::optional<RoundRecord> record_;
        std::vector<CardVal> stacked_;
    };
}
#endif //BLACKJACKSIM_TABLE_HPP
