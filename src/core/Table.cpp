//
// Table.cpp
//
#include "Table.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <utility>
#include "Exception.hpp"

namespace blackjack::core
{
    auto ValidateConfig(Config const& cfg) -> std::expected<void, std::string>
    {
        if (cfg.n_decks == 0)
            return std::unexpected(std::string{"n_decks must be at least 1"});
        if (cfg.dealer_stand_value > cfg.blackjack_value)
            return std::unexpected(std::format("dealer_stand_value {} above blackjack_value {}",
                                               cfg.dealer_stand_value, cfg.blackjack_value));
        if (cfg.payout_blackjack < 0.0 || cfg.payout_blackjack_split < 0.0)
            return std::unexpected(std::string{"payout ratios must not be negative"});
        if (cfg.min_bet <= 0 || cfg.min_bet > cfg.max_bet)
            return std::unexpected(std::format("bad bet limits [{}, {}]", cfg.min_bet, cfg.max_bet));
        if (cfg.bet_sizes.empty())
            return std::unexpected(std::string{"no bet sizes configured"});
        if (std::ranges::any_of(cfg.bet_sizes, [](ChipsT const b) { return b <= 0; }))
            return std::unexpected(std::string{"bet sizes must be positive"});
        if (!std::ranges::is_sorted(cfg.bet_sizes) ||
            std::ranges::adjacent_find(cfg.bet_sizes) != cfg.bet_sizes.end())
            return std::unexpected(std::string{"bet sizes must be strictly ascending"});
        if (cfg.min_chips_active < 0)
            return std::unexpected(std::string{"min_chips_active must not be negative"});
        return {};
    }

    Table::Table(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<SeatSpec> seats) :
        cfg_(config),
        rules_(std::move(rules)),
        rng_{cfg_.seed},
        shoe_{std::max<uint8_t>(cfg_.n_decks, 1)}
    {
        if (auto const ok = ValidateConfig(cfg_); !ok)
            BJ_THROW(error::Code::Assertion, std::format("Invalid config: {}", ok.error()));
        BJ_ASSERT(rules_ != nullptr, "Table without rules");
        BJ_ASSERT(!seats.empty(), "Table without seats");
        BJ_ASSERT(seats.size() <= constants::MaxSeats, "More seats than the table holds");

        participants_.reserve(seats.size());
        for (std::size_t i{}; i < seats.size(); ++i)
        {
            participants_.emplace_back(std::move(seats[i].name), static_cast<SeatIdxT>(i),
                                       seats[i].chips, std::move(seats[i].provider));
        }
    }

    auto Table::SeatAt(SeatIdxT const seat) const -> Participant const&
    {
        BJ_ASSERT(seat < participants_.size(), "Seat out of range");
        return participants_[seat];
    }

    auto Table::PlayerAt(SeatIdxT const seat) -> Participant&
    {
        BJ_ASSERT(seat < participants_.size(), "Seat out of range");
        return participants_[seat];
    }

    auto Table::Upcard() const -> CardVal
    {
        BJ_ASSERT(!dealer_.Empty(), "No dealer upcard before the deal");
        return ToVal(*dealer_.Cards().front());
    }

    auto Table::OfferedBets(Participant const& p) const -> std::vector<ChipsT>
    {
        auto offered = cfg_.bet_sizes | std::views::filter([&](ChipsT const b)
        {
            return b >= cfg_.min_bet && b <= cfg_.max_bet && b <= p.Chips();
        });
        return std::ranges::to<std::vector<ChipsT>>(offered);
    }

    auto Table::CanSeatBet(SeatIdxT const seat) const -> bool
    {
        Participant const& p = SeatAt(seat);
        return p.Chips() >= cfg_.min_chips_active && !OfferedBets(p).empty();
    }

    auto Table::CanAnySeatBet() const -> bool
    {
        for (std::size_t i{}; i < participants_.size(); ++i)
        {
            if (CanSeatBet(static_cast<SeatIdxT>(i))) return true;
        }
        return false;
    }

    auto Table::ActiveCount() const -> uint8_t
    {
        return static_cast<uint8_t>(std::ranges::count_if(participants_,
                                                           [](Participant const& p) { return p.InRound(); }));
    }

    auto Table::ContextFor(SeatIdxT const seat) const -> ContextSP
    {
        auto ctx = std::make_shared<RoundContext>();
        ctx->num_participants = ActiveCount();
        for (Participant const& p : participants_)
        {
            for (HandSlot const& s : p.Slots())
            {
                for (CardSP const& c : s.hand.Cards()) ctx->cards_visible.push_back(ToVal(*c));
            }
        }
        if (!dealer_.Empty())
        {
            ctx->cards_visible.push_back(Upcard());
            if (Upcard().rank == Rank::Ace)
                ctx->prob_hole_card_is_ten = HoleCardTenProbability(cfg_.n_decks, ctx->cards_visible);
        }
        if (SeatAt(seat).InRound())
            ctx->num_hands = static_cast<uint8_t>(SeatAt(seat).HandCount());
        return ctx;
    }

    auto Table::SnapshotFor(SeatIdxT const seat, std::size_t const hand) const -> DecisionSnapshot
    {
        Participant const& p = SeatAt(seat);
        HandSlot const& s = p.Slot(hand);

        DecisionSnapshot snap{};
        snap.seat = seat;
        snap.hand_index = static_cast<uint8_t>(hand);
        snap.hand = s.hand.Values();
        snap.upcard = Upcard();
        snap.legal = rules_->LegalDecisions(*this, seat, hand);
        snap.bet = s.bet;
        snap.chips = p.Chips();
        snap.context = ContextFor(seat);
        return snap;
    }

    auto Table::InsuranceSnapshotFor(SeatIdxT const seat) const -> InsuranceSnapshot
    {
        Participant const& p = SeatAt(seat);
        BJ_ASSERT(p.InRound(), "Insurance offered to a seat sitting out");

        InsuranceSnapshot snap{};
        snap.seat = seat;
        snap.chips = p.Chips();
        snap.primary_bet = p.Slot(0).bet;
        snap.hand = p.Slot(0).hand.Values();
        snap.upcard = Upcard();
        snap.context = ContextFor(seat);
        return snap;
    }

    auto Table::DealTo(SeatIdxT const seat, std::size_t const hand) -> void
    {
        PlayerAt(seat).AddCard(hand, shoe_.Deal());
    }

    auto Table::DealToDealer() -> void
    {
        dealer_.Add(shoe_.Deal());
    }

    auto Table::RunSetup() -> Phase
    {
        if (!CanAnySeatBet())
            BJ_THROW(error::Code::State, "No seat can cover a bet");

        ++round_number_;
        record_.reset();
        decisions_.clear();
        dealer_ = Hand{};
        dealer_initial_.clear();

        shoe_ = Shoe{cfg_.n_decks};
        shoe_.Shuffle(rng_);
        if (!stacked_.empty())
        {
            shoe_.Stack(stacked_);
            stacked_.clear();
        }

        for (Participant& p : participants_) p.ResetForRound();

        for (Participant& p : participants_)
        {
            SeatIdxT const seat = p.Seat();
            if (!CanSeatBet(seat))
            {
                std::print("[table] seat {} ({}) sits out with {} chips\n",
                           static_cast<int>(seat), p.Name(), p.Chips());
                continue;
            }
            std::vector<ChipsT> const offered = OfferedBets(p);
            ChipsT const amount = judge_.GetBet(*this, seat, offered);
            if (auto const ok = p.PlaceBet(amount); !ok)
            {
                std::print("[table] bet rejected: {}\n", error::describe(ok.error()));
                if (auto const retry = p.PlaceBet(offered.front()); !retry)
                    BJ_THROW(error::Code::State, error::describe(retry.error()));
            }
        }
        return Phase::Deal;
    }

    auto Table::RunDeal() -> Phase
    {
        for (int round{}; round < 2; ++round)
        {
            for (Participant& p : participants_)
            {
                if (p.InRound()) DealTo(p.Seat(), 0);
            }
            DealToDealer();
        }
        dealer_initial_ = dealer_.Values();
        return Phase::Insurance;
    }

    auto Table::RunInsurance() -> Phase
    {
        if (Upcard().rank != Rank::Ace) return Phase::BlackjackCheck;

        for (Participant& p : participants_)
        {
            if (!p.InRound()) continue;
            if (!judge_.GetInsurance(*this, p.Seat())) continue;
            if (auto const ok = p.PlaceInsurance(); !ok)
                std::print("[table] insurance rejected: {}\n", error::describe(ok.error()));
        }
        return Phase::BlackjackCheck;
    }

    auto Table::RunBlackjackCheck() -> Phase
    {
        unsigned const target = cfg_.blackjack_value;
        bool const dealer_bj = dealer_.IsBlackjack(target);

        for (Participant& p : participants_)
        {
            if (!p.InRound()) continue;
            bool const player_bj = p.Slot(0).hand.IsBlackjack(target);
            if (dealer_bj)
            {
                if (p.InsuranceBet() > 0) p.PayInsurance(p.InsuranceBet() * 2);
                p.SetOutcome(0, player_bj ? Outcome::Push : Outcome::Loss);
            }
            else if (player_bj)
            {
                p.SetOutcome(0, Outcome::Blackjack);
            }
        }
        return dealer_bj ? Phase::Settlement : Phase::PlayerTurns;
    }

    auto Table::PlayHand(SeatIdxT const seat, std::size_t const hand) -> void
    {
        Participant& p = PlayerAt(seat);
        while (true)
        {
            HandSlot const& s = p.Slot(hand);
            if (s.outcome || s.frozen) return;

            if (rules_->LegalDecisions(*this, seat, hand).empty())
            {
                p.SetOutcome(hand, Outcome::Bust);
                return;
            }

            std::vector<CardVal> before = s.hand.Values();
            RuledDecision const ruled = judge_.GetDecision(*this, seat, hand);
            decisions_.push_back(DecisionEntry{
                .seat = seat,
                .hand_index = static_cast<uint8_t>(hand),
                .hand = std::move(before),
                .requested = ruled.requested,
                .applied = ruled.applied
            });

            if (rules_->Apply(*this, seat, hand, ruled.applied) == TurnResult::HandEnded) return;
        }
    }

    auto Table::RunPlayerTurns() -> Phase
    {
        for (Participant& p : participants_)
        {
            if (!p.InRound() || p.Slot(0).outcome) continue;
            // hand count may grow while looping (split)
            for (std::size_t idx{}; idx < p.HandCount(); ++idx)
            {
                PlayHand(p.Seat(), idx);
            }
        }
        return Phase::DealerTurn;
    }

    auto Table::AnyHandUnresolved() const -> bool
    {
        return std::ranges::any_of(participants_, [](Participant const& p)
        {
            return std::ranges::any_of(p.Slots(), [](HandSlot const& s) { return !s.outcome.has_value(); });
        });
    }

    auto Table::RunDealerTurn() -> Phase
    {
        if (!AnyHandUnresolved()) return Phase::Outcomes;

        while (rules_->DealerDecision(*this) == Decision::Hit)
        {
            DealToDealer();
        }
        return Phase::Outcomes;
    }

    auto Table::RunOutcomes() -> Phase
    {
        unsigned const target = cfg_.blackjack_value;
        unsigned const dealer_value = dealer_.Value(target);
        bool const dealer_bust = dealer_value > target;

        for (Participant& p : participants_)
        {
            for (std::size_t i{}; i < p.HandCount(); ++i)
            {
                HandSlot const& s = p.Slot(i);
                if (s.outcome) continue;

                unsigned const v = s.hand.Value(target);
                if (v > target) p.SetOutcome(i, Outcome::Bust);
                else if (dealer_bust || v > dealer_value) p.SetOutcome(i, Outcome::Win);
                else if (v < dealer_value) p.SetOutcome(i, Outcome::Loss);
                else p.SetOutcome(i, Outcome::Push);
            }
        }
        return Phase::Settlement;
    }

    auto Table::GrossReturn(HandSlot const& slot) const -> ChipsT
    {
        BJ_ASSERT(slot.outcome.has_value(), "Settling a hand without an outcome");
        switch (*slot.outcome)
        {
        case Outcome::Blackjack:
        {
            double const ratio = slot.hand.FromSplit() ? cfg_.payout_blackjack_split : cfg_.payout_blackjack;
            return slot.bet + static_cast<ChipsT>(static_cast<double>(slot.bet) * ratio);
        }
        case Outcome::Win: return slot.bet * 2;
        case Outcome::Push: return slot.bet;
        case Outcome::Loss:
        case Outcome::Bust:
        case Outcome::Surrender: return 0;
        }
        return 0;
    }

    auto Table::RunSettlement() -> Phase
    {
        for (Participant& p : participants_)
        {
            for (std::size_t i{}; i < p.HandCount(); ++i)
            {
                ChipsT const gross = GrossReturn(p.Slot(i));
                if (gross > 0) p.Credit(i, gross);
            }
        }
        record_ = BuildRecord();
        return Phase::Done;
    }

    auto Table::BuildRecord() const -> RoundRecord
    {
        unsigned const target = cfg_.blackjack_value;
        RoundRecord rec{};
        rec.round_number = round_number_;
        rec.dealer.initial_hand = dealer_initial_;
        rec.dealer.final_hand = dealer_.Values();
        rec.dealer.final_value = dealer_.Value(target);
        rec.dealer.is_blackjack = dealer_.IsBlackjack(target);
        rec.dealer.is_busted = dealer_.IsBust(target);

        for (Participant const& p : participants_)
        {
            if (!p.InRound()) continue;

            ParticipantRecord pr{};
            pr.name = p.Name();
            pr.seat = p.Seat();
            pr.chips_before = p.ChipsBefore();
            pr.chips_after = p.Chips();
            pr.insurance_bet = p.InsuranceBet();
            pr.insurance_payout = p.InsurancePayout();

            for (HandSlot const& s : p.Slots())
            {
                BJ_ASSERT(s.outcome.has_value(), "Round ended with an unresolved hand");
                HandRecord hr{};
                hr.initial_hand = s.initial;
                hr.final_hand = s.hand.Values();
                hr.final_value = s.hand.Value(target);
                hr.bet = s.bet;
                hr.outcome = *s.outcome;
                hr.payout = s.credit + s.refund - s.bet;
                hr.is_blackjack = s.hand.IsBlackjack(target);
                hr.is_busted = s.hand.IsBust(target);
                hr.from_split = s.hand.FromSplit();
                pr.hands.push_back(std::move(hr));
            }
            rec.participants.push_back(std::move(pr));
        }
        return rec;
    }

    auto Table::Step() -> Phase
    {
        switch (phase_)
        {
        case Phase::Setup: phase_ = RunSetup(); break;
        case Phase::Deal: phase_ = RunDeal(); break;
        case Phase::Insurance: phase_ = RunInsurance(); break;
        case Phase::BlackjackCheck: phase_ = RunBlackjackCheck(); break;
        case Phase::PlayerTurns: phase_ = RunPlayerTurns(); break;
        case Phase::DealerTurn: phase_ = RunDealerTurn(); break;
        case Phase::Outcomes: phase_ = RunOutcomes(); break;
        case Phase::Settlement: phase_ = RunSettlement(); break;
        case Phase::Done: phase_ = Phase::Setup; break;
        }
        return phase_;
    }

    auto Table::PlayRound() -> RoundRecord
    {
        if (phase_ == Phase::Done) phase_ = Phase::Setup;
        BJ_ASSERT(phase_ == Phase::Setup, "PlayRound called mid-round");

        while (Step() != Phase::Done) {}

        std::optional<RoundRecord> rec = TakeRecord();
        BJ_ASSERT(rec.has_value(), "Round finished without a record");
        return std::move(*rec);
    }

    auto Table::TakeRecord() -> std::optional<RoundRecord>
    {
        std::optional<RoundRecord> out = std::move(record_);
        record_.reset();
        return out;
    }
}
