//
// State.hpp
//

#ifndef BLACKJACKSIM_STATE_HPP
#define BLACKJACKSIM_STATE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"

namespace blackjack::core
{
    // Shared, immutable per-round view. Rebuilt after a split or a new card.
    struct RoundContext
    {
        uint8_t num_participants{};
        std::vector<CardVal> cards_visible;
        std::optional<uint8_t> num_hands{};
        std::optional<double> prob_hole_card_is_ten{};
    };

    using ContextSP = std::shared_ptr<RoundContext const>;

    // Immutable snapshot exposed to providers and the network (value copies only)
    struct DecisionSnapshot
    {
        SeatIdxT seat{};
        uint8_t hand_index{};
        std::vector<CardVal> hand;
        CardVal upcard{};
        std::vector<Decision> legal;
        ChipsT bet{};
        ChipsT chips{};
        ContextSP context;
    };

    struct InsuranceSnapshot
    {
        SeatIdxT seat{};
        ChipsT chips{};
        ChipsT primary_bet{};
        std::vector<CardVal> hand;
        CardVal upcard{};
        ContextSP context;
    };

    struct BetRequest
    {
        SeatIdxT seat{};
        ChipsT chips{};
        // ascending, never empty
        std::vector<ChipsT> available;
    };

    struct HandRecord
    {
        std::vector<CardVal> initial_hand;
        std::vector<CardVal> final_hand;
        unsigned final_value{};
        ChipsT bet{};
        Outcome outcome{Outcome::Loss};
        // net for this hand: credits + refunds - total staked
        ChipsT payout{};
        bool is_blackjack{false};
        bool is_busted{false};
        bool from_split{false};
    };

    struct ParticipantRecord
    {
        std::string name;
        SeatIdxT seat{};
        ChipsT chips_before{};
        ChipsT chips_after{};
        ChipsT insurance_bet{};
        ChipsT insurance_payout{};
        std::vector<HandRecord> hands;
    };

    struct DealerRecord
    {
        std::vector<CardVal> initial_hand;
        std::vector<CardVal> final_hand;
        unsigned final_value{};
        bool is_blackjack{false};
        bool is_busted{false};
    };

    struct RoundRecord
    {
        uint64_t round_number{};
        DealerRecord dealer;
        std::vector<ParticipantRecord> participants;
    };
} // namespace blackjack::core

#endif //BLACKJACKSIM_STATE_HPP
