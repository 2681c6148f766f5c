//
// Exception.hpp
//

#ifndef BLACKJACKSIM_EXCEPTION_HPP
#define BLACKJACKSIM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace blackjack::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a provider's illegal choice)
        State, // table state misuse (dealing from empty shoe, no seated players)
        InvalidAction, // decision cannot be applied to the hand
        Timeout, // deadline exceeded for IO or a remote answer
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    inline auto to_string(Code const c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "Unknown";
        case Code::Rules: return "Rules";
        case Code::State: return "State";
        case Code::InvalidAction: return "InvalidAction";
        case Code::Timeout: return "Timeout";
        case Code::Network: return "Network";
        case Code::Serialization: return "Serialization";
        case Code::Assertion: return "Assertion";
        }
        return "Unknown";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define BJ_THROW(code_enum, msg) ::blackjack::core::error::fail((code_enum), (msg))
#define BJ_ASSERT(cond, msg) do { if(!(cond)) ::blackjack::core::error::fail(::blackjack::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by operation.
    enum class RuleViolationCode : std::uint16_t
    {
        // Betting
        Bet_NotPositive,
        Bet_ExceedsChips,
        Bet_AlreadyPlaced,

        // Hand state
        Hand_NoSuchHand,
        Hand_AlreadyResolved,
        Hand_Frozen,
        Hand_Busted,

        // Split
        Split_NotFirstAction,
        Split_NotPair,
        Split_AlreadySplit,
        Split_InsufficientChips,

        // Double down
        Double_NotFirstAction,
        Double_InsufficientChips,

        // Surrender
        Surrender_NotFirstAction,

        // Insurance
        Insurance_NoPrimaryBet,
        Insurance_AlreadyPlaced,
        Insurance_InsufficientChips,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<SeatIdxT> seat{};
        std::optional<std::uint8_t> hand_index{};
        std::optional<Decision> decision{};

        std::optional<ChipsT> bet{};   // bet or side-bet involved
        std::optional<ChipsT> chips{};  // balance at the time
        std::optional<std::uint8_t> card_count{};

        std::optional<Rank> rank{};

        auto with_seat(SeatIdxT s) -> RuleViolation&
        {
            seat = s;
            return *this;
        }

        auto with_hand(std::uint8_t h) -> RuleViolation&
        {
            hand_index = h;
            return *this;
        }

        auto with_decision(Decision d) -> RuleViolation&
        {
            decision = d;
            return *this;
        }

        auto with_bet(ChipsT v) -> RuleViolation&
        {
            bet = v;
            return *this;
        }

        auto with_chips(ChipsT v) -> RuleViolation&
        {
            chips = v;
            return *this;
        }

        auto with_cards(std::uint8_t v) -> RuleViolation&
        {
            card_count = v;
            return *this;
        }

        auto with_rank(Rank r) -> RuleViolation&
        {
            rank = r;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Bet_NotPositive: return "Bet: amount must be positive";
        case E::Bet_ExceedsChips: return "Bet: amount exceeds chips";
        case E::Bet_AlreadyPlaced: return "Bet: already placed this round";

        case E::Hand_NoSuchHand: return "Hand: index out of range";
        case E::Hand_AlreadyResolved: return "Hand: outcome already assigned";
        case E::Hand_Frozen: return "Hand: frozen after split aces";
        case E::Hand_Busted: return "Hand: busted";

        case E::Split_NotFirstAction: return "Split: only allowed on the first two cards";
        case E::Split_NotPair: return "Split: cards are not a pair";
        case E::Split_AlreadySplit: return "Split: participant already holds more than one hand";
        case E::Split_InsufficientChips: return "Split: chips do not cover the matching bet";

        case E::Double_NotFirstAction: return "Double: only allowed on the first two cards";
        case E::Double_InsufficientChips: return "Double: chips do not cover the extra bet";

        case E::Surrender_NotFirstAction: return "Surrender: only allowed on the first two cards";

        case E::Insurance_NoPrimaryBet: return "Insurance: no primary bet";
        case E::Insurance_AlreadyPlaced: return "Insurance: already placed";
        case E::Insurance_InsufficientChips: return "Insurance: chips do not cover half the bet";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.seat) s += std::format(" | seat={}", static_cast<int>(*v.seat));
        if (v.hand_index) s += std::format(" | hand={}", static_cast<int>(*v.hand_index));
        if (v.decision) s += std::format(" | decision={}", to_string(*v.decision));
        if (v.bet) s += std::format(" | bet={}", *v.bet);
        if (v.chips) s += std::format(" | chips={}", *v.chips);
        if (v.card_count) s += std::format(" | cards={}", static_cast<int>(*v.card_count));
        if (v.rank) s += std::format(" | rank={}", static_cast<int>(std::to_underlying(*v.rank)));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //BLACKJACKSIM_EXCEPTION_HPP
