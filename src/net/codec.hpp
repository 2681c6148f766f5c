#ifndef BLACKJACKSIM_CODEC_HPP
#define BLACKJACKSIM_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/blackjack_net_generated.h"

namespace blackjack::core::net
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    // What a seat's reply decodes into
    struct BetAnswer
    {
        ChipsT amount{};
    };

    struct InsuranceAnswer
    {
        bool take{false};
    };

    struct DecisionAnswer
    {
        Decision decision{};
    };

    struct DecodedReply
    {
        std::uint64_t msg_id{};
        SeatIdxT seat{};
        std::variant<BetAnswer, InsuranceAnswer, DecisionAnswer> answer;
    };

    // What a server message decodes into, on the seat side
    struct DecodedServerMsg
    {
        std::uint64_t msg_id{};
        std::variant<BetRequest, InsuranceSnapshot, DecisionSnapshot, RoundRecord> body;
    };

    auto ToFbSuit(Suit s) noexcept -> blackjack::gen::net::Suit;
    auto ToFbRank(Rank r) noexcept -> blackjack::gen::net::Rank;
    auto ToFbDecision(Decision d) noexcept -> blackjack::gen::net::Decision;
    auto ToFbOutcome(Outcome o) noexcept -> blackjack::gen::net::Outcome;

    auto FromFbSuit(blackjack::gen::net::Suit s) noexcept -> Suit;
    auto FromFbRank(blackjack::gen::net::Rank r) noexcept -> Rank;
    auto FromFbDecision(blackjack::gen::net::Decision d) noexcept -> Decision;
    auto FromFbOutcome(blackjack::gen::net::Outcome o) noexcept -> Outcome;

    // --- Outbound builders (server → seat) ---

    auto BuildBetRequest(BetRequest const& req, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildInsuranceRequest(InsuranceSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildDecisionRequest(DecisionSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Size-prefixed records can be concatenated in a stream (history file)
    auto BuildRoundRecord(RoundRecord const& rec, std::uint64_t msg_id, bool size_prefixed = false)
        -> flatbuffers::DetachedBuffer;

    // ----- Value-based builders (FOR CLIENTS) -----

    auto BuildBetReply(SeatIdxT seat, ChipsT amount, std::uint64_t msg_id) -> std::vector<std::uint8_t>;
    auto BuildInsuranceReply(SeatIdxT seat, bool take, std::uint64_t msg_id) -> std::vector<std::uint8_t>;
    auto BuildDecisionReply(SeatIdxT seat, Decision d, std::uint64_t msg_id) -> std::vector<std::uint8_t>;

    // --- Inbound decode (verified before any field is read) ---

    auto DecodeReply(std::span<std::byte const> bytes) -> std::expected<DecodedReply, ParseError>;
    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<DecodedServerMsg, ParseError>;
    auto DecodeRoundRecord(std::span<std::byte const> bytes, bool size_prefixed = false)
        -> std::expected<RoundRecord, ParseError>;
} // namespace blackjack::core::net


#endif //BLACKJACKSIM_CODEC_HPP
