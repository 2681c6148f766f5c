//
// RoundLogger.cpp
//

#include "RoundLogger.hpp"

#include <format>
#include <utility>

#include "../core/Util.hpp"

namespace
{
using namespace blackjack::core;

auto s_cards(std::vector<CardVal> const& cards) -> std::string
{
    return util::ToString(cards);
}

auto s_hand_result(HandRecord const& h) -> std::string
{
    return std::format("{} value={} bet={} outcome={} net={:+}{}",
                       s_cards(h.final_hand), h.final_value, h.bet, to_string(h.outcome), h.payout,
                       h.from_split ? " (split)" : "");
}

} // anonymous namespace

namespace blackjack::core::debug
{

RoundLogger::RoundLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

RoundLogger::~RoundLogger() = default;

auto RoundLogger::start(Table const& table, std::uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Decks={}\n", static_cast<int>(table.Settings().n_decks));
    out_ << std::format("Seats={}\n", table.SeatCount());
    for (std::size_t i{}; i < table.SeatCount(); ++i)
    {
        Participant const& p = table.SeatAt(static_cast<SeatIdxT>(i));
        out_ << std::format("  S{} {} chips={}\n", i, p.Name(), p.Chips());
    }
    out_.flush();
}

auto RoundLogger::round(Table const& table, RoundRecord const& rec) -> void
{
    out_ << std::format("Round {}\n", rec.round_number);
    out_ << std::format("Deal: dealer={}", s_cards(rec.dealer.initial_hand));
    for (ParticipantRecord const& p : rec.participants)
    {
        if (p.hands.empty()) continue;
        out_ << std::format(" S{}={}", static_cast<int>(p.seat), s_cards(p.hands.front().initial_hand));
    }
    out_ << '\n';

    for (ParticipantRecord const& p : rec.participants)
    {
        if (p.insurance_bet > 0)
            out_ << std::format("Insurance: S{} stake={} paid={}\n",
                                static_cast<int>(p.seat), p.insurance_bet, p.insurance_payout);
    }

    for (DecisionEntry const& d : table.Decisions())
    {
        if (d.requested == d.applied)
            out_ << std::format("Turn S{}.{} {} -> {}\n", static_cast<int>(d.seat),
                                static_cast<int>(d.hand_index), s_cards(d.hand), to_string(d.applied));
        else
            out_ << std::format("Turn S{}.{} {} -> {} (asked {})\n", static_cast<int>(d.seat),
                                static_cast<int>(d.hand_index), s_cards(d.hand), to_string(d.applied),
                                to_string(d.requested));
    }

    out_ << std::format("Dealer: {} value={}{}{}\n", s_cards(rec.dealer.final_hand), rec.dealer.final_value,
                        rec.dealer.is_blackjack ? " blackjack" : "", rec.dealer.is_busted ? " bust" : "");

    for (ParticipantRecord const& p : rec.participants)
    {
        for (std::size_t i{}; i < p.hands.size(); ++i)
        {
            out_ << std::format("Result S{}.{} {}\n", static_cast<int>(p.seat), i, s_hand_result(p.hands[i]));
        }
        out_ << std::format("Settle S{} {} -> {}\n", static_cast<int>(p.seat), p.chips_before, p.chips_after);
    }
}

auto RoundLogger::end(Table const& table) -> void
{
    std::string body;
    for (std::size_t i{}; i < table.SeatCount(); ++i)
    {
        body += std::format("{}{}:{}", (i ? "," : ""), i, table.SeatAt(static_cast<SeatIdxT>(i)).Chips());
    }
    out_ << std::format("Final chips=[{}]\n", body);
    out_.flush();
}

auto RoundLogger::flush() -> void
{
    out_.flush();
}

} // namespace blackjack::core::debug
