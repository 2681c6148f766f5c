#include <gtest/gtest.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <thread>
#include <variant>
#include <vector>

#include "../net/RemoteProvider.hpp"
#include "../net/codec.hpp"
#include "ScriptedProvider.hpp"

using namespace blackjack::core;
using blackjack::core::test::C;
using blackjack::net::RemoteProvider;
using blackjack::net::SeatInbox;
using namespace std::chrono_literals;

namespace
{
    using Reply = std::function<std::vector<std::uint8_t>(net::DecodedServerMsg const&)>;

    // Stands in for the transport: decodes the request and queues the seat's answer.
    struct FakeSeat
    {
        std::shared_ptr<SeatInbox> inbox = std::make_shared<SeatInbox>();
        std::vector<net::DecodedServerMsg> requests;
        Reply reply;

        auto Sender() -> RemoteProvider::SendFn
        {
            return [this](std::span<std::byte const> bytes)
            {
                auto msg = net::DecodeServerMessage(bytes);
                if (!msg) return false;
                requests.push_back(*msg);
                if (reply) inbox->Push(reply(*msg));
                return true;
            };
        }
    };

    auto Snap() -> DecisionSnapshot
    {
        DecisionSnapshot s{};
        s.seat = 1;
        s.hand = {C(Rank::Ten, Suit::Hearts), C(Rank::Six, Suit::Clubs)};
        s.upcard = C(Rank::Nine, Suit::Spades);
        s.legal = {Decision::Hit, Decision::Stand, Decision::DoubleDown, Decision::Surrender};
        s.bet = 20;
        s.chips = 200;
        return s;
    }

    auto Insurance() -> InsuranceSnapshot
    {
        InsuranceSnapshot s{};
        s.seat = 1;
        s.chips = 200;
        s.primary_bet = 20;
        s.hand = {C(Rank::Ten, Suit::Hearts), C(Rank::Six, Suit::Clubs)};
        s.upcard = C(Rank::Ace, Suit::Spades);
        return s;
    }

    BetRequest const Bets{.seat = 1, .chips = 200, .available = {10, 20, 50}};
}

TEST(RemoteProvider, AnswersComeBackByMessageId)
{
    FakeSeat seat{};
    seat.reply = [](net::DecodedServerMsg const& m) -> std::vector<std::uint8_t>
    {
        if (std::holds_alternative<BetRequest>(m.body)) return net::BuildBetReply(1, 50, m.msg_id);
        if (std::holds_alternative<InsuranceSnapshot>(m.body)) return net::BuildInsuranceReply(1, true, m.msg_id);
        return net::BuildDecisionReply(1, Decision::Surrender, m.msg_id);
    };
    RemoteProvider remote(1, seat.inbox, seat.Sender(), 500ms);

    EXPECT_EQ(remote.ChooseBet(Bets), 50);
    EXPECT_TRUE(remote.DecideInsurance(Insurance()));
    EXPECT_EQ(remote.Decide(Snap()), Decision::Surrender);
    EXPECT_EQ(remote.Failures(), 0u);

    ASSERT_EQ(seat.requests.size(), 3u);
    EXPECT_EQ(seat.requests[0].msg_id, 1u);
    EXPECT_EQ(seat.requests[1].msg_id, 2u);
    EXPECT_EQ(seat.requests[2].msg_id, 3u);
    auto const& snap = std::get<DecisionSnapshot>(seat.requests[2].body);
    EXPECT_EQ(snap.legal, Snap().legal);
}

TEST(RemoteProvider, SilenceTimesOutToDefaults)
{
    FakeSeat seat{};
    RemoteProvider remote(1, seat.inbox, seat.Sender(), 20ms);

    EXPECT_EQ(remote.Decide(Snap()), Decision::Stand);
    EXPECT_EQ(remote.Failures(), 1u);
    EXPECT_EQ(remote.ChooseBet(Bets), 10);
    EXPECT_FALSE(remote.DecideInsurance(Insurance()));
    EXPECT_EQ(remote.Failures(), 3u);
}

TEST(RemoteProvider, LateReplyIsDroppedNotMistaken)
{
    FakeSeat seat{};
    RemoteProvider remote(1, seat.inbox, seat.Sender(), 20ms);

    // request 1 goes unanswered
    EXPECT_EQ(remote.Decide(Snap()), Decision::Stand);

    // the late answer to 1 lands just before the answer to 2
    seat.reply = [&](net::DecodedServerMsg const& m) -> std::vector<std::uint8_t>
    {
        seat.inbox->Push(net::BuildDecisionReply(1, Decision::Hit, 1));
        return net::BuildDecisionReply(1, Decision::DoubleDown, m.msg_id);
    };
    EXPECT_EQ(remote.Decide(Snap()), Decision::DoubleDown);
    EXPECT_EQ(remote.Failures(), 1u);
}

TEST(RemoteProvider, WrongSeatOrWrongKindFallsBack)
{
    FakeSeat seat{};
    seat.reply = [](net::DecodedServerMsg const& m) { return net::BuildDecisionReply(4, Decision::Hit, m.msg_id); };
    RemoteProvider remote(1, seat.inbox, seat.Sender(), 200ms);
    EXPECT_EQ(remote.Decide(Snap()), Decision::Stand);
    EXPECT_EQ(remote.Failures(), 1u);

    // a decision reply to a bet request
    seat.reply = [](net::DecodedServerMsg const& m) { return net::BuildDecisionReply(1, Decision::Hit, m.msg_id); };
    EXPECT_EQ(remote.ChooseBet(Bets), 10);
    EXPECT_EQ(remote.Failures(), 2u);
}

TEST(RemoteProvider, GarbageAndSendFailure)
{
    FakeSeat seat{};
    seat.reply = [](net::DecodedServerMsg const&) { return std::vector<std::uint8_t>(32, 0xAB); };
    RemoteProvider remote(1, seat.inbox, seat.Sender(), 200ms);
    EXPECT_EQ(remote.Decide(Snap()), Decision::Stand);
    EXPECT_EQ(remote.Failures(), 1u);

    RemoteProvider unplugged(1, std::make_shared<SeatInbox>(),
                             [](std::span<std::byte const>) { return false; }, 200ms);
    EXPECT_EQ(unplugged.ChooseBet(Bets), 10);
    EXPECT_EQ(unplugged.Failures(), 1u);
}

TEST(RemoteProvider, ReplyWithoutBodyFallsBack)
{
    FakeSeat seat{};
    seat.reply = [](net::DecodedServerMsg const& m)
    {
        flatbuffers::FlatBufferBuilder fbb;
        fbb.Finish(blackjack::gen::net::CreateEnvelope(fbb, net::SchemaVersion, m.msg_id,
                                                       blackjack::gen::net::Message::DecisionReply));
        return std::vector<std::uint8_t>(fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize());
    };
    RemoteProvider remote(1, seat.inbox, seat.Sender(), 200ms);
    EXPECT_EQ(remote.Decide(Snap()), Decision::Stand);
    EXPECT_EQ(remote.Failures(), 1u);
}

TEST(RemoteProvider, ReplyFromAnotherThread)
{
    auto inbox = std::make_shared<SeatInbox>();
    std::vector<std::thread> workers;
    RemoteProvider remote(1, inbox, [&](std::span<std::byte const> bytes)
    {
        auto msg = net::DecodeServerMessage(bytes);
        if (!msg) return false;
        std::uint64_t const id = msg->msg_id;
        workers.emplace_back([inbox, id]
        {
            std::this_thread::sleep_for(5ms);
            inbox->Push(net::BuildDecisionReply(1, Decision::Hit, id));
        });
        return true;
    }, 2000ms);

    EXPECT_EQ(remote.Decide(Snap()), Decision::Hit);
    for (std::thread& t : workers) t.join();
    EXPECT_EQ(remote.Failures(), 0u);
}

TEST(SeatInbox, PopHonoursDeadline)
{
    SeatInbox inbox{};
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(inbox.PopUntil(out, std::chrono::steady_clock::now() + 5ms));

    inbox.Push({1, 2, 3});
    inbox.Push({4});
    ASSERT_TRUE(inbox.PopUntil(out, std::chrono::steady_clock::now() + 5ms));
    EXPECT_EQ(out, (std::vector<std::uint8_t>{1, 2, 3}));

    inbox.Clear();
    EXPECT_FALSE(inbox.PopUntil(out, std::chrono::steady_clock::now() + 5ms));
}
