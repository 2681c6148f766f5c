#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <span>
#include <variant>
#include <vector>

#include "../net/codec.hpp"
#include "ScriptedProvider.hpp"

using namespace blackjack::core;
using blackjack::core::test::C;
namespace fb = blackjack::gen::net;

namespace
{
    inline std::span<const std::byte> AsBytes(const flatbuffers::DetachedBuffer& buf)
    {
        return {reinterpret_cast<const std::byte*>(buf.data()), buf.size()};
    }

    inline std::span<const std::byte> AsBytes(std::vector<std::uint8_t> const& v)
    {
        return {reinterpret_cast<const std::byte*>(v.data()), v.size()};
    }

    auto SampleSnapshot() -> DecisionSnapshot
    {
        auto ctx = std::make_shared<RoundContext>();
        ctx->num_participants = 3;
        ctx->cards_visible = {C(Rank::Eight, Suit::Hearts), C(Rank::Eight, Suit::Clubs), C(Rank::Ace, Suit::Spades)};
        ctx->num_hands = 1;
        ctx->prob_hole_card_is_ten = 32.0 / 101.0;

        DecisionSnapshot s{};
        s.seat = 2;
        s.hand_index = 0;
        s.hand = {C(Rank::Eight, Suit::Hearts), C(Rank::Eight, Suit::Clubs)};
        s.upcard = C(Rank::Ace, Suit::Spades);
        s.legal = {Decision::Hit, Decision::Stand, Decision::DoubleDown, Decision::Split, Decision::Surrender};
        s.bet = 20;
        s.chips = 480;
        s.context = std::move(ctx);
        return s;
    }

    auto SampleRecord() -> RoundRecord
    {
        RoundRecord rec{};
        rec.round_number = 17;
        rec.dealer.initial_hand = {C(Rank::Six, Suit::Spades), C(Rank::King, Suit::Clubs)};
        rec.dealer.final_hand = {C(Rank::Six, Suit::Spades), C(Rank::King, Suit::Clubs), C(Rank::Seven, Suit::Spades)};
        rec.dealer.final_value = 23;
        rec.dealer.is_busted = true;

        ParticipantRecord p{};
        p.name = "basic";
        p.seat = 1;
        p.chips_before = 1000;
        p.chips_after = 1060;

        HandRecord h0{};
        h0.initial_hand = {C(Rank::Eight, Suit::Hearts), C(Rank::Three, Suit::Hearts)};
        h0.final_hand = {C(Rank::Eight, Suit::Hearts), C(Rank::Three, Suit::Hearts), C(Rank::Nine, Suit::Clubs)};
        h0.final_value = 20;
        h0.bet = 40;
        h0.outcome = Outcome::Win;
        h0.payout = 40;
        h0.from_split = true;

        HandRecord h1 = h0;
        h1.bet = 20;
        h1.payout = 20;
        h1.final_value = 18;

        p.hands = {h0, h1};
        rec.participants.push_back(std::move(p));
        return rec;
    }
}

TEST(Codec, DecisionRequestCarriesTheSnapshot)
{
    DecisionSnapshot const s = SampleSnapshot();
    auto const buf = net::BuildDecisionRequest(s, 41);

    auto const decoded = net::DecodeServerMessage(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->msg_id, 41u);

    auto const* got = std::get_if<DecisionSnapshot>(&decoded->body);
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->seat, 2u);
    EXPECT_EQ(got->hand, s.hand);
    EXPECT_EQ(got->upcard, s.upcard);
    EXPECT_EQ(got->legal, s.legal);
    EXPECT_EQ(got->bet, 20);
    EXPECT_EQ(got->chips, 480);
    ASSERT_NE(got->context, nullptr);
    EXPECT_EQ(got->context->num_participants, 3u);
    EXPECT_EQ(got->context->cards_visible, s.context->cards_visible);
    EXPECT_EQ(got->context->num_hands, std::optional<uint8_t>{1});
    ASSERT_TRUE(got->context->prob_hole_card_is_ten.has_value());
    EXPECT_DOUBLE_EQ(*got->context->prob_hole_card_is_ten, 32.0 / 101.0);
}

TEST(Codec, MissingOddsStayMissing)
{
    DecisionSnapshot s = SampleSnapshot();
    auto ctx = std::make_shared<RoundContext>(*s.context);
    ctx->prob_hole_card_is_ten.reset();
    ctx->num_hands.reset();
    s.context = ctx;

    auto const decoded = net::DecodeServerMessage(AsBytes(net::BuildDecisionRequest(s, 1)));
    ASSERT_TRUE(decoded.has_value());
    auto const& got = std::get<DecisionSnapshot>(decoded->body);
    EXPECT_FALSE(got.context->prob_hole_card_is_ten.has_value());
    EXPECT_FALSE(got.context->num_hands.has_value());
}

TEST(Codec, BetAndInsuranceRequests)
{
    BetRequest const req{.seat = 1, .chips = 75, .available = {10, 20, 50}};
    auto const bet = net::DecodeServerMessage(AsBytes(net::BuildBetRequest(req, 5)));
    ASSERT_TRUE(bet.has_value());
    auto const& got_req = std::get<BetRequest>(bet->body);
    EXPECT_EQ(got_req.seat, 1u);
    EXPECT_EQ(got_req.chips, 75);
    EXPECT_EQ(got_req.available, req.available);

    InsuranceSnapshot ins{};
    ins.seat = 1;
    ins.chips = 55;
    ins.primary_bet = 20;
    ins.hand = {C(Rank::Ten, Suit::Hearts), C(Rank::Nine, Suit::Clubs)};
    ins.upcard = C(Rank::Ace, Suit::Diamonds);
    auto const insurance = net::DecodeServerMessage(AsBytes(net::BuildInsuranceRequest(ins, 6)));
    ASSERT_TRUE(insurance.has_value());
    auto const& got_ins = std::get<InsuranceSnapshot>(insurance->body);
    EXPECT_EQ(got_ins.primary_bet, 20);
    EXPECT_EQ(got_ins.upcard, ins.upcard);
    EXPECT_EQ(got_ins.hand, ins.hand);
    EXPECT_EQ(got_ins.context, nullptr);
}

TEST(Codec, RepliesDecode)
{
    auto const d = net::DecodeReply(AsBytes(net::BuildDecisionReply(3, Decision::Split, 99)));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->msg_id, 99u);
    EXPECT_EQ(d->seat, 3u);
    EXPECT_EQ(std::get<net::DecisionAnswer>(d->answer).decision, Decision::Split);

    auto const b = net::DecodeReply(AsBytes(net::BuildBetReply(0, 50, 7)));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(std::get<net::BetAnswer>(b->answer).amount, 50);

    auto const i = net::DecodeReply(AsBytes(net::BuildInsuranceReply(0, true, 8)));
    ASSERT_TRUE(i.has_value());
    EXPECT_TRUE(std::get<net::InsuranceAnswer>(i->answer).take);
}

TEST(Codec, RequestIsNotAReply)
{
    BetRequest const req{.seat = 0, .chips = 100, .available = {10}};
    auto const r = net::DecodeReply(AsBytes(net::BuildBetRequest(req, 1)));
    ASSERT_FALSE(r.has_value());

    auto const s = net::DecodeServerMessage(AsBytes(net::BuildBetReply(0, 10, 1)));
    ASSERT_FALSE(s.has_value());
}

TEST(Codec, GarbageIsRejected)
{
    std::vector<std::uint8_t> junk(64, 0xFF);
    EXPECT_FALSE(net::DecodeReply(AsBytes(junk)).has_value());
    EXPECT_FALSE(net::DecodeServerMessage(AsBytes(junk)).has_value());

    std::vector<std::uint8_t> tiny{0x01};
    auto const r = net::DecodeReply(AsBytes(tiny));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "buffer too small");

    // a valid reply cut short
    std::vector<std::uint8_t> cut = net::BuildDecisionReply(0, Decision::Hit, 1);
    cut.resize(cut.size() / 2);
    EXPECT_FALSE(net::DecodeReply(AsBytes(cut)).has_value());
}

TEST(Codec, SchemaVersionMismatch)
{
    flatbuffers::FlatBufferBuilder fbb;
    auto const m = fb::CreateDecisionReply(fbb, 0, fb::Decision::Hit);
    auto const env = fb::CreateEnvelope(fbb, static_cast<std::uint16_t>(net::SchemaVersion + 1), 1, fb::Message::DecisionReply, m.Union());
    fbb.Finish(env);

    auto const r = net::DecodeReply(AsBytes(fbb.Release()));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "schema version mismatch");
}

TEST(Codec, TypedEnvelopeWithoutBodyIsRejected)
{
    // the verifier accepts a missing union table, so the decoders must not read through it
    auto bare = [](fb::Message const kind)
    {
        flatbuffers::FlatBufferBuilder fbb;
        fbb.Finish(fb::CreateEnvelope(fbb, net::SchemaVersion, 7, kind));
        return fbb.Release();
    };

    for (fb::Message const kind : {fb::Message::BetReply, fb::Message::InsuranceReply, fb::Message::DecisionReply})
    {
        auto const buf = bare(kind);
        auto const r = net::DecodeReply(AsBytes(buf));
        ASSERT_FALSE(r.has_value()) << fb::EnumNameMessage(kind);
        EXPECT_EQ(r.error().message, "empty message body");
    }
    for (fb::Message const kind : {fb::Message::BetRequest, fb::Message::InsuranceRequest, fb::Message::DecisionRequest})
    {
        auto const buf = bare(kind);
        auto const r = net::DecodeServerMessage(AsBytes(buf));
        ASSERT_FALSE(r.has_value()) << fb::EnumNameMessage(kind);
        EXPECT_EQ(r.error().message, "empty message body");
    }

    auto const rec = bare(fb::Message::RoundRecordMsg);
    EXPECT_FALSE(net::DecodeServerMessage(AsBytes(rec)).has_value());
    EXPECT_FALSE(net::DecodeRoundRecord(AsBytes(rec), false).has_value());
}

TEST(Codec, UnknownLegalDecisionIsRejected)
{
    flatbuffers::FlatBufferBuilder fbb;
    std::vector<std::uint8_t> const legal{0, 1, 9};
    auto const hand = fbb.CreateVector(std::vector<flatbuffers::Offset<fb::Card>>{
        fb::CreateCard(fbb, fb::Suit::Hearts, fb::Rank::Ten)});
    auto const up = fb::CreateCard(fbb, fb::Suit::Spades, fb::Rank::Six);
    auto const legal_v = fbb.CreateVector(legal);
    auto const m = fb::CreateDecisionRequest(fbb, 0, 0, hand, up, legal_v, 10, 100, 0);
    auto const env = fb::CreateEnvelope(fbb, net::SchemaVersion, 1, fb::Message::DecisionRequest, m.Union());
    fbb.Finish(env);

    EXPECT_FALSE(net::DecodeServerMessage(AsBytes(fbb.Release())).has_value());
}

TEST(Codec, RoundRecordPlainAndSizePrefixed)
{
    RoundRecord const rec = SampleRecord();

    for (bool const prefixed : {false, true})
    {
        auto const buf = net::BuildRoundRecord(rec, rec.round_number, prefixed);
        auto const got = net::DecodeRoundRecord(AsBytes(buf), prefixed);
        ASSERT_TRUE(got.has_value()) << got.error().message;

        EXPECT_EQ(got->round_number, 17u);
        EXPECT_EQ(got->dealer.final_hand, rec.dealer.final_hand);
        EXPECT_EQ(got->dealer.final_value, 23u);
        EXPECT_TRUE(got->dealer.is_busted);
        ASSERT_EQ(got->participants.size(), 1u);
        ParticipantRecord const& p = got->participants[0];
        EXPECT_EQ(p.name, "basic");
        EXPECT_EQ(p.chips_after, 1060);
        ASSERT_EQ(p.hands.size(), 2u);
        EXPECT_EQ(p.hands[0].final_hand, rec.participants[0].hands[0].final_hand);
        EXPECT_EQ(p.hands[0].bet, 40);
        EXPECT_EQ(p.hands[0].outcome, Outcome::Win);
        EXPECT_TRUE(p.hands[0].from_split);
        EXPECT_EQ(p.hands[1].payout, 20);
    }

    // the broadcast form goes through the seat-side decoder too
    auto const msg = net::DecodeServerMessage(AsBytes(net::BuildRoundRecord(rec, 3)));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->msg_id, 3u);
    EXPECT_EQ(std::get<RoundRecord>(msg->body).round_number, 17u);
}

TEST(Codec, EnumMapsAgree)
{
    for (Decision const d : {Decision::Hit, Decision::Stand, Decision::DoubleDown, Decision::Split,
                             Decision::Surrender})
    {
        EXPECT_EQ(net::FromFbDecision(net::ToFbDecision(d)), d);
    }
    for (Outcome const o : {Outcome::Win, Outcome::Loss, Outcome::Push, Outcome::Blackjack, Outcome::Bust,
                            Outcome::Surrender})
    {
        EXPECT_EQ(net::FromFbOutcome(net::ToFbOutcome(o)), o);
    }
    EXPECT_EQ(net::ToFbRank(Rank::Ace), fb::Rank::Ace);
    EXPECT_EQ(net::ToFbSuit(Suit::Clubs), fb::Suit::Clubs);
}
