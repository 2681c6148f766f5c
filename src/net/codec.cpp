//
// codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>

namespace blackjack::core::net
{
    namespace fb = blackjack::gen::net;

    auto ToFbSuit(Suit s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case Suit::Hearts: return fb::Suit::Hearts;
        case Suit::Diamonds: return fb::Suit::Diamonds;
        case Suit::Clubs: return fb::Suit::Clubs;
        case Suit::Spades: return fb::Suit::Spades;
        }
        return fb::Suit::Hearts;
    }

    auto FromFbSuit(fb::Suit s) noexcept -> Suit
    {
        switch (s)
        {
        case fb::Suit::Hearts: return Suit::Hearts;
        case fb::Suit::Diamonds: return Suit::Diamonds;
        case fb::Suit::Clubs: return Suit::Clubs;
        case fb::Suit::Spades: return Suit::Spades;
        }
        return Suit::Hearts;
    }

    auto ToFbRank(Rank r) noexcept -> fb::Rank
    {
        switch (r)
        {
        case Rank::Two: return fb::Rank::Two;
        case Rank::Three: return fb::Rank::Three;
        case Rank::Four: return fb::Rank::Four;
        case Rank::Five: return fb::Rank::Five;
        case Rank::Six: return fb::Rank::Six;
        case Rank::Seven: return fb::Rank::Seven;
        case Rank::Eight: return fb::Rank::Eight;
        case Rank::Nine: return fb::Rank::Nine;
        case Rank::Ten: return fb::Rank::Ten;
        case Rank::Jack: return fb::Rank::Jack;
        case Rank::Queen: return fb::Rank::Queen;
        case Rank::King: return fb::Rank::King;
        case Rank::Ace: return fb::Rank::Ace;
        }
        return fb::Rank::Two;
    }

    auto FromFbRank(fb::Rank r) noexcept -> Rank
    {
        switch (r)
        {
        case fb::Rank::Two: return Rank::Two;
        case fb::Rank::Three: return Rank::Three;
        case fb::Rank::Four: return Rank::Four;
        case fb::Rank::Five: return Rank::Five;
        case fb::Rank::Six: return Rank::Six;
        case fb::Rank::Seven: return Rank::Seven;
        case fb::Rank::Eight: return Rank::Eight;
        case fb::Rank::Nine: return Rank::Nine;
        case fb::Rank::Ten: return Rank::Ten;
        case fb::Rank::Jack: return Rank::Jack;
        case fb::Rank::Queen: return Rank::Queen;
        case fb::Rank::King: return Rank::King;
        case fb::Rank::Ace: return Rank::Ace;
        }
        return Rank::Two;
    }

    auto ToFbDecision(Decision d) noexcept -> fb::Decision
    {
        switch (d)
        {
        case Decision::Hit: return fb::Decision::Hit;
        case Decision::Stand: return fb::Decision::Stand;
        case Decision::DoubleDown: return fb::Decision::DoubleDown;
        case Decision::Split: return fb::Decision::Split;
        case Decision::Surrender: return fb::Decision::Surrender;
        }
        return fb::Decision::Stand;
    }

    // Unknown values from the wire read as Stand
    auto FromFbDecision(fb::Decision d) noexcept -> Decision
    {
        switch (d)
        {
        case fb::Decision::Hit: return Decision::Hit;
        case fb::Decision::Stand: return Decision::Stand;
        case fb::Decision::DoubleDown: return Decision::DoubleDown;
        case fb::Decision::Split: return Decision::Split;
        case fb::Decision::Surrender: return Decision::Surrender;
        }
        return Decision::Stand;
    }

    auto ToFbOutcome(Outcome o) noexcept -> fb::Outcome
    {
        switch (o)
        {
        case Outcome::Win: return fb::Outcome::Win;
        case Outcome::Loss: return fb::Outcome::Loss;
        case Outcome::Push: return fb::Outcome::Push;
        case Outcome::Blackjack: return fb::Outcome::Blackjack;
        case Outcome::Bust: return fb::Outcome::Bust;
        case Outcome::Surrender: return fb::Outcome::Surrender;
        }
        return fb::Outcome::Loss;
    }

    auto FromFbOutcome(fb::Outcome o) noexcept -> Outcome
    {
        switch (o)
        {
        case fb::Outcome::Win: return Outcome::Win;
        case fb::Outcome::Loss: return Outcome::Loss;
        case fb::Outcome::Push: return Outcome::Push;
        case fb::Outcome::Blackjack: return Outcome::Blackjack;
        case fb::Outcome::Bust: return Outcome::Bust;
        case fb::Outcome::Surrender: return Outcome::Surrender;
        }
        return Outcome::Loss;
    }
}

namespace
{
    namespace fb = blackjack::gen::net;
    using namespace blackjack::core;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(Suit::Spades) == static_cast<int>(fb::Suit::Spades));
    static_assert(static_cast<int>(Rank::Ace) == static_cast<int>(fb::Rank::Ace));
    static_assert(static_cast<int>(Decision::Surrender) == static_cast<int>(fb::Decision::Surrender));
    static_assert(static_cast<int>(Outcome::Surrender) == static_cast<int>(fb::Outcome::Surrender));

    using CardOffsets = std::vector<flatbuffers::Offset<fb::Card>>;

    auto ToFbCard(flatbuffers::FlatBufferBuilder& fbb, CardVal const cv) -> flatbuffers::Offset<fb::Card>
    {
        return fb::CreateCard(fbb, net::ToFbSuit(cv.suit), net::ToFbRank(cv.rank));
    }

    auto ToFbCards(flatbuffers::FlatBufferBuilder& fbb, std::vector<CardVal> const& cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Card>>>
    {
        CardOffsets vec;
        vec.reserve(cards.size());
        for (CardVal const cv : cards) vec.push_back(ToFbCard(fbb, cv));
        return fbb.CreateVector(vec);
    }

    auto ToFbContext(flatbuffers::FlatBufferBuilder& fbb, ContextSP const& ctx) -> flatbuffers::Offset<fb::Context>
    {
        if (!ctx) return 0;
        auto const visible = ToFbCards(fbb, ctx->cards_visible);
        return fb::CreateContext(
            fbb,
            /*num_participants*/ ctx->num_participants,
            /*cards_visible*/ visible,
            /*num_hands*/ ctx->num_hands.value_or(0),
            /*has_prob_hole_ten*/ ctx->prob_hole_card_is_ten.has_value(),
            /*prob_hole_ten*/ ctx->prob_hole_card_is_ten.value_or(0.0));
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t msg_id, fb::Message type,
                flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, net::SchemaVersion, msg_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    auto ToBytes(flatbuffers::FlatBufferBuilder const& fbb) -> std::vector<std::uint8_t>
    {
        std::vector<std::uint8_t> out(fbb.GetSize());
        std::memcpy(out.data(), fbb.GetBufferPointer(), fbb.GetSize());
        return out;
    }

    auto FromFbCard(fb::Card const* c) -> CardVal
    {
        return CardVal{net::FromFbSuit(c->suit()), net::FromFbRank(c->rank())};
    }

    auto FromFbCards(flatbuffers::Vector<flatbuffers::Offset<fb::Card>> const* v) -> std::vector<CardVal>
    {
        std::vector<CardVal> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* c : *v) out.push_back(FromFbCard(c));
        return out;
    }

    auto FromFbContext(fb::Context const* c) -> ContextSP
    {
        if (!c) return nullptr;
        auto ctx = std::make_shared<RoundContext>();
        ctx->num_participants = c->num_participants();
        ctx->cards_visible = FromFbCards(c->cards_visible());
        if (c->num_hands() > 0) ctx->num_hands = c->num_hands();
        if (c->has_prob_hole_ten()) ctx->prob_hole_card_is_ten = c->prob_hole_ten();
        return ctx;
    }

    auto VerifiedEnvelope(std::span<std::byte const> bytes, bool size_prefixed)
        -> std::expected<fb::Envelope const*, net::ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(net::ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        bool const ok = size_prefixed ? fb::VerifySizePrefixedEnvelopeBuffer(verifier)
                                      : fb::VerifyEnvelopeBuffer(verifier);
        if (!ok)
            return std::unexpected(net::ParseError{"verification failed"});

        fb::Envelope const* env = size_prefixed ? fb::GetSizePrefixedEnvelope(data) : fb::GetEnvelope(data);
        if (env->schema_version() != net::SchemaVersion)
            return std::unexpected(net::ParseError{"schema version mismatch"});
        return env;
    }

    auto DecodeRecordBody(fb::RoundRecordMsg const* m) -> std::expected<RoundRecord, net::ParseError>
    {
        if (!m || !m->dealer())
            return std::unexpected(net::ParseError{"round record without dealer"});

        RoundRecord rec{};
        rec.round_number = m->round_number();

        fb::DealerRecord const* d = m->dealer();
        rec.dealer.initial_hand = FromFbCards(d->initial_hand());
        rec.dealer.final_hand = FromFbCards(d->final_hand());
        rec.dealer.final_value = d->final_value();
        rec.dealer.is_blackjack = d->is_blackjack();
        rec.dealer.is_busted = d->is_busted();

        if (auto const* parts = m->participants())
        {
            rec.participants.reserve(parts->size());
            for (auto const* p : *parts)
            {
                ParticipantRecord pr{};
                pr.name = p->name() ? p->name()->str() : std::string{};
                pr.seat = p->seat();
                pr.chips_before = p->chips_before();
                pr.chips_after = p->chips_after();
                pr.insurance_bet = p->insurance_bet();
                pr.insurance_payout = p->insurance_payout();
                if (auto const* hands = p->hands())
                {
                    for (auto const* h : *hands)
                    {
                        HandRecord hr{};
                        hr.initial_hand = FromFbCards(h->initial_hand());
                        hr.final_hand = FromFbCards(h->final_hand());
                        hr.final_value = h->final_value();
                        hr.bet = h->bet();
                        hr.outcome = net::FromFbOutcome(h->outcome());
                        hr.payout = h->payout();
                        hr.is_blackjack = h->is_blackjack();
                        hr.is_busted = h->is_busted();
                        hr.from_split = h->from_split();
                        pr.hands.push_back(std::move(hr));
                    }
                }
                rec.participants.push_back(std::move(pr));
            }
        }
        return rec;
    }
} // anonymous

namespace blackjack::core::net
{
    // ---------- Requests (server → seat) ----------

    auto BuildBetRequest(BetRequest const& req, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const avail = fbb.CreateVector(req.available);
        auto const m = fb::CreateBetRequest(fbb, req.seat, req.chips, avail);
        return Finish(fbb, msg_id, fb::Message::BetRequest, m.Union());
    }

    auto BuildInsuranceRequest(InsuranceSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const hand = ToFbCards(fbb, snap.hand);
        auto const up = ToFbCard(fbb, snap.upcard);
        auto const ctx = ToFbContext(fbb, snap.context);
        auto const m = fb::CreateInsuranceRequest(fbb, snap.seat, snap.chips, snap.primary_bet, hand, up, ctx);
        return Finish(fbb, msg_id, fb::Message::InsuranceRequest, m.Union());
    }

    auto BuildDecisionRequest(DecisionSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const hand = ToFbCards(fbb, snap.hand);
        auto const up = ToFbCard(fbb, snap.upcard);

        std::vector<std::uint8_t> legal;
        legal.reserve(snap.legal.size());
        for (Decision const d : snap.legal) legal.push_back(static_cast<std::uint8_t>(ToFbDecision(d)));
        auto const legal_vec = fbb.CreateVector(legal);

        auto const ctx = ToFbContext(fbb, snap.context);
        auto const m = fb::CreateDecisionRequest(
            fbb,
            /*seat*/ snap.seat,
            /*hand_index*/ snap.hand_index,
            /*hand*/ hand,
            /*upcard*/ up,
            /*legal*/ legal_vec,
            /*bet*/ snap.bet,
            /*chips*/ snap.chips,
            /*context*/ ctx);
        return Finish(fbb, msg_id, fb::Message::DecisionRequest, m.Union());
    }

    auto BuildRoundRecord(RoundRecord const& rec, std::uint64_t msg_id, bool size_prefixed)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const d_init = ToFbCards(fbb, rec.dealer.initial_hand);
        auto const d_final = ToFbCards(fbb, rec.dealer.final_hand);
        auto const dealer = fb::CreateDealerRecord(fbb, d_init, d_final, rec.dealer.final_value,
                                                   rec.dealer.is_blackjack, rec.dealer.is_busted);

        std::vector<flatbuffers::Offset<fb::ParticipantRecord>> parts;
        parts.reserve(rec.participants.size());
        for (ParticipantRecord const& p : rec.participants)
        {
            std::vector<flatbuffers::Offset<fb::HandRecord>> hands;
            hands.reserve(p.hands.size());
            for (HandRecord const& h : p.hands)
            {
                auto const init = ToFbCards(fbb, h.initial_hand);
                auto const fin = ToFbCards(fbb, h.final_hand);
                hands.push_back(fb::CreateHandRecord(
                    fbb,
                    /*initial_hand*/ init,
                    /*final_hand*/ fin,
                    /*final_value*/ h.final_value,
                    /*bet*/ h.bet,
                    /*outcome*/ ToFbOutcome(h.outcome),
                    /*payout*/ h.payout,
                    /*is_blackjack*/ h.is_blackjack,
                    /*is_busted*/ h.is_busted,
                    /*from_split*/ h.from_split));
            }
            auto const name = fbb.CreateString(p.name);
            auto const hands_vec = fbb.CreateVector(hands);
            parts.push_back(fb::CreateParticipantRecord(
                fbb, name, p.seat, p.chips_before, p.chips_after,
                p.insurance_bet, p.insurance_payout, hands_vec));
        }
        auto const parts_vec = fbb.CreateVector(parts);
        auto const m = fb::CreateRoundRecordMsg(fbb, rec.round_number, dealer, parts_vec);

        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, msg_id, fb::Message::RoundRecordMsg, m.Union());
        if (size_prefixed) fbb.FinishSizePrefixed(env);
        else fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Replies (seat → server) ----------

    auto BuildBetReply(SeatIdxT seat, ChipsT amount, std::uint64_t msg_id) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateBetReply(fbb, seat, amount);
        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, msg_id, fb::Message::BetReply, m.Union());
        fbb.Finish(env);
        return ToBytes(fbb);
    }

    auto BuildInsuranceReply(SeatIdxT seat, bool take, std::uint64_t msg_id) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateInsuranceReply(fbb, seat, take);
        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, msg_id, fb::Message::InsuranceReply, m.Union());
        fbb.Finish(env);
        return ToBytes(fbb);
    }

    auto BuildDecisionReply(SeatIdxT seat, Decision d, std::uint64_t msg_id) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = fb::CreateDecisionReply(fbb, seat, ToFbDecision(d));
        auto const env = fb::CreateEnvelope(fbb, SchemaVersion, msg_id, fb::Message::DecisionReply, m.Union());
        fbb.Finish(env);
        return ToBytes(fbb);
    }

    // ---------- Decode ----------

    auto DecodeReply(std::span<std::byte const> bytes) -> std::expected<DecodedReply, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes, false);
        if (!env) return std::unexpected(env.error());

        DecodedReply out{};
        out.msg_id = (*env)->msg_id();

        switch ((*env)->message_type())
        {
        case fb::Message::BetReply:
        {
            auto const* r = (*env)->message_as_BetReply();
            if (!r) return std::unexpected(ParseError{"empty message body"});
            out.seat = r->seat();
            out.answer = BetAnswer{r->amount()};
            return out;
        }
        case fb::Message::InsuranceReply:
        {
            auto const* r = (*env)->message_as_InsuranceReply();
            if (!r) return std::unexpected(ParseError{"empty message body"});
            out.seat = r->seat();
            out.answer = InsuranceAnswer{r->take()};
            return out;
        }
        case fb::Message::DecisionReply:
        {
            auto const* r = (*env)->message_as_DecisionReply();
            if (!r) return std::unexpected(ParseError{"empty message body"});
            out.seat = r->seat();
            out.answer = DecisionAnswer{FromFbDecision(r->decision())};
            return out;
        }
        default:
            return std::unexpected(ParseError{"not a reply"});
        }
    }

    auto DecodeServerMessage(std::span<std::byte const> bytes) -> std::expected<DecodedServerMsg, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes, false);
        if (!env) return std::unexpected(env.error());

        DecodedServerMsg out{};
        out.msg_id = (*env)->msg_id();

        switch ((*env)->message_type())
        {
        case fb::Message::BetRequest:
        {
            auto const* r = (*env)->message_as_BetRequest();
            if (!r) return std::unexpected(ParseError{"empty message body"});
            BetRequest req{ .seat = r->seat(), .chips = r->chips() };
            if (auto const* v = r->available())
                for (std::int64_t const a : *v) req.available.push_back(a);
            out.body = std::move(req);
            return out;
        }
        case fb::Message::InsuranceRequest:
        {
            auto const* r = (*env)->message_as_InsuranceRequest();
            if (!r) return std::unexpected(ParseError{"empty message body"});
            if (!r->upcard()) return std::unexpected(ParseError{"insurance request without upcard"});
            InsuranceSnapshot snap{};
            snap.seat = r->seat();
            snap.chips = r->chips();
            snap.primary_bet = r->primary_bet();
            snap.hand = FromFbCards(r->hand());
            snap.upcard = FromFbCard(r->upcard());
            snap.context = FromFbContext(r->context());
            out.body = std::move(snap);
            return out;
        }
        case fb::Message::DecisionRequest:
        {
            auto const* r = (*env)->message_as_DecisionRequest();
            if (!r) return std::unexpected(ParseError{"empty message body"});
            if (!r->upcard()) return std::unexpected(ParseError{"decision request without upcard"});
            DecisionSnapshot snap{};
            snap.seat = r->seat();
            snap.hand_index = r->hand_index();
            snap.hand = FromFbCards(r->hand());
            snap.upcard = FromFbCard(r->upcard());
            if (auto const* v = r->legal())
            {
                for (std::uint8_t const raw : *v)
                {
                    if (raw > static_cast<std::uint8_t>(Decision::Surrender))
                        return std::unexpected(ParseError{"unknown decision in legal set"});
                    snap.legal.push_back(static_cast<Decision>(raw));
                }
            }
            snap.bet = r->bet();
            snap.chips = r->chips();
            snap.context = FromFbContext(r->context());
            out.body = std::move(snap);
            return out;
        }
        case fb::Message::RoundRecordMsg:
        {
            auto rec = DecodeRecordBody((*env)->message_as_RoundRecordMsg());
            if (!rec) return std::unexpected(rec.error());
            out.body = std::move(*rec);
            return out;
        }
        default:
            return std::unexpected(ParseError{"not a server message"});
        }
    }

    auto DecodeRoundRecord(std::span<std::byte const> bytes, bool size_prefixed)
        -> std::expected<RoundRecord, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes, size_prefixed);
        if (!env) return std::unexpected(env.error());
        if ((*env)->message_type() != fb::Message::RoundRecordMsg)
            return std::unexpected(ParseError{"not a RoundRecordMsg"});
        return DecodeRecordBody((*env)->message_as_RoundRecordMsg());
    }
} // namespace blackjack::core::net
