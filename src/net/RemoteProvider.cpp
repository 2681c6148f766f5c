//
// RemoteProvider.cpp
//

#include "RemoteProvider.hpp"

#include <print>
#include <utility>
#include <variant>

namespace blackjack::net
{
    namespace core = blackjack::core;

    RemoteProvider::RemoteProvider(core::SeatIdxT seat,
                                   std::shared_ptr<SeatInbox> inbox,
                                   SendFn send,
                                   std::chrono::milliseconds timeout)
        : seat_{seat}
          , inbox_{std::move(inbox)}
          , send_{std::move(send)}
          , timeout_{timeout}
    {
    }

    auto RemoteProvider::Fail(char const* what) -> void
    {
        ++failures_;
        std::print("[seat {}] {} -> default\n", static_cast<int>(seat_), what);
    }

    auto RemoteProvider::Exchange(flatbuffers::DetachedBuffer const& frame, std::uint64_t msg_id)
        -> std::optional<core::net::DecodedReply>
    {
        std::span<std::byte const> out{reinterpret_cast<std::byte const*>(frame.data()), frame.size()};
        if (!send_ || !send_(out))
        {
            Fail("send failed");
            return std::nullopt;
        }

        auto const deadline = std::chrono::steady_clock::now() + timeout_;
        std::vector<std::uint8_t> in;
        while (inbox_->PopUntil(in, deadline))
        {
            std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(in.data()), in.size()};
            auto parsed = core::net::DecodeReply(bytes);
            if (!parsed.has_value())
            {
                std::print("[seat {}] Parse error: {}\n", static_cast<int>(seat_), parsed.error().message);
                Fail("undecodable reply");
                return std::nullopt;
            }
            // Late answer to a request that already timed out
            if (parsed->msg_id < msg_id)
            {
                std::print("[seat {}] Dropping stale reply {}\n", static_cast<int>(seat_), parsed->msg_id);
                continue;
            }
            if (parsed->msg_id != msg_id)
            {
                Fail("reply id mismatch");
                return std::nullopt;
            }
            // Seat spoofing guard
            if (parsed->seat != seat_)
            {
                std::print("[seat {}] Spoofed seat {} -> rejected\n",
                           static_cast<int>(seat_), static_cast<int>(parsed->seat));
                Fail("wrong seat");
                return std::nullopt;
            }
            return std::move(*parsed);
        }

        Fail("timeout");
        return std::nullopt;
    }

    auto RemoteProvider::ChooseBet(core::BetRequest const& request) -> core::ChipsT
    {
        core::ChipsT const fallback = request.available.empty() ? core::ChipsT{0} : request.available.front();

        std::uint64_t const id = next_msg_id_++;
        auto const reply = Exchange(core::net::BuildBetRequest(request, id), id);
        if (!reply) return fallback;

        if (auto const* a = std::get_if<core::net::BetAnswer>(&reply->answer))
        {
            return a->amount;
        }
        Fail("unexpected reply to bet request");
        return fallback;
    }

    auto RemoteProvider::Decide(core::DecisionSnapshot const& snapshot) -> core::Decision
    {
        std::uint64_t const id = next_msg_id_++;
        auto const reply = Exchange(core::net::BuildDecisionRequest(snapshot, id), id);
        if (!reply) return core::Decision::Stand;

        if (auto const* a = std::get_if<core::net::DecisionAnswer>(&reply->answer))
        {
            return a->decision;
        }
        Fail("unexpected reply to decision request");
        return core::Decision::Stand;
    }

    auto RemoteProvider::DecideInsurance(core::InsuranceSnapshot const& snapshot) -> bool
    {
        std::uint64_t const id = next_msg_id_++;
        auto const reply = Exchange(core::net::BuildInsuranceRequest(snapshot, id), id);
        if (!reply) return false;

        if (auto const* a = std::get_if<core::net::InsuranceAnswer>(&reply->answer))
        {
            return a->take;
        }
        Fail("unexpected reply to insurance request");
        return false;
    }
}
