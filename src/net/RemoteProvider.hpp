//
// RemoteProvider.hpp
//

#ifndef BLACKJACKSIM_REMOTEPROVIDER_HPP
#define BLACKJACKSIM_REMOTEPROVIDER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "../core/DecisionProvider.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"
#include "codec.hpp"

namespace blackjack::net
{
    // Frames received for one seat, filled by the network thread and drained by the table thread.
    class SeatInbox
    {
    public:
        SeatInbox() = default;

        void Push(std::vector<std::uint8_t> frame)
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                q_.push_back(std::move(frame));
            }
            cv_.notify_one();
        }

        // Pop a frame until absolute deadline; returns false on timeout.
        bool PopUntil(std::vector<std::uint8_t>& out, std::chrono::steady_clock::time_point deadline)
        {
            std::unique_lock<std::mutex> lock(m_);
            while (q_.empty())
            {
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout)
                {
                    if (q_.empty()) return false;
                    break;
                }
            }
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        void Clear()
        {
            std::lock_guard<std::mutex> lock(m_);
            q_.clear();
        }

    private:
        std::mutex m_;
        std::condition_variable cv_;
        std::deque<std::vector<std::uint8_t>> q_;
    };

    // Table-side provider for a seat played over the network. Every request is sent as an
    // envelope with a fresh msg_id and answered by the reply carrying that id.
    class RemoteProvider final : public blackjack::core::DecisionProvider
    {
    public:
        // false when the frame could not be handed to the transport
        using SendFn = std::function<bool(std::span<std::byte const>)>;

        RemoteProvider(blackjack::core::SeatIdxT seat,
                       std::shared_ptr<SeatInbox> inbox,
                       SendFn send,
                       std::chrono::milliseconds timeout);

        auto ChooseBet(blackjack::core::BetRequest const& request) -> blackjack::core::ChipsT override;
        auto Decide(blackjack::core::DecisionSnapshot const& snapshot) -> blackjack::core::Decision override;
        auto DecideInsurance(blackjack::core::InsuranceSnapshot const& snapshot) -> bool override;

        blackjack::core::SeatIdxT Seat() const noexcept { return seat_; }
        std::uint64_t Failures() const noexcept { return failures_; }

    private:
        // Sends the frame and waits for the reply with the same id; nullopt on any failure.
        auto Exchange(flatbuffers::DetachedBuffer const& frame, std::uint64_t msg_id)
            -> std::optional<blackjack::core::net::DecodedReply>;

        auto Fail(char const* what) -> void;

    private:
        blackjack::core::SeatIdxT seat_{};
        std::shared_ptr<SeatInbox> inbox_;
        SendFn send_;
        std::chrono::milliseconds timeout_;
        std::uint64_t next_msg_id_{1};
        std::uint64_t failures_{0};
    };
}

#endif //BLACKJACKSIM_REMOTEPROVIDER_HPP
