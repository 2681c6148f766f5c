//
// RecordingProvider.hpp
//

#ifndef BLACKJACKSIM_RECORDINGPROVIDER_HPP
#define BLACKJACKSIM_RECORDINGPROVIDER_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../core/DecisionProvider.hpp"
#include "../core/Table.hpp"

namespace blackjack::core::debug
{
    class RecordingProvider final : public DecisionProvider
    {
    public:
        explicit RecordingProvider(std::unique_ptr<DecisionProvider> inner)
            : inner_{std::move(inner)}
        {
        }

        auto ChooseBet(BetRequest const& request) -> ChipsT override
        {
            last_bet_ = inner_->ChooseBet(request);
            return *last_bet_;
        }

        auto Decide(DecisionSnapshot const& snapshot) -> Decision override
        {
            last_decision_ = inner_->Decide(snapshot);
            decisions_.push_back(*last_decision_);
            return *last_decision_;
        }

        auto DecideInsurance(InsuranceSnapshot const& snapshot) -> bool override
        {
            last_insurance_ = inner_->DecideInsurance(snapshot);
            return *last_insurance_;
        }

        auto LastBet() const -> std::optional<ChipsT> { return last_bet_; }
        auto LastDecision() const -> std::optional<Decision> { return last_decision_; }
        auto LastInsurance() const -> std::optional<bool> { return last_insurance_; }

        // Every decision answered since the previous drain, in order
        auto Drain() -> std::vector<Decision> { return std::exchange(decisions_, {}); }

    private:
        std::unique_ptr<DecisionProvider> inner_;
        std::optional<ChipsT> last_bet_{};
        std::optional<Decision> last_decision_{};
        std::optional<bool> last_insurance_{};
        std::vector<Decision> decisions_;
    };

    // Helper to wrap every seat's provider
    inline auto WrapRecording(std::vector<SeatSpec>& seats) -> void
    {
        for (SeatSpec& s : seats)
        {
            s.provider = std::make_unique<RecordingProvider>(std::move(s.provider));
        }
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(DecisionProvider* p) -> RecordingProvider*
    {
        return dynamic_cast<RecordingProvider*>(p);
    }
} // namespace blackjack::core::debug

#endif //BLACKJACKSIM_RECORDINGPROVIDER_HPP
