//
// RoundLogger.hpp
//

#ifndef BLACKJACKSIM_ROUNDLOGGER_HPP
#define BLACKJACKSIM_ROUNDLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Table.hpp"
#include "../core/State.hpp"

namespace blackjack::core::debug
{
    // Plain-text transcript of a session, one block per round.
    class RoundLogger
    {
    public:
        explicit RoundLogger(std::string path);
        ~RoundLogger();

        RoundLogger(RoundLogger const&) = delete;
        auto operator=(RoundLogger const&) -> RoundLogger& = delete;

        RoundLogger(RoundLogger&&) noexcept = default;
        auto operator=(RoundLogger&&) noexcept -> RoundLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed, decks, seats)
        auto start(Table const& table, std::uint64_t seed) -> void;

        // After a round: deal, decisions in play order, dealer play, outcomes and settlement
        auto round(Table const& table, RoundRecord const& rec) -> void;

        // Session footer with final balances
        auto end(Table const& table) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //BLACKJACKSIM_ROUNDLOGGER_HPP
