//
// Actions.hpp
//

#ifndef BLACKJACKSIM_ACTIONS_HPP
#define BLACKJACKSIM_ACTIONS_HPP

#include <string_view>
#include "Types.hpp"

namespace blackjack::core
{
    enum class Decision : uint8_t
    {
        Hit = 0,
        Stand,
        DoubleDown,
        Split,
        Surrender
    };

    // Assigned exactly once per hand
    enum class Outcome : uint8_t
    {
        Win = 0,
        Loss,
        Push,
        Blackjack,
        Bust,
        Surrender
    };

    // Round state machine, in execution order
    enum class Phase : uint8_t
    {
        Setup,
        Deal,
        Insurance,
        BlackjackCheck,
        PlayerTurns,
        DealerTurn,
        Outcomes,
        Settlement,
        Done
    };

    enum class TurnResult : uint8_t
    {
        Continue,
        HandEnded
    };

    inline auto to_string(Decision const d) -> std::string_view
    {
        switch (d)
        {
        case Decision::Hit: return "Hit";
        case Decision::Stand: return "Stand";
        case Decision::DoubleDown: return "DoubleDown";
        case Decision::Split: return "Split";
        case Decision::Surrender: return "Surrender";
        }
        return "Unknown";
    }

    inline auto to_string(Outcome const o) -> std::string_view
    {
        switch (o)
        {
        case Outcome::Win: return "Win";
        case Outcome::Loss: return "Loss";
        case Outcome::Push: return "Push";
        case Outcome::Blackjack: return "Blackjack";
        case Outcome::Bust: return "Bust";
        case Outcome::Surrender: return "Surrender";
        }
        return "Unknown";
    }

    inline auto to_string(Phase const p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Setup: return "Setup";
        case Phase::Deal: return "Deal";
        case Phase::Insurance: return "Insurance";
        case Phase::BlackjackCheck: return "BlackjackCheck";
        case Phase::PlayerTurns: return "PlayerTurns";
        case Phase::DealerTurn: return "DealerTurn";
        case Phase::Outcomes: return "Outcomes";
        case Phase::Settlement: return "Settlement";
        case Phase::Done: return "Done";
        }
        return "Unknown";
    }
} // namespace blackjack::core

#endif //BLACKJACKSIM_ACTIONS_HPP
