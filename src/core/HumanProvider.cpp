//
// HumanProvider.cpp
//

#include "HumanProvider.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <ostream>
#include <print>
#include <utility>
#include "Hand.hpp"
#include "Util.hpp"

namespace blackjack::core
{
    HumanProvider::HumanProvider(std::string name, std::istream& in, std::ostream& out) :
        name_(std::move(name)),
        in_(in),
        out_(out)
    {
    }

    auto HumanProvider::KeyFor(Decision const d) -> char
    {
        switch (d)
        {
        case Decision::Hit: return 'h';
        case Decision::Stand: return 's';
        case Decision::DoubleDown: return 'd';
        case Decision::Split: return 'p';
        case Decision::Surrender: return 'r';
        }
        return '?';
    }

    auto HumanProvider::FromKey(char const key) -> std::optional<Decision>
    {
        switch (std::tolower(static_cast<unsigned char>(key)))
        {
        case 'h': return Decision::Hit;
        case 's': return Decision::Stand;
        case 'd': return Decision::DoubleDown;
        case 'p': return Decision::Split;
        case 'r': return Decision::Surrender;
        default: return std::nullopt;
        }
    }

    auto HumanProvider::ReadLine() -> std::optional<std::string>
    {
        std::string line;
        if (!std::getline(in_, line)) return std::nullopt;
        auto const first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) return std::string{};
        auto const last = line.find_last_not_of(" \t\r");
        return line.substr(first, last - first + 1);
    }

    auto HumanProvider::ChooseBet(BetRequest const& request) -> ChipsT
    {
        if (request.available.empty()) return 0;

        std::string sizes;
        for (ChipsT const b : request.available)
        {
            if (!sizes.empty()) sizes += '/';
            sizes += std::to_string(b);
        }

        while (true)
        {
            std::print(out_, "{} has {} chips. Bet [{}] (enter = {}): ", name_, request.chips, sizes,
                       request.available.front());
            out_.flush();
            std::optional<std::string> const line = ReadLine();
            if (!line || line->empty()) return request.available.front();

            ChipsT amount{};
            auto const [ptr, ec] = std::from_chars(line->data(), line->data() + line->size(), amount);
            if (ec == std::errc{} && ptr == line->data() + line->size() &&
                std::ranges::find(request.available, amount) != request.available.end())
            {
                return amount;
            }
            std::print(out_, "Not an offered bet: {}\n", *line);
        }
    }

    auto HumanProvider::Decide(DecisionSnapshot const& snapshot) -> Decision
    {
        if (snapshot.legal.empty()) return Decision::Stand;

        std::string keys;
        for (Decision const d : snapshot.legal)
        {
            if (!keys.empty()) keys += ' ';
            keys += std::format("{}={}", KeyFor(d), to_string(d));
        }

        HandValue const v = EvaluateCards(snapshot.hand);
        while (true)
        {
            std::print(out_, "{} hand {}: {} ({}{}) vs dealer {}. [{}]: ", name_,
                       static_cast<int>(snapshot.hand_index) + 1, util::ToString(snapshot.hand),
                       v.soft ? "soft " : "", v.total, util::ToString(snapshot.upcard), keys);
            out_.flush();
            std::optional<std::string> const line = ReadLine();
            if (!line) return Decision::Stand;
            if (line->size() == 1)
            {
                if (auto const d = FromKey(line->front());
                    d && std::ranges::find(snapshot.legal, *d) != snapshot.legal.end())
                {
                    return *d;
                }
            }
            std::print(out_, "Choose one of: {}\n", keys);
        }
    }

    auto HumanProvider::DecideInsurance(InsuranceSnapshot const& snapshot) -> bool
    {
        while (true)
        {
            std::print(out_, "{}: dealer shows {}. Insure for {}? [y/n]: ", name_,
                       util::ToString(snapshot.upcard), snapshot.primary_bet / 2);
            out_.flush();
            std::optional<std::string> const line = ReadLine();
            if (!line) return false;
            if (*line == "y" || *line == "Y") return true;
            if (*line == "n" || *line == "N" || line->empty()) return false;
        }
    }
}
