//
// Util.hpp
//

#ifndef BLACKJACKSIM_UTIL_HPP
#define BLACKJACKSIM_UTIL_HPP

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <utility>
#include "Types.hpp"

namespace blackjack::core::util
{
    inline constexpr auto CardToUID(Suit const s, Rank const r) -> std::size_t
    {
        return static_cast<std::size_t>(s) * constants::RankCount + static_cast<std::size_t>(r);
    }
    inline auto CardToUID(Card const& c) -> std::size_t { return CardToUID(c.suit, c.rank); }
    inline auto CardToUID(CardVal const& c) -> std::size_t { return CardToUID(c.suit, c.rank); }

    // Per exact-card tally; a multi-deck shoe holds n_decks copies of each entry.
    class CardCounter
    {
    public:
        auto Add(CardVal const c) -> void { ++counts_[CardToUID(c)]; }
        auto Add(Card const& c) -> void { ++counts_[CardToUID(c)]; }

        [[nodiscard]]
        auto Count(CardVal const c) const -> unsigned { return counts_[CardToUID(c)]; }

        [[nodiscard]]
        auto MaxMultiplicity() const -> unsigned { return *std::ranges::max_element(counts_); }

        [[nodiscard]]
        auto Total() const -> std::size_t
        {
            std::size_t n{};
            for (unsigned const c : counts_) n += c;
            return n;
        }

    private:
        std::array<unsigned, constants::SuitCount * constants::RankCount> counts_{};
    };

    inline auto RankChar(Rank const r) -> char
    {
        static constexpr char s_rank[] = "23456789TJQKA";
        return s_rank[std::to_underlying(r)];
    }

    inline auto SuitChar(Suit const s) -> char
    {
        static constexpr char s_suit[] = "HDCS";
        return s_suit[std::to_underlying(s)];
    }

    inline auto ToString(CardVal const c) -> std::string
    {
        return std::string{RankChar(c.rank), SuitChar(c.suit)};
    }

    inline auto ToString(std::span<CardVal const> cards) -> std::string
    {
        std::string out{"["};
        for (std::size_t i{}; i < cards.size(); ++i)
        {
            if (i) out += ' ';
            out += ToString(cards[i]);
        }
        out += ']';
        return out;
    }
}

#endif //BLACKJACKSIM_UTIL_HPP
