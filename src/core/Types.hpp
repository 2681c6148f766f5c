//
// Types.hpp
//

#ifndef BLACKJACKSIM_TYPES_HPP
#define BLACKJACKSIM_TYPES_HPP

#define BJ_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <string>

namespace blackjack::core::constants
{
    inline constexpr std::size_t CardsPerDeck = 52;
    inline constexpr std::size_t SuitCount = 4;
    inline constexpr std::size_t RankCount = 13;
    inline constexpr std::size_t MaxSeats = 7;

    inline constexpr unsigned BlackjackValue = 21;
    inline constexpr unsigned DealerStandValue = 17;
    // difference between an Ace counted as 11 and as 1
    inline constexpr unsigned SoftAceBonus = 10;
}

namespace blackjack::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };

    enum class Rank : uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    // A physical card. Owned by exactly one zone (shoe, a hand, the dealer) at a time,
    // so copies are forbidden and ownership moves through shared_ptr.
    struct Card
    {
        Card() = delete;
        Card(Suit suit, Rank rank) : suit(suit), rank(rank) {}

        Suit const suit;
        Rank const rank;
        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }
    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;

    // Value-side card used by snapshots, records and the wire
    struct CardVal
    {
        Suit suit{};
        Rank rank{};

        auto operator==(CardVal const&) const -> bool = default;
    };

    inline auto ToVal(Card const& c) noexcept -> CardVal { return CardVal{c.suit, c.rank}; }

    // Ace reports its soft value; hand valuation downgrades it.
    inline constexpr auto ValueOf(Rank const r) noexcept -> unsigned
    {
        switch (r)
        {
        case Rank::Ace: return 11;
        case Rank::Jack:
        case Rank::Queen:
        case Rank::King: return 10;
        default: return static_cast<unsigned>(r) + 2;
        }
    }

    inline constexpr auto IsTenValued(Rank const r) noexcept -> bool
    {
        return r >= Rank::Ten && r <= Rank::King;
    }

    using ChipsT = std::int64_t;
    using SeatIdxT = uint8_t;

    struct Config
    {
        uint8_t  n_decks{2};
        unsigned blackjack_value{constants::BlackjackValue};
        unsigned dealer_stand_value{constants::DealerStandValue};
        // winnings per staked chip
        double   payout_blackjack{1.5};
        double   payout_blackjack_split{1.0};
        ChipsT   min_bet{2};
        ChipsT   max_bet{500};
        // offered denominations, ascending
        std::vector<ChipsT> bet_sizes{10, 20, 50, 100};
        ChipsT   min_chips_active{2};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //BLACKJACKSIM_TYPES_HPP
