//
// Shoe.hpp
//

#ifndef BLACKJACKSIM_SHOE_HPP
#define BLACKJACKSIM_SHOE_HPP

#include <random>
#include <span>
#include <vector>
#include "Types.hpp"

namespace blackjack::core
{
    // The working deck(s) for one round. Cards are dealt from the back.
    class Shoe
    {
    public:
        explicit Shoe(uint8_t n_decks);

        Shoe(Shoe const&) = delete;
        auto operator=(Shoe const&) -> Shoe& = delete;
        Shoe(Shoe&&) noexcept = default;
        auto operator=(Shoe&&) noexcept -> Shoe& = default;

        auto Shuffle(std::mt19937_64& rng) -> void;
        // Throws StateError when empty
        auto Deal() -> CardSP;

        auto Size() const noexcept -> std::size_t { return cards_.size(); }
        auto Decks() const noexcept -> uint8_t { return n_decks_; }
        auto Cards() const noexcept -> std::vector<CardSP> const& { return cards_; }

        // Reorders so that `order` is dealt first, in sequence. Every listed card must be
        // present (with multiplicity); nothing is added or removed.
        auto Stack(std::span<CardVal const> order) -> void;

    private:
        std::vector<CardSP> cards_;
        uint8_t n_decks_{};
    };

    // Chance that the hole card is ten-valued, counted against a fresh reference shoe with
    // the visible cards removed.
    auto HoleCardTenProbability(uint8_t n_decks, std::span<CardVal const> visible) -> double;
}

#endif //BLACKJACKSIM_SHOE_HPP
