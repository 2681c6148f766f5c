//
// Shoe.cpp
//
#include "Shoe.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include "Exception.hpp"
#include "Util.hpp"

namespace blackjack::core
{
    Shoe::Shoe(uint8_t const n_decks) :
        n_decks_{n_decks}
    {
        BJ_ASSERT(n_decks_ > 0, "Shoe needs at least one deck");
        cards_.reserve(n_decks_ * constants::CardsPerDeck);
        for (uint8_t d{}; d < n_decks_; ++d)
        {
            for (std::size_t i{}; i < constants::SuitCount; ++i)
            {
                for (std::size_t j{}; j < constants::RankCount; ++j)
                {
                    cards_.emplace_back(std::make_shared<Card>(
                        static_cast<Suit>(i), static_cast<Rank>(j)));
                }
            }
        }
    }

    auto Shoe::Shuffle(std::mt19937_64& rng) -> void
    {
        std::ranges::shuffle(cards_, rng);
    }

    auto Shoe::Deal() -> CardSP
    {
        if (cards_.empty()) BJ_THROW(error::Code::State, "Dealing from an empty shoe");
        CardSP c = std::move(cards_.back());
        cards_.pop_back();
        return c;
    }

    auto Shoe::Stack(std::span<CardVal const> const order) -> void
    {
        BJ_ASSERT(order.size() <= cards_.size(), "Stacked order longer than the shoe");
        // order[k] goes to slot size-1-k; slots above it are already placed.
        for (std::size_t k{}; k < order.size(); ++k)
        {
            CardVal const want = order[k];
            auto const slot = cards_.begin() + static_cast<std::ptrdiff_t>(cards_.size() - 1 - k);
            auto const it = std::find_if(cards_.begin(), slot + 1,
                                         [&want](CardSP const& c) { return ToVal(*c) == want; });
            if (it == slot + 1)
                BJ_THROW(error::Code::State,
                         std::format("Stacked card {} not available in shoe", util::ToString(want)));
            std::iter_swap(it, slot);
        }
    }

    auto HoleCardTenProbability(uint8_t const n_decks, std::span<CardVal const> const visible) -> double
    {
        std::size_t const reference = n_decks * constants::CardsPerDeck;
        if (visible.size() >= reference) return 0.0;

        std::size_t tens = n_decks * constants::SuitCount * 4;
        util::CardCounter seen{};
        for (CardVal const c : visible)
        {
            // a card beyond the reference multiplicity does not come out of the reference shoe
            if (seen.Count(c) >= n_decks) continue;
            seen.Add(c);
            if (IsTenValued(c.rank)) --tens;
        }
        return static_cast<double>(tens) / static_cast<double>(reference - visible.size());
    }
}
