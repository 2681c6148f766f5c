#include <gtest/gtest.h>
#include <format>
#include <random>
#include <string>
#include <vector>

#include "../core/Hand.hpp"
#include "../core/Shoe.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "ScriptedProvider.hpp"

using namespace blackjack::core;
using blackjack::core::test::C;

namespace
{
    auto MakeHand(std::vector<CardVal> const& cards, bool from_split = false) -> Hand
    {
        Hand h{from_split};
        for (CardVal const c : cards) h.Add(std::make_shared<Card>(c.suit, c.rank));
        return h;
    }
}

TEST(HandValue, SoftAceDowngrade)
{
    Hand const h = MakeHand({C(Rank::Ace, Suit::Hearts), C(Rank::Ace, Suit::Spades), C(Rank::Nine, Suit::Clubs)});
    EXPECT_EQ(h.Value(), 21u);
    EXPECT_TRUE(h.IsSoft());
    EXPECT_FALSE(h.IsBlackjack());
}

TEST(HandValue, HardAfterEveryAceDowngraded)
{
    Hand const h = MakeHand({C(Rank::Ace, Suit::Hearts), C(Rank::King, Suit::Spades), C(Rank::Five, Suit::Clubs)});
    EXPECT_EQ(h.Value(), 16u);
    EXPECT_FALSE(h.IsSoft());
    EXPECT_FALSE(h.IsBust());
}

TEST(HandValue, Bust)
{
    Hand const h = MakeHand({C(Rank::King, Suit::Hearts), C(Rank::Queen, Suit::Spades), C(Rank::Two, Suit::Clubs)});
    EXPECT_EQ(h.Value(), 22u);
    EXPECT_TRUE(h.IsBust());
}

TEST(HandValue, Blackjack)
{
    Hand const h = MakeHand({C(Rank::Ace, Suit::Hearts), C(Rank::Jack, Suit::Spades)});
    EXPECT_EQ(h.Value(), 21u);
    EXPECT_TRUE(h.IsSoft());
    EXPECT_TRUE(h.IsBlackjack());
}

TEST(HandValue, SplitBornTwentyOneIsNotBlackjack)
{
    Hand const h = MakeHand({C(Rank::Ace, Suit::Hearts), C(Rank::Jack, Suit::Spades)}, /*from_split*/ true);
    EXPECT_EQ(h.Value(), 21u);
    EXPECT_FALSE(h.IsBlackjack());
}

TEST(HandValue, ValuesOnlyMatchCardEvaluation)
{
    std::vector<CardVal> const cards{C(Rank::Ace, Suit::Hearts), C(Rank::Six, Suit::Clubs)};
    HandValue const v = EvaluateCards(cards);
    EXPECT_EQ(v.total, 17u);
    EXPECT_TRUE(v.soft);
    EXPECT_EQ(MakeHand(cards).Value(), v.total);
}

TEST(HandSplit, SplitOffKeepsFirstCard)
{
    Hand h = MakeHand({C(Rank::Eight, Suit::Hearts), C(Rank::Eight, Suit::Spades)});
    ASSERT_TRUE(h.IsPair());
    CardSP const second = h.SplitOff();
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(ToVal(*second), C(Rank::Eight, Suit::Spades));
    EXPECT_EQ(h.Size(), 1u);
    EXPECT_TRUE(h.FromSplit());
}

TEST(HandSplit, SplitOffOnNonPairAsserts)
{
    Hand h = MakeHand({C(Rank::Eight, Suit::Hearts), C(Rank::Nine, Suit::Spades)});
    EXPECT_THROW((void)h.SplitOff(), error::AssertionError);
}

TEST(ShoeModel, FreshShoeHoldsEachCardOncePerDeck)
{
    Shoe const shoe{2};
    ASSERT_EQ(shoe.Size(), 2 * constants::CardsPerDeck);

    util::CardCounter counter{};
    for (CardSP const& c : shoe.Cards()) counter.Add(*c);
    EXPECT_EQ(counter.Total(), 104u);
    EXPECT_EQ(counter.MaxMultiplicity(), 2u);
    EXPECT_EQ(counter.Count(C(Rank::Ace, Suit::Spades)), 2u);
}

TEST(ShoeModel, DealFromEmptyThrows)
{
    Shoe shoe{1};
    for (std::size_t i{}; i < constants::CardsPerDeck; ++i) (void)shoe.Deal();
    EXPECT_EQ(shoe.Size(), 0u);
    EXPECT_THROW((void)shoe.Deal(), error::StateError);
}

TEST(ShoeModel, StackDealsInOrderWithoutChangingContents)
{
    std::mt19937_64 rng{99};
    Shoe shoe{2};
    shoe.Shuffle(rng);

    std::vector<CardVal> const order{C(Rank::Ace, Suit::Spades), C(Rank::Ace, Suit::Spades),
                                     C(Rank::Two, Suit::Hearts), C(Rank::King, Suit::Clubs)};
    shoe.Stack(order);
    EXPECT_EQ(shoe.Size(), 104u);

    for (CardVal const want : order)
    {
        EXPECT_EQ(ToVal(*shoe.Deal()), want);
    }
}

TEST(ShoeModel, StackingMissingCardThrows)
{
    Shoe shoe{1};
    std::vector<CardVal> const order{C(Rank::Ace, Suit::Spades), C(Rank::Ace, Suit::Spades)};
    EXPECT_THROW(shoe.Stack(order), error::StateError);
}

TEST(HoleCard, FreshShoeProbability)
{
    // Only the upcard is visible: 32 ten-valued cards left out of 103
    std::vector<CardVal> const visible{C(Rank::Ace, Suit::Spades)};
    EXPECT_DOUBLE_EQ(HoleCardTenProbability(2, visible), 32.0 / 103.0);
}

TEST(HoleCard, VisibleTensReduceProbability)
{
    std::vector<CardVal> const visible{C(Rank::King, Suit::Hearts), C(Rank::Ten, Suit::Clubs),
                                       C(Rank::Ace, Suit::Spades)};
    EXPECT_DOUBLE_EQ(HoleCardTenProbability(1, visible), 14.0 / 49.0);
}

TEST(ShoeModel, ErrorNamesItsCodeAndSite)
{
    Shoe shoe{1};
    for (std::size_t i{}; i < constants::CardsPerDeck; ++i) (void)shoe.Deal();
    try
    {
        (void)shoe.Deal();
        FAIL() << "dealing from an empty shoe must throw";
    }
    catch (error::StateError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::State);
        std::string const text = std::format("{}", static_cast<OmegaException<error::Code> const&>(e));
        EXPECT_EQ(text.rfind("State error: ", 0), 0u);
        EXPECT_NE(text.find("Shoe.cpp"), std::string::npos);
    }
}
