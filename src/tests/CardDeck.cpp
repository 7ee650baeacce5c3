#include <gtest/gtest.h>
#include <random>
#include <set>

#include "../core/ActionLog.hpp"
#include "../core/Deck.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace kasino::core;

TEST(Deck, FortyUniqueCards)
{
    CardList const deck = BuildDeck();
    ASSERT_EQ(deck.size(), constants::DeckSize);

    util::CardUniqueChecker checker{};
    checker.AddAll(deck);
    EXPECT_FALSE(checker.ContainsDup());
    EXPECT_EQ(checker.Mask(), (uint64_t{1} << 40) - 1);
}

TEST(Deck, IdsAreSuitMajor)
{
    for (CardId id{}; id < constants::DeckSize; ++id)
    {
        Card const c = CardFromId(id);
        EXPECT_EQ(c.id, id);
        EXPECT_EQ(MakeCard(c.suit, c.rank), c);
    }
    EXPECT_EQ(MakeCard(Suit::Spades, 1).id, 0);
    EXPECT_EQ(MakeCard(Suit::Hearts, 1).id, 10);
    EXPECT_EQ(MakeCard(Suit::Clubs, 10).id, 39);
}

TEST(Deck, ShuffleIsSeededPermutation)
{
    std::mt19937_64 a{42};
    std::mt19937_64 b{42};
    CardList const first = ShuffledDeck(a);
    EXPECT_EQ(first, ShuffledDeck(b));

    std::set<CardId> ids;
    for (Card const& c : first) ids.insert(c.id);
    EXPECT_EQ(ids.size(), constants::DeckSize);
}

TEST(Card, ScoringPredicates)
{
    EXPECT_TRUE(MakeCard(Suit::Spades, 2).IsSpyTwo());
    EXPECT_FALSE(MakeCard(Suit::Hearts, 2).IsSpyTwo());
    EXPECT_TRUE(MakeCard(Suit::Diamonds, 10).IsBigTen());
    EXPECT_FALSE(MakeCard(Suit::Spades, 10).IsBigTen());
    EXPECT_TRUE(MakeCard(Suit::Clubs, 1).IsAce());
    EXPECT_TRUE(MakeCard(Suit::Spades, 7).IsSpade());
    EXPECT_EQ(MakeCard(Suit::Hearts, 9).Value(), 9);
}

TEST(Card, Names)
{
    EXPECT_EQ(to_string(MakeCard(Suit::Spades, 1)), "AS");
    EXPECT_EQ(to_string(MakeCard(Suit::Diamonds, 10)), "10D");
    EXPECT_EQ(to_string(CardList{MakeCard(Suit::Hearts, 4), MakeCard(Suit::Clubs, 4)}, '+'), "4H+4C");
}

TEST(ActionLog, DropsOldestPastCapacity)
{
    ActionLog log{3};
    for (int i{}; i < 5; ++i)
    {
        log.Append(ActionRecord{ .actor = 0, .type = ActionType::Drift, .description = std::to_string(i) });
    }

    EXPECT_EQ(log.Size(), 3u);
    EXPECT_EQ(log.TotalAppended(), 5u);
    EXPECT_EQ(log.Entries().front().description, "2");
    EXPECT_EQ(log.Entries().front().sequence, 2u);
    EXPECT_EQ(log.Back().sequence, 4u);
}

TEST(ActionLog, EmptyLogHasNoBack)
{
    ActionLog const log{};
    EXPECT_TRUE(log.Empty());
    EXPECT_EQ(log.Capacity(), 50u);
    EXPECT_THROW((void)log.Back(), error::StateError);
}

TEST(ActionLog, ZeroCapacityIsMisuse)
{
    EXPECT_THROW(ActionLog{0}, error::AssertionError);
}
