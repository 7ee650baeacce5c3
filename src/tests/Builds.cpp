#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace kasino::test;
using RVC = kasino::core::error::RuleViolationCode;

namespace
{
    auto MakeEngine() -> Engine
    {
        return Engine{Config{ .seed = 11 }};
    }

    auto ExpectRejected(MoveResult const& result, GameState const& input, RVC const code) -> void
    {
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, code) << error::describe(result.error());
        EXPECT_EQ(result.value_or(input), input);
    }
}

TEST(CreateBuild, PairAbsorbsLooseCardOfSameValue)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(4), C(8)}, {H(9)}}, .table = {S(4), D(8), H(3)} });

    MoveResult const result = engine.CreateBuild(state, BuildAction{ .hand_card = C(4), .table_cards = {S(4)},
                                                                     .declared_value = 8 });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());

    ASSERT_EQ(result->builds.size(), 1u);
    Build const& b = result->builds.front();
    EXPECT_EQ(b.owner, 0);
    EXPECT_EQ(b.value, 8);
    EXPECT_EQ(b.groups.size(), 2u);
    EXPECT_EQ(b.CardCount(), 3u);
    for (CardList const& g : b.groups) EXPECT_EQ(util::SumValues(g), 8);

    EXPECT_EQ(result->table, (CardList{H(3)}));
    EXPECT_EQ(result->players[0].hand, (CardList{C(8)}));
    EXPECT_EQ(result->log.Back().type, ActionType::BuildCreate);
}

TEST(CreateBuild, SumBuildFromTwoTableCards)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(2), C(9)}, {H(9)}}, .table = {S(4), D(3)} });

    MoveResult const result = engine.CreateBuild(state, BuildAction{ .hand_card = C(2), .table_cards = {S(4), D(3)},
                                                                     .declared_value = 9 });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_TRUE(result->table.empty());
    ASSERT_EQ(result->builds.size(), 1u);
    EXPECT_FALSE(result->builds.front().IsAugmented());
}

TEST(CreateBuild, NeedsCardToCaptureIt)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(4), H(2)}, {H(9)}}, .table = {S(4)} });

    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(4), .table_cards = {S(4)}, .declared_value = 8 }),
                   state, RVC::Build_NoCaptureCard);
}

TEST(CreateBuild, PlayedCardDoesNotCountAsCaptureCard)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(8), H(2)}, {H(9)}}, .table = {S(4), D(4)} });

    // Only 8 in hand would be spent building
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(8), .table_cards = {S(4), D(4)},
                                                          .declared_value = 8 }),
                   state, RVC::Build_NoCaptureCard);
}

TEST(CreateBuild, ValidationFailures)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(5), C(8), C(9)}, {H(9)}}, .table = {S(2), H(6)} });

    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .table_cards = {S(2)}, .declared_value = 11 }),
                   state, RVC::Build_ValueOutOfRange);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = H(9), .table_cards = {S(2)}, .declared_value = 8 }),
                   state, RVC::Card_NotInHand);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .table_cards = {D(3)}, .declared_value = 8 }),
                   state, RVC::Card_NotOnTable);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .table_cards = {S(2)}, .declared_value = 8 }),
                   state, RVC::Build_NoExactPartition);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(9), .table_cards = {S(2)}, .declared_value = 8 }),
                   state, RVC::Build_CardExceedsValue);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .declared_value = 8 }),
                   state, RVC::Build_Empty);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .table_cards = {S(2), S(2)}, .declared_value = 8 }),
                   state, RVC::Card_Duplicate);
}

TEST(CreateBuild, TableOnlyBuildAllowed)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(8)}, {H(9)}}, .table = {S(2), H(6)} });

    MoveResult const result = engine.CreateBuild(state, BuildAction{ .table_cards = {S(2), H(6)}, .declared_value = 8 });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->players[0].hand, (CardList{C(8)}));
    EXPECT_EQ(result->log.Back().card_played, S(2));
}

TEST(CreateBuild, OneBuildValuePerOwner)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(3), C(7), C(8)}, {H(9)}}, .table = {S(4)},
                                        .builds = {MakeBuild(0, 8, {{H(5), H(3)}})} });

    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(3), .table_cards = {S(4)}, .declared_value = 7 }),
                   state, RVC::Build_OwnsOtherValue);
}

TEST(CreateBuild, SameValueMergesIntoOwnedBuild)
{
    Engine const engine = MakeEngine();
    Build const owned = MakeBuild(0, 8, {{H(5), H(3)}});
    GameState const state = MakeState({ .hands = {{C(6), C(8)}, {H(9)}}, .table = {D(2)}, .builds = {owned} });

    MoveResult const result = engine.CreateBuild(state, BuildAction{ .hand_card = C(6), .table_cards = {D(2)},
                                                                     .declared_value = 8 });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    ASSERT_EQ(result->builds.size(), 1u);
    EXPECT_EQ(result->builds.front().id, owned.id);
    EXPECT_EQ(result->builds.front().groups.size(), 2u);
    EXPECT_EQ(result->log.Back().type, ActionType::BuildAugment);
}

TEST(CreateBuild, StealFromOpponentPileTop)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(5), C(8)}, {H(9)}},
                                        .piles = {{}, {H(10), D(3)}} });

    MoveResult const result = engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .declared_value = 8,
                                                                     .stolen_cards = {D(3)} });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->players[1].capture_pile, (CardList{H(10)}));
    EXPECT_EQ(result->log.Back().type, ActionType::StealAndBuild);
    EXPECT_EQ(result->log.Back().cards_captured, (CardList{D(3)}));

    // Only the top card can be taken
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .declared_value = 8,
                                                          .stolen_cards = {H(10)} }),
                   state, RVC::Card_NotOnPileTop);
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .table_cards = {}, .declared_value = 3,
                                                          .stolen_cards = {D(3)} }),
                   state, RVC::Build_StealWithoutHandCard);
}

TEST(CreateBuild, OneCardPerOpponentPile)
{
    Engine const engine = MakeEngine();
    GameState const state = MakeState({ .hands = {{C(5), C(9)}, {H(9)}, {D(9)}},
                                        .piles = {{}, {H(10), D(3)}, {S(1)}} });

    // Tops of two different piles
    MoveResult const result = engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .declared_value = 9,
                                                                     .stolen_cards = {D(3), S(1)} });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->players[1].capture_pile, (CardList{H(10)}));
    EXPECT_TRUE(result->players[2].capture_pile.empty());
    EXPECT_EQ(result->builds.front().CardCount(), 3u);

    // The card under a pile top never becomes stealable in the same action
    ExpectRejected(engine.CreateBuild(state, BuildAction{ .hand_card = C(5), .declared_value = 9,
                                                          .stolen_cards = {D(3), H(10)} }),
                   state, RVC::Card_NotOnPileTop);
}

TEST(AugmentBuild, OwnerAddsGroup)
{
    Engine const engine = MakeEngine();
    Build const owned = MakeBuild(0, 8, {{H(5), H(3)}});
    GameState const state = MakeState({ .hands = {{C(6), C(8)}, {H(9)}}, .table = {D(2)}, .builds = {owned} });

    MoveResult const result = engine.AugmentBuild(state, AugmentAction{ .build = owned.id, .table_cards = {D(2)},
                                                                        .hand_card = C(6) });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->builds.front().groups.size(), 2u);
    EXPECT_TRUE(result->table.empty());
    EXPECT_EQ(result->log.Back().type, ActionType::BuildAugment);
}

TEST(AugmentBuild, StealsOpponentPileTop)
{
    Engine const engine = MakeEngine();
    Build const owned = MakeBuild(0, 8, {{H(5), H(3)}});
    GameState const state = MakeState({ .hands = {{C(6), C(8)}, {H(9)}}, .builds = {owned},
                                        .piles = {{S(7)}, {H(10), D(2)}} });

    MoveResult const result = engine.AugmentBuild(state, AugmentAction{ .build = owned.id, .hand_card = C(6),
                                                                        .stolen_card = D(2) });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->builds.front().groups.back(), (CardList{C(6), D(2)}));
    EXPECT_EQ(result->players[1].capture_pile, (CardList{H(10)}));
    EXPECT_EQ(result->players[0].capture_pile, (CardList{S(7)}));
    EXPECT_EQ(result->log.Back().cards_captured, (CardList{D(2)}));

    ExpectRejected(engine.AugmentBuild(state, AugmentAction{ .build = owned.id, .stolen_card = D(2) }),
                   state, RVC::Build_StealWithoutHandCard);
    ExpectRejected(engine.AugmentBuild(state, AugmentAction{ .build = owned.id, .hand_card = C(6),
                                                             .stolen_card = H(10) }),
                   state, RVC::Card_NotOnPileTop);
    // Own pile is not an opponent's
    ExpectRejected(engine.AugmentBuild(state, AugmentAction{ .build = owned.id, .hand_card = C(6),
                                                             .stolen_card = S(7) }),
                   state, RVC::Card_NotOnPileTop);
}

TEST(AugmentBuild, Rejections)
{
    Engine const engine = MakeEngine();
    Build const theirs = MakeBuild(1, 8, {{H(5), H(3)}});
    Build const mine = MakeBuild(0, 7, {{S(4), S(3)}});
    GameState const state = MakeState({ .hands = {{C(6), C(7), C(8)}, {H(9), H(8)}}, .table = {D(2), D(1)},
                                        .builds = {theirs, mine} });

    ExpectRejected(engine.AugmentBuild(state, AugmentAction{ .build = theirs.id, .table_cards = {D(2)}, .hand_card = C(6) }),
                   state, RVC::Augment_NotOwner);
    ExpectRejected(engine.AugmentBuild(state, AugmentAction{ .build = 12345, .hand_card = C(6) }),
                   state, RVC::Augment_UnknownBuild);
    ExpectRejected(engine.AugmentBuild(state, AugmentAction{ .build = mine.id, .table_cards = {D(2)}, .hand_card = C(6) }),
                   state, RVC::Augment_SumMismatch);
}

TEST(IncreaseBuild, TakesOwnershipAndRaisesValue)
{
    Engine const engine = MakeEngine();
    Build const theirs = MakeBuild(1, 5, {{S(3), S(2)}});
    GameState const state = MakeState({ .hands = {{H(3), C(8)}, {H(9)}}, .builds = {theirs} });

    MoveResult const result = engine.IncreaseBuild(state, IncreaseAction{ .build = theirs.id, .hand_card = H(3) });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    ASSERT_EQ(result->builds.size(), 1u);
    Build const& b = result->builds.front();
    EXPECT_EQ(b.id, theirs.id);
    EXPECT_EQ(b.owner, 0);
    EXPECT_EQ(b.value, 8);
    EXPECT_EQ(b.groups, (CardGroups{{S(3), S(2), H(3)}}));
    EXPECT_EQ(result->log.Back().type, ActionType::BuildIncrease);
}

TEST(IncreaseBuild, Rejections)
{
    Engine const engine = MakeEngine();
    Build const eight = MakeBuild(1, 8, {{S(5), S(3)}});
    Build const augmented = MakeBuild(1, 8, {{D(6), D(2)}, {H(8)}});
    Build const mine = MakeBuild(0, 9, {{C(4), C(5)}});

    GameState const state = MakeState({ .hands = {{H(3), H(1), C(9)}, {H(9)}}, .builds = {eight, mine} });
    ExpectRejected(engine.IncreaseBuild(state, IncreaseAction{ .build = mine.id, .hand_card = H(1) }),
                   state, RVC::Increase_OwnBuild);
    ExpectRejected(engine.IncreaseBuild(state, IncreaseAction{ .build = eight.id, .hand_card = H(3) }),
                   state, RVC::Increase_ValueAboveTen);
    ExpectRejected(engine.IncreaseBuild(state, IncreaseAction{ .build = 99, .hand_card = H(3) }),
                   state, RVC::Increase_UnknownBuild);

    GameState const with_augmented = MakeState({ .hands = {{H(1), C(9)}, {H(9)}}, .builds = {augmented} });
    ExpectRejected(engine.IncreaseBuild(with_augmented, IncreaseAction{ .build = augmented.id, .hand_card = H(1) }),
                   with_augmented, RVC::Increase_AugmentedBuild);

    // No 9 left once the increase lands
    GameState const no_card = MakeState({ .hands = {{H(1), C(2)}, {H(9)}}, .builds = {eight} });
    ExpectRejected(engine.IncreaseBuild(no_card, IncreaseAction{ .build = eight.id, .hand_card = H(1) }),
                   no_card, RVC::Build_NoCaptureCard);
}

TEST(IncreaseBuild, KeepsCaptureCardForOtherOwnedBuild)
{
    Engine const engine = MakeEngine();
    Build const theirs = MakeBuild(1, 5, {{S(4), C(1)}});
    Build const mine = MakeBuild(0, 2, {{S(1), D(1)}});

    // The only 2 in hand would be spent on the increase
    GameState const state = MakeState({ .hands = {{H(2), C(7)}, {H(9)}}, .builds = {theirs, mine} });
    MoveResult const rejected = engine.IncreaseBuild(state, IncreaseAction{ .build = theirs.id, .hand_card = H(2) });
    ExpectRejected(rejected, state, RVC::Build_NoCaptureCard);
    EXPECT_EQ(rejected.error().build, mine.id);
    EXPECT_EQ(rejected.error().value, 2);

    GameState const spare = MakeState({ .hands = {{H(2), C(2), C(7)}, {H(9)}}, .builds = {theirs, mine} });
    MoveResult const result = engine.IncreaseBuild(spare, IncreaseAction{ .build = theirs.id, .hand_card = H(2) });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->OwnedBuilds(0).size(), 2u);
}

TEST(IncreaseBuild, MergesIntoOwnedBuildOfNewValue)
{
    Engine const engine = MakeEngine();
    Build const theirs = MakeBuild(1, 5, {{S(3), S(2)}});
    Build const mine = MakeBuild(0, 8, {{D(6), D(2)}});
    GameState const state = MakeState({ .hands = {{H(3), C(8)}, {H(9)}}, .builds = {theirs, mine} });

    MoveResult const result = engine.IncreaseBuild(state, IncreaseAction{ .build = theirs.id, .hand_card = H(3) });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    ASSERT_EQ(result->builds.size(), 1u);
    EXPECT_EQ(result->builds.front().id, mine.id);
    EXPECT_EQ(result->builds.front().owner, 0);
    EXPECT_EQ(result->builds.front().groups.size(), 2u);
}

TEST(Drift, BlockedWhileOwningBuildInFirstDeal)
{
    Engine const engine = MakeEngine();
    Build const mine = MakeBuild(0, 8, {{D(6), D(2)}});
    GameState const state = MakeState({ .hands = {{H(3), C(8)}, {H(9)}}, .builds = {mine} });

    ExpectRejected(engine.Drift(state, H(3)), state, RVC::Drift_OwnsBuild);
    ExpectRejected(engine.Drift(state, H(9)), state, RVC::Card_NotInHand);
}

TEST(Drift, AllowedInSecondDealAndWithoutBuilds)
{
    Engine const engine = MakeEngine();
    Build const mine = MakeBuild(0, 8, {{D(6), D(2)}});
    GameState const second = MakeState({ .hands = {{H(3), C(8)}, {H(9)}}, .builds = {mine}, .second_deal = true });

    MoveResult const result = engine.Apply(second, DriftAction{ .hand_card = H(3) });
    ASSERT_TRUE(result.has_value()) << error::describe(result.error());
    EXPECT_EQ(result->table, (CardList{H(3)}));
    EXPECT_EQ(result->log.Back().type, ActionType::Drift);

    GameState const plain = MakeState({ .hands = {{H(3)}, {H(9)}} });
    EXPECT_TRUE(engine.Drift(plain, H(3)).has_value());
}
