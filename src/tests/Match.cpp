#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "Fixtures.hpp"
#include "../core/Match.hpp"
#include "../core/RandomAi.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"

using namespace kasino::test;

namespace
{
    // Always offers a card it does not hold
    class StubbornPlayer final : public Player
    {
    public:
        auto Play(GameState const& state, PlyrIdxT) -> PlayerAction override
        {
            return DriftAction{ .hand_card = state.draw_pile.front() };
        }
    };

    auto RandomPlayers(size_t n, uint64_t seed) -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> ps;
        for (size_t i{}; i < n; ++i) ps.emplace_back(std::make_unique<RandomAI>(seed + i));
        return ps;
    }
}

TEST(RandomAI, OnlyProposesAcceptedActions)
{
    Engine engine{Config{ .seed = 21 }};
    GameState s = engine.InitializeGame(Seats(3), GameMode::Practice);
    RandomAI ai{99};

    for (int i{}; i < 30 && s.InPlay(); ++i)
    {
        PlayerAction const a = ai.Play(s, s.current);
        MoveResult const result = engine.Apply(s, a);
        ASSERT_TRUE(result.has_value()) << error::describe(result.error());
        s = engine.NextTurn(*result);
        debug::CheckInvariants(s);
    }
}

TEST(RandomAI, RefusesToMoveOutOfTurn)
{
    Engine engine{Config{ .seed = 21 }};
    GameState const s = engine.InitializeGame(Seats(2), GameMode::Practice);
    RandomAI ai{1};
    EXPECT_THROW((void)ai.Play(s, 1), error::AssertionError);
}

TEST(Match, RejectedActionsFallBackAfterThreeTries)
{
    std::vector<std::unique_ptr<Player>> players;
    players.emplace_back(std::make_unique<StubbornPlayer>());
    players.emplace_back(std::make_unique<RandomAI>(5));

    std::vector<PlayerInfo> const seats = Seats(2);
    Match match(Config{ .seed = 8 }, seats, std::move(players));
    ASSERT_EQ(match.State().current, 0);

    EXPECT_EQ(match.Step(), MoveOutcome::Invalid);
    ASSERT_TRUE(match.LastViolation().has_value());
    EXPECT_EQ(match.LastViolation()->code, error::RuleViolationCode::Card_NotInHand);
    EXPECT_EQ(match.State().current, 0);

    EXPECT_EQ(match.Step(), MoveOutcome::Invalid);
    EXPECT_EQ(match.Step(), MoveOutcome::Applied);
    EXPECT_EQ(match.State().current, 1);
    EXPECT_EQ(match.State().players[0].hand.size(), 9u);
    ASSERT_TRUE(match.LastAction().has_value());
    EXPECT_EQ(match.State().log.TotalAppended(), 1u);
}

TEST(Match, RejectionsReachHookAndTranscript)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    fs::path const path{"_artifacts/match_rejections.log"};

    std::vector<std::unique_ptr<Player>> players;
    players.emplace_back(std::make_unique<StubbornPlayer>());
    players.emplace_back(std::make_unique<RandomAI>(5));

    std::vector<PlayerInfo> const seats = Seats(2);
    Match match(Config{ .seed = 8 }, seats, std::move(players));

    std::vector<PlyrIdxT> rejected_seats;
    {
        debug::AuditLogger log(path.string());
        log.start(match.State(), 8);
        match.OnRejection([&](PlyrIdxT seat, error::RuleViolation const& v)
        {
            rejected_seats.push_back(seat);
            EXPECT_EQ(v.code, error::RuleViolationCode::Card_NotInHand);
            log.rejection(seat, v);
        });

        EXPECT_EQ(match.Step(), MoveOutcome::Invalid);
        EXPECT_EQ(match.Step(), MoveOutcome::Invalid);
        EXPECT_EQ(match.Step(), MoveOutcome::Applied);
        match.OnRejection({});
    }

    EXPECT_EQ(rejected_seats, (std::vector<PlyrIdxT>{0, 0, 0}));

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    std::string const body = text.str();
    EXPECT_NE(body.find("Rejected: P0 Card not in the mover's hand"), std::string::npos) << body;
}

TEST(Match, RunsHandsUntilTarget)
{
    std::vector<PlayerInfo> const seats = Seats(2);
    Match match(Config{ .target_score = 11, .seed = 77 }, seats, RandomPlayers(2, 77));

    bool saw_hand_end = false;
    MoveOutcome out{MoveOutcome::Applied};
    for (size_t i{}; i < 20000 && out != MoveOutcome::MatchEnded; ++i)
    {
        uint32_t const hand = match.State().hand_number;
        out = match.Step();
        ASSERT_NE(out, MoveOutcome::Invalid);
        debug::CheckInvariants(match.State());

        if (out == MoveOutcome::HandEnded)
        {
            saw_hand_end = true;
            EXPECT_TRUE(match.State().hand_scored);
            EXPECT_EQ(match.State().hand_number, hand);
        }
    }

    ASSERT_EQ(out, MoveOutcome::MatchEnded);
    EXPECT_EQ(match.State().phase, Phase::GameOver);
    EXPECT_FALSE(match.Winners().empty());
    EXPECT_EQ(match.Step(), MoveOutcome::MatchEnded);
    EXPECT_EQ(saw_hand_end, match.State().hand_number > 1);
}

TEST(Match, RecordingPlayerSeesEveryCall)
{
    std::vector<std::unique_ptr<Player>> players = RandomPlayers(2, 3);
    players = debug::WrapRecording(players);

    std::vector<PlayerInfo> const seats = Seats(2);
    Match match(Config{ .seed = 3 }, seats, std::move(players));
    for (int i{}; i < 6; ++i) ASSERT_EQ(match.Step(), MoveOutcome::Applied);

    auto const* p0 = debug::AsRecording(match.PlayerAt(0));
    auto const* p1 = debug::AsRecording(match.PlayerAt(1));
    ASSERT_NE(p0, nullptr);
    ASSERT_NE(p1, nullptr);
    EXPECT_EQ(p0->Calls(), 3u);
    EXPECT_EQ(p1->Calls(), 3u);
    ASSERT_TRUE(p1->HasLast());
    EXPECT_EQ(p1->Last(), *match.LastAction());
}

TEST(Match, SeatAndPlayerCountsMustAgree)
{
    std::vector<PlayerInfo> const seats = Seats(3);
    EXPECT_THROW(Match(Config{ .seed = 1 }, seats, RandomPlayers(2, 1)), error::AssertionError);
}
