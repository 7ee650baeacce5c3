#include "Match.hpp"

#include <algorithm>
#include <utility>

namespace kasino::core
{
    Match::Match(Config const& config,
                 std::span<PlayerInfo const> seats,
                 std::vector<std::unique_ptr<Player>> players,
                 GameMode const mode) :
        engine_(config),
        players_(std::move(players))
    {
        KSN_ASSERT(players_.size() == seats.size(), "One player per seat required");
        KSN_ASSERT(!std::ranges::any_of(players_,
                                        [](std::unique_ptr<Player> const& p) { return !p; }), "Invalid player in match");
        state_ = engine_.InitializeGame(seats, mode);
    }

    auto Match::ScoreHand() -> MoveOutcome
    {
        state_ = engine_.ApplyScores(state_);
        return state_.phase == Phase::GameOver ? MoveOutcome::MatchEnded : MoveOutcome::HandEnded;
    }

    auto Match::Step() -> MoveOutcome
    {
        if (state_.phase == Phase::GameOver) return MoveOutcome::MatchEnded;
        if (state_.phase == Phase::Scoring)
        {
            if (!state_.hand_scored) return ScoreHand();
            state_ = engine_.StartNextHand(state_);
        }

        PlyrIdxT const actor = state_.current;
        PlayerAction action = players_[actor]->Play(state_, actor);
        MoveResult result = engine_.Apply(state_, action);

        if (!result.has_value())
        {
            last_violation_ = result.error();
            if (on_rejection_) on_rejection_(actor, *last_violation_);
            if (++rejections_ < MaxRejections) return MoveOutcome::Invalid;

            // Same seat keeps failing, move on its behalf
            std::vector<PlayerAction> const legal = engine_.LegalActions(state_);
            error::ErrorContext const ctx{ .seat = actor, .phase = state_.phase };
            KSN_ASSERT(!legal.empty(), "Seat has no legal action", ctx);
            action = legal.front();
            result = engine_.Apply(state_, action);
            KSN_ASSERT(result.has_value(), "Legal action rejected by the engine", ctx);
        }

        rejections_ = 0;
        last_action_ = std::move(action);
        state_ = engine_.NextTurn(*result);

        if (state_.phase == Phase::Scoring) return ScoreHand();
        return MoveOutcome::Applied;
    }

    auto Match::Run(size_t const max_steps) -> MoveOutcome
    {
        MoveOutcome last{MoveOutcome::Applied};
        for (size_t i{}; i < max_steps && last != MoveOutcome::MatchEnded; ++i)
        {
            last = Step();
        }
        return last;
    }
}
