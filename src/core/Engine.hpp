#ifndef KASINO_ENGINE_HPP
#define KASINO_ENGINE_HPP

#include <expected>
#include <random>
#include <span>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Capture.hpp"
#include "Exception.hpp"
#include "Scoring.hpp"
#include "State.hpp"

namespace kasino::core
{
    // Rejected moves carry the reason; result.value_or(input) is the unchanged state.
    using MoveResult = std::expected<GameState, error::RuleViolation>;

    // Rules engine. Every operation is a pure transform of the snapshot it is
    // handed; the only state the engine keeps is its config and the shuffle rng.
    class Engine
    {
    public:
        explicit Engine(Config const& config);

        // Dealing. The deck overloads deal the given order instead of shuffling.
        auto InitializeGame(std::span<PlayerInfo const> players, GameMode mode) -> GameState;
        auto InitializeGame(std::span<PlayerInfo const> players, GameMode mode, CardList deck) const -> GameState;
        auto StartNextHand(GameState const& state) -> GameState;
        auto StartNextHand(GameState const& state, CardList deck) const -> GameState;

        // Capture
        auto FindCaptures(GameState const& state, Card const& hand_card) const -> std::vector<CaptureOption>;
        // option must come from FindCaptures on this same state; anything else throws
        auto ExecuteCapture(GameState const& state, Card const& hand_card, CaptureOption const& option) const
            -> GameState;

        // Builds
        auto CreateBuild(GameState const& state, BuildAction const& action) const -> MoveResult;
        auto AugmentBuild(GameState const& state, AugmentAction const& action) const -> MoveResult;
        auto IncreaseBuild(GameState const& state, IncreaseAction const& action) const -> MoveResult;

        auto Drift(GameState const& state, Card const& hand_card) const -> MoveResult;

        // Turn pointer, second deal, end-of-hand sweep
        auto NextTurn(GameState const& state) const -> GameState;

        // Scoring
        auto CalculateScores(GameState const& state) const -> std::vector<int>;
        auto ScoreBreakdowns(GameState const& state) const -> std::vector<ScoreBreakdown>;
        auto ApplyScores(GameState const& state) const -> GameState;
        auto MatchWinners(GameState const& state) const -> std::vector<PlyrIdxT>;

        // Dispatch a player's action to the matching operation
        auto Apply(GameState const& state, PlayerAction const& action) const -> MoveResult;
        // Every move the current seat can make with a hand card, each one accepted by Apply
        auto LegalActions(GameState const& state) const -> std::vector<PlayerAction>;

    private:
        auto Capture(GameState const& state, CaptureAction const& action) const -> MoveResult;
        auto Deal(std::vector<PlayerState> players, GameMode mode, CardList deck) const -> GameState;
        auto DealSecondRound(GameState const& state) const -> GameState;
        auto EndHand(GameState const& state) const -> GameState;

    private:
        Config cfg_;
        std::mt19937_64 rng_;
    };
}

#endif //KASINO_ENGINE_HPP
