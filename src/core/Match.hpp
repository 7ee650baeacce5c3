#ifndef KASINO_MATCH_HPP
#define KASINO_MATCH_HPP

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include "Engine.hpp"
#include "Player.hpp"

namespace kasino::core
{
    // Drives a whole match, one action per Step, over as many hands as it
    // takes to reach the target score.
    class Match
    {
    public:
        // Told about every rejected action before the seat is asked again
        using RejectionFn = std::function<void(PlyrIdxT, error::RuleViolation const&)>;

        Match() = delete;
        Match(Config const& config,
              std::span<PlayerInfo const> seats,
              std::vector<std::unique_ptr<Player>> players,
              GameMode mode = GameMode::SinglePlayer);

        // Ask the seat to move, apply, advance. Scores the hand when it ends and
        // deals the next one on the following call.
        auto Step() -> MoveOutcome;
        // Steps until the match ends or max_steps is used up
        auto Run(size_t max_steps) -> MoveOutcome;

        auto OnRejection(RejectionFn fn) -> void { on_rejection_ = std::move(fn); }

        auto State() const noexcept -> GameState const& { return state_; }
        auto GetEngine() const noexcept -> Engine const& { return engine_; }
        auto LastAction() const noexcept -> std::optional<PlayerAction> const& { return last_action_; }
        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }
        auto Winners() const -> std::vector<PlyrIdxT> { return engine_.MatchWinners(state_); }
        auto PlayerAt(PlyrIdxT seat) -> Player* { return players_.at(seat).get(); }

    private:
        auto ScoreHand() -> MoveOutcome;

    private:
        static constexpr uint8_t MaxRejections = 3;

        Engine engine_;
        std::vector<std::unique_ptr<Player>> players_;
        GameState state_;

        uint8_t rejections_{0};
        std::optional<PlayerAction> last_action_{};
        std::optional<error::RuleViolation> last_violation_{};
        RejectionFn on_rejection_{};
    };
}

#endif //KASINO_MATCH_HPP
