#ifndef KASINO_AUDITLOGGER_HPP
#define KASINO_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Scoring.hpp"
#include "../core/Types.hpp"

namespace kasino::core::debug
{
    // Plain-text transcript of a match, one line per event
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, seats, target)
        auto start(GameState const& state, std::uint64_t seed) -> void;

        // Per turn (before Apply/NextTurn): table, builds, actor and proposed action
        auto turn(GameState const& s,
                  PlyrIdxT actor,
                  PlayerAction const& a) -> void;

        // Action refused by the engine; the seat moves again
        auto rejection(PlyrIdxT actor, error::RuleViolation const& v) -> void;

        auto outcome(MoveOutcome m) -> void;

        // After scoring a hand: pile sizes, breakdown and running match totals
        auto hand_end(GameState const& state, std::span<ScoreBreakdown const> breakdown) -> void;

        // Match footer
        auto end(GameState const& state, std::span<PlyrIdxT const> winners) -> void;

    private:
        std::ofstream out_;
    };

    auto to_string(PlayerAction const& a) -> std::string;
}

#endif //KASINO_AUDITLOGGER_HPP
