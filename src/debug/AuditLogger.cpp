#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <type_traits>
#include <variant>

using namespace kasino::core;

namespace
{

auto s_builds(GameState const& s) -> std::string
{
    std::string body;
    for (size_t i{}; i < s.builds.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("P{}{}", static_cast<int>(s.builds[i].owner), to_string(s.builds[i]));
    }
    return body;
}

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
    case MoveOutcome::Invalid:    return "Invalid";
    case MoveOutcome::Applied:    return "Applied";
    case MoveOutcome::HandEnded:  return "HandEnded";
    case MoveOutcome::MatchEnded: return "MatchEnded";
    }
    return "?";
}

auto s_turn(GameState const& s, PlyrIdxT const actor) -> std::string
{
    return std::format(
        "Turn hand={} actor=P{} phase={} hand=[{}] table=[{}] builds=[{}]\n",
        s.hand_number,
        static_cast<int>(actor),
        to_string(s.phase),
        to_string(s.players.at(actor).hand),
        to_string(s.table),
        s_builds(s)
    );
}

} // anonymous namespace

namespace kasino::core::debug
{

auto to_string(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, CaptureAction>)
            {
                std::string body;
                for (size_t i{}; i < act.combinations.size(); ++i)
                {
                    body += (i ? "|" : "");
                    body += core::to_string(act.combinations[i], '+');
                }
                return std::format("Capture({})[{}]", core::to_string(act.hand_card), body);
            }
            else if constexpr (std::is_same_v<T, BuildAction>)
            {
                return std::format("Build{}({}, table=[{}], stolen=[{}])",
                                   act.declared_value,
                                   act.hand_card ? core::to_string(*act.hand_card) : std::string("--"),
                                   core::to_string(act.table_cards),
                                   core::to_string(act.stolen_cards));
            }
            else if constexpr (std::is_same_v<T, AugmentAction>)
            {
                return std::format("Augment({:#x}, {}, table=[{}], stolen={})",
                                   act.build,
                                   act.hand_card ? core::to_string(*act.hand_card) : std::string("--"),
                                   core::to_string(act.table_cards),
                                   act.stolen_card ? core::to_string(*act.stolen_card) : std::string("--"));
            }
            else if constexpr (std::is_same_v<T, IncreaseAction>)
            {
                return std::format("Increase({:#x}, {})", act.build, core::to_string(act.hand_card));
            }
            else
            {
                return std::format("Drift({})", core::to_string(act.hand_card));
            }
        },
        a
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& state, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", static_cast<int>(state.PlayerCount()));
    for (size_t i{}; i < state.PlayerCount(); ++i)
    {
        out_ << std::format("Seat P{}={} ({})\n", i, state.players[i].display_name, state.players[i].id);
    }
    out_ << std::format("Target={}\n", state.target_score);
    out_.flush();
}

auto AuditLogger::turn(GameState const& s,
                       PlyrIdxT actor,
                       PlayerAction const& a) -> void
{
    out_ << s_turn(s, actor);
    out_ << std::format("Action: {}\n", to_string(a));
}

auto AuditLogger::rejection(PlyrIdxT actor, error::RuleViolation const& v) -> void
{
    out_ << std::format("Rejected: P{} {}\n", static_cast<int>(actor), error::describe(v));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    out_ << std::format("Outcome: {}\n", s_outcome(m));
}

auto AuditLogger::hand_end(GameState const& state, std::span<ScoreBreakdown const> breakdown) -> void
{
    out_ << std::format("HandEnd: hand={} last_capturer={}\n", state.hand_number,
                        state.last_capturer == NoPlayer ? -1 : static_cast<int>(state.last_capturer));
    for (size_t i{}; i < breakdown.size() && i < state.PlayerCount(); ++i)
    {
        out_ << std::format("  P{} pile={} {} match={}\n",
                            i,
                            state.players[i].CapturedCount(),
                            core::to_string(breakdown[i]),
                            state.match_scores.at(i));
    }
}

auto AuditLogger::end(GameState const& state, std::span<PlyrIdxT const> winners) -> void
{
    std::string scores;
    for (size_t i{}; i < state.match_scores.size(); ++i)
    {
        scores += std::format("{}{}:{}", (i ? "," : ""), i, state.match_scores[i]);
    }
    std::string body;
    for (size_t i{}; i < winners.size(); ++i)
    {
        body += std::format("{}P{}", (i ? "," : ""), static_cast<int>(winners[i]));
    }

    out_ << std::format("Scores=[{}]\n", scores);
    out_ << std::format("Winners=[{}]\n", body);
    out_.flush();
}

} // namespace kasino::core::debug
