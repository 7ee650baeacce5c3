// Self-play driver: seats RandomAI players and runs a match to the target score

#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "core/Engine.hpp"
#include "core/Exception.hpp"
#include "core/Match.hpp"
#include "core/RandomAi.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "debug/RecordingPlayer.hpp"

namespace
{
    struct SelfPlayConfig
    {
        std::uint32_t n_players{2};
        std::uint64_t seed{123456789ULL};
        int           target{11};
        std::uint32_t max_hands{50};
        std::optional<std::string> log_path{};
    };

    auto ParseArgs(int argc, char** argv) -> SelfPlayConfig
    {
        SelfPlayConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--target")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.target = static_cast<int>(v); }
            }
            else if (arg == "--hands")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_hands = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--log")
            {
                if (i + 1 < argc) { cfg.log_path = argv[++i]; }
            }
            else
            {
                std::print("[kasino] ignoring unknown argument {}\n", arg);
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace kasino::core;

    SelfPlayConfig const sc = ParseArgs(argc, argv);
    if (sc.n_players < constants::MinPlayers || sc.n_players > constants::MaxPlayers)
    {
        std::print("[kasino] --players must be between {} and {}\n", constants::MinPlayers, constants::MaxPlayers);
        return 1;
    }

    Config cfg{};
    cfg.target_score = sc.target;
    cfg.seed = sc.seed;

    std::vector<PlayerInfo> seats;
    std::vector<std::unique_ptr<Player>> players;
    for (std::uint32_t i = 0; i < sc.n_players; ++i)
    {
        seats.push_back(PlayerInfo{ .id = std::format("ai-{}", i), .display_name = std::format("RandomAI {}", i) });
        players.emplace_back(std::make_unique<RandomAI>(sc.seed + static_cast<uint64_t>(i * 1337u)));
    }
    players = debug::WrapRecording(players);

    std::print("[kasino] {} players, seed {}, target {}\n", sc.n_players, sc.seed, sc.target);

    try
    {
        Match match(cfg, seats, std::move(players));

        std::optional<debug::AuditLogger> audit{};
        if (sc.log_path)
        {
            audit.emplace(*sc.log_path);
            audit->start(match.State(), sc.seed);
        }
        match.OnRejection([&audit](PlyrIdxT seat, error::RuleViolation const& v)
        {
            std::print("[kasino] P{} rejected: {}\n", static_cast<int>(seat), error::describe(v));
            if (audit) audit->rejection(seat, v);
        });

        MoveOutcome outcome{MoveOutcome::Applied};
        while (outcome != MoveOutcome::MatchEnded)
        {
            GameState const before = match.State();
            PlyrIdxT const actor = before.current;

            outcome = match.Step();
            debug::CheckInvariants(match.State());

            if (audit)
            {
                auto const* rec = debug::AsRecording(match.PlayerAt(actor));
                if (before.InPlay() && rec && rec->HasLast()) audit->turn(before, actor, rec->Last());
                audit->outcome(outcome);
                if (outcome == MoveOutcome::HandEnded || outcome == MoveOutcome::MatchEnded)
                {
                    std::vector<ScoreBreakdown> const breakdown = match.GetEngine().ScoreBreakdowns(match.State());
                    audit->hand_end(match.State(), breakdown);
                }
            }

            if (outcome == MoveOutcome::HandEnded || outcome == MoveOutcome::MatchEnded)
            {
                GameState const& s = match.State();
                std::string scores;
                for (size_t i{}; i < s.match_scores.size(); ++i)
                {
                    scores += std::format("{}P{}={}", (i ? " " : ""), i, s.match_scores[i]);
                }
                std::print("[kasino] hand {} done: {}\n", s.hand_number, scores);
                if (outcome == MoveOutcome::HandEnded && s.hand_number >= sc.max_hands) break;
            }
        }

        std::vector<PlyrIdxT> const winners = match.Winners();
        if (audit) audit->end(match.State(), winners);

        if (winners.empty())
        {
            std::print("[kasino] stopped after {} hand(s) without a winner\n", sc.max_hands);
            return 0;
        }
        for (PlyrIdxT w : winners)
        {
            std::print("[kasino] winner: {}\n", match.State().players[w].display_name);
        }
    }
    catch (error::EngineError const& e)
    {
        std::print("{}", e.to_str());
        return 2;
    }

    return 0;
}
