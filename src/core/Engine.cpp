#include "Engine.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <ranges>
#include <type_traits>
#include <utility>
#include "Deck.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(kasino::core::error::RuleViolationCode code) -> kasino::core::error::RuleViolation
    {
        return kasino::core::error::RuleViolation{ .code = code };
    }

    auto AllEqual(std::vector<int> const& v) -> bool
    {
        return std::ranges::adjacent_find(v, std::ranges::not_equal_to{}) == v.end();
    }
}

namespace kasino::core
{
    Engine::Engine(Config const& config) :
        cfg_(config),
        rng_{cfg_.seed}
    {
        KSN_ASSERT(cfg_.target_score > 0, "Target score must be positive");
        KSN_ASSERT(cfg_.max_action_log > 0, "Action log capacity must be positive");
    }

    auto Engine::InitializeGame(std::span<PlayerInfo const> players, GameMode const mode) -> GameState
    {
        return InitializeGame(players, mode, ShuffledDeck(rng_));
    }

    auto Engine::InitializeGame(std::span<PlayerInfo const> players, GameMode const mode, CardList deck) const
        -> GameState
    {
        KSN_ASSERT(players.size() >= constants::MinPlayers && players.size() <= constants::MaxPlayers,
                   std::format("Kasino needs 2 to 4 players, got {}", players.size()));

        std::vector<PlayerState> seats;
        seats.reserve(players.size());
        for (PlayerInfo const& info : players)
        {
            seats.push_back(PlayerState{ .id = info.id, .display_name = info.display_name });
        }
        return Deal(std::move(seats), mode, std::move(deck));
    }

    auto Engine::StartNextHand(GameState const& state) -> GameState
    {
        return StartNextHand(state, ShuffledDeck(rng_));
    }

    auto Engine::StartNextHand(GameState const& state, CardList deck) const -> GameState
    {
        KSN_ASSERT(state.phase == Phase::Scoring && state.hand_scored,
                   std::format("Next hand requested in phase {} (scored={})", to_string(state.phase), state.hand_scored));

        std::vector<PlayerState> seats;
        seats.reserve(state.players.size());
        for (PlayerState const& p : state.players)
        {
            seats.push_back(PlayerState{ .id = p.id, .display_name = p.display_name });
        }

        GameState next = Deal(std::move(seats), state.mode, std::move(deck));
        next.match_scores = state.match_scores;
        next.target_score = state.target_score;
        next.hand_number = state.hand_number + 1;
        next.log = state.log;
        return next;
    }

    auto Engine::Deal(std::vector<PlayerState> players, GameMode const mode, CardList deck) const -> GameState
    {
        util::CardUniqueChecker checker{};
        checker.AddAll(deck);
        KSN_ASSERT(deck.size() == constants::DeckSize && !checker.ContainsDup(),
                   "Dealing requires a complete 40-card deck");

        size_t const n = players.size();
        // 2p: 10 each now, 10 each later. 3p: 13 each, one face up. 4p: 10 each.
        size_t const per_hand = (n == 3) ? 13 : 10;

        auto it = deck.begin();
        for (PlayerState& p : players)
        {
            p.hand.assign(it, it + static_cast<std::ptrdiff_t>(per_hand));
            it += static_cast<std::ptrdiff_t>(per_hand);
        }

        GameState s{};
        s.mode = mode;
        s.phase = Phase::Playing;
        s.current = 0;
        if (n == 2) s.draw_pile.assign(it, deck.end());
        else s.table.assign(it, deck.end());

        s.players = std::move(players);
        s.match_scores.assign(n, 0);
        s.target_score = cfg_.target_score;
        s.log = ActionLog{cfg_.max_action_log};
        return s;
    }

    auto Engine::DealSecondRound(GameState const& state) const -> GameState
    {
        KSN_ASSERT(state.PlayerCount() == 2, "Second deal is a two-player rule");
        KSN_ASSERT(state.draw_pile.size() == 2 * constants::SecondDealSize,
                   std::format("Second deal expects 20 cards, draw pile has {}", state.draw_pile.size()));

        GameState next = state;
        auto const split = next.draw_pile.begin() + static_cast<std::ptrdiff_t>(constants::SecondDealSize);
        next.players[0].hand.assign(next.draw_pile.begin(), split);
        next.players[1].hand.assign(split, next.draw_pile.end());
        next.draw_pile.clear();
        next.second_deal = true;
        next.phase = Phase::PlayingSecond;
        next.current = 0;
        return next;
    }

    auto Engine::EndHand(GameState const& state) const -> GameState
    {
        GameState next = state;
        next.phase = Phase::Scoring;
        next.hand_scored = false;

        // Nobody captured: nobody sweeps, the cards stay where they are
        if (state.last_capturer == NoPlayer) return next;

        CardList swept = state.table;
        CardList const build_cards = state.BuildCards();
        swept.insert(swept.end(), build_cards.begin(), build_cards.end());

        next.table.clear();
        next.builds.clear();
        if (swept.empty()) return next;

        PlayerState& p = next.players[state.last_capturer];
        p.capture_pile.insert(p.capture_pile.end(), swept.begin(), swept.end());
        next.log.Append(ActionRecord{
            .actor = state.last_capturer,
            .type = ActionType::Sweep,
            .cards_captured = swept,
            .description = std::format("{} swept {} remaining card(s)", p.display_name, swept.size())
        });
        return next;
    }

    auto Engine::Drift(GameState const& state, Card const& hand_card) const -> MoveResult
    {
        using RVC = error::RuleViolationCode;
        PlyrIdxT const actor = state.current;

        if (!state.InPlay())
            return std::unexpected(Viol(RVC::WrongPhase_PlayRequired).with_phase(state.phase).with_actor(actor));
        if (!state.Current().InHand(hand_card))
            return std::unexpected(Viol(RVC::Card_NotInHand).with_actor(actor).with_card(hand_card));
        if (!state.CanCurrentDrift())
            return std::unexpected(Viol(RVC::Drift_OwnsBuild).with_actor(actor).with_card(hand_card));

        GameState next = state;
        std::erase(next.players[actor].hand, hand_card);
        next.table.push_back(hand_card);
        next.log.Append(ActionRecord{
            .actor = actor,
            .type = ActionType::Drift,
            .card_played = hand_card,
            .description = std::format("{} drifted {}", state.Current().display_name, to_string(hand_card))
        });
        return next;
    }

    auto Engine::NextTurn(GameState const& state) const -> GameState
    {
        if (!state.InPlay())
            KSN_THROW(error::Code::Rules, std::format("NextTurn called in phase {}", to_string(state.phase)),
                      error::ErrorContext{ .seat = state.current, .phase = state.phase });

        if (state.AllHandsEmpty())
        {
            if (state.PlayerCount() == 2 && !state.second_deal && !state.draw_pile.empty())
                return DealSecondRound(state);
            return EndHand(state);
        }

        // Seats that have run out sit the rest of the round out
        GameState next = state;
        PlyrIdxT seat = state.current;
        for (size_t i{}; i < state.PlayerCount(); ++i)
        {
            seat = state.NextSeat(seat);
            if (!state.players[seat].hand.empty()) break;
        }
        next.current = seat;
        return next;
    }

    auto Engine::ScoreBreakdowns(GameState const& state) const -> std::vector<ScoreBreakdown>
    {
        return ScoreHand(state);
    }

    auto Engine::CalculateScores(GameState const& state) const -> std::vector<int>
    {
        std::vector<int> totals;
        for (ScoreBreakdown const& b : ScoreHand(state)) totals.push_back(b.Total());
        return totals;
    }

    auto Engine::ApplyScores(GameState const& state) const -> GameState
    {
        KSN_ASSERT(state.phase == Phase::Scoring, std::format("Scores applied in phase {}", to_string(state.phase)),
                   error::ErrorContext{ .phase = state.phase });
        KSN_ASSERT(!state.hand_scored, "Hand already scored");
        KSN_ASSERT(state.match_scores.size() == state.PlayerCount(), "Match ledger out of step with seats");

        std::vector<int> const hand = CalculateScores(state);
        GameState next = state;
        for (size_t i{}; i < hand.size(); ++i) next.match_scores[i] += hand[i];

        // Full tie at both levels: a big pile breaks it
        if (AllEqual(hand) && AllEqual(next.match_scores))
        {
            for (size_t i{}; i < next.players.size(); ++i)
            {
                if (next.players[i].CapturedCount() >= constants::TieBreakCardCount) ++next.match_scores[i];
            }
        }

        next.hand_scored = true;
        bool const reached = std::ranges::any_of(next.match_scores,
                                                 [&](int s) { return s >= next.target_score; });
        next.phase = reached ? Phase::GameOver : Phase::Scoring;
        return next;
    }

    auto Engine::MatchWinners(GameState const& state) const -> std::vector<PlyrIdxT>
    {
        if (state.match_scores.empty()) return {};
        int const best = std::ranges::max(state.match_scores);
        if (best < state.target_score) return {};

        std::vector<PlyrIdxT> winners;
        for (size_t i{}; i < state.match_scores.size(); ++i)
        {
            if (state.match_scores[i] == best) winners.push_back(static_cast<PlyrIdxT>(i));
        }
        return winners;
    }

    auto Engine::Apply(GameState const& state, PlayerAction const& action) const -> MoveResult
    {
        return std::visit([&]<typename T0>(T0 const& act) -> MoveResult
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, CaptureAction>)
            {
                return Capture(state, act);
            }
            else if constexpr (std::is_same_v<T, BuildAction>)
            {
                return CreateBuild(state, act);
            }
            else if constexpr (std::is_same_v<T, AugmentAction>)
            {
                return AugmentBuild(state, act);
            }
            else if constexpr (std::is_same_v<T, IncreaseAction>)
            {
                return IncreaseBuild(state, act);
            }
            else if constexpr (std::is_same_v<T, DriftAction>)
            {
                return Drift(state, act.hand_card);
            }
            else
            {
                return std::unexpected(Viol(error::RuleViolationCode::Internal_Unreachable));
            }
        }, action);
    }

    auto Engine::LegalActions(GameState const& state) const -> std::vector<PlayerAction>
    {
        if (!state.InPlay()) return {};

        PlyrIdxT const actor = state.current;
        std::vector<PlayerAction> candidates;

        for (Card const& card : state.Current().hand)
        {
            std::vector<CaptureOption> const options = FindCaptures(state, card);
            for (CaptureOption const& opt : options)
            {
                candidates.emplace_back(CaptureAction{
                    .hand_card = card,
                    .combinations = options.size() > 1 ? opt.combinations : CardGroups{}
                });
            }

            for (Card const& t : state.table)
            {
                // Sum build, and the same-value pair build
                if (card.Value() + t.Value() <= constants::MaxBuildValue)
                    candidates.emplace_back(BuildAction{ .hand_card = card, .table_cards = {t},
                                                         .declared_value = card.Value() + t.Value() });
                if (card.Value() == t.Value())
                    candidates.emplace_back(BuildAction{ .hand_card = card, .table_cards = {t},
                                                         .declared_value = card.Value() });
            }

            for (Build const& b : state.builds)
            {
                if (b.owner == actor)
                {
                    candidates.emplace_back(AugmentAction{ .build = b.id, .hand_card = card });
                    for (Card const& t : state.table)
                    {
                        if (card.Value() + t.Value() == b.value)
                            candidates.emplace_back(AugmentAction{ .build = b.id, .table_cards = {t}, .hand_card = card });
                    }
                }
                else
                {
                    candidates.emplace_back(IncreaseAction{ .build = b.id, .hand_card = card });
                }
            }

            candidates.emplace_back(DriftAction{ .hand_card = card });
        }

        std::vector<PlayerAction> legal;
        for (PlayerAction& a : candidates)
        {
            if (Apply(state, a).has_value()) legal.push_back(std::move(a));
        }
        return legal;
    }
}
