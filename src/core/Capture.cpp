#include "Engine.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>
#include "Combinatorics.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(kasino::core::error::RuleViolationCode code) -> kasino::core::error::RuleViolation
    {
        return kasino::core::error::RuleViolation{ .code = code };
    }

    // Order-insensitive fingerprint of a set of combinations
    auto ComboMasks(kasino::core::CardGroups const& groups) -> std::vector<uint64_t>
    {
        std::vector<uint64_t> masks;
        masks.reserve(groups.size());
        for (kasino::core::CardList const& g : groups) masks.push_back(kasino::core::util::IdMask(g));
        std::ranges::sort(masks);
        return masks;
    }
}

namespace kasino::core
{
    auto CaptureOption::TotalCaptured() const -> size_t
    {
        size_t count = singles.size() + opponent_pile_cards.size();
        for (Build const& b : builds) count += b.CardCount();
        for (CardList const& combo : combinations) count += combo.size();
        return count;
    }

    auto CaptureOption::Describe() const -> std::string
    {
        std::vector<std::string> parts;
        if (!singles.empty()) parts.push_back(to_string(singles));
        if (!builds.empty()) parts.push_back(std::format("build(s) of {}", builds.front().value));
        for (CardList const& combo : combinations) parts.push_back(to_string(combo, '+'));
        if (!opponent_pile_cards.empty()) parts.push_back(std::format("stole {}", to_string(opponent_pile_cards)));

        std::string out;
        for (size_t i{}; i < parts.size(); ++i)
        {
            if (i) out += " & ";
            out += parts[i];
        }
        return out;
    }

    auto Engine::FindCaptures(GameState const& state, Card const& hand_card) const -> std::vector<CaptureOption>
    {
        int const value = hand_card.Value();

        CardList singles;
        CardList rest;
        for (Card const& c : state.table)
        {
            if (c.Value() == value) singles.push_back(c);
            else rest.push_back(c);
        }

        std::vector<Build> builds;
        std::ranges::copy_if(state.builds, std::back_inserter(builds),
                             [value](Build const& b) { return b.value == value; });

        CardGroups const combos = search::FindSumCombinations<Card>(rest, value, &Card::Value);

        if (singles.empty() && builds.empty() && combos.empty()) return {};

        CaptureOption base{ .hand_card = hand_card, .singles = singles, .builds = builds };
        if (combos.empty()) return {base};

        std::vector<CaptureOption> options;
        for (CardGroups& selection : search::FindMaxDisjointSets<Card>(combos, &Card::id))
        {
            CaptureOption opt = base;
            opt.combinations = std::move(selection);
            options.push_back(std::move(opt));
        }
        return options;
    }

    auto Engine::ExecuteCapture(GameState const& state, Card const& hand_card, CaptureOption const& option) const
        -> GameState
    {
        PlyrIdxT const actor = state.current;
        error::ErrorContext const ctx{ .seat = actor, .action = ActionType::Capture, .phase = state.phase,
                                       .card = hand_card.id };

        KSN_ASSERT(state.InPlay(), "Capture executed outside of play", ctx);
        KSN_ASSERT(option.hand_card == hand_card, "Capture option belongs to a different card", ctx);

        PlayerState const& mover = state.Current();
        if (!mover.InHand(hand_card))
            KSN_THROW(error::Code::InvalidAction, std::format("{} is not in P{}'s hand",
                                                              to_string(hand_card), static_cast<int>(actor)), ctx);

        uint64_t table_mask = util::IdMask(option.singles);
        for (CardList const& combo : option.combinations) table_mask |= util::IdMask(combo);
        if ((table_mask & util::IdMask(state.table)) != table_mask)
            KSN_THROW(error::Code::InvalidAction, "Capture option references cards not loose on the table", ctx);

        for (Build const& b : option.builds)
        {
            if (state.FindBuild(b.id) == nullptr)
                KSN_THROW(error::Code::InvalidAction, std::format("Capture option references unknown build {}", to_string(b)), ctx);
        }

        GameState next = state;

        // Peel stolen cards off the opponents' pile tops
        for (Card const& stolen : option.opponent_pile_cards)
        {
            bool taken = false;
            for (size_t i{}; i < next.players.size() && !taken; ++i)
            {
                if (i == actor) continue;
                CardList& pile = next.players[i].capture_pile;
                if (!pile.empty() && pile.back() == stolen)
                {
                    pile.pop_back();
                    taken = true;
                }
            }
            if (!taken)
                KSN_THROW(error::Code::InvalidAction, std::format("{} is not on top of an opponent's pile", to_string(stolen)), ctx);
        }

        next.table = util::WithoutIds(state.table, table_mask);
        std::erase_if(next.builds, [&option](Build const& b)
        {
            return std::ranges::any_of(option.builds, [&b](Build const& o) { return o.id == b.id; });
        });

        PlayerState& p = next.players[actor];
        std::erase(p.hand, hand_card);

        // Played card goes on top, after everything it took
        CardList captured;
        captured.insert(captured.end(), option.singles.begin(), option.singles.end());
        for (Build const& b : option.builds)
        {
            Build const* live = state.FindBuild(b.id);
            CardList const cards = live->AllCards();
            captured.insert(captured.end(), cards.begin(), cards.end());
        }
        for (CardList const& combo : option.combinations) captured.insert(captured.end(), combo.begin(), combo.end());
        captured.insert(captured.end(), option.opponent_pile_cards.begin(), option.opponent_pile_cards.end());

        p.capture_pile.insert(p.capture_pile.end(), captured.begin(), captured.end());
        p.capture_pile.push_back(hand_card);
        next.last_capturer = actor;

        next.log.Append(ActionRecord{
            .actor = actor,
            .type = ActionType::Capture,
            .card_played = hand_card,
            .cards_captured = std::move(captured),
            .description = std::format("{} captured {} with {}", p.display_name, option.Describe(), to_string(hand_card))
        });
        return next;
    }

    auto Engine::Capture(GameState const& state, CaptureAction const& action) const -> MoveResult
    {
        using RVC = error::RuleViolationCode;
        PlyrIdxT const actor = state.current;

        if (!state.InPlay())
            return std::unexpected(Viol(RVC::WrongPhase_PlayRequired).with_phase(state.phase).with_actor(actor));
        if (!state.Current().InHand(action.hand_card))
            return std::unexpected(Viol(RVC::Card_NotInHand).with_actor(actor).with_card(action.hand_card));

        std::vector<CaptureOption> const options = FindCaptures(state, action.hand_card);
        if (options.empty())
            return std::unexpected(Viol(RVC::Capture_NothingToCapture)
                                   .with_actor(actor).with_card(action.hand_card)
                                   .with_value(action.hand_card.Value()));

        if (action.combinations.empty())
        {
            if (options.size() != 1)
                return std::unexpected(Viol(RVC::Capture_OptionNotAvailable)
                                       .with_actor(actor).with_card(action.hand_card)
                                       .with_attempted(static_cast<int>(options.size())));
            return ExecuteCapture(state, action.hand_card, options.front());
        }

        std::vector<uint64_t> const wanted = ComboMasks(action.combinations);
        auto const it = std::ranges::find_if(options, [&wanted](CaptureOption const& o)
        {
            return ComboMasks(o.combinations) == wanted;
        });
        if (it == options.end())
            return std::unexpected(Viol(RVC::Capture_OptionNotAvailable).with_actor(actor).with_card(action.hand_card));

        return ExecuteCapture(state, action.hand_card, *it);
    }
}
