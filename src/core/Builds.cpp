#include "Engine.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>
#include "Combinatorics.hpp"
#include "Util.hpp"

namespace
{
    using kasino::core::Card;
    using kasino::core::CardList;
    using kasino::core::GameState;
    using kasino::core::PlyrIdxT;
    using kasino::core::error::RuleViolation;
    using kasino::core::error::RuleViolationCode;
    using kasino::core::error::ValidateResult;

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    // Each stolen card must sit on top of an opponent's pile. Two cards can
    // never both be the top of one pile, so a pile gives up at most one.
    auto CheckStolen(GameState const& state, PlyrIdxT const actor, CardList const& stolen) -> ValidateResult
    {
        for (Card const& c : stolen)
        {
            bool const on_top = std::ranges::any_of(state.OpponentPileTops(actor),
                                                    [&c](auto const& top) { return top.second == c; });
            if (!on_top)
                return std::unexpected(Viol(RuleViolationCode::Card_NotOnPileTop).with_actor(actor).with_card(c));
        }
        return {};
    }

    auto CheckOnTable(GameState const& state, PlyrIdxT const actor, CardList const& cards) -> ValidateResult
    {
        for (Card const& c : cards)
        {
            if (!state.OnTable(c))
                return std::unexpected(Viol(RuleViolationCode::Card_NotOnTable).with_actor(actor).with_card(c));
        }
        return {};
    }

    auto PeelStolen(GameState& state, PlyrIdxT const actor, CardList const& stolen) -> void
    {
        for (Card const& c : stolen)
        {
            for (size_t i{}; i < state.players.size(); ++i)
            {
                if (i == actor) continue;
                CardList& pile = state.players[i].capture_pile;
                if (!pile.empty() && pile.back() == c)
                {
                    pile.pop_back();
                    break;
                }
            }
        }
    }
}

namespace kasino::core
{
    auto Engine::CreateBuild(GameState const& state, BuildAction const& action) const -> MoveResult
    {
        using RVC = error::RuleViolationCode;
        PlyrIdxT const actor = state.current;
        PlayerState const& mover = state.Current();
        int const value = action.declared_value;

        if (!state.InPlay())
            return std::unexpected(Viol(RVC::WrongPhase_PlayRequired).with_phase(state.phase).with_actor(actor));

        if (value < constants::MinRank || value > constants::MaxBuildValue)
            return std::unexpected(Viol(RVC::Build_ValueOutOfRange).with_actor(actor).with_value(value));

        if (!action.stolen_cards.empty() && !action.hand_card)
            return std::unexpected(Viol(RVC::Build_StealWithoutHandCard).with_actor(actor));

        if (action.hand_card && !mover.InHand(*action.hand_card))
            return std::unexpected(Viol(RVC::Card_NotInHand).with_actor(actor).with_card(*action.hand_card));

        if (auto const ok = CheckOnTable(state, actor, action.table_cards); !ok) return std::unexpected(ok.error());
        if (auto const ok = CheckStolen(state, actor, action.stolen_cards); !ok) return std::unexpected(ok.error());

        CardList contributed = action.table_cards;
        if (action.hand_card) contributed.push_back(*action.hand_card);
        contributed.insert(contributed.end(), action.stolen_cards.begin(), action.stolen_cards.end());

        util::CardUniqueChecker checker{};
        checker.AddAll(contributed);
        if (checker.ContainsDup())
            return std::unexpected(Viol(RVC::Card_Duplicate).with_actor(actor));
        if (contributed.empty())
            return std::unexpected(Viol(RVC::Build_Empty).with_actor(actor).with_value(value));

        // One build value per owner at a time
        for (Build const* owned : state.OwnedBuilds(actor))
        {
            if (owned->value != value)
                return std::unexpected(Viol(RVC::Build_OwnsOtherValue)
                                       .with_actor(actor).with_value(value)
                                       .with_build(owned->id).with_attempted(owned->value));
        }

        if (!mover.HoldsValue(value, action.hand_card))
            return std::unexpected(Viol(RVC::Build_NoCaptureCard).with_actor(actor).with_value(value));

        if (auto const it = std::ranges::find_if(contributed, [value](Card const& c) { return c.Value() > value; });
            it != contributed.end())
            return std::unexpected(Viol(RVC::Build_CardExceedsValue).with_actor(actor).with_value(value).with_card(*it));

        std::optional<CardGroups> groups = search::FindExactPartition<Card>(contributed, value, &Card::Value);
        if (!groups)
            return std::unexpected(Viol(RVC::Build_NoExactPartition)
                                   .with_actor(actor).with_value(value)
                                   .with_attempted(util::SumValues(contributed)));

        // A loose card of the build's value cannot stay beside it
        uint64_t table_mask = util::IdMask(action.table_cards);
        for (Card const& loose : state.table)
        {
            if (loose.Value() == value && (table_mask & util::CardBit(loose)) == 0)
            {
                groups->push_back(CardList{loose});
                table_mask |= util::CardBit(loose);
            }
        }

        GameState next = state;
        Build const* existing = state.BuildOf(actor, value);
        Build result{};
        if (existing)
        {
            auto const it = std::ranges::find(next.builds, existing->id, &Build::id);
            it->groups.insert(it->groups.end(), groups->begin(), groups->end());
            result = *it;
        }
        else
        {
            result = Build{ .id = MakeBuildId(*groups), .owner = actor, .value = value, .groups = std::move(*groups) };
            next.builds.push_back(result);
        }

        next.table = util::WithoutIds(state.table, table_mask);
        if (action.hand_card) std::erase(next.players[actor].hand, *action.hand_card);
        PeelStolen(next, actor, action.stolen_cards);

        ActionType const type = !action.stolen_cards.empty() ? ActionType::StealAndBuild
                              : existing ? ActionType::BuildAugment
                              : ActionType::BuildCreate;

        std::string description = std::format("{} built {}", mover.display_name, to_string(result));
        if (!action.stolen_cards.empty()) description += std::format(" (stole {})", to_string(action.stolen_cards));

        std::optional<Card> played = action.hand_card;
        if (!played && !action.table_cards.empty()) played = action.table_cards.front();

        next.log.Append(ActionRecord{
            .actor = actor,
            .type = type,
            .card_played = played,
            .cards_captured = action.stolen_cards,
            .description = std::move(description)
        });
        return next;
    }

    auto Engine::AugmentBuild(GameState const& state, AugmentAction const& action) const -> MoveResult
    {
        using RVC = error::RuleViolationCode;
        PlyrIdxT const actor = state.current;
        PlayerState const& mover = state.Current();

        if (!state.InPlay())
            return std::unexpected(Viol(RVC::WrongPhase_PlayRequired).with_phase(state.phase).with_actor(actor));

        Build const* build = state.FindBuild(action.build);
        if (!build)
            return std::unexpected(Viol(RVC::Augment_UnknownBuild).with_actor(actor).with_build(action.build));
        if (build->owner != actor)
            return std::unexpected(Viol(RVC::Augment_NotOwner)
                                   .with_actor(actor).with_owner(build->owner).with_build(build->id));

        if (action.stolen_card && !action.hand_card)
            return std::unexpected(Viol(RVC::Build_StealWithoutHandCard).with_actor(actor).with_build(build->id));

        if (action.hand_card && !mover.InHand(*action.hand_card))
            return std::unexpected(Viol(RVC::Card_NotInHand).with_actor(actor).with_card(*action.hand_card));

        if (auto const ok = CheckOnTable(state, actor, action.table_cards); !ok) return std::unexpected(ok.error());

        CardList stolen;
        if (action.stolen_card) stolen.push_back(*action.stolen_card);
        if (auto const ok = CheckStolen(state, actor, stolen); !ok) return std::unexpected(ok.error());

        CardList group = action.table_cards;
        if (action.hand_card) group.push_back(*action.hand_card);
        group.insert(group.end(), stolen.begin(), stolen.end());

        util::CardUniqueChecker checker{};
        checker.AddAll(group);
        if (checker.ContainsDup())
            return std::unexpected(Viol(RVC::Card_Duplicate).with_actor(actor));
        if (group.empty())
            return std::unexpected(Viol(RVC::Build_Empty).with_actor(actor).with_build(build->id));

        int const sum = util::SumValues(group);
        if (sum != build->value)
            return std::unexpected(Viol(RVC::Augment_SumMismatch)
                                   .with_actor(actor).with_build(build->id)
                                   .with_value(build->value).with_attempted(sum));

        if (action.hand_card && !mover.HoldsValue(build->value, action.hand_card))
            return std::unexpected(Viol(RVC::Build_NoCaptureCard).with_actor(actor).with_value(build->value));

        GameState next = state;
        auto const it = std::ranges::find(next.builds, build->id, &Build::id);
        it->groups.push_back(group);

        next.table = util::WithoutIds(state.table, util::IdMask(action.table_cards));
        if (action.hand_card) std::erase(next.players[actor].hand, *action.hand_card);
        PeelStolen(next, actor, stolen);

        std::optional<Card> played = action.hand_card;
        if (!played && !action.table_cards.empty()) played = action.table_cards.front();

        next.log.Append(ActionRecord{
            .actor = actor,
            .type = ActionType::BuildAugment,
            .card_played = played,
            .cards_captured = std::move(stolen),
            .description = std::format("{} augmented build to {}", mover.display_name, to_string(*it))
        });
        return next;
    }

    auto Engine::IncreaseBuild(GameState const& state, IncreaseAction const& action) const -> MoveResult
    {
        using RVC = error::RuleViolationCode;
        PlyrIdxT const actor = state.current;
        PlayerState const& mover = state.Current();
        Card const& card = action.hand_card;

        if (!state.InPlay())
            return std::unexpected(Viol(RVC::WrongPhase_PlayRequired).with_phase(state.phase).with_actor(actor));

        if (!mover.InHand(card))
            return std::unexpected(Viol(RVC::Card_NotInHand).with_actor(actor).with_card(card));

        Build const* build = state.FindBuild(action.build);
        if (!build)
            return std::unexpected(Viol(RVC::Increase_UnknownBuild).with_actor(actor).with_build(action.build));
        if (build->owner == actor)
            return std::unexpected(Viol(RVC::Increase_OwnBuild).with_actor(actor).with_build(build->id));
        if (build->IsAugmented())
            return std::unexpected(Viol(RVC::Increase_AugmentedBuild)
                                   .with_actor(actor).with_owner(build->owner).with_build(build->id));

        int const value = build->value + card.Value();
        if (value > constants::MaxBuildValue)
            return std::unexpected(Viol(RVC::Increase_ValueAboveTen)
                                   .with_actor(actor).with_build(build->id).with_attempted(value));

        if (!mover.HoldsValue(value, card))
            return std::unexpected(Viol(RVC::Build_NoCaptureCard).with_actor(actor).with_value(value));

        // Builds the increaser already owns still need their capture cards afterwards
        for (Build const* owned : state.OwnedBuilds(actor))
        {
            if (owned->value != value && !mover.HoldsValue(owned->value, card))
                return std::unexpected(Viol(RVC::Build_NoCaptureCard)
                                       .with_actor(actor).with_value(owned->value).with_build(owned->id));
        }

        CardList increased = build->AllCards();
        increased.push_back(card);

        GameState next = state;
        if (Build const* target = state.BuildOf(actor, value))
        {
            auto const merged = std::ranges::find(next.builds, target->id, &Build::id);
            merged->groups.push_back(std::move(increased));
            std::erase_if(next.builds, [id = build->id](Build const& b) { return b.id == id; });
        }
        else
        {
            auto const it = std::ranges::find(next.builds, build->id, &Build::id);
            it->owner = actor;
            it->value = value;
            it->groups = CardGroups{std::move(increased)};
        }

        std::erase(next.players[actor].hand, card);

        next.log.Append(ActionRecord{
            .actor = actor,
            .type = ActionType::BuildIncrease,
            .card_played = card,
            .description = std::format("{} increased build to {}", mover.display_name, value)
        });
        return next;
    }
}
