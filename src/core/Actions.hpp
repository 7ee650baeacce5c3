#ifndef KASINO_ACTIONS_HPP
#define KASINO_ACTIONS_HPP

#include <optional>
#include <string_view>
#include <variant>
#include "Types.hpp"

namespace kasino::core
{
    // Cards are referenced by id; the engine resolves them against the state.

    // combinations selects among overlapping capture options; leave empty when
    // the played card has a single option.
    struct CaptureAction
    {
        Card hand_card;
        CardGroups combinations{};

        auto operator==(CaptureAction const&) const -> bool = default;
    };

    struct BuildAction
    {
        std::optional<Card> hand_card{};
        CardList table_cards{};
        int declared_value{};
        CardList stolen_cards{};

        auto operator==(BuildAction const&) const -> bool = default;
    };

    struct AugmentAction
    {
        BuildId build{};
        CardList table_cards{};
        std::optional<Card> hand_card{};
        std::optional<Card> stolen_card{};

        auto operator==(AugmentAction const&) const -> bool = default;
    };

    struct IncreaseAction
    {
        BuildId build{};
        Card hand_card;

        auto operator==(IncreaseAction const&) const -> bool = default;
    };

    struct DriftAction
    {
        Card hand_card;

        auto operator==(DriftAction const&) const -> bool = default;
    };

    using PlayerAction = std::variant<
      CaptureAction, BuildAction, AugmentAction, IncreaseAction, DriftAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        HandEnded,
        MatchEnded
    };

    enum class Phase : uint8_t
    {
        Dealing,
        Playing,
        PlayingSecond,
        Scoring,
        GameOver
    };

    enum class ActionType : uint8_t
    {
        Capture,
        BuildCreate,
        BuildAugment,
        BuildIncrease,
        StealAndBuild,
        Drift,
        Sweep
    };

    auto to_string(Phase p) -> std::string_view;
    auto to_string(ActionType t) -> std::string_view;
} // namespace kasino::core

#endif //KASINO_ACTIONS_HPP
