#ifndef KASINO_SCORING_HPP
#define KASINO_SCORING_HPP

#include <string>
#include <vector>
#include "State.hpp"

namespace kasino::core
{
    namespace constants
    {
        inline constexpr int MostCardsPoints = 2;
        inline constexpr int MostCardsTiedPoints = 1;
        inline constexpr size_t SpadesMinorThreshold = 5;
        inline constexpr size_t SpadesMajorThreshold = 6;
        inline constexpr int SpyTwoPoints = 1;
        inline constexpr int BigTenPoints = 2;
        inline constexpr int AcePoints = 1;
    }

    struct ScoreBreakdown
    {
        int most_cards{};
        int spades{};
        int spy_two{};
        int big_ten{};
        int aces{};

        [[nodiscard]]
        constexpr auto Total() const noexcept -> int { return most_cards + spades + spy_two + big_ten + aces; }

        auto operator==(ScoreBreakdown const&) const -> bool = default;
    };

    // Scores one seat's capture pile. has_most is whether the seat holds the
    // (possibly shared) highest card count; tied whether that count is shared.
    auto ScorePile(PlayerState const& p, bool has_most, bool tied) -> ScoreBreakdown;

    // Breakdown per seat, in seat order
    auto ScoreHand(GameState const& state) -> std::vector<ScoreBreakdown>;

    auto to_string(ScoreBreakdown const& b) -> std::string;
}

#endif //KASINO_SCORING_HPP
