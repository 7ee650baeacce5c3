#include "Scoring.hpp"

#include <algorithm>
#include <format>

namespace kasino::core
{
    auto ScorePile(PlayerState const& p, bool const has_most, bool const tied) -> ScoreBreakdown
    {
        ScoreBreakdown b{};
        if (has_most) b.most_cards = tied ? constants::MostCardsTiedPoints : constants::MostCardsPoints;

        // Threshold, not additive
        size_t const spades = p.SpadesCount();
        if (spades >= constants::SpadesMajorThreshold) b.spades = 2;
        else if (spades >= constants::SpadesMinorThreshold) b.spades = 1;

        if (p.HasSpyTwo()) b.spy_two = constants::SpyTwoPoints;
        if (p.HasBigTen()) b.big_ten = constants::BigTenPoints;
        b.aces = static_cast<int>(p.AceCount()) * constants::AcePoints;
        return b;
    }

    auto ScoreHand(GameState const& state) -> std::vector<ScoreBreakdown>
    {
        std::vector<size_t> const counts = state.CapturedCounts();
        size_t const most = counts.empty() ? 0 : std::ranges::max(counts);
        auto const holders = std::ranges::count(counts, most);

        std::vector<ScoreBreakdown> out;
        out.reserve(state.players.size());
        for (size_t i{}; i < state.players.size(); ++i)
        {
            out.push_back(ScorePile(state.players[i], counts[i] == most, holders > 1));
        }
        return out;
    }

    auto to_string(ScoreBreakdown const& b) -> std::string
    {
        return std::format("cards={} spades={} spy={} big={} aces={} total={}",
                           b.most_cards, b.spades, b.spy_two, b.big_ten, b.aces, b.Total());
    }
}
