#ifndef KASINO_INVARIANTS_HPP
#define KASINO_INVARIANTS_HPP

#include <format>
#include <set>
#include <utility>
#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/Util.hpp"

namespace kasino::core::debug
{
    // A second layer of checks run by tests after every step. The engine keeps
    // these by construction; a failure here means an operation leaked or
    // duplicated a card somewhere.
    inline auto CheckInvariants(GameState const& s) -> void
    {
#if KSN_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        // 1) Turn pointer in range
        KSN_ASSERT(s.current < s.PlayerCount(), std::format("current={} with {} seats",
                                                            static_cast<int>(s.current), s.PlayerCount()));
        KSN_ASSERT(s.match_scores.size() == s.PlayerCount(), "Match ledger size differs from seat count");

        // 2) Conservation: every card in exactly one zone
        util::CardUniqueChecker checker{};
        for (PlayerState const& p : s.players)
        {
            checker.AddAll(p.hand);
            checker.AddAll(p.capture_pile);
        }
        checker.AddAll(s.table);
        checker.AddAll(s.draw_pile);
        for (Build const& b : s.builds)
        {
            for (CardList const& g : b.groups) checker.AddAll(g);
        }
        KSN_ASSERT(!checker.ContainsDup(), "Card present in two zones");
        KSN_ASSERT(checker.Count() == constants::DeckSize,
                   std::format("{} cards materialised, expected {}", checker.Count(), constants::DeckSize));

        // 3) Builds: owned, in range, every group sums to the value, one per (owner, value)
        std::set<std::pair<PlyrIdxT, int>> owner_values;
        for (Build const& b : s.builds)
        {
            KSN_ASSERT(b.owner < s.PlayerCount(), std::format("Build {} has no valid owner", to_string(b)));
            KSN_ASSERT(b.value >= constants::MinRank && b.value <= constants::MaxBuildValue,
                       std::format("Build {} value out of range", to_string(b)));
            KSN_ASSERT(!b.groups.empty(), "Build without groups");
            for (CardList const& g : b.groups)
            {
                KSN_ASSERT(!g.empty() && util::SumValues(g) == b.value,
                           std::format("Build {} has a group not summing to its value", to_string(b)));
            }
            KSN_ASSERT(owner_values.emplace(b.owner, b.value).second,
                       std::format("P{} owns two builds of {}", static_cast<int>(b.owner), b.value));
        }

        // 4) Phase specific
        if (s.phase == Phase::PlayingSecond)
        {
            KSN_ASSERT(s.second_deal && s.draw_pile.empty(), "Second deal phase with cards undealt");
        }
        if (s.phase == Phase::Scoring || s.phase == Phase::GameOver)
        {
            KSN_ASSERT(s.AllHandsEmpty(), "Hand scored with cards still in hand");
        }
#endif // KSN_ENABLE_TEST_HOOKS == true
    }
}
#endif //KASINO_INVARIANTS_HPP
