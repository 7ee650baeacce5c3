#include "State.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace kasino::core
{
    auto PlayerState::TopCapture() const -> std::optional<Card>
    {
        if (capture_pile.empty()) return std::nullopt;
        return capture_pile.back();
    }

    auto PlayerState::SpadesCount() const -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(capture_pile, &Card::IsSpade));
    }

    auto PlayerState::AceCount() const -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(capture_pile, &Card::IsAce));
    }

    auto PlayerState::HasSpyTwo() const -> bool
    {
        return std::ranges::any_of(capture_pile, &Card::IsSpyTwo);
    }

    auto PlayerState::HasBigTen() const -> bool
    {
        return std::ranges::any_of(capture_pile, &Card::IsBigTen);
    }

    auto PlayerState::InHand(Card const& c) const -> bool
    {
        return util::ContainsId(hand, c.id);
    }

    auto PlayerState::HoldsValue(int const value, std::optional<Card> const& except) const -> bool
    {
        return std::ranges::any_of(hand, [&](Card const& c)
        {
            return c.Value() == value && !(except && c == *except);
        });
    }

    auto GameState::OwnsBuild(PlyrIdxT const seat) const -> bool
    {
        return std::ranges::any_of(builds, [seat](Build const& b) { return b.owner == seat; });
    }

    auto GameState::AllHandsEmpty() const -> bool
    {
        return std::ranges::all_of(players, [](PlayerState const& p) { return p.hand.empty(); });
    }

    auto GameState::FindBuild(BuildId const id) const -> Build const*
    {
        auto const it = std::ranges::find(builds, id, &Build::id);
        return it != builds.end() ? &*it : nullptr;
    }

    auto GameState::BuildOf(PlyrIdxT const owner, int const value) const -> Build const*
    {
        auto const it = std::ranges::find_if(builds, [&](Build const& b)
        {
            return b.owner == owner && b.value == value;
        });
        return it != builds.end() ? &*it : nullptr;
    }

    auto GameState::OwnedBuilds(PlyrIdxT const owner) const -> std::vector<Build const*>
    {
        std::vector<Build const*> out;
        for (Build const& b : builds)
        {
            if (b.owner == owner) out.push_back(&b);
        }
        return out;
    }

    auto GameState::OnTable(Card const& c) const -> bool
    {
        return util::ContainsId(table, c.id);
    }

    auto GameState::BuildCards() const -> CardList
    {
        CardList out;
        for (Build const& b : builds)
        {
            for (CardList const& g : b.groups) out.insert(out.end(), g.begin(), g.end());
        }
        return out;
    }

    auto GameState::OpponentPileTops(PlyrIdxT const seat) const -> std::vector<std::pair<PlyrIdxT, Card>>
    {
        std::vector<std::pair<PlyrIdxT, Card>> tops;
        for (size_t i{}; i < players.size(); ++i)
        {
            if (i == seat) continue;
            if (auto const top = players[i].TopCapture())
            {
                tops.emplace_back(static_cast<PlyrIdxT>(i), *top);
            }
        }
        return tops;
    }

    auto GameState::CapturedCounts() const -> std::vector<size_t>
    {
        std::vector<size_t> counts;
        counts.reserve(players.size());
        for (PlayerState const& p : players) counts.push_back(p.CapturedCount());
        return counts;
    }

    auto to_string(Build const& b) -> std::string
    {
        std::string body;
        for (size_t i{}; i < b.groups.size(); ++i)
        {
            if (i) body += " | ";
            body += to_string(b.groups[i], '+');
        }
        return std::format("[{}: {}]", b.value, body);
    }
}
