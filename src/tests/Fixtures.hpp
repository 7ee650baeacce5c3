#ifndef KASINO_TESTS_FIXTURES_HPP
#define KASINO_TESTS_FIXTURES_HPP

#include <format>
#include <vector>

#include "../core/Deck.hpp"
#include "../core/Engine.hpp"
#include "../core/State.hpp"
#include "../core/Util.hpp"

namespace kasino::test
{
    using namespace kasino::core;

    inline constexpr auto S(uint8_t rank) -> Card { return MakeCard(Suit::Spades, rank); }
    inline constexpr auto H(uint8_t rank) -> Card { return MakeCard(Suit::Hearts, rank); }
    inline constexpr auto D(uint8_t rank) -> Card { return MakeCard(Suit::Diamonds, rank); }
    inline constexpr auto C(uint8_t rank) -> Card { return MakeCard(Suit::Clubs, rank); }

    inline auto Seats(size_t n) -> std::vector<PlayerInfo>
    {
        std::vector<PlayerInfo> seats;
        for (size_t i{}; i < n; ++i)
        {
            seats.push_back(PlayerInfo{ .id = std::format("p{}", i), .display_name = std::format("Player {}", i) });
        }
        return seats;
    }

    inline auto MakeBuild(PlyrIdxT owner, int value, CardGroups groups) -> Build
    {
        return Build{ .id = MakeBuildId(groups), .owner = owner, .value = value, .groups = std::move(groups) };
    }

    // Mid-hand position laid out by hand. Cards not placed anywhere go to the
    // draw pile so the 40 are all accounted for.
    struct Layout
    {
        std::vector<CardList> hands{};
        CardList table{};
        std::vector<Build> builds{};
        std::vector<CardList> piles{};
        PlyrIdxT current{0};
        bool second_deal{false};
    };

    inline auto MakeState(Layout const& l) -> GameState
    {
        GameState s{};
        s.phase = l.second_deal ? Phase::PlayingSecond : Phase::Playing;
        s.second_deal = l.second_deal;
        s.current = l.current;
        s.table = l.table;
        s.builds = l.builds;
        s.match_scores.assign(l.hands.size(), 0);

        uint64_t placed = util::IdMask(l.table);
        for (Build const& b : l.builds) placed |= util::IdMask(b.AllCards());

        for (size_t i{}; i < l.hands.size(); ++i)
        {
            PlayerState p{ .id = std::format("p{}", i), .display_name = std::format("Player {}", i) };
            p.hand = l.hands[i];
            if (i < l.piles.size()) p.capture_pile = l.piles[i];
            placed |= util::IdMask(p.hand) | util::IdMask(p.capture_pile);
            s.players.push_back(std::move(p));
        }

        if (!l.second_deal) s.draw_pile = util::WithoutIds(BuildDeck(), placed);
        return s;
    }
}

#endif //KASINO_TESTS_FIXTURES_HPP
