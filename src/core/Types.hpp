#ifndef KASINO_TYPES_HPP
#define KASINO_TYPES_HPP

#define KSN_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace kasino::core::constants
{
    inline constexpr size_t DeckSize = 40;
    inline constexpr uint8_t MinRank = 1;
    inline constexpr uint8_t MaxRank = 10;
    inline constexpr size_t RanksPerSuit = 10;
    inline constexpr size_t MinPlayers = 2;
    inline constexpr size_t MaxPlayers = 4;
    inline constexpr size_t SecondDealSize = 10;
    inline constexpr int MaxBuildValue = 10;
    // Captured-card count that earns the full-tie bonus point
    inline constexpr size_t TieBreakCardCount = 21;
}

namespace kasino::core
{
    enum class Suit : uint8_t
    {
        Spades = 0,
        Hearts,
        Diamonds,
        Clubs
    };

    // 0..39, suit-major. Stable across every representation of a card.
    using CardId = uint8_t;
    using PlyrIdxT = uint8_t;
    // Bitmask over member CardIds at creation time
    using BuildId = uint64_t;

    inline constexpr PlyrIdxT NoPlayer = 0xFF;

    struct Card
    {
        uint8_t rank{constants::MinRank};
        Suit suit{Suit::Spades};
        CardId id{};

        [[nodiscard]]
        constexpr auto Value() const noexcept -> int { return rank; }

        constexpr auto IsSpyTwo() const noexcept -> bool { return rank == 2 && suit == Suit::Spades; }
        constexpr auto IsBigTen() const noexcept -> bool { return rank == 10 && suit == Suit::Diamonds; }
        constexpr auto IsAce() const noexcept -> bool { return rank == 1; }
        constexpr auto IsSpade() const noexcept -> bool { return suit == Suit::Spades; }
    };

    // Identity is the id, never the position or the face
    constexpr auto operator==(Card const& a, Card const& b) noexcept -> bool { return a.id == b.id; }

    constexpr auto MakeCard(Suit suit, uint8_t rank) noexcept -> Card
    {
        return Card{
            .rank = rank,
            .suit = suit,
            .id = static_cast<CardId>(static_cast<size_t>(suit) * constants::RanksPerSuit + (rank - 1))
        };
    }

    constexpr auto CardFromId(CardId id) noexcept -> Card
    {
        return MakeCard(static_cast<Suit>(id / constants::RanksPerSuit),
                        static_cast<uint8_t>(id % constants::RanksPerSuit + 1));
    }

    using CardList = std::vector<Card>;
    using CardGroups = std::vector<CardList>;

    enum class GameMode : uint8_t
    {
        SinglePlayer,
        Multiplayer,
        Practice
    };

    struct Config
    {
        int      target_score{11};
        size_t   max_action_log{50};
        uint64_t seed{std::random_device{}()};
    };

    // Identity the caller seats at the table; hands and piles are dealt by the engine
    struct PlayerInfo
    {
        std::string id;
        std::string display_name;
    };

    auto to_string(Suit s) -> std::string;
    auto to_string(Card const& c) -> std::string;
    auto to_string(CardList const& cards, char sep = ',') -> std::string;
}

#endif //KASINO_TYPES_HPP
