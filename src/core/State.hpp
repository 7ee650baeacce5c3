#ifndef KASINO_STATE_HPP
#define KASINO_STATE_HPP

#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "ActionLog.hpp"
#include "Build.hpp"

namespace kasino::core
{
    struct PlayerState
    {
        std::string id;
        std::string display_name;
        CardList hand{};
        // Face up, back() is the top card
        CardList capture_pile{};

        auto TopCapture() const -> std::optional<Card>;
        auto CapturedCount() const noexcept -> size_t { return capture_pile.size(); }
        auto SpadesCount() const -> size_t;
        auto AceCount() const -> size_t;
        auto HasSpyTwo() const -> bool;
        auto HasBigTen() const -> bool;
        auto InHand(Card const& c) const -> bool;
        // Whether the hand holds a card of value other than `except`
        auto HoldsValue(int value, std::optional<Card> const& except = std::nullopt) const -> bool;

        auto operator==(PlayerState const&) const -> bool = default;
    };

    // Immutable snapshot of a hand in progress. Engine operations take one by
    // const reference and hand back a modified copy; nothing edits a snapshot
    // in place once it has been returned.
    struct GameState
    {
        GameMode mode{GameMode::SinglePlayer};
        Phase phase{Phase::Dealing};

        std::vector<PlayerState> players{};
        PlyrIdxT current{0};

        CardList table{};
        std::vector<Build> builds{};
        CardList draw_pile{};

        PlyrIdxT last_capturer{NoPlayer};
        bool second_deal{false};

        // Match ledger, one entry per seat
        std::vector<int> match_scores{};
        int target_score{11};
        uint32_t hand_number{1};
        bool hand_scored{false};

        ActionLog log{};

        auto PlayerCount() const noexcept -> size_t { return players.size(); }
        auto Current() const -> PlayerState const& { return players.at(current); }
        auto NextSeat(PlyrIdxT const idx) const -> PlyrIdxT { return static_cast<PlyrIdxT>((idx + 1) % players.size()); }
        auto InPlay() const noexcept -> bool { return phase == Phase::Playing || phase == Phase::PlayingSecond; }

        auto OwnsBuild(PlyrIdxT seat) const -> bool;
        auto CurrentOwnsBuild() const -> bool { return OwnsBuild(current); }
        // Second deal always permits drifting
        auto CanCurrentDrift() const -> bool { return second_deal || !CurrentOwnsBuild(); }
        auto AllHandsEmpty() const -> bool;

        auto FindBuild(BuildId id) const -> Build const*;
        auto BuildOf(PlyrIdxT owner, int value) const -> Build const*;
        auto OwnedBuilds(PlyrIdxT owner) const -> std::vector<Build const*>;
        auto OnTable(Card const& c) const -> bool;

        // Cards visible to the AI collaborator
        auto BuildCards() const -> CardList;
        auto OpponentPileTops(PlyrIdxT seat) const -> std::vector<std::pair<PlyrIdxT, Card>>;
        auto CapturedCounts() const -> std::vector<size_t>;

        auto operator==(GameState const&) const -> bool = default;
    };
}

#endif //KASINO_STATE_HPP
