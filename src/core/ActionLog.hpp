#ifndef KASINO_ACTIONLOG_HPP
#define KASINO_ACTIONLOG_HPP

#include <deque>
#include <optional>
#include <string>
#include "Actions.hpp"
#include "Types.hpp"

namespace kasino::core
{
    struct ActionRecord
    {
        uint64_t sequence{}; // assigned by ActionLog::Append
        PlyrIdxT actor{NoPlayer};
        ActionType type{ActionType::Drift};
        std::optional<Card> card_played{};
        CardList cards_captured{};
        std::string description;

        auto operator==(ActionRecord const&) const -> bool = default;
    };

    // Sliding window over the most recent actions. Once capacity is reached the
    // oldest record is dropped for every new one; sequence numbers keep counting.
    class ActionLog
    {
    public:
        explicit ActionLog(size_t capacity = 50);

        auto Append(ActionRecord record) -> ActionRecord const&;

        [[nodiscard]] auto Entries() const noexcept -> std::deque<ActionRecord> const& { return entries_; }
        [[nodiscard]] auto Size() const noexcept -> size_t { return entries_.size(); }
        [[nodiscard]] auto Capacity() const noexcept -> size_t { return capacity_; }
        [[nodiscard]] auto Empty() const noexcept -> bool { return entries_.empty(); }
        // Total appended over the log's lifetime, dropped entries included
        [[nodiscard]] auto TotalAppended() const noexcept -> uint64_t { return next_sequence_; }
        auto Back() const -> ActionRecord const&;

        auto operator==(ActionLog const&) const -> bool = default;
    private:
        size_t capacity_;
        uint64_t next_sequence_{0};
        std::deque<ActionRecord> entries_;
    };
}

#endif //KASINO_ACTIONLOG_HPP
