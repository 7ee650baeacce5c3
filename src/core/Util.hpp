#ifndef KASINO_UTIL_HPP
#define KASINO_UTIL_HPP

#include <algorithm>
#include <iterator>
#include <numeric>
#include <ranges>
#include <span>
#include "Types.hpp"

namespace kasino::core::util
{
    inline auto CardBit(Card const& c) -> uint64_t
    {
        return uint64_t{1} << c.id;
    }

    inline auto IdMask(std::span<Card const> cards) -> uint64_t
    {
        uint64_t mask{};
        for (Card const& c : cards) mask |= CardBit(c);
        return mask;
    }

    inline auto SumValues(std::span<Card const> cards) -> int
    {
        return std::accumulate(cards.begin(), cards.end(), 0,
                               [](int acc, Card const& c) { return acc + c.Value(); });
    }

    inline auto ContainsId(std::span<Card const> cards, CardId id) -> bool
    {
        return std::ranges::any_of(cards, [id](Card const& c) { return c.id == id; });
    }

    // Copy of src without any card whose bit is set in mask
    inline auto WithoutIds(CardList const& src, uint64_t mask) -> CardList
    {
        CardList out;
        out.reserve(src.size());
        std::ranges::copy_if(src, std::back_inserter(out),
                             [mask](Card const& c) { return (mask & CardBit(c)) == 0; });
        return out;
    }

    inline auto Flatten(CardGroups const& groups) -> CardList
    {
        CardList out;
        for (CardList const& g : groups) out.insert(out.end(), g.begin(), g.end());
        return out;
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = CardBit(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        auto AddAll(std::span<Card const> cs) -> void
        {
            for (Card const& c : cs) Add(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
        [[nodiscard]]
        auto Mask() const -> uint64_t
        {
            return cards_;
        }
    private:
        uint64_t cards_;
        size_t count_;
        bool contains_dup_;
    };
}

#endif //KASINO_UTIL_HPP
