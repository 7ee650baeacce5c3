#ifndef KASINO_BUILD_HPP
#define KASINO_BUILD_HPP

#include <string>
#include "Types.hpp"
#include "Util.hpp"

namespace kasino::core
{
    // Owned stack on the table. Every group sums to value.
    struct Build
    {
        BuildId id{};
        PlyrIdxT owner{NoPlayer};
        int value{};
        CardGroups groups{};

        auto AllCards() const -> CardList { return util::Flatten(groups); }
        auto CardCount() const -> size_t
        {
            size_t n{};
            for (CardList const& g : groups) n += g.size();
            return n;
        }
        auto IsAugmented() const noexcept -> bool { return groups.size() > 1; }

        auto operator==(Build const&) const -> bool = default;
    };

    // Same cards give the same id on every machine, no counter involved
    inline auto MakeBuildId(CardGroups const& groups) -> BuildId
    {
        BuildId id{};
        for (CardList const& g : groups) id |= util::IdMask(g);
        return id;
    }

    // "[8: 4S+4H | 8D]"
    auto to_string(Build const& b) -> std::string;
}

#endif //KASINO_BUILD_HPP
