#ifndef KASINO_CAPTURE_HPP
#define KASINO_CAPTURE_HPP

#include <string>
#include <vector>
#include "Types.hpp"
#include "Build.hpp"

namespace kasino::core
{
    // One way of resolving a played card. Singles and builds of the played
    // value are always taken whole; combinations differ between options only
    // when the table offers overlapping sums.
    struct CaptureOption
    {
        Card hand_card;
        CardList singles{};
        std::vector<Build> builds{};
        CardGroups combinations{};
        CardList opponent_pile_cards{};

        // Excludes the played card
        auto TotalCaptured() const -> size_t;
        auto Describe() const -> std::string;

        auto operator==(CaptureOption const&) const -> bool = default;
    };
}

#endif //KASINO_CAPTURE_HPP
