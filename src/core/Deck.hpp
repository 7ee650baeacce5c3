#ifndef KASINO_DECK_HPP
#define KASINO_DECK_HPP

#include <random>
#include "Types.hpp"

namespace kasino::core
{
    // Fresh 40-card deck, suit-major, ids 0..39 in order
    auto BuildDeck() -> CardList;

    auto ShuffledDeck(std::mt19937_64& rng) -> CardList;
}

#endif //KASINO_DECK_HPP
