#include "Deck.hpp"

#include <algorithm>
#include <format>

namespace kasino::core
{
    auto BuildDeck() -> CardList
    {
        CardList deck;
        deck.reserve(constants::DeckSize);
        for (size_t s{}; s < 4; ++s)
        {
            for (uint8_t r{constants::MinRank}; r <= constants::MaxRank; ++r)
            {
                deck.push_back(MakeCard(static_cast<Suit>(s), r));
            }
        }
        return deck;
    }

    auto ShuffledDeck(std::mt19937_64& rng) -> CardList
    {
        CardList deck = BuildDeck();
        std::ranges::shuffle(deck, rng);
        return deck;
    }

    auto to_string(Suit const s) -> std::string
    {
        switch (s)
        {
        case Suit::Spades:   return "S";
        case Suit::Hearts:   return "H";
        case Suit::Diamonds: return "D";
        case Suit::Clubs:    return "C";
        }
        return "?";
    }

    auto to_string(Card const& c) -> std::string
    {
        if (c.IsAce()) return std::format("A{}", to_string(c.suit));
        return std::format("{}{}", static_cast<int>(c.rank), to_string(c.suit));
    }

    auto to_string(CardList const& cards, char const sep) -> std::string
    {
        std::string body;
        for (size_t i{}; i < cards.size(); ++i)
        {
            if (i) body += sep;
            body += to_string(cards[i]);
        }
        return body;
    }
}
