#ifndef KASINO_RANDOMAI_HPP
#define KASINO_RANDOMAI_HPP

#include <random>
#include "Engine.hpp"
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace kasino::core
{
    // Picks uniformly among the engine's legal actions for the seat
    class RandomAI final : public kasino::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(GameState const& state, PlyrIdxT seat) -> PlayerAction override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
        Engine engine_;
    };
}

#endif //KASINO_RANDOMAI_HPP
