#ifndef KASINO_PLAYER_HPP
#define KASINO_PLAYER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace kasino::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the match loop when seat is to move. The action is checked
        // by the engine afterwards; a rejected one is asked for again.
        virtual auto Play(GameState const& state, PlyrIdxT seat) -> PlayerAction = 0;
    };
}
#endif //KASINO_PLAYER_HPP
