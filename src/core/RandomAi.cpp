#include "RandomAi.hpp"

#include <utility>
#include <vector>

namespace kasino::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(rng_seed),
        engine_(Config{ .seed = rng_seed }) {}

    auto RandomAI::Play(GameState const& state, PlyrIdxT const seat) -> PlayerAction
    {
        error::ErrorContext const ctx{ .seat = seat, .phase = state.phase };
        KSN_ASSERT(seat == state.current, "RandomAI asked to move out of turn", ctx);
        KSN_ASSERT(!state.Current().hand.empty(), "RandomAI asked to move with an empty hand", ctx);

        std::vector<PlayerAction> legal = engine_.LegalActions(state);
        // Drifting the first card is the last resort; the engine rejects it if barred
        if (legal.empty()) return DriftAction{ .hand_card = state.Current().hand.front() };

        return std::move(legal[pick(legal)]);
    }
}
