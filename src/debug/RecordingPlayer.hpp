#ifndef KASINO_RECORDINGPLAYER_HPP
#define KASINO_RECORDINGPLAYER_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace kasino::core::debug
{
    // Remembers the last action the wrapped player proposed, accepted or not
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(GameState const& s, PlyrIdxT const seat) -> PlayerAction override
        {
            last_action_ = inner_->Play(s, seat);
            ++calls_;
            return *last_action_;
        }

        auto HasLast() const -> bool
        {
            return last_action_.has_value();
        }

        auto Last() const -> PlayerAction const&
        {
            return last_action_.value();
        }

        auto Calls() const -> size_t
        {
            return calls_;
        }

    private:
        std::unique_ptr<Player> inner_;
        std::optional<PlayerAction> last_action_{};
        size_t calls_{0};
    };

    // Helper to wrap a vector<unique_ptr<Player>>
    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
        }

        return out;
    }

    // Only safe if WrapRecording was used at construction
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
}

#endif //KASINO_RECORDINGPLAYER_HPP
