#ifndef KASINO_CODEC_HPP
#define KASINO_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/Build.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/kasino_net_generated.h"

namespace kasino::core::net
{
    inline constexpr uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    // What a player action decodes into
    struct DecodedAction
    {
        PlyrIdxT actor{};
        PlayerAction action{};
    };

    // Client projection of a snapshot: only the viewer's own hand is shown,
    // other hands and the draw pile are reduced to counts.
    struct SeatView
    {
        PlyrIdxT seat{};
        size_t n_players{};
        PlyrIdxT current{};
        Phase phase{Phase::Dealing};
        bool second_deal{false};
        uint32_t hand_number{1};

        CardList table{};
        std::vector<Build> builds{};
        CardList my_hand{};

        std::vector<size_t> hand_counts{};
        std::vector<size_t> captured_counts{};
        std::vector<std::pair<PlyrIdxT, Card>> pile_tops{};
        size_t draw_count{};
        PlyrIdxT last_capturer{NoPlayer};

        std::vector<int> match_scores{};
        int target_score{};

        auto operator==(SeatView const&) const -> bool = default;
    };

    auto ViewFor(GameState const& state, PlyrIdxT seat) -> SeatView;

    auto ToFbSuit(Suit s) noexcept -> kasino::gen::net::Suit;
    auto ToFbPhase(Phase p) noexcept -> kasino::gen::net::Phase;

    auto FromFbSuit(kasino::gen::net::Suit s) noexcept -> Suit;
    auto FromFbPhase(kasino::gen::net::Phase p) noexcept -> Phase;

    // --- Outbound builders (server → client) ---

    auto BuildSnapshot(GameState const& state,
                       PlyrIdxT seat,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Outbound builders (client → server) ---

    auto BuildAction_Capture(PlyrIdxT actor, CaptureAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Build(PlyrIdxT actor, BuildAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Augment(PlyrIdxT actor, AugmentAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Increase(PlyrIdxT actor, IncreaseAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildAction_Drift(PlyrIdxT actor, DriftAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Dispatches to the builder for the held alternative
    auto BuildPlayerAction(PlyrIdxT actor, PlayerAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    auto DecodeSeatView(std::span<std::byte const> bytes)
        -> std::expected<SeatView, ParseError>;

    // Card and build ids are resolved against state. Where a card sits is left
    // to the engine to judge; ids that name nothing are a ParseError.
    auto DecodePlayerAction(GameState const& state,
                            std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>;
} // namespace kasino::core::net


#endif //KASINO_CODEC_HPP
