#include "codec.hpp"

#include <algorithm>
#include <format>
#include <type_traits>
#include <utility>
#include <vector>

namespace fb = kasino::gen::net;

namespace kasino::core::net
{
    auto ToFbSuit(Suit s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case Suit::Spades: return fb::Suit::Spades;
        case Suit::Hearts: return fb::Suit::Hearts;
        case Suit::Diamonds: return fb::Suit::Diamonds;
        case Suit::Clubs: return fb::Suit::Clubs;
        }
        return fb::Suit::Spades;
    }

    auto FromFbSuit(fb::Suit s) noexcept -> Suit
    {
        switch (s)
        {
        case fb::Suit::Spades: return Suit::Spades;
        case fb::Suit::Hearts: return Suit::Hearts;
        case fb::Suit::Diamonds: return Suit::Diamonds;
        case fb::Suit::Clubs: return Suit::Clubs;
        }
        return Suit::Spades;
    }

    auto ToFbPhase(Phase p) noexcept -> fb::Phase
    {
        switch (p)
        {
        case Phase::Dealing: return fb::Phase::Dealing;
        case Phase::Playing: return fb::Phase::Playing;
        case Phase::PlayingSecond: return fb::Phase::PlayingSecond;
        case Phase::Scoring: return fb::Phase::Scoring;
        case Phase::GameOver: return fb::Phase::GameOver;
        }
        return fb::Phase::Dealing;
    }

    auto FromFbPhase(fb::Phase p) noexcept -> Phase
    {
        switch (p)
        {
        case fb::Phase::Dealing: return Phase::Dealing;
        case fb::Phase::Playing: return Phase::Playing;
        case fb::Phase::PlayingSecond: return Phase::PlayingSecond;
        case fb::Phase::Scoring: return Phase::Scoring;
        case fb::Phase::GameOver: return Phase::GameOver;
        }
        return Phase::Dealing;
    }
}

namespace
{
    using namespace kasino::core;
    using kasino::core::net::ParseError;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(Suit::Hearts) == static_cast<int>(fb::Suit::Hearts));
    static_assert(static_cast<int>(Phase::PlayingSecond) == static_cast<int>(fb::Phase::PlayingSecond));

    using CardOffsets = std::vector<flatbuffers::Offset<fb::Card>>;

    auto ToFbCard(flatbuffers::FlatBufferBuilder& fbb, Card const& c) -> flatbuffers::Offset<fb::Card>
    {
        return fb::CreateCard(fbb, c.id, c.rank, net::ToFbSuit(c.suit));
    }

    auto ToFbCards(flatbuffers::FlatBufferBuilder& fbb, CardList const& cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Card>>>
    {
        CardOffsets vec;
        vec.reserve(cards.size());
        for (Card const& c : cards) vec.push_back(ToFbCard(fbb, c));
        return fbb.CreateVector(vec);
    }

    auto ToFbGroups(flatbuffers::FlatBufferBuilder& fbb, CardGroups const& groups)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::CardGroup>>>
    {
        std::vector<flatbuffers::Offset<fb::CardGroup>> vec;
        vec.reserve(groups.size());
        for (CardList const& g : groups) vec.push_back(fb::CreateCardGroup(fbb, ToFbCards(fbb, g)));
        return fbb.CreateVector(vec);
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb,
                std::uint64_t msg_id,
                fb::Action kind,
                flatbuffers::Offset<void> action) -> flatbuffers::DetachedBuffer
    {
        auto const m = fb::CreatePlayerActionMsg(fbb, msg_id, kind, action);
        auto const e = fb::CreateEnvelope(fbb, fb::Message::PlayerActionMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }

    // The id decides; rank and suit must agree with it
    auto FromFbCard(fb::Card const* c) -> std::expected<Card, ParseError>
    {
        if (!c) return std::unexpected(ParseError{"missing card"});
        if (c->id() >= constants::DeckSize)
            return std::unexpected(ParseError{std::format("card id {} out of range", static_cast<int>(c->id()))});

        Card const card = CardFromId(c->id());
        if (card.rank != c->rank() || card.suit != net::FromFbSuit(c->suit()))
            return std::unexpected(ParseError{std::format("card {} fields disagree with its id", static_cast<int>(c->id()))});
        return card;
    }

    auto FromFbCards(flatbuffers::Vector<flatbuffers::Offset<fb::Card>> const* v)
        -> std::expected<CardList, ParseError>
    {
        CardList out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* fb_c : *v)
        {
            auto card = FromFbCard(fb_c);
            if (!card) return std::unexpected(card.error());
            out.push_back(*card);
        }
        return out;
    }

    auto FromFbGroups(flatbuffers::Vector<flatbuffers::Offset<fb::CardGroup>> const* v)
        -> std::expected<CardGroups, ParseError>
    {
        CardGroups out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* g : *v)
        {
            if (!g || !g->cards()) return std::unexpected(ParseError{"card group without cards"});
            auto cards = FromFbCards(g->cards());
            if (!cards) return std::unexpected(cards.error());
            out.push_back(std::move(*cards));
        }
        return out;
    }

    auto OptionalCard(fb::Card const* c) -> std::expected<std::optional<Card>, ParseError>
    {
        if (!c) return std::optional<Card>{};
        auto card = FromFbCard(c);
        if (!card) return std::unexpected(card.error());
        return std::optional<Card>{*card};
    }

    auto VerifiedEnvelope(std::span<std::byte const> bytes) -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }
} // anonymous

namespace kasino::core::net
{
    auto ViewFor(GameState const& state, PlyrIdxT const seat) -> SeatView
    {
        KSN_ASSERT(seat < state.PlayerCount(), std::format("No seat P{} in a {}-player game",
                                                           static_cast<int>(seat), state.PlayerCount()));
        SeatView v{};
        v.seat = seat;
        v.n_players = state.PlayerCount();
        v.current = state.current;
        v.phase = state.phase;
        v.second_deal = state.second_deal;
        v.hand_number = state.hand_number;
        v.table = state.table;
        v.builds = state.builds;
        v.my_hand = state.players[seat].hand;
        for (size_t i{}; i < state.PlayerCount(); ++i)
        {
            PlayerState const& p = state.players[i];
            v.hand_counts.push_back(p.hand.size());
            v.captured_counts.push_back(p.CapturedCount());
            if (auto const top = p.TopCapture()) v.pile_tops.emplace_back(static_cast<PlyrIdxT>(i), *top);
        }
        v.draw_count = state.draw_pile.size();
        v.last_capturer = state.last_capturer;
        v.match_scores = state.match_scores;
        v.target_score = state.target_score;
        return v;
    }

    // ---------- Snapshot (server → client) ----------

    auto BuildSnapshot(GameState const& state,
                       PlyrIdxT seat,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        SeatView const view = ViewFor(state, seat);

        flatbuffers::FlatBufferBuilder fbb;

        auto const tbl_vec = ToFbCards(fbb, view.table);

        std::vector<flatbuffers::Offset<fb::Build>> builds;
        builds.reserve(view.builds.size());
        for (Build const& b : view.builds)
        {
            builds.push_back(fb::CreateBuild(fbb, b.id, b.owner, static_cast<uint8_t>(b.value),
                                             ToFbGroups(fbb, b.groups)));
        }
        auto const builds_vec = fbb.CreateVector(builds);

        auto const my_vec = ToFbCards(fbb, view.my_hand);

        std::vector<uint8_t> hand_counts;
        std::vector<uint8_t> captured_counts;
        for (size_t n : view.hand_counts) hand_counts.push_back(static_cast<uint8_t>(n));
        for (size_t n : view.captured_counts) captured_counts.push_back(static_cast<uint8_t>(n));

        std::vector<flatbuffers::Offset<fb::PileTop>> tops;
        tops.reserve(view.pile_tops.size());
        for (auto const& [owner, card] : view.pile_tops)
        {
            tops.push_back(fb::CreatePileTop(fbb, owner, ToFbCard(fbb, card)));
        }
        auto const tops_vec = fbb.CreateVector(tops);

        std::vector<int32_t> const scores(view.match_scores.begin(), view.match_scores.end());

        auto const fb_view = fb::CreateSeatView(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*seat*/ view.seat,
            /*n_players*/ static_cast<uint8_t>(view.n_players),
            /*current*/ view.current,
            /*phase*/ ToFbPhase(view.phase),
            /*second_deal*/ view.second_deal,
            /*hand_number*/ view.hand_number,
            /*table*/ tbl_vec,
            /*builds*/ builds_vec,
            /*my_hand*/ my_vec,
            /*hand_counts*/ fbb.CreateVector(hand_counts),
            /*captured_counts*/ fbb.CreateVector(captured_counts),
            /*pile_tops*/ tops_vec,
            /*draw_count*/ static_cast<uint8_t>(view.draw_count),
            /*last_capturer*/ view.last_capturer,
            /*match_scores*/ fbb.CreateVector(scores),
            /*target_score*/ view.target_score
        );

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, fb_view);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation (server → client) ----------

    auto BuildViolation(error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, msg_id, static_cast<int16_t>(v.code), txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Builders (client → server) ----------

    auto BuildAction_Capture(PlyrIdxT actor, CaptureAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const hand = ToFbCard(fbb, a.hand_card);
        auto const combos = ToFbGroups(fbb, a.combinations);
        auto const act = fb::CreateAction_Capture(fbb, actor, hand, combos);
        return Finish(fbb, msg_id, fb::Action::Action_Capture, act.Union());
    }

    auto BuildAction_Build(PlyrIdxT actor, BuildAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::Card> hand{};
        if (a.hand_card) hand = ToFbCard(fbb, *a.hand_card);
        auto const table = ToFbCards(fbb, a.table_cards);
        auto const stolen = ToFbCards(fbb, a.stolen_cards);
        auto const act = fb::CreateAction_Build(fbb, actor, hand, table,
                                                static_cast<uint8_t>(a.declared_value), stolen);
        return Finish(fbb, msg_id, fb::Action::Action_Build, act.Union());
    }

    auto BuildAction_Augment(PlyrIdxT actor, AugmentAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const table = ToFbCards(fbb, a.table_cards);
        flatbuffers::Offset<fb::Card> hand{};
        if (a.hand_card) hand = ToFbCard(fbb, *a.hand_card);
        flatbuffers::Offset<fb::Card> stolen{};
        if (a.stolen_card) stolen = ToFbCard(fbb, *a.stolen_card);
        auto const act = fb::CreateAction_Augment(fbb, actor, a.build, table, hand, stolen);
        return Finish(fbb, msg_id, fb::Action::Action_Augment, act.Union());
    }

    auto BuildAction_Increase(PlyrIdxT actor, IncreaseAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const hand = ToFbCard(fbb, a.hand_card);
        auto const act = fb::CreateAction_Increase(fbb, actor, a.build, hand);
        return Finish(fbb, msg_id, fb::Action::Action_Increase, act.Union());
    }

    auto BuildAction_Drift(PlyrIdxT actor, DriftAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const hand = ToFbCard(fbb, a.hand_card);
        auto const act = fb::CreateAction_Drift(fbb, actor, hand);
        return Finish(fbb, msg_id, fb::Action::Action_Drift, act.Union());
    }

    auto BuildPlayerAction(PlyrIdxT actor, PlayerAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, CaptureAction>) return BuildAction_Capture(actor, act, msg_id);
            else if constexpr (std::is_same_v<T, BuildAction>) return BuildAction_Build(actor, act, msg_id);
            else if constexpr (std::is_same_v<T, AugmentAction>) return BuildAction_Augment(actor, act, msg_id);
            else if constexpr (std::is_same_v<T, IncreaseAction>) return BuildAction_Increase(actor, act, msg_id);
            else return BuildAction_Drift(actor, act, msg_id);
        }, a);
    }

    // ---------- Decode (client/server ← inbound wire) ----------

    auto DecodeSeatView(std::span<std::byte const> bytes)
        -> std::expected<SeatView, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::SnapshotMsg)
            return std::unexpected(ParseError{"not a SnapshotMsg"});

        fb::SnapshotMsg const* sm = (*env)->message_as_SnapshotMsg();
        if (!sm) return std::unexpected(ParseError{"SnapshotMsg tag without payload"});
        fb::SeatView const* fv = sm->view();
        if (!fv) return std::unexpected(ParseError{"snapshot without view"});
        if (fv->schema_version() != SchemaVersion)
            return std::unexpected(ParseError{std::format("schema version {} unsupported", fv->schema_version())});

        SeatView v{};
        v.seat = fv->seat();
        v.n_players = fv->n_players();
        v.current = fv->current();
        v.phase = FromFbPhase(fv->phase());
        v.second_deal = fv->second_deal();
        v.hand_number = fv->hand_number();

        auto table = FromFbCards(fv->table());
        if (!table) return std::unexpected(table.error());
        v.table = std::move(*table);

        if (auto const* builds = fv->builds())
        {
            for (auto const* fb_b : *builds)
            {
                if (!fb_b) return std::unexpected(ParseError{"missing build"});
                auto groups = FromFbGroups(fb_b->groups());
                if (!groups) return std::unexpected(groups.error());
                v.builds.push_back(Build{
                    .id = fb_b->id(),
                    .owner = fb_b->owner(),
                    .value = fb_b->value(),
                    .groups = std::move(*groups)
                });
            }
        }

        auto hand = FromFbCards(fv->my_hand());
        if (!hand) return std::unexpected(hand.error());
        v.my_hand = std::move(*hand);

        if (auto const* counts = fv->hand_counts())
            for (auto const n : *counts) v.hand_counts.push_back(n);
        if (auto const* counts = fv->captured_counts())
            for (auto const n : *counts) v.captured_counts.push_back(n);

        if (auto const* tops = fv->pile_tops())
        {
            for (auto const* t : *tops)
            {
                if (!t) return std::unexpected(ParseError{"missing pile top"});
                auto card = FromFbCard(t->card());
                if (!card) return std::unexpected(card.error());
                v.pile_tops.emplace_back(t->seat(), *card);
            }
        }

        v.draw_count = fv->draw_count();
        v.last_capturer = fv->last_capturer();
        if (auto const* scores = fv->match_scores())
            for (auto const s : *scores) v.match_scores.push_back(s);
        v.target_score = fv->target_score();
        return v;
    }

    auto DecodePlayerAction(GameState const& state,
                            std::span<std::byte const> bytes)
        -> std::expected<DecodedAction, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fb::Message::PlayerActionMsg)
            return std::unexpected(ParseError{"not a PlayerActionMsg"});

        auto const* pam = (*env)->message_as_PlayerActionMsg();
        if (!pam) return std::unexpected(ParseError{"PlayerActionMsg tag without payload"});

        // The verifier lets a union tag through without its table
        ParseError const no_payload{"action tag without payload"};

        auto check_actor = [&state](uint8_t actor) -> std::expected<PlyrIdxT, ParseError>
        {
            if (actor >= state.PlayerCount())
                return std::unexpected(ParseError{std::format("no seat P{}", static_cast<int>(actor))});
            return static_cast<PlyrIdxT>(actor);
        };

        auto check_build = [&state](BuildId id) -> std::expected<BuildId, ParseError>
        {
            if (!state.FindBuild(id))
                return std::unexpected(ParseError{std::format("unknown build {:#x}", id)});
            return id;
        };

        DecodedAction out{};

        switch (pam->action_type())
        {
        case fb::Action::Action_Capture:
        {
            auto const* a = pam->action_as_Action_Capture();
            if (!a) return std::unexpected(no_payload);
            auto const actor = check_actor(a->actor());
            if (!actor) return std::unexpected(actor.error());
            auto const hand = FromFbCard(a->hand_card());
            if (!hand) return std::unexpected(hand.error());
            auto combos = FromFbGroups(a->combinations());
            if (!combos) return std::unexpected(combos.error());

            out.actor = *actor;
            out.action = CaptureAction{ .hand_card = *hand, .combinations = std::move(*combos) };
            return out;
        }

        case fb::Action::Action_Build:
        {
            auto const* a = pam->action_as_Action_Build();
            if (!a) return std::unexpected(no_payload);
            auto const actor = check_actor(a->actor());
            if (!actor) return std::unexpected(actor.error());
            auto const hand = OptionalCard(a->hand_card());
            if (!hand) return std::unexpected(hand.error());
            auto table = FromFbCards(a->table_cards());
            if (!table) return std::unexpected(table.error());
            auto stolen = FromFbCards(a->stolen_cards());
            if (!stolen) return std::unexpected(stolen.error());

            out.actor = *actor;
            out.action = BuildAction{
                .hand_card = *hand,
                .table_cards = std::move(*table),
                .declared_value = a->declared_value(),
                .stolen_cards = std::move(*stolen)
            };
            return out;
        }

        case fb::Action::Action_Augment:
        {
            auto const* a = pam->action_as_Action_Augment();
            if (!a) return std::unexpected(no_payload);
            auto const actor = check_actor(a->actor());
            if (!actor) return std::unexpected(actor.error());
            auto const build = check_build(a->build());
            if (!build) return std::unexpected(build.error());
            auto table = FromFbCards(a->table_cards());
            if (!table) return std::unexpected(table.error());
            auto const hand = OptionalCard(a->hand_card());
            if (!hand) return std::unexpected(hand.error());
            auto const stolen = OptionalCard(a->stolen_card());
            if (!stolen) return std::unexpected(stolen.error());

            out.actor = *actor;
            out.action = AugmentAction{
                .build = *build,
                .table_cards = std::move(*table),
                .hand_card = *hand,
                .stolen_card = *stolen
            };
            return out;
        }

        case fb::Action::Action_Increase:
        {
            auto const* a = pam->action_as_Action_Increase();
            if (!a) return std::unexpected(no_payload);
            auto const actor = check_actor(a->actor());
            if (!actor) return std::unexpected(actor.error());
            auto const build = check_build(a->build());
            if (!build) return std::unexpected(build.error());
            auto const hand = FromFbCard(a->hand_card());
            if (!hand) return std::unexpected(hand.error());

            out.actor = *actor;
            out.action = IncreaseAction{ .build = *build, .hand_card = *hand };
            return out;
        }

        case fb::Action::Action_Drift:
        {
            auto const* a = pam->action_as_Action_Drift();
            if (!a) return std::unexpected(no_payload);
            auto const actor = check_actor(a->actor());
            if (!actor) return std::unexpected(actor.error());
            auto const hand = FromFbCard(a->hand_card());
            if (!hand) return std::unexpected(hand.error());

            out.actor = *actor;
            out.action = DriftAction{ .hand_card = *hand };
            return out;
        }

        default:
            return std::unexpected(ParseError{"unknown action variant"});
        }
    }
} // namespace kasino::core::net
