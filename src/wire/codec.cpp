//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <variant>
#include <vector>

namespace bjc::core::wire
{
    namespace fb = bjc::gen::wire;

    auto ToFbOutcome(Outcome const o) noexcept -> fb::Outcome
    {
        switch (o)
        {
        case Outcome::NoOp: return fb::Outcome::NoOp;
        case Outcome::Applied: return fb::Outcome::Applied;
        }
        return fb::Outcome::NoOp;
    }

    auto FromFbOutcome(fb::Outcome const o) noexcept -> Outcome
    {
        switch (o)
        {
        case fb::Outcome::NoOp: return Outcome::NoOp;
        case fb::Outcome::Applied: return Outcome::Applied;
        }
        return Outcome::NoOp;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)bjc::core::Outcome::Applied == (int)bjc::gen::wire::Outcome::Applied);

    inline auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> bjc::gen::wire::Envelope const*
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
        {
            return nullptr;
        }
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!bjc::gen::wire::VerifyEnvelopeBuffer(verifier))
        {
            return nullptr;
        }
        return bjc::gen::wire::GetEnvelope(data);
    }
} // anonymous

namespace bjc::core::wire
{
    // ---------- Build (outbound) ----------

    auto BuildCommand(LedgerAction const& a, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::pair<fb::Command, flatbuffers::Offset<void>> const body = std::visit(
            [&]<typename T0>(T0 const& act) -> std::pair<fb::Command, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, RecordAction>)
                {
                    flatbuffers::Offset<flatbuffers::String> const label = fbb.CreateString(act.label);
                    return {fb::Command::Cmd_Record, fb::CreateCmd_Record(fbb, label, act.value).Union()};
                }
                else if constexpr (std::is_same_v<T, UndoAction>)
                {
                    return {fb::Command::Cmd_Undo, fb::CreateCmd_Undo(fbb).Union()};
                }
                else if constexpr (std::is_same_v<T, RedoAction>)
                {
                    return {fb::Command::Cmd_Redo, fb::CreateCmd_Redo(fbb).Union()};
                }
                else
                {
                    return {fb::Command::Cmd_Reset, fb::CreateCmd_Reset(fbb).Union()};
                }
            },
            a
        );

        flatbuffers::Offset<fb::CommandMsg> const cm =
            fb::CreateCommandMsg(fbb, msg_id, body.first, body.second);
        flatbuffers::Offset<fb::Envelope> const env =
            fb::CreateEnvelope(fbb, fb::Message::CommandMsg, cm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto BuildView(LedgerSnapshot const& s, Outcome const outcome, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::Entry>> entries;
        entries.reserve(s.history.size());
        for (EntryView const& e : s.history)
        {
            entries.push_back(fb::CreateEntry(fbb, fbb.CreateString(e.label), e.value));
        }
        auto const history = fbb.CreateVector(entries);

        flatbuffers::Offset<fb::LedgerView> const view = fb::CreateLedgerView(
            fbb,
            msg_id,
            s.decks_total,
            s.running_count,
            s.true_count,
            static_cast<uint32_t>(s.cards_seen),
            s.decks_remaining,
            s.can_undo,
            s.can_redo,
            static_cast<uint32_t>(s.undo_remaining),
            static_cast<uint32_t>(s.redo_pending),
            history,
            ToFbOutcome(outcome)
        );

        flatbuffers::Offset<fb::Envelope> const env =
            fb::CreateEnvelope(fbb, fb::Message::LedgerView, view.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Decode (inbound) ----------

    auto DecodeCommand(std::span<std::byte const> bytes)
        -> std::expected<DecodedCommand, ParseError>
    {
        auto const* env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(ParseError{"buffer failed verification"});

        if (env->message_type() != fb::Message::CommandMsg)
            return std::unexpected(ParseError{"not a CommandMsg"});

        auto const* cm = env->message_as_CommandMsg();

        DecodedCommand out{};
        out.msg_id = cm->msg_id();

        switch (cm->command_type())
        {
        case fb::Command::Cmd_Record:
        {
            auto const* r = cm->command_as_Cmd_Record();
            std::string label = r->label() ? r->label()->str() : std::string{};
            out.action = RecordAction{std::move(label), r->value()};
            return out;
        }
        case fb::Command::Cmd_Undo:
            out.action = UndoAction{};
            return out;

        case fb::Command::Cmd_Redo:
            out.action = RedoAction{};
            return out;

        case fb::Command::Cmd_Reset:
            out.action = ResetAction{};
            return out;

        default:
            return std::unexpected(ParseError{"unknown command variant"});
        }
    }

    auto DecodeView(std::span<std::byte const> bytes)
        -> std::expected<DecodedView, ParseError>
    {
        auto const* env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(ParseError{"buffer failed verification"});

        if (env->message_type() != fb::Message::LedgerView)
            return std::unexpected(ParseError{"not a LedgerView"});

        auto const* lv = env->message_as_LedgerView();

        DecodedView out{};
        out.msg_id = lv->msg_id();
        out.outcome = FromFbOutcome(lv->outcome());

        LedgerSnapshot& s = out.snapshot;
        s.decks_total = lv->decks_total();
        s.running_count = lv->running_count();
        s.true_count = lv->true_count();
        s.cards_seen = lv->cards_seen();
        s.decks_remaining = lv->decks_remaining();
        s.can_undo = lv->can_undo();
        s.can_redo = lv->can_redo();
        s.undo_remaining = lv->undo_remaining();
        s.redo_pending = lv->redo_pending();

        if (auto const* hv = lv->history())
        {
            s.history.reserve(hv->size());
            for (auto const* e : *hv)
            {
                s.history.push_back(EntryView{e->label() ? e->label()->str() : std::string{}, e->value()});
            }
        }
        return out;
    }
} // namespace bjc::core::wire
