#ifndef BJCOUNTER_CODEC_HPP
#define BJCOUNTER_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"

#include "generated/flatbuffers/bjc_wire_generated.h"

namespace bjc::core::wire
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    // What a command envelope decodes into
    struct DecodedCommand
    {
        std::uint64_t msg_id{};
        LedgerAction action{};
    };

    // What a view envelope decodes into
    struct DecodedView
    {
        std::uint64_t msg_id{};
        Outcome outcome{Outcome::NoOp};
        LedgerSnapshot snapshot{};
    };

    auto ToFbOutcome(Outcome o) noexcept -> bjc::gen::wire::Outcome;
    auto FromFbOutcome(bjc::gen::wire::Outcome o) noexcept -> Outcome;

    // --- Outbound builders ---

    // presentation -> session
    auto BuildCommand(LedgerAction const& a, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // session -> presentation
    auto BuildView(LedgerSnapshot const& s, Outcome outcome, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode; both verify the buffer before touching it ---

    auto DecodeCommand(std::span<std::byte const> bytes)
        -> std::expected<DecodedCommand, ParseError>;

    auto DecodeView(std::span<std::byte const> bytes)
        -> std::expected<DecodedView, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace bjc::core::wire


#endif //BJCOUNTER_CODEC_HPP
