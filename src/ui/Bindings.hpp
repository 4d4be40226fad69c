//
// Created by Malik T on 02/09/2025.
//

#ifndef BJCOUNTER_BINDINGS_HPP
#define BJCOUNTER_BINDINGS_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Keymap.hpp"

namespace bjc::ui
{
    // Reset, undo and redo; shared by every counting screen
    auto CommonBindings() -> std::vector<Binding>;

    // A toggleable pair of Hi-Lo keys
    struct HotkeyGroup
    {
        std::string_view name;
        std::string_view title;
        std::span<std::string_view const> low_keys;
        std::span<std::string_view const> hi_keys;
    };

    auto HiLoHotkeyGroups() noexcept -> std::span<HotkeyGroup const>;
    auto FindHotkeyGroup(std::string_view name) noexcept -> HotkeyGroup const*;
    auto GroupBindings(HotkeyGroup const& g) -> std::vector<Binding>;

    // Hi-Lo rank mode: card key -> card, neutral ranks have no key
    struct RankKey
    {
        std::string_view key;
        std::string_view card;
    };
    auto HiLoRankKeys() noexcept -> std::span<RankKey const>;
    auto RankModeBindings() -> std::vector<Binding>;

    // Wong Halves: one key per rank
    struct CardKey
    {
        std::string_view card;
        std::string_view key;
    };
    auto WongCardKeys() noexcept -> std::span<CardKey const>;
    auto WongBindings() -> std::vector<Binding>;

    // "L / A / -" for the keys in a group side
    auto JoinKeys(std::span<std::string_view const> keys, std::string_view sep) -> std::string;
}

#endif //BJCOUNTER_BINDINGS_HPP
