//
// Created by Malik T on 02/09/2025.
//

#ifndef BJCOUNTER_KEYMAP_HPP
#define BJCOUNTER_KEYMAP_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../core/Actions.hpp"

namespace bjc::ui
{
    enum Mod : uint8_t
    {
        ModNone  = 0,
        ModCtrl  = 1 << 0,
        ModShift = 1 << 1
    };

    struct KeyChord
    {
        std::string key;   // lower-case letter, digit, symbol, or named key ("left")
        uint8_t mods{ModNone};

        auto operator==(KeyChord const& other) const -> bool = default;
    };

    struct KeyChordHash
    {
        auto operator()(KeyChord const& kc) const noexcept -> std::size_t
        {
            return std::hash<std::string>{}(kc.key) ^ (static_cast<std::size_t>(kc.mods) << 16U);
        }
    };

    // "l", "L", "ctrl+shift+z", "left", "<", "plus". nullopt for anything unrecognised.
    auto ParseKey(std::string_view token) -> std::optional<KeyChord>;
    // Display form: "Ctrl+Shift+Z", "L", "Left", "<"
    auto DescribeKey(KeyChord const& kc) -> std::string;

    struct Binding
    {
        KeyChord chord;
        core::LedgerAction action;
    };

    // Immutable key -> ledger operation table. Screens build one when shown and drop it when hidden.
    class Keymap
    {
    public:
        Keymap() = default;
        // Later bindings win on duplicate chords
        explicit Keymap(std::vector<Binding> bindings);

        [[nodiscard]] auto Resolve(KeyChord const& kc) const -> std::optional<core::LedgerAction>;
        [[nodiscard]] auto Empty() const noexcept -> bool { return index_.empty(); }
        [[nodiscard]] auto Size() const noexcept -> std::size_t { return index_.size(); }
        [[nodiscard]] auto Bindings() const noexcept -> std::span<Binding const> { return bindings_; }

    private:
        std::vector<Binding> bindings_;
        std::unordered_map<KeyChord, std::size_t, KeyChordHash> index_;
    };
}

#endif //BJCOUNTER_KEYMAP_HPP
