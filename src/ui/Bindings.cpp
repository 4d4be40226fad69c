//
// Created by Malik T on 02/09/2025.
//
#include "Bindings.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string>

#include "../core/Exception.hpp"
#include "../core/Systems.hpp"

namespace bjc::ui
{
    namespace
    {
        // Hotkey definitions live here; tweak before they get bound.
        constexpr std::array<std::string_view, 1> LettersLow{"l"};
        constexpr std::array<std::string_view, 1> LettersHi{"h"};
        constexpr std::array<std::string_view, 1> AdjacentLow{"a"};
        constexpr std::array<std::string_view, 1> AdjacentHi{"d"};
        constexpr std::array<std::string_view, 1> SymbolsLow{"-"};
        constexpr std::array<std::string_view, 2> SymbolsHi{"+", "="};
        constexpr std::array<std::string_view, 1> HorizontalLow{"left"};
        constexpr std::array<std::string_view, 1> HorizontalHi{"right"};
        constexpr std::array<std::string_view, 1> VerticalLow{"down"};
        constexpr std::array<std::string_view, 1> VerticalHi{"up"};
        constexpr std::array<std::string_view, 1> BracketsLow{"["};
        constexpr std::array<std::string_view, 1> BracketsHi{"]"};

        constexpr std::array<HotkeyGroup, 6> Groups{{
            {"letters", "Letters", LettersLow, LettersHi},
            {"adjacent", "A / D", AdjacentLow, AdjacentHi},
            {"symbols", "Minus / Plus", SymbolsLow, SymbolsHi},
            {"horizontal_arrows", "Arrow Keys", HorizontalLow, HorizontalHi},
            {"vertical_arrows", "Vertical Arrows", VerticalLow, VerticalHi},
            {"brackets", "Brackets", BracketsLow, BracketsHi},
        }};

        constexpr std::array<RankKey, 10> RankKeys{{
            {"2", "2"},
            {"3", "3"},
            {"4", "4"},
            {"5", "5"},
            {"6", "6"},
            {"0", "10"},
            {"q", "J"},
            {"w", "Q"},
            {"e", "K"},
            {"1", "A"},
        }};

        constexpr std::array<CardKey, 13> CardKeys{{
            {"2", "q"},
            {"3", "w"},
            {"4", "e"},
            {"5", "r"},
            {"6", "a"},
            {"7", "s"},
            {"8", "d"},
            {"9", "f"},
            {"10", "g"},
            {"J", "z"},
            {"Q", "x"},
            {"K", "c"},
            {"A", "v"},
        }};

        auto Bind(std::string_view const key, core::LedgerAction action) -> Binding
        {
            std::optional<KeyChord> kc = ParseKey(key);
            BJC_ASSERT(kc.has_value(), std::format("Unparseable key '{}' in binding table", key));
            return Binding{std::move(*kc), std::move(action)};
        }

        auto HiLoRecord(core::RankCategory const c) -> core::RecordAction
        {
            // Hi-Lo records the side pressed, not the card
            std::string label = c == core::RankCategory::Low ? "Low" : "Hi";
            return core::RecordAction{std::move(label), core::HiLoValue(c)};
        }
    }

    auto CommonBindings() -> std::vector<Binding>
    {
        std::vector<Binding> out;
        out.push_back(Bind("ctrl+r", core::ResetAction{}));
        for (std::string_view const k : {"<", ",", "ctrl+z"})
        {
            out.push_back(Bind(k, core::UndoAction{}));
        }
        for (std::string_view const k : {">", ".", "ctrl+shift+z"})
        {
            out.push_back(Bind(k, core::RedoAction{}));
        }
        return out;
    }

    auto HiLoHotkeyGroups() noexcept -> std::span<HotkeyGroup const> { return Groups; }

    auto FindHotkeyGroup(std::string_view const name) noexcept -> HotkeyGroup const*
    {
        auto const it = std::ranges::find_if(Groups, [name](HotkeyGroup const& g) { return g.name == name; });
        return it != Groups.end() ? &*it : nullptr;
    }

    auto GroupBindings(HotkeyGroup const& g) -> std::vector<Binding>
    {
        std::vector<Binding> out;
        for (std::string_view const k : g.low_keys)
        {
            out.push_back(Bind(k, HiLoRecord(core::RankCategory::Low)));
        }
        for (std::string_view const k : g.hi_keys)
        {
            out.push_back(Bind(k, HiLoRecord(core::RankCategory::High)));
        }
        return out;
    }

    auto HiLoRankKeys() noexcept -> std::span<RankKey const> { return RankKeys; }

    auto RankModeBindings() -> std::vector<Binding>
    {
        std::vector<Binding> out;
        for (RankKey const& rk : RankKeys)
        {
            auto const ranks = core::HiLoRanks();
            auto const it = std::ranges::find_if(ranks, [&](core::RankEntry const& r) { return r.card == rk.card; });
            BJC_ASSERT(it != ranks.end(), std::format("Rank key for unknown card '{}'", rk.card));
            if (it->category == core::RankCategory::Neutral)
            {
                continue;
            }
            out.push_back(Bind(rk.key, HiLoRecord(it->category)));
        }
        return out;
    }

    auto WongCardKeys() noexcept -> std::span<CardKey const> { return CardKeys; }

    auto WongBindings() -> std::vector<Binding>
    {
        std::vector<Binding> out;
        for (CardKey const& ck : CardKeys)
        {
            std::optional<core::CountAction> const a = core::FindAction(core::WongHalves(), ck.card);
            BJC_ASSERT(a.has_value(), std::format("Card '{}' missing from Wong Halves table", ck.card));
            out.push_back(Bind(ck.key, core::RecordAction{std::string(a->label), a->value}));
        }
        return out;
    }

    auto JoinKeys(std::span<std::string_view const> keys, std::string_view const sep) -> std::string
    {
        std::string s;
        for (std::size_t i{}; i < keys.size(); ++i)
        {
            s += (i ? std::string(sep) : std::string{});
            std::optional<KeyChord> const kc = ParseKey(keys[i]);
            s += kc ? DescribeKey(*kc) : std::string(keys[i]);
        }
        return s;
    }
}
