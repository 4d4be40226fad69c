//
// Created by Malik T on 03/09/2025.
//
#include "CountingScreen.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <print>
#include <string>

#include "../core/Exception.hpp"
#include "../core/Formatting.hpp"
#include "Bindings.hpp"

namespace bjc::ui
{
    CountingScreen::CountingScreen(Navigator& nav, core::CountingSystem const& system) :
        nav_(nav),
        system_(system)
    {
    }

    auto CountingScreen::Attach(bjc::wire::SessionHost& host) -> void
    {
        host_ = &host;
        auto const reply = host_->CurrentView(msg_id_++);
        auto decoded = core::wire::DecodeView(core::wire::AsBytes(reply));
        if (!decoded.has_value())
        {
            BJC_THROW(core::error::Code::Serialization,
                      std::format("Session answered with an unreadable view: {}", decoded.error().message));
        }
        view_ = std::move(*decoded);
    }

    auto CountingScreen::Detach() -> void
    {
        host_ = nullptr;
        view_.reset();
    }

    auto CountingScreen::OnShow() -> void
    {
        active_ = true;
        RebuildKeymap();
    }

    auto CountingScreen::OnHide() -> void
    {
        active_ = false;
        show_hotkeys_ = false;
        keymap_ = Keymap{};
    }

    auto CountingScreen::RebuildKeymap() -> void
    {
        if (!active_)
        {
            return;
        }
        std::vector<Binding> bindings = CommonBindings();
        std::ranges::move(ModeBindings(), std::back_inserter(bindings));
        keymap_ = Keymap{std::move(bindings)};
    }

    auto CountingScreen::Dispatch(core::LedgerAction const& a) -> core::Outcome
    {
        if (!host_)
        {
            return core::Outcome::NoOp;
        }

        auto const cmd = core::wire::BuildCommand(a, msg_id_++);
        auto const reply = host_->Handle(core::wire::AsBytes(cmd));
        auto decoded = core::wire::DecodeView(core::wire::AsBytes(reply));
        if (!decoded.has_value())
        {
            std::print("[bjcounter] unreadable view from session: {}\n", decoded.error().message);
            return core::Outcome::NoOp;
        }
        view_ = std::move(*decoded);
        return view_->outcome;
    }

    auto CountingScreen::HandleKey(KeyChord const& kc) -> bool
    {
        std::optional<core::LedgerAction> const action = keymap_.Resolve(kc);
        if (!action)
        {
            return false;
        }
        // a bound key is consumed even when the ledger says NoOp
        (void)Dispatch(*action);
        return true;
    }

    auto CountingScreen::HandleCommand(std::string_view const name, std::string_view const arg) -> bool
    {
        (void)arg;
        if (name == "menu")
        {
            nav_.ShowScreen(ScreenId::ModeSelection);
            return true;
        }
        if (name == "hotkeys")
        {
            show_hotkeys_ = !show_hotkeys_;
            return true;
        }
        return false;
    }

    auto CountingScreen::Render(std::ostream& out) const -> void
    {
        out << std::format("== {} ==\n", system_.name);
        if (!view_)
        {
            out << "(no active shoe)\n";
            return;
        }

        core::LedgerSnapshot const& s = view_->snapshot;
        out << std::format("Previously Counted: {}\n", core::FormatHistory(s.history));
        out << std::format("Running Count: {}\n", core::FormatIncrement(s.running_count));
        out << std::format("True Count: {}\n", core::FormatTrueCount(s.true_count));
        out << std::format("{}\n", core::FormatCardsSeen(s.cards_seen));
        out << std::format("Undo [< / Ctrl+Z]: {} ({} left)   Redo [> / Ctrl+Shift+Z]: {} ({} pending)\n",
                           s.can_undo ? "enabled" : "disabled", s.undo_remaining,
                           s.can_redo ? "enabled" : "disabled", s.redo_pending);
        RenderControls(out);
        out << "Reset Shoe [Ctrl+R]   Menu [:menu]   Hotkeys [:hotkeys]\n";
        if (show_hotkeys_)
        {
            RenderHotkeys(out);
        }
    }

    // ---------------- Hi-Lo ----------------

    HiLoScreen::HiLoScreen(Navigator& nav) :
        CountingScreen(nav, core::HiLo())
    {
        BJC_ASSERT(HiLoHotkeyGroups().size() == group_enabled_.size(), "Hotkey group table size drifted");
    }

    auto HiLoScreen::GroupIndex(std::string_view const group) const -> std::optional<std::size_t>
    {
        auto const groups = HiLoHotkeyGroups();
        auto const it = std::ranges::find_if(groups, [group](HotkeyGroup const& g) { return g.name == group; });
        if (it == groups.end())
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(groups.begin(), it));
    }

    auto HiLoScreen::SetGroupEnabled(std::string_view const group, bool const enabled) -> bool
    {
        std::optional<std::size_t> const idx = GroupIndex(group);
        if (!idx)
        {
            return false;
        }
        bool const previous = group_enabled_[*idx];
        group_enabled_[*idx] = enabled;
        if (previous != enabled)
        {
            RebuildKeymap();
        }
        return true;
    }

    auto HiLoScreen::GroupEnabled(std::string_view const group) const -> bool
    {
        std::optional<std::size_t> const idx = GroupIndex(group);
        return idx && group_enabled_[*idx];
    }

    auto HiLoScreen::SetRankMode(bool const enabled) -> void
    {
        if (rank_mode_ == enabled)
        {
            return;
        }
        rank_mode_ = enabled;
        RebuildKeymap();
    }

    auto HiLoScreen::HandleCommand(std::string_view const name, std::string_view const arg) -> bool
    {
        if (name == "toggle")
        {
            std::optional<std::size_t> const idx = GroupIndex(arg);
            if (!idx)
            {
                std::print("[bjcounter] unknown hotkey group '{}'\n", arg);
                return false;
            }
            return SetGroupEnabled(arg, !group_enabled_[*idx]);
        }
        if (name == "rank")
        {
            SetRankMode(!rank_mode_);
            return true;
        }
        return CountingScreen::HandleCommand(name, arg);
    }

    auto HiLoScreen::ModeBindings() const -> std::vector<Binding>
    {
        std::vector<Binding> out;
        auto const groups = HiLoHotkeyGroups();
        for (std::size_t i{}; i < groups.size(); ++i)
        {
            if (group_enabled_[i])
            {
                std::ranges::move(GroupBindings(groups[i]), std::back_inserter(out));
            }
        }
        if (rank_mode_)
        {
            std::ranges::move(RankModeBindings(), std::back_inserter(out));
        }
        return out;
    }

    auto HiLoScreen::RenderControls(std::ostream& out) const -> void
    {
        std::string low_cards;
        std::string high_cards;
        for (core::RankEntry const& r : core::HiLoRanks())
        {
            if (r.category == core::RankCategory::Low)
            {
                low_cards += (low_cards.empty() ? "" : " ") + std::string(r.card);
            }
            else if (r.category == core::RankCategory::High)
            {
                high_cards += (high_cards.empty() ? "" : " ") + std::string(r.card);
            }
        }
        out << std::format("Low Cards (+1): {}   High Cards (-1): {}\n", low_cards, high_cards);

        std::string low_keys;
        std::string hi_keys;
        auto const groups = HiLoHotkeyGroups();
        for (std::size_t i{}; i < groups.size(); ++i)
        {
            if (!group_enabled_[i])
            {
                continue;
            }
            low_keys += (low_keys.empty() ? "" : " / ") + JoinKeys(groups[i].low_keys, " / ");
            hi_keys += (hi_keys.empty() ? "" : " / ") + JoinKeys(groups[i].hi_keys, " / ");
        }
        out << std::format("Low (+1) [{}]   Hi (-1) [{}]\n", low_keys, hi_keys);
    }

    auto HiLoScreen::RankModeText() const -> std::string
    {
        if (!rank_mode_)
        {
            return "Enable rank mode to use card-rank shortcuts (2-A).";
        }

        std::string low;
        std::string high;
        std::string neutral;
        for (core::RankEntry const& r : core::HiLoRanks())
        {
            auto const keys = HiLoRankKeys();
            auto const it = std::ranges::find_if(keys, [&](RankKey const& k) { return k.card == r.card; });
            std::string entry = it != keys.end()
                ? std::format("{} [{}]", r.card, JoinKeys(std::span{&it->key, 1}, ""))
                : std::string(r.card);

            std::string& bucket = r.category == core::RankCategory::Low ? low
                                : r.category == core::RankCategory::High ? high : neutral;
            bucket += (bucket.empty() ? "" : ", ") + entry;
        }

        std::string text = std::format("Low (+1): {}\nHigh (-1): {}", low, high);
        if (!neutral.empty())
        {
            text += std::format("\nNeutral (0): {} (no change)", neutral);
        }
        return text;
    }

    auto HiLoScreen::RenderHotkeys(std::ostream& out) const -> void
    {
        out << "-- Hi-Lo Hotkeys (:toggle <group> to enable or disable a pair) --\n";
        auto const groups = HiLoHotkeyGroups();
        for (std::size_t i{}; i < groups.size(); ++i)
        {
            out << std::format("  {:<18} {:<16} Low: {:<8} Hi: {:<10} {}\n",
                               groups[i].name, groups[i].title,
                               JoinKeys(groups[i].low_keys, " / "),
                               JoinKeys(groups[i].hi_keys, " / "),
                               group_enabled_[i] ? "Enabled" : "Disabled");
        }
        out << std::format("-- Rank Mode (:rank) {} --\n", rank_mode_ ? "on" : "off");
        out << RankModeText() << '\n';
    }

    // ---------------- Wong Halves ----------------

    WongHalvesScreen::WongHalvesScreen(Navigator& nav) :
        CountingScreen(nav, core::WongHalves())
    {
    }

    auto WongHalvesScreen::ModeBindings() const -> std::vector<Binding>
    {
        return WongBindings();
    }

    auto WongHalvesScreen::RenderControls(std::ostream& out) const -> void
    {
        std::string row;
        for (CardKey const& ck : WongCardKeys())
        {
            std::optional<core::CountAction> const a = core::FindAction(System(), ck.card);
            if (!a)
            {
                continue;
            }
            row += std::format("{}{}({})[{}]", row.empty() ? "" : "  ", ck.card,
                               core::FormatIncrement(a->value), JoinKeys(std::span{&ck.key, 1}, ""));
        }
        out << row << '\n';
    }

    auto WongHalvesScreen::RenderHotkeys(std::ostream& out) const -> void
    {
        out << "-- Wong Halves Hotkeys --\n";
        out << "Undo: <, ,, Ctrl+Z\n";
        out << "Redo: >, ., Ctrl+Shift+Z\n";
        out << "Reset Shoe: Ctrl+R\n";

        auto const keys = WongCardKeys();
        for (std::size_t i{}; i < keys.size(); ++i)
        {
            out << std::format("  {:<8}", std::format("{}: {}", keys[i].card, JoinKeys(std::span{&keys[i].key, 1}, "")));
            if (i % 3 == 2 || i + 1 == keys.size())
            {
                out << '\n';
            }
        }
    }
}
