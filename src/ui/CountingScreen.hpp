//
// Created by Malik T on 03/09/2025.
//

#ifndef BJCOUNTER_COUNTINGSCREEN_HPP
#define BJCOUNTER_COUNTINGSCREEN_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Systems.hpp"
#include "../wire/SessionHost.hpp"
#include "../wire/codec.hpp"
#include "Keymap.hpp"
#include "Screen.hpp"

namespace bjc::ui
{
    // Shared layout for both counting systems. Talks to the session only through
    // command/view envelopes and renders whatever view came back last.
    class CountingScreen : public Screen
    {
    public:
        CountingScreen(Navigator& nav, core::CountingSystem const& system);

        // Bind to a freshly created session; host must outlive the binding
        auto Attach(bjc::wire::SessionHost& host) -> void;
        auto Detach() -> void;

        auto OnShow() -> void override;
        auto OnHide() -> void override;

        auto Render(std::ostream& out) const -> void override;
        auto HandleKey(KeyChord const& kc) -> bool override;
        auto HandleCommand(std::string_view name, std::string_view arg) -> bool override;

        // Encode, hand to the session, decode the answer. NoOp when detached.
        auto Dispatch(core::LedgerAction const& a) -> core::Outcome;

        auto System() const noexcept -> core::CountingSystem const& { return system_; }
        auto View() const noexcept -> std::optional<core::wire::DecodedView> const& { return view_; }
        auto ActiveKeymap() const noexcept -> Keymap const& { return keymap_; }
        auto HotkeysShown() const noexcept -> bool { return show_hotkeys_; }

    protected:
        // System specific keys, appended after the common ones
        virtual auto ModeBindings() const -> std::vector<Binding> = 0;
        virtual auto RenderControls(std::ostream& out) const -> void = 0;
        virtual auto RenderHotkeys(std::ostream& out) const -> void = 0;

        // Re-resolves the keymap; only while shown
        auto RebuildKeymap() -> void;
        auto IsActive() const noexcept -> bool { return active_; }

    private:
        Navigator& nav_;
        core::CountingSystem const& system_;
        bjc::wire::SessionHost* host_{nullptr};

        Keymap keymap_;
        std::optional<core::wire::DecodedView> view_;
        std::uint64_t msg_id_{1};
        bool active_{false};
        bool show_hotkeys_{false};
    };

    class HiLoScreen final : public CountingScreen
    {
    public:
        explicit HiLoScreen(Navigator& nav);

        auto HandleCommand(std::string_view name, std::string_view arg) -> bool override;

        auto SetGroupEnabled(std::string_view group, bool enabled) -> bool;
        auto GroupEnabled(std::string_view group) const -> bool;
        auto SetRankMode(bool enabled) -> void;
        auto RankMode() const noexcept -> bool { return rank_mode_; }

    protected:
        auto ModeBindings() const -> std::vector<Binding> override;
        auto RenderControls(std::ostream& out) const -> void override;
        auto RenderHotkeys(std::ostream& out) const -> void override;

    private:
        auto GroupIndex(std::string_view group) const -> std::optional<std::size_t>;
        auto RankModeText() const -> std::string;

        std::array<bool, 6> group_enabled_{true, true, true, true, true, true};
        bool rank_mode_{false};
    };

    class WongHalvesScreen final : public CountingScreen
    {
    public:
        explicit WongHalvesScreen(Navigator& nav);

    protected:
        auto ModeBindings() const -> std::vector<Binding> override;
        auto RenderControls(std::ostream& out) const -> void override;
        auto RenderHotkeys(std::ostream& out) const -> void override;
    };
}

#endif //BJCOUNTER_COUNTINGSCREEN_HPP
