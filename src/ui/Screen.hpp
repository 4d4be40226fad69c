//
// Created by Malik T on 03/09/2025.
//

#ifndef BJCOUNTER_SCREEN_HPP
#define BJCOUNTER_SCREEN_HPP

#include <ostream>
#include <string_view>

#include "../core/Systems.hpp"
#include "Keymap.hpp"

namespace bjc::ui
{
    enum class ScreenId : uint8_t
    {
        StartMenu,
        ModeSelection,
        HiLo,
        WongHalves
    };

    // Implemented by the app; screens ask it to move, never switch themselves.
    class Navigator
    {
    public:
        virtual ~Navigator() = default;

        virtual auto ShowScreen(ScreenId id) -> void = 0;
        // Creates a fresh session for the system and shows its counting screen
        virtual auto StartMode(core::CountingSystem const& system) -> void = 0;
        virtual auto Quit() -> void = 0;
    };

    class Screen
    {
    public:
        virtual ~Screen() = default;

        // Lifecycle hooks, called by the app around every switch. Default: nothing to do.
        virtual auto OnShow() -> void {}
        virtual auto OnHide() -> void {}

        virtual auto Render(std::ostream& out) const -> void = 0;

        // true when the key meant something on this screen
        virtual auto HandleKey(KeyChord const& kc) -> bool = 0;

        // ":name arg" lines. true when understood.
        virtual auto HandleCommand(std::string_view name, std::string_view arg) -> bool
        {
            (void)name;
            (void)arg;
            return false;
        }
    };
}

#endif //BJCOUNTER_SCREEN_HPP
