//
// Created by Malik T on 03/09/2025.
//
#include "MenuScreens.hpp"

#include <format>
#include <string>

namespace bjc::ui
{
    auto StartMenu::Render(std::ostream& out) const -> void
    {
        out << "== Manual Blackjack Counter ==\n";
        out << "  [1/N] New Game\n";
        out << "  [Q]   Quit\n";
    }

    auto StartMenu::HandleKey(KeyChord const& kc) -> bool
    {
        if (kc.mods != ModNone)
        {
            return false;
        }
        if (kc.key == "1" || kc.key == "n")
        {
            nav_.ShowScreen(ScreenId::ModeSelection);
            return true;
        }
        if (kc.key == "q")
        {
            nav_.Quit();
            return true;
        }
        return false;
    }

    auto ModeSelection::Render(std::ostream& out) const -> void
    {
        out << "== Choose a Counting System ==\n";
        auto const systems = core::AllSystems();
        for (std::size_t i{}; i < systems.size(); ++i)
        {
            out << std::format("  [{}] {}\n", i + 1, systems[i]->name);
        }
        out << "  [B] Back\n";
    }

    auto ModeSelection::HandleKey(KeyChord const& kc) -> bool
    {
        if (kc.mods != ModNone)
        {
            return false;
        }
        if (kc.key == "b")
        {
            nav_.ShowScreen(ScreenId::StartMenu);
            return true;
        }

        auto const systems = core::AllSystems();
        for (std::size_t i{}; i < systems.size(); ++i)
        {
            if (kc.key == std::to_string(i + 1))
            {
                nav_.StartMode(*systems[i]);
                return true;
            }
        }
        return false;
    }
}
