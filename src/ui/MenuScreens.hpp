//
// Created by Malik T on 03/09/2025.
//

#ifndef BJCOUNTER_MENUSCREENS_HPP
#define BJCOUNTER_MENUSCREENS_HPP

#include "Screen.hpp"

namespace bjc::ui
{
    // Landing screen: new game or quit
    class StartMenu final : public Screen
    {
    public:
        explicit StartMenu(Navigator& nav) : nav_(nav) {}

        auto Render(std::ostream& out) const -> void override;
        auto HandleKey(KeyChord const& kc) -> bool override;

    private:
        Navigator& nav_;
    };

    // Pick a counting system
    class ModeSelection final : public Screen
    {
    public:
        explicit ModeSelection(Navigator& nav) : nav_(nav) {}

        auto Render(std::ostream& out) const -> void override;
        auto HandleKey(KeyChord const& kc) -> bool override;

    private:
        Navigator& nav_;
    };
}

#endif //BJCOUNTER_MENUSCREENS_HPP
