//
// Created by Malik T on 02/09/2025.
//
#include "Keymap.hpp"

#include <array>
#include <cctype>
#include <utility>

#include "../core/Util.hpp"

namespace bjc::ui
{
    namespace
    {
        struct Alias
        {
            std::string_view name;
            std::string_view key;
        };

        // Tk-style keysym names accepted on input
        constexpr std::array<Alias, 12> Aliases{{
            {"plus", "+"},
            {"minus", "-"},
            {"equal", "="},
            {"kp_add", "+"},
            {"kp_subtract", "-"},
            {"less", "<"},
            {"greater", ">"},
            {"comma", ","},
            {"period", "."},
            {"bracketleft", "["},
            {"bracketright", "]"},
            {"space", " "},
        }};

        constexpr std::array<std::string_view, 4> NamedKeys{"left", "right", "up", "down"};

        auto StripPrefix(std::string_view& s, std::string_view prefix) -> bool
        {
            // a bare "ctrl+" would leave nothing to press
            if (s.size() > prefix.size() && s.starts_with(prefix))
            {
                s.remove_prefix(prefix.size());
                return true;
            }
            return false;
        }
    }

    auto ParseKey(std::string_view const token) -> std::optional<KeyChord>
    {
        if (token.empty())
        {
            return std::nullopt;
        }

        std::string const lowered = core::util::ToLower(token);
        std::string_view rest{lowered};

        KeyChord kc{};
        for (bool stripped = true; stripped;)
        {
            stripped = false;
            if (StripPrefix(rest, "ctrl+"))
            {
                kc.mods |= ModCtrl;
                stripped = true;
            }
            if (StripPrefix(rest, "shift+"))
            {
                kc.mods |= ModShift;
                stripped = true;
            }
        }

        if (rest.size() == 1)
        {
            unsigned char const c = static_cast<unsigned char>(rest.front());
            if (!std::isgraph(c))
            {
                return std::nullopt;
            }
            kc.key = std::string(rest);
            return kc;
        }

        for (Alias const& a : Aliases)
        {
            if (a.name == rest)
            {
                kc.key = std::string(a.key);
                return kc;
            }
        }
        for (std::string_view const named : NamedKeys)
        {
            if (named == rest)
            {
                kc.key = std::string(named);
                return kc;
            }
        }
        return std::nullopt;
    }

    auto DescribeKey(KeyChord const& kc) -> std::string
    {
        std::string s;
        if (kc.mods & ModCtrl) s += "Ctrl+";
        if (kc.mods & ModShift) s += "Shift+";

        if (kc.key.size() == 1)
        {
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(kc.key.front()))));
        }
        else if (!kc.key.empty())
        {
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(kc.key.front()))));
            s += kc.key.substr(1);
        }
        return s;
    }

    Keymap::Keymap(std::vector<Binding> bindings) :
        bindings_(std::move(bindings))
    {
        index_.reserve(bindings_.size());
        for (std::size_t i{}; i < bindings_.size(); ++i)
        {
            index_[bindings_[i].chord] = i;
        }
    }

    auto Keymap::Resolve(KeyChord const& kc) const -> std::optional<core::LedgerAction>
    {
        auto const it = index_.find(kc);
        if (it == index_.end())
        {
            return std::nullopt;
        }
        return bindings_[it->second].action;
    }
}
