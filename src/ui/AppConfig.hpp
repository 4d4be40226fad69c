//
// Created by Malik T on 04/09/2025.
//

#ifndef BJCOUNTER_APPCONFIG_HPP
#define BJCOUNTER_APPCONFIG_HPP

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../core/Types.hpp"

namespace bjc::ui
{
    struct AppConfig
    {
        core::LedgerConfig ledger{};
        std::optional<std::string> system;      // skip the menus and start this system
        std::optional<std::string> audit_path;  // session transcript
        bool show_help{false};
    };

    struct ConfigIssue
    {
        std::string message;
    };

    // --decks <real> --undo-budget <n> --redo-cap <n> --system hilo|wong --audit <path> --help
    auto ParseArgs(std::span<char const* const> args) -> std::expected<AppConfig, ConfigIssue>;

    auto Usage(std::string_view prog) -> std::string;
}

#endif //BJCOUNTER_APPCONFIG_HPP
