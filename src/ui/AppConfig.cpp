//
// Created by Malik T on 04/09/2025.
//
#include "AppConfig.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <format>

#include "../core/Systems.hpp"

namespace bjc::ui
{
    auto ParseArgs(std::span<char const* const> const args) -> std::expected<AppConfig, ConfigIssue>
    {
        AppConfig cfg{};

        // args[0] is the program name
        for (std::size_t i = 1; i < args.size(); ++i)
        {
            std::string_view const arg = args[i];

            auto next_value = [&]() -> std::expected<std::string_view, ConfigIssue>
            {
                if (i + 1 >= args.size())
                {
                    return std::unexpected(ConfigIssue{std::format("{} needs a value", arg)});
                }
                return std::string_view{args[++i]};
            };

            auto next_uint = [&](std::uint64_t& out) -> std::expected<void, ConfigIssue>
            {
                auto const v = next_value();
                if (!v) return std::unexpected(v.error());
                auto const res = std::from_chars(v->data(), v->data() + v->size(), out);
                if (res.ec != std::errc{} || res.ptr != v->data() + v->size())
                {
                    return std::unexpected(ConfigIssue{std::format("{} expects a whole number, got '{}'", arg, *v)});
                }
                return {};
            };

            if (arg == "--decks")
            {
                auto const v = next_value();
                if (!v) return std::unexpected(v.error());
                double d{};
                auto const res = std::from_chars(v->data(), v->data() + v->size(), d);
                if (res.ec != std::errc{} || res.ptr != v->data() + v->size() || !std::isfinite(d) || d <= 0.0)
                {
                    return std::unexpected(ConfigIssue{std::format("--decks expects a positive number, got '{}'", *v)});
                }
                cfg.ledger.decks_total = d;
            }
            else if (arg == "--undo-budget")
            {
                std::uint64_t v{};
                if (auto const r = next_uint(v); !r) return std::unexpected(r.error());
                cfg.ledger.undo_budget = static_cast<std::size_t>(v);
            }
            else if (arg == "--redo-cap")
            {
                std::uint64_t v{};
                if (auto const r = next_uint(v); !r) return std::unexpected(r.error());
                if (v == 0)
                {
                    return std::unexpected(ConfigIssue{"--redo-cap must be at least 1"});
                }
                cfg.ledger.redo_cap = static_cast<std::size_t>(v);
            }
            else if (arg == "--system")
            {
                auto const v = next_value();
                if (!v) return std::unexpected(v.error());
                if (core::FindSystem(*v) == nullptr)
                {
                    return std::unexpected(ConfigIssue{std::format("unknown counting system '{}'", *v)});
                }
                cfg.system = std::string(*v);
            }
            else if (arg == "--audit")
            {
                auto const v = next_value();
                if (!v) return std::unexpected(v.error());
                cfg.audit_path = std::string(*v);
            }
            else if (arg == "--help" || arg == "-h")
            {
                cfg.show_help = true;
            }
            else
            {
                return std::unexpected(ConfigIssue{std::format("unknown argument '{}'", arg)});
            }
        }
        return cfg;
    }

    auto Usage(std::string_view const prog) -> std::string
    {
        std::string s = std::format("usage: {} [options]\n", prog);
        s += std::format("  --decks <n>         decks in the shoe (default {})\n", core::constants::DefaultDecks);
        s += std::format("  --undo-budget <n>   undos allowed between records (default {})\n", core::constants::DefaultUndoBudget);
        s += std::format("  --redo-cap <n>      most undone entries kept for redo (default {})\n", core::constants::DefaultRedoCap);
        s += "  --system <id>       start straight into a system:";
        for (core::CountingSystem const* sys : core::AllSystems())
        {
            s += std::format(" {}", sys->key);
        }
        s += "\n  --audit <path>      write a session transcript\n";
        s += "  --help              this text\n";
        return s;
    }
}
