//
// Created by Malik T on 04/09/2025.
//

#ifndef BJCOUNTER_APP_HPP
#define BJCOUNTER_APP_HPP

#include <istream>
#include <memory>
#include <ostream>
#include <string_view>

#include "../debug/AuditLogger.hpp"
#include "../wire/SessionHost.hpp"
#include "AppConfig.hpp"
#include "CountingScreen.hpp"
#include "MenuScreens.hpp"
#include "Screen.hpp"

namespace bjc::ui
{
    // Top-level navigation. Owns at most one SessionHost; leaving a counting screen discards it.
    class App final : public Navigator
    {
    public:
        App(AppConfig config, std::ostream& out);
        ~App() override;

        App(App const&) = delete;
        auto operator=(App const&) -> App& = delete;

        // Reads lines until EOF or :quit. Returns the process exit code.
        auto Run(std::istream& in) -> int;

        // One input line: whitespace separated keys, or a single ":command [arg]"
        auto Feed(std::string_view line) -> void;
        auto RenderActive() const -> void;

        auto ShowScreen(ScreenId id) -> void override;
        auto StartMode(core::CountingSystem const& system) -> void override;
        auto Quit() -> void override { running_ = false; }

        auto Running() const noexcept -> bool { return running_; }
        auto ActiveId() const noexcept -> ScreenId { return active_id_; }
        auto Host() const noexcept -> bjc::wire::SessionHost const* { return host_.get(); }
        auto HiLo() noexcept -> HiLoScreen& { return hilo_; }
        auto Wong() noexcept -> WongHalvesScreen& { return wong_; }

    private:
        auto ScreenFor(ScreenId id) -> Screen&;
        auto ScreenFor(ScreenId id) const -> Screen const&;
        auto CountingFor(core::SystemId id) -> CountingScreen&;
        auto HandleCommandLine(std::string_view line) -> void;

        AppConfig cfg_;
        std::ostream& out_;

        std::unique_ptr<bjc::core::debug::AuditLogger> audit_;  // must outlive host_
        std::unique_ptr<bjc::wire::SessionHost> host_;

        StartMenu start_;
        ModeSelection modes_;
        HiLoScreen hilo_;
        WongHalvesScreen wong_;

        ScreenId active_id_{ScreenId::StartMenu};
        bool running_{true};
    };
}

#endif //BJCOUNTER_APP_HPP
