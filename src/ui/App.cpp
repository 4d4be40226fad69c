//
// Created by Malik T on 04/09/2025.
//
#include "App.hpp"

#include <format>
#include <print>
#include <string>

#include "../core/Exception.hpp"

namespace bjc::ui
{
    namespace
    {
        auto IsCounting(ScreenId const id) -> bool
        {
            return id == ScreenId::HiLo || id == ScreenId::WongHalves;
        }

        auto Trim(std::string_view s) -> std::string_view
        {
            constexpr std::string_view ws = " \t\r\n";
            std::size_t const b = s.find_first_not_of(ws);
            if (b == std::string_view::npos)
            {
                return {};
            }
            std::size_t const e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }
    }

    App::App(AppConfig config, std::ostream& out) :
        cfg_(std::move(config)),
        out_(out),
        start_(*this),
        modes_(*this),
        hilo_(*this),
        wong_(*this)
    {
        if (cfg_.audit_path)
        {
            audit_ = std::make_unique<bjc::core::debug::AuditLogger>(*cfg_.audit_path);
            if (!audit_->good())
            {
                std::print("[bjcounter] cannot open audit log '{}', continuing without it\n", *cfg_.audit_path);
                audit_.reset();
            }
        }

        ScreenFor(active_id_).OnShow();

        if (cfg_.system)
        {
            core::CountingSystem const* sys = core::FindSystem(*cfg_.system);
            if (sys == nullptr)
            {
                BJC_THROW(core::error::Code::Config, std::format("unknown counting system '{}'", *cfg_.system));
            }
            StartMode(*sys);
        }
    }

    App::~App()
    {
        ScreenFor(active_id_).OnHide();
        hilo_.Detach();
        wong_.Detach();
        host_.reset();
    }

    auto App::ScreenFor(ScreenId const id) -> Screen&
    {
        switch (id)
        {
        case ScreenId::StartMenu: return start_;
        case ScreenId::ModeSelection: return modes_;
        case ScreenId::HiLo: return hilo_;
        case ScreenId::WongHalves: return wong_;
        }
        return start_;
    }

    auto App::ScreenFor(ScreenId const id) const -> Screen const&
    {
        switch (id)
        {
        case ScreenId::StartMenu: return start_;
        case ScreenId::ModeSelection: return modes_;
        case ScreenId::HiLo: return hilo_;
        case ScreenId::WongHalves: return wong_;
        }
        return start_;
    }

    auto App::CountingFor(core::SystemId const id) -> CountingScreen&
    {
        switch (id)
        {
        case core::SystemId::HiLo: return hilo_;
        case core::SystemId::WongHalves: return wong_;
        }
        return hilo_;
    }

    auto App::ShowScreen(ScreenId const id) -> void
    {
        if (id == ScreenId::HiLo)
        {
            StartMode(core::HiLo());
            return;
        }
        if (id == ScreenId::WongHalves)
        {
            StartMode(core::WongHalves());
            return;
        }

        ScreenFor(active_id_).OnHide();
        if (IsCounting(active_id_))
        {
            // the session ends with its screen
            static_cast<CountingScreen&>(ScreenFor(active_id_)).Detach();
            host_.reset();
        }
        active_id_ = id;
        ScreenFor(active_id_).OnShow();
    }

    auto App::StartMode(core::CountingSystem const& system) -> void
    {
        ScreenFor(active_id_).OnHide();
        if (IsCounting(active_id_))
        {
            static_cast<CountingScreen&>(ScreenFor(active_id_)).Detach();
        }
        // drop the previous session before the next one writes its audit header
        host_.reset();
        host_ = std::make_unique<bjc::wire::SessionHost>(system, cfg_.ledger, audit_.get());

        CountingScreen& screen = CountingFor(system.id);
        screen.Attach(*host_);
        active_id_ = system.id == core::SystemId::HiLo ? ScreenId::HiLo : ScreenId::WongHalves;
        screen.OnShow();
    }

    auto App::Feed(std::string_view const raw) -> void
    {
        std::string_view const line = Trim(raw);
        if (line.empty())
        {
            return;
        }
        if (line.front() == ':')
        {
            HandleCommandLine(line.substr(1));
            return;
        }

        std::string_view rest = line;
        while (running_ && !rest.empty())
        {
            std::size_t const end = rest.find_first_of(" \t");
            std::string_view const token = rest.substr(0, end);
            rest = end == std::string_view::npos ? std::string_view{} : Trim(rest.substr(end));

            std::optional<KeyChord> const kc = ParseKey(token);
            if (!kc)
            {
                std::print("[bjcounter] unknown key '{}'\n", token);
                if (audit_)
                {
                    audit_->rejected(std::format("unknown key '{}'", token));
                }
                continue;
            }
            if (!ScreenFor(active_id_).HandleKey(*kc))
            {
                std::print("[bjcounter] {} does nothing here\n", DescribeKey(*kc));
            }
        }
    }

    auto App::HandleCommandLine(std::string_view const line) -> void
    {
        std::string_view const trimmed = Trim(line);
        std::size_t const sp = trimmed.find_first_of(" \t");
        std::string_view const name = trimmed.substr(0, sp);
        std::string_view const arg = sp == std::string_view::npos ? std::string_view{} : Trim(trimmed.substr(sp));

        if (name == "quit")
        {
            Quit();
            return;
        }
        if (name == "help")
        {
            out_ << "Type keys separated by spaces (l, h, ctrl+z, left, ...).\n";
            out_ << "Commands: :menu :hotkeys :toggle <group> :rank :quit\n";
            return;
        }
        if (!ScreenFor(active_id_).HandleCommand(name, arg))
        {
            std::print("[bjcounter] unknown command ':{}'\n", name);
        }
    }

    auto App::RenderActive() const -> void
    {
        ScreenFor(active_id_).Render(out_);
        out_.flush();
    }

    auto App::Run(std::istream& in) -> int
    {
        RenderActive();
        std::string line;
        while (running_ && std::getline(in, line))
        {
            Feed(line);
            if (running_)
            {
                RenderActive();
            }
        }
        return 0;
    }
}
