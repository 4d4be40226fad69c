//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp - terminal front end for the manual blackjack counter
//

#include <iostream>
#include <print>
#include <span>

#include "core/Exception.hpp"
#include "ui/App.hpp"
#include "ui/AppConfig.hpp"

int main(int argc, char** argv)
{
    using namespace bjc;

    char const* const* const argp = argv;
    std::span<char const* const> const args{argp, static_cast<std::size_t>(argc)};
    auto const parsed = ui::ParseArgs(args);
    if (!parsed.has_value())
    {
        std::print("[bjcounter] {}\n", parsed.error().message);
        std::print("{}", ui::Usage(argc > 0 ? argv[0] : "bjcounter"));
        return 2;
    }
    if (parsed->show_help)
    {
        std::print("{}", ui::Usage(argc > 0 ? argv[0] : "bjcounter"));
        return 0;
    }

    try
    {
        ui::App app(*parsed, std::cout);
        return app.Run(std::cin);
    }
    catch (core::OmegaException<core::error::Code> const& e)
    {
        std::print("{}", e.to_str());
        return 1;
    }
}
