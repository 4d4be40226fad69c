//
// Created by Malik T on 16/08/2025.
//

#ifndef BJCOUNTER_FORMATTING_HPP
#define BJCOUNTER_FORMATTING_HPP

#include <span>
#include <string>
#include "Types.hpp"

namespace bjc::core
{
    // Signed increment with trailing zeros trimmed: +1, -0.5, +1.5, +0.
    // Rounds to two places first; locale independent.
    auto FormatIncrement(double value) -> std::string;

    // Always two decimals: +0.00, -1.25
    auto FormatTrueCount(double value) -> std::string;

    // "5(+1.5)  K(-1)" or "-" when nothing is recorded
    auto FormatHistory(std::span<EntryView const> entries) -> std::string;

    auto FormatCardsSeen(std::size_t n) -> std::string;
}

#endif //BJCOUNTER_FORMATTING_HPP
