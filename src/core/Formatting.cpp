//
// Created by Malik T on 16/08/2025.
//
#include "Formatting.hpp"

#include <cmath>
#include <format>

#include "Util.hpp"

namespace bjc::core
{
    auto FormatIncrement(double const value) -> std::string
    {
        double rounded = util::RoundTo(value, 2);
        if (util::NearlyZero(rounded))
        {
            rounded = 0.0;
        }
        if (util::NearlyInteger(rounded))
        {
            return std::format("{:+.0f}", rounded);
        }

        std::string text = std::format("{:+.2f}", rounded);
        if (text.ends_with("00"))
        {
            text.resize(text.size() - 3);
        }
        else if (text.ends_with('0'))
        {
            text.pop_back();
        }
        return text;
    }

    auto FormatTrueCount(double const value) -> std::string
    {
        return std::format("{:+.2f}", value);
    }

    auto FormatHistory(std::span<EntryView const> entries) -> std::string
    {
        if (entries.empty())
        {
            return "-";
        }

        std::string body;
        for (size_t i{}; i < entries.size(); ++i)
        {
            body += (i ? "  " : "");
            body += std::format("{}({})", entries[i].label, FormatIncrement(entries[i].value));
        }
        return body;
    }

    auto FormatCardsSeen(std::size_t const n) -> std::string
    {
        return std::format("Cards seen: {}", n);
    }
}
