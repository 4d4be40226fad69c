//
// Created by Malik T on 14/08/2025.
//

#ifndef BJCOUNTER_UTIL_HPP
#define BJCOUNTER_UTIL_HPP

#include <charconv>
#include <cmath>
#include <format>
#include <cctype>
#include <string>
#include <string_view>
#include "Types.hpp"



namespace bjc::core::util
{
    // Correctly rounded on the exact binary value, ties to even
    inline auto RoundTo(double v, int decimals) -> double
    {
        std::string const text = std::format("{:.{}f}", v, decimals);
        double out{};
        auto const res = std::from_chars(text.data(), text.data() + text.size(), out);
        return res.ec == std::errc{} ? out : v;
    }
    inline auto NearlyZero(double v) -> bool
    {
        return std::fabs(v) < constants::Epsilon;
    }
    inline auto NearlyInteger(double v) -> bool
    {
        return std::fabs(v - std::round(v)) < constants::Epsilon;
    }
    inline auto ToLower(std::string_view s) -> std::string
    {
        std::string out;
        out.reserve(s.size());
        for (char const c : s)
        {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }
}

#endif //BJCOUNTER_UTIL_HPP
