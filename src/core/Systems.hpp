//
// Created by Malik T on 16/08/2025.
//

#ifndef BJCOUNTER_SYSTEMS_HPP
#define BJCOUNTER_SYSTEMS_HPP

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include "Types.hpp"

namespace bjc::core
{
    enum class SystemId : uint8_t
    {
        HiLo = 0,
        WongHalves
    };

    struct CountAction
    {
        std::string_view label;
        double value{};
    };

    struct CountingSystem
    {
        SystemId id{};
        std::string_view key;   // command-line / lookup name
        std::string_view name;  // display name
        std::span<CountAction const> actions;
    };

    enum class RankCategory : uint8_t
    {
        Low,
        Neutral,
        High
    };

    struct RankEntry
    {
        std::string_view card;
        RankCategory category{};
    };

    auto HiLo() noexcept -> CountingSystem const&;
    auto WongHalves() noexcept -> CountingSystem const&;
    auto AllSystems() noexcept -> std::span<CountingSystem const* const>;

    auto FindSystem(std::string_view key) noexcept -> CountingSystem const*;
    auto FindAction(CountingSystem const& sys, std::string_view label) noexcept -> std::optional<CountAction>;

    // Hi-Lo sorted by rank, 2..A. Neutral ranks carry no adjustment.
    auto HiLoRanks() noexcept -> std::span<RankEntry const>;
    auto HiLoValue(RankCategory c) noexcept -> double;
}

#endif //BJCOUNTER_SYSTEMS_HPP
