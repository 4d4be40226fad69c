//
// Created by Malik T on 16/08/2025.
//
#include "Systems.hpp"

#include <algorithm>

namespace bjc::core
{
    namespace
    {
        constexpr std::array<CountAction, 2> HiLoActions{{
            {"Low", 1.0},
            {"Hi", -1.0},
        }};

        // Wong Halves: half-step weights per rank
        constexpr std::array<CountAction, 13> WongActions{{
            {"2", 0.5},
            {"3", 1.0},
            {"4", 1.0},
            {"5", 1.5},
            {"6", 1.0},
            {"7", 0.5},
            {"8", 0.0},
            {"9", -0.5},
            {"10", -1.0},
            {"J", -1.0},
            {"Q", -1.0},
            {"K", -1.0},
            {"A", -1.0},
        }};

        constexpr std::array<RankEntry, 13> HiLoRankTable{{
            {"2", RankCategory::Low},
            {"3", RankCategory::Low},
            {"4", RankCategory::Low},
            {"5", RankCategory::Low},
            {"6", RankCategory::Low},
            {"7", RankCategory::Neutral},
            {"8", RankCategory::Neutral},
            {"9", RankCategory::Neutral},
            {"10", RankCategory::High},
            {"J", RankCategory::High},
            {"Q", RankCategory::High},
            {"K", RankCategory::High},
            {"A", RankCategory::High},
        }};

        CountingSystem const HiLoSystem{SystemId::HiLo, "hilo", "Hi-Lo", HiLoActions};
        CountingSystem const WongSystem{SystemId::WongHalves, "wong", "Wong Halves", WongActions};

        std::array<CountingSystem const*, 2> const Registry{&HiLoSystem, &WongSystem};
    }

    auto HiLo() noexcept -> CountingSystem const& { return HiLoSystem; }
    auto WongHalves() noexcept -> CountingSystem const& { return WongSystem; }
    auto AllSystems() noexcept -> std::span<CountingSystem const* const> { return Registry; }

    auto FindSystem(std::string_view const key) noexcept -> CountingSystem const*
    {
        auto const it = std::ranges::find_if(Registry,
            [key](CountingSystem const* s) { return s->key == key; });
        return it != Registry.end() ? *it : nullptr;
    }

    auto FindAction(CountingSystem const& sys, std::string_view const label) noexcept -> std::optional<CountAction>
    {
        auto const it = std::ranges::find_if(sys.actions,
            [label](CountAction const& a) { return a.label == label; });
        if (it == sys.actions.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    auto HiLoRanks() noexcept -> std::span<RankEntry const> { return HiLoRankTable; }

    auto HiLoValue(RankCategory const c) noexcept -> double
    {
        switch (c)
        {
        case RankCategory::Low: return 1.0;
        case RankCategory::High: return -1.0;
        case RankCategory::Neutral: return 0.0;
        }
        return 0.0;
    }
}
