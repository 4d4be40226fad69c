//
// Created by Malik T on 20/08/2025.
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../core/Formatting.hpp"
#include "../core/Systems.hpp"

using namespace bjc::core;

TEST(Formatting, IncrementWholeNumbers)
{
    EXPECT_EQ(FormatIncrement(1.0), "+1");
    EXPECT_EQ(FormatIncrement(-1.0), "-1");
    EXPECT_EQ(FormatIncrement(0.0), "+0");
    EXPECT_EQ(FormatIncrement(-3.0), "-3");
    EXPECT_EQ(FormatIncrement(12.0), "+12");
}

TEST(Formatting, IncrementFractions)
{
    EXPECT_EQ(FormatIncrement(-0.5), "-0.5");
    EXPECT_EQ(FormatIncrement(1.5), "+1.5");
    EXPECT_EQ(FormatIncrement(0.25), "+0.25");
    EXPECT_EQ(FormatIncrement(-1.75), "-1.75");
}

TEST(Formatting, IncrementRoundsToTwoPlaces)
{
    EXPECT_EQ(FormatIncrement(0.999), "+1");
    EXPECT_EQ(FormatIncrement(1.504), "+1.5");
    EXPECT_EQ(FormatIncrement(0.126), "+0.13");
}

TEST(Formatting, IncrementTiesRoundToEven)
{
    // exact binary halves go to the even digit
    EXPECT_EQ(FormatIncrement(0.125), "+0.12");
    EXPECT_EQ(FormatIncrement(-0.125), "-0.12");
    EXPECT_EQ(FormatIncrement(0.625), "+0.62");
    EXPECT_EQ(FormatIncrement(0.375), "+0.38");
    // 0.015 is stored just below the half
    EXPECT_EQ(FormatIncrement(0.015), "+0.01");
}

TEST(Formatting, IncrementHugeWholeNumbers)
{
    EXPECT_EQ(FormatIncrement(1e19), "+10000000000000000000");
    EXPECT_EQ(FormatIncrement(-1e19), "-10000000000000000000");
    EXPECT_EQ(FormatIncrement(9223372036854775808.0), "+9223372036854775808");
}

TEST(Formatting, IncrementNeverPrintsNegativeZero)
{
    EXPECT_EQ(FormatIncrement(-0.0), "+0");
    EXPECT_EQ(FormatIncrement(-0.001), "+0");
    EXPECT_EQ(FormatIncrement(1e-12), "+0");
}

TEST(Formatting, TrueCountAlwaysTwoDecimals)
{
    EXPECT_EQ(FormatTrueCount(0.0), "+0.00");
    EXPECT_EQ(FormatTrueCount(1.0 / (6.0 - 3.0 / 52.0)), "+0.17");
    EXPECT_EQ(FormatTrueCount(-1.25), "-1.25");
}

TEST(Formatting, HistoryLine)
{
    EXPECT_EQ(FormatHistory({}), "-");

    std::vector<EntryView> const entries{{"5", 1.5}, {"K", -1.0}, {"8", 0.0}};
    EXPECT_EQ(FormatHistory(entries), "5(+1.5)  K(-1)  8(+0)");
}

TEST(Formatting, CardsSeen)
{
    EXPECT_EQ(FormatCardsSeen(0), "Cards seen: 0");
    EXPECT_EQ(FormatCardsSeen(52), "Cards seen: 52");
}

TEST(Systems, HiLoTable)
{
    CountingSystem const& s = HiLo();
    EXPECT_EQ(s.id, SystemId::HiLo);
    EXPECT_EQ(s.name, "Hi-Lo");
    ASSERT_EQ(s.actions.size(), 2u);

    auto const low = FindAction(s, "Low");
    auto const hi = FindAction(s, "Hi");
    ASSERT_TRUE(low && hi);
    EXPECT_DOUBLE_EQ(low->value, 1.0);
    EXPECT_DOUBLE_EQ(hi->value, -1.0);
    EXPECT_FALSE(FindAction(s, "5").has_value());
}

TEST(Systems, WongHalvesWeights)
{
    struct Expect { char const* card; double value; };
    std::vector<Expect> const expected{
        {"2", 0.5}, {"3", 1.0}, {"4", 1.0}, {"5", 1.5}, {"6", 1.0}, {"7", 0.5}, {"8", 0.0},
        {"9", -0.5}, {"10", -1.0}, {"J", -1.0}, {"Q", -1.0}, {"K", -1.0}, {"A", -1.0},
    };

    CountingSystem const& s = WongHalves();
    ASSERT_EQ(s.actions.size(), expected.size());
    double total = 0.0;
    for (std::size_t i{}; i < expected.size(); ++i)
    {
        EXPECT_EQ(s.actions[i].label, expected[i].card);
        EXPECT_DOUBLE_EQ(s.actions[i].value, expected[i].value) << expected[i].card;
        total += s.actions[i].value;
    }
    // a single suit of 2..A nets to zero
    EXPECT_DOUBLE_EQ(total, 0.0);
}

TEST(Systems, Registry)
{
    ASSERT_EQ(AllSystems().size(), 2u);
    EXPECT_EQ(FindSystem("hilo"), &HiLo());
    EXPECT_EQ(FindSystem("wong"), &WongHalves());
    EXPECT_EQ(FindSystem("ko"), nullptr);
}

TEST(Systems, HiLoRanks)
{
    int low = 0, neutral = 0, high = 0;
    for (RankEntry const& r : HiLoRanks())
    {
        switch (r.category)
        {
        case RankCategory::Low: ++low; break;
        case RankCategory::Neutral: ++neutral; break;
        case RankCategory::High: ++high; break;
        }
    }
    EXPECT_EQ(low, 5);
    EXPECT_EQ(neutral, 3);
    EXPECT_EQ(high, 5);
    EXPECT_DOUBLE_EQ(HiLoValue(RankCategory::Low), 1.0);
    EXPECT_DOUBLE_EQ(HiLoValue(RankCategory::Neutral), 0.0);
    EXPECT_DOUBLE_EQ(HiLoValue(RankCategory::High), -1.0);
}
