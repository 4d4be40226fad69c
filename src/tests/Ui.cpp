//
// Created by Malik T on 05/09/2025.
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "../ui/App.hpp"
#include "../ui/AppConfig.hpp"
#include "../ui/Bindings.hpp"
#include "../ui/Keymap.hpp"

using namespace bjc;
using namespace bjc::ui;

namespace
{
auto chord(std::string_view token) -> KeyChord
{
    std::optional<KeyChord> kc = ParseKey(token);
    EXPECT_TRUE(kc.has_value()) << token;
    return kc.value_or(KeyChord{});
}

auto ledger_of(App const& app) -> core::CountingLedger const&
{
    return app.Host()->Session().Ledger();
}

auto contains(std::string const& haystack, std::string_view needle) -> bool
{
    return haystack.find(needle) != std::string::npos;
}
} // anonymous namespace

// ================== KEYS ==================

TEST(Keys, ParseAndDescribe)
{
    KeyChord const z = chord("Ctrl+Shift+Z");
    EXPECT_EQ(z.key, "z");
    EXPECT_EQ(z.mods, ModCtrl | ModShift);
    EXPECT_EQ(chord("shift+ctrl+z"), z);
    EXPECT_EQ(DescribeKey(z), "Ctrl+Shift+Z");

    EXPECT_EQ(chord("L").key, "l");
    EXPECT_EQ(chord("plus").key, "+");
    EXPECT_EQ(chord("KP_Subtract").key, "-");
    EXPECT_EQ(chord("less").key, "<");
    EXPECT_EQ(chord("bracketright").key, "]");
    EXPECT_EQ(chord("Left").key, "left");
    EXPECT_EQ(DescribeKey(chord("left")), "Left");
    EXPECT_EQ(DescribeKey(chord("l")), "L");
    EXPECT_EQ(DescribeKey(chord("ctrl+r")), "Ctrl+R");

    EXPECT_FALSE(ParseKey("").has_value());
    EXPECT_FALSE(ParseKey("ctrl+").has_value());
    EXPECT_FALSE(ParseKey("foo").has_value());
    EXPECT_FALSE(ParseKey("ctrl+pageup").has_value());
}

TEST(Keys, LaterBindingWins)
{
    Keymap const km({
        Binding{chord("l"), core::RecordAction{"Low", 1.0}},
        Binding{chord("l"), core::UndoAction{}},
    });
    EXPECT_EQ(km.Size(), 1u);
    auto const a = km.Resolve(chord("l"));
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(std::holds_alternative<core::UndoAction>(*a));
    EXPECT_FALSE(km.Resolve(chord("ctrl+l")).has_value());
    EXPECT_TRUE(Keymap{}.Empty());
}

TEST(Keys, CommonBindings)
{
    Keymap const km(CommonBindings());
    EXPECT_EQ(km.Size(), 7u);
    EXPECT_TRUE(std::holds_alternative<core::ResetAction>(*km.Resolve(chord("ctrl+r"))));
    for (std::string_view k : {"<", "comma", "ctrl+z"})
    {
        EXPECT_TRUE(std::holds_alternative<core::UndoAction>(*km.Resolve(chord(k)))) << k;
    }
    for (std::string_view k : {">", "period", "ctrl+shift+z"})
    {
        EXPECT_TRUE(std::holds_alternative<core::RedoAction>(*km.Resolve(chord(k)))) << k;
    }
    // plain r is a card key in Wong Halves, not reset
    EXPECT_FALSE(km.Resolve(chord("r")).has_value());
}

TEST(Keys, HiLoGroups)
{
    ASSERT_EQ(HiLoHotkeyGroups().size(), 6u);
    HotkeyGroup const* sym = FindHotkeyGroup("symbols");
    ASSERT_NE(sym, nullptr);
    EXPECT_EQ(FindHotkeyGroup("numpad"), nullptr);

    Keymap const km(GroupBindings(*sym));
    EXPECT_EQ(km.Size(), 3u);
    auto const low = km.Resolve(chord("-"));
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(std::get<core::RecordAction>(*low).label, "Low");
    EXPECT_DOUBLE_EQ(std::get<core::RecordAction>(*low).value, 1.0);
    for (std::string_view k : {"+", "="})
    {
        auto const hi = km.Resolve(chord(k));
        ASSERT_TRUE(hi.has_value()) << k;
        EXPECT_EQ(std::get<core::RecordAction>(*hi).label, "Hi");
    }
    EXPECT_EQ(JoinKeys(sym->hi_keys, " / "), "+ / =");
}

TEST(Keys, RankModeSkipsNeutralCards)
{
    Keymap const km(RankModeBindings());
    EXPECT_EQ(km.Size(), 10u);
    EXPECT_EQ(std::get<core::RecordAction>(*km.Resolve(chord("5"))).label, "Low");
    EXPECT_EQ(std::get<core::RecordAction>(*km.Resolve(chord("0"))).label, "Hi");
    EXPECT_EQ(std::get<core::RecordAction>(*km.Resolve(chord("1"))).label, "Hi");
    EXPECT_FALSE(km.Resolve(chord("7")).has_value());
    EXPECT_FALSE(km.Resolve(chord("8")).has_value());
    EXPECT_FALSE(km.Resolve(chord("9")).has_value());
}

TEST(Keys, WongOneKeyPerCard)
{
    Keymap const km(WongBindings());
    EXPECT_EQ(km.Size(), 13u);
    auto const five = km.Resolve(chord("r"));
    ASSERT_TRUE(five.has_value());
    EXPECT_EQ(std::get<core::RecordAction>(*five).label, "5");
    EXPECT_DOUBLE_EQ(std::get<core::RecordAction>(*five).value, 1.5);
    EXPECT_DOUBLE_EQ(std::get<core::RecordAction>(*km.Resolve(chord("d"))).value, 0.0);
    EXPECT_EQ(std::get<core::RecordAction>(*km.Resolve(chord("v"))).label, "A");
}

// ================== SCREENS ==================

TEST(Screens, MenusLeadIntoHiLo)
{
    std::ostringstream out;
    App app(AppConfig{}, out);
    EXPECT_EQ(app.ActiveId(), ScreenId::StartMenu);
    EXPECT_EQ(app.Host(), nullptr);

    app.Feed("n");
    EXPECT_EQ(app.ActiveId(), ScreenId::ModeSelection);
    app.Feed("b");
    EXPECT_EQ(app.ActiveId(), ScreenId::StartMenu);
    app.Feed("1");
    app.Feed("1");
    ASSERT_EQ(app.ActiveId(), ScreenId::HiLo);
    ASSERT_NE(app.Host(), nullptr);
    EXPECT_EQ(&app.Host()->Session().System(), &core::HiLo());
    EXPECT_FALSE(app.HiLo().ActiveKeymap().Empty());
}

TEST(Screens, HiLoCountingUndoAndToggles)
{
    std::ostringstream out;
    App app(AppConfig{.system = "hilo"}, out);
    ASSERT_EQ(app.ActiveId(), ScreenId::HiLo);

    app.Feed("l a - left down [");
    EXPECT_DOUBLE_EQ(ledger_of(app).RunningCount(), 6.0);
    app.Feed("h d + = right up ]");
    EXPECT_DOUBLE_EQ(ledger_of(app).RunningCount(), -1.0);
    EXPECT_EQ(ledger_of(app).CardsSeen(), 13u);

    app.Feed("ctrl+z <");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 11u);
    app.Feed(">");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 12u);

    app.Feed(":toggle letters");
    EXPECT_FALSE(app.HiLo().GroupEnabled("letters"));
    app.Feed("l");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 12u);
    app.Feed(":toggle letters");
    app.Feed("l");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 13u);

    app.Feed("ctrl+r");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 0u);
    EXPECT_FALSE(ledger_of(app).CanRedo());
}

TEST(Screens, HiLoRankMode)
{
    std::ostringstream out;
    App app(AppConfig{.system = "hilo"}, out);

    app.Feed("5");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 0u);

    app.Feed(":rank");
    ASSERT_TRUE(app.HiLo().RankMode());
    app.Feed("5 q 7 1");
    EXPECT_EQ(ledger_of(app).CardsSeen(), 3u);
    EXPECT_DOUBLE_EQ(ledger_of(app).RunningCount(), -1.0);
    EXPECT_EQ(ledger_of(app).History()[0]->label, "Low");
    EXPECT_EQ(ledger_of(app).History()[1]->label, "Hi");
}

TEST(Screens, WongHalvesScenarioRenders)
{
    std::ostringstream out;
    App app(AppConfig{}, out);
    app.Feed("1");
    app.Feed("2");
    ASSERT_EQ(app.ActiveId(), ScreenId::WongHalves);

    app.Feed("r g q");
    EXPECT_DOUBLE_EQ(ledger_of(app).RunningCount(), 1.0);

    out.str("");
    app.RenderActive();
    std::string const text = out.str();
    EXPECT_TRUE(contains(text, "== Wong Halves =="));
    EXPECT_TRUE(contains(text, "Previously Counted: 5(+1.5)  10(-1)  2(+0.5)"));
    EXPECT_TRUE(contains(text, "Running Count: +1"));
    EXPECT_TRUE(contains(text, "True Count: +0.17"));
    EXPECT_TRUE(contains(text, "Cards seen: 3"));
    EXPECT_TRUE(contains(text, "Undo [< / Ctrl+Z]: enabled (5 left)"));
    EXPECT_TRUE(contains(text, "Redo [> / Ctrl+Shift+Z]: disabled (0 pending)"));
    EXPECT_TRUE(contains(text, "5(+1.5)[R]"));
    EXPECT_FALSE(contains(text, "Wong Halves Hotkeys"));

    app.Feed(":hotkeys");
    EXPECT_TRUE(app.Wong().HotkeysShown());
    out.str("");
    app.RenderActive();
    EXPECT_TRUE(contains(out.str(), "-- Wong Halves Hotkeys --"));
}

TEST(Screens, LeavingDiscardsTheSession)
{
    std::ostringstream out;
    App app(AppConfig{.system = "wong"}, out);
    app.Feed("r r");
    app.Feed(":hotkeys");
    ASSERT_EQ(ledger_of(app).CardsSeen(), 2u);

    app.Feed(":menu");
    EXPECT_EQ(app.ActiveId(), ScreenId::ModeSelection);
    EXPECT_EQ(app.Host(), nullptr);
    EXPECT_TRUE(app.Wong().ActiveKeymap().Empty());
    EXPECT_FALSE(app.Wong().HotkeysShown());
    EXPECT_FALSE(app.Wong().View().has_value());

    app.Feed("2");
    ASSERT_EQ(app.ActiveId(), ScreenId::WongHalves);
    EXPECT_EQ(ledger_of(app).CardsSeen(), 0u);
}

TEST(Screens, RunLoopStopsOnQuit)
{
    std::ostringstream out;
    App app(AppConfig{}, out);
    std::istringstream in("1\n1\nl l h\n:quit\nl\n");
    EXPECT_EQ(app.Run(in), 0);
    EXPECT_FALSE(app.Running());
    EXPECT_DOUBLE_EQ(ledger_of(app).RunningCount(), 1.0);
    EXPECT_TRUE(contains(out.str(), "== Manual Blackjack Counter =="));
    EXPECT_TRUE(contains(out.str(), "Previously Counted: Low(+1)  Low(+1)  Hi(-1)"));
}

TEST(Screens, UnknownKeysReachTheAuditLog)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    fs::path const path = "_artifacts/audit_unknown_keys.log";
    {
        std::ostringstream out;
        App app(AppConfig{.system = "hilo", .audit_path = path.string()}, out);
        app.Feed("l pageup h");
        EXPECT_EQ(ledger_of(app).CardsSeen(), 2u);
    }

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::string const text = ss.str();
    EXPECT_TRUE(contains(text, "Rejected: unknown key 'pageup'"));
    EXPECT_TRUE(contains(text, "Final: rc=+0 seen=2"));
}

TEST(Screens, QuitFromStartMenu)
{
    std::ostringstream out;
    App app(AppConfig{}, out);
    app.Feed("q");
    EXPECT_FALSE(app.Running());
}

// ================== ARGS ==================

TEST(Args, Defaults)
{
    std::vector<char const*> const argv{"bjcounter"};
    auto const cfg = ParseArgs(argv);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->ledger.decks_total, 6.0);
    EXPECT_EQ(cfg->ledger.undo_budget, 5u);
    EXPECT_EQ(cfg->ledger.redo_cap, 20u);
    EXPECT_FALSE(cfg->system.has_value());
    EXPECT_FALSE(cfg->audit_path.has_value());
    EXPECT_FALSE(cfg->show_help);
}

TEST(Args, AllOptions)
{
    std::vector<char const*> const argv{
        "bjcounter", "--decks", "2.5", "--undo-budget", "3", "--redo-cap", "7",
        "--system", "wong", "--audit", "out.log", "--help"
    };
    auto const cfg = ParseArgs(argv);
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_DOUBLE_EQ(cfg->ledger.decks_total, 2.5);
    EXPECT_EQ(cfg->ledger.undo_budget, 3u);
    EXPECT_EQ(cfg->ledger.redo_cap, 7u);
    EXPECT_EQ(cfg->system, "wong");
    EXPECT_EQ(cfg->audit_path, "out.log");
    EXPECT_TRUE(cfg->show_help);
}

TEST(Args, RejectsBadValues)
{
    auto fails = [](std::vector<char const*> const& argv) { return !ParseArgs(argv).has_value(); };
    EXPECT_TRUE(fails({"bjcounter", "--decks", "0"}));
    EXPECT_TRUE(fails({"bjcounter", "--decks", "-1"}));
    EXPECT_TRUE(fails({"bjcounter", "--decks", "six"}));
    EXPECT_TRUE(fails({"bjcounter", "--decks"}));
    EXPECT_TRUE(fails({"bjcounter", "--undo-budget", "2x"}));
    EXPECT_TRUE(fails({"bjcounter", "--redo-cap", "0"}));
    EXPECT_TRUE(fails({"bjcounter", "--system", "ko"}));
    EXPECT_TRUE(fails({"bjcounter", "--verbose"}));
    EXPECT_FALSE(fails({"bjcounter", "--undo-budget", "0"}));
}

TEST(Args, UsageListsSystems)
{
    std::string const u = Usage("bjcounter");
    EXPECT_TRUE(contains(u, "usage: bjcounter"));
    EXPECT_TRUE(contains(u, "hilo"));
    EXPECT_TRUE(contains(u, "wong"));
}
