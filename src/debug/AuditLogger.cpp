#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <variant>

#include "../core/Formatting.hpp"

using namespace bjc::core;

namespace
{

auto s_action(LedgerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RecordAction>)
            {
                return std::format("Record({},{})", act.label, FormatIncrement(act.value));
            }
            else if constexpr (std::is_same_v<T, UndoAction>)
            {
                return "Undo";
            }
            else if constexpr (std::is_same_v<T, RedoAction>)
            {
                return "Redo";
            }
            else
            {
                return "Reset";
            }
        },
        a
    );
}

} // anonymous namespace

namespace bjc::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Session const& session) -> void
{
    LedgerConfig const& cfg = session.Ledger().Config();
    out_ << std::format("System={}\n", session.System().name);
    out_ << std::format("Decks={}\n", cfg.decks_total);
    out_ << std::format("UndoBudget={} RedoCap={}\n", cfg.undo_budget, cfg.redo_cap);
    out_.flush();
}

auto AuditLogger::action(LedgerAction const& a) -> void
{
    out_ << std::format("Action: {}\n", s_action(a));
}

auto AuditLogger::outcome(Outcome const o, LedgerSnapshot const& s) -> void
{
    out_ << std::format("Outcome: {}\n", to_string(o));
    out_ << std::format(
        "State: rc={} tc={} seen={} decks={:.3f} undo={} redo={}\n",
        FormatIncrement(s.running_count),
        FormatTrueCount(s.true_count),
        s.cards_seen,
        s.decks_remaining,
        s.undo_remaining,
        s.redo_pending
    );
}

auto AuditLogger::rejected(std::string const& why) -> void
{
    out_ << std::format("Rejected: {}\n", why);
}

auto AuditLogger::end(Session const& session) -> void
{
    CountingLedger const& l = session.Ledger();
    out_ << std::format("Final: rc={} seen={}\n", FormatIncrement(l.RunningCount()), l.CardsSeen());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

}
