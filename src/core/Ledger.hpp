//
// Created by Malik T on 15/08/2025.
//

#ifndef BJCOUNTER_LEDGER_HPP
#define BJCOUNTER_LEDGER_HPP

#include <deque>
#include <optional>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"

namespace bjc::core::debug {struct Inspector;}
namespace bjc::core
{
    // One shoe worth of counting. Single threaded; every call runs to completion.
    class CountingLedger
    {
    public:
        CountingLedger();
        // Throws error::ConfigError when decks_total is not a positive finite number
        // or redo_cap is zero.
        explicit CountingLedger(LedgerConfig const& config);

        CountingLedger(CountingLedger const&) = delete;
        auto operator=(CountingLedger const&) -> CountingLedger& = delete;
        CountingLedger(CountingLedger&&) = default;
        auto operator=(CountingLedger&&) -> CountingLedger& = default;

        // Appends, drops the redo lineage and refills the undo budget. Never fails.
        auto Record(std::string label, double value) -> void;
        // nullopt when history is empty or the undo budget is spent
        auto Undo() -> std::optional<CountEntry>;
        // nullopt when nothing is pending
        auto Redo() -> std::optional<CountEntry>;
        auto Reset() -> void;

        // Dispatch helper used by Session; NoOp mirrors the nullopt returns above.
        auto Apply(LedgerAction const& a) -> Outcome;

        [[nodiscard]] auto RunningCount() const -> double;
        [[nodiscard]] auto TrueCount() const -> double;
        [[nodiscard]] auto CardsSeen() const noexcept -> std::size_t { return history_.size(); }
        [[nodiscard]] auto DecksRemaining() const -> double;
        [[nodiscard]] auto CanUndo() const noexcept -> bool;
        [[nodiscard]] auto CanRedo() const noexcept -> bool { return !redo_.empty(); }

        [[nodiscard]] auto UndoRemaining() const noexcept -> std::size_t;
        [[nodiscard]] auto RedoPending() const noexcept -> std::size_t { return redo_.size(); }
        [[nodiscard]] auto DecksTotal() const noexcept -> double { return cfg_.decks_total; }
        [[nodiscard]] auto Config() const noexcept -> LedgerConfig const& { return cfg_; }

        // Read-only chronological view for scrollback rendering
        [[nodiscard]] auto History() const noexcept -> std::span<EntryUP const> { return history_; }

        [[nodiscard]] auto Snapshot() const -> LedgerSnapshot;

        friend struct debug::Inspector;

    private:
        LedgerConfig cfg_;

        std::vector<EntryUP> history_;   // owns active entries, oldest first
        std::deque<EntryUP>  redo_;      // owns undone entries, most recently undone at back
        std::size_t undos_used_{0};      // since last Record/Reset, replenished by Redo
    };
}
#endif //BJCOUNTER_LEDGER_HPP
