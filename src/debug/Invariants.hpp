//
// Created by Malik T on 19/08/2025.
//

#ifndef BJCOUNTER_INVARIANTS_HPP
#define BJCOUNTER_INVARIANTS_HPP

#include "../core/Ledger.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"
#include <cmath>
#include <format>
#include <numeric>
#include <unordered_set>

namespace bjc::core::debug
{
    // A second layer of checks over the ledger internals. Throws AssertionError on the first violation.
    inline auto CheckInvariants(CountingLedger const& l) -> void
    {
#if BJC_ENABLE_TEST_HOOKS == false
        (void)l;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(l);

    // 1) No null owners anywhere
    for (auto p : s.history) BJC_ASSERT(p != nullptr, "Null entry in history");
    for (auto p : s.redo)    BJC_ASSERT(p != nullptr, "Null entry in redo buffer");

    // 2) An entry is either active history or pending redo, never both
    {
        std::unordered_set<CountEntry const*> seen;
        seen.reserve(s.history.size() + s.redo.size());

        for (auto p : s.history)
        {
            BJC_ASSERT(seen.insert(p).second, "Duplicate entry pointer in history");
        }
        for (auto p : s.redo)
        {
            BJC_ASSERT(seen.insert(p).second, "Entry shared between history and redo buffer");
        }
    }

    // 3) Redo buffer bounded by the cap
    BJC_ASSERT(s.redo.size() <= s.cfg.redo_cap,
               std::format("Redo buffer {} exceeds cap {}", s.redo.size(), s.cfg.redo_cap));

    // 4) Undo usage bounded by the budget
    BJC_ASSERT(s.undos_used <= s.cfg.undo_budget,
               std::format("Undo usage {} exceeds budget {}", s.undos_used, s.cfg.undo_budget));

    // 5) Derived values agree with the raw history
    {
        BJC_ASSERT(l.DecksRemaining() >= 0.0, "Negative decks remaining");
        BJC_ASSERT(l.CardsSeen() == s.history.size(), "CardsSeen != history size");

        double const sum = std::accumulate(s.history.cbegin(), s.history.cend(), 0.0,
                                           [](double acc, CountEntry const* e) { return acc + e->value; });
        BJC_ASSERT(std::fabs(sum - l.RunningCount()) < constants::Epsilon, "Running count drifted from history");

        if (s.history.empty())
        {
            BJC_ASSERT(l.TrueCount() == 0.0, "True count non-zero on empty history");
        }
        BJC_ASSERT(l.CanRedo() == !s.redo.empty(), "CanRedo disagrees with redo buffer");
    }

#endif // BJC_ENABLE_TEST_HOOKS == true
    }
}
#endif //BJCOUNTER_INVARIANTS_HPP
