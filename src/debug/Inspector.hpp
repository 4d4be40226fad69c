//
// Created by Malik T on 19/08/2025.
//

#ifndef BJCOUNTER_INSPECTOR_HPP
#define BJCOUNTER_INSPECTOR_HPP

#include <algorithm>
#include <iterator>
#include <vector>
#include <cstddef>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Ledger.hpp"

namespace bjc::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<CountEntry const*> history;
            std::vector<CountEntry const*> redo;
            std::size_t undos_used{};
            LedgerConfig cfg{};
        };

        static inline auto Gather(CountingLedger const& l) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.undos_used = l.undos_used_;
            ret.cfg = l.cfg_;

            ret.history.reserve(l.history_.size());
            std::ranges::transform(l.history_, std::back_inserter(ret.history),
                                   [](EntryUP const& e) -> CountEntry const* { return e.get(); });

            ret.redo.reserve(l.redo_.size());
            std::ranges::transform(l.redo_, std::back_inserter(ret.redo),
                                   [](EntryUP const& e) -> CountEntry const* { return e.get(); });

            return ret;
        }
    };
}

#endif //BJCOUNTER_INSPECTOR_HPP
