//
// Created by Malik T on 14/08/2025.
//

#ifndef BJCOUNTER_STATE_HPP
#define BJCOUNTER_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"



namespace bjc::core
{
    // Immutable snapshot exposed to UI/wire (owns copies, no references back into the ledger)
    struct LedgerSnapshot
    {
        double decks_total{constants::DefaultDecks};

        std::vector<EntryView> history;

        double running_count{};
        double true_count{};
        std::size_t cards_seen{};
        double decks_remaining{};

        bool can_undo{false};
        bool can_redo{false};
        std::size_t undo_remaining{};
        std::size_t redo_pending{};
    };

} // namespace bjc::core

#endif //BJCOUNTER_STATE_HPP
