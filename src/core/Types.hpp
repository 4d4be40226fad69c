//
// Created by Malik T on 14/08/2025.
//

#ifndef BJCOUNTER_TYPES_HPP
#define BJCOUNTER_TYPES_HPP

#define BJC_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bjc::core::constants
{
    inline constexpr double DefaultDecks = 6.0;
    inline constexpr double CardsPerDeck = 52.0;
    // true count never divides by less than a quarter deck
    inline constexpr double MinTrueCountDecks = 0.25;
    inline constexpr std::size_t DefaultUndoBudget = 5;
    inline constexpr std::size_t DefaultRedoCap = 20;
    inline constexpr double Epsilon = 1e-9;
}

namespace bjc::core
{
    struct CountEntry
    {
        CountEntry() = delete;
        CountEntry(std::string label, double value) : label(std::move(label)), value(value) {}

        std::string const label;
        double const value;
        ///////////////////////////////////
        CountEntry(CountEntry const&) = default;
        auto operator=(CountEntry const&) -> CountEntry& = delete;
    };
    inline auto operator==(CountEntry const& a, CountEntry const& b) -> bool
    {
        return a.label == b.label && a.value == b.value;
    }
    // history and redo buffer each own their entries outright; an entry moves between them
    using EntryUP = std::unique_ptr<CountEntry const>;

    struct LedgerConfig
    {
        double      decks_total{constants::DefaultDecks};
        std::size_t undo_budget{constants::DefaultUndoBudget};
        std::size_t redo_cap{constants::DefaultRedoCap};
    };

    // Plain value copy of one entry, used by snapshots and the wire view
    struct EntryView
    {
        std::string label;
        double value{};
    };
}

#endif //BJCOUNTER_TYPES_HPP
