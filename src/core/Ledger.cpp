//
// Created by Malik T on 15/08/2025.
//
#include "Ledger.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <ranges>
#include <utility>
#include <variant>
#include <iterator>

#include "Exception.hpp"

namespace bjc::core
{
    CountingLedger::CountingLedger() :
        CountingLedger(LedgerConfig{})
    {
    }

    CountingLedger::CountingLedger(LedgerConfig const& config) :
        cfg_(config)
    {
        if (!std::isfinite(cfg_.decks_total) || cfg_.decks_total <= 0.0)
        {
            BJC_THROW(error::Code::Config, std::format("decks_total must be positive, got {}", cfg_.decks_total));
        }
        if (cfg_.redo_cap == 0)
        {
            BJC_THROW(error::Code::Config, "redo_cap must be at least 1");
        }
    }

    auto CountingLedger::Record(std::string label, double value) -> void
    {
        history_.push_back(std::make_unique<CountEntry const>(std::move(label), value));
        redo_.clear();
        undos_used_ = 0;
    }

    auto CountingLedger::Undo() -> std::optional<CountEntry>
    {
        if (!CanUndo())
        {
            return std::nullopt;
        }

        EntryUP entry = std::move(history_.back());
        history_.pop_back();
        CountEntry ret = *entry;

        redo_.push_back(std::move(entry));
        //oldest pending goes first
        while (redo_.size() > cfg_.redo_cap)
        {
            redo_.pop_front();
        }
        ++undos_used_;
        return ret;
    }

    auto CountingLedger::Redo() -> std::optional<CountEntry>
    {
        if (redo_.empty())
        {
            return std::nullopt;
        }

        EntryUP entry = std::move(redo_.back());
        redo_.pop_back();
        CountEntry ret = *entry;

        history_.push_back(std::move(entry));
        if (undos_used_ > 0)
        {
            --undos_used_;
        }
        return ret;
    }

    auto CountingLedger::Reset() -> void
    {
        history_.clear();
        redo_.clear();
        undos_used_ = 0;
    }

    auto CountingLedger::Apply(LedgerAction const& a) -> Outcome
    {
        return std::visit(
            [&]<typename T0>(T0 const& act) -> Outcome
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, RecordAction>)
                {
                    Record(act.label, act.value);
                    return Outcome::Applied;
                }
                else if constexpr (std::is_same_v<T, UndoAction>)
                {
                    return Undo() ? Outcome::Applied : Outcome::NoOp;
                }
                else if constexpr (std::is_same_v<T, RedoAction>)
                {
                    return Redo() ? Outcome::Applied : Outcome::NoOp;
                }
                else
                {
                    Reset();
                    return Outcome::Applied;
                }
            },
            a
        );
    }

    auto CountingLedger::RunningCount() const -> double
    {
        return std::accumulate(history_.cbegin(), history_.cend(), 0.0,
                               [](double acc, EntryUP const& e) { return acc + e->value; });
    }

    auto CountingLedger::DecksRemaining() const -> double
    {
        double const remaining = cfg_.decks_total - (static_cast<double>(history_.size()) / constants::CardsPerDeck);
        return remaining > 0.0 ? remaining : 0.0;
    }

    auto CountingLedger::TrueCount() const -> double
    {
        if (history_.empty())
        {
            return 0.0;
        }
        return RunningCount() / std::max(constants::MinTrueCountDecks, DecksRemaining());
    }

    auto CountingLedger::CanUndo() const noexcept -> bool
    {
        return !history_.empty() && undos_used_ < cfg_.undo_budget;
    }

    auto CountingLedger::UndoRemaining() const noexcept -> std::size_t
    {
        return undos_used_ < cfg_.undo_budget ? cfg_.undo_budget - undos_used_ : 0;
    }

    auto CountingLedger::Snapshot() const -> LedgerSnapshot
    {
        LedgerSnapshot snap{};
        snap.decks_total = cfg_.decks_total;

        snap.history.reserve(history_.size());
        std::ranges::transform(history_, std::back_inserter(snap.history),
                               [](EntryUP const& e) { return EntryView{e->label, e->value}; });

        snap.running_count = RunningCount();
        snap.true_count = TrueCount();
        snap.cards_seen = CardsSeen();
        snap.decks_remaining = DecksRemaining();
        snap.can_undo = CanUndo();
        snap.can_redo = CanRedo();
        snap.undo_remaining = UndoRemaining();
        snap.redo_pending = RedoPending();

        return snap;
    }
}
