//
// Created by Malik T on 15/08/2025.
//

#ifndef BJCOUNTER_SESSION_HPP
#define BJCOUNTER_SESSION_HPP

#include "Actions.hpp"
#include "Ledger.hpp"
#include "State.hpp"
#include "Systems.hpp"
#include "Types.hpp"

namespace bjc::core
{
    // One counting session: a ledger bound to the system the user picked.
    // Created on mode selection, discarded on return to the menu. Reset keeps it alive.
    class Session
    {
    public:
        Session() = delete;
        Session(CountingSystem const& system, LedgerConfig const& config);

        // One state-machine step. Atomic: either fully applied or NoOp.
        auto Apply(LedgerAction const& a) -> Outcome;

        auto System() const noexcept -> CountingSystem const& { return *system_; }
        auto Ledger() const noexcept -> CountingLedger const& { return ledger_; }
        auto Snapshot() const -> LedgerSnapshot { return ledger_.Snapshot(); }
        auto LastOutcome() const noexcept -> Outcome { return last_; }

    private:
        CountingSystem const* system_;
        CountingLedger ledger_;
        Outcome last_{Outcome::NoOp};
    };
}
#endif //BJCOUNTER_SESSION_HPP
