//
// Created by Malik T on 15/08/2025.
//
#include "Session.hpp"

#include <cmath>
#include <print>
#include <variant>

namespace bjc::core
{
    Session::Session(CountingSystem const& system, LedgerConfig const& config) :
        system_(&system),
        ledger_(config)
    {
    }

    auto Session::Apply(LedgerAction const& a) -> Outcome
    {
        if (auto const* rec = std::get_if<RecordAction>(&a))
        {
            if (rec->label.empty() || !std::isfinite(rec->value))
            {
                std::print("[bjcounter] ignoring record '{}' with value {}\n", rec->label, rec->value);
                last_ = Outcome::NoOp;
                return last_;
            }
        }
        last_ = ledger_.Apply(a);
        return last_;
    }
}
