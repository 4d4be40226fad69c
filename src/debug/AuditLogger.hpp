//
// Created by Malik T on 20/08/2025.
//

#ifndef BJCOUNTER_AUDITLOGGER_HPP
#define BJCOUNTER_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Session.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace bjc::core::debug
{
    // Plain-text transcript of one counting session
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto good() const -> bool { return out_.good(); }

        // Session header (system, deck count, undo/redo policy)
        auto start(Session const& session) -> void;

        // Per action, before it reaches the ledger
        auto action(LedgerAction const& a) -> void;

        // Per action outcome plus the aggregates after it
        auto outcome(Outcome o, LedgerSnapshot const& s) -> void;

        // Input that never made it to an action (undecodable envelope, unknown key)
        auto rejected(std::string const& why) -> void;

        // Session footer
        auto end(Session const& session) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //BJCOUNTER_AUDITLOGGER_HPP
