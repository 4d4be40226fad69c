//
// SessionHost.cpp
//

#include "wire/SessionHost.hpp"

#include <print>

namespace bjc::wire
{
    SessionHost::SessionHost(bjc::core::CountingSystem const& system,
                             bjc::core::LedgerConfig const& config,
                             bjc::core::debug::AuditLogger* audit)
        : session_{system, config}
          , audit_{audit}
    {
        if (audit_)
        {
            audit_->start(session_);
        }
    }

    SessionHost::~SessionHost()
    {
        if (audit_)
        {
            audit_->end(session_);
        }
    }

    auto SessionHost::Handle(std::span<std::byte const> bytes) -> flatbuffers::DetachedBuffer
    {
        auto const parsed = bjc::core::wire::DecodeCommand(bytes);

        if (!parsed.has_value())
        {
            std::print("[bjcounter] dropped command: {}\n", parsed.error().message);
            if (audit_)
            {
                audit_->rejected(parsed.error().message);
            }
            return bjc::core::wire::BuildView(session_.Snapshot(), bjc::core::Outcome::NoOp, 0);
        }

        auto const& dc = parsed.value();
        if (audit_)
        {
            audit_->action(dc.action);
        }

        bjc::core::Outcome const outcome = session_.Apply(dc.action);
        bjc::core::LedgerSnapshot const snap = session_.Snapshot();

        if (audit_)
        {
            audit_->outcome(outcome, snap);
        }
        return bjc::core::wire::BuildView(snap, outcome, dc.msg_id);
    }

    auto SessionHost::CurrentView(std::uint64_t const msg_id) const -> flatbuffers::DetachedBuffer
    {
        return bjc::core::wire::BuildView(session_.Snapshot(), session_.LastOutcome(), msg_id);
    }
}
