//
// SessionHost.hpp - owns the active Session and answers command envelopes with view envelopes
//

#ifndef BJCOUNTER_SESSIONHOST_HPP
#define BJCOUNTER_SESSIONHOST_HPP

#include <cstddef>
#include <cstdint>
#include <span>

#include <flatbuffers/flatbuffers.h>

#include "core/Session.hpp"
#include "core/Systems.hpp"
#include "core/Types.hpp"
#include "debug/AuditLogger.hpp"

#include "wire/codec.hpp"

namespace bjc::wire
{
    class SessionHost
    {
    public:
        // audit is optional and non-owning; it must outlive the host
        SessionHost(bjc::core::CountingSystem const& system,
                    bjc::core::LedgerConfig const& config,
                    bjc::core::debug::AuditLogger* audit = nullptr);
        ~SessionHost();

        SessionHost(SessionHost const&) = delete;
        auto operator=(SessionHost const&) -> SessionHost& = delete;

        // Always answers with a view. Undecodable input yields a NoOp view of the unchanged state.
        auto Handle(std::span<std::byte const> bytes) -> flatbuffers::DetachedBuffer;

        // View of the current state without applying anything
        auto CurrentView(std::uint64_t msg_id) const -> flatbuffers::DetachedBuffer;

        auto Session() const noexcept -> bjc::core::Session const& { return session_; }

    private:
        bjc::core::Session              session_;
        bjc::core::debug::AuditLogger*  audit_{nullptr};
    };
}

#endif // BJCOUNTER_SESSIONHOST_HPP
