//
// Created by Malik T on 14/08/2025.
//

#ifndef BJCOUNTER_EXCEPTION_HPP
#define BJCOUNTER_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace bjc::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Config, // invalid ledger/session configuration
        State, // ledger misuse (not a benign no-op)
        Serialization, // FlatBuffers verification/build errors
        Input, // presentation layer handed over something unusable
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InputError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Config: throw ConfigError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Input: throw InputError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define BJC_THROW(code_enum, msg) ::bjc::core::error::fail((code_enum), (msg))
#define BJC_ASSERT(cond, msg) do { if(!(cond)) ::bjc::core::error::fail(::bjc::core::error::Code::Assertion, (msg)); } while(0)

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "unknown";
        case Code::Config: return "config";
        case Code::State: return "state";
        case Code::Serialization: return "serialization";
        case Code::Input: return "input";
        case Code::Assertion: return "assertion";
        }
        return "unknown";
    }
}

#endif //BJCOUNTER_EXCEPTION_HPP
