//
// Created by Malik T on 14/08/2025.
//

#ifndef BJCOUNTER_ACTIONS_HPP
#define BJCOUNTER_ACTIONS_HPP

#include <string>
#include <variant>
#include "Types.hpp"

namespace bjc::core
{
    struct RecordAction { std::string label; double value{}; };
    struct UndoAction   {};
    struct RedoAction   {};
    struct ResetAction  {};

    using LedgerAction = std::variant<
      RecordAction, UndoAction, RedoAction, ResetAction>;

    // Undo past the budget, undo on empty history and redo with nothing pending are NoOp, not errors
    enum class Outcome : uint8_t
    {
        NoOp,
        Applied
    };

    inline auto to_string(Outcome o) -> char const*
    {
        return o == Outcome::Applied ? "Applied" : "NoOp";
    }
} // namespace bjc::core

#endif //BJCOUNTER_ACTIONS_HPP
