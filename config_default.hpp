#pragma once
#include <array>
#include <string_view>
#include "chartypes.hpp"
#include "error.hpp"

namespace cligram {
    /// Default values for `specials`, `syntax_error_msgs` and `match_error_msgs` in `config`.
    struct config_default {
        static constexpr special_chars specials = {
            "<", ">", ":", "|",
            "(", ")", "[", "]",
            "{", "}", "...", "*", "^", "~",
            "\"'", '\\'
        };
        /// Order corresponds to order of enums in `syntax_error_type`.
        static constexpr std::array<std::string_view, syntax_error_types_n> syntax_error_msgs = {
            "Unexpected token",
            "Empty parameter name",
            "Empty optional sequence",
            "Empty sequence",
            "Empty variant",
            "Empty unordered group",
            "Symbol used more than once",
            "Cannot assign identifier",
            "Modifiers can only follow a literal",
            "Cannot define variants in an unordered group, maybe you meant to use parentheses?",
            "Nothing may follow a tail parameter",
            "Unterminated parameter",
            "Unterminated expression",
            "Undefined type"
        };
        /// Order corresponds to order of enums in `match_error_type`.
        static constexpr std::array<std::string_view, match_error_types_n> match_error_msgs = {
            "Expected literal",
            "Expected literal",
            "Did you mean",
            "Expected argument for parameter",
            "Argument does not match type of parameter",
            "Expected arguments for",
            "Expected",
            "Expected",
            "Expected",
            "Expected",
            "Tried matching after a tail parameter consumed the call",
            "Too many arguments",
            "Unknown command"
        };
    };
}
