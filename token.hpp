#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "common.hpp"

namespace cligram {
    /// Kinds a call token may be tagged with. Untagged tokens are plain words.
    enum class token_kind {
        quoted, unterminated
    };

    /// An atomic piece of a command call.
    struct token {
        std::optional<token_kind> kind;
        /// Substring of the call that produced the token (quotes included).
        std::string raw;
        /// Byte offsets into the call, `start` inclusive and `end` exclusive.
        std::size_t start = 0, end = 0;
        /// Logical value (quotes removed, escapes resolved).
        std::string value;

        friend bool operator==(const token&, const token&) = default;
    };

    inline std::ostream& operator<<(std::ostream& os, const token& t) {
        return os << quoted(t.value) << " at " << t.start;
    }

    /// Types of tokens produced by `syntax_lexer`.
    enum class syntax_token_type {
        symbol,
        param_open, param_close, separator, variant_divider,
        sequence_open, sequence_close, optional_open, optional_close,
        unordered_open, unordered_close, tail, raw, case_insensitive, tolerant
    };

    /// A token of a grammar string. `text` views into the grammar.
    struct syntax_token {
        syntax_token_type type;
        std::string_view text;
        std::size_t start = 0, end = 0;
    };
}
