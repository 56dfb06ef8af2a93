#pragma once
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <string>
#include <string_view>
#include "common.hpp"

namespace cligram {
    /// Defines special characters of the grammar DSL and of command calls.
    /// Grammar specials are strings so that multi-character punctuation (such as "...") can be used.
    struct special_chars {
        std::string_view param_open, param_close, separator, variant_divider,
            sequence_open, sequence_close, optional_open, optional_close,
            unordered_open, unordered_close, tail, raw, case_insensitive, tolerant;
        /// Characters that open and close a quoted call token.
        std::string_view quotes;
        char escape;
    };

    /// Character classification and case folding used by the lexers and the matcher.
    /// Only the basic execution character set is folded; other bytes compare as-is.
    struct char_traits {
        static constexpr bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
        }
        static char to_lower(char c) noexcept {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        static std::string to_lower(std::string_view str) {
            std::string out{str};
            ranges::transform(out, out.begin(), [](char c) {return to_lower(c);});
            return out;
        }
        static bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
            return ranges::equal(lhs, rhs, [](char a, char b) {return to_lower(a) == to_lower(b);});
        }
        static constexpr std::string_view trim(std::string_view str) noexcept {
            while (!str.empty() && is_space(str.front())) str.remove_prefix(1);
            while (!str.empty() && is_space(str.back())) str.remove_suffix(1);
            return str;
        }
    };

    /// Stream that diagnostics are written to unless another one is supplied.
    inline std::ostream& output_stream() noexcept {
        return std::cout;
    }
}
