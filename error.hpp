#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include "common.hpp"
#include "chartypes.hpp"
#include "token.hpp"

namespace cligram {
    struct node;
    struct error_tag;

    /// All types of error that can be raised while compiling a grammar.\n
    /// Guarantees:
    /// 1. The underlying values start from 0, and are consecutive.
    /// 2. undefined_type is the last syntax_error_type.
    enum class syntax_error_type {
        unexpected_token,
        empty_parameter_name,
        empty_optional_sequence,
        empty_sequence,
        empty_variant,
        empty_unordered_group,
        duplicate_symbol,
        illegal_identifier,
        illegal_modifier,
        illegal_variant,
        tail_not_last,
        unterminated_parameter,
        unterminated_expression,
        undefined_type
    };
    constexpr std::size_t syntax_error_types_n = std::to_underlying(syntax_error_type::undefined_type) + 1;

    /// All types of failure that can be raised while matching a call.\n
    /// Guarantees:
    /// 1. The underlying values start from 0, and are consecutive.
    /// 2. unknown_command is the last match_error_type.
    enum class match_error_type {
        missing_literal,
        mismatched_literal,
        suggested_literal,
        missing_parameter,
        mismatched_parameter_type,
        missing_tail,
        missing_unordered_group,
        unmatched_unordered_group,
        missing_variant,
        no_matched_variant,
        terminated,
        too_many_arguments,
        unknown_command
    };
    constexpr std::size_t match_error_types_n = std::to_underlying(match_error_type::unknown_command) + 1;

    namespace detail {
        inline void print_caret(std::ostream& os, std::string_view line, std::size_t loc) {
            os << " | " << line << "\n | ";
            for (std::size_t i = 0; i < loc && i < line.size(); ++i) {
                os << (line[i] == '\t' ? '\t' : ' ');
            }
            os << "^\n";
        }
    }

    /// An error in a grammar string. Fatal to compiling that grammar.
    struct syntax_error {
        using tag = error_tag;
        syntax_error_type type;
        /// Human-readable message, naming the offending token where there is one.
        std::string what;
        /// The grammar being compiled.
        std::string syntax;
        /// Byte offset of the offending token in `syntax`. `npos`: error cannot be pinpointed.
        std::size_t loc = npos;

        void print(std::ostream& os = output_stream()) const {
            os << "Syntax error.\n\033[31mError: \033[0m" << what << '\n';
            if (loc != npos) {
                detail::print_caret(os, syntax, loc);
            } else {
                os << " | " << syntax << '\n';
            }
        }
    };

    /// A failure to match a call against a valid grammar.
    /// These are expected outcomes of speculative matching, not exceptional conditions.
    struct match_failure {
        using tag = error_tag;
        match_error_type type;
        /// Human-readable message.
        std::string what;
        /// Description of what was expected (e.g. `'exit' or 'quit'`).
        std::string expected;
        /// The offending token, if the failure is not caused by running out of tokens.
        std::optional<token> actual;
        /// The node that raised the failure. Points into the syntax tree that was matched,
        /// and is only valid while that tree is alive.
        const node* source = nullptr;
        /// The literal the user probably meant (only for `suggested_literal`).
        std::string suggestion;
        /// Score accumulated by the match attempt up to the failure.
        double score = 0;

        void print(std::ostream& os = output_stream()) const {
            os << "\033[31mError:\033[0m " << what << '\n';
        }
    };

    template <tagged<error_tag> Error>
    std::ostream& operator<<(std::ostream& os, const Error& error) {
        error.print(os);
        return os;
    }
}
