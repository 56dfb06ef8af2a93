#pragma once
#include <array>
#include <ostream>
#include <string_view>
#include <utility>
#include "config_default.hpp"

namespace cligram {
    /// What the grammar parser does with the tree once a grammar has been parsed.
    enum class simplify_mode {
        /// Return the tree as parsed.
        no,
        /// Return the tree as parsed, and write a note if it could be simplified.
        warn,
        /// Return the flattened tree, and write a note if flattening changed it.
        yes,
        /// Return the flattened tree.
        silently
    };

    /// How the children of an unordered group are assigned to the call.
    enum class unordered_strategy {
        /// Each round commits the best-scoring unused child. Not guaranteed to find the global optimum.
        greedy,
        /// Tries every order of the children. Factorial cost.
        permutation
    };

    /// Scores and thresholds used while matching calls.
    struct match_options {
        /// Minimum similarity of a token to a literal for the literal to be suggested (or accepted if tolerant).
        double literal_threshold = 0.75;
        double literal_score = 1.0;
        /// Score of a tolerant literal accepted by similarity.
        /// A suggestion failure scores this times the similarity, so that it always scores
        /// below an accepted fuzzy match (the similarity of a non-equal token is below 1).
        double fuzzy_score = 0.25;
        double parameter_score = 0.5;
        /// If false, all literals are compared case-insensitively.
        bool case_sensitive = true;
        unordered_strategy unordered = unordered_strategy::greedy;
    };

    /// Configuration of grammar compilation and call matching.
    struct config {
        /// Special characters of the grammar DSL and of command calls.
        special_chars specials = config_default::specials;
        /// Whether literals are parsed as case-sensitive (the ^ modifier overrides it per literal).
        bool case_sensitive = true;
        simplify_mode simplify = simplify_mode::yes;
        /// Stream for diagnostic notes. nullptr: notes are discarded.
        std::ostream* diagnostics = nullptr;
        match_options matching{};
        /// Order corresponds to order of enums in `syntax_error_type`.
        std::array<std::string_view, syntax_error_types_n> syntax_error_msgs = config_default::syntax_error_msgs;
        /// Order corresponds to order of enums in `match_error_type`.
        std::array<std::string_view, match_error_types_n> match_error_msgs = config_default::match_error_msgs;

        std::string_view message(syntax_error_type type) const noexcept {
            return syntax_error_msgs[std::to_underlying(type)];
        }
        std::string_view message(match_error_type type) const noexcept {
            return match_error_msgs[std::to_underlying(type)];
        }
    };
}
