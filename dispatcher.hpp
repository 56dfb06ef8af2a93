#pragma once
#include <concepts>
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include "common.hpp"
#include "chartypes.hpp"
#include "config.hpp"
#include "error.hpp"
#include "token.hpp"
#include "call_lexer.hpp"
#include "call_match.hpp"
#include "matcher.hpp"
#include "syntax_tree.hpp"
#include "syntax_parser.hpp"

namespace cligram {
    /// A concept that checks if T can be used to identify commands.
    /// Uniqueness is not required.
    template <typename T>
    concept command_id = std::is_integral_v<T> || std::is_enum_v<T>;

    /// A compiled command.
    template <command_id Result>
    struct command {
        syntax_tree tree;
        /// Used to identify the command.
        Result result;
        std::string description;
    };

    /// A successful `dispatcher::match`.
    /// Owns the tokens of the call, so it is move-only.
    /// \remark The call string itself is borrowed, and must outlive the result.
    template <command_id Result>
    class dispatch_result {
        std::vector<token> tokens_;
    public:
        Result result;
        /// Index of the matched command, in order of `dispatcher::add`.
        std::size_t command_index;
        call_match match;

        dispatch_result(Result result, std::size_t command_index, std::vector<token>&& tokens, call_match&& match) :
            tokens_{std::move(tokens)}, result{result}, command_index{command_index}, match{std::move(match)} {}
        dispatch_result(const dispatch_result&) = delete;
        dispatch_result(dispatch_result&&) noexcept = default;
        dispatch_result& operator=(const dispatch_result&) = delete;
        dispatch_result& operator=(dispatch_result&&) noexcept = default;

        const std::vector<token>& tokens() const noexcept {
            return tokens_;
        }
    };

    /// A failed `dispatcher::match`: the most informative failure among all commands.
    struct dispatch_error {
        using tag = error_tag;
        match_failure failure;
        /// The call that failed.
        std::string call;
        /// Index of the command that raised `failure`. `npos`: no command came close.
        std::size_t command_index = npos;
        /// Rendered grammars of the commands that came closest.
        std::vector<std::string> closest;

        match_error_type type() const noexcept {
            return failure.type;
        }
        void print(std::ostream& os = output_stream()) const {
            os << "\033[31mError:\033[0m " << failure.what << '\n';
            if (failure.actual) {
                detail::print_caret(os, call, failure.actual->start);
            }
            if (!closest.empty()) {
                os << "\033[36mClosest usages:\033[0m\n";
                for (const auto& usage : closest) {
                    os << " | " << usage << '\n';
                }
            }
        }
    };

    namespace detail {
        /// Appends `text` to `lines`, split at spaces into lines of at most `width` characters
        /// (a word longer than `width` gets a line of its own).
        /// \param width: 0 means no wrapping
        inline void wrap(std::vector<std::string>& lines, std::string_view text, std::size_t width,
            std::string_view first_indent, std::string_view indent) {
            std::string line{first_indent};
            bool empty = true;
            while (!text.empty()) {
                const std::size_t space = text.find(' ');
                const std::string_view word = text.substr(0, space);
                text = space == std::string_view::npos ? std::string_view{} : text.substr(space + 1);
                if (word.empty()) continue;
                if (!empty && width && line.size() + 1 + word.size() > width) {
                    lines.push_back(std::move(line));
                    line = indent;
                    empty = true;
                }
                if (!empty) line += ' ';
                line += word;
                empty = false;
            }
            if (!empty) lines.push_back(std::move(line));
        }
    }

    /// Holds compiled commands, and matches calls against all of them.
    /// \tparam Result: type for identifying commands
    template <command_id Result>
    class dispatcher {
    public:
        using result_type = Result;
        using command_type = command<Result>;
        using match_type = std::expected<dispatch_result<Result>, dispatch_error>;
    private:
        config config_;
        call_lexer lexer_;
        matcher matcher_;
        std::vector<command_type> commands_;
    public:
        explicit dispatcher(config config = {}) :
            config_{std::move(config)}, lexer_{config_}, matcher_{config_} {}

        /// Registry of parameter types. Register custom types before adding commands that use them.
        matcher& types() noexcept {
            return matcher_;
        }
        const matcher& types() const noexcept {
            return matcher_;
        }
        const std::vector<command_type>& commands() const noexcept {
            return commands_;
        }

        /// Compiles `grammar`, and adds it as a command identified by `result`.
        /// \return nothing, or the error in `grammar`
        std::expected<void, syntax_error> add(std::string_view grammar, Result result, std::string description = {}) {
            auto tree = compile(grammar, config_, &matcher_);
            if (!tree) return std::unexpected(std::move(tree.error()));
            commands_.push_back({std::move(*tree), result, std::move(description)});
            return {};
        }

        /// Matches `call` against every command.
        /// \return the best-scoring successful match (the first added wins a tie),
        /// or the best-scoring failure (`unknown_command` if no command scored)
        match_type match(std::string_view call) const {
            using enum match_error_type;
            std::vector<token> tokens = lexer_.tokenize(call);
            std::optional<call_match> best;
            std::size_t best_index = 0;
            std::optional<match_failure> failure;
            std::size_t failure_index = npos;
            std::vector<double> failure_scores(commands_.size(), -1);
            for (std::size_t i = 0; i < commands_.size(); ++i) {
                call_match m{call, tokens};
                if (auto res = match_call(commands_[i].tree, m, matcher_); res) {
                    if (!best || m.score() > best->score()) {
                        best = std::move(m);
                        best_index = i;
                    }
                } else {
                    failure_scores[i] = res.error().score;
                    if (!failure || res.error().score > failure->score) {
                        failure = std::move(res.error());
                        failure_index = i;
                    }
                }
            }
            if (best) {
                return dispatch_result<Result>{commands_[best_index].result, best_index, std::move(tokens), std::move(*best)};
            }
            dispatch_error error{{}, std::string{call}};
            if (failure && failure->score > 0) {
                error.failure = std::move(*failure);
                error.command_index = failure_index;
                for (std::size_t i = 0; i < commands_.size(); ++i) {
                    if (failure_scores[i] == error.failure.score) {
                        error.closest.push_back(commands_[i].tree.render());
                    }
                }
            } else {
                error.failure.type = unknown_command;
                error.failure.what = std::string{matcher_.message(unknown_command)};
                if (!tokens.empty()) {
                    error.failure.actual = tokens.front();
                    error.failure.what += ": " + quoted(tokens.front().value);
                }
            }
            return std::unexpected(std::move(error));
        }

        /// \param max_width: maximum width of a line. 0: no wrapping
        /// \param indent_width: indentation of wrapped lines and descriptions
        /// \return lines of usage text: each command's grammar followed by its description
        std::vector<std::string> usage_lines(std::size_t max_width = 70, std::size_t indent_width = 4) const {
            std::vector<std::string> lines;
            const std::string indent(indent_width, ' ');
            for (const auto& cmd : commands_) {
                detail::wrap(lines, cmd.tree.render(), max_width, {}, indent);
                if (!cmd.description.empty()) {
                    detail::wrap(lines, cmd.description, max_width, indent, indent);
                }
            }
            return lines;
        }
        void print_usage(std::ostream& os = output_stream(), std::size_t max_width = 70) const {
            os << "\033[36mUsages:\033[0m\n";
            for (const auto& line : usage_lines(max_width)) {
                os << line << '\n';
            }
        }
    };
}
