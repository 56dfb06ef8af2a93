#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "chartypes.hpp"
#include "config.hpp"
#include "token.hpp"

namespace cligram {
    /// Splits command calls into tokens.
    /// Quote characters group words (spaces included) into one token, and the escape character
    /// allows quotes and itself to be used literally.
    class call_lexer {
        std::string quotes_;
        char escape_;

        bool is_quote(char c) const noexcept {
            return quotes_.find(c) != std::string::npos;
        }
    public:
        explicit call_lexer(const special_chars& specials = config_default::specials) :
            quotes_{specials.quotes}, escape_{specials.escape} {}
        explicit call_lexer(const config& config) : call_lexer{config.specials} {}

        /// \param call: the command call to tokenize
        /// \return tokens of `call`, with spans as byte offsets into `call`
        /// \remark An unterminated quoted token keeps its opening quote in its value.
        /// A backslash escaping anything other than a quote or a backslash is kept.
        std::vector<token> tokenize(std::string_view call) const {
            std::vector<token> tokens;
            std::string current;
            std::size_t current_start = 0;
            char quote = 0;
            bool quote_open = false, escape = false;
            auto push_plain = [&](std::size_t end) {
                tokens.push_back({
                    std::nullopt, std::string{call.substr(current_start, end - current_start)},
                    current_start, end, current
                });
            };
            for (std::size_t i = 0; i < call.size(); ++i) {
                const char c = call[i];
                if (!quote_open && char_traits::is_space(c)) {
                    if (escape) {
                        current += escape_;
                        escape = false;
                    }
                    if (!current.empty()) push_plain(i);
                    current.clear();
                    current_start = i + 1;
                } else if (is_quote(c)) {
                    if (escape) {
                        // outside of quotes, the escape character is kept
                        if (!quote_open) current += escape_;
                        current += c;
                        escape = false;
                    } else if (!quote_open) {
                        if (!current.empty()) push_plain(i);
                        current.clear();
                        current_start = i;
                        quote = c;
                        quote_open = true;
                    } else if (c == quote) {
                        tokens.push_back({
                            token_kind::quoted, std::string{call.substr(current_start, i + 1 - current_start)},
                            current_start, i + 1, current
                        });
                        current.clear();
                        current_start = i + 1;
                        quote_open = false;
                    } else {
                        current += c;
                    }
                } else if (c == escape_) {
                    if (escape) {
                        current += c;
                        escape = false;
                    } else {
                        escape = true;
                    }
                } else {
                    if (escape) {
                        current += escape_;
                        escape = false;
                    }
                    current += c;
                }
            }
            if (escape) current += escape_;
            if (quote_open) [[unlikely]] {
                tokens.push_back({
                    token_kind::unterminated, std::string{call.substr(current_start)},
                    current_start, call.size(), quote + current
                });
            } else if (!current.empty()) {
                push_plain(call.size());
            }
            return tokens;
        }
    };
}
