#pragma once
#include <array>
#include <string_view>
#include <utility>
#include <vector>
#include "chartypes.hpp"
#include "config.hpp"
#include "token.hpp"

namespace cligram {
    /// Splits grammar strings into symbols and punctuation.
    /// The lexer never fails; structure is checked by `syntax_parser`.
    class syntax_lexer {
        using punctuation_type = std::pair<std::string_view, syntax_token_type>;
        std::array<punctuation_type, 14> punctuation_;
    public:
        explicit syntax_lexer(const special_chars& specials = config_default::specials) noexcept {
            using enum syntax_token_type;
            punctuation_ = {{
                {specials.param_open, param_open}, {specials.param_close, param_close},
                {specials.separator, separator}, {specials.variant_divider, variant_divider},
                {specials.sequence_open, sequence_open}, {specials.sequence_close, sequence_close},
                {specials.optional_open, optional_open}, {specials.optional_close, optional_close},
                {specials.unordered_open, unordered_open}, {specials.unordered_close, unordered_close},
                {specials.tail, tail}, {specials.raw, raw},
                {specials.case_insensitive, case_insensitive}, {specials.tolerant, tolerant}
            }};
        }

        /// \param syntax: the grammar string to tokenize
        /// \return tokens viewing into `syntax`
        std::vector<syntax_token> tokenize(std::string_view syntax) const {
            std::vector<syntax_token> tokens;
            // current symbol is syntax[start, i)
            std::size_t start = 0;
            for (std::size_t i = 0; i < syntax.size(); ++i) {
                if (char_traits::is_space(syntax[i])) {
                    if (start < i) {
                        tokens.push_back({syntax_token_type::symbol, syntax.substr(start, i - start), start, i});
                    }
                    start = i + 1;
                    continue;
                }
                const std::string_view current = syntax.substr(start, i + 1 - start);
                for (const auto& [text, type] : punctuation_) {
                    if (!text.empty() && current.ends_with(text)) {
                        const std::size_t punct_start = i + 1 - text.size();
                        if (start < punct_start) {
                            tokens.push_back({
                                syntax_token_type::symbol, syntax.substr(start, punct_start - start),
                                start, punct_start
                            });
                        }
                        tokens.push_back({type, text, punct_start, i + 1});
                        start = i + 1;
                        break;
                    }
                }
            }
            if (start < syntax.size()) {
                tokens.push_back({syntax_token_type::symbol, syntax.substr(start), start, syntax.size()});
            }
            return tokens;
        }
    };
}
