#pragma once
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "common.hpp"
#include "config.hpp"
#include "error.hpp"
#include "token.hpp"
#include "syntax_lexer.hpp"
#include "symbol_table.hpp"
#include "node.hpp"
#include "matcher.hpp"
#include "syntax_tree.hpp"

namespace cligram {
    /// Compiles grammar strings into syntax trees.
    /// The grammar is read in a single pass by a state machine, with a stack of open scopes.
    class syntax_parser {
        config config_;
        const matcher* types_;
        syntax_lexer lexer_;

        enum class state {
            normal,
            before_param_name, after_param_name, before_param_type, after_param_type,
            after_tail, after_raw_tail,
            before_identifier
        };
        enum class frame_kind {
            root, sequence, optional, unordered
        };
        /// An open scope.
        struct frame {
            frame_kind kind;
            /// Offset of the opening token.
            std::size_t start = 0;
            /// Children of the current variant, or of the whole scope if there are no variants.
            std::vector<node> children{};
            /// Set once a variant divider is met in this scope.
            std::optional<variant_group> group{};
            /// A tail has been appended to `children`.
            bool tail_closed = false;
        };

        void note(std::string_view grammar, const node& from, const node& to, bool applied) const {
            if (!config_.diagnostics) return;
            *config_.diagnostics << "\033[36mNote:\033[0m Grammar " << quoted(grammar)
                << (applied ? " simplified to " : " can be simplified to ")
                << quoted(cligram::render(to, true, config_.specials)) << " (from "
                << quoted(cligram::render(from, true, config_.specials)) << ")\n";
        }

        /// Registry holding only the built-in types.
        static const matcher& builtin_types() {
            static const matcher types;
            return types;
        }
    public:
        /// \param types: registry that types of parameters must be registered in.
        /// nullptr: only the built-in types are accepted.
        explicit syntax_parser(config config = {}, const matcher* types = nullptr) :
            config_{std::move(config)}, types_{types ? types : &builtin_types()}, lexer_{config_.specials} {}

        /// \param grammar: the grammar string
        /// \return the syntax tree (simplified according to `config::simplify`), or the first error in `grammar`
        std::expected<syntax_tree, syntax_error> parse(std::string_view grammar) const {
            using enum syntax_error_type;
            using enum syntax_token_type;
            const std::vector<syntax_token> tokens = lexer_.tokenize(grammar);
            auto raise = [this, grammar](syntax_error_type type, std::size_t loc,
                std::string_view text = {}, std::string_view detail = {}) {
                std::string what{config_.message(type)};
                if (!text.empty()) {
                    what += ": " + quoted(text) + " at " + std::to_string(loc);
                    if (!detail.empty()) {
                        what += ", ";
                        what += detail;
                    }
                } else if (!detail.empty()) {
                    what += ": ";
                    what += detail;
                }
                return std::unexpected(syntax_error{type, std::move(what), std::string{grammar}, loc});
            };

            symbol_table symbols;
            std::vector<frame> frames;
            frames.push_back({frame_kind::root, 0});
            state st = state::normal;
            const syntax_token* param_open_token = nullptr;
            const syntax_token* name_token = nullptr;
            const syntax_token* type_token = nullptr;
            const syntax_token* identifier_separator = nullptr;
            // last node appended to the top frame, if nothing else happened since
            node* last = nullptr;

            auto append = [&frames, &last](node&& n) {
                frames.back().children.push_back(std::move(n));
                last = &frames.back().children.back();
            };
            // Closes the current variant (if any) and collects the contents of `f`.
            auto collect = [&raise](frame& f, const syntax_token& at)
                -> std::expected<std::vector<node>, syntax_error> {
                if (!f.group) return std::move(f.children);
                if (f.children.empty()) {
                    return raise(empty_variant, at.start, at.text);
                }
                f.group->variants.push_back(sequence{std::move(f.children)});
                std::vector<node> contents;
                contents.push_back(std::move(*f.group));
                return contents;
            };

            for (const syntax_token& t : tokens) {
                node* const previous = last;
                last = nullptr;
                frame& top = frames.back();
                switch (t.type) {
                    case symbol: {
                        switch (st) {
                            case state::normal:
                                if (top.tail_closed) {
                                    return raise(tail_not_last, t.start, t.text);
                                }
                                append(literal{std::string{t.text}, config_.case_sensitive});
                                break;
                            case state::before_param_name:
                                name_token = &t;
                                st = state::after_param_name;
                                break;
                            case state::before_param_type:
                                type_token = &t;
                                st = state::after_param_type;
                                break;
                            case state::before_identifier: {
                                if (!symbols.add(t.text)) {
                                    return raise(duplicate_symbol, t.start, t.text);
                                }
                                auto* group = previous->get_if<variant_group>();
                                if (auto* optional = previous->get_if<optional_sequence>()) {
                                    auto* sole = optional->children.size() == 1 ?
                                        optional->children.front().get_if<variant_group>() : nullptr;
                                    // [a|b]:id identifies the variant group, as if it were [(a|b):id]
                                    if (sole && !sole->parentheses) {
                                        sole->identifier = std::string{t.text};
                                        sole->inherited_identifier = true;
                                    } else {
                                        optional->identifier = std::string{t.text};
                                    }
                                } else if (group) {
                                    group->identifier = std::string{t.text};
                                } else if (auto* unordered = previous->get_if<unordered_group>()) {
                                    unordered->identifier = std::string{t.text};
                                }
                                last = previous;
                                st = state::normal;
                                break;
                            }
                            default:
                                return raise(unexpected_token, t.start, t.text);
                        }
                        break;
                    }
                    case param_open: {
                        if (st != state::normal) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        if (top.tail_closed) {
                            return raise(tail_not_last, t.start, t.text);
                        }
                        param_open_token = &t;
                        name_token = type_token = nullptr;
                        st = state::before_param_name;
                        break;
                    }
                    case separator: {
                        if (st == state::after_param_name) {
                            st = state::before_param_type;
                            break;
                        }
                        if (st != state::normal) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        if (!previous) {
                            return raise(illegal_identifier, t.start, t.text, "nothing to identify");
                        }
                        bool identified = false;
                        if (auto* optional = previous->get_if<optional_sequence>()) {
                            auto* sole = optional->children.size() == 1 ?
                                optional->children.front().get_if<variant_group>() : nullptr;
                            identified = optional->identifier || (sole && sole->inherited_identifier);
                        } else if (auto* group = previous->get_if<variant_group>()) {
                            identified = group->identifier.has_value();
                        } else if (auto* unordered = previous->get_if<unordered_group>()) {
                            identified = unordered->identifier.has_value();
                        } else {
                            return raise(illegal_identifier, t.start, t.text,
                                "cannot identify " + std::string{previous->kind_name()});
                        }
                        if (identified) {
                            return raise(illegal_identifier, t.start, t.text, "already identified");
                        }
                        identifier_separator = &t;
                        last = previous;
                        st = state::before_identifier;
                        break;
                    }
                    case param_close: {
                        if (st == state::before_param_name) {
                            return raise(empty_parameter_name, t.start, t.text);
                        }
                        if (st == state::after_param_name || st == state::after_param_type) {
                            if (!symbols.add(name_token->text)) {
                                return raise(duplicate_symbol, name_token->start, name_token->text);
                            }
                            std::optional<std::string> type_name;
                            if (type_token) {
                                if (!types_->has_type(type_token->text)) {
                                    return raise(undefined_type, type_token->start, type_token->text);
                                }
                                type_name = std::string{type_token->text};
                            }
                            append(parameter{std::string{name_token->text}, std::move(type_name)});
                        } else if (st == state::after_tail || st == state::after_raw_tail) {
                            if (!symbols.add(name_token->text)) {
                                return raise(duplicate_symbol, name_token->start, name_token->text);
                            }
                            append(cligram::tail{std::string{name_token->text}, st == state::after_raw_tail});
                            top.tail_closed = true;
                        } else [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        st = state::normal;
                        break;
                    }
                    case tail: {
                        if (st != state::after_param_name) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        st = state::after_tail;
                        break;
                    }
                    case raw: {
                        if (st != state::after_tail) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        st = state::after_raw_tail;
                        break;
                    }
                    case case_insensitive:
                    case tolerant: {
                        if (st != state::normal) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        auto* l = previous ? previous->get_if<literal>() : nullptr;
                        if (!l) {
                            return raise(illegal_modifier, t.start, t.text);
                        }
                        if (t.type == case_insensitive) {
                            l->case_sensitive = false;
                        } else {
                            l->tolerant = true;
                        }
                        last = previous;
                        break;
                    }
                    case variant_divider: {
                        if (st != state::normal) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        if (top.kind == frame_kind::unordered) {
                            return raise(illegal_variant, t.start, t.text);
                        }
                        if (top.children.empty()) {
                            return raise(empty_variant, t.start, t.text);
                        }
                        if (!top.group) {
                            top.group.emplace();
                            top.group->parentheses = top.kind == frame_kind::sequence;
                        }
                        top.group->variants.push_back(sequence{std::move(top.children)});
                        top.children.clear();
                        top.tail_closed = false;
                        break;
                    }
                    case sequence_open:
                    case optional_open:
                    case unordered_open: {
                        if (st != state::normal) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        if (top.tail_closed) {
                            return raise(tail_not_last, t.start, t.text);
                        }
                        const frame_kind kind = t.type == sequence_open ? frame_kind::sequence :
                            t.type == optional_open ? frame_kind::optional : frame_kind::unordered;
                        frames.push_back({kind, t.start});
                        break;
                    }
                    case sequence_close:
                    case optional_close:
                    case unordered_close: {
                        const frame_kind kind = t.type == sequence_close ? frame_kind::sequence :
                            t.type == optional_close ? frame_kind::optional : frame_kind::unordered;
                        if (st != state::normal || top.kind != kind) [[unlikely]] {
                            return raise(unexpected_token, t.start, t.text);
                        }
                        const bool variants = top.group.has_value();
                        // a tail that is not behind a variant divider or an optional sequence
                        // ends the enclosing scope too
                        const bool closes_tail = top.tail_closed && kind != frame_kind::optional && !variants;
                        auto contents = collect(top, t);
                        if (!contents) return std::unexpected(std::move(contents.error()));
                        node closed;
                        if (kind == frame_kind::sequence) {
                            if (contents->empty()) {
                                return raise(empty_sequence, t.start, t.text);
                            }
                            if (variants) {
                                closed = std::move(contents->front());
                            } else {
                                closed = sequence{std::move(*contents)};
                            }
                        } else if (kind == frame_kind::optional) {
                            if (contents->empty()) {
                                return raise(empty_optional_sequence, t.start, t.text);
                            }
                            closed = optional_sequence{std::move(*contents)};
                        } else {
                            if (contents->empty()) {
                                return raise(empty_unordered_group, t.start, t.text);
                            }
                            closed = unordered_group{std::move(*contents)};
                        }
                        frames.pop_back();
                        if (frames.back().tail_closed) {
                            return raise(tail_not_last, t.start, t.text);
                        }
                        append(std::move(closed));
                        if (closes_tail) frames.back().tail_closed = true;
                        break;
                    }
                }
            }

            if (st == state::before_identifier) {
                return raise(illegal_identifier, identifier_separator->start, identifier_separator->text,
                    "missing identifier");
            }
            if (st != state::normal) {
                return raise(unterminated_parameter, param_open_token->start, param_open_token->text);
            }
            if (frames.size() > 1) {
                std::string path;
                for (std::size_t i = 1; i < frames.size(); ++i) {
                    std::string_view name;
                    switch (frames[i].kind) {
                        case frame_kind::sequence:
                            name = frames[i].group ? "variant_group" : "sequence";
                            break;
                        case frame_kind::optional:
                            name = "optional_sequence";
                            break;
                        default:
                            name = "unordered_group";
                            break;
                    }
                    if (!path.empty()) path += " > ";
                    path += name;
                    if (frames[i].kind == frame_kind::optional && frames[i].group) {
                        path += " > variant_group";
                    }
                }
                return raise(unterminated_expression, frames.back().start, {}, path);
            }

            frame& root_frame = frames.front();
            const syntax_token end_token{variant_divider, {}, grammar.size(), grammar.size()};
            auto contents = collect(root_frame, tokens.empty() ? end_token : tokens.back());
            if (!contents) return std::unexpected(std::move(contents.error()));
            node root = sequence{std::move(*contents)};
            if (config_.simplify == simplify_mode::no) {
                return syntax_tree{std::move(root), std::string{grammar}, config_.specials};
            }
            // the root sequence is implicit, so a single node stands on its own
            if (auto* s = root.get_if<sequence>(); s && s->children.size() == 1) {
                node only = std::move(s->children.front());
                root = std::move(only);
            }
            node flat = cligram::flatten(root);
            switch (config_.simplify) {
                case simplify_mode::warn:
                    if (flat != root) note(grammar, root, flat, false);
                    return syntax_tree{std::move(root), std::string{grammar}, config_.specials};
                case simplify_mode::yes:
                    if (flat != root) note(grammar, root, flat, true);
                    break;
                default:
                    break;
            }
            return syntax_tree{std::move(flat), std::string{grammar}, config_.specials};
        }
    };

    /// Compiles `grammar` with a `syntax_parser` configured by `config`.
    /// \param types: registry that types of parameters must be registered in.
    /// nullptr: only the built-in types are accepted.
    inline std::expected<syntax_tree, syntax_error> compile(
        std::string_view grammar, const config& config = {}, const matcher* types = nullptr) {
        return syntax_parser{config, types}.parse(grammar);
    }
}
