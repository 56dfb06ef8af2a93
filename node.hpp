#pragma once
#include <algorithm>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "common.hpp"
#include "chartypes.hpp"
#include "config_default.hpp"

namespace cligram {
    struct node;

    /// Matches one token by exact (or, within the similarity threshold, fuzzy) comparison.
    struct literal {
        std::string text;
        bool case_sensitive = true;
        /// Accept tokens within the similarity threshold instead of suggesting this literal.
        bool tolerant = false;
    };
    /// Binds one token, optionally converted by a registered type.
    struct parameter {
        std::string name;
        std::optional<std::string> type_name;
    };
    /// Binds all remaining tokens. Must be the last node of its sequence.
    struct tail {
        std::string name;
        /// Bind the original text spanning the tokens instead of a list of token values.
        bool raw = false;
    };
    /// All children must match, in order.
    struct sequence {
        std::vector<node> children;
    };
    /// Children are matched as an all-or-nothing unit that may be absent.
    struct optional_sequence {
        std::vector<node> children;
        std::optional<std::string> identifier;
    };
    /// Exactly one variant must match.
    struct variant_group {
        std::vector<sequence> variants;
        std::optional<std::string> identifier;
        /// The identifier was written on the optional sequence wrapping this group (`[a|b]:id`).
        /// Only affects rendering.
        bool inherited_identifier = false;
        /// Only affects rendering.
        bool parentheses = true;
    };
    /// All children must match, in any order.
    struct unordered_group {
        std::vector<node> children;
        /// Names the order in which the children were matched.
        std::optional<std::string> identifier;
    };

    /// A node of a syntax tree.
    /// Trees are values: a node owns its children, and is never mutated once compiled.
    struct node {
        using value_type = std::variant<
            literal, parameter, tail, sequence, optional_sequence, variant_group, unordered_group>;
        value_type value;

        node() = default;
        template <typename T>
        requires (!std::same_as<std::remove_cvref_t<T>, node> && std::constructible_from<value_type, T&&>)
        node(T&& v) : value(std::forward<T>(v)) {}

        template <typename T>
        bool is() const noexcept {
            return std::holds_alternative<T>(value);
        }
        template <typename T>
        const T* get_if() const noexcept {
            return std::get_if<T>(&value);
        }
        template <typename T>
        T* get_if() noexcept {
            return std::get_if<T>(&value);
        }
        /// \return name of the node kind, as used in diagnostics
        std::string_view kind_name() const noexcept {
            constexpr std::string_view names[] = {
                "literal", "parameter", "tail", "sequence", "optional_sequence", "variant_group", "unordered_group"
            };
            return names[value.index()];
        }
    };

    /// Node equality compares what matching depends on.
    /// The rendering flags of `variant_group` are ignored.
    bool operator==(const node& lhs, const node& rhs);

    inline bool operator==(const literal& lhs, const literal& rhs) {
        return lhs.text == rhs.text && lhs.case_sensitive == rhs.case_sensitive && lhs.tolerant == rhs.tolerant;
    }
    inline bool operator==(const parameter& lhs, const parameter& rhs) {
        return lhs.name == rhs.name && lhs.type_name == rhs.type_name;
    }
    inline bool operator==(const tail& lhs, const tail& rhs) {
        return lhs.name == rhs.name && lhs.raw == rhs.raw;
    }
    inline bool operator==(const sequence& lhs, const sequence& rhs) {
        return lhs.children == rhs.children;
    }
    inline bool operator==(const optional_sequence& lhs, const optional_sequence& rhs) {
        return lhs.identifier == rhs.identifier && lhs.children == rhs.children;
    }
    inline bool operator==(const variant_group& lhs, const variant_group& rhs) {
        return lhs.identifier == rhs.identifier && lhs.variants == rhs.variants;
    }
    inline bool operator==(const unordered_group& lhs, const unordered_group& rhs) {
        return lhs.identifier == rhs.identifier && lhs.children == rhs.children;
    }
    inline bool operator==(const node& lhs, const node& rhs) {
        return lhs.value == rhs.value;
    }

    namespace detail {
        inline void render_to(std::string& out, const node& n, const special_chars& specials, bool root);

        inline void render_children(std::string& out, const std::vector<node>& children, const special_chars& specials) {
            bool first = true;
            for (const auto& child : children) {
                if (first) {
                    first = false;
                } else {
                    out += ' ';
                }
                render_to(out, child, specials, false);
            }
        }

        inline void render_to(std::string& out, const node& n, const special_chars& specials, bool root) {
            std::visit(overloaded{
                [&](const literal& l) {
                    out += l.text;
                    if (!l.case_sensitive) out += specials.case_insensitive;
                    if (l.tolerant) out += specials.tolerant;
                },
                [&](const parameter& p) {
                    out += specials.param_open;
                    out += p.name;
                    if (p.type_name) {
                        out += specials.separator;
                        out += ' ';
                        out += *p.type_name;
                    }
                    out += specials.param_close;
                },
                [&](const tail& t) {
                    out += specials.param_open;
                    out += t.name;
                    out += specials.tail;
                    if (t.raw) out += specials.raw;
                    out += specials.param_close;
                },
                [&](const sequence& s) {
                    if (!root) out += specials.sequence_open;
                    render_children(out, s.children, specials);
                    if (!root) out += specials.sequence_close;
                },
                [&](const optional_sequence& o) {
                    out += specials.optional_open;
                    render_children(out, o.children, specials);
                    out += specials.optional_close;
                    const std::string* identifier = o.identifier ? &*o.identifier : nullptr;
                    if (o.children.size() == 1) {
                        const auto* group = o.children.front().get_if<variant_group>();
                        if (group && group->identifier && group->inherited_identifier) {
                            identifier = &*group->identifier;
                        }
                    }
                    if (identifier) {
                        out += specials.separator;
                        out += *identifier;
                    }
                },
                [&](const variant_group& g) {
                    const bool own_identifier = g.identifier && !g.inherited_identifier;
                    const bool parentheses = g.parentheses || own_identifier;
                    if (parentheses) out += specials.sequence_open;
                    bool first = true;
                    for (const auto& variant : g.variants) {
                        if (first) {
                            first = false;
                        } else {
                            out += specials.variant_divider;
                        }
                        render_children(out, variant.children, specials);
                    }
                    if (parentheses) out += specials.sequence_close;
                    if (own_identifier) {
                        out += specials.separator;
                        out += *g.identifier;
                    }
                },
                [&](const unordered_group& u) {
                    out += specials.unordered_open;
                    render_children(out, u.children, specials);
                    out += specials.unordered_close;
                    if (u.identifier) {
                        out += specials.separator;
                        out += *u.identifier;
                    }
                }
            }, n.value);
        }

        inline node flatten(const node& n, bool has_parent, bool sole_child);

        /// Appends `child` to `out`, unpacking it if it is a sequence.
        inline void splice(std::vector<node>& out, node&& child) {
            if (auto* s = child.get_if<sequence>()) {
                for (auto& grandchild : s->children) {
                    out.push_back(std::move(grandchild));
                }
            } else {
                out.push_back(std::move(child));
            }
        }

        inline std::vector<node> flatten_children(const std::vector<node>& children, bool unpack_sequences) {
            std::vector<node> out;
            out.reserve(children.size());
            const bool sole = children.size() == 1;
            for (const auto& child : children) {
                node flat = flatten(child, true, sole);
                if (unpack_sequences) {
                    splice(out, std::move(flat));
                } else {
                    out.push_back(std::move(flat));
                }
            }
            return out;
        }

        /// \param has_parent: whether `n` is nested in another node
        /// \param sole_child: whether `n` is the only child of its parent
        inline node flatten(const node& n, bool has_parent, bool sole_child) {
            return std::visit(overloaded{
                [](const literal& l) -> node {return l;},
                [](const parameter& p) -> node {return p;},
                [](const tail& t) -> node {return t;},
                [&](const sequence& s) -> node {
                    if (s.children.size() == 1) {
                        return flatten(s.children.front(), has_parent, sole_child);
                    }
                    return sequence{flatten_children(s.children, true)};
                },
                [](const optional_sequence& o) -> node {
                    optional_sequence flat{flatten_children(o.children, true), o.identifier};
                    // [(a|b)]:id identifies the optional sequence, [a|b]:id the variant group
                    if (flat.identifier && flat.children.size() == 1) {
                        auto* group = flat.children.front().get_if<variant_group>();
                        if (group && !group->identifier) group->parentheses = true;
                    }
                    return flat;
                },
                [&](const variant_group& g) -> node {
                    if (g.variants.size() == 1 && !g.identifier) {
                        return flatten(node{g.variants.front()}, has_parent, sole_child);
                    }
                    variant_group flat{{}, g.identifier, g.inherited_identifier, false};
                    flat.parentheses = (has_parent && !sole_child) || (g.identifier && !g.inherited_identifier);
                    for (const auto& variant : g.variants) {
                        sequence flat_variant{flatten_children(variant.children, true)};
                        if (flat_variant.children.size() == 1) {
                            auto* nested = flat_variant.children.front().get_if<variant_group>();
                            // (a|(b|c)) is (a|b|c)
                            if (nested && !nested->parentheses && !nested->identifier) {
                                for (auto& nested_variant : nested->variants) {
                                    flat.variants.push_back(std::move(nested_variant));
                                }
                                continue;
                            }
                        }
                        flat.variants.push_back(std::move(flat_variant));
                    }
                    return flat;
                },
                [&](const unordered_group& u) -> node {
                    if (u.children.size() == 1 && !u.identifier) {
                        return flatten(u.children.front(), has_parent, sole_child);
                    }
                    return unordered_group{flatten_children(u.children, false), u.identifier};
                }
            }, n.value);
        }
    }

    /// \param root: whether `n` is the root of a tree (a root sequence is rendered without parentheses)
    /// \return grammar string of `n`
    inline std::string render(const node& n, bool root = true, const special_chars& specials = config_default::specials) {
        std::string out;
        detail::render_to(out, n, specials, root);
        return out;
    }

    /// Collapses single-child wrappers, unpacks nested sequences and nested variant groups,
    /// and decides which variant groups need parentheses.
    /// \return the flattened copy of the tree rooted at `n`
    /// \remark Flattening is idempotent and does not change what a tree matches.
    inline node flatten(const node& n) {
        return detail::flatten(n, false, true);
    }

    /// \return description of what `n` expects first, for failure messages
    inline std::string describe_expected(const node& n) {
        auto join = [](const std::vector<std::string>& leads) {
            std::string out;
            for (const auto& lead : leads) {
                if (!out.empty()) out += " or ";
                out += lead;
            }
            return out;
        };
        auto add_unique = [](std::vector<std::string>& leads, std::string lead) {
            if (!lead.empty() && ranges::find(leads, lead) == leads.end()) {
                leads.push_back(std::move(lead));
            }
        };
        return std::visit(overloaded{
            [](const literal& l) {return quoted(l.text);},
            [&](const sequence& s) {
                return s.children.empty() ? std::string{} : describe_expected(s.children.front());
            },
            [&](const variant_group& g) {
                std::vector<std::string> leads;
                for (const auto& variant : g.variants) {
                    add_unique(leads, describe_expected(node{variant}));
                }
                return join(leads);
            },
            [&](const unordered_group& u) {
                std::vector<std::string> leads;
                for (const auto& child : u.children) {
                    add_unique(leads, describe_expected(child));
                }
                return join(leads);
            },
            [&](const auto&) {return render(n, false);}
        }, n.value);
    }
}
