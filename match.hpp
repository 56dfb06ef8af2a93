#pragma once
#include <algorithm>
#include <expected>
#include <numeric>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common.hpp"
#include "config.hpp"
#include "error.hpp"
#include "node.hpp"
#include "call_match.hpp"
#include "matcher.hpp"

namespace cligram {
    using match_result = std::expected<void, match_failure>;

    match_result match(const node& n, call_match& m, const matcher& ctx);

    namespace detail {
        inline match_result match_children(const std::vector<node>& children, call_match& m, const matcher& ctx) {
            for (const auto& child : children) {
                if (auto res = match(child, m, ctx); !res) return res;
            }
            return {};
        }

        /// The most promising of the failed branches of a group.
        /// Only branches that scored are kept: a branch that scored nothing says nothing about intent.
        struct best_failure {
            std::optional<match_failure> failure;

            void offer(match_failure&& candidate, double score) {
                if (score > 0 && (!failure || score > failure->score)) {
                    candidate.score = score;
                    failure = std::move(candidate);
                }
            }
        };

        inline std::string describe_unused(const std::vector<node>& children, const std::vector<bool>& used) {
            std::vector<std::string> leads;
            for (std::size_t i = 0; i < children.size(); ++i) {
                if (used[i]) continue;
                std::string lead = describe_expected(children[i]);
                if (ranges::find(leads, lead) == leads.end()) leads.push_back(std::move(lead));
            }
            std::string out;
            for (const auto& lead : leads) {
                if (!out.empty()) out += " or ";
                out += lead;
            }
            return out;
        }
    }

    /// Matches `n` against the tokens left in `m`, consuming the tokens it matches.
    /// \param ctx: types and literal comparison policy
    /// \return nothing on success, or the most informative failure
    /// \remark On failure, `m` keeps the score accumulated so far (bindings may be partial).
    /// Tokens left over after a successful match are not an error here.
    inline match_result match(const node& n, call_match& m, const matcher& ctx) {
        using enum match_error_type;
        const match_options& options = ctx.options();
        auto raise = [&n, &m, &ctx](match_error_type type, std::string expected, bool with_actual = true) {
            match_failure failure{type, std::string{ctx.message(type)}, std::move(expected)};
            failure.source = &n;
            if (with_actual && !m.empty()) failure.actual = m.front();
            if (!failure.expected.empty()) failure.what += " " + failure.expected;
            if (failure.actual) failure.what += ", got " + quoted(failure.actual->value);
            return std::unexpected(std::move(failure));
        };
        if (m.terminated()) [[unlikely]] {
            return raise(terminated, {}, false);
        }
        return std::visit(overloaded{
            [&](const literal& l) -> match_result {
                if (m.empty()) {
                    return raise(missing_literal, quoted(l.text));
                }
                const token& actual = m.front();
                if (ctx.equals(l.text, actual.value, l.case_sensitive)) [[likely]] {
                    m.add_score(options.literal_score);
                    m.consume();
                    return {};
                }
                const double sim = ctx.similarity(l.text, actual.value, l.case_sensitive);
                if (sim >= options.literal_threshold) {
                    if (l.tolerant) {
                        m.add_score(options.fuzzy_score);
                        m.consume();
                        return {};
                    }
                    m.add_score(options.fuzzy_score * sim);
                    match_failure failure{
                        suggested_literal, std::string{ctx.message(suggested_literal)} + " " + quoted(l.text) + "?",
                        quoted(l.text), actual, &n, l.text
                    };
                    return std::unexpected(std::move(failure));
                }
                return raise(mismatched_literal, quoted(l.text));
            },
            [&](const parameter& p) -> match_result {
                if (m.empty()) {
                    return raise(missing_parameter, render(n, false));
                }
                const token& actual = m.front();
                if (p.type_name) {
                    auto constructed = ctx.construct(*p.type_name, actual.value);
                    if (!constructed) {
                        auto failure = raise(mismatched_parameter_type, render(n, false));
                        failure.error().what += ": " + constructed.error();
                        return failure;
                    }
                    m.bind(p.name, std::move(*constructed));
                } else {
                    m.bind(p.name, actual.value);
                }
                m.add_score(options.parameter_score);
                m.consume();
                return {};
            },
            [&](const tail& t) -> match_result {
                if (m.empty()) {
                    return raise(missing_tail, render(n, false));
                }
                const auto tokens = m.tokens();
                const std::size_t start = tokens.front().start, end = tokens.back().end;
                std::string_view text = start < end && end <= m.raw().size() ?
                    m.raw().substr(start, end - start) : std::string_view{};
                if (text.empty()) {
                    return raise(missing_tail, render(n, false));
                }
                if (t.raw) {
                    m.bind(t.name, std::string{text});
                } else {
                    std::vector<std::string> values;
                    values.reserve(tokens.size());
                    for (const auto& tok : tokens) {
                        values.push_back(tok.value);
                    }
                    m.bind(t.name, std::move(values));
                }
                m.add_score(options.parameter_score);
                m.terminate();
                return {};
            },
            [&](const sequence& s) -> match_result {
                return detail::match_children(s.children, m, ctx);
            },
            [&](const optional_sequence& o) -> match_result {
                call_match forked = m.fork();
                if (auto res = detail::match_children(o.children, forked, ctx); !res) {
                    if (forked.score() > 0) {
                        // a partial match means the user meant to use this branch
                        m.add_score(forked.score());
                        return res;
                    }
                    m.record_optional(o.identifier, false);
                    return {};
                }
                m.record_optional(o.identifier, true);
                m.join(std::move(forked));
                return {};
            },
            [&](const variant_group& g) -> match_result {
                std::optional<call_match> best;
                std::size_t best_index = 0;
                detail::best_failure failed;
                for (std::size_t i = 0; i < g.variants.size(); ++i) {
                    call_match forked = m.fork();
                    if (auto res = detail::match_children(g.variants[i].children, forked, ctx); res) {
                        if (!best || forked.score() > best->score()) {
                            best = std::move(forked);
                            best_index = i;
                        }
                    } else {
                        failed.offer(std::move(res.error()), forked.score());
                    }
                }
                if (best) {
                    m.record_variant(g.identifier, best_index);
                    m.join(std::move(*best));
                    return {};
                }
                if (failed.failure) {
                    m.add_score(failed.failure->score);
                    return std::unexpected(std::move(*failed.failure));
                }
                return raise(m.empty() ? missing_variant : no_matched_variant, describe_expected(n));
            },
            [&](const unordered_group& u) -> match_result {
                const std::size_t size = u.children.size();
                detail::best_failure failed;
                if (options.unordered == unordered_strategy::permutation) {
                    std::vector<std::size_t> order(size);
                    std::iota(order.begin(), order.end(), 0uz);
                    std::optional<call_match> best;
                    std::vector<std::size_t> best_order;
                    do {
                        call_match forked = m.fork();
                        match_result res;
                        for (std::size_t i : order) {
                            res = match(u.children[i], forked, ctx);
                            if (!res) break;
                        }
                        if (!res) {
                            failed.offer(std::move(res.error()), forked.score());
                        } else if (!best || forked.score() > best->score()) {
                            best = std::move(forked);
                            best_order = order;
                        }
                    } while (std::next_permutation(order.begin(), order.end()));
                    if (best) {
                        m.record_unordered(u.identifier, std::move(best_order));
                        m.join(std::move(*best));
                        return {};
                    }
                    if (failed.failure) {
                        m.add_score(failed.failure->score);
                        return std::unexpected(std::move(*failed.failure));
                    }
                    return raise(m.empty() ? missing_unordered_group : unmatched_unordered_group, describe_expected(n));
                }
                std::vector<bool> used(size);
                std::vector<std::size_t> order;
                order.reserve(size);
                for (std::size_t round = 0; round < size; ++round) {
                    std::optional<call_match> best;
                    std::size_t best_index = 0;
                    for (std::size_t i = 0; i < size; ++i) {
                        if (used[i]) continue;
                        call_match forked = m.fork();
                        if (auto res = match(u.children[i], forked, ctx); res) {
                            if (!best || forked.score() > best->score()) {
                                best = std::move(forked);
                                best_index = i;
                            }
                        } else {
                            failed.offer(std::move(res.error()), forked.score());
                        }
                    }
                    if (!best) {
                        if (failed.failure) {
                            m.add_score(failed.failure->score);
                            return std::unexpected(std::move(*failed.failure));
                        }
                        return raise(m.empty() ? missing_unordered_group : unmatched_unordered_group,
                            detail::describe_unused(u.children, used));
                    }
                    used[best_index] = true;
                    order.push_back(best_index);
                    m.join(std::move(*best));
                    // failures of earlier rounds are stale once a child is committed
                    failed.failure.reset();
                }
                m.record_unordered(u.identifier, std::move(order));
                return {};
            }
        }, n.value);
    }
}
