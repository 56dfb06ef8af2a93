#pragma once
#include <string>
#include <string_view>
#include <utility>
#include "common.hpp"
#include "chartypes.hpp"
#include "config_default.hpp"
#include "error.hpp"
#include "node.hpp"
#include "call_match.hpp"
#include "matcher.hpp"
#include "match.hpp"

namespace cligram {
    /// A compiled grammar.
    /// \remark Immutable once compiled, so one tree may be matched by several threads at once.
    class syntax_tree {
        node root_;
        std::string grammar_;
        special_chars specials_;
    public:
        /// \param grammar: the grammar `root` was compiled from
        /// \param specials: used to render the tree. The strings it views must outlive the tree.
        explicit syntax_tree(node root, std::string grammar = {},
            const special_chars& specials = config_default::specials) :
            root_{std::move(root)}, grammar_{std::move(grammar)}, specials_{specials} {}

        const node& root() const noexcept {
            return root_;
        }
        /// \return the grammar the tree was compiled from
        std::string_view grammar() const noexcept {
            return grammar_;
        }
        /// \return canonical grammar of the tree
        std::string render() const {
            return cligram::render(root_, true, specials_);
        }
        syntax_tree flattened() const {
            return syntax_tree{cligram::flatten(root_), grammar_, specials_};
        }

        /// Matches the tree against the tokens left in `m`.
        /// On failure, the score of the failure is the score `m` accumulated.
        /// \remark Tokens left over after a successful match are not an error here, see `match_call`.
        match_result match(call_match& m, const matcher& ctx) const {
            auto res = cligram::match(root_, m, ctx);
            if (!res) res.error().score = m.score();
            return res;
        }

        friend bool operator==(const syntax_tree& lhs, const syntax_tree& rhs) {
            return lhs.root_ == rhs.root_;
        }
    };

    /// Matches `tree` against the whole call in `m`.
    /// \return nothing on success, or a failure (`too_many_arguments` if tokens are left over)
    inline match_result match_call(const syntax_tree& tree, call_match& m, const matcher& ctx) {
        if (auto res = tree.match(m, ctx); !res) return res;
        if (!m.empty()) {
            const token& extra = m.front();
            match_failure failure{
                match_error_type::too_many_arguments,
                std::string{ctx.message(match_error_type::too_many_arguments)} + ", got " + quoted(extra.value),
                {}, extra, &tree.root()
            };
            failure.score = m.score();
            return std::unexpected(std::move(failure));
        }
        return {};
    }
}
