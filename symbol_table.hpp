#pragma once
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include "common.hpp"

namespace cligram {
    /// Names of parameters and group identifiers used in one grammar.
    class symbol_table {
        std::set<std::string, std::less<>> symbols_;
    public:
        /// \return false if `symbol` has already been added
        bool add(std::string_view symbol) {
            return symbols_.emplace(symbol).second;
        }
        bool contains(std::string_view symbol) const {
            return symbols_.contains(symbol);
        }
        std::size_t size() const noexcept {
            return symbols_.size();
        }
    };
}
