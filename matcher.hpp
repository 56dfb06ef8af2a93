#pragma once
#include <algorithm>
#include <array>
#include <charconv>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include "common.hpp"
#include "chartypes.hpp"
#include "config.hpp"
#include "call_match.hpp"

namespace cligram {
    /// Converts the text of a call token to a parameter value, or explains why it cannot.
    using type_constructor = std::function<std::expected<value, std::string>(std::string_view)>;

    /// Parses the whole of `str` (surrounding whitespace and a leading '+' allowed) as a `T`.
    /// \tparam T: an arithmetic type supported by `std::from_chars`
    template <typename T>
    std::expected<T, std::string> parse_number(std::string_view str) {
        std::string_view trimmed = char_traits::trim(str);
        if (trimmed.starts_with('+')) trimmed.remove_prefix(1);
        T result{};
        const char* last = trimmed.data() + trimmed.size();
        auto [ptr, ec] = std::from_chars(trimmed.data(), last, result);
        if (trimmed.empty() || ec != std::errc{} || ptr != last) [[unlikely]] {
            return std::unexpected(quoted(str) + (ec == std::errc::result_out_of_range ?
                " is out of range" : " is not a number"));
        }
        return result;
    }

    /// Parses `str` as a boolean.
    /// Numbers are true unless zero. Otherwise `str` is compared case-insensitively
    /// to a set of affirmative and negative words.
    inline std::expected<bool, std::string> loose_bool(std::string_view str) {
        static constexpr std::array affirmative{"y"sv, "yes"sv, "t"sv, "true"sv, "do"sv, "ok"sv, "sure"sv, "alright"sv};
        static constexpr std::array negative{"n"sv, "no"sv, "f"sv, "false"sv, "dont"sv};
        const std::string_view trimmed = char_traits::trim(str);
        if (auto number = parse_number<double>(trimmed)) {
            return *number != 0;
        }
        const std::string lower = char_traits::to_lower(trimmed);
        if (ranges::find(affirmative, lower) != affirmative.end()) return true;
        if (ranges::find(negative, lower) != negative.end()) return false;
        return std::unexpected(quoted(str) + " cannot be read as a boolean");
    }

    /// \return Jaro-Winkler similarity of `lhs` and `rhs`, from 0 (nothing in common) to 1 (equal)
    inline double similarity(std::string_view lhs, std::string_view rhs) {
        if (lhs.empty() && rhs.empty()) return 1;
        if (lhs.empty() || rhs.empty()) return 0;
        const std::size_t window = std::max(lhs.size(), rhs.size()) / 2 - (std::max(lhs.size(), rhs.size()) >= 2);
        std::vector<bool> lhs_matched(lhs.size()), rhs_matched(rhs.size());
        std::size_t matches = 0;
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            const std::size_t begin = i > window ? i - window : 0;
            const std::size_t end = std::min(i + window + 1, rhs.size());
            for (std::size_t j = begin; j < end; ++j) {
                if (!rhs_matched[j] && lhs[i] == rhs[j]) {
                    lhs_matched[i] = rhs_matched[j] = true;
                    ++matches;
                    break;
                }
            }
        }
        if (!matches) return 0;
        std::size_t half_transpositions = 0;
        for (std::size_t i = 0, j = 0; i < lhs.size(); ++i) {
            if (!lhs_matched[i]) continue;
            while (!rhs_matched[j]) ++j;
            if (lhs[i] != rhs[j]) ++half_transpositions;
            ++j;
        }
        const double m = static_cast<double>(matches);
        const double jaro = (m / lhs.size() + m / rhs.size() + (m - half_transpositions / 2.0) / m) / 3;
        std::size_t prefix = 0;
        while (prefix < 4 && prefix < lhs.size() && prefix < rhs.size() && lhs[prefix] == rhs[prefix]) {
            ++prefix;
        }
        return jaro + prefix * 0.1 * (1 - jaro);
    }

    /// Context of call matching: registered parameter types, and the comparison policy of literals.
    /// \remark Types must only be registered while setting up.
    /// Matching only reads the matcher, so one matcher may be shared by concurrent matches.
    class matcher {
        match_options options_;
        std::array<std::string_view, match_error_types_n> msgs_;
        std::map<std::string, type_constructor, std::less<>> types_;
    public:
        /// Registers the built-in types `str`, `int`, `float` and `bool`.
        explicit matcher(const config& config = {}) :
            options_{config.matching}, msgs_{config.match_error_msgs} {
            register_type("str", [](std::string_view str) -> std::expected<value, std::string> {
                return std::string{str};
            });
            register_type("int", [](std::string_view str) -> std::expected<value, std::string> {
                auto result = parse_number<long long>(str);
                if (!result) return std::unexpected(std::move(result.error()));
                return *result;
            });
            register_type("float", [](std::string_view str) -> std::expected<value, std::string> {
                auto result = parse_number<double>(str);
                if (!result) return std::unexpected(std::move(result.error()));
                return *result;
            });
            register_type("bool", [](std::string_view str) -> std::expected<value, std::string> {
                auto result = loose_bool(str);
                if (!result) return std::unexpected(std::move(result.error()));
                return *result;
            });
        }

        /// Registers (or replaces) the type named `name`.
        void register_type(std::string_view name, type_constructor constructor) {
            types_.insert_or_assign(std::string{name}, std::move(constructor));
        }
        [[nodiscard]] bool has_type(std::string_view name) const {
            return types_.find(name) != types_.end();
        }
        /// \return value of `str` as the type named `name`
        [[nodiscard]] std::expected<value, std::string> construct(std::string_view name, std::string_view str) const {
            auto it = types_.find(name);
            if (it == types_.end()) [[unlikely]] {
                return std::unexpected("Undefined type " + quoted(name));
            }
            return it->second(str);
        }

        [[nodiscard]] const match_options& options() const noexcept {
            return options_;
        }
        [[nodiscard]] std::string_view message(match_error_type type) const noexcept {
            return msgs_[std::to_underlying(type)];
        }
        /// \param case_sensitive: whether the literal being compared is case-sensitive
        [[nodiscard]] bool equals(std::string_view literal, std::string_view str, bool case_sensitive) const noexcept {
            if (case_sensitive && options_.case_sensitive) return literal == str;
            return char_traits::iequals(literal, str);
        }
        [[nodiscard]] double similarity(std::string_view literal, std::string_view str, bool case_sensitive) const {
            if (case_sensitive && options_.case_sensitive) return cligram::similarity(literal, str);
            return cligram::similarity(char_traits::to_lower(literal), char_traits::to_lower(str));
        }
    };
}
