#pragma once
#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "common.hpp"
#include "token.hpp"

namespace cligram {
    /// A value bound to a parameter.
    /// Tails bind `std::vector<std::string>` (or `std::string` if raw).
    using value = std::variant<std::string, long long, double, bool, std::vector<std::string>>;

    /// State of one attempt to match a call against a syntax tree.
    /// Speculative branches work on a `fork()`, which is `join()`ed back into its parent on success
    /// and discarded otherwise.
    /// \remark The call string and its tokens are borrowed, and must outlive the `call_match`.
    class call_match {
        std::string_view raw_;
        std::span<const token> tokens_;
        double score_ = 0;
        bool terminated_ = false;
        std::map<std::string, value, std::less<>> params_;
        std::vector<bool> optionals_;
        std::vector<std::size_t> variants_;
        std::map<std::string, bool, std::less<>> named_optionals_;
        std::map<std::string, std::size_t, std::less<>> named_variants_;
        std::map<std::string, std::vector<std::size_t>, std::less<>> named_unordered_;
    public:
        call_match() = default;
        /// \param raw: the call that `tokens` were produced from
        /// \param tokens: tokens left to match
        call_match(std::string_view raw, std::span<const token> tokens) noexcept :
            raw_{raw}, tokens_{tokens} {}

        /// \return a match on the same remaining tokens, with no score and no bindings
        [[nodiscard]] call_match fork() const {
            call_match forked{raw_, tokens_};
            forked.terminated_ = terminated_;
            return forked;
        }
        /// Merges a successful fork of this match.
        /// Bindings of `forked` win over existing ones, and its remaining tokens are adopted.
        void join(call_match&& forked) {
            score_ += forked.score_;
            terminated_ = terminated_ || forked.terminated_;
            tokens_ = forked.tokens_;
            for (auto& [name, val] : forked.params_) {
                params_.insert_or_assign(name, std::move(val));
            }
            optionals_.insert(optionals_.end(), forked.optionals_.begin(), forked.optionals_.end());
            variants_.insert(variants_.end(), forked.variants_.begin(), forked.variants_.end());
            for (auto& [name, present] : forked.named_optionals_) {
                named_optionals_.insert_or_assign(name, present);
            }
            for (auto& [name, index] : forked.named_variants_) {
                named_variants_.insert_or_assign(name, index);
            }
            for (auto& [name, order] : forked.named_unordered_) {
                named_unordered_.insert_or_assign(name, std::move(order));
            }
        }

        [[nodiscard]] std::string_view raw() const noexcept {
            return raw_;
        }
        /// \return tokens left to match
        [[nodiscard]] std::span<const token> tokens() const noexcept {
            return tokens_;
        }
        [[nodiscard]] bool empty() const noexcept {
            return tokens_.empty();
        }
        [[nodiscard]] const token& front() const {
            return tokens_.front();
        }
        /// Consumes `n` tokens.
        void consume(std::size_t n = 1) noexcept {
            tokens_ = tokens_.subspan(std::min(n, tokens_.size()));
        }
        /// Consumes all remaining tokens, and forbids any further matching.
        void terminate() noexcept {
            tokens_ = tokens_.subspan(tokens_.size());
            terminated_ = true;
        }
        [[nodiscard]] bool terminated() const noexcept {
            return terminated_;
        }

        [[nodiscard]] double score() const noexcept {
            return score_;
        }
        void add_score(double delta) noexcept {
            score_ += delta;
        }

        void bind(std::string_view name, value val) {
            params_.insert_or_assign(std::string{name}, std::move(val));
        }
        void record_optional(const std::optional<std::string>& identifier, bool present) {
            if (identifier) {
                named_optionals_.insert_or_assign(*identifier, present);
            } else {
                optionals_.push_back(present);
            }
        }
        void record_variant(const std::optional<std::string>& identifier, std::size_t index) {
            if (identifier) {
                named_variants_.insert_or_assign(*identifier, index);
            } else {
                variants_.push_back(index);
            }
        }

        /// Records the order in which the children of an unordered group matched.
        /// Unnamed groups record nothing.
        void record_unordered(const std::optional<std::string>& identifier, std::vector<std::size_t> order) {
            if (identifier) named_unordered_.insert_or_assign(*identifier, std::move(order));
        }

        /// \return whether a parameter named `name` has been bound
        [[nodiscard]] bool contains(std::string_view name) const {
            return params_.find(name) != params_.end();
        }
        /// \throw std::out_of_range if no parameter named `name` has been bound
        [[nodiscard]] const value& operator[](std::string_view name) const {
            auto it = params_.find(name);
            if (it == params_.end()) [[unlikely]] {
                throw std::out_of_range("Unbound parameter: " + std::string{name});
            }
            return it->second;
        }
        /// \throw std::out_of_range if no parameter named `name` has been bound
        /// \throw std::bad_variant_access if the parameter does not hold a `T`
        template <typename T>
        [[nodiscard]] const T& get(std::string_view name) const {
            return std::get<T>((*this)[name]);
        }
        [[nodiscard]] const std::map<std::string, value, std::less<>>& params() const noexcept {
            return params_;
        }

        /// \return whether the `index`th unnamed optional sequence (in pre-order) was present
        /// \throw std::out_of_range if fewer optional sequences were recorded
        [[nodiscard]] bool optional(std::size_t index) const {
            return optionals_.at(index);
        }
        /// \return whether the optional sequence named `identifier` was present
        /// \throw std::out_of_range if no optional sequence named `identifier` was recorded
        [[nodiscard]] bool optional(std::string_view identifier) const {
            auto it = named_optionals_.find(identifier);
            if (it == named_optionals_.end()) [[unlikely]] {
                throw std::out_of_range("Unknown optional sequence: " + std::string{identifier});
            }
            return it->second;
        }
        /// \return index of the variant chosen in the `index`th unnamed variant group (in pre-order)
        /// \throw std::out_of_range if fewer variant groups were recorded
        [[nodiscard]] std::size_t variant(std::size_t index) const {
            return variants_.at(index);
        }
        /// \return index of the variant chosen in the variant group named `identifier`
        /// \throw std::out_of_range if no variant group named `identifier` was recorded
        [[nodiscard]] std::size_t variant(std::string_view identifier) const {
            auto it = named_variants_.find(identifier);
            if (it == named_variants_.end()) [[unlikely]] {
                throw std::out_of_range("Unknown variant group: " + std::string{identifier});
            }
            return it->second;
        }
        /// \return indexes of the children of the unordered group named `identifier`, in the order they matched
        /// \throw std::out_of_range if no unordered group named `identifier` was recorded
        [[nodiscard]] const std::vector<std::size_t>& unordered(std::string_view identifier) const {
            auto it = named_unordered_.find(identifier);
            if (it == named_unordered_.end()) [[unlikely]] {
                throw std::out_of_range("Unknown unordered group: " + std::string{identifier});
            }
            return it->second;
        }
        [[nodiscard]] const std::vector<bool>& optionals() const noexcept {
            return optionals_;
        }
        [[nodiscard]] const std::vector<std::size_t>& variants() const noexcept {
            return variants_;
        }
    };
}
