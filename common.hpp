#pragma once
#include <ranges>
#include <type_traits>
#include <concepts>
#include <string>
#include <string_view>

namespace cligram {
    namespace ranges = std::ranges;
    namespace views = std::views;
    using namespace std::literals;

    /// Offset used when a location cannot be pinpointed.
    constexpr std::size_t npos = -1uz;

    /// A visitor assembled from a set of callables.
    template <typename... Fs>
    struct overloaded : Fs... {
        using Fs::operator()...;
    };
    template <typename... Fs>
    overloaded(Fs...) -> overloaded<Fs...>;

    template <typename T, typename Tag>
    concept tagged = std::same_as<typename T::tag, Tag>;

    /// \return `str` wrapped in single quotes
    inline std::string quoted(std::string_view str) {
        std::string out;
        out.reserve(str.size() + 2);
        out += '\'';
        out += str;
        out += '\'';
        return out;
    }
}
