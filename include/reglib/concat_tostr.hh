#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

template <class T>
constexpr decltype(auto) stringify(T&& x) {
    using DT = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<DT, char>) {
        return std::string(1, x);
    } else if constexpr (std::is_same_v<DT, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_integral_v<DT>) {
        return std::to_string(x);
    } else {
        return std::forward<T>(x);
    }
}

namespace detail {

template <class T, class = decltype(std::string_view{stringify(std::declval<T>())})>
constexpr auto is_string_argument(int) -> std::true_type;

template <class>
constexpr auto is_string_argument(...) -> std::false_type;

} // namespace detail

template <class T>
constexpr inline bool is_string_argument = decltype(detail::is_string_argument<T>(0))::value;

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += std::string_view{str});
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (0 + ... + std::string_view{xx}.size()));
        return (str += ... += std::string_view{xx});
    }(stringify(std::forward<Args>(args))...);
}
