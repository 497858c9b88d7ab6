#pragma once

#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace detail {

template <class T, class = decltype(std::declval<std::ostream&>() << std::declval<const T&>())>
constexpr auto is_printable(int) -> std::true_type;

template <class>
constexpr auto is_printable(...) -> std::false_type;

} // namespace detail

template <class T>
constexpr inline bool is_printable = decltype(detail::is_printable<T>(0))::value;

template <class T>
struct Ok {
    T val;

    constexpr explicit Ok(T val) noexcept(std::is_nothrow_move_constructible_v<T>)
    : val{std::move(val)} {}

    Ok(const Ok&) = default;
    Ok(Ok&&) noexcept = default;
    Ok& operator=(const Ok&) = default;
    Ok& operator=(Ok&&) noexcept = default;
    ~Ok() = default;
};

template <class T, std::enable_if_t<is_printable<T>, int> = 0>
std::ostream& operator<<(std::ostream& os, const Ok<T>& ok) {
    return os << "Ok{" << ok.val << "}";
}

template <class T>
struct Err {
    T err;

    constexpr explicit Err(T err) noexcept(std::is_nothrow_move_constructible_v<T>)
    : err{std::move(err)} {}

    Err(const Err&) = default;
    Err(Err&&) noexcept = default;
    Err& operator=(const Err&) = default;
    Err& operator=(Err&&) noexcept = default;
    ~Err() = default;
};

template <class T, std::enable_if_t<is_printable<T>, int> = 0>
std::ostream& operator<<(std::ostream& os, const Err<T>& err) {
    return os << "Err{" << err.err << "}";
}

template <class A, class B>
constexpr bool operator==(const Err<A>& a, const Err<B>& b) {
    return a.err == b.err;
}

template <class T, class E>
struct Result : std::variant<Ok<T>, Err<E>> {
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Ok<T> ok) : std::variant<Ok<T>, Err<E>>{std::move(ok)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Err<E> err) : std::variant<Ok<T>, Err<E>>{std::move(err)} {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<Ok<T>>(*this);
    }

    [[nodiscard]] constexpr bool is_err() const noexcept {
        return std::holds_alternative<Err<E>>(*this);
    }

    constexpr T unwrap() && { return std::get<Ok<T>>(std::move(*this)).val; }

    constexpr E unwrap_err() && { return std::get<Err<E>>(std::move(*this)).err; }

    [[nodiscard]] constexpr const T& ok() const& { return std::get<Ok<T>>(*this).val; }

    [[nodiscard]] constexpr const E& err() const& { return std::get<Err<E>>(*this).err; }
};

template <class T, class E, class X>
constexpr bool operator==(const Result<T, E>& r, const Err<X>& x) {
    return r.is_err() and r.err() == x.err;
}

template <class T, class E, class X>
constexpr bool operator!=(const Result<T, E>& r, const Err<X>& x) {
    return !(r == x);
}
