#pragma once

#include "varbinary.hh"

#include <reglib/concat_tostr.hh>
#include <reglib/throw_assert.hh>
#include <reglib/time.hh>
#include <string>
#include <string_view>

namespace reglist::sql::fields {

// Format: YYYY-mm-dd HH:MM:SS
class Datetime : public Varbinary<std::char_traits<char>::length("YYYY-mm-dd HH:MM:SS")> {
public:
    Datetime() noexcept = default;
    Datetime(const Datetime&) = default;
    Datetime(Datetime&&) noexcept = default;
    Datetime& operator=(const Datetime&) = default;
    Datetime& operator=(Datetime&&) noexcept = default;
    ~Datetime() = default;

    explicit Datetime(std::string str)
    : Varbinary{[&]() -> decltype(auto) {
        throw_assert(is_datetime(str));
        return std::move(str);
    }()} {}

    Datetime& operator=(std::string str) {
        throw_assert(is_datetime(str));
        Varbinary::operator=(std::move(str));
        return *this;
    }

    // Local time without a timezone designator: "YYYY-mm-ddTHH:MM:SS"
    [[nodiscard]] std::string to_json() const {
        throw_assert(size() == max_len);
        auto sv = std::string_view{*this};
        auto date = sv.substr(0, std::char_traits<char>::length("YYYY-mm-dd"));
        auto time = sv.substr(date.size() + 1);
        return concat_tostr('"', date, 'T', time, '"');
    }
};

// Format: YYYY-mm-dd
class Date : public Varbinary<std::char_traits<char>::length("YYYY-mm-dd")> {
public:
    Date() noexcept = default;
    Date(const Date&) = default;
    Date(Date&&) noexcept = default;
    Date& operator=(const Date&) = default;
    Date& operator=(Date&&) noexcept = default;
    ~Date() = default;

    explicit Date(std::string str)
    : Varbinary{[&]() -> decltype(auto) {
        throw_assert(is_date(str));
        return std::move(str);
    }()} {}

    Date& operator=(std::string str) {
        throw_assert(is_date(str));
        Varbinary::operator=(std::move(str));
        return *this;
    }
};

} // namespace reglist::sql::fields
