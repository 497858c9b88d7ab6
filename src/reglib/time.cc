#include <cstddef>
#include <ctime>
#include <reglib/errmsg.hh>
#include <reglib/macros/throw.hh>
#include <reglib/time.hh>
#include <string>
#include <string_view>

std::string localdate(const char* format, time_t curr_time) {
    if (curr_time < 0) {
        curr_time = time(nullptr);
    }

    struct tm tm_buff {};
    if (localtime_r(&curr_time, &tm_buff) == nullptr) {
        THROW("localtime_r()", errmsg());
    }

    char buff[64];
    size_t len = strftime(buff, sizeof(buff), format, &tm_buff);
    return {buff, len};
}

namespace {

bool parse_number(std::string_view str, size_t pos, size_t len, int& res) noexcept {
    res = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (str[i] < '0' or str[i] > '9') {
            return false;
        }
        res = res * 10 + (str[i] - '0');
    }
    return true;
}

bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 and year % 100 != 0) or year % 400 == 0;
}

} // namespace

bool is_date(std::string_view str) noexcept {
    if (str.size() != std::char_traits<char>::length("YYYY-mm-dd") or str[4] != '-' or
        str[7] != '-')
    {
        return false;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_number(str, 0, 4, year) or !parse_number(str, 5, 2, month) or
        !parse_number(str, 8, 2, day))
    {
        return false;
    }

    static constexpr int month_days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 or month > 12 or day < 1) {
        return false;
    }
    int days_in_month = month_days[month - 1] + (month == 2 and is_leap_year(year) ? 1 : 0);
    return day <= days_in_month;
}

bool is_datetime(std::string_view str) noexcept {
    if (str.size() != std::char_traits<char>::length("YYYY-mm-dd HH:MM:SS") or str[10] != ' ' or
        str[13] != ':' or str[16] != ':')
    {
        return false;
    }
    if (!is_date(str.substr(0, 10))) {
        return false;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    return parse_number(str, 11, 2, hour) and parse_number(str, 14, 2, minute) and
        parse_number(str, 17, 2, second) and hour < 24 and minute < 60 and second < 60;
}
