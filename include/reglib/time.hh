#pragma once

#include <ctime>
#include <string>
#include <string_view>

// Returns local date in format @p format (see strftime(3)), @p curr_time == -1
// means the current time
std::string localdate(const char* format, time_t curr_time = -1);

// Returns local date in format "%Y-%m-%d %H:%M:%S"
inline std::string mysql_localdate(time_t curr_time = -1) {
    return localdate("%Y-%m-%d %H:%M:%S", curr_time);
}

// Checks if @p str has format "%Y-%m-%d" and denotes an existing day
bool is_date(std::string_view str) noexcept;

// Checks if @p str has format "%Y-%m-%d %H:%M:%S" and denotes an existing moment
bool is_datetime(std::string_view str) noexcept;
