#pragma once

#include <cerrno>
#include <cstring>
#include <reglib/concat_tostr.hh>
#include <string>

// Returns " - <error description> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    char buff[128];
    const char* errstr = strerror_r(errnum, buff, sizeof(buff));
    if (errstr == nullptr) {
        errstr = "Unknown error";
    }
    return concat_tostr(" - ", errstr, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }
