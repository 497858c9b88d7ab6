#pragma once

#include <reglib/concat_tostr.hh>
#include <reglib/macros/stringify.hh>
#include <stdexcept>

// Includes the exception origin
#define THROW(...)                                                                         \
    throw std::runtime_error(concat_tostr(                                                 \
        __VA_ARGS__, " (thrown at " __FILE__ ":" REGLIST_STRINGIFY(__LINE__) ")"           \
    ))
