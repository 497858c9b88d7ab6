#pragma once

#include <stdexcept>

namespace reglist {

// Loaded data break a precondition of the grouping and would yield a wrong report
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace reglist
