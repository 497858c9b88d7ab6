#pragma once

#include <cstddef>
#include <cstdint>

namespace reglist::memberships {

// Participant @p participant_id qualifies for special category @p special_category_id
struct Membership {
    uint64_t participant_id;
    uint64_t special_category_id;
    static constexpr size_t COLUMNS_NUM = 2;
};

} // namespace reglist::memberships
