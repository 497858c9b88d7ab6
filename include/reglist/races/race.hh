#pragma once

#include <cstddef>
#include <cstdint>
#include <reglist/sql/fields/varbinary.hh>

namespace reglist::races {

struct Race {
    uint64_t id;
    uint64_t competition_id;
    // Grouping key of participants, unique within a competition
    sql::fields::Varbinary<255> name;
    // Minimal from_age of the categories started in the race, used only for ordering
    int32_t from_age;
    static constexpr size_t COLUMNS_NUM = 4;
};

} // namespace reglist::races
