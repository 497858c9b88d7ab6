#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <reglist/sql/fields/datetime.hh>
#include <reglist/sql/fields/varbinary.hh>

namespace reglist::participants {

// A participant row flattened with its start and race, it carries no race id
struct Participant {
    uint64_t id;
    sql::fields::Varbinary<255> first_name;
    sql::fields::Varbinary<255> last_name;
    std::optional<sql::fields::Varbinary<255>> club;
    int32_t birth_year;
    sql::fields::Datetime start_time;
    // Label of the participant's category
    sql::fields::Varbinary<255> class_label;
    sql::fields::Varbinary<255> race_name;
    static constexpr size_t COLUMNS_NUM = 8;
};

} // namespace reglist::participants
