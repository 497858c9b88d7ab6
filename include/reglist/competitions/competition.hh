#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <reglist/sql/fields/datetime.hh>
#include <reglist/sql/fields/varbinary.hh>

namespace reglist::competitions {

struct Competition {
    uint64_t id;
    sql::fields::Varbinary<255> name;
    sql::fields::Date date;
    std::optional<sql::fields::Varbinary<255>> location;
    static constexpr size_t COLUMNS_NUM = 4;
};

} // namespace reglist::competitions
