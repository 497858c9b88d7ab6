#pragma once

#include <cstddef>
#include <cstdint>
#include <reglist/sql/fields/varbinary.hh>

namespace reglist::special_categories {

struct SpecialCategory {
    uint64_t id;
    uint64_t race_id;
    sql::fields::Varbinary<32> short_name;
    sql::fields::Varbinary<255> name;
    static constexpr size_t COLUMNS_NUM = 4;
};

} // namespace reglist::special_categories
