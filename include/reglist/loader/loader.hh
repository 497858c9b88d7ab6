#pragma once

#include <cstdint>
#include <optional>
#include <reglist/competitions/competition.hh>
#include <reglist/memberships/membership.hh>
#include <reglist/mysql/mysql.hh>
#include <reglist/participants/participant.hh>
#include <reglist/races/race.hh>
#include <reglist/special_categories/special_category.hh>
#include <reglist/sql/sql.hh>
#include <vector>

namespace reglist::loader {

// Queries issued by the loader. Parameters are held by reference, so they have to outlive the
// returned query.

sql::SqlWithParams<const uint64_t&> competition_query(const uint64_t& competition_id);

// Races of the competition that start at least one category, ordered by the minimal from_age of
// their categories, then by name and id
sql::SqlWithParams<const uint64_t&> races_query(const uint64_t& competition_id);

// Special categories of @p races, one run per race in the order of @p races, ordered by id
// within a run. @p races must not be empty.
sql::SqlWithParams<> special_categories_query(const std::vector<races::Race>& races);

// Participants of the competition ordered by the same (from_age, name, id) prefix as
// races_query(), then by birth year descending, first name and last name
sql::SqlWithParams<const uint64_t&> participants_query(const uint64_t& competition_id);

// Memberships of @p participants in existing special categories, ordered by participant id and
// special category id. @p participants must not be empty.
sql::SqlWithParams<> memberships_query(const std::vector<participants::Participant>& participants
);

std::optional<competitions::Competition>
load_competition(mysql::Connection& mysql, uint64_t competition_id);

std::vector<races::Race> load_races(mysql::Connection& mysql, uint64_t competition_id);

// No query is issued if @p races is empty
std::vector<special_categories::SpecialCategory>
load_special_categories(mysql::Connection& mysql, const std::vector<races::Race>& races);

std::vector<participants::Participant>
load_participants(mysql::Connection& mysql, uint64_t competition_id);

// No query is issued if @p participants is empty
std::vector<memberships::Membership> load_memberships(
    mysql::Connection& mysql, const std::vector<participants::Participant>& participants
);

struct LoadedRelations {
    competitions::Competition competition;
    std::vector<races::Race> races;
    std::vector<special_categories::SpecialCategory> special_categories;
    std::vector<participants::Participant> participants;
    std::vector<memberships::Membership> memberships;
};

// Runs all the loads above in order, returns std::nullopt if the competition does not exist.
// Data-access failures are thrown as std::runtime_error.
std::optional<LoadedRelations> load_relations(mysql::Connection& mysql, uint64_t competition_id);

} // namespace reglist::loader
