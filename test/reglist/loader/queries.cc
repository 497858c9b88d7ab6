#include "../sample_data.hh"

#include <cstdint>
#include <gtest/gtest.h>
#include <reglist/loader/loader.hh>
#include <stdexcept>
#include <tuple>
#include <vector>

using reglist::participants::Participant;
using reglist::races::Race;

// NOLINTNEXTLINE
TEST(loader, competition_query) {
    uint64_t id = 3;
    auto query = reglist::loader::competition_query(id);
    EXPECT_EQ(query.get_sql(), "SELECT id, name, date, location FROM competitions WHERE id=?");
    EXPECT_EQ(&std::get<0>(std::move(query).get_params()), &id);
}

// NOLINTNEXTLINE
TEST(loader, races_query) {
    uint64_t id = 3;
    EXPECT_EQ(
        reglist::loader::races_query(id).get_sql(),
        "SELECT r.id, r.competition_id, r.name, MIN(c.from_age) AS from_age FROM races r "
        "INNER JOIN starts s ON s.race_id=r.id INNER JOIN categories c ON c.start_id=s.id "
        "WHERE r.competition_id=? GROUP BY r.id, r.competition_id, r.name "
        "ORDER BY from_age, r.name, r.id"
    );
}

// NOLINTNEXTLINE
TEST(loader, special_categories_query) {
    std::vector<Race> races = {make_race(3, "5km", 10), make_race(1, "10km", 18)};
    EXPECT_EQ(
        reglist::loader::special_categories_query(races).get_sql(),
        "SELECT sc.id, sc.race_id, sc.short_name, sc.name FROM special_categories sc "
        "WHERE sc.race_id IN (3, 1) ORDER BY FIELD(sc.race_id, 3, 1), sc.id"
    );
    EXPECT_THROW((void)reglist::loader::special_categories_query({}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(loader, participants_query) {
    uint64_t id = 3;
    EXPECT_EQ(
        reglist::loader::participants_query(id).get_sql(),
        "SELECT p.id, p.first_name, p.last_name, p.club, p.birth_year, s.time, c.label, r.name "
        "FROM participants p INNER JOIN categories c ON c.id=p.category_id "
        "INNER JOIN starts s ON s.id=c.start_id INNER JOIN races r ON r.id=s.race_id "
        "INNER JOIN (SELECT rs.race_id, MIN(rc.from_age) AS from_age FROM starts rs "
        "INNER JOIN categories rc ON rc.start_id=rs.id GROUP BY rs.race_id) ra "
        "ON ra.race_id=r.id WHERE r.competition_id=? "
        "ORDER BY ra.from_age, r.name, r.id, c.from_age, p.birth_year DESC, p.first_name, "
        "p.last_name"
    );
}

// NOLINTNEXTLINE
TEST(loader, memberships_query) {
    std::vector<Participant> participants = {
        make_participant(5, "5km"), make_participant(9, "5km")
    };
    EXPECT_EQ(
        reglist::loader::memberships_query(participants).get_sql(),
        "SELECT spp.participant_id, spp.special_category_id "
        "FROM special_category_per_participant spp "
        "INNER JOIN special_categories sc ON sc.id=spp.special_category_id "
        "WHERE spp.participant_id IN (5, 9) "
        "ORDER BY spp.participant_id, spp.special_category_id"
    );
    EXPECT_THROW((void)reglist::loader::memberships_query({}), std::runtime_error);
}
