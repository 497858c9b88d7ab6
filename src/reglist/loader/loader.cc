#include <cstdint>
#include <optional>
#include <reglib/concat_tostr.hh>
#include <reglib/throw_assert.hh>
#include <reglist/loader/loader.hh>
#include <reglist/sql/sql.hh>
#include <string>
#include <utility>
#include <vector>

using reglist::competitions::Competition;
using reglist::memberships::Membership;
using reglist::participants::Participant;
using reglist::races::Race;
using reglist::special_categories::SpecialCategory;
using reglist::sql::Select;
using reglist::sql::SqlWithParams;

namespace {

// Ids are integers, so they are safe to inline into the query text
template <class T, class IdOf>
std::string comma_separated_ids(const std::vector<T>& elems, IdOf&& id_of) {
    std::string res;
    for (const auto& elem : elems) {
        if (!res.empty()) {
            res += ", ";
        }
        back_insert(res, id_of(elem));
    }
    return res;
}

} // namespace

namespace reglist::loader {

SqlWithParams<const uint64_t&> competition_query(const uint64_t& competition_id) {
    return Select("id, name, date, location").from("competitions").where("id=?", competition_id);
}

SqlWithParams<const uint64_t&> races_query(const uint64_t& competition_id) {
    return Select("r.id, r.competition_id, r.name, MIN(c.from_age) AS from_age")
        .from("races r")
        .inner_join("starts s")
        .on("s.race_id=r.id")
        .inner_join("categories c")
        .on("c.start_id=s.id")
        .where("r.competition_id=?", competition_id)
        .group_by("r.id, r.competition_id, r.name")
        .order_by("from_age, r.name, r.id");
}

SqlWithParams<> special_categories_query(const std::vector<Race>& races) {
    throw_assert(!races.empty());
    auto race_ids = comma_separated_ids(races, [](const Race& race) { return race.id; });
    return Select("sc.id, sc.race_id, sc.short_name, sc.name")
        .from("special_categories sc")
        .where(concat_tostr("sc.race_id IN (", race_ids, ')'))
        .order_by(concat_tostr("FIELD(sc.race_id, ", race_ids, "), sc.id"));
}

SqlWithParams<const uint64_t&> participants_query(const uint64_t& competition_id) {
    return Select("p.id, p.first_name, p.last_name, p.club, p.birth_year, s.time, c.label, r.name")
        .from("participants p")
        .inner_join("categories c")
        .on("c.id=p.category_id")
        .inner_join("starts s")
        .on("s.id=c.start_id")
        .inner_join("races r")
        .on("r.id=s.race_id")
        .inner_join(
            Select("rs.race_id, MIN(rc.from_age) AS from_age")
                .from("starts rs")
                .inner_join("categories rc")
                .on("rc.start_id=rs.id")
                .group_by("rs.race_id"),
            "ra"
        )
        .on("ra.race_id=r.id")
        .where("r.competition_id=?", competition_id)
        .order_by(
            "ra.from_age, r.name, r.id, c.from_age, p.birth_year DESC, p.first_name, p.last_name"
        );
}

SqlWithParams<> memberships_query(const std::vector<Participant>& participants) {
    throw_assert(!participants.empty());
    auto participant_ids =
        comma_separated_ids(participants, [](const Participant& p) { return p.id; });
    return Select("spp.participant_id, spp.special_category_id")
        .from("special_category_per_participant spp")
        .inner_join("special_categories sc")
        .on("sc.id=spp.special_category_id")
        .where(concat_tostr("spp.participant_id IN (", participant_ids, ')'))
        .order_by("spp.participant_id, spp.special_category_id");
}

std::optional<Competition> load_competition(mysql::Connection& mysql, uint64_t competition_id) {
    auto stmt = mysql.execute(competition_query(competition_id));
    Competition competition;
    std::string date;
    stmt.res_bind(competition.id, competition.name, date, competition.location);
    if (!stmt.next()) {
        return std::nullopt;
    }
    competition.date = std::move(date);
    return competition;
}

std::vector<Race> load_races(mysql::Connection& mysql, uint64_t competition_id) {
    auto stmt = mysql.execute(races_query(competition_id));
    Race race;
    stmt.res_bind(race.id, race.competition_id, race.name, race.from_age);
    std::vector<Race> races;
    while (stmt.next()) {
        races.emplace_back(race);
    }
    return races;
}

std::vector<SpecialCategory>
load_special_categories(mysql::Connection& mysql, const std::vector<Race>& races) {
    std::vector<SpecialCategory> special_categories;
    if (races.empty()) {
        return special_categories;
    }

    auto stmt = mysql.execute(special_categories_query(races));
    SpecialCategory sc;
    stmt.res_bind(sc.id, sc.race_id, sc.short_name, sc.name);
    while (stmt.next()) {
        special_categories.emplace_back(sc);
    }
    return special_categories;
}

std::vector<Participant> load_participants(mysql::Connection& mysql, uint64_t competition_id) {
    auto stmt = mysql.execute(participants_query(competition_id));
    Participant p;
    std::string start_time;
    stmt.res_bind(
        p.id,
        p.first_name,
        p.last_name,
        p.club,
        p.birth_year,
        start_time,
        p.class_label,
        p.race_name
    );
    std::vector<Participant> participants;
    while (stmt.next()) {
        p.start_time = start_time;
        participants.emplace_back(p);
    }
    return participants;
}

std::vector<Membership>
load_memberships(mysql::Connection& mysql, const std::vector<Participant>& participants) {
    std::vector<Membership> memberships;
    if (participants.empty()) {
        return memberships;
    }

    auto stmt = mysql.execute(memberships_query(participants));
    Membership m;
    stmt.res_bind(m.participant_id, m.special_category_id);
    while (stmt.next()) {
        memberships.emplace_back(m);
    }
    return memberships;
}

std::optional<LoadedRelations> load_relations(mysql::Connection& mysql, uint64_t competition_id) {
    auto competition = load_competition(mysql, competition_id);
    if (!competition) {
        return std::nullopt;
    }

    auto races = load_races(mysql, competition_id);
    auto special_categories = load_special_categories(mysql, races);
    auto participants = load_participants(mysql, competition_id);
    auto memberships = load_memberships(mysql, participants);
    return LoadedRelations{
        .competition = std::move(*competition),
        .races = std::move(races),
        .special_categories = std::move(special_categories),
        .participants = std::move(participants),
        .memberships = std::move(memberships),
    };
}

} // namespace reglist::loader
