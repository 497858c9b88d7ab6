#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <reglib/result.hh>
#include <reglist/competitions/competition.hh>
#include <reglist/memberships/membership.hh>
#include <reglist/participants/participant.hh>
#include <reglist/races/race.hh>
#include <reglist/special_categories/special_category.hh>
#include <reglist/sql/fields/varbinary.hh>
#include <string>
#include <vector>

namespace reglist::report {

struct ParticipantWithFlags {
    participants::Participant participant;
    // special_category_flags[i] tells whether the participant qualifies for the i-th special
    // category of its race
    std::vector<bool> special_category_flags;
};

struct RaceGroup {
    decltype(races::Race::name) race_name;
    std::vector<special_categories::SpecialCategory> special_categories;
    std::vector<ParticipantWithFlags> participants;
};

struct RegistrationReport {
    competitions::Competition competition_info;
    std::vector<RaceGroup> race_groups;
};

struct NotFound {
    uint64_t competition_id;
    std::string message;

    explicit NotFound(uint64_t competition_id);

    bool operator==(const NotFound&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const NotFound& nf) { return os << nf.message; }

/**
 * @brief Assembles the registration report of the competition from its loaded relations
 * @details Races keep their order. Participants are assigned to races by race name in a single
 *   pass, so they have to be ordered as the loader orders them; this is verified first.
 *
 * @param competition_id id the relations were loaded for
 * @param competition std::nullopt if the competition does not exist
 * @param races races of the competition in the report order
 * @param special_categories special categories of @p races
 * @param participants participants of the competition grouped by race in the order of @p races
 * @param memberships memberships of @p participants
 *
 * @return the report or NotFound if @p competition is std::nullopt
 *
 * @errors Throws InvariantViolation if participants are not grouped by race in the race order,
 *   race names are not unique or a special category belongs to an unknown race
 */
Result<RegistrationReport, NotFound> make_registration_report(
    uint64_t competition_id,
    std::optional<competitions::Competition> competition,
    std::vector<races::Race> races,
    std::vector<special_categories::SpecialCategory> special_categories,
    std::vector<participants::Participant> participants,
    const std::vector<memberships::Membership>& memberships
);

// Serializes @p report to a JSON object with camelCase keys
std::string to_json(const RegistrationReport& report);

} // namespace reglist::report
