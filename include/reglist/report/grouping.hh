#pragma once

#include <cstddef>
#include <optional>
#include <reglist/participants/participant.hh>
#include <reglist/races/race.hh>
#include <string>
#include <vector>

namespace reglist::report {

struct RaceParticipants {
    size_t race_idx;
    // The race's participants are participants[participants_begin, participants_end)
    size_t participants_begin;
    size_t participants_end;

    [[nodiscard]] size_t size() const noexcept { return participants_end - participants_begin; }
};

struct ParticipantGrouping {
    // One element per race, in the order of races
    std::vector<RaceParticipants> groups;
    // Number of participants assigned to any race, smaller than the number of all participants
    // only if the participants were not grouped by race in the race order
    size_t consumed = 0;
};

/**
 * @brief Partitions @p participants into runs belonging to consecutive @p races
 * @details Single pass with one cursor over @p participants: for every race the participants
 *   whose race_name equals the race's name are taken as long as they follow the cursor. A
 *   participant that is not where the race order expects it is never consumed.
 *
 * @param races races in the report order
 * @param participants participants sorted by the same key prefix as @p races
 *
 * @return one group per race and the number of consumed participants
 */
ParticipantGrouping group_participants_by_race(
    const std::vector<races::Race>& races,
    const std::vector<participants::Participant>& participants
);

// Checks that race names are unique, that every participant belongs to one of @p races and that
// participants of each race form a single run with runs following the order of @p races. Returns
// description of the first violation found.
std::optional<std::string> validate_participant_order(
    const std::vector<races::Race>& races,
    const std::vector<participants::Participant>& participants
);

} // namespace reglist::report
