#include <cstddef>
#include <optional>
#include <reglib/concat_tostr.hh>
#include <reglist/report/grouping.hh>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using reglist::participants::Participant;
using reglist::races::Race;
using std::string;

namespace reglist::report {

ParticipantGrouping group_participants_by_race(
    const std::vector<Race>& races, const std::vector<Participant>& participants
) {
    ParticipantGrouping res;
    res.groups.reserve(races.size());
    size_t next = 0;
    for (size_t race_idx = 0; race_idx < races.size(); ++race_idx) {
        std::string_view race_name = races[race_idx].name;
        size_t begin = next;
        while (next < participants.size() && participants[next].race_name == race_name) {
            ++next;
        }
        res.groups.push_back({
            .race_idx = race_idx,
            .participants_begin = begin,
            .participants_end = next,
        });
    }
    res.consumed = next;
    return res;
}

std::optional<string> validate_participant_order(
    const std::vector<Race>& races, const std::vector<Participant>& participants
) {
    std::unordered_map<std::string_view, size_t> race_idx_by_name;
    race_idx_by_name.reserve(races.size());
    for (size_t i = 0; i < races.size(); ++i) {
        auto [it, inserted] = race_idx_by_name.emplace(races[i].name, i);
        if (!inserted) {
            return concat_tostr(
                "Race name `",
                races[i].name,
                "` is shared by races ",
                races[it->second].id,
                " and ",
                races[i].id
            );
        }
    }

    std::optional<size_t> curr_race_idx;
    for (const auto& p : participants) {
        auto it = race_idx_by_name.find(p.race_name);
        if (it == race_idx_by_name.end()) {
            return concat_tostr(
                "Participant ", p.id, " belongs to race `", p.race_name, "` that is not loaded"
            );
        }
        size_t race_idx = it->second;
        if (curr_race_idx == race_idx) {
            continue;
        }
        if (curr_race_idx and race_idx < *curr_race_idx) {
            return concat_tostr(
                "Participant ",
                p.id,
                " of race `",
                p.race_name,
                "` appears after participants of race `",
                races[*curr_race_idx].name,
                '`'
            );
        }
        curr_race_idx = race_idx;
    }
    return std::nullopt;
}

} // namespace reglist::report
