#include <cstdint>
#include <optional>
#include <reglib/concat_tostr.hh>
#include <reglib/json_str/json_str.hh>
#include <reglib/result.hh>
#include <reglist/invariant_violation.hh>
#include <reglist/report/grouping.hh>
#include <reglist/report/registration_report.hh>
#include <reglist/report/special_category_flags.hh>
#include <string>
#include <utility>
#include <vector>

using reglist::competitions::Competition;
using reglist::memberships::Membership;
using reglist::participants::Participant;
using reglist::races::Race;
using reglist::special_categories::SpecialCategory;

namespace reglist::report {

NotFound::NotFound(uint64_t competition_id)
: competition_id{competition_id}
, message{concat_tostr("No competition for id ", competition_id, " found")} {}

Result<RegistrationReport, NotFound> make_registration_report(
    uint64_t competition_id,
    std::optional<Competition> competition,
    std::vector<Race> races,
    std::vector<SpecialCategory> special_categories,
    std::vector<Participant> participants,
    const std::vector<Membership>& memberships
) {
    if (!competition) {
        return Err{NotFound{competition_id}};
    }

    if (auto violation = validate_participant_order(races, participants)) {
        throw InvariantViolation{std::move(*violation)};
    }
    auto grouping = group_participants_by_race(races, participants);
    if (grouping.consumed != participants.size()) {
        throw InvariantViolation{concat_tostr(
            "Only ", grouping.consumed, " of ", participants.size(), " participants were grouped"
        )};
    }

    auto categories_of_race = group_special_categories_by_race(races, special_categories);
    auto membership_index = MembershipIndex::build(memberships);

    RegistrationReport report{
        .competition_info = std::move(*competition),
        .race_groups = {},
    };
    report.race_groups.reserve(grouping.groups.size());
    for (const auto& group : grouping.groups) {
        auto& categories = categories_of_race[group.race_idx];
        RaceGroup race_group{
            .race_name = std::move(races[group.race_idx].name),
            .special_categories = {},
            .participants = {},
        };
        race_group.participants.reserve(group.size());
        for (auto i = group.participants_begin; i < group.participants_end; ++i) {
            auto flags =
                special_category_flags(categories, membership_index.find(participants[i].id));
            if (flags.size() != categories.size()) {
                throw InvariantViolation{concat_tostr(
                    "Participant ",
                    participants[i].id,
                    " has ",
                    flags.size(),
                    " special category flags, but the race has ",
                    categories.size(),
                    " special categories"
                )};
            }
            race_group.participants.push_back({
                .participant = std::move(participants[i]),
                .special_category_flags = std::move(flags),
            });
        }
        race_group.special_categories = std::move(categories);
        report.race_groups.emplace_back(std::move(race_group));
    }
    return Ok{std::move(report)};
}

std::string to_json(const RegistrationReport& report) {
    json_str::Object obj;
    obj.prop_obj("competitionInfo", [&](auto& competition_obj) {
        const auto& competition = report.competition_info;
        competition_obj.prop("id", competition.id);
        competition_obj.prop("name", competition.name);
        competition_obj.prop("date", competition.date);
        competition_obj.prop("location", competition.location);
    });
    obj.prop_arr("raceGroups", [&](auto& race_groups_arr) {
        for (const auto& group : report.race_groups) {
            race_groups_arr.val_obj([&](auto& group_obj) {
                group_obj.prop("raceName", group.race_name);
                group_obj.prop_arr("specialCategories", [&](auto& categories_arr) {
                    for (const auto& sc : group.special_categories) {
                        categories_arr.val_obj([&](auto& sc_obj) {
                            sc_obj.prop("id", sc.id);
                            sc_obj.prop("shortName", sc.short_name);
                            sc_obj.prop("name", sc.name);
                        });
                    }
                });
                group_obj.prop_arr("participants", [&](auto& participants_arr) {
                    for (const auto& participant_with_flags : group.participants) {
                        participants_arr.val_obj([&](auto& p_obj) {
                            const auto& p = participant_with_flags.participant;
                            p_obj.prop("firstName", p.first_name);
                            p_obj.prop("lastName", p.last_name);
                            p_obj.prop("club", p.club);
                            p_obj.prop("birthYear", p.birth_year);
                            p_obj.prop_raw("startTime", p.start_time.to_json());
                            p_obj.prop("class", p.class_label);
                            p_obj.prop_arr("specialCategoryFlags", [&](auto& flags_arr) {
                                for (bool flag : participant_with_flags.special_category_flags) {
                                    flags_arr.val(flag);
                                }
                            });
                        });
                    }
                });
            });
        }
    });
    return std::move(obj).into_str();
}

} // namespace reglist::report
