#include <cstddef>
#include <cstdint>
#include <reglib/concat_tostr.hh>
#include <reglist/invariant_violation.hh>
#include <reglist/report/special_category_flags.hh>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using reglist::memberships::Membership;
using reglist::races::Race;
using reglist::special_categories::SpecialCategory;

namespace reglist::report {

MembershipIndex MembershipIndex::build(const std::vector<Membership>& memberships) {
    MembershipIndex index;
    for (const auto& m : memberships) {
        index.categories_of_participant[m.participant_id].emplace(m.special_category_id);
    }
    return index;
}

const std::unordered_set<uint64_t>* MembershipIndex::find(uint64_t participant_id) const {
    auto it = categories_of_participant.find(participant_id);
    return it == categories_of_participant.end() ? nullptr : &it->second;
}

std::vector<bool> special_category_flags(
    const std::vector<SpecialCategory>& categories,
    const std::unordered_set<uint64_t>* membership_set
) {
    std::vector<bool> flags(categories.size(), false);
    if (!membership_set) {
        return flags;
    }
    for (size_t i = 0; i < categories.size(); ++i) {
        flags[i] = membership_set->count(categories[i].id) > 0;
    }
    return flags;
}

std::vector<std::vector<SpecialCategory>> group_special_categories_by_race(
    const std::vector<Race>& races, const std::vector<SpecialCategory>& special_categories
) {
    std::unordered_map<uint64_t, size_t> race_idx_by_id;
    race_idx_by_id.reserve(races.size());
    for (size_t i = 0; i < races.size(); ++i) {
        race_idx_by_id.emplace(races[i].id, i);
    }

    std::vector<std::vector<SpecialCategory>> res(races.size());
    for (const auto& sc : special_categories) {
        auto it = race_idx_by_id.find(sc.race_id);
        if (it == race_idx_by_id.end()) {
            throw InvariantViolation{concat_tostr(
                "Special category ", sc.id, " belongs to race ", sc.race_id, " that is not loaded"
            )};
        }
        res[it->second].emplace_back(sc);
    }
    return res;
}

} // namespace reglist::report
