#pragma once

#include <cstdint>
#include <reglist/memberships/membership.hh>
#include <reglist/races/race.hh>
#include <reglist/special_categories/special_category.hh>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace reglist::report {

// Special category ids of every participant
class MembershipIndex {
    std::unordered_map<uint64_t, std::unordered_set<uint64_t>> categories_of_participant;

public:
    static MembershipIndex build(const std::vector<memberships::Membership>& memberships);

    // Returns nullptr if the participant has no memberships
    [[nodiscard]] const std::unordered_set<uint64_t>* find(uint64_t participant_id) const;
};

// Returns a vector whose i-th element tells whether categories[i].id is in @p membership_set.
// nullptr is treated as an empty set.
std::vector<bool> special_category_flags(
    const std::vector<special_categories::SpecialCategory>& categories,
    const std::unordered_set<uint64_t>* membership_set
);

// Splits @p special_categories into per race lists aligned with @p races. Throws
// InvariantViolation if a special category belongs to none of @p races.
std::vector<std::vector<special_categories::SpecialCategory>> group_special_categories_by_race(
    const std::vector<races::Race>& races,
    const std::vector<special_categories::SpecialCategory>& special_categories
);

} // namespace reglist::report
