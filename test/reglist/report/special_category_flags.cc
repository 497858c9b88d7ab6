#include "../sample_data.hh"

#include <gtest/gtest.h>
#include <reglist/invariant_violation.hh>
#include <reglist/report/special_category_flags.hh>
#include <unordered_set>
#include <vector>

using reglist::InvariantViolation;
using reglist::races::Race;
using reglist::report::group_special_categories_by_race;
using reglist::report::MembershipIndex;
using reglist::report::special_category_flags;
using reglist::special_categories::SpecialCategory;

// NOLINTNEXTLINE
TEST(special_category_flags, follows_category_order) {
    std::vector<SpecialCategory> categories = {
        make_special_category(3, 1, "L"),
        make_special_category(5, 1, "V"),
        make_special_category(8, 1, "S"),
    };
    std::unordered_set<uint64_t> set = {8, 3, 42};
    EXPECT_EQ(special_category_flags(categories, &set), (std::vector<bool>{true, false, true}));
}

// NOLINTNEXTLINE
TEST(special_category_flags, empty_or_missing_set) {
    std::vector<SpecialCategory> categories = {
        make_special_category(3, 1, "L"), make_special_category(5, 1, "V")
    };
    std::unordered_set<uint64_t> empty;
    EXPECT_EQ(special_category_flags(categories, &empty), (std::vector<bool>{false, false}));
    EXPECT_EQ(special_category_flags(categories, nullptr), (std::vector<bool>{false, false}));
}

// NOLINTNEXTLINE
TEST(special_category_flags, full_set) {
    std::vector<SpecialCategory> categories = {
        make_special_category(3, 1, "L"), make_special_category(5, 1, "V")
    };
    std::unordered_set<uint64_t> full = {3, 5};
    EXPECT_EQ(special_category_flags(categories, &full), (std::vector<bool>{true, true}));
}

// NOLINTNEXTLINE
TEST(special_category_flags, no_categories) {
    std::unordered_set<uint64_t> set = {1, 2};
    EXPECT_TRUE(special_category_flags({}, &set).empty());
    EXPECT_TRUE(special_category_flags({}, nullptr).empty());
}

// NOLINTNEXTLINE
TEST(MembershipIndex, build) {
    auto index = MembershipIndex::build({
        make_membership(10, 3),
        make_membership(11, 5),
        make_membership(10, 5),
        make_membership(10, 3),
    });
    ASSERT_NE(index.find(10), nullptr);
    EXPECT_EQ(*index.find(10), (std::unordered_set<uint64_t>{3, 5}));
    ASSERT_NE(index.find(11), nullptr);
    EXPECT_EQ(*index.find(11), (std::unordered_set<uint64_t>{5}));
    EXPECT_EQ(index.find(12), nullptr);
    EXPECT_EQ(MembershipIndex::build({}).find(10), nullptr);
}

// NOLINTNEXTLINE
TEST(group_special_categories_by_race, aligned_with_races) {
    std::vector<Race> races = {
        make_race(7, "5km", 10), make_race(2, "10km", 18), make_race(9, "kids", 20)
    };
    auto grouped = group_special_categories_by_race(
        races,
        {
            make_special_category(1, 2, "A"),
            make_special_category(4, 7, "B"),
            make_special_category(6, 7, "C"),
        }
    );
    ASSERT_EQ(grouped.size(), 3u);
    ASSERT_EQ(grouped[0].size(), 2u);
    EXPECT_EQ(grouped[0][0].id, 4u);
    EXPECT_EQ(grouped[0][1].id, 6u);
    ASSERT_EQ(grouped[1].size(), 1u);
    EXPECT_EQ(grouped[1][0].id, 1u);
    EXPECT_TRUE(grouped[2].empty());
}

// NOLINTNEXTLINE
TEST(group_special_categories_by_race, unknown_race) {
    std::vector<Race> races = {make_race(7, "5km", 10)};
    EXPECT_THROW(
        (void)group_special_categories_by_race(races, {make_special_category(1, 8, "A")}),
        InvariantViolation
    );
    EXPECT_TRUE(group_special_categories_by_race({}, {}).empty());
}
