#include "../sample_data.hh"

#include <gtest/gtest.h>
#include <reglist/report/grouping.hh>
#include <vector>

using reglist::participants::Participant;
using reglist::races::Race;
using reglist::report::group_participants_by_race;
using reglist::report::validate_participant_order;

// NOLINTNEXTLINE
TEST(group_participants_by_race, splits_runs_in_race_order) {
    std::vector<Race> races = {make_race(1, "5km", 10), make_race(2, "10km", 18)};
    std::vector<Participant> participants = {
        make_participant(11, "5km", 2012),
        make_participant(12, "5km", 2011),
        make_participant(13, "5km", 2010),
        make_participant(21, "10km", 2000),
        make_participant(22, "10km", 1990),
    };
    auto grouping = group_participants_by_race(races, participants);
    ASSERT_EQ(grouping.groups.size(), 2u);
    EXPECT_EQ(grouping.groups[0].race_idx, 0u);
    EXPECT_EQ(grouping.groups[0].participants_begin, 0u);
    EXPECT_EQ(grouping.groups[0].participants_end, 3u);
    EXPECT_EQ(grouping.groups[1].race_idx, 1u);
    EXPECT_EQ(grouping.groups[1].participants_begin, 3u);
    EXPECT_EQ(grouping.groups[1].participants_end, 5u);
    EXPECT_EQ(grouping.consumed, participants.size());
    EXPECT_EQ(validate_participant_order(races, participants), std::nullopt);
}

// NOLINTNEXTLINE
TEST(group_participants_by_race, races_without_participants) {
    std::vector<Race> races = {
        make_race(1, "kids", 6), make_race(2, "5km", 10), make_race(3, "10km", 18)
    };
    std::vector<Participant> participants = {make_participant(21, "5km")};
    auto grouping = group_participants_by_race(races, participants);
    ASSERT_EQ(grouping.groups.size(), 3u);
    EXPECT_EQ(grouping.groups[0].size(), 0u);
    EXPECT_EQ(grouping.groups[1].size(), 1u);
    EXPECT_EQ(grouping.groups[1].participants_begin, 0u);
    EXPECT_EQ(grouping.groups[2].size(), 0u);
    EXPECT_EQ(grouping.consumed, 1u);
    EXPECT_EQ(validate_participant_order(races, participants), std::nullopt);
}

// NOLINTNEXTLINE
TEST(group_participants_by_race, no_races) {
    auto grouping = group_participants_by_race({}, {});
    EXPECT_TRUE(grouping.groups.empty());
    EXPECT_EQ(grouping.consumed, 0u);
    EXPECT_EQ(validate_participant_order({}, {}), std::nullopt);
}

// NOLINTNEXTLINE
TEST(group_participants_by_race, similar_race_names) {
    std::vector<Race> races = {make_race(1, "5km", 10), make_race(2, "5mi", 10)};
    std::vector<Participant> participants = {
        make_participant(11, "5km"),
        make_participant(21, "5mi"),
        make_participant(22, "5mi"),
    };
    auto grouping = group_participants_by_race(races, participants);
    ASSERT_EQ(grouping.groups.size(), 2u);
    EXPECT_EQ(grouping.groups[0].size(), 1u);
    EXPECT_EQ(grouping.groups[1].size(), 2u);
    EXPECT_EQ(grouping.consumed, 3u);
}

// NOLINTNEXTLINE
TEST(group_participants_by_race, interleaved_participants_are_dropped) {
    std::vector<Race> races = {make_race(1, "A", 10), make_race(2, "B", 18)};
    std::vector<Participant> participants = {
        make_participant(1, "A"),
        make_participant(2, "B"),
        make_participant(3, "A"),
        make_participant(4, "B"),
    };
    auto grouping = group_participants_by_race(races, participants);
    ASSERT_EQ(grouping.groups.size(), 2u);
    EXPECT_EQ(grouping.groups[0].size(), 1u);
    EXPECT_EQ(grouping.groups[1].size(), 1u);
    EXPECT_EQ(grouping.groups[1].participants_begin, 1u);
    EXPECT_EQ(grouping.consumed, 2u);

    EXPECT_EQ(
        validate_participant_order(races, participants),
        "Participant 3 of race `A` appears after participants of race `B`"
    );
}

// NOLINTNEXTLINE
TEST(group_participants_by_race, participants_in_reversed_race_order) {
    std::vector<Race> races = {make_race(1, "A", 10), make_race(2, "B", 18)};
    std::vector<Participant> participants = {make_participant(1, "B"), make_participant(2, "A")};
    auto grouping = group_participants_by_race(races, participants);
    EXPECT_EQ(grouping.groups[0].size(), 0u);
    EXPECT_EQ(grouping.groups[1].size(), 1u);
    EXPECT_EQ(grouping.consumed, 1u);
    EXPECT_EQ(
        validate_participant_order(races, participants),
        "Participant 2 of race `A` appears after participants of race `B`"
    );
}

// NOLINTNEXTLINE
TEST(validate_participant_order, unknown_race) {
    std::vector<Race> races = {make_race(1, "A", 10)};
    std::vector<Participant> participants = {make_participant(1, "A"), make_participant(7, "Z")};
    EXPECT_EQ(
        validate_participant_order(races, participants),
        "Participant 7 belongs to race `Z` that is not loaded"
    );
    EXPECT_EQ(group_participants_by_race(races, participants).consumed, 1u);
}

// NOLINTNEXTLINE
TEST(validate_participant_order, duplicated_race_name) {
    std::vector<Race> races = {make_race(1, "A", 10), make_race(4, "A", 18)};
    EXPECT_EQ(validate_participant_order(races, {}), "Race name `A` is shared by races 1 and 4");
}
