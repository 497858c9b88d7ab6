#include <gtest/gtest.h>
#include <reglib/time.hh>

// NOLINTNEXTLINE
TEST(time, is_date) {
    EXPECT_TRUE(is_date("2024-05-01"));
    EXPECT_TRUE(is_date("2024-02-29"));
    EXPECT_TRUE(is_date("2000-02-29"));
    EXPECT_FALSE(is_date("1900-02-29"));
    EXPECT_FALSE(is_date("2023-02-29"));
    EXPECT_FALSE(is_date("2024-04-31"));
    EXPECT_FALSE(is_date("2024-13-01"));
    EXPECT_FALSE(is_date("2024-00-10"));
    EXPECT_FALSE(is_date("2024-01-00"));
    EXPECT_FALSE(is_date("2024-1-01"));
    EXPECT_FALSE(is_date("2024/01/01"));
    EXPECT_FALSE(is_date("2024-01-01 "));
    EXPECT_FALSE(is_date(""));
}

// NOLINTNEXTLINE
TEST(time, is_datetime) {
    EXPECT_TRUE(is_datetime("2024-05-01 10:00:00"));
    EXPECT_TRUE(is_datetime("2024-12-31 23:59:59"));
    EXPECT_FALSE(is_datetime("2024-12-31 24:00:00"));
    EXPECT_FALSE(is_datetime("2024-12-31 23:60:00"));
    EXPECT_FALSE(is_datetime("2024-12-31 23:00:60"));
    EXPECT_FALSE(is_datetime("2024-12-31T23:00:00"));
    EXPECT_FALSE(is_datetime("2024-02-30 10:00:00"));
    EXPECT_FALSE(is_datetime("2024-05-01 10:00"));
    EXPECT_FALSE(is_datetime("2024-05-01"));
}

// NOLINTNEXTLINE
TEST(time, localdate) {
    EXPECT_EQ(localdate("%Y", 0).size(), 4u);
    EXPECT_TRUE(is_datetime(mysql_localdate()));
    EXPECT_TRUE(is_datetime(mysql_localdate(1'717'343'210)));
}
