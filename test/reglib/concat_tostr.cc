#include <cstdint>
#include <gtest/gtest.h>
#include <reglib/concat_tostr.hh>
#include <string>
#include <string_view>

// NOLINTNEXTLINE
TEST(concat_tostr, mixed_arguments) {
    EXPECT_EQ(concat_tostr(), "");
    EXPECT_EQ(concat_tostr("abc"), "abc");
    EXPECT_EQ(concat_tostr("race ", 5, 'k', 'm'), "race 5km");
    EXPECT_EQ(concat_tostr(std::string{"x"}, std::string_view{"y"}, true, false), "xytruefalse");
    EXPECT_EQ(
        concat_tostr(-42, ' ', uint64_t{18'446'744'073'709'551'615u}), "-42 18446744073709551615"
    );
}

// NOLINTNEXTLINE
TEST(concat_tostr, back_insert) {
    std::string str = "id: ";
    back_insert(str, 7, ", name: ", std::string_view{"10km"});
    EXPECT_EQ(str, "id: 7, name: 10km");
    back_insert(str);
    EXPECT_EQ(str, "id: 7, name: 10km");
}

// NOLINTNEXTLINE
TEST(concat_tostr, is_string_argument) {
    static_assert(is_string_argument<const char*>);
    static_assert(is_string_argument<std::string&>);
    static_assert(is_string_argument<int>);
    static_assert(is_string_argument<char>);
    static_assert(!is_string_argument<double*>);
    SUCCEED();
}
