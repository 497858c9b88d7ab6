#include <gtest/gtest.h>
#include <reglib/concat_tostr.hh>
#include <reglib/macros/throw.hh>
#include <reglib/throw_assert.hh>
#include <stdexcept>

// NOLINTNEXTLINE
TEST(throw_assert, throw_assert) {
    constexpr int var = 123;
    try {
        throw_assert(var == 123);
        throw_assert(var % 3 != 0);
        ADD_FAILURE();
    } catch (const std::runtime_error& e) {
        constexpr auto line = __LINE__;
        EXPECT_EQ(
            e.what(),
            concat_tostr(
                __FILE__,
                ':',
                line - 3,
                ": ",
                __PRETTY_FUNCTION__,
                ": Assertion `var % 3 != 0` failed."
            )
        );
    } catch (...) {
        ADD_FAILURE();
    }
}

// NOLINTNEXTLINE
TEST(throw_macro, includes_origin) {
    try {
        THROW("competition ", 42, " is broken");
        ADD_FAILURE();
    } catch (const std::runtime_error& e) {
        constexpr auto line = __LINE__;
        EXPECT_EQ(
            e.what(),
            concat_tostr("competition 42 is broken (thrown at ", __FILE__, ':', line - 3, ')')
        );
    } catch (...) {
        ADD_FAILURE();
    }
}
