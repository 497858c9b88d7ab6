#include <cstdio>
#include <gtest/gtest.h>
#include <memory>
#include <reglib/logger.hh>
#include <reglib/time.hh>
#include <string>

namespace {

std::string read_all(FILE* f) {
    rewind(f);
    std::string res;
    char buff[256];
    size_t len = 0;
    while ((len = fread(buff, 1, sizeof(buff), f)) > 0) {
        res.append(buff, len);
    }
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(Logger, unlabelled_lines) {
    std::unique_ptr<FILE, int (*)(FILE*)> f = {tmpfile(), fclose};
    ASSERT_TRUE(f);
    Logger logger{f.get()};
    logger.label(false);
    logger("No competition for id ", 7, " found");
    logger << "race " << '5' << "km";
    {
        auto appender = logger("a");
        appender("b", 'c');
        appender << 1;
    }
    EXPECT_EQ(read_all(f.get()), "No competition for id 7 found\nrace 5km\nabc1\n");
}

// NOLINTNEXTLINE
TEST(Logger, labelled_line) {
    std::unique_ptr<FILE, int (*)(FILE*)> f = {tmpfile(), fclose};
    ASSERT_TRUE(f);
    Logger logger{f.get()};
    EXPECT_TRUE(logger.label());
    logger("message");
    auto logged = read_all(f.get());
    // "[ YYYY-mm-dd HH:MM:SS ] message\n"
    ASSERT_EQ(logged.size(), 32u);
    EXPECT_EQ(logged.substr(0, 2), "[ ");
    EXPECT_TRUE(is_datetime(logged.substr(2, 19)));
    EXPECT_EQ(logged.substr(21), " ] message\n");
}

// NOLINTNEXTLINE
TEST(Logger, dummy_logger) {
    Logger logger{static_cast<FILE*>(nullptr)};
    logger("ignored");
    SUCCEED();
}
