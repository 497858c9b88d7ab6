#include <gtest/gtest.h>
#include <reglib/config_file.hh>
#include <string>
#include <vector>

using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(ConfigFile, loads_only_declared_variables) {
    ConfigFile cf;
    cf.add_vars("host", "user", "password", "db");
    cf.load_config_from_string("# credentials\n"
                               "host: localhost\n"
                               "user = reglist   \n"
                               "password: 'it''s secret'  # comment\n"
                               "port: 3306\n"
                               "db: \"reg\\x6cist\\n\"\n");

    EXPECT_TRUE(cf["host"].is_set());
    EXPECT_EQ(cf["host"].as_string(), "localhost");
    EXPECT_EQ(cf["user"].as_string(), "reglist");
    EXPECT_EQ(cf["password"].as_string(), "it's secret");
    EXPECT_EQ(cf["db"].as_string(), "reglist\n");
    EXPECT_FALSE(cf["port"].is_set());
    EXPECT_EQ(cf.get_vars().size(), 4u);
}

// NOLINTNEXTLINE
TEST(ConfigFile, undeclared_variable_is_empty) {
    ConfigFile cf;
    const auto& var = cf["host"];
    EXPECT_FALSE(var.is_set());
    EXPECT_FALSE(var.is_array());
    EXPECT_EQ(var.as_string(), "");
    EXPECT_TRUE(var.as_array().empty());
    EXPECT_EQ(&cf.get_var("db"), &var);
}

// NOLINTNEXTLINE
TEST(ConfigFile, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("a: 1\nb: on\nc: -7\nd:\n", true);
    EXPECT_EQ(cf.get_vars().size(), 4u);
    EXPECT_EQ(cf["a"].as<int>(), 1);
    EXPECT_TRUE(cf["b"].as_bool());
    EXPECT_EQ(cf["c"].as<int>(), -7);
    EXPECT_EQ(cf["c"].as<unsigned>(), std::nullopt);
    EXPECT_TRUE(cf["d"].is_set());
    EXPECT_EQ(cf["d"].as_string(), "");
    EXPECT_FALSE(cf["e"].is_set());
}

// NOLINTNEXTLINE
TEST(ConfigFile, arrays) {
    ConfigFile cf;
    cf.add_vars("races", "empty");
    cf.load_config_from_string("races: [5km, '10km', \"half marathon\",\n"
                               "  # comment inside the array\n"
                               "  marathon\n"
                               "]\n"
                               "empty: []\n");
    EXPECT_TRUE(cf["races"].is_array());
    EXPECT_EQ(
        cf["races"].as_array(), (vector<string>{"5km", "10km", "half marathon", "marathon"})
    );
    EXPECT_TRUE(cf["empty"].is_array());
    EXPECT_TRUE(cf["empty"].as_array().empty());
}

// NOLINTNEXTLINE
TEST(ConfigFile, reloading_unsets_variables) {
    ConfigFile cf;
    cf.add_vars("host");
    cf.load_config_from_string("host: a\n");
    EXPECT_TRUE(cf["host"].is_set());
    cf.load_config_from_string("# nothing\n");
    EXPECT_FALSE(cf["host"].is_set());
}

namespace {

void expect_parse_error(
    const string& config, const string& expected_what, const string& expected_diagnostics
) {
    ConfigFile cf;
    try {
        cf.load_config_from_string(config);
        ADD_FAILURE() << "expected ParseError for: " << config;
    } catch (const ConfigFile::ParseError& pe) {
        EXPECT_EQ(pe.what(), expected_what);
        EXPECT_EQ(pe.diagnostics(), expected_diagnostics);
    }
}

} // namespace

// NOLINTNEXTLINE
TEST(ConfigFile, parse_errors) {
    expect_parse_error("a: 1\nb 2\n", "line 2:3: Invalid assignment operator: `2`", "b 2\n  ^");
    expect_parse_error(
        "a: 'abc\n", "line 1:8: Missing terminating ' character", "a: 'abc\n       ^"
    );
    expect_parse_error("= 1\n", "line 1:1: Invalid or missing variable's name", "= 1\n^");
    expect_parse_error("abc\n", "line 1:4: Incomplete directive: `abc`", "abc\n   ^");
    expect_parse_error(
        "a: \"\\q\"\n", "line 1:6: Unknown escape sequence: `\\q`", "a: \"\\q\"\n     ^"
    );
    // The error is reported at the end of the input
    expect_parse_error(
        "a: [x, y\n", "line 2:1: Missing terminating ] character at the end of an array", "\n^"
    );
    expect_parse_error(
        "a: 'x' y\n", "line 1:8: Unexpected character after the value: `y`", "a: 'x' y\n       ^"
    );
}

// NOLINTNEXTLINE
TEST(ConfigFile, missing_file) {
    ConfigFile cf;
    EXPECT_THROW(
        cf.load_config_from_file("/nonexistent/reglist/.db.config"), std::runtime_error
    );
}
