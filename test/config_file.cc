#include <gtest/gtest.h>
#include <minijudge/config_file.hh>
#include <minijudge/file_contents.hh>
#include <minijudge/temporary_directory.hh>

using std::string;
using std::vector;

namespace {

constexpr const char* SAMPLE_CONFIG = R"===(# Sample configuration
a = foo bar  # trailing comment
b: 'it''s'
c = "x\ty\x41"
d = [1, 'two', "three"]
e = [
  x,   # comment inside an array
  y
]
f =
n = 42
flag = On
)===";

ConfigFile::ParseError parse_error_of(string config) {
    ConfigFile cf;
    try {
        cf.load_config_from_string(std::move(config), true);
    } catch (const ConfigFile::ParseError& pe) {
        return pe;
    }
    ADD_FAILURE() << "no ParseError was thrown";
    return ConfigFile::ParseError(0, 0, "none");
}

} // namespace

// NOLINTNEXTLINE
TEST(config_file, load_all_variables) {
    ConfigFile cf;
    cf.load_config_from_string(SAMPLE_CONFIG, true);
    EXPECT_EQ(cf.get_vars().size(), 8U);

    EXPECT_TRUE(cf["a"].is_set());
    EXPECT_FALSE(cf["a"].is_array());
    EXPECT_EQ(cf["a"].as_string(), "foo bar");
    EXPECT_EQ(cf["b"].as_string(), "it's");
    EXPECT_EQ(cf["c"].as_string(), "x\tyA");

    EXPECT_TRUE(cf["d"].is_array());
    EXPECT_EQ(cf["d"].as_array(), (vector<string>{"1", "two", "three"}));
    EXPECT_EQ(cf["d"].as_string(), "");
    EXPECT_EQ(cf["e"].as_array(), (vector<string>{"x", "y"}));

    EXPECT_TRUE(cf["f"].is_set());
    EXPECT_EQ(cf["f"].as_string(), "");

    EXPECT_EQ(cf["n"].as<int>(), 42);
    EXPECT_FALSE(cf["n"].is_bool());
    EXPECT_TRUE(cf["flag"].is_bool());
    EXPECT_TRUE(cf["flag"].as_bool());
    EXPECT_EQ(cf["a"].as<int>(), std::nullopt);

    EXPECT_FALSE(cf["missing"].is_set());
    EXPECT_EQ(cf["missing"].as_string(), "");
}

// NOLINTNEXTLINE
TEST(config_file, load_only_added_variables) {
    ConfigFile cf;
    cf.add_vars("a", "n", "unused");
    cf.load_config_from_string(SAMPLE_CONFIG);

    EXPECT_EQ(cf.get_vars().size(), 3U);
    EXPECT_EQ(cf["a"].as_string(), "foo bar");
    EXPECT_EQ(cf["n"].as<unsigned>(), 42U);
    EXPECT_FALSE(cf["unused"].is_set());
    EXPECT_FALSE(cf["b"].is_set());
}

// NOLINTNEXTLINE
TEST(config_file, reloading_unsets_previous_values) {
    ConfigFile cf;
    cf.add_vars("x", "y");
    cf.load_config_from_string("x = 1\ny = [a]\n");
    EXPECT_TRUE(cf["x"].is_set());
    EXPECT_TRUE(cf["y"].is_array());

    cf.load_config_from_string("y = b");
    EXPECT_FALSE(cf["x"].is_set());
    EXPECT_FALSE(cf["y"].is_array());
    EXPECT_EQ(cf["y"].as_string(), "b");
}

// NOLINTNEXTLINE
TEST(config_file, load_config_from_file) {
    TemporaryDirectory tmp_dir("/tmp/config-file-test.XXXXXX");
    auto path = concat_tostr(tmp_dir.path(), "test.conf");
    put_file_contents(path, "timeout: 2.5\n");

    ConfigFile cf;
    cf.add_vars("timeout");
    cf.load_config_from_file(path);
    EXPECT_EQ(cf["timeout"].as<double>(), 2.5);

    auto missing_path = concat_tostr(tmp_dir.path(), "missing.conf");
    EXPECT_THROW(cf.load_config_from_file(missing_path), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(config_file, invalid_assignment_operator) {
    auto pe = parse_error_of("a = 1\nb ? 2\n");
    EXPECT_STREQ(pe.what(), "line 2:3: Invalid assignment operator: `?`");
    EXPECT_EQ(pe.diagnostics(), "b ? 2\n  ^");
}

// NOLINTNEXTLINE
TEST(config_file, missing_terminating_quote) {
    auto pe = parse_error_of("a = 'abc");
    EXPECT_STREQ(pe.what(), "line 1:9: Missing terminating ' character");
    EXPECT_EQ(pe.diagnostics(), "a = 'abc\n        ^");

    pe = parse_error_of("a = \"abc");
    EXPECT_STREQ(pe.what(), "line 1:9: Missing terminating \" character");
}

// NOLINTNEXTLINE
TEST(config_file, other_parse_errors) {
    EXPECT_STREQ(parse_error_of("a\n").what(), "line 1:2: Incomplete directive: `a`");
    EXPECT_STREQ(parse_error_of("= 1\n").what(), "line 1:1: Invalid or missing variable's name");
    EXPECT_STREQ(
        parse_error_of("a = \"\\q\"\n").what(), "line 1:7: Unknown escape sequence: `\\q`"
    );
    EXPECT_STREQ(
        parse_error_of("a = [x y z\n").what(),
        "line 2:1: Missing terminating ] character at the end of an array"
    );
    EXPECT_STREQ(
        parse_error_of("a = 'x' y\n").what(), "line 1:9: Unknown sequence after the value: `y`"
    );
}
