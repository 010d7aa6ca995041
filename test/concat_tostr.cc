#include <cerrno>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <minijudge/concat_tostr.hh>
#include <minijudge/errmsg.hh>
#include <minijudge/file_path.hh>
#include <minijudge/macros/throw.hh>

using std::string;
using ::testing::HasSubstr;
using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(concat_tostr, mixed_arguments) {
    string str = "abc";
    std::string_view sv = "def";
    EXPECT_EQ(concat_tostr(), "");
    EXPECT_EQ(
        concat_tostr("x", str, sv, '-', 42, -7, 18446744073709551615ULL),
        "xabcdef-42-718446744073709551615"
    );
    EXPECT_EQ(concat_tostr(FilePath{str}, '/'), "abc/");
}

// NOLINTNEXTLINE
TEST(concat_tostr, back_insert) {
    string str = "line";
    back_insert(str, ' ', 1, ": ", "ok");
    EXPECT_EQ(str, "line 1: ok");
}

// NOLINTNEXTLINE
TEST(errmsg, format) {
    EXPECT_EQ(string{errmsg(ENOENT)}, " - No such file or directory (os error 2)");
    errno = EACCES;
    EXPECT_EQ(concat_tostr("open()", errmsg()), "open() - Permission denied (os error 13)");
}

// NOLINTNEXTLINE
TEST(throw_macro, message_has_origin) {
    try {
        THROW("value: ", 7);
        FAIL() << "THROW did not throw";
    } catch (const std::runtime_error& e) {
        EXPECT_THAT(
            e.what(), MatchesRegex("value: 7 \\(thrown at .*concat_tostr\\.cc:[0-9]+\\)")
        );
    }
}
