#include <gtest/gtest.h>
#include <minijudge/judge/language_profile.hh>

using minijudge::judge::CommandPlaceholders;
using minijudge::judge::expand_command;
using minijudge::judge::resolve;
using minijudge::judge::supported_language_ids;
using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(language_profile, supported_language_ids) {
    EXPECT_EQ(supported_language_ids(), (vector<string>{"c", "cpp", "java", "python"}));
}

// NOLINTNEXTLINE
TEST(language_profile, resolve_known_languages) {
    for (const auto& id : supported_language_ids()) {
        auto res = resolve(id);
        ASSERT_TRUE(res.is_ok()) << id;
        EXPECT_EQ(std::move(res).unwrap()->id, id);
    }

    auto python = resolve("python");
    ASSERT_TRUE(python.is_ok());
    const auto* profile = std::move(python).unwrap();
    EXPECT_FALSE(profile->requires_compile());
    EXPECT_EQ(profile->source_filename(), "code.py");
    EXPECT_EQ(profile->run_command, (vector<string>{"python3", "{source}"}));

    auto cpp = resolve("cpp");
    ASSERT_TRUE(cpp.is_ok());
    profile = std::move(cpp).unwrap();
    EXPECT_TRUE(profile->requires_compile());
    EXPECT_EQ(profile->source_filename(), "code.cpp");
    EXPECT_EQ(profile->artifact_filename, "program");

    auto java = resolve("java");
    ASSERT_TRUE(java.is_ok());
    profile = std::move(java).unwrap();
    EXPECT_TRUE(profile->requires_compile());
    EXPECT_EQ(profile->source_filename(), "Main.java");
    EXPECT_EQ(profile->artifact_filename, std::nullopt);
    EXPECT_EQ(profile->run_command, (vector<string>{"java", "{class}"}));
}

// NOLINTNEXTLINE
TEST(language_profile, resolve_returns_the_same_profile) {
    auto a = resolve("c");
    auto b = resolve("c");
    ASSERT_TRUE(a.is_ok() and b.is_ok());
    EXPECT_EQ(std::move(a).unwrap(), std::move(b).unwrap());
}

// NOLINTNEXTLINE
TEST(language_profile, unsupported_language) {
    for (const char* id : {"rust", "", "Python", "c++"}) {
        auto res = resolve(id);
        ASSERT_TRUE(res.is_err()) << id;
        auto err = std::move(res).unwrap_err();
        EXPECT_EQ(err.language_id, id);
        EXPECT_EQ(err.supported_ids, supported_language_ids());
        EXPECT_EQ(
            err.description(),
            string{"Unsupported language: "} + id + ". Supported: c, cpp, java, python"
        );
    }
}

// NOLINTNEXTLINE
TEST(language_profile, expand_command) {
    CommandPlaceholders values{
        .source = "/tmp/ws/code.c",
        .artifact = "/tmp/ws/program",
        .class_name = "Main",
    };
    EXPECT_EQ(
        expand_command({"gcc", "-o", "{artifact}", "{source}"}, values),
        (vector<string>{"gcc", "-o", "/tmp/ws/program", "/tmp/ws/code.c"})
    );
    EXPECT_EQ(
        expand_command({"java", "-cp", ".", "{class}"}, values),
        (vector<string>{"java", "-cp", ".", "Main"})
    );
    EXPECT_EQ(
        expand_command({"--in={source},{source}", "{unknown}", "{", ""}, values),
        (vector<string>{"--in=/tmp/ws/code.c,/tmp/ws/code.c", "{unknown}", "{", ""})
    );
    EXPECT_EQ(expand_command({}, values), vector<string>{});
}
