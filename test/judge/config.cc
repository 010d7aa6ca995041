#include <chrono>
#include <limits>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <minijudge/config_file.hh>
#include <minijudge/file_contents.hh>
#include <minijudge/judge/config.hh>
#include <minijudge/temporary_directory.hh>

using minijudge::judge::ConfigError;
using minijudge::judge::load_config;
using minijudge::judge::load_config_from_string;
using std::string;
using ::testing::StartsWith;
using namespace std::chrono_literals;

namespace {

string config_error_of(string contents) {
    try {
        (void)load_config_from_string(std::move(contents));
    } catch (const ConfigError& e) {
        return e.what();
    }
    ADD_FAILURE() << "no ConfigError was thrown";
    return "";
}

} // namespace

// NOLINTNEXTLINE
TEST(judge_config, defaults) {
    auto config = load_config_from_string("# nothing is set\n");
    EXPECT_EQ(config.judge.timeout, 5s);
    EXPECT_EQ(config.judge.workspace_parent_dir, "/tmp");
    EXPECT_FALSE(config.judge.compile_once_per_batch);
    EXPECT_EQ(config.stdlog_file, std::nullopt);
    EXPECT_EQ(config.errlog_file, std::nullopt);
}

// NOLINTNEXTLINE
TEST(judge_config, all_values) {
    TemporaryDirectory tmp_dir("/tmp/judge-config-test.XXXXXX");
    auto config_path = tmp_dir.path() + "mini_judge.conf";
    put_file_contents(
        config_path,
        concat_tostr(
            "timeout_in_seconds: 2.5\n"
            "workspace_parent_dir: '",
            tmp_dir.path(),
            "'\n"
            "compile_once_per_batch: true\n"
            "stdlog_file: /var/log/mini_judge.log\n"
            "errlog_file: \"/var/log/mini_judge errors.log\"\n"
            "unknown_variable: is ignored\n"
        )
    );

    auto config = load_config(config_path);
    EXPECT_EQ(config.judge.timeout, 2500ms);
    EXPECT_EQ(config.judge.workspace_parent_dir, tmp_dir.path());
    EXPECT_TRUE(config.judge.compile_once_per_batch);
    EXPECT_EQ(config.stdlog_file, "/var/log/mini_judge.log");
    EXPECT_EQ(config.errlog_file, "/var/log/mini_judge errors.log");
}

// NOLINTNEXTLINE
TEST(judge_config, invalid_timeout) {
    for (const char* value : {"0", "-1", "abc", "''", "100000", "[1]"}) {
        EXPECT_THAT(
            config_error_of(concat_tostr("timeout_in_seconds: ", value)),
            StartsWith("timeout_in_seconds: ")
        ) << value;
    }
}

// NOLINTNEXTLINE
TEST(judge_config, invalid_values) {
    EXPECT_EQ(
        config_error_of("workspace_parent_dir = /nonexistent/dir"),
        "workspace_parent_dir: not a directory: `/nonexistent/dir`"
    );
    EXPECT_EQ(
        config_error_of("compile_once_per_batch = maybe"),
        "compile_once_per_batch: expected a boolean, got: `maybe`"
    );
    EXPECT_EQ(config_error_of("stdlog_file ="), "stdlog_file: expected a file path");
    EXPECT_EQ(config_error_of("errlog_file = [a, b]"), "errlog_file: expected a file path");
}

// NOLINTNEXTLINE
TEST(judge_config, syntax_error) {
    EXPECT_THROW(
        (void)load_config_from_string("timeout_in_seconds ? 3\n"), ConfigFile::ParseError
    );
}

// NOLINTNEXTLINE
TEST(judge_config, missing_file) {
    EXPECT_THROW((void)load_config("/nonexistent/mini_judge.conf"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(judge_config, timeout_from_seconds) {
    using minijudge::judge::MAX_TIMEOUT;
    using minijudge::judge::timeout_from_seconds;

    EXPECT_EQ(timeout_from_seconds(2), 2s);
    EXPECT_EQ(timeout_from_seconds(0.25), 250ms);
    EXPECT_EQ(timeout_from_seconds(1e-9), 1ns);
    EXPECT_EQ(timeout_from_seconds(24 * 60 * 60), MAX_TIMEOUT);

    // Truncates to 0ns
    EXPECT_EQ(timeout_from_seconds(1e-10), std::nullopt);
    EXPECT_EQ(timeout_from_seconds(0), std::nullopt);
    EXPECT_EQ(timeout_from_seconds(-1), std::nullopt);
    // Would overflow the nanosecond count
    EXPECT_EQ(timeout_from_seconds(1e30), std::nullopt);
    EXPECT_EQ(timeout_from_seconds(24 * 60 * 60 + 1), std::nullopt);
    EXPECT_EQ(timeout_from_seconds(std::numeric_limits<double>::infinity()), std::nullopt);
    EXPECT_EQ(timeout_from_seconds(std::numeric_limits<double>::quiet_NaN()), std::nullopt);
}

// NOLINTNEXTLINE
TEST(judge_config, timeout_limits) {
    EXPECT_EQ(load_config_from_string("timeout_in_seconds: 1e-9").judge.timeout, 1ns);
    EXPECT_EQ(load_config_from_string("timeout_in_seconds: 86400").judge.timeout, 24h);
    for (const char* value : {"1e-10", "1e30", "86401", "inf", "nan"}) {
        EXPECT_THAT(
            config_error_of(concat_tostr("timeout_in_seconds: ", value)),
            StartsWith("timeout_in_seconds: ")
        ) << value;
    }
}
