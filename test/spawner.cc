#include <chrono>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <minijudge/errmsg.hh>
#include <minijudge/file_contents.hh>
#include <minijudge/file_descriptor.hh>
#include <minijudge/spawner.hh>
#include <minijudge/temporary_directory.hh>
#include <sys/mman.h>
#include <sys/wait.h>

using std::string;
using ::testing::HasSubstr;
using namespace std::chrono_literals;

namespace {

FileDescriptor memfd(const char* name, std::string_view contents = {}) {
    FileDescriptor fd{memfd_create(name, MFD_CLOEXEC)};
    if (not fd.is_open()) {
        ADD_FAILURE() << "memfd_create()" << errmsg().c_str();
        return fd;
    }
    EXPECT_EQ(write_all(fd, contents), contents.size());
    EXPECT_EQ(lseek64(fd, 0, SEEK_SET), 0);
    return fd;
}

} // namespace

// NOLINTNEXTLINE
TEST(spawner, clean_exit) {
    auto es = Spawner::run("true", {"true"});
    EXPECT_EQ(es.si.code, CLD_EXITED);
    EXPECT_EQ(es.si.status, 0);
    EXPECT_FALSE(es.timed_out);
    EXPECT_EQ(es.message, "");
}

// NOLINTNEXTLINE
TEST(spawner, non_zero_exit_status) {
    auto es = Spawner::run("sh", {"sh", "-c", "exit 3"});
    EXPECT_EQ(es.si.code, CLD_EXITED);
    EXPECT_EQ(es.si.status, 3);
    EXPECT_EQ(es.message, "exited with 3");
}

// NOLINTNEXTLINE
TEST(spawner, killed_by_signal) {
    auto es = Spawner::run("sh", {"sh", "-c", "kill -9 $$"});
    EXPECT_EQ(es.si.code, CLD_KILLED);
    EXPECT_EQ(es.si.status, SIGKILL);
    EXPECT_THAT(es.message, HasSubstr("killed by signal 9"));
}

// NOLINTNEXTLINE
TEST(spawner, real_time_limit) {
    auto es = Spawner::run("sleep", {"sleep", "10"}, {.real_time_limit = 200ms});
    EXPECT_TRUE(es.timed_out);
    EXPECT_EQ(es.runtime, 200ms);
    EXPECT_EQ(es.si.code, CLD_KILLED);
    EXPECT_EQ(es.si.status, SIGKILL);
}

// NOLINTNEXTLINE
TEST(spawner, descendants_are_killed_on_timeout) {
    auto start = std::chrono::steady_clock::now();
    auto es = Spawner::run(
        "sh", {"sh", "-c", "sleep 10 & sleep 10; wait"}, {.real_time_limit = 200ms}
    );
    EXPECT_TRUE(es.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

// NOLINTNEXTLINE
TEST(spawner, exit_before_the_limit) {
    auto es = Spawner::run("true", {"true"}, {.real_time_limit = 5s});
    EXPECT_FALSE(es.timed_out);
    EXPECT_LT(es.runtime, 5s);
    EXPECT_EQ(es.si.status, 0);
}

// NOLINTNEXTLINE
TEST(spawner, redirections) {
    auto stdin_fd = memfd("stdin", "some input\n");
    auto stdout_fd = memfd("stdout");
    auto stderr_fd = memfd("stderr");
    auto es = Spawner::run(
        "sh",
        {"sh", "-c", "cat; echo err >&2"},
        {
            .new_stdin_fd = stdin_fd,
            .new_stdout_fd = stdout_fd,
            .new_stderr_fd = stderr_fd,
        }
    );
    EXPECT_EQ(es.si.status, 0);
    EXPECT_EQ(get_file_contents(stdout_fd, 0), "some input\n");
    EXPECT_EQ(get_file_contents(stderr_fd, 0), "err\n");
}

// NOLINTNEXTLINE
TEST(spawner, working_dir) {
    TemporaryDirectory tmp_dir("/tmp/spawner-test.XXXXXX");
    auto stdout_fd = memfd("stdout");
    auto es = Spawner::run(
        "pwd", {"pwd"}, {.new_stdout_fd = stdout_fd, .working_dir = tmp_dir.path()}
    );
    EXPECT_EQ(es.si.status, 0);
    // path() ends with '/', pwd prints no trailing slash
    auto expected = tmp_dir.path();
    expected.back() = '\n';
    EXPECT_EQ(get_file_contents(stdout_fd, 0), expected);
}

// NOLINTNEXTLINE
TEST(spawner, errors) {
    EXPECT_THROW(
        Spawner::run("/nonexistent/program", {"/nonexistent/program"}), std::runtime_error
    );
    EXPECT_THROW(
        Spawner::run("true", {"true"}, {.working_dir = "/nonexistent/dir"}), std::runtime_error
    );
    EXPECT_THROW(Spawner::run("true", {"true"}, {.real_time_limit = 0ns}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(spawner, sigxcpu_is_timeout) {
    auto es = Spawner::run("sh", {"sh", "-c", "kill -XCPU $$"}, {.real_time_limit = 5s});
    EXPECT_TRUE(es.timed_out);
    EXPECT_EQ(es.runtime, 5s);
    EXPECT_NE(es.si.code, CLD_EXITED);
    EXPECT_EQ(es.si.status, SIGXCPU);

    // Without a limit it is an ordinary signal
    es = Spawner::run("sh", {"sh", "-c", "kill -XCPU $$"});
    EXPECT_FALSE(es.timed_out);
    EXPECT_EQ(es.si.status, SIGXCPU);
}
