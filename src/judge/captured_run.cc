#include <minijudge/errmsg.hh>
#include <minijudge/file_contents.hh>
#include <minijudge/file_descriptor.hh>
#include <minijudge/judge/captured_run.hh>
#include <minijudge/macros/throw.hh>
#include <sys/mman.h>
#include <sys/wait.h>

namespace minijudge::judge {

namespace {

FileDescriptor open_memfd(const char* name) {
    FileDescriptor fd{memfd_create(name, MFD_CLOEXEC)};
    if (not fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    return fd;
}

} // namespace

CapturedRun run_captured(
    const std::vector<std::string>& argv,
    std::string_view stdin_text,
    const std::string& working_dir,
    std::chrono::nanoseconds timeout
) {
    if (argv.empty()) {
        THROW("Cannot run an empty command");
    }

    auto stdin_fd = open_memfd("stdin");
    if (write_all(stdin_fd, stdin_text) != stdin_text.size()) {
        THROW("write()", errmsg());
    }
    if (lseek64(stdin_fd, 0, SEEK_SET) == static_cast<off64_t>(-1)) {
        THROW("lseek64()", errmsg());
    }

    auto stdout_fd = open_memfd("stdout");
    auto stderr_fd = open_memfd("stderr");

    auto es = Spawner::run(
        argv[0],
        argv,
        {
            .new_stdin_fd = stdin_fd,
            .new_stdout_fd = stdout_fd,
            .new_stderr_fd = stderr_fd,
            .real_time_limit = timeout,
            .working_dir = working_dir,
        }
    );

    std::optional<int> exit_code;
    if (not es.timed_out) {
        exit_code = (es.si.code == CLD_EXITED ? es.si.status : 128 + es.si.status);
    }

    return {
        .exit_stat = std::move(es),
        .stdout_text = get_file_contents(stdout_fd, 0),
        .stderr_text = get_file_contents(stderr_fd, 0),
        .exit_code = exit_code,
    };
}

} // namespace minijudge::judge
