#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <climits>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <memory>
#include <minijudge/call_in_destructor.hh>
#include <minijudge/errmsg.hh>
#include <minijudge/file_descriptor.hh>
#include <minijudge/macros/throw.hh>
#include <minijudge/overloaded.hh>
#include <minijudge/spawner.hh>
#include <minijudge/string_transform.hh>
#include <minijudge/syscalls.hh>
#include <minijudge/time.hh>
#include <sys/wait.h>

using std::array;
using std::string;
using std::vector;

void Spawner::send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept {
    (void)write_all(fd, str);
    auto err = errmsg(errnum);
    (void)write_all(fd, err);
    _exit(-1);
}

string Spawner::receive_error_message(const siginfo_t& si, int fd) {
    string message;
    array<char, 4096> buff{};
    // Read errors from fd
    ssize_t rc = 0;
    while ((rc = read(fd, buff.data(), buff.size())) > 0) {
        message.append(buff.data(), rc);
    }

    if (!message.empty()) { // Error in child
        THROW(message);
    }

    switch (si.si_code) {
    case CLD_EXITED: message = concat_tostr("exited with ", si.si_status); break;
    case CLD_KILLED:
        message = concat_tostr("killed by signal ", si.si_status, " - ", strsignal(si.si_status));
        break;
    case CLD_DUMPED:
        message = concat_tostr(
            "killed and dumped by signal ", si.si_status, " - ", strsignal(si.si_status)
        );
        break;
    default: THROW("Invalid siginfo_t.si_code: ", si.si_code);
    }

    return message;
}

timespec Spawner::Timer::delete_timer_and_get_remaining_time() noexcept {
    return std::visit(
        overloaded{
            [](const WithoutTimeout& /*unused*/) { return timespec{0, 0}; },
            [&](WithTimeout& state) {
                if (not state.timer_is_active) {
                    return timespec{0, 0};
                }
                state.timer_is_active = false;
                // Disarm timer and check if it has expired
                itimerspec new_its{{0, 0}, {0, 0}};
                itimerspec old_its{};
                int rc = timer_settime(state.timer_id, 0, &new_its, &old_its);
                assert(rc == 0);
                if (old_its.it_value == timespec{0, 0}) {
                    // Timer has already expired => the signal handler was / is
                    // about to run => wait for it
                    while (not state.signal_handler_context.timeout_signal_was_sent) {
                        pause();
                    }
                }

                rc = timer_delete(state.timer_id);
                assert(rc == 0);
                (void)rc;
                return old_its.it_value;
            }},
        state_
    );
}

Spawner::Timer::Timer(pid_t kill_target, std::chrono::nanoseconds time_limit)
: state_([&]() -> decltype(state_) {
    if (time_limit < std::chrono::nanoseconds::zero()) {
        THROW("time_limit has to be non-negative");
    }
    if (time_limit == std::chrono::nanoseconds::zero()) {
        timespec curr_clock_time{};
        if (clock_gettime(CLOCK_MONOTONIC, &curr_clock_time)) {
            THROW("clock_gettime()", errmsg());
        }
        return WithoutTimeout{curr_clock_time};
    }

    return WithTimeout{to_timespec(time_limit), {}, false, {kill_target, false}};
}()) {
    if (std::holds_alternative<WithoutTimeout>(state_)) {
        return; // Nothing more to do
    }

    auto& state = std::get<WithTimeout>(state_);
    static constexpr auto timeout_handler = [](int /*unused*/,
                                               siginfo_t* si,
                                               void* /*unused*/) noexcept {
        if (si->si_code != SI_TIMER) {
            return; // Ignore other signals
        }

        int errnum = errno;
        auto& context = *static_cast<SignalHandlerContext*>(si->si_value.sival_ptr);
        (void)kill(context.kill_target, SIGKILL); // signal safe
        context.timeout_signal_was_sent = true;
        errno = errnum;
    };

    // Install timeout signal handler
    struct sigaction sa = {};
    sa.sa_flags = SA_SIGINFO | SA_RESTART;
    sa.sa_sigaction = timeout_handler;
    if (sigaction(SIGRTMIN, &sa, nullptr)) {
        THROW("sigaction()", errmsg());
    }

    // Prepare timer, the signal is delivered to this thread only
    sigevent sev{};
    sev.sigev_notify = SIGEV_THREAD_ID;
    sev._sigev_un._tid = syscalls::gettid(); // sigev_notify_thread_id
    sev.sigev_signo = SIGRTMIN;
    sev.sigev_value.sival_ptr = &state.signal_handler_context;
    if (timer_create(CLOCK_MONOTONIC, &sev, &state.timer_id)) {
        THROW("timer_create()", errmsg());
    }

    state.timer_is_active = true;

    // Arm timer
    itimerspec its{{0, 0}, state.time_limit};
    if (timer_settime(state.timer_id, 0, &its, nullptr)) {
        int errnum = errno;
        (void)delete_timer_and_get_remaining_time();
        THROW("timer_settime()", errmsg(errnum));
    }
}

std::chrono::nanoseconds Spawner::Timer::deactivate_and_get_runtime() noexcept {
    return std::visit(
        overloaded{
            [&](const WithoutTimeout& state) {
                timespec curr_clock_time{};
                (void)clock_gettime(CLOCK_MONOTONIC, &curr_clock_time);
                return to_nanoseconds(curr_clock_time - state.start_clock_time);
            },
            [&](WithTimeout& state) {
                return to_nanoseconds(state.time_limit - delete_timer_and_get_remaining_time());
            }},
        state_
    );
}

bool Spawner::Timer::timeout_signal_was_sent() const noexcept {
    return std::visit(
        overloaded{
            [&](const WithoutTimeout& /*unused*/) { return false; },
            [&](const WithTimeout& state) -> bool {
                return state.signal_handler_context.timeout_signal_was_sent;
            }},
        state_
    );
}

Spawner::ExitStat
Spawner::run(FilePath exec, const vector<string>& exec_args, const Spawner::Options& opts) {
    using std::chrono_literals::operator""ns;

    if (opts.real_time_limit.has_value() and opts.real_time_limit.value() <= 0ns) {
        THROW("If set, real_time_limit has to be greater than 0");
    }

    // Error stream from child via pipe
    array<int, 2> pfd{};
    if (pipe2(pfd.data(), O_CLOEXEC) == -1) {
        THROW("pipe()", errmsg());
    }

    // CPU time is summed over all threads, so the limit has to allow every
    // online CPU to be busy until the wall-clock deadline
    rlim_t cpu_time_limit = RLIM_INFINITY;
    if (opts.real_time_limit.has_value()) {
        using std::chrono::duration_cast;
        using std::chrono::seconds;
        using std::chrono_literals::operator""ms;
        long cpus = std::max(sysconf(_SC_NPROCESSORS_ONLN), 1L);
        cpu_time_limit =
            duration_cast<seconds>(opts.real_time_limit.value() + 1500ms).count() * cpus;
    }

    int cpid = fork();
    if (cpid == -1) {
        int errnum = errno;
        (void)close(pfd[0]);
        (void)close(pfd[1]);
        THROW("fork()", errmsg(errnum));
    }
    if (cpid == 0) {
        (void)close(pfd[0]);
        run_child(exec, exec_args, opts, cpu_time_limit, pfd[1]);
    }

    (void)close(pfd[1]);
    FileDescriptor pipe0_closer(pfd[0]);

    // Wait for child to be ready
    siginfo_t si{};
    rusage ru{};
    if (syscalls::waitid(P_PID, cpid, &si, WSTOPPED | WEXITED, &ru) == -1) {
        THROW("waitid()", errmsg());
    }

    // If something went wrong
    if (si.si_code != CLD_STOPPED) {
        ExitStat es{.runtime = 0ns, .si = {si.si_code, si.si_status}, .rusage = ru};
        es.message = receive_error_message(si, pfd[0]);
        return es;
    }

    // Useful when exception is thrown
    CallInDtor kill_and_wait_child_guard([&] {
        (void)kill(-cpid, SIGKILL);
        (void)syscalls::waitid(P_PID, cpid, &si, WEXITED, nullptr);
    });

    Timer timer(-cpid, opts.real_time_limit.value_or(0ns));
    (void)kill(cpid, SIGCONT); // There is only one process now, so '-' is not needed

    // Wait for death of the child
    (void)syscalls::waitid(P_PID, cpid, &si, WEXITED | WNOWAIT, nullptr);

    auto runtime = timer.deactivate_and_get_runtime();
    bool timed_out = timer.timeout_signal_was_sent();

    // Descendants may still be alive, the group id is valid until the leader
    // is reaped
    (void)kill(-cpid, SIGKILL);
    kill_and_wait_child_guard.cancel();
    if (syscalls::waitid(P_PID, cpid, &si, WEXITED, &ru) == -1) {
        THROW("waitid()", errmsg());
    }

    // RLIMIT_CPU is a backstop for the wall-clock limit, so hitting it is a
    // timeout as well
    if (opts.real_time_limit.has_value() and si.si_code != CLD_EXITED and
        si.si_status == SIGXCPU)
    {
        timed_out = true;
        runtime = opts.real_time_limit.value();
    }

    ExitStat es{
        .runtime = runtime,
        .si = {si.si_code, si.si_status},
        .rusage = ru,
        .timed_out = timed_out,
    };
    if (si.si_code != CLD_EXITED or si.si_status != 0) {
        es.message = receive_error_message(si, pfd[0]);
    }
    return es;
}

void Spawner::run_child(
    FilePath exec,
    const std::vector<std::string>& exec_args,
    const Options& opts,
    rlim_t cpu_time_limit,
    int fd
) noexcept {
    // Sends error to parent
    auto send_error_and_exit = [fd](int errnum, std::string_view str) {
        send_error_message_and_exit(fd, errnum, str);
    };

    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        send_error_and_exit(errno, "setpgid()");
    }

    // Convert exec_args
    const size_t len = exec_args.size();
    std::unique_ptr<const char*[]> args(new (std::nothrow) const char*[len + 1]);
    if (not args) {
        send_error_message_and_exit(fd, "Out of memory");
    }

    args[len] = nullptr;
    for (size_t i = 0; i < len; ++i) {
        args[i] = exec_args[i].c_str();
    }

    // Change working directory
    if (opts.working_dir != "" and opts.working_dir != "." and opts.working_dir != "./") {
        if (chdir(opts.working_dir.c_str()) == -1) {
            send_error_and_exit(errno, "chdir()");
        }
    }

    // Limit below is useful when spawned process becomes orphaned
    if (cpu_time_limit != RLIM_INFINITY) {
        rlimit limit{};
        limit.rlim_cur = limit.rlim_max = cpu_time_limit;
        if (setrlimit(RLIMIT_CPU, &limit)) {
            send_error_and_exit(errno, "setrlimit(RLIMIT_CPU)");
        }
    }

    auto redirect = [&](int new_fd, int std_fd) {
        if (new_fd < 0) {
            (void)close(std_fd);
        } else if (new_fd != std_fd) {
            while (dup2(new_fd, std_fd) == -1) {
                if (errno != EINTR) {
                    send_error_and_exit(errno, "dup2()");
                }
            }
        }
    };
    redirect(opts.new_stdin_fd, STDIN_FILENO);
    redirect(opts.new_stdout_fd, STDOUT_FILENO);
    redirect(opts.new_stderr_fd, STDERR_FILENO);

    // Close file descriptors that are not needed to be open
    {
        DIR* dir = opendir("/proc/thread-self/fd");
        if (dir == nullptr) {
            send_error_and_exit(errno, "opendir()");
        }

        array permitted_fds = {
            dirfd(dir),
            fd, // Needed in case of errors (it has FD_CLOEXEC flag set)
            (opts.new_stdin_fd < 0 ? fd : STDIN_FILENO),
            (opts.new_stdout_fd < 0 ? fd : STDOUT_FILENO),
            (opts.new_stderr_fd < 0 ? fd : STDERR_FILENO),
        };

        errno = 0;
        while (dirent* file = readdir(dir)) {
            auto fd_no = str2num<int>(file->d_name);
            if (not fd_no) {
                continue; // "." or ".."
            }
            if (std::find(permitted_fds.begin(), permitted_fds.end(), *fd_no) ==
                permitted_fds.end())
            {
                (void)close(*fd_no);
            }
        }
        if (errno != 0) {
            send_error_and_exit(errno, "readdir()");
        }
        (void)closedir(dir);
    }

    // Signal parent process that child is ready to execute @p exec
    (void)kill(getpid(), SIGSTOP);

    execvp(exec, const_cast<char* const*>(args.get()));
    int errnum = errno;

    // execvp() failed
    std::array<char, PATH_MAX + 20> msg{};
    auto exec_sv = exec.to_string_view().substr(0, PATH_MAX);
    size_t pos = 0;
    for (std::string_view part : {std::string_view{"execvp('"}, exec_sv, std::string_view{"')"}}) {
        std::memcpy(msg.data() + pos, part.data(), part.size());
        pos += part.size();
    }
    send_error_and_exit(errnum, {msg.data(), pos});
    _exit(-1);
}
