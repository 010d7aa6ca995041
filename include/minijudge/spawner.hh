#pragma once

#include <chrono>
#include <csignal>
#include <ctime>
#include <functional>
#include <minijudge/file_contents.hh>
#include <minijudge/file_path.hh>
#include <optional>
#include <string>
#include <string_view>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>
#include <variant>
#include <vector>

class Spawner {
public:
    struct ExitStat {
        std::chrono::nanoseconds runtime{0};

        struct {
            int code; // si_code field from siginfo_t from waitid(2)
            int status; // si_status field from siginfo_t from waitid(2)
        } si{};

        struct rusage rusage = {}; // resource information
        bool timed_out = false; // true if the process group was killed on timeout
        std::string message;
    };

    struct Options {
        int new_stdin_fd = STDIN_FILENO; // negative - close, STDIN_FILENO - do not change
        int new_stdout_fd = STDOUT_FILENO; // negative - close, STDOUT_FILENO - do not change
        int new_stderr_fd = STDERR_FILENO; // negative - close, STDERR_FILENO - do not change
        std::optional<std::chrono::nanoseconds> real_time_limit = std::nullopt;
        std::string working_dir = "."; // directory at which program will be run
    };

    /**
     * @brief Runs @p exec with arguments @p exec_args and limits
     * @details @p exec is called via execvp(). The child is a leader of a new
     *   process group. On timeout and after the child exits the whole process
     *   group is killed with SIGKILL, so no descendants outlive the call.
     *   RLIMIT_CPU is set to (real time limit + 1.5s) rounded down and
     *   multiplied by the number of online CPUs, so an orphaned process dies
     *   eventually. Death by SIGXCPU is reported as a timeout.
     *   IMPORTANT: To function properly this function uses internally signal
     *     SIGRTMIN and installs handler for it. So be aware that using this
     *     signal while this function runs (in any thread) is not safe.
     *
     * @param exec path to file will be executed
     * @param exec_args arguments passed to exec (including argv[0])
     * @param opts options (see Options)
     *
     * @return Returns ExitStat structure with fields:
     *   - runtime: wall clock time of the run, equal to the real time limit if
     *       the time limit was exceeded
     *   - si: {
     *       code: si_code form siginfo_t from waitid(2)
     *       status: si_status form siginfo_t from waitid(2)
     *     }
     *   - rusage: resource used (see getrusage(2)).
     *   - timed_out: whether the real time limit was exceeded
     *   - message: description of the process death if it was not a clean exit
     *
     * @errors Throws an exception std::runtime_error with appropriate
     *   information if any syscall fails or @p exec cannot be executed
     */
    static ExitStat
    run(FilePath exec, const std::vector<std::string>& exec_args, const Options& opts);

    static ExitStat run(FilePath exec, const std::vector<std::string>& exec_args) {
        return run(exec, exec_args, Options{});
    }

private:
    // Sends @p str through @p fd and _exits with -1
    static void send_error_message_and_exit(int fd, std::string_view str) noexcept {
        (void)write_all(fd, str);
        _exit(-1);
    }

    // Sends @p str followed by error message of @p errnum through @p fd and
    // _exits with -1
    static void send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept;

    /**
     * @brief Receives error message from @p fd
     * @details Reads everything the child wrote using
     *   send_error_message_and_exit(), if anything was written it is thrown as
     *   std::runtime_error
     *
     * @param si sig_info from waitid(2)
     * @param fd file descriptor to read from
     *
     * @return description of the child's death
     */
    static std::string receive_error_message(const siginfo_t& si, int fd);

    // Initializes child process which will execute @p exec, this function does
    // not return. Errors are written to @p fd.
    [[noreturn]] static void run_child(
        FilePath exec,
        const std::vector<std::string>& exec_args,
        const Options& opts,
        rlim_t cpu_time_limit,
        int fd
    ) noexcept;

    class Timer {
        struct SignalHandlerContext {
            const pid_t kill_target;
            volatile std::sig_atomic_t timeout_signal_was_sent;
        };

        struct WithTimeout {
            const timespec time_limit;
            timer_t timer_id;
            bool timer_is_active;
            SignalHandlerContext signal_handler_context;
        };

        struct WithoutTimeout {
            const timespec start_clock_time;
        };

        std::variant<WithTimeout, WithoutTimeout> state_;

        timespec delete_timer_and_get_remaining_time() noexcept;

    public:
        /**
         * @param kill_target argument for kill(2) to use on timeout (negative
         *   value denotes a process group)
         * @param time_limit if set to 0, then timeout handler is not installed
         **/
        Timer(pid_t kill_target, std::chrono::nanoseconds time_limit);

        Timer(const Timer&) = delete;
        Timer(Timer&&) = delete;
        Timer& operator=(const Timer&) = delete;
        Timer& operator=(Timer&&) = delete;

        // May be called only once
        std::chrono::nanoseconds deactivate_and_get_runtime() noexcept;

        // Valid after deactivate_and_get_runtime()
        [[nodiscard]] bool timeout_signal_was_sent() const noexcept;

        ~Timer() { (void)delete_timer_and_get_remaining_time(); }
    };
};
