#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace minijudge::judge {

struct ExecutionOutcome {
    enum class Status {
        Ok,
        CompileError,
        CompileTimeout,
        RuntimeError,
        ExecutionTimeout,
        UnsupportedLanguage,
        InternalError,
    };

    Status status = Status::Ok;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    std::chrono::nanoseconds duration{0};
    std::string diagnostic; // empty iff status == Ok

    [[nodiscard]] bool is_ok() const noexcept { return status == Status::Ok; }

    static ExecutionOutcome unsupported_language(std::string description);

    static ExecutionOutcome internal_error(std::string_view what);

    static ExecutionOutcome
    compile_error(std::string compiler_stderr, std::optional<int> compiler_exit_code);

    static ExecutionOutcome compile_timeout(std::chrono::nanoseconds timeout);

    static ExecutionOutcome execution_timeout(std::chrono::nanoseconds timeout);
};

// E.g. "ExecutionTimeout"
const char* to_str(ExecutionOutcome::Status status) noexcept;

// Formats @p timeout in seconds without trailing zeros, e.g. "2", "0.5"
std::string timeout_to_str(std::chrono::nanoseconds timeout);

} // namespace minijudge::judge
