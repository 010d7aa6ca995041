#include <minijudge/concat_tostr.hh>
#include <minijudge/judge/execution_outcome.hh>
#include <minijudge/time.hh>

using std::string;

namespace minijudge::judge {

ExecutionOutcome ExecutionOutcome::unsupported_language(string description) {
    return {
        .status = Status::UnsupportedLanguage,
        .diagnostic = std::move(description),
    };
}

ExecutionOutcome ExecutionOutcome::internal_error(std::string_view what) {
    return {
        .status = Status::InternalError,
        .diagnostic = concat_tostr("Unexpected error: ", what),
    };
}

ExecutionOutcome
ExecutionOutcome::compile_error(string compiler_stderr, std::optional<int> compiler_exit_code) {
    string diagnostic = concat_tostr("Compilation error:\n", compiler_stderr);
    return {
        .status = Status::CompileError,
        .stderr_text = std::move(compiler_stderr),
        .exit_code = compiler_exit_code,
        .diagnostic = std::move(diagnostic),
    };
}

ExecutionOutcome ExecutionOutcome::compile_timeout(std::chrono::nanoseconds timeout) {
    return {
        .status = Status::CompileTimeout,
        .diagnostic = concat_tostr("Compilation timeout (>", timeout_to_str(timeout), "s)"),
    };
}

ExecutionOutcome ExecutionOutcome::execution_timeout(std::chrono::nanoseconds timeout) {
    return {
        .status = Status::ExecutionTimeout,
        .duration = timeout,
        .diagnostic = concat_tostr("Execution timeout (>", timeout_to_str(timeout), "s)"),
    };
}

const char* to_str(ExecutionOutcome::Status status) noexcept {
    using Status = ExecutionOutcome::Status;
    switch (status) {
    case Status::Ok: return "Ok";
    case Status::CompileError: return "CompileError";
    case Status::CompileTimeout: return "CompileTimeout";
    case Status::RuntimeError: return "RuntimeError";
    case Status::ExecutionTimeout: return "ExecutionTimeout";
    case Status::UnsupportedLanguage: return "UnsupportedLanguage";
    case Status::InternalError: return "InternalError";
    }
    return "Unknown";
}

string timeout_to_str(std::chrono::nanoseconds timeout) {
    string res = to_seconds_str(timeout, 9);
    while (res.back() == '0') {
        res.pop_back();
    }
    if (res.back() == '.') {
        res.pop_back();
    }
    return res;
}

} // namespace minijudge::judge
