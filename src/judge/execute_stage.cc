#include <minijudge/concat_tostr.hh>
#include <minijudge/judge/captured_run.hh>
#include <minijudge/judge/execute_stage.hh>

namespace minijudge::judge {

ExecutionOutcome execute(
    const Artifact& artifact,
    const CommandTemplate& run_command,
    std::string_view stdin_text,
    std::chrono::nanoseconds timeout
) {
    auto argv = expand_command(
        run_command,
        {
            .source = artifact.reference,
            .artifact = artifact.reference,
            .class_name = artifact.reference,
        }
    );
    auto run = run_captured(argv, stdin_text, artifact.working_dir, timeout);
    if (run.timed_out()) {
        return ExecutionOutcome::execution_timeout(timeout);
    }

    ExecutionOutcome outcome{
        .status = ExecutionOutcome::Status::Ok,
        .stdout_text = std::move(run.stdout_text),
        .stderr_text = std::move(run.stderr_text),
        .exit_code = run.exit_code,
        .duration = run.exit_stat.runtime,
    };
    if (outcome.exit_code != 0 and not outcome.stderr_text.empty()) {
        outcome.status = ExecutionOutcome::Status::RuntimeError;
        outcome.diagnostic = concat_tostr("Runtime error:\n", outcome.stderr_text);
    }
    return outcome;
}

} // namespace minijudge::judge
