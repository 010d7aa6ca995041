#include <minijudge/judge/captured_run.hh>
#include <minijudge/judge/compile_stage.hh>

namespace minijudge::judge {

const char* to_str(CompileState state) noexcept {
    switch (state) {
    case CompileState::NotNeeded: return "NotNeeded";
    case CompileState::Compiling: return "Compiling";
    case CompileState::Compiled: return "Compiled";
    case CompileState::CompileFailed: return "CompileFailed";
    }
    return "Unknown";
}

Result<Artifact, ExecutionOutcome> compile(
    const LanguageProfile& profile, const Workspace& workspace, std::chrono::nanoseconds timeout
) {
    if (not profile.requires_compile()) {
        return Ok{Artifact{
            .state = CompileState::NotNeeded,
            .reference = workspace.source_path(),
            .working_dir = workspace.root(),
        }};
    }

    auto argv = expand_command(
        *profile.compile_command,
        {
            .source = workspace.source_path(),
            .artifact = workspace.artifact_path().value_or(""),
            .class_name = profile.source_stem,
        }
    );
    auto run = run_captured(argv, "", workspace.root(), timeout);
    if (run.timed_out()) {
        return Err{ExecutionOutcome::compile_timeout(timeout)};
    }
    if (run.exit_code != 0) {
        return Err{ExecutionOutcome::compile_error(std::move(run.stderr_text), run.exit_code)};
    }

    return Ok{Artifact{
        .state = CompileState::Compiled,
        .reference = workspace.artifact_path().value_or(profile.source_stem),
        .working_dir = workspace.root(),
    }};
}

} // namespace minijudge::judge
