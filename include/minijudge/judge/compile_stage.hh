#pragma once

#include <chrono>
#include <minijudge/judge/execution_outcome.hh>
#include <minijudge/judge/language_profile.hh>
#include <minijudge/judge/workspace.hh>
#include <minijudge/result.hh>
#include <string>

namespace minijudge::judge {

enum class CompileState {
    NotNeeded,
    Compiling,
    Compiled,
    CompileFailed,
};

const char* to_str(CompileState state) noexcept;

// What the run command operates on
struct Artifact {
    CompileState state; // NotNeeded or Compiled
    // Executable path for natively compiled languages, class name for Java,
    // source path for interpreted languages
    std::string reference;
    std::string working_dir;
};

/**
 * @brief Compiles the workspace source if @p profile requires it
 * @details The compiler runs inside the workspace under @p timeout.
 *
 * @return Artifact on success, otherwise CompileError / CompileTimeout outcome
 *
 * @errors Throws std::runtime_error if spawning the compiler fails
 */
Result<Artifact, ExecutionOutcome> compile(
    const LanguageProfile& profile, const Workspace& workspace, std::chrono::nanoseconds timeout
);

} // namespace minijudge::judge
