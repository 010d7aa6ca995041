#pragma once

#include <chrono>
#include <minijudge/judge/compile_stage.hh>
#include <minijudge/judge/execution_outcome.hh>
#include <minijudge/judge/language_profile.hh>
#include <string_view>

namespace minijudge::judge {

/**
 * @brief Runs @p artifact once with @p stdin_text as its standard input
 * @details Every placeholder in @p run_command expands to
 *   @p artifact.reference. Standard output and error are captured fully. On
 *   timeout the whole process group is killed.
 *
 * @return Ok, RuntimeError (non-zero exit code and non-empty stderr) or
 *   ExecutionTimeout outcome
 *
 * @errors Throws std::runtime_error if the program cannot be spawned
 */
ExecutionOutcome execute(
    const Artifact& artifact,
    const CommandTemplate& run_command,
    std::string_view stdin_text,
    std::chrono::nanoseconds timeout
);

} // namespace minijudge::judge
