#pragma once

#include <chrono>
#include <minijudge/spawner.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minijudge::judge {

struct CapturedRun {
    Spawner::ExitStat exit_stat;
    std::string stdout_text;
    std::string stderr_text;
    // Exit status or 128 + signal number, std::nullopt on timeout
    std::optional<int> exit_code;

    [[nodiscard]] bool timed_out() const noexcept { return exit_stat.timed_out; }
};

/**
 * @brief Runs @p argv in @p working_dir with @p stdin_text as the standard
 *   input, capturing the standard output and error in memory files
 *
 * @errors Throws std::runtime_error if a memory file cannot be created or the
 *   spawn fails
 */
CapturedRun run_captured(
    const std::vector<std::string>& argv,
    std::string_view stdin_text,
    const std::string& working_dir,
    std::chrono::nanoseconds timeout
);

} // namespace minijudge::judge
