#pragma once

#include <chrono>
#include <minijudge/judge/compile_stage.hh>
#include <minijudge/judge/judge_logger.hh>
#include <minijudge/judge/language_profile.hh>
#include <minijudge/judge/report.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minijudge::judge {

/**
 * Drives submissions through Workspace -> Compile -> Execute -> Compare.
 * Every failure is reported as an ExecutionOutcome status: unexpected errors
 * (filesystem, spawning) become InternalError and are logged to errlog.
 * A Judge holds no mutable state, so distinct threads may use it concurrently.
 */
class Judge {
public:
    struct Options {
        std::chrono::nanoseconds timeout = std::chrono::seconds{5}; // per compile and per run
        std::string workspace_parent_dir = "/tmp";
        // Reuse one workspace and one compilation across a batch instead of
        // compiling for every test case
        bool compile_once_per_batch = false;
    };

private:
    Options opts_;

    // Runs the program inside @p artifact against one test, never throws
    // spawning errors past itself
    [[nodiscard]] RunResult run_compiled(
        const LanguageProfile& profile,
        const Artifact& artifact,
        std::string_view stdin_text,
        const std::optional<std::string_view>& expected_output
    ) const;

    [[nodiscard]] BatchResult run_many_impl(
        const Submission& submission, const std::vector<TestCase>& tests, JudgeLogger* logger
    ) const;

public:
    Judge();

    explicit Judge(Options opts);

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    [[nodiscard]] RunResult run_one(
        const Submission& submission,
        std::string_view stdin_text,
        const std::optional<std::string_view>& expected_output = std::nullopt
    ) const;

    [[nodiscard]] BatchResult
    run_many(const Submission& submission, const std::vector<TestCase>& tests) const;

    // Like run_many() but notifies @p logger about the progress
    BatchResult run_many(
        const Submission& submission, const std::vector<TestCase>& tests, JudgeLogger& logger
    ) const;
};

} // namespace minijudge::judge
