#include <minijudge/judge/compile_stage.hh>
#include <minijudge/judge/execute_stage.hh>
#include <minijudge/judge/judge.hh>
#include <minijudge/judge/workspace.hh>
#include <minijudge/logger.hh>

using std::optional;
using std::string_view;
using std::vector;

namespace minijudge::judge {

namespace {

RunResult internal_error(const std::exception& e) {
    errlog("Judge: internal error: ", e.what());
    return {.outcome = ExecutionOutcome::internal_error(e.what()), .comparison = std::nullopt};
}

} // namespace

Judge::Judge() : Judge(Options{}) {}

Judge::Judge(Options opts) : opts_(std::move(opts)) {}

RunResult Judge::run_compiled(
    const LanguageProfile& profile,
    const Artifact& artifact,
    string_view stdin_text,
    const optional<string_view>& expected_output
) const {
    RunResult res;
    try {
        res.outcome = execute(artifact, profile.run_command, stdin_text, opts_.timeout);
    } catch (const std::exception& e) {
        return internal_error(e);
    }

    if (expected_output) {
        res.comparison = compare(res.outcome.stdout_text, *expected_output);
    }
    return res;
}

RunResult Judge::run_one(
    const Submission& submission,
    string_view stdin_text,
    const optional<string_view>& expected_output
) const {
    auto resolved = resolve(submission.language_id);
    if (resolved.is_err()) {
        return {
            .outcome = ExecutionOutcome::unsupported_language(
                std::move(resolved).unwrap_err().description()
            ),
            .comparison = std::nullopt,
        };
    }
    const LanguageProfile& profile = *std::move(resolved).unwrap();

    try {
        auto workspace =
            Workspace::acquire(opts_.workspace_parent_dir, profile, submission.source_text);
        auto compiled = compile(profile, workspace, opts_.timeout);
        if (compiled.is_err()) {
            return {.outcome = std::move(compiled).unwrap_err(), .comparison = std::nullopt};
        }

        auto res = run_compiled(profile, std::move(compiled).unwrap(), stdin_text, expected_output);
        try {
            workspace.release();
        } catch (const std::exception& e) {
            errlog("Judge: failed to release workspace: ", e.what());
        }
        return res;
    } catch (const std::exception& e) {
        return internal_error(e);
    }
}

BatchResult Judge::run_many_impl(
    const Submission& submission, const vector<TestCase>& tests, JudgeLogger* logger
) const {
    if (logger) {
        logger->begin(submission, tests.size());
    }

    BatchResult batch;
    batch.total = tests.size();
    batch.results.reserve(tests.size());
    auto record = [&](size_t test_index, RunResult result) {
        if (logger) {
            logger->test(test_index, result);
        }
        ++(result.passed() ? batch.passed : batch.failed);
        batch.results.push_back({.test_index = test_index, .result = std::move(result)});
    };

    if (not opts_.compile_once_per_batch) {
        for (size_t i = 0; i < tests.size(); ++i) {
            record(i + 1, run_one(submission, tests[i].input, tests[i].expected_output));
        }
    } else {
        // Every test gets the same outcome if the shared part fails
        auto fail_all = [&](const RunResult& result) {
            for (size_t i = 0; i < tests.size(); ++i) {
                record(i + 1, result);
            }
        };

        auto resolved = resolve(submission.language_id);
        if (resolved.is_err()) {
            fail_all({
                .outcome = ExecutionOutcome::unsupported_language(
                    std::move(resolved).unwrap_err().description()
                ),
                .comparison = std::nullopt,
            });
        } else {
            const LanguageProfile& profile = *std::move(resolved).unwrap();
            optional<Workspace> workspace;
            optional<Artifact> artifact;
            optional<RunResult> shared_failure;
            try {
                workspace.emplace(
                    Workspace::acquire(opts_.workspace_parent_dir, profile, submission.source_text)
                );
                auto compiled = compile(profile, *workspace, opts_.timeout);
                if (compiled.is_err()) {
                    shared_failure = RunResult{
                        .outcome = std::move(compiled).unwrap_err(),
                        .comparison = std::nullopt,
                    };
                } else {
                    artifact = std::move(compiled).unwrap();
                }
            } catch (const std::exception& e) {
                shared_failure = internal_error(e);
            }

            if (shared_failure) {
                fail_all(*shared_failure);
            }
            if (artifact) {
                for (size_t i = 0; i < tests.size(); ++i) {
                    record(
                        i + 1,
                        run_compiled(profile, *artifact, tests[i].input, tests[i].expected_output)
                    );
                }
            }

            if (workspace) {
                try {
                    workspace->release();
                } catch (const std::exception& e) {
                    errlog("Judge: failed to release workspace: ", e.what());
                }
            }
        }
    }

    if (logger) {
        logger->end(batch);
    }
    return batch;
}

BatchResult Judge::run_many(const Submission& submission, const vector<TestCase>& tests) const {
    return run_many_impl(submission, tests, nullptr);
}

BatchResult Judge::run_many(
    const Submission& submission, const vector<TestCase>& tests, JudgeLogger& logger
) const {
    return run_many_impl(submission, tests, &logger);
}

} // namespace minijudge::judge
