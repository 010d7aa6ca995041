#include <cmath>
#include <minijudge/judge/judge_logger.hh>
#include <minijudge/time.hh>

namespace minijudge::judge {

void VerboseJudgeLogger::begin(const Submission& submission, size_t test_count) {
    logger_(
        "Judging submission in ",
        submission.language_id,
        " (",
        submission.source_text.size(),
        " bytes) on ",
        test_count,
        " test(s)"
    );
}

void VerboseJudgeLogger::test(size_t test_index, const RunResult& result) {
    const auto& outcome = result.outcome;
    auto tmplog = logger_(
        "  Test ",
        test_index,
        ": ",
        to_str(outcome.status),
        " [",
        to_seconds_str(outcome.duration, 3),
        "s]"
    );
    if (outcome.exit_code) {
        tmplog(" exit code: ", *outcome.exit_code);
    }
    if (result.comparison) {
        tmplog(
            " match: ",
            static_cast<long long>(std::floor(result.comparison->match_percentage)),
            '%'
        );
    }
    tmplog(result.passed() ? " PASSED" : " FAILED");
    if (not outcome.diagnostic.empty()) {
        tmplog('\n', outcome.diagnostic);
    }
}

void VerboseJudgeLogger::end(const BatchResult& batch) {
    logger_("Passed ", batch.passed, " / ", batch.total, " (failed: ", batch.failed, ')');
}

} // namespace minijudge::judge
