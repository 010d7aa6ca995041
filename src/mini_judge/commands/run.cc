#include "../mini_judge_error.hh"
#include "../status_str.hh"
#include "commands.hh"

#include <minijudge/file_contents.hh>
#include <minijudge/file_info.hh>
#include <minijudge/logger.hh>
#include <minijudge/time.hh>
#include <optional>
#include <string>

using minijudge::judge::Submission;
using std::optional;
using std::string;

namespace commands {

string read_file_arg(std::string_view path, std::string_view what) {
    string path_str{path};
    if (not is_regular_file(path_str)) {
        throw MiniJudgeError(what, " file does not exist: ", path_str);
    }
    return get_file_contents(path_str);
}

bool run(ArgvParser args, const minijudge::judge::Judge& judge) {
    if (args.size() < 2 or args.size() > 4) {
        throw MiniJudgeError("run: expected <language> <source> [<input> [<expected>]]");
    }

    Submission submission{
        .source_text = read_file_arg(args[1], "source"),
        .language_id = string{args[0]},
    };
    string input = (args.size() > 2 ? read_file_arg(args[2], "input") : string{});
    optional<string> expected;
    if (args.size() > 3) {
        expected = read_file_arg(args[3], "expected output");
    }

    auto res = judge.run_one(submission, input, expected);
    const auto& outcome = res.outcome;

    stdlog(
        "Status: ",
        colored_status(outcome.status),
        "  Time: ",
        to_seconds_str(outcome.duration, 3),
        "\033[2ms\033[m"
    );
    if (outcome.exit_code) {
        stdlog("Exit code: ", *outcome.exit_code);
    }
    if (not outcome.diagnostic.empty()) {
        stdlog(outcome.diagnostic);
    }
    using Status = minijudge::judge::ExecutionOutcome::Status;
    if (outcome.is_ok() or outcome.status == Status::RuntimeError) {
        stdlog("\033[1mstdout:\033[m\n", outcome.stdout_text);
    }
    if (outcome.is_ok()) {
        if (not outcome.stderr_text.empty()) {
            stdlog("\033[1mstderr:\033[m\n", outcome.stderr_text);
        }
    }

    if (res.comparison) {
        const auto& cmp = *res.comparison;
        stdlog(
            "Exact match: ",
            (cmp.exact_match ? "\033[1;32myes\033[m" : "\033[1;31mno\033[m"),
            "  Match: ",
            percentage_str(cmp.match_percentage)
        );
        for (const auto& diff : cmp.differences) {
            stdlog(
                "  line ", diff.line, ": expected `", diff.expected, "`, got `", diff.actual, '`'
            );
        }
    }

    return outcome.is_ok() and (not res.comparison or res.comparison->exact_match);
}

} // namespace commands
