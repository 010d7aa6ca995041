#include "../cli_judge_logger.hh"
#include "../mini_judge_error.hh"
#include "commands.hh"

#include <algorithm>
#include <cerrno>
#include <dirent.h>
#include <memory>
#include <minijudge/errmsg.hh>
#include <minijudge/file_info.hh>
#include <minijudge/string_transform.hh>
#include <string>
#include <vector>

using minijudge::judge::Submission;
using minijudge::judge::TestCase;
using std::string;
using std::vector;

namespace {

// Returns names (without extension) of the *.in files in @p dir_path, sorted
vector<string> list_test_names(const string& dir_path) {
    std::unique_ptr<DIR, decltype(&closedir)> dir(opendir(dir_path.c_str()), closedir);
    if (dir == nullptr) {
        throw MiniJudgeError("cannot open tests directory `", dir_path, '`', errmsg());
    }

    vector<string> names;
    errno = 0;
    while (dirent* file = readdir(dir.get())) {
        std::string_view filename = file->d_name;
        if (has_suffix(filename, ".in") and filename.size() > 3) {
            names.emplace_back(filename.substr(0, filename.size() - 3));
        }
    }
    if (errno != 0) {
        throw MiniJudgeError("cannot read tests directory `", dir_path, '`', errmsg());
    }

    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

namespace commands {

bool test(ArgvParser args, const minijudge::judge::Judge& judge) {
    if (args.size() != 3) {
        throw MiniJudgeError("test: expected <language> <source> <tests-dir>");
    }

    Submission submission{
        .source_text = read_file_arg(args[1], "source"),
        .language_id = string{args[0]},
    };

    string tests_dir{args[2]};
    if (not is_directory(tests_dir)) {
        throw MiniJudgeError("tests directory does not exist: ", tests_dir);
    }
    if (tests_dir.back() != '/') {
        tests_dir += '/';
    }

    auto test_names = list_test_names(tests_dir);
    if (test_names.empty()) {
        throw MiniJudgeError("no tests (*.in files) found in ", tests_dir);
    }

    vector<TestCase> tests;
    tests.reserve(test_names.size());
    for (const auto& name : test_names) {
        string out_path = concat_tostr(tests_dir, name, ".out");
        if (not is_regular_file(out_path)) {
            throw MiniJudgeError("test ", name, ": missing output file ", out_path);
        }
        tests.push_back({
            .input = read_file_arg(concat_tostr(tests_dir, name, ".in"), "input"),
            .expected_output = read_file_arg(out_path, "output"),
        });
    }

    CliJudgeLogger logger{std::move(test_names)};
    auto batch = judge.run_many(submission, tests, logger);
    return batch.passed == batch.total;
}

} // namespace commands
