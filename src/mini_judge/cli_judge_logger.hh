#pragma once

#include "status_str.hh"

#include <algorithm>
#include <cmath>
#include <minijudge/judge/judge_logger.hh>
#include <minijudge/logger.hh>
#include <minijudge/time.hh>
#include <string>
#include <vector>

// Prints one aligned line per test and a summary to stdlog
class CliJudgeLogger : public minijudge::judge::JudgeLogger {
    std::vector<std::string> test_names_;
    size_t test_name_max_len_ = 0;

    static std::string padded(std::string str, size_t len) {
        if (str.size() < len) {
            str.append(len - str.size(), ' ');
        }
        return str;
    }

public:
    explicit CliJudgeLogger(std::vector<std::string> test_names)
    : test_names_(std::move(test_names)) {
        for (const auto& name : test_names_) {
            test_name_max_len_ = std::max(test_name_max_len_, name.size());
        }
    }

    void begin(const minijudge::judge::Submission& submission, size_t test_count) override {
        stdlog("Judging ", submission.language_id, " submission on ", test_count, " test(s)");
    }

    void test(size_t test_index, const minijudge::judge::RunResult& result) override {
        const auto& name =
            (test_index - 1 < test_names_.size() ? test_names_[test_index - 1] : std::string{});
        auto tmplog = stdlog(
            padded(std::to_string(test_index), 3),
            ' ',
            padded(name, test_name_max_len_),
            "  ",
            colored_status(result.outcome.status),
            ' ',
            to_seconds_str(result.outcome.duration, 2),
            "\033[2ms\033[m"
        );
        if (result.comparison) {
            tmplog(
                "  match: ",
                static_cast<long long>(std::floor(result.comparison->match_percentage)),
                '%'
            );
        }
        if (result.outcome.is_ok() and not result.passed()) {
            tmplog(" \033[1;31mWA\033[m");
        }
    }

    void end(const minijudge::judge::BatchResult& batch) override {
        const char* color = (batch.passed == batch.total ? "\033[1;32m" : "\033[1;31m");
        stdlog(color, batch.passed, '/', batch.total, "\033[m tests passed");
    }
};
