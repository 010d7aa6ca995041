#pragma once

#include <cstddef>
#include <minijudge/judge/report.hh>
#include <minijudge/logger.hh>

namespace minijudge::judge {

class JudgeLogger {
public:
    JudgeLogger() = default;
    JudgeLogger(const JudgeLogger&) = delete;
    JudgeLogger(JudgeLogger&&) = delete;
    JudgeLogger& operator=(const JudgeLogger&) = delete;
    JudgeLogger& operator=(JudgeLogger&&) = delete;
    virtual ~JudgeLogger() = default;

    virtual void begin(const Submission& submission, size_t test_count) = 0;

    virtual void test(size_t test_index, const RunResult& result) = 0;

    virtual void end(const BatchResult& batch) = 0;
};

// Writes a per-test trace to the given Logger
class VerboseJudgeLogger : public JudgeLogger {
    Logger& logger_;

public:
    explicit VerboseJudgeLogger(Logger& logger) noexcept : logger_(logger) {}

    void begin(const Submission& submission, size_t test_count) override;

    void test(size_t test_index, const RunResult& result) override;

    void end(const BatchResult& batch) override;
};

} // namespace minijudge::judge
