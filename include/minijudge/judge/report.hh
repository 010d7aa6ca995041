#pragma once

#include <cstddef>
#include <minijudge/judge/execution_outcome.hh>
#include <minijudge/judge/output_comparator.hh>
#include <optional>
#include <string>
#include <vector>

namespace minijudge::judge {

struct Submission {
    std::string source_text;
    std::string language_id;
};

struct TestCase {
    std::string input;
    std::string expected_output;
};

struct RunResult {
    ExecutionOutcome outcome;
    // Present iff the program was run and an expected output was given
    std::optional<ComparisonResult> comparison;

    [[nodiscard]] bool passed() const noexcept {
        return outcome.is_ok() and comparison.has_value() and comparison->exact_match;
    }
};

struct BatchResult {
    struct Entry {
        size_t test_index; // 1-based
        RunResult result;
    };

    size_t total = 0;
    size_t passed = 0;
    size_t failed = 0; // passed + failed == total
    std::vector<Entry> results; // in the order of test cases
};

} // namespace minijudge::judge
