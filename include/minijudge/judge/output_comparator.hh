#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace minijudge::judge {

// Stands for a line absent in the shorter of the compared outputs
constexpr std::string_view MISSING_LINE = "<missing>";

struct LineDifference {
    size_t line; // 1-based
    std::string expected;
    std::string actual;

    friend bool operator==(const LineDifference&, const LineDifference&) = default;
};

struct ComparisonResult {
    bool exact_match;
    std::vector<LineDifference> differences; // ordered by line
    double match_percentage; // 0 - 100
};

/**
 * @brief Compares program output with the expected one
 * @details Both strings are trimmed of surrounding white-space and split on
 *   '\n' (an empty string is one empty line). Differing lines are reported
 *   with MISSING_LINE in place of lines past the end of the shorter output.
 */
ComparisonResult compare(std::string_view actual, std::string_view expected);

} // namespace minijudge::judge
