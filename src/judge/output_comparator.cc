#include <algorithm>
#include <minijudge/judge/output_comparator.hh>
#include <minijudge/string_transform.hh>

using std::string;
using std::string_view;
using std::vector;

namespace minijudge::judge {

namespace {

// Splitting "" yields one empty line
vector<string_view> split_lines(string_view str) {
    vector<string_view> lines;
    for (;;) {
        auto pos = str.find('\n');
        lines.emplace_back(str.substr(0, pos));
        if (pos == string_view::npos) {
            return lines;
        }
        str.remove_prefix(pos + 1);
    }
}

} // namespace

ComparisonResult compare(string_view actual, string_view expected) {
    actual = trimmed(actual);
    expected = trimmed(expected);

    auto actual_lines = split_lines(actual);
    auto expected_lines = split_lines(expected);
    size_t max_lines = std::max(actual_lines.size(), expected_lines.size());

    ComparisonResult res{
        .exact_match = (actual == expected),
        .differences = {},
        .match_percentage = 100,
    };
    for (size_t i = 0; i < max_lines; ++i) {
        string_view actual_line = (i < actual_lines.size() ? actual_lines[i] : MISSING_LINE);
        string_view expected_line = (i < expected_lines.size() ? expected_lines[i] : MISSING_LINE);
        if (actual_line != expected_line) {
            res.differences.push_back({
                .line = i + 1,
                .expected = string{expected_line},
                .actual = string{actual_line},
            });
        }
    }

    if (max_lines > 0) {
        res.match_percentage =
            (1 - static_cast<double>(res.differences.size()) / static_cast<double>(max_lines)) *
            100;
    }
    return res;
}

} // namespace minijudge::judge
