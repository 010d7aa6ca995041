#pragma once

#include <algorithm>
#include <optional>
#include <string_view>

class ArgvParser {
    unsigned argc_;
    const char* const* argv_;

public:
    ArgvParser(int argc, const char* const* argv)
    : argc_(static_cast<unsigned>(std::max(argc, 0)))
    , argv_(argv) {}

    [[nodiscard]] unsigned size() const noexcept { return argc_; }

    std::string_view operator[](unsigned n) const noexcept {
        return (n < argc_ ? std::string_view(argv_[n]) : std::string_view());
    }

    [[nodiscard]] std::string_view next() const noexcept { return operator[](0); }

    std::string_view extract_next() noexcept {
        if (argc_ > 0) {
            --argc_;
            return argv_++[0];
        }
        return {};
    }

    // Returns std::nullopt if there are no more arguments
    std::optional<std::string_view> try_extract_next() noexcept {
        if (argc_ == 0) {
            return std::nullopt;
        }
        return extract_next();
    }
};
