#pragma once

#include <cctype>
#include <charconv>
#include <optional>
#include <string_view>
#include <type_traits>

// Converts whole @p str to a number, returns std::nullopt on any error
template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty() or str.front() == '+') {
        return std::nullopt;
    }

    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

constexpr bool is_space(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f';
}

constexpr bool lower_equal(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        auto lower = [](char c) { return ('A' <= c and c <= 'Z' ? c - 'A' + 'a' : c); };
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

// Removes leading and trailing white-space characters
constexpr std::string_view trimmed(std::string_view str) noexcept {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

constexpr bool has_suffix(std::string_view str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() and str.substr(str.size() - suffix.size()) == suffix;
}
