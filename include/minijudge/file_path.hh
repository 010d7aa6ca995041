#pragma once

#include <cstring>
#include <string>
#include <string_view>

// Non-owning, null-terminated path
class FilePath {
    const char* str_;
    size_t size_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    FilePath(const char* str) noexcept : str_(str), size_(std::strlen(str)) {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    FilePath(const std::string& str) noexcept : str_(str.c_str()), size_(str.size()) {}

    FilePath(std::string&&) = delete;

    FilePath(const FilePath&) noexcept = default;
    FilePath(FilePath&&) noexcept = default;
    FilePath& operator=(const FilePath&) noexcept = default;
    FilePath& operator=(FilePath&&) noexcept = default;
    ~FilePath() = default;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator const char*() const noexcept { return str_; }

    [[nodiscard]] const char* data() const noexcept { return str_; }

    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] std::string_view to_string_view() const noexcept { return {str_, size_}; }

    [[nodiscard]] std::string to_str() const { return {str_, size_}; }

    friend std::string_view stringify(const FilePath& path) noexcept {
        return path.to_string_view();
    }
};

